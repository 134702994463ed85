#include "config.hpp"

namespace codejudge {
using namespace std;

filesystem::path RUN_DIR = filesystem::temp_directory_path();
string DOCKER_EXECUTABLE = "docker";
int SANDBOX_PROC_LIMIT = 64;
int SANDBOX_FILE_LIMIT = 1024;
string SANDBOX_CPUS = "1.0";
string SANDBOX_USER = "65534:65534";  // nobody:nogroup
int COMPILE_TIME_ALLOWANCE = 10;  // 10s
size_t OUTPUT_LIMIT = 1 << 20;    // 1M
size_t CAPTURE_LIMIT = 1 << 26;   // 64M
string RUNNER_URL = "http://runner:5000/run";
int REMOTE_TIMEOUT = 10;  // 10s

}  // namespace codejudge
