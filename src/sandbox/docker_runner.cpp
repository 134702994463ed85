#include "sandbox/docker_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/driver_script.hpp"

namespace codejudge::sandbox {
using namespace std;
namespace fs = std::filesystem;

static const char *SCRIPT_NAME = "run_script.sh";
static const char *MOUNT_POINT = "/app";

vector<string> docker_runner::docker_arguments(const string &name, const fs::path &workdir, const submission &submit, const language_profile &profile) {
    string memory = fmt::format("{}m", submit.memory_limit);
    return {DOCKER_EXECUTABLE, "run", "--rm",
            "--name", name,
            "--network", "none",
            "--memory", memory,
            "--memory-swap", memory,
            "--pids-limit", to_string(SANDBOX_PROC_LIMIT),
            "--ulimit", fmt::format("nproc={0}:{0}", SANDBOX_PROC_LIMIT),
            "--ulimit", fmt::format("nofile={0}:{0}", SANDBOX_FILE_LIMIT),
            fmt::format("--cpus={}", SANDBOX_CPUS),
            "--user", "0:0",
            "-v", fmt::format("{}:{}", fs::absolute(workdir), MOUNT_POINT),
            "-w", MOUNT_POINT,
            profile.image,
            fmt::format("{}/{}", MOUNT_POINT, SCRIPT_NAME)};
}

/**
 * @brief 将选手代码、测试输入和驱动脚本写入工作目录
 * 测试的标准输出不会写入工作目录，选手程序无论如何都读不到答案
 */
static void prepare_workdir(const fs::path &workdir, const submission &submit, const language_profile &profile, const string &script) {
    const fs::perms readable = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec;

    fs::path program = workdir / PROGRAM_DIRECTORY;
    fs::create_directories(program);
    fs::path source = program / assert_safe_path(profile.source_file);
    write_file_content(source, submit.source_code);
    fs::permissions(source, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read);

    fs::path tests = workdir / "tests";
    fs::create_directories(tests);
    for (size_t i = 0; i < submit.test_cases.size(); ++i)
        write_file_content(tests / fmt::format("{}.in", i + 1), submit.test_cases[i].input);

    fs::path script_path = workdir / SCRIPT_NAME;
    write_file_content(script_path, script);
    fs::permissions(script_path, readable);

    // 驱动脚本以 root 运行，选手程序以 SANDBOX_USER 运行：
    // 后者只能写入 program 目录，无法读取或删除 tests 中的数据
    fs::permissions(workdir, readable);
    fs::permissions(tests, fs::perms::owner_all);
    fs::permissions(program, fs::perms::all);
}

static void kill_container(const string &name) {
    try {
        auto result = capture_process(chrono::seconds(10), 4096, DOCKER_EXECUTABLE, "kill", name);
        if (result.exit_code != 0)
            LOG(WARNING) << "docker kill " << name << " exited with " << result.exit_code << ": " << result.error;
    } catch (system_error &e) {
        LOG(ERROR) << "unable to kill container " << name << ": " << e.what();
    }
}

sandbox_invocation docker_runner::execute(const submission &submit, const language_profile &profile, const string &script) {
    string id = boost::uuids::to_string(boost::uuids::random_generator()());
    string name = "judge-" + id;

    scoped_directory workdir(RUN_DIR / id);
    prepare_workdir(workdir.path(), submit, profile, script);

    sandbox_invocation invocation;
    invocation.workdir = workdir.path();
    invocation.script = script;

    chrono::seconds watchdog(submit.time_limit * (long long)submit.test_cases.size() + COMPILE_TIME_ALLOWANCE);
    LOG(INFO) << "Starting container " << name << " with image " << profile.image << ", watchdog " << watchdog.count() << "s";

    elapsed_time elapsed;
    process_result result;
    try {
        result = capture_program(docker_arguments(name, workdir.path(), submit, profile), watchdog, CAPTURE_LIMIT);
    } catch (system_error &e) {
        throw infrastructure_error(fmt::format("unable to start sandbox: {}", e.what()));
    }

    if (result.timed_out) {
        LOG(WARNING) << "Container " << name << " was killed by watchdog after " << watchdog.count() << "s";
        kill_container(name);
    }
    if (result.truncated)
        LOG(WARNING) << "Output of container " << name << " exceeded " << CAPTURE_LIMIT << " bytes and was truncated";

    DLOG(INFO) << "Container " << name << " stdout:\n" << result.output;
    DLOG(INFO) << "Container " << name << " stderr:\n" << result.error;
    LOG(INFO) << "Container " << name << " finished in " << elapsed.duration<chrono::milliseconds>().count() << "ms with exit code " << result.exit_code;

    // 125: docker 守护进程出错, 126: 入口命令无法执行, 127: 入口命令不存在
    if (!result.timed_out && result.exit_code >= 125 && result.exit_code <= 127)
        throw infrastructure_error(fmt::format("sandbox exited with code {}: {}", result.exit_code, boost::algorithm::trim_copy(result.error)));

    invocation.output = move(result.output);
    invocation.error = move(result.error);
    invocation.exit_code = result.exit_code;
    invocation.timed_out = result.timed_out;
    return invocation;
}

}  // namespace codejudge::sandbox
