#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <regex>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/engine.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "sandbox/docker_runner.hpp"
#include "sandbox/remote_runner.hpp"
using namespace std;
using namespace nlohmann;

static const int EXIT_REJECTED = 2;

static string read_submission(const string &path) {
    if (path == "-")
        return string((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    if (!filesystem::is_regular_file(path))
        throw runtime_error("Submission file " + path + " does not exist");
    return codejudge::read_file_content(path);
}

static void print_rejection(const string &message) {
    json j = {{"error", message}};
    cout << j.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("submission", po::value<string>()->required(), "judge the submission stored in given JSON file, or read from stdin when given -")
        ("runner", po::value<string>(), "set the sandbox to run the submission with, docker or remote. Defaults to docker when environ USE_DOCKER_RUNNER is true, otherwise remote")
        ("runner-url", po::value<string>(), "set the url of the remote runner service, default to http://runner:5000/run. You can either pass it from environ RUNNER_URL")
        ("run-dir", po::value<string>(), "set the directory to create sandbox working directories in, default to the system temporary directory. You can either pass it from environ RUNDIR")
        ("docker", po::value<string>(), "set the docker executable, default to docker found in PATH. You can either pass it from environ DOCKER")
        ("sandbox-user", po::value<string>(), "set the uid:gid that compilers and submitted programs run as inside the docker sandbox, default to 65534:65534. Empty string runs them as the driver's user. You can either pass it from environ SANDBOX_USER")
        ("languages", po::value<string>(), "load additional language profiles from given JSON file. You can either pass it from environ LANGUAGES")
        ("compile-time-allowance", po::value<int>(), "set the extra seconds given to the sandbox watchdog for compilation, default to 10. You can either pass it from environ COMPILETIMEALLOWANCE")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of program output kept for each test case, default to 1048576(1MB). You can either pass it from environ OUTPUTLIMIT")
        ("remote-timeout", po::value<int>(), "set the timeout in seconds of each request to the remote runner service, default to 10. You can either pass it from environ REMOTETIMEOUT")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "codejudge: Judge a submission against its test cases in a sandbox" << endl
                 << "Usage: " << argv[0] << " --submission <file> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("version")) {
            cout << "codejudge 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("run-dir")) {
            codejudge::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
        } else if (getenv("RUNDIR")) {
            codejudge::RUN_DIR = filesystem::path(getenv("RUNDIR"));
        }

        if (vm.count("docker")) {
            codejudge::DOCKER_EXECUTABLE = vm.at("docker").as<string>();
        } else if (getenv("DOCKER")) {
            codejudge::DOCKER_EXECUTABLE = getenv("DOCKER");
        }

        if (vm.count("sandbox-user")) {
            codejudge::SANDBOX_USER = vm.at("sandbox-user").as<string>();
        } else if (getenv("SANDBOX_USER")) {
            codejudge::SANDBOX_USER = getenv("SANDBOX_USER");
        }

        if (vm.count("runner-url")) {
            codejudge::RUNNER_URL = vm.at("runner-url").as<string>();
        } else if (getenv("RUNNER_URL")) {
            codejudge::RUNNER_URL = getenv("RUNNER_URL");
        }

        if (vm.count("compile-time-allowance")) {
            codejudge::COMPILE_TIME_ALLOWANCE = vm.at("compile-time-allowance").as<int>();
        } else if (getenv("COMPILETIMEALLOWANCE")) {
            codejudge::COMPILE_TIME_ALLOWANCE = boost::lexical_cast<int>(getenv("COMPILETIMEALLOWANCE"));
        }

        if (vm.count("output-limit")) {
            codejudge::OUTPUT_LIMIT = vm.at("output-limit").as<size_t>();
        } else if (getenv("OUTPUTLIMIT")) {
            codejudge::OUTPUT_LIMIT = boost::lexical_cast<size_t>(getenv("OUTPUTLIMIT"));
        }

        if (vm.count("remote-timeout")) {
            codejudge::REMOTE_TIMEOUT = vm.at("remote-timeout").as<int>();
        } else if (getenv("REMOTETIMEOUT")) {
            codejudge::REMOTE_TIMEOUT = boost::lexical_cast<int>(getenv("REMOTETIMEOUT"));
        }
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Malformed numeric environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(codejudge::COMPILE_TIME_ALLOWANCE >= 0)
        << "Compile time allowance should not be negative";
    CHECK(codejudge::REMOTE_TIMEOUT > 0)
        << "Remote timeout should be positive";
    CHECK(regex_match(codejudge::SANDBOX_USER, regex("^([0-9]+:[0-9]+)?$")))
        << "Sandbox user should be in the form uid:gid";

    codejudge::language_registry languages;
    string languages_path;
    if (vm.count("languages")) {
        languages_path = vm.at("languages").as<string>();
    } else if (getenv("LANGUAGES")) {
        languages_path = getenv("LANGUAGES");
    }
    if (!languages_path.empty()) {
        CHECK(filesystem::is_regular_file(languages_path))
            << "Language configuration file " << languages_path << " does not exist";
        try {
            languages.load(filesystem::path(languages_path));
        } catch (std::exception &e) {
            LOG(FATAL) << "Language configuration file " << languages_path << " is malformed: " << e.what();
        }
    }

    string runner_type;
    if (vm.count("runner")) {
        runner_type = vm.at("runner").as<string>();
    } else {
        runner_type = codejudge::get_env("USE_DOCKER_RUNNER", "") == "true" ? "docker" : "remote";
    }

    unique_ptr<codejudge::sandbox::runner> runner;
    if (runner_type == "docker") {
        CHECK(filesystem::is_directory(codejudge::RUN_DIR))
            << "Run directory " << codejudge::RUN_DIR << " does not exist";
        runner = make_unique<codejudge::sandbox::docker_runner>();
    } else if (runner_type == "remote") {
        runner = make_unique<codejudge::sandbox::remote_runner>(codejudge::RUNNER_URL, codejudge::REMOTE_TIMEOUT);
    } else {
        cerr << "Unrecognized runner " << runner_type << ", expected docker or remote" << endl;
        return EXIT_FAILURE;
    }

    json request;
    try {
        request = json::parse(read_submission(vm.at("submission").as<string>()));
    } catch (json::parse_error &e) {
        cerr << "Submission is not valid JSON: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    codejudge::engine engine(languages, *runner);
    try {
        auto submit = request.get<codejudge::submission>();
        auto results = engine.run_batch(submit);

        json response = {{"results", results}};
        cout << response.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
    } catch (codejudge::invalid_submission &e) {
        print_rejection(e.what());
        return EXIT_REJECTED;
    } catch (codejudge::unsupported_language &e) {
        print_rejection(e.what());
        return EXIT_REJECTED;
    }

    return EXIT_SUCCESS;
}
