#include "judge/language.hpp"
#include <glog/logging.h>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "judge/driver_script.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

static const regex language_pattern("^[a-z0-9_+-]+$");
static const regex filename_pattern("^[A-Za-z0-9_][A-Za-z0-9_.-]*$");
static const regex image_pattern("^[A-Za-z0-9_][A-Za-z0-9_./:@-]*$");

bool language_profile::requires_compilation() const {
    return compile_command.has_value();
}

void validate_profile(const language_profile &profile) {
    if (!regex_match(profile.language, language_pattern))
        throw invalid_argument("unsafe language identifier '" + profile.language + "'");
    if (!regex_match(profile.source_file, filename_pattern))
        throw invalid_argument("unsafe source file name '" + profile.source_file + "'");
    if (!regex_match(profile.executable_file, filename_pattern))
        throw invalid_argument("unsafe executable file name '" + profile.executable_file + "'");
    if (!regex_match(profile.image, image_pattern))
        throw invalid_argument("unsafe image reference '" + profile.image + "'");
    if (profile.compile_command && profile.compile_command->empty())
        throw invalid_argument("empty compile command of language " + profile.language);
    if (profile.run_command.empty())
        throw invalid_argument("empty run command of language " + profile.language);

    // 提前渲染一次模板，使得占位符错误在注册时就被发现
    if (profile.compile_command)
        render_command(*profile.compile_command, profile);
    render_command(profile.run_command, profile);
}

void from_json(const json &j, language_profile &profile) {
    profile.language = get_value<string>(j, "language");
    profile.source_file = get_value<string>(j, "source_file");
    profile.executable_file = get_value_def<string>(j, profile.source_file, "executable_file");
    profile.image = get_value<string>(j, "image");
    if (exists(j, "compile"))
        profile.compile_command = get_value<string>(j, "compile");
    else
        profile.compile_command.reset();
    profile.run_command = get_value<string>(j, "run");
}

void to_json(json &j, const language_profile &profile) {
    j = {{"language", profile.language},
         {"source_file", profile.source_file},
         {"executable_file", profile.executable_file},
         {"image", profile.image},
         {"run", profile.run_command}};
    if (profile.compile_command)
        j["compile"] = *profile.compile_command;
}

language_registry::language_registry() {
    // clang-format off
    register_profile({"cpp", "solution.cpp", "a.out", "my-cpp-executor:12",
                      "g++ -O2 -static -DONLINE_JUDGE -s -x c++ {source} -o {executable} -lm",
                      "./{executable}"});
    register_profile({"java", "Solution.java", "Solution", "openjdk:11-jdk-slim-buster",
                      "javac {source}",
                      "java {executable}"});
    register_profile({"python", "solution.py", "solution.py", "my-python-executor",
                      nullopt,
                      "python {source}"});
    register_profile({"ruby", "solution.rb", "solution.rb", "ruby:3.0-slim-buster",
                      nullopt,
                      "ruby {source}"});
    // clang-format on
}

const language_profile &language_registry::resolve(const string &language) const {
    auto it = profiles.find(language);
    if (it == profiles.end())
        throw unsupported_language(language);
    return it->second;
}

void language_registry::register_profile(const language_profile &profile) {
    validate_profile(profile);
    profiles[profile.language] = profile;
}

void language_registry::load(const filesystem::path &config_path) {
    json config;
    try {
        config = json::parse(read_file_content(config_path));
    } catch (json::parse_error &e) {
        throw invalid_argument("language configuration " + config_path.string() + " is malformed: " + e.what());
    }
    load(config);
    LOG(INFO) << "Loaded language configuration " << config_path;
}

void language_registry::load(const json &config) {
    if (!config.is_array())
        throw invalid_argument("language configuration must be an array");
    for (auto &item : config)
        register_profile(item.get<language_profile>());
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[language, profile] : profiles)
        result.push_back(language);
    return result;
}

}  // namespace codejudge
