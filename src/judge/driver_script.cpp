#include "judge/driver_script.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <regex>
#include <sstream>
#include <stdexcept>
#include "config.hpp"
#include "judge/protocol.hpp"

namespace codejudge {
using namespace std;

static const regex variable_pattern("^[A-Za-z_][A-Za-z0-9_]*$");
static const regex user_pattern("^([0-9]+:[0-9]+)?$");

string shell_script::quote(const string &value) {
    string result = "'";
    for (char c : value) {
        if (c == '\'')
            result += "'\\''";
        else
            result += c;
    }
    result += "'";
    return result;
}

shell_script &shell_script::line(const string &text) {
    lines.push_back(text);
    return *this;
}

shell_script &shell_script::assign(const string &name, const string &value) {
    if (!regex_match(name, variable_pattern))
        throw invalid_argument("invalid shell variable name '" + name + "'");
    return line(name + "=" + quote(value));
}

shell_script &shell_script::assign(const string &name, long long value) {
    if (!regex_match(name, variable_pattern))
        throw invalid_argument("invalid shell variable name '" + name + "'");
    return line(name + "=" + to_string(value));
}

string shell_script::str() const {
    stringstream ss;
    for (auto &text : lines)
        ss << text << '\n';
    return ss.str();
}

string render_command(const string &command_template, const language_profile &profile) {
    try {
        return fmt::format(fmt::runtime(command_template),
                           fmt::arg("source", shell_script::quote(profile.source_file)),
                           fmt::arg("executable", shell_script::quote(profile.executable_file)));
    } catch (fmt::format_error &e) {
        throw invalid_argument("malformed command template '" + command_template + "': " + e.what());
    }
}

string generate_driver_script(const language_profile &profile, const string &language, int time_limit) {
    validate_profile(profile);
    if (language != profile.language)
        throw invalid_argument("language " + language + " does not match profile " + profile.language);
    if (time_limit <= 0)
        throw invalid_argument("time limit must be positive");
    if (!regex_match(SANDBOX_USER, user_pattern))
        throw invalid_argument("sandbox user must be in the form uid:gid, got '" + SANDBOX_USER + "'");

    shell_script script;
    // clang-format off
    script.line("#!/bin/sh")
          .line("# Generated by codejudge, do not edit.")
          .line("set -u")
          .line("cd \"$(dirname \"$0\")\" || exit 1")
          .line()
          .assign("LANGUAGE", language)
          .assign("SOURCE_FILE", profile.source_file)
          .assign("EXECUTABLE_FILE", profile.executable_file)
          .assign("TIME_LIMIT", time_limit)
          .assign("OUTPUT_LIMIT", (long long)OUTPUT_LIMIT)
          .assign("PROTOCOL_VERSION", PROTOCOL_VERSION)
          .assign("PROGRAM_DIR", PROGRAM_DIRECTORY)
          .assign("RUN_AS", SANDBOX_USER)
          .assign("RUN_COMMAND", render_command(profile.run_command, profile));
    if (profile.requires_compilation())
        script.assign("COMPILE_COMMAND", render_command(*profile.compile_command, profile));

    script.line()
          .line("# base64 of the first OUTPUT_LIMIT bytes of a file, empty when the file is missing")
          .line("encode() {")
          .line("    head -c \"$OUTPUT_LIMIT\" \"$1\" 2>/dev/null | base64 | tr -d '\\n'")
          .line("}")
          .line()
          .line("# number of OOM kills reported by cgroup v2, 0 when unavailable")
          .line("oom_kills() {")
          .line("    value=$(sed -n 's/^oom_kill \\([0-9][0-9]*\\)$/\\1/p' /sys/fs/cgroup/memory.events 2>/dev/null)")
          .line("    echo \"${value:-0}\"")
          .line("}")
          .line()
          .line("now_ns() {")
          .line("    value=$(date +%s%N 2>/dev/null)")
          .line("    case \"$value\" in")
          .line("        ''|*[!0-9]*) echo \"$(date +%s)000000000\" ;;")
          .line("        *) echo \"$value\" ;;")
          .line("    esac")
          .line("}")
          .line()
          .line("# compiler and program run as RUN_AS, so they cannot reach tests/ or our stdout")
          .line("if [ -n \"$RUN_AS\" ]; then")
          .line("    if [ \"$(id -u)\" -ne 0 ] || ! command -v setpriv > /dev/null 2>&1; then")
          .line("        echo \"driver must run as root with setpriv installed to switch to $RUN_AS\" >&2")
          .line("        exit 126")
          .line("    fi")
          .line("    set -- setpriv --reuid=\"${RUN_AS%%:*}\" --regid=\"${RUN_AS#*:}\" --clear-groups --")
          .line("else")
          .line("    set --")
          .line("fi")
          .line();

    if (profile.requires_compilation()) {
        script.line("if ! ( cd \"$PROGRAM_DIR\" && exec \"$@\" sh -c \"$COMPILE_COMMAND\" ) > compile.log 2>&1; then")
              .line(fmt::format("    printf '{} {{\"version\":%d,\"encoding\":\"base64\",\"message\":\"%s\"}}\\n' \"$PROTOCOL_VERSION\" \"$(encode compile.log)\"",
                                COMPILATION_ERROR_MARKER))
              .line("    exit 0")
              .line("fi")
              .line();
    }

    script.line(fmt::format("printf '{}\\n'", RESULTS_START_MARKER))
          .line("index=1")
          .line("while [ -f \"tests/$index.in\" ]; do")
          .line("    cp \"tests/$index.in\" input.txt")
          .line("    rm -f output.txt stderr.txt")
          .line("    oom_before=$(oom_kills)")
          .line("    start=$(now_ns)")
          .line("    ( cd \"$PROGRAM_DIR\" && exec timeout -k 1 \"${TIME_LIMIT}s\" \"$@\" sh -c \"$RUN_COMMAND\" ) < input.txt > output.txt 2> stderr.txt")
          .line("    exit_code=$?")
          .line("    end=$(now_ns)")
          .line("    oom_after=$(oom_kills)")
          .line("    elapsed_ms=$(( (end - start) / 1000000 ))")
          .line("    if [ \"$elapsed_ms\" -lt 0 ]; then elapsed_ms=0; fi")
          .line("    time_used=$(printf '%d.%03d' $((elapsed_ms / 1000)) $((elapsed_ms % 1000)))")
          .line("    output_size=$(wc -c < output.txt | tr -d ' ')")
          .line("    if [ \"$output_size\" -gt \"$OUTPUT_LIMIT\" ]; then")
          .line("        output_limit_exceeded=true")
          .line("    else")
          .line("        output_limit_exceeded=false")
          .line("    fi")
          .line("    if [ \"$exit_code\" -eq 124 ] || { [ \"$exit_code\" -eq 137 ] && [ \"$elapsed_ms\" -ge $((TIME_LIMIT * 1000)) ]; }; then")
          .line("        status='Time Limit Exceeded'")
          .line("    elif [ \"$oom_after\" -gt \"$oom_before\" ]; then")
          .line("        status='Memory Limit Exceeded'")
          .line("    elif [ \"$exit_code\" -ne 0 ]; then")
          .line("        status='Runtime Error'")
          .line("    else")
          .line("        status='Success'")
          .line("    fi")
          .line(fmt::format("    printf '{} {{\"version\":%d,\"encoding\":\"base64\",\"index\":%d,\"output\":\"%s\",\"stderr\":\"%s\",\"status\":\"%s\",\"time\":%s,\"memory\":0,\"exit_code\":%d,\"output_limit_exceeded\":%s}}\\n' \\",
                            TEST_CASE_RESULT_MARKER))
          .line("        \"$PROTOCOL_VERSION\" \"$index\" \"$(encode output.txt)\" \"$(encode stderr.txt)\" \\")
          .line("        \"$status\" \"$time_used\" \"$exit_code\" \"$output_limit_exceeded\"")
          .line("    index=$((index + 1))")
          .line("done")
          .line(fmt::format("printf '{}\\n'", RESULTS_END_MARKER))
          .line("exit 0");
    // clang-format on

    return script.str();
}

}  // namespace codejudge
