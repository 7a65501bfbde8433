// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace hookguard {

struct ShellWord {
    std::string text;
    // Contains an unquoted $ expansion or command substitution.
    bool dynamic = false;
    bool redirect_op = false;
    // Some part of the word was quoted; grouping characters in it are text.
    bool quoted = false;
};

struct Redirection {
    std::string op; // ">", ">>", "<", ">&"
    ShellWord target;
};

struct SimpleCommand {
    std::vector<std::pair<std::string, std::string>> assignments;
    std::vector<ShellWord> argv;
    std::vector<Redirection> redirections;
    // The command runs a script of its own (eval, sh -c) whose commands follow
    // it in parse_command_line() output.
    bool runs_script = false;
    // Number of `sh -c` child shells between the command line and this command.
    int shell_depth = 0;

    [[nodiscard]] bool empty() const { return argv.empty(); }
    [[nodiscard]] const std::string& program() const;
    [[nodiscard]] bool has_arg(const std::string& arg) const;
};

// Split on unquoted ;, &&, ||, |, & and newlines. Text inside quotes, $( )
// and backticks stays in its segment.
std::vector<std::string> split_command_segments(const std::string& command);

std::vector<ShellWord> tokenize_shell_words(const std::string& segment);

// Tokenize one segment and peel off grouping and reserved words ((, {, !,
// if, then, elif, else, do, while, until and the matching ) or }), leading
// NAME=value assignments, redirections and transparent wrappers (sudo, env,
// nohup, time, command, exec). `env NAME=value cmd` assignments are reported
// as assignments.
SimpleCommand parse_simple_command(const std::string& segment);

inline constexpr int kMaxNestedScriptDepth = 4;

// Script text handed to `eval` or to a shell's -c option.
struct ScriptArgument {
    bool present = false;
    // Built from a runtime expansion; its text cannot be analyzed.
    bool dynamic = false;
    // Runs in a child shell (sh -c) rather than the current one (eval).
    bool child_shell = false;
    std::string text;
};

ScriptArgument script_argument(const SimpleCommand& cmd);

// All simple commands of a command line. Static eval / sh -c scripts are
// parsed as well, up to kMaxNestedScriptDepth levels, and their commands
// follow the command that runs them.
std::vector<SimpleCommand> parse_command_line(const std::string& command);

bool is_assignment_word(const std::string& word);

// Lexically resolve `target` against `base`, expanding a leading ~ to `home`.
// The result is absolute and normalized, without a trailing slash.
std::string resolve_path(const std::string& base, const std::string& target, const std::string& home);

// True when `path` equals `root` or lies beneath it, component-wise.
bool path_is_within(const std::string& path, const std::string& root);

} // namespace hookguard
