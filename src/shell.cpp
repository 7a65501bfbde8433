// cppcheck-suppress-file missingIncludeSystem
#include "shell.hpp"

#include <cctype>
#include <filesystem>

namespace hookguard {

namespace {

const std::string kEmpty;

bool is_fd_prefix(const std::string& word)
{
    if (word.empty()) {
        return false;
    }
    for (char c : word) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_wrapper(const std::string& program)
{
    return program == "sudo" || program == "nohup" || program == "time" || program == "command" ||
           program == "exec" || program == "builtin" || program == "nice";
}

bool is_reserved_prefix(const std::string& word)
{
    return word == "!" || word == "{" || word == "if" || word == "then" || word == "elif" || word == "else" ||
           word == "do" || word == "while" || word == "until";
}

bool is_shell_interpreter(const std::string& program)
{
    const size_t slash = program.rfind('/');
    const std::string base = slash == std::string::npos ? program : program.substr(slash + 1);
    return base == "sh" || base == "bash" || base == "zsh" || base == "dash" || base == "ksh";
}

// Drop ")" and "}" that close a group opened in an earlier segment.
void strip_group_closers(ShellWord& word)
{
    if (word.quoted || word.redirect_op) {
        return;
    }
    std::string& t = word.text;
    if (t == "}") {
        t.clear();
        return;
    }
    size_t opens = 0;
    size_t closes = 0;
    for (char c : t) {
        if (c == '(') {
            ++opens;
        } else if (c == ')') {
            ++closes;
        }
    }
    while (!t.empty() && t.back() == ')' && closes > opens) {
        t.pop_back();
        --closes;
    }
}

void append_commands(const std::string& command, int shell_depth, int nesting, std::vector<SimpleCommand>& out)
{
    for (const auto& segment : split_command_segments(command)) {
        SimpleCommand cmd = parse_simple_command(segment);
        cmd.shell_depth = shell_depth;
        const ScriptArgument script = script_argument(cmd);
        const bool expand = script.present && !script.dynamic && nesting < kMaxNestedScriptDepth;
        cmd.runs_script = expand;
        out.push_back(std::move(cmd));
        if (expand) {
            append_commands(script.text, shell_depth + (script.child_shell ? 1 : 0), nesting + 1, out);
        }
    }
}

std::string strip_trailing_slashes(std::string path)
{
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

const std::string& SimpleCommand::program() const
{
    if (argv.empty()) {
        return kEmpty;
    }
    return argv.front().text;
}

bool SimpleCommand::has_arg(const std::string& arg) const
{
    for (size_t i = 1; i < argv.size(); ++i) {
        if (argv[i].text == arg) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> split_command_segments(const std::string& command)
{
    std::vector<std::string> out;
    std::string current;
    bool in_single = false;
    bool in_double = false;
    bool in_backtick = false;
    int paren_depth = 0;

    auto flush = [&]() {
        if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        if (in_single) {
            current.push_back(c);
            if (c == '\'') {
                in_single = false;
            }
            continue;
        }
        if (c == '\\' && i + 1 < command.size()) {
            current.push_back(c);
            current.push_back(command[++i]);
            continue;
        }
        if (in_double) {
            current.push_back(c);
            if (c == '"') {
                in_double = false;
            }
            continue;
        }
        if (c == '\'') {
            in_single = true;
            current.push_back(c);
            continue;
        }
        if (c == '"') {
            in_double = true;
            current.push_back(c);
            continue;
        }
        if (c == '`') {
            in_backtick = !in_backtick;
            current.push_back(c);
            continue;
        }
        if (c == '$' && i + 1 < command.size() && command[i + 1] == '(') {
            ++paren_depth;
            current.push_back(c);
            current.push_back(command[++i]);
            continue;
        }
        if (paren_depth > 0 && c == ')') {
            --paren_depth;
            current.push_back(c);
            continue;
        }
        if (in_backtick || paren_depth > 0) {
            current.push_back(c);
            continue;
        }
        if (c == ';' || c == '\n') {
            flush();
            continue;
        }
        if (c == '|') {
            flush();
            if (i + 1 < command.size() && command[i + 1] == '|') {
                ++i;
            }
            continue;
        }
        if (c == '&') {
            // "&>" and ">&" are redirections, not separators.
            const bool after_redirect = !current.empty() && (current.back() == '>' || current.back() == '<');
            const bool before_redirect = i + 1 < command.size() && command[i + 1] == '>';
            if (after_redirect || before_redirect) {
                current.push_back(c);
                continue;
            }
            flush();
            if (i + 1 < command.size() && command[i + 1] == '&') {
                ++i;
            }
            continue;
        }
        current.push_back(c);
    }
    flush();

    for (auto& segment : out) {
        size_t b = 0;
        while (b < segment.size() && std::isspace(static_cast<unsigned char>(segment[b]))) {
            ++b;
        }
        size_t e = segment.size();
        while (e > b && std::isspace(static_cast<unsigned char>(segment[e - 1]))) {
            --e;
        }
        segment = segment.substr(b, e - b);
    }
    std::vector<std::string> trimmed;
    for (auto& segment : out) {
        if (!segment.empty()) {
            trimmed.push_back(std::move(segment));
        }
    }
    return trimmed;
}

std::vector<ShellWord> tokenize_shell_words(const std::string& segment)
{
    std::vector<ShellWord> words;
    ShellWord current;
    bool has_word = false;
    bool in_single = false;
    bool in_double = false;
    int paren_depth = 0;
    bool in_backtick = false;

    auto flush = [&]() {
        if (has_word) {
            words.push_back(current);
        }
        current = ShellWord{};
        has_word = false;
    };

    for (size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];
        if (in_single) {
            if (c == '\'') {
                in_single = false;
            } else {
                current.text.push_back(c);
            }
            continue;
        }
        if (paren_depth > 0 || in_backtick) {
            current.text.push_back(c);
            if (c == '(' && i > 0 && segment[i - 1] == '$') {
                ++paren_depth;
            } else if (c == ')' && paren_depth > 0) {
                --paren_depth;
            } else if (c == '`') {
                in_backtick = false;
            }
            continue;
        }
        if (c == '\\' && i + 1 < segment.size()) {
            current.text.push_back(segment[++i]);
            current.quoted = true;
            has_word = true;
            continue;
        }
        if (in_double) {
            if (c == '"') {
                in_double = false;
                continue;
            }
            if (c == '$' || c == '`') {
                current.dynamic = true;
                if (c == '`') {
                    in_backtick = true;
                } else if (i + 1 < segment.size() && segment[i + 1] == '(') {
                    current.text.push_back(c);
                    current.text.push_back(segment[++i]);
                    ++paren_depth;
                    continue;
                }
            }
            current.text.push_back(c);
            continue;
        }
        if (c == '\'') {
            in_single = true;
            current.quoted = true;
            has_word = true;
            continue;
        }
        if (c == '"') {
            in_double = true;
            current.quoted = true;
            has_word = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }
        if (c == '>' || c == '<') {
            if (has_word && is_fd_prefix(current.text) && !current.dynamic) {
                current = ShellWord{};
                has_word = false;
            } else if (has_word && current.text == "&") {
                // &> redirects both streams.
                current = ShellWord{};
                has_word = false;
            } else {
                flush();
            }
            ShellWord op;
            op.redirect_op = true;
            op.text.push_back(c);
            if (c == '>' && i + 1 < segment.size() && (segment[i + 1] == '>' || segment[i + 1] == '&')) {
                op.text.push_back(segment[++i]);
            }
            words.push_back(op);
            continue;
        }
        if (c == '$' || c == '`') {
            current.dynamic = true;
            if (c == '`') {
                in_backtick = true;
            } else if (i + 1 < segment.size() && segment[i + 1] == '(') {
                current.text.push_back(c);
                current.text.push_back(segment[++i]);
                ++paren_depth;
                has_word = true;
                continue;
            }
        }
        current.text.push_back(c);
        has_word = true;
    }
    flush();
    return words;
}

bool is_assignment_word(const std::string& word)
{
    const size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    if (!(std::isalpha(static_cast<unsigned char>(word[0])) || word[0] == '_')) {
        return false;
    }
    for (size_t i = 1; i < eq; ++i) {
        const unsigned char c = static_cast<unsigned char>(word[i]);
        if (!(std::isalnum(c) || c == '_')) {
            return false;
        }
    }
    return true;
}

SimpleCommand parse_simple_command(const std::string& segment)
{
    SimpleCommand cmd;
    const auto words = tokenize_shell_words(segment);

    std::vector<ShellWord> rest;
    for (size_t i = 0; i < words.size(); ++i) {
        const auto& w = words[i];
        if (w.redirect_op) {
            Redirection r;
            r.op = w.text;
            if (i + 1 < words.size()) {
                r.target = words[++i];
                strip_group_closers(r.target);
            }
            cmd.redirections.push_back(r);
            continue;
        }
        rest.push_back(w);
    }

    size_t i = 0;
    bool in_env = false;
    while (i < rest.size()) {
        auto& w = rest[i];
        if (!w.quoted && !in_env && is_reserved_prefix(w.text)) {
            ++i;
            continue;
        }
        if (!w.quoted && !w.text.empty() && w.text[0] == '(') {
            const size_t n = w.text.find_first_not_of('(');
            w.text.erase(0, n == std::string::npos ? w.text.size() : n);
            if (w.text.empty()) {
                ++i;
            }
            continue;
        }
        if (is_assignment_word(w.text)) {
            const size_t eq = w.text.find('=');
            cmd.assignments.emplace_back(w.text.substr(0, eq), w.text.substr(eq + 1));
            ++i;
            continue;
        }
        if (in_env && !w.text.empty() && w.text[0] == '-') {
            ++i;
            continue;
        }
        if (w.text == "env") {
            in_env = true;
            ++i;
            continue;
        }
        if (is_wrapper(w.text)) {
            ++i;
            while (i < rest.size() && !rest[i].text.empty() && rest[i].text[0] == '-') {
                ++i;
            }
            continue;
        }
        break;
    }
    for (; i < rest.size(); ++i) {
        cmd.argv.push_back(rest[i]);
    }
    while (!cmd.argv.empty()) {
        strip_group_closers(cmd.argv.back());
        if (!cmd.argv.back().text.empty() || cmd.argv.back().quoted) {
            break;
        }
        cmd.argv.pop_back();
    }
    return cmd;
}

ScriptArgument script_argument(const SimpleCommand& cmd)
{
    ScriptArgument out;
    const std::string& program = cmd.program();
    if (program == "eval") {
        out.present = cmd.argv.size() > 1;
        for (size_t i = 1; i < cmd.argv.size(); ++i) {
            if (i > 1) {
                out.text.push_back(' ');
            }
            out.text += cmd.argv[i].text;
            out.dynamic = out.dynamic || cmd.argv[i].dynamic;
        }
        return out;
    }
    if (!is_shell_interpreter(program)) {
        return out;
    }
    bool saw_c = false;
    for (size_t i = 1; i < cmd.argv.size(); ++i) {
        const ShellWord& w = cmd.argv[i];
        if (w.text == "--") {
            continue;
        }
        if (w.text.size() > 1 && (w.text[0] == '-' || w.text[0] == '+') && w.text[1] != '-') {
            if (w.text[0] == '-' && w.text.find('c') != std::string::npos) {
                saw_c = true;
            }
            if (w.text == "-o" || w.text == "+o" || w.text == "-O" || w.text == "+O") {
                ++i;
            }
            continue;
        }
        if (w.text.rfind("--", 0) == 0) {
            continue;
        }
        if (saw_c) {
            out.present = true;
            out.dynamic = w.dynamic;
            out.child_shell = true;
            out.text = w.text;
        }
        break;
    }
    return out;
}

std::vector<SimpleCommand> parse_command_line(const std::string& command)
{
    std::vector<SimpleCommand> out;
    append_commands(command, 0, 0, out);
    return out;
}

std::string resolve_path(const std::string& base, const std::string& target, const std::string& home)
{
    std::string expanded = target;
    if (expanded == "~") {
        expanded = home;
    } else if (expanded.rfind("~/", 0) == 0) {
        expanded = home + expanded.substr(1);
    }

    std::filesystem::path p(expanded);
    if (p.is_relative()) {
        p = std::filesystem::path(base.empty() ? "/" : base) / p;
    }
    std::string normalized = p.lexically_normal().string();
    if (normalized.empty()) {
        normalized = "/";
    }
    return strip_trailing_slashes(normalized);
}

bool path_is_within(const std::string& path, const std::string& root)
{
    const std::string p = strip_trailing_slashes(std::filesystem::path(path).lexically_normal().string());
    const std::string r = strip_trailing_slashes(std::filesystem::path(root).lexically_normal().string());
    if (r.empty()) {
        return false;
    }
    if (r == "/") {
        return !p.empty() && p.front() == '/';
    }
    if (p == r) {
        return true;
    }
    return p.size() > r.size() && p.compare(0, r.size(), r) == 0 && p[r.size()] == '/';
}

} // namespace hookguard
