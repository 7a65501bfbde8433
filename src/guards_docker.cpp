// cppcheck-suppress-file missingIncludeSystem
#include <unordered_set>

#include "guards.hpp"

namespace hookguard {

namespace {

constexpr const char* kComposeSuggestion = "Use docker compose build <service> && docker compose up -d <service>";

// First word that is neither an option nor the value of one listed in
// `takes_value`, starting at `start`.
size_t next_word(const SimpleCommand& cmd, size_t start, const std::unordered_set<std::string>& takes_value)
{
    for (size_t i = start; i < cmd.argv.size(); ++i) {
        const std::string& w = cmd.argv[i].text;
        if (takes_value.count(w) != 0) {
            ++i;
            continue;
        }
        if (!w.empty() && w[0] == '-') {
            continue;
        }
        return i;
    }
    return cmd.argv.size();
}

std::string word_at(const SimpleCommand& cmd, size_t index)
{
    return index < cmd.argv.size() ? cmd.argv[index].text : std::string();
}

std::string check_compose(const SimpleCommand& cmd, size_t start)
{
    static const std::unordered_set<std::string> compose_values = {
        "-f", "--file", "-p", "--project-name", "--profile", "--env-file", "--project-directory"};
    if (word_at(cmd, next_word(cmd, start, compose_values)) == "restart") {
        return "compose restart reuses the existing images and skips code changes";
    }
    return {};
}

} // namespace

const char* DockerComposeGuard::description() const
{
    return "Blocks docker restart and container management outside compose";
}

std::string DockerComposeGuard::check_docker(const SimpleCommand& cmd) const
{
    if (path_basename(cmd.program()) == "docker-compose") {
        return check_compose(cmd, 1);
    }
    static const std::unordered_set<std::string> global_values = {"-c", "--context", "-H", "--host",
                                                                   "--config", "-l", "--log-level"};
    static const std::unordered_set<std::string> safe = {"ps",   "logs",    "exec", "images", "system", "info",
                                                         "version", "help", "inspect", "stats", "top"};
    const size_t sub_index = next_word(cmd, 1, global_values);
    const std::string sub = word_at(cmd, sub_index);
    if (sub.empty() || cmd.has_arg("--help")) {
        return {};
    }
    if (sub == "compose") {
        return check_compose(cmd, sub_index + 1);
    }
    if (sub == "restart" || (sub == "container" && word_at(cmd, next_word(cmd, sub_index + 1, {})) == "restart")) {
        return "docker restart reuses the existing image and skips code changes";
    }
    if (safe.count(sub) != 0) {
        return {};
    }
    return "docker " + sub + " manages containers outside docker compose";
}

Decision DockerComposeGuard::check(const Event& event) const
{
    if (!event.is_shell() || !event.command) {
        return Decision::allow(name());
    }
    for (const auto& cmd : parse_command_line(*event.command)) {
        const std::string base = path_basename(cmd.program());
        if (base != "docker" && base != "docker-compose") {
            continue;
        }
        std::string reason = check_docker(cmd);
        if (!reason.empty()) {
            return Decision::block(name(), reason, std::string(kComposeSuggestion));
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
