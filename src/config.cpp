// cppcheck-suppress-file missingIncludeSystem
#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <unordered_set>

#include "file_lock.hpp"
#include "guards.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

bool is_known_guard(const std::string& name)
{
    static const std::unordered_set<std::string> known = {
        kPathBoundaryGuard, kInstallScriptGuard, kBypassPatternGuard, kScriptIntegrityGuard, kGitSafetyGuard,
        kTempFileLocationGuard, kMockCodeGuard, kPythonEnvGuard, kDockerComposeGuard};
    return known.find(name) != known.end();
}

void append_unique(std::vector<std::string>& list, const std::vector<std::string>& extra)
{
    for (const auto& item : extra) {
        bool present = false;
        for (const auto& existing : list) {
            if (existing == item) {
                present = true;
                break;
            }
        }
        if (!present) {
            list.push_back(item);
        }
    }
}

std::string line_prefix(size_t line_no)
{
    return "line " + std::to_string(line_no) + ": ";
}

} // namespace

Result<GuardPolicy> parse_policy_file(const std::string& path, PolicyIssues& issues)
{
    auto text = read_file_to_string(path);
    if (!text) {
        issues.errors.push_back("Failed to open '" + path + "': " + text.error().to_string());
        if (text.error().code() == ErrorCode::ResourceNotFound) {
            return Error(ErrorCode::ResourceNotFound, "Policy file not found", path);
        }
        return Error(ErrorCode::PolicyParseFailed, "Failed to open policy file", path);
    }
    return parse_policy_text(*text, issues);
}

Result<GuardPolicy> parse_policy_text(const std::string& text, PolicyIssues& issues)
{
    GuardPolicy policy{};
    std::string section;
    std::unordered_set<std::string> seen;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    static const std::unordered_set<std::string> valid_sections = {"allow_root", "protected_file", "protected_dir",
                                                                   "protected_glob", "disable_guard"};

    while (std::getline(in, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            if (valid_sections.find(section) == valid_sections.end()) {
                issues.errors.push_back(line_prefix(line_no) + "unknown section '" + section + "'");
                section.clear();
            }
            continue;
        }

        if (section.empty()) {
            std::string key;
            std::string value;
            if (!parse_key_value(trimmed, key, value)) {
                issues.errors.push_back(line_prefix(line_no) + "expected key=value in header");
                continue;
            }
            if (key == "version") {
                uint64_t version = 0;
                if (!parse_uint64(value, version) || version == 0 ||
                    version > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                    issues.errors.push_back(line_prefix(line_no) + "invalid version");
                    continue;
                }
                if (version != static_cast<uint64_t>(kPolicyVersion)) {
                    issues.errors.push_back(line_prefix(line_no) + "unsupported version " + value);
                    continue;
                }
                policy.version = static_cast<int>(version);
            } else if (key == "project_root") {
                if (value.empty() || (value[0] != '/' && value[0] != '~')) {
                    issues.errors.push_back(line_prefix(line_no) + "project_root must be absolute");
                    continue;
                }
                policy.project_root = value;
            } else if (key == "install_entry_point") {
                if (value.empty() || value.find('/') != std::string::npos) {
                    issues.errors.push_back(line_prefix(line_no) + "install_entry_point must be a file name");
                    continue;
                }
                policy.install_entry_point = value;
            } else {
                issues.errors.push_back(line_prefix(line_no) + "unknown header key '" + key + "'");
            }
            continue;
        }

        if (!seen.insert(section + "\n" + trimmed).second) {
            issues.warnings.push_back(line_prefix(line_no) + "duplicate " + section + " entry '" + trimmed + "'");
            continue;
        }

        if (section == "allow_root") {
            if (trimmed[0] != '/' && trimmed[0] != '~') {
                issues.errors.push_back(line_prefix(line_no) + "allow_root must be absolute");
                continue;
            }
            if (trimmed == "/") {
                issues.warnings.push_back(line_prefix(line_no) + "allow_root '/' disables the path boundary");
            }
            policy.allow_roots.push_back(trimmed);
            continue;
        }

        if (section == "protected_file") {
            if (trimmed.find('/') != std::string::npos) {
                issues.errors.push_back(line_prefix(line_no) + "protected_file must be a basename");
                continue;
            }
            policy.protected_files.push_back(trimmed);
            continue;
        }

        if (section == "protected_dir") {
            while (trimmed.size() > 1 && trimmed.back() == '/') {
                trimmed.pop_back();
            }
            if (!trimmed.empty() && trimmed[0] == '/') {
                issues.warnings.push_back(line_prefix(line_no) +
                                          "protected_dir is matched as path components; leading '/' ignored");
            }
            policy.protected_dirs.push_back(trimmed);
            continue;
        }

        if (section == "protected_glob") {
            policy.protected_globs.push_back(trimmed);
            continue;
        }

        if (section == "disable_guard") {
            if (!is_known_guard(trimmed)) {
                issues.errors.push_back(line_prefix(line_no) + "unknown guard '" + trimmed + "'");
                continue;
            }
            policy.disabled_guards.push_back(trimmed);
            continue;
        }
    }

    if (policy.version == 0) {
        issues.errors.push_back("missing version header");
    }
    if (issues.has_errors()) {
        return Error(ErrorCode::PolicyParseFailed, "Policy contains errors", issues.errors.front());
    }
    return policy;
}

void report_policy_issues(const PolicyIssues& issues)
{
    for (const auto& e : issues.errors) {
        logger().log(SLOG_ERROR("Policy error").field("detail", e));
    }
    for (const auto& w : issues.warnings) {
        logger().log(SLOG_WARN("Policy warning").field("detail", w));
    }
}

EngineConfig default_engine_config()
{
    EngineConfig config;
    const std::string home = home_directory();
    config.state_dir = (std::filesystem::path(home) / kDefaultStateSubdir).string();
    config.policy_path = (std::filesystem::path(config.state_dir) / kPolicyFileName).string();
    config.audit_log_path = (std::filesystem::path(config.state_dir) / kAuditLogFileName).string();
    config.override_store_path = (std::filesystem::path(config.state_dir) / kOverrideStoreFileName).string();
    config.lock_timeout_ms = kDefaultLockTimeoutMs;
    config.guards = default_guard_settings();
    return config;
}

void apply_policy(EngineConfig& config, const GuardPolicy& policy)
{
    if (!policy.project_root.empty()) {
        config.guards.project_root = policy.project_root;
    }
    if (!policy.install_entry_point.empty()) {
        config.guards.install_entry_point = policy.install_entry_point;
    }
    append_unique(config.guards.allow_roots, policy.allow_roots);
    append_unique(config.guards.protected_files, policy.protected_files);
    append_unique(config.guards.protected_dirs, policy.protected_dirs);
    append_unique(config.guards.protected_globs, policy.protected_globs);
    append_unique(config.disabled_guards, policy.disabled_guards);
}

Result<EngineConfig> load_engine_config()
{
    EngineConfig config = default_engine_config();

    const char* state_dir = std::getenv("HOOKGUARD_STATE_DIR");
    if (state_dir && *state_dir) {
        config.state_dir = state_dir;
        config.policy_path = (std::filesystem::path(config.state_dir) / kPolicyFileName).string();
        config.audit_log_path = (std::filesystem::path(config.state_dir) / kAuditLogFileName).string();
        config.override_store_path = (std::filesystem::path(config.state_dir) / kOverrideStoreFileName).string();
    }
    const char* policy_path = std::getenv("HOOKGUARD_POLICY_PATH");
    if (policy_path && *policy_path) {
        config.policy_path = policy_path;
        config.policy_path_explicit = true;
    }

    PolicyIssues issues;
    auto policy = parse_policy_file(config.policy_path, issues);
    if (policy) {
        report_policy_issues(issues);
        apply_policy(config, *policy);
    } else if (policy.error().code() == ErrorCode::ResourceNotFound && !config.policy_path_explicit) {
        logger().log(SLOG_DEBUG("No policy file; using built-in defaults").field("path", config.policy_path));
    } else {
        report_policy_issues(issues);
        return policy.error();
    }

    config.audit_log_path = env_or_default("HOOKGUARD_AUDIT_LOG_PATH", config.audit_log_path);
    config.override_store_path = env_or_default("HOOKGUARD_OVERRIDE_STORE_PATH", config.override_store_path);
    config.guards.project_root = env_or_default("HOOKGUARD_PROJECT_ROOT", config.guards.project_root);

    uint32_t u32 = 0;
    if (parse_u32_env("HOOKGUARD_LOCK_TIMEOUT_MS", u32)) {
        config.lock_timeout_ms = u32;
    }
    return config;
}

} // namespace hookguard
