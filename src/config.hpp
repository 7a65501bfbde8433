// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "guard.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hookguard {

inline constexpr int kPolicyVersion = 1;

/**
 * Parsed guard policy file.
 *
 *   version=1
 *   project_root=/path            (optional)
 *   install_entry_point=name.sh   (optional)
 *   [allow_root] [protected_file] [protected_dir] [protected_glob] [disable_guard]
 */
struct GuardPolicy {
    int version = 0;
    std::string project_root;
    std::string install_entry_point;
    std::vector<std::string> allow_roots;
    std::vector<std::string> protected_files;
    std::vector<std::string> protected_dirs;
    std::vector<std::string> protected_globs;
    std::vector<std::string> disabled_guards;
};

Result<GuardPolicy> parse_policy_file(const std::string& path, PolicyIssues& issues);
Result<GuardPolicy> parse_policy_text(const std::string& text, PolicyIssues& issues);
void report_policy_issues(const PolicyIssues& issues);

struct EngineConfig {
    std::string state_dir;
    std::string policy_path;
    bool policy_path_explicit = false;
    std::string audit_log_path;
    std::string override_store_path;
    uint32_t lock_timeout_ms = 0;
    GuardSettings guards;
    std::vector<std::string> disabled_guards;
};

// Defaults only; no environment or file access beyond $HOME.
EngineConfig default_engine_config();

// Merge a parsed policy into `config`. Protected entries extend the defaults.
void apply_policy(EngineConfig& config, const GuardPolicy& policy);

// Defaults, then the policy file, then HOOKGUARD_* environment overrides.
// An explicitly configured policy path must exist; the default may be absent.
Result<EngineConfig> load_engine_config();

} // namespace hookguard
