// cppcheck-suppress-file missingIncludeSystem
/*
 * hookguard - command implementations
 */

#include "commands.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>

#include "audit_log.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "interception.hpp"
#include "logging.hpp"
#include "override_store.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

std::string current_directory()
{
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return "/";
    }
    return cwd.string();
}

Result<EngineConfig> load_config_or_report()
{
    auto config = load_engine_config();
    if (!config) {
        std::cerr << "hookguard: configuration error: " << config.error().to_string() << "\n";
    }
    return config;
}

const char* override_status(const OverrideCode& code, int64_t now)
{
    if (code.consumed) {
        return "consumed";
    }
    if (code.expired(now)) {
        return "expired";
    }
    return "active";
}

} // namespace

int cmd_check(const std::optional<std::string>& override_code)
{
    auto config = load_config_or_report();
    if (!config) {
        return kExitCheckFailed;
    }
    auto engine = make_engine(*config);
    if (!engine) {
        logger().log(SLOG_ERROR("Failed to build guard registry").field("error", engine.error().to_string()));
        std::cerr << "hookguard: " << engine.error().to_string() << "\n";
        return kExitCheckFailed;
    }
    auto payload = read_hook_payload(std::cin);
    if (!payload) {
        std::cerr << "hookguard: cannot read payload: " << payload.error().to_string() << "\n";
        return kExitCheckFailed;
    }
    return handle_hook_payload(**engine, *payload, override_code, current_directory(), std::cerr);
}

int cmd_override_issue(int64_t ttl_seconds, const std::string& reason, bool json_output)
{
    const std::string trace_id = make_span_id("trace-override-issue");
    ScopedSpan span("cli.override_issue", trace_id);

    auto config = load_config_or_report();
    if (!config) {
        span.fail(config.error().to_string());
        return 1;
    }
    OverrideStore store(config->override_store_path, config->lock_timeout_ms);
    auto issued = store.issue(ttl_seconds, reason);
    if (!issued) {
        span.fail(issued.error().to_string());
        std::cerr << "hookguard: failed to issue override: " << issued.error().to_string() << "\n";
        return 1;
    }

    if (json_output) {
        std::cout << "{\"code\":\"" << issued->code << "\",\"issued_at\":" << issued->record.issued_at
                  << ",\"expires_at\":" << issued->record.expires_at << ",\"reason\":\""
                  << json_escape(issued->record.reason) << "\"}\n";
        return 0;
    }
    std::cout << "Override code: " << issued->code << "\n";
    std::cout << "Expires: " << format_unix_seconds_utc(issued->record.expires_at) << " (single use)\n";
    std::cout << "Supply it to the next hook run as " << kOverrideEnvVar << "=" << issued->code << "\n";
    return 0;
}

int cmd_override_list(bool json_output)
{
    auto config = load_config_or_report();
    if (!config) {
        return 1;
    }
    OverrideStore store(config->override_store_path, config->lock_timeout_ms);
    auto entries = store.list();
    if (!entries) {
        std::cerr << "hookguard: failed to read override store: " << entries.error().to_string() << "\n";
        return 1;
    }

    const int64_t now = now_unix_ms() / 1000;
    if (json_output) {
        std::cout << "[";
        for (size_t i = 0; i < entries->size(); ++i) {
            const auto& e = (*entries)[i];
            if (i > 0) {
                std::cout << ",";
            }
            std::cout << "{\"code_sha256\":\"" << e.code_sha256 << "\",\"issued_at\":" << e.issued_at
                      << ",\"expires_at\":" << e.expires_at << ",\"status\":\"" << override_status(e, now)
                      << "\",\"reason\":\"" << json_escape(e.reason) << "\"}";
        }
        std::cout << "]\n";
        return 0;
    }

    if (entries->empty()) {
        std::cout << "No override codes.\n";
        return 0;
    }
    std::cout << std::left << std::setw(14) << "CODE-SHA256" << std::setw(22) << "EXPIRES" << std::setw(10)
              << "STATUS"
              << "REASON\n";
    for (const auto& e : *entries) {
        std::cout << std::left << std::setw(14) << e.code_sha256.substr(0, 12) << std::setw(22)
                  << format_unix_seconds_utc(e.expires_at) << std::setw(10) << override_status(e, now) << e.reason
                  << "\n";
    }
    return 0;
}

int cmd_override_prune()
{
    auto config = load_config_or_report();
    if (!config) {
        return 1;
    }
    OverrideStore store(config->override_store_path, config->lock_timeout_ms);
    auto removed = store.prune();
    if (!removed) {
        std::cerr << "hookguard: failed to prune override store: " << removed.error().to_string() << "\n";
        return 1;
    }
    std::cout << "Removed " << *removed << " expired or consumed override code(s).\n";
    return 0;
}

int cmd_audit_tail(size_t count)
{
    auto config = load_config_or_report();
    if (!config) {
        return 1;
    }
    AuditLog log(audit_options_from_config(*config));
    auto records = log.read_tail(count);
    if (!records) {
        std::cerr << "hookguard: failed to read audit log: " << records.error().to_string() << "\n";
        return 1;
    }
    for (const auto& r : *records) {
        std::cout << audit_record_to_json(r) << "\n";
    }
    return 0;
}

int cmd_audit_summary(int64_t window_seconds, bool json_output)
{
    auto config = load_config_or_report();
    if (!config) {
        return 1;
    }
    AuditLog log(audit_options_from_config(*config));
    auto summary = log.summarize(window_seconds, now_unix_ms());
    if (!summary) {
        std::cerr << "hookguard: failed to read audit log: " << summary.error().to_string() << "\n";
        return 1;
    }
    const AuditSummary& s = *summary;

    if (json_output) {
        auto write_map = [](const std::map<std::string, uint64_t>& m) {
            std::cout << "{";
            bool first = true;
            for (const auto& [guard, count] : m) {
                if (!first) {
                    std::cout << ",";
                }
                first = false;
                std::cout << "\"" << json_escape(guard) << "\":" << count;
            }
            std::cout << "}";
        };
        std::cout << "{\"window_seconds\":" << s.window_seconds << ",\"total\":" << s.total
                  << ",\"allowed\":" << s.allowed << ",\"blocked\":" << s.blocked << ",\"overridden\":" << s.overridden
                  << ",\"malformed_lines\":" << s.malformed_lines << ",\"blocks_by_guard\":";
        write_map(s.blocks_by_guard);
        std::cout << ",\"warnings_by_guard\":";
        write_map(s.warnings_by_guard);
        std::cout << "}\n";
        return 0;
    }

    if (s.window_seconds > 0) {
        std::cout << "Audit summary (last " << s.window_seconds << "s)\n";
    } else {
        std::cout << "Audit summary (readable tail)\n";
    }
    std::cout << "  Events: " << s.total << "\n";
    std::cout << "  Allowed: " << s.allowed << "\n";
    std::cout << "  Blocked: " << s.blocked << "\n";
    std::cout << "  Overridden: " << s.overridden << "\n";
    if (s.malformed_lines > 0) {
        std::cout << "  Malformed lines skipped: " << s.malformed_lines << "\n";
    }
    if (!s.blocks_by_guard.empty()) {
        std::cout << "\nBlocks by guard:\n";
        for (const auto& [guard, count] : s.blocks_by_guard) {
            std::cout << "  " << guard << ": " << count << (count >= 3 ? "  (repeated)" : "") << "\n";
        }
    }
    if (!s.warnings_by_guard.empty()) {
        std::cout << "\nWarnings by guard:\n";
        for (const auto& [guard, count] : s.warnings_by_guard) {
            std::cout << "  " << guard << ": " << count << "\n";
        }
    }
    return 0;
}

int cmd_guards_list()
{
    auto config = load_config_or_report();
    if (!config) {
        return 1;
    }
    auto registry = build_default_registry(config->guards, config->disabled_guards);
    if (!registry) {
        std::cerr << "hookguard: " << registry.error().to_string() << "\n";
        return 1;
    }
    for (const auto& g : registry->list()) {
        std::cout << std::left << std::setw(20) << g.name << std::setw(10) << (g.enabled ? "enabled" : "disabled")
                  << g.description << "\n";
    }
    return 0;
}

int cmd_policy_validate(const std::string& path, bool verbose)
{
    const std::string trace_id = make_span_id("trace-policy-validate");
    ScopedSpan span("cli.policy_validate", trace_id);

    PolicyIssues issues;
    auto result = parse_policy_file(path, issues);
    report_policy_issues(issues);
    if (!result) {
        span.fail(result.error().to_string());
        std::cerr << "Policy validation failed:\n";
        for (const auto& e : issues.errors) {
            std::cerr << "  " << e << "\n";
        }
        return 1;
    }

    const GuardPolicy& policy = *result;
    std::cout << "Policy validation successful.\n\n";
    std::cout << "Summary:\n";
    std::cout << "  Version: " << policy.version << "\n";
    if (!policy.project_root.empty()) {
        std::cout << "  Project root: " << policy.project_root << "\n";
    }
    if (!policy.install_entry_point.empty()) {
        std::cout << "  Install entry point: " << policy.install_entry_point << "\n";
    }
    std::cout << "  Allow roots: " << policy.allow_roots.size() << "\n";
    std::cout << "  Protected files: " << policy.protected_files.size() << "\n";
    std::cout << "  Protected dirs: " << policy.protected_dirs.size() << "\n";
    std::cout << "  Protected globs: " << policy.protected_globs.size() << "\n";
    std::cout << "  Disabled guards: " << policy.disabled_guards.size() << "\n";

    if (verbose) {
        auto print_list = [](const char* title, const std::vector<std::string>& items) {
            if (items.empty()) {
                return;
            }
            std::cout << "\n" << title << ":\n";
            for (const auto& item : items) {
                std::cout << "  - " << item << "\n";
            }
        };
        print_list("Allow roots", policy.allow_roots);
        print_list("Protected files", policy.protected_files);
        print_list("Protected dirs", policy.protected_dirs);
        print_list("Protected globs", policy.protected_globs);
        print_list("Disabled guards", policy.disabled_guards);
    }
    if (issues.has_warnings()) {
        std::cout << "\nWarnings: " << issues.warnings.size() << "\n";
        for (const auto& w : issues.warnings) {
            std::cout << "  " << w << "\n";
        }
    }
    return 0;
}

int run_command_guarded(const std::string& command, const std::function<int()>& body, std::ostream& err)
{
    try {
        return body();
    } catch (const std::exception& e) {
        logger().log(SLOG_ERROR("Command failed with an exception").field("command", command).field("error", e.what()));
        err << "hookguard: internal error in " << command << ": " << e.what() << "\n";
    } catch (...) {
        logger().log(SLOG_ERROR("Command failed with a non-standard exception").field("command", command));
        err << "hookguard: internal error in " << command << "\n";
    }
    return kExitCheckFailed;
}

} // namespace hookguard
