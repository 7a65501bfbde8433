// cppcheck-suppress-file missingIncludeSystem
/*
 * hookguard - command-interception policy engine
 *
 * Entry point and argument dispatch. Hook mode ("check") is the default when
 * no subcommand is given so the binary can be registered directly as a
 * pre-tool hook.
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "commands.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {

using namespace hookguard;

int usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " [command] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  check                               Evaluate a hook payload from stdin (default)\n"
              << "  override issue [--ttl SECONDS] [--reason TEXT] [--json]\n"
              << "                                      Issue a single-use override code\n"
              << "  override list [--json]              List override codes (hashes only)\n"
              << "  override prune                      Drop expired and consumed codes\n"
              << "  audit tail [--count N]              Print the most recent audit records\n"
              << "  audit summary [--window-seconds N] [--json]\n"
              << "                                      Summarize outcomes and repeated blocks\n"
              << "  guards list                         List registered guards\n"
              << "  policy validate <file> [--verbose]  Validate a policy file\n"
              << "\n"
              << "Options:\n"
              << "  --help                              Show this help\n"
              << "  --version                           Show version\n"
              << "\n"
              << "Exit codes in check mode: 0 allow, 2 block, 1 evaluation failure.\n"
              << "Set " << kOverrideEnvVar << " to supply an override code.\n";
    return 1;
}

std::optional<std::string> override_code_from_env()
{
    const char* value = std::getenv(kOverrideEnvVar);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

int dispatch_override(int argc, char** argv)
{
    if (argc < 3) {
        return usage(argv[0]);
    }
    const std::string sub = argv[2];
    if (sub == "issue") {
        int64_t ttl = kOverrideDefaultTtlSeconds;
        std::string reason;
        bool json = false;
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--ttl" && i + 1 < argc) {
                if (!parse_int64(argv[++i], ttl)) {
                    std::cerr << "Invalid --ttl value\n";
                    return 1;
                }
            } else if (arg == "--reason" && i + 1 < argc) {
                reason = argv[++i];
            } else if (arg == "--json") {
                json = true;
            } else {
                return usage(argv[0]);
            }
        }
        return cmd_override_issue(ttl, reason, json);
    }
    if (sub == "list") {
        bool json = false;
        for (int i = 3; i < argc; ++i) {
            if (std::string(argv[i]) == "--json") {
                json = true;
            } else {
                return usage(argv[0]);
            }
        }
        return cmd_override_list(json);
    }
    if (sub == "prune") {
        return argc == 3 ? cmd_override_prune() : usage(argv[0]);
    }
    return usage(argv[0]);
}

int dispatch_audit(int argc, char** argv)
{
    if (argc < 3) {
        return usage(argv[0]);
    }
    const std::string sub = argv[2];
    if (sub == "tail") {
        uint64_t count = 20;
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--count" && i + 1 < argc) {
                if (!parse_uint64(argv[++i], count) || count == 0) {
                    std::cerr << "Invalid --count value\n";
                    return 1;
                }
            } else {
                return usage(argv[0]);
            }
        }
        return cmd_audit_tail(static_cast<size_t>(count));
    }
    if (sub == "summary") {
        int64_t window = 0;
        bool json = false;
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "--window-seconds" || arg == "--window") && i + 1 < argc) {
                if (!parse_int64(argv[++i], window) || window < 0) {
                    std::cerr << "Invalid --window-seconds value\n";
                    return 1;
                }
            } else if (arg == "--json") {
                json = true;
            } else {
                return usage(argv[0]);
            }
        }
        return cmd_audit_summary(window, json);
    }
    return usage(argv[0]);
}

int dispatch(int argc, char** argv)
{
    if (argc < 2) {
        return cmd_check(override_code_from_env());
    }
    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        usage(argv[0]);
        return 0;
    }
    if (cmd == "--version") {
        std::cout << "hookguard " << kVersion << "\n";
        return 0;
    }
    if (cmd == "check") {
        if (argc != 2) {
            return usage(argv[0]);
        }
        return cmd_check(override_code_from_env());
    }
    if (cmd == "override") {
        return dispatch_override(argc, argv);
    }
    if (cmd == "audit") {
        return dispatch_audit(argc, argv);
    }
    if (cmd == "guards") {
        if (argc == 3 && std::string(argv[2]) == "list") {
            return cmd_guards_list();
        }
        return usage(argv[0]);
    }
    if (cmd == "policy") {
        if (argc >= 4 && std::string(argv[2]) == "validate") {
            bool verbose = false;
            for (int i = 4; i < argc; ++i) {
                if (std::string(argv[i]) == "--verbose") {
                    verbose = true;
                } else {
                    return usage(argv[0]);
                }
            }
            return cmd_policy_validate(argv[3], verbose);
        }
        return usage(argv[0]);
    }
    return usage(argv[0]);
}

} // namespace

int main(int argc, char** argv)
{
    configure_logger_from_env();
    const std::string command = argc < 2 ? "check" : argv[1];
    return run_command_guarded(command, [argc, argv]() { return dispatch(argc, argv); }, std::cerr);
}
