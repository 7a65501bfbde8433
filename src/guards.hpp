// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "guard.hpp"
#include "patterns.hpp"
#include "shell.hpp"

namespace hookguard {

inline constexpr const char* kPathBoundaryGuard = "path_boundary";
inline constexpr const char* kInstallScriptGuard = "install_script";
inline constexpr const char* kBypassPatternGuard = "bypass_pattern";
inline constexpr const char* kScriptIntegrityGuard = "script_integrity";
inline constexpr const char* kGitSafetyGuard = "git_safety";
inline constexpr const char* kTempFileLocationGuard = "temp_file_location";
inline constexpr const char* kMockCodeGuard = "mock_code";
inline constexpr const char* kPythonEnvGuard = "python_env";
inline constexpr const char* kDockerComposeGuard = "docker_compose";

// Blocks `cd`/`pushd` into directories outside the project root and the
// configured allow roots.
class PathBoundaryGuard : public Guard {
  public:
    explicit PathBoundaryGuard(GuardSettings settings);

    [[nodiscard]] const char* name() const override { return kPathBoundaryGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    [[nodiscard]] bool allowed(const std::string& path, const std::string& project_root) const;

    GuardSettings settings_;
};

class InstallScriptGuard : public Guard {
  public:
    explicit InstallScriptGuard(GuardSettings settings);

    [[nodiscard]] const char* name() const override { return kInstallScriptGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

    [[nodiscard]] bool is_install_script(const std::string& path) const;

  private:
    [[nodiscard]] Decision check_shell(const std::string& command) const;
    [[nodiscard]] Decision check_file_edit(const Event& event) const;

    GuardSettings settings_;
    std::vector<Pattern> name_patterns_;
    std::vector<PatternRule> content_rules_;
};

class BypassPatternGuard : public Guard {
  public:
    BypassPatternGuard();

    [[nodiscard]] const char* name() const override { return kBypassPatternGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

    [[nodiscard]] bool is_bypass_variable(const std::string& name) const;

  private:
    [[nodiscard]] Decision check_shell(const std::string& command) const;
    [[nodiscard]] Decision check_content(const Event& event) const;

    std::vector<Pattern> env_name_patterns_;
    std::vector<PatternRule> content_rules_;
    std::vector<PatternRule> precommit_rules_;
};

class ScriptIntegrityGuard : public Guard {
  public:
    explicit ScriptIntegrityGuard(GuardSettings settings);

    [[nodiscard]] const char* name() const override { return kScriptIntegrityGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

    // `path` may be absolute or relative to `cwd`.
    [[nodiscard]] bool is_protected(const std::string& path, const std::string& cwd,
                                    const std::string& project_root) const;

  private:
    [[nodiscard]] Decision check_shell(const Event& event) const;

    GuardSettings settings_;
    std::vector<Pattern> dir_patterns_;
    std::vector<Pattern> glob_patterns_;
};

class GitSafetyGuard : public Guard {
  public:
    GitSafetyGuard();

    [[nodiscard]] const char* name() const override { return kGitSafetyGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    [[nodiscard]] std::string check_git(const SimpleCommand& cmd) const;
    [[nodiscard]] std::string check_hook_tampering(const SimpleCommand& cmd) const;

    Pattern hooks_dir_;
};

// Warn-only: scratch files belong in a scratch directory, not the project root.
class TempFileLocationGuard : public Guard {
  public:
    explicit TempFileLocationGuard(GuardSettings settings);

    [[nodiscard]] const char* name() const override { return kTempFileLocationGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    GuardSettings settings_;
    std::vector<Pattern> scratch_patterns_;
};

// Blocks file edits that introduce mocks, patches or simulated results.
class MockCodeGuard : public Guard {
  public:
    MockCodeGuard();

    [[nodiscard]] const char* name() const override { return kMockCodeGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    std::vector<PatternRule> rules_;
};

// Blocks ad-hoc `pip install` and Python run outside the project venv.
class PythonEnvGuard : public Guard {
  public:
    explicit PythonEnvGuard(GuardSettings settings);

    [[nodiscard]] const char* name() const override { return kPythonEnvGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    GuardSettings settings_;
};

class DockerComposeGuard : public Guard {
  public:
    DockerComposeGuard() = default;

    [[nodiscard]] const char* name() const override { return kDockerComposeGuard; }
    [[nodiscard]] const char* description() const override;
    [[nodiscard]] Decision check(const Event& event) const override;

  private:
    [[nodiscard]] std::string check_docker(const SimpleCommand& cmd) const;
};

// Words of a command that are not options (do not start with '-').
std::vector<ShellWord> operand_words(const SimpleCommand& cmd);

// Subcommand of `git [global options] <sub> ...` and the index of its word.
std::string git_subcommand(const SimpleCommand& cmd, size_t& index);

} // namespace hookguard
