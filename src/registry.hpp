// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "guard.hpp"
#include "result.hpp"

namespace hookguard {

struct GuardInfo {
    std::string name;
    std::string description;
    bool enabled = true;
};

/**
 * Ordered collection of uniquely named guards.
 *
 * evaluate() runs every enabled guard in registration order and never
 * short-circuits, so one event reports all of its violations.
 */
class GuardRegistry {
  public:
    Result<void> register_guard(std::unique_ptr<Guard> guard);
    Result<void> set_enabled(const std::string& name, bool enabled);

    [[nodiscard]] std::vector<Decision> evaluate(const Event& event) const;
    [[nodiscard]] std::vector<GuardInfo> list() const;
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool contains(const std::string& name) const;

  private:
    struct Entry {
        std::unique_ptr<Guard> guard;
        bool enabled = true;
    };
    std::vector<Entry> entries_;
};

// The static guard table in deterministic order, with `disabled` guards
// switched off. Unknown names in `disabled` are an InvalidArgument error.
Result<GuardRegistry> build_default_registry(const GuardSettings& settings,
                                             const std::vector<std::string>& disabled = {});

} // namespace hookguard
