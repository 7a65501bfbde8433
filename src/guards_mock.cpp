// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"

namespace hookguard {

MockCodeGuard::MockCodeGuard()
{
    rules_ = {
        {Pattern::regex(R"(@mock\.patch)", true), "@mock.patch decorator"},
        {Pattern::regex(R"(unittest\.mock)", true), "unittest.mock import"},
        {Pattern::regex(R"(MagicMock)", true), "MagicMock object"},
        {Pattern::regex(R"(Mock\(\))", true), "Mock() object"},
        {Pattern::regex(R"(SIMULATION:)", true), "SIMULATION: marker"},
        {Pattern::regex(R"(if.*test_mode.*return.*fake)", true), "test-mode branch returning fake data"},
        {Pattern::regex(R"(mock_\w*\s*=)", true), "mock_ variable"},
        {Pattern::regex(R"(\.patch\()", true), ".patch() call"},
    };
}

const char* MockCodeGuard::description() const
{
    return "Blocks mock and simulation code in file edits";
}

Decision MockCodeGuard::check(const Event& event) const
{
    if (!event.is_file_edit() || !event.new_content) {
        return Decision::allow(name());
    }
    const std::string hit = first_line_match(rules_, *event.new_content);
    if (hit.empty()) {
        return Decision::allow(name());
    }
    return Decision::block(name(), "edit introduces mock code: " + hit,
                           std::string("Test against the real service; ask the operator before adding mocks"));
}

} // namespace hookguard
