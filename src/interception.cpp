// cppcheck-suppress-file missingIncludeSystem
#include "interception.hpp"

#include <initializer_list>
#include <istream>
#include <ostream>

#include "json_value.hpp"
#include "logging.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

// Optional string field; present-but-not-a-string is malformed input.
Result<std::optional<std::string>> optional_string(const JsonValue& obj, const char* key)
{
    const JsonValue* v = obj.find(key);
    if (!v || v->is_null()) {
        return std::optional<std::string>{};
    }
    if (!v->is_string()) {
        return Error::invalid_input("Payload field has the wrong type", key);
    }
    return std::optional<std::string>(v->as_string());
}

Result<std::optional<std::string>> first_string(const JsonValue& obj, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        auto v = optional_string(obj, key);
        if (!v) {
            return v.error();
        }
        if (*v) {
            return v;
        }
    }
    return std::optional<std::string>{};
}

Result<std::optional<std::string>> extract_new_content(const JsonValue& input)
{
    auto direct = first_string(input, {"content", "new_string"});
    if (!direct) {
        return direct.error();
    }
    if (*direct) {
        return direct;
    }
    if (const JsonValue* edits = input.find("edits"); edits && edits->is_array()) {
        std::string joined;
        bool any = false;
        for (const auto& edit : edits->items()) {
            std::string piece;
            if (!edit.get_string("new_string", piece)) {
                continue;
            }
            if (any) {
                joined.push_back('\n');
            }
            joined += piece;
            any = true;
        }
        if (any) {
            return std::optional<std::string>(joined);
        }
    }
    return optional_string(input, "new_source");
}

} // namespace

Result<std::string> read_hook_payload(std::istream& in)
{
    std::string payload;
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        payload.append(buf, static_cast<size_t>(in.gcount()));
        if (payload.size() > kMaxPayloadBytes) {
            return Error::invalid_input("Payload exceeds size limit", std::to_string(kMaxPayloadBytes) + " bytes");
        }
    }
    if (in.bad()) {
        return Error(ErrorCode::IoError, "Failed to read hook payload");
    }
    return payload;
}

Result<Event> parse_hook_payload(const std::string& payload, const std::string& fallback_cwd)
{
    if (payload.size() > kMaxPayloadBytes) {
        return Error::invalid_input("Payload exceeds size limit", std::to_string(kMaxPayloadBytes) + " bytes");
    }
    if (trim(payload).empty()) {
        return Error::invalid_input("Empty payload");
    }
    auto doc = JsonValue::parse(payload);
    if (!doc) {
        return doc.error();
    }
    if (!doc->is_object()) {
        return Error::invalid_input("Payload is not a JSON object");
    }

    Event event;
    auto tool = first_string(*doc, {"tool_name", "tool"});
    if (!tool) {
        return tool.error();
    }
    if (!*tool || trim(**tool).empty()) {
        return Error::invalid_input("Payload is missing tool_name");
    }
    event.tool_name = trim(**tool);

    const JsonValue* input = nullptr;
    for (const char* key : {"tool_input", "toolInput", "parameters"}) {
        const JsonValue* v = doc->find(key);
        if (!v || v->is_null()) {
            continue;
        }
        if (!v->is_object()) {
            return Error::invalid_input("Payload field has the wrong type", key);
        }
        input = v;
        break;
    }
    const JsonValue& fields = input ? *input : *doc;

    auto command = optional_string(fields, "command");
    if (!command) {
        return command.error();
    }
    if (!*command && input) {
        command = optional_string(*doc, "command");
        if (!command) {
            return command.error();
        }
    }
    event.command = *command;

    auto file_path = first_string(fields, {"file_path", "notebook_path", "path"});
    if (!file_path) {
        return file_path.error();
    }
    if (!*file_path && input) {
        file_path = optional_string(*doc, "file_path");
        if (!file_path) {
            return file_path.error();
        }
    }
    event.file_path = *file_path;

    auto content = extract_new_content(fields);
    if (!content) {
        return content.error();
    }
    event.new_content = *content;

    auto cwd = optional_string(*doc, "cwd");
    if (!cwd) {
        return cwd.error();
    }
    event.working_directory = (*cwd && !(*cwd)->empty()) ? **cwd : fallback_cwd;
    event.timestamp_unix_ms = now_unix_ms();
    return event;
}

int verdict_exit_code(const Verdict& verdict)
{
    return verdict.blocked ? kExitBlock : kExitAllow;
}

void report_verdict(const EvaluationResult& result, std::ostream& err)
{
    const Verdict& v = result.verdict;
    for (const auto& w : v.warnings) {
        err << "hookguard: warning: " << w << "\n";
    }
    if (v.overridden) {
        err << "hookguard: override accepted; allowing " << v.reasons.size() << " blocked check(s):\n";
        for (const auto& r : v.reasons) {
            err << "  - " << r << "\n";
        }
    } else if (v.blocked) {
        err << "hookguard: BLOCKED (" << v.reasons.size() << " violation(s))\n";
        for (const auto& d : v.decisions) {
            if (!d.blocked) {
                continue;
            }
            err << "  - " << d.guard_name << ": " << d.reason << "\n";
            if (d.suggestion) {
                err << "    suggestion: " << *d.suggestion << "\n";
            }
        }
        err << "To proceed, an operator can run `hookguard override issue` and supply the code via " << kOverrideEnvVar
            << ".\n";
    }
    if (!result.audit_ok) {
        err << "hookguard: ERROR: audit log write failed: " << result.audit_error << "\n";
    }
}

int handle_hook_payload(Engine& engine, const std::string& payload, const std::optional<std::string>& override_code,
                        const std::string& fallback_cwd, std::ostream& err)
{
    ScopedSpan span("hook.check", make_span_id("trace-hook"));
    auto event = parse_hook_payload(payload, fallback_cwd);
    if (!event) {
        span.fail(event.error().to_string());
        logger().log(SLOG_ERROR("Rejected hook payload").field("error", event.error().to_string()));
        err << "hookguard: cannot evaluate payload: " << event.error().to_string() << "\n";
        return kExitCheckFailed;
    }

    const EvaluationResult result = engine.evaluate(*event, override_code);
    report_verdict(result, err);
    return verdict_exit_code(result.verdict);
}

} // namespace hookguard
