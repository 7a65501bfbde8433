// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstring>
#include <string>
#include <utility>
#include <variant>

namespace hookguard {

enum class ErrorCode {
    Unknown,
    InvalidArgument,
    InvalidInput,
    IoError,
    ResourceNotFound,
    ResourceBusy,
    PermissionDenied,
    PolicyParseFailed,
    DuplicateGuard,
    GuardFault,
    OverrideRejected,
    AuditWriteFailed,
};

const char* error_code_name(ErrorCode code);

class Error {
  public:
    Error(ErrorCode code, std::string message, std::string context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    static Error system(int errnum, const std::string& message)
    {
        return Error(ErrorCode::IoError, message, std::strerror(errnum));
    }

    static Error not_found(const std::string& what)
    {
        return Error(ErrorCode::ResourceNotFound, "Not found", what);
    }

    static Error invalid_argument(const std::string& message)
    {
        return Error(ErrorCode::InvalidArgument, message);
    }

    static Error invalid_input(const std::string& message, const std::string& context = {})
    {
        return Error(ErrorCode::InvalidInput, message, context);
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::string("[") + error_code_name(code_) + "] " + message_;
        if (!context_.empty()) {
            out += ": " + context_;
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

/**
 * Value-or-error return type.
 *
 * Implicitly constructible from either a T or an Error so functions can
 * `return value;` or `return Error(...);` directly.
 */
template <typename T> class Result {
  public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &std::get<T>(data_); }
    const T* operator->() const { return &std::get<T>(data_); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

  private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
  public:
    Result() = default;
    Result(const Error& error) : error_(error), ok_(false) {}
    Result(Error&& error) : error_(std::move(error)), ok_(false) {}

    [[nodiscard]] bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::Unknown, ""};
    bool ok_ = true;
};

#define HOOKGUARD_CONCAT_INNER(a, b) a##b
#define HOOKGUARD_CONCAT(a, b) HOOKGUARD_CONCAT_INNER(a, b)

// Propagate the error of a Result-returning expression to the caller.
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto HOOKGUARD_CONCAT(_try_result_, __LINE__) = (expr);                                                        \
        if (!HOOKGUARD_CONCAT(_try_result_, __LINE__)) {                                                               \
            return HOOKGUARD_CONCAT(_try_result_, __LINE__).error();                                                   \
        }                                                                                                              \
    } while (0)

inline const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Unknown:
            return "Unknown";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::ResourceNotFound:
            return "ResourceNotFound";
        case ErrorCode::ResourceBusy:
            return "ResourceBusy";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::PolicyParseFailed:
            return "PolicyParseFailed";
        case ErrorCode::DuplicateGuard:
            return "DuplicateGuard";
        case ErrorCode::GuardFault:
            return "GuardFault";
        case ErrorCode::OverrideRejected:
            return "OverrideRejected";
        case ErrorCode::AuditWriteFailed:
            return "AuditWriteFailed";
    }
    return "Unknown";
}

} // namespace hookguard
