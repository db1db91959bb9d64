#pragma once
#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        Cancelled,        // Clean stop or peer closed (Expected)
        PermissionDenied,
        Busy,             // Already running / would block
        Timeout,
        ExternalToolMissing, // Missing dependency (e.g. playerctl)
        InvalidArgument,
        NotFound,
        IoError,
        ConnectionFailed,
        AuthRejected,
        ProtocolError,
        CriticalError,
        NotImplemented,
        Unknown
    };

    inline const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::Cancelled:           return "Cancelled";
            case ErrorCode::PermissionDenied:    return "PermissionDenied";
            case ErrorCode::Busy:                return "Busy";
            case ErrorCode::Timeout:             return "Timeout";
            case ErrorCode::ExternalToolMissing: return "ExternalToolMissing";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::NotFound:            return "NotFound";
            case ErrorCode::IoError:             return "IoError";
            case ErrorCode::ConnectionFailed:    return "ConnectionFailed";
            case ErrorCode::AuthRejected:        return "AuthRejected";
            case ErrorCode::ProtocolError:       return "ProtocolError";
            case ErrorCode::CriticalError:       return "CriticalError";
            case ErrorCode::NotImplemented:      return "NotImplemented";
            case ErrorCode::Unknown:             return "Unknown";
        }
        return "Unknown";
    }

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string location; // __FILE__:__LINE__

        std::string describe() const {
            return std::string(error_code_name(code)) + ": " + message;
        }
    };

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        // Static Builders
        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& loc = "") {
            return Result(AppError{code, msg, loc});
        }

        static Result<T> err(const AppError& e) { return Result(e); }

        // Checkers
        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }

        // Unwrappers
        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        // Moves the value out, for move-only payloads (unique_ptr, buffers)
        T take() {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::take failed: " + e.message);
            }
            return std::move(std::get<T>(value));
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        // For void-like results (Result<Ok>)
        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

} // namespace common

#define SM_ERR_LOCATION (std::string(__FILE__) + ":" + std::to_string(__LINE__))
