#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace presence::core {

// Error domain shared by storage, transport and the event source
enum class Errc {
    kSuccess = 0,
    kNotFound,
    kCorruption,
    kPermissionDenied,
    kTimeout,
    kTransportError,
    kRejected,
    kInvalidArgument,
    kUnknown
};

inline constexpr std::string_view ToString(Errc e) {
    switch (e) {
        case Errc::kSuccess:          return "success";
        case Errc::kNotFound:         return "not found";
        case Errc::kCorruption:       return "corruption";
        case Errc::kPermissionDenied: return "permission denied";
        case Errc::kTimeout:          return "timeout";
        case Errc::kTransportError:   return "transport error";
        case Errc::kRejected:         return "rejected";
        case Errc::kInvalidArgument:  return "invalid argument";
        default:                      return "unknown";
    }
}

class ErrorCode {
public:
    Errc value;
    std::string message;  // free-form upstream text, may be empty
    ErrorCode(Errc v) : value(v) {}
    ErrorCode(Errc v, std::string msg) : value(v), message(std::move(msg)) {}
    operator bool() const { return value != Errc::kSuccess; }

    std::string Describe() const {
        std::string out(ToString(value));
        if (!message.empty()) { out += ": "; out += message; }
        return out;
    }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    Result(Errc e) : data_(ErrorCode(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(Errc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}
    Result(Errc e) : ok_(false), err_(e) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace presence::core
