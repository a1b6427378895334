#pragma once

#include <optional>
#include <string>
#include <utility>

namespace relpath {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes for relpath operations
 *
 * The first four are the relative path taxonomy and are always caused by
 * caller input. IO_ERROR and PARSE_ERROR only come from batch file loading.
 */
enum class ErrorCode {
    // Relative path rejections
    NOT_A_STRING,
    EMPTY_STRING,
    ABSOLUTE_PATH,
    PARENT_COMPONENT,

    // Batch input
    IO_ERROR,
    PARSE_ERROR,
};

// Canonical lowercase snake_case name, used in JSON output
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_A_STRING: return "not_a_string";
        case ErrorCode::EMPTY_STRING: return "empty_string";
        case ErrorCode::ABSOLUTE_PATH: return "absolute_path";
        case ErrorCode::PARENT_COMPONENT: return "parent_component";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        default: return "unknown";
    }
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error with code, message and the offending input
 *
 * The message is "<context>: <detail>". The context label names the
 * operation that asked for normalization so diagnostics point at the real
 * call site rather than at the shared routine.
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string input, std::string context)
        : code_(code),
          message_(std::move(message)),
          input_(std::move(input)),
          context_(std::move(context)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        context_ = context_.empty() ? context : context + ": " + context_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& input() const { return input_; }
    const std::string& context() const { return context_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string input_;
    std::string context_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) const -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

    template<typename F>
    auto flatMap(F func) const -> decltype(func(std::declval<T>())) {
        if (has_value_) {
            return func(value_.value());
        }
        return decltype(func(std::declval<T>()))::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace relpath
