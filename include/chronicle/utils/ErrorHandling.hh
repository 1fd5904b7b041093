#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chronicle {

/**
 * @brief Base exception for chronicle errors. what() is the message as given.
 */
class ChronicleException : public std::exception {
  public:
    explicit ChronicleException(std::string message);
    const char* what() const noexcept override;

  private:
    std::string message_;
};

/**
 * @brief Token sequence that violates the save-file grammar.
 *
 * Fatal for the snapshot being parsed; no partial tree is returned. The
 * message reads "Line N: ...".
 */
class FormatError : public ChronicleException {
  public:
    FormatError(int line, const std::string& message);
    int line() const noexcept { return line_; }

  private:
    int line_;
};

/// Persistence layer failure. Aborts the in-flight snapshot.
class StoreError : public ChronicleException {
  public:
    using ChronicleException::ChronicleException;
};

/// Unusable configuration or an observer that cannot be identified.
class ConfigError : public ChronicleException {
  public:
    using ChronicleException::ChronicleException;
};

// Log, then throw.
[[noreturn]] void throwError(const std::string& message);
[[noreturn]] void throwStoreError(const std::string& message);

// Expected failures (lookups, files, config) travel as codes in a Result.
enum class ErrorCode : uint16_t {
    Ok = 0,
    InvalidState,
    NotFound,
    AlreadyExists,
    TypeMismatch,
    OutOfRange,
    ParseFailure,
    IoFailure,
    Internal
};

std::string_view errorCodeToString(ErrorCode code);

// Value or error code plus message. Move-only.
template <typename T> class Result {
  public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result error(ErrorCode code, std::string message = "") { return Result(code, std::move(message)); }

    // Forwards the error of a result of another type, optionally prefixed
    // with "<context>: ".
    template <typename U> static Result error(const Result<U>& other, std::string_view context = {}) {
        return Result(other.code(), context.empty() ? other.message()
                                                    : std::string(context) + ": " + other.message());
    }

    bool isOk() const { return code_ == ErrorCode::Ok; }
    bool isError() const { return code_ != ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    T& value() {
        if (isError()) {
            throwError("Result contains error: " + message_);
        }
        return *value_;
    }

    const T& value() const {
        if (isError()) {
            throwError("Result contains error: " + message_);
        }
        return *value_;
    }

    T valueOr(T fallback) const { return isOk() ? *value_ : fallback; }

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

  private:
    explicit Result(T value) : code_(ErrorCode::Ok), value_(std::move(value)) {}
    Result(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    ErrorCode code_;
    std::string message_;
    std::optional<T> value_;
};

template <> class Result<void> {
  public:
    static Result ok() { return Result(); }

    static Result error(ErrorCode code, std::string message = "") { return Result(code, std::move(message)); }

    template <typename U> static Result error(const Result<U>& other, std::string_view context = {}) {
        return Result(other.code(), context.empty() ? other.message()
                                                    : std::string(context) + ": " + other.message());
    }

    bool isOk() const { return code_ == ErrorCode::Ok; }
    bool isError() const { return code_ != ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

  private:
    Result() : code_(ErrorCode::Ok) {}
    Result(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    ErrorCode code_;
    std::string message_;
};

} // namespace chronicle
