#pragma once

#include "ErrorCodes.h"

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace Ferry {

/**
 * @brief Error type for the Result pattern
 *
 * Carries a categorised code, a human readable message and the component
 * that produced it.
 */
struct Error {
    ErrorCode code{ErrorCode::INTERNAL_ERROR};
    std::string message;
    std::string component;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string comp = "")
        : code(c), message(std::move(msg)), component(std::move(comp)) {}

    ErrorCategory category() const { return categoryOf(code); }

    std::string toString() const {
        std::string result = categoryName(category()) + " " + errorCodeName(code) + ": " + message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        return result;
    }
};

/**
 * @brief Result type for explicit error handling
 *
 * Usage:
 *   Result<uint64_t> sent = framer.send(stream, reader);
 *   if (!sent) {
 *       logger.error(sent.error().toString(), "Client");
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    // Throws if the result holds an error
    T& value() {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::runtime_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (no value, only success/error)
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    E& error() {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::runtime_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

inline Error Err(ErrorCode code, std::string message, std::string component = "") {
    return Error(code, std::move(message), std::move(component));
}

} // namespace Ferry
