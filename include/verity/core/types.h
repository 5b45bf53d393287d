#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace verity {

using PassageId = int64_t;
using DocumentId = int64_t;
using Embedding = std::vector<float>;

enum class ErrorCode {
    Success = 0,

    // Caller or configuration mistakes
    InvalidArgument,
    InvalidConfiguration,
    InvalidState,
    InvalidData,
    NotFound,
    FileNotFound,
    NotSupported,
    NotInitialized,

    // Pipeline stages
    DatabaseError,
    EmbeddingFailed,
    RetrievalFailed,
    RerankerUnavailable,
    Timeout,
    OperationCancelled,

    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidConfiguration: return "Invalid configuration";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::EmbeddingFailed: return "Embedding failed";
        case ErrorCode::RetrievalFailed: return "Retrieval failed";
        case ErrorCode::RerankerUnavailable: return "Reranker unavailable";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: break;
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    // Also serves ErrorCode == Error and both != forms through C++20 rewriting
    friend bool operator==(const Error& e, ErrorCode c) { return e.code == c; }
};

/**
 * @brief Thrown when a Result is read on the wrong side (value of an error or error of a value).
 */
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Either a value or an Error. Failures travel as values through the retrieval stages;
 * exceptions are reserved for misuse.
 */
template <typename T> class Result {
public:
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code) : state_(std::in_place_index<1>, Error{code}) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        requireValue();
        return std::get<0>(state_);
    }
    T& value() & {
        requireValue();
        return std::get<0>(state_);
    }
    T&& value() && {
        requireValue();
        return std::get<0>(std::move(state_));
    }

    template <typename U> T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(state_) : static_cast<T>(std::forward<U>(fallback));
    }

    const Error& error() const {
        if (has_value()) {
            throw BadResultAccess("Result holds a value, not an error");
        }
        return std::get<1>(state_);
    }

private:
    void requireValue() const {
        if (!has_value()) {
            const auto& err = std::get<1>(state_);
            throw BadResultAccess(fmt::format("Result holds an error ({}): {}",
                                              errorToString(err.code), err.message));
        }
    }

    std::variant<T, Error> state_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(code) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw BadResultAccess(fmt::format("Result holds an error ({}): {}",
                                              errorToString(error_.code), error_.message));
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw BadResultAccess("Result holds no error");
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace verity

template <> struct fmt::formatter<verity::ErrorCode> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext> auto format(verity::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(verity::errorToString(code), ctx);
    }
};
