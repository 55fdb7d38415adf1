#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace repofetch {

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    CorruptedData,
    WriteError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::WriteError: return "Write error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail. The error type defaults to Error;
// subsystems with a richer failure record (see fetch::FetchError) plug in their own.
template <typename T, typename E = Error> class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(std::move(data_));
    }

    const E& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<1>(data_);
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void
template <typename E> class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)), failed_(true) {}

    bool has_value() const noexcept { return !failed_; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const E& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    E error_{};
    bool failed_{false};
};

} // namespace repofetch
