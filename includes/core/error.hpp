#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace whispercore {

// Error domain reported through std::error_code::category().name().
inline constexpr const char* kErrorDomain = "whispercore";

enum class ErrorCode {
    ModelLoadFailed       = 1001,
    TranscriptionFailed   = 1002,
    InvalidAudioData      = 1003,
    InvalidModelPath      = 1004,
    ContextNotInitialized = 1005
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(ErrorCode code) noexcept;
const char* to_string(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    std::error_code error_code() const { return make_error_code(code); }
    std::string describe() const;
};

// Either a fully formed value or an Error. Reading value() of a failed
// result is a programming error and throws std::logic_error.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & {
        check();
        return std::get<0>(data_);
    }
    const T& value() const& {
        check();
        return std::get<0>(data_);
    }
    T&& value() && {
        check();
        return std::get<0>(std::move(data_));
    }

    const Error& error() const {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(data_);
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    void check() const {
        if (!ok()) {
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).describe());
        }
    }

    std::variant<T, Error> data_;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace whispercore

namespace std {
template <>
struct is_error_code_enum<whispercore::ErrorCode> : true_type {};
} // namespace std
