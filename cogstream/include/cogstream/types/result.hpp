#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cogstream {

/// Error type for COG reading operations
struct Error {
    enum class Code {
        Success,
        InvalidTiff,            ///< Not a TIFF/BigTIFF stream, or its directory structure is broken
        MalformedTag,           ///< A tag entry cannot be decoded, or has an unexpected type
        UnsupportedCompression, ///< No decompressor or image decoder for the compression id
        CorruptTile,            ///< Decompressed tile size or stream content is inconsistent
        MissingGeoreferencing,  ///< Neither a model transformation nor a pixel scale is present
        OutOfRange,             ///< Level, tile or window outside the dataset
        Transport,              ///< Error reported by the byte source
        UnsupportedFeature,
        InvalidState,           ///< Reader not open, failed or closed
        Cancelled,
        MemoryError
    };

    Code code;
    std::string message;

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] constexpr bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return code != Code::Success;
    }

    /// Prefix the message with some context, keeping the code
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error{code, std::string(context) + ": " + message};
    }
};

[[nodiscard]] constexpr std::string_view error_code_name(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success:                return "Success";
        case Error::Code::InvalidTiff:            return "InvalidTiff";
        case Error::Code::MalformedTag:           return "MalformedTag";
        case Error::Code::UnsupportedCompression: return "UnsupportedCompression";
        case Error::Code::CorruptTile:            return "CorruptTile";
        case Error::Code::MissingGeoreferencing:  return "MissingGeoreferencing";
        case Error::Code::OutOfRange:             return "OutOfRange";
        case Error::Code::Transport:              return "Transport";
        case Error::Code::UnsupportedFeature:     return "UnsupportedFeature";
        case Error::Code::InvalidState:           return "InvalidState";
        case Error::Code::Cancelled:              return "Cancelled";
        case Error::Code::MemoryError:            return "MemoryError";
    }
    return "Unknown";
}

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::forward<T>(value)) {}

    constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(value) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) && {
        if (is_ok()) {
            return std::move(value());
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) const& -> decltype(func(std::declval<const T&>())) {
        if (is_ok()) {
            return func(value());
        }
        using RetType = decltype(func(std::declval<const T&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) const& {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>{func(value())};
        }
        return Result<U>{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) && {
        using U = decltype(func(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>{func(std::move(value()))};
        }
        return Result<U>{error()};
    }
};

template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    constexpr Result() noexcept : data_(std::monostate{}) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace cogstream
