/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The processing pipeline reports every failure through result<T>.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace mailcast
{

/// Error categories for mailcast operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Message structure errors (100-199)
    malformed_message = 100,
    missing_boundary = 101,

    // Content errors (200-299)
    no_renderable_content = 200,
    decode_error = 201,

    // Text processing errors (300-399)
    dangling_footnote = 300,

    // Environment errors (700-799)
    invalid_argument = 700,
    io_error = 701,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::malformed_message: return "Malformed message";
        case error_code::missing_boundary: return "Multipart boundary missing";
        case error_code::no_renderable_content: return "No HTML part found in the email";
        case error_code::decode_error: return "Content decoding error";
        case error_code::dangling_footnote: return "Footnote not found";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::io_error: return "I/O error";
        case error_code::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Rich error type with code, message, and optional detail
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
        if (!detail_.empty())
            out += ": " + detail_;
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Check if the message itself could not be parsed
    [[nodiscard]] bool is_malformed_message() const noexcept
    {
        return code_ == error_code::malformed_message || code_ == error_code::missing_boundary;
    }

    /// Check if the error comes from content processing rather than the environment
    [[nodiscard]] bool is_content_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 700;
    }

private:
    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::string detail)
{
    return std::unexpected(error(code, std::move(message), std::move(detail)));
}

/// Propagate the error of a result into a result of another type
template<typename T, typename U>
[[nodiscard]] constexpr std::expected<T, error> forward_error(const std::expected<U, error>& r)
{
    return std::unexpected(r.error());
}

} // namespace mailcast
