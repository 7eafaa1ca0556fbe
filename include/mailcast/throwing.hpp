/*

throwing.hpp
------------

Exceptions for callers who prefer them to mailcast::result, one class per
kind of processing failure.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <mailcast/config.hpp>
#include <mailcast/detail/result.hpp>

namespace mailcast
{

#if !MAILCAST_THROWING_ENABLED
#error "MAILCAST_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

/**
Base of the processing exceptions, carrying the error it was raised for.
**/
class exception : public std::runtime_error
{
public:
    explicit exception(error err)
        : std::runtime_error(err.to_string()), error_(std::move(err))
    {
    }

    [[nodiscard]] const error& info() const noexcept { return error_; }

    [[nodiscard]] error_code code() const noexcept { return error_.code(); }

private:
    error error_;
};

/// The input is not a parseable message.
class malformed_message_error : public exception
{
public:
    using exception::exception;
};

/// No part of the message can be rendered as text.
class no_renderable_content_error : public exception
{
public:
    using exception::exception;
};

/// A payload cannot be decoded with its transfer encoding or charset.
class decode_error : public exception
{
public:
    using exception::exception;
};

class dangling_footnote_error : public exception
{
public:
    using exception::exception;

    /// Number of the footnote without definition.
    [[nodiscard]] const std::string& footnote() const noexcept { return info().detail(); }
};

/**
Raising the exception matching the kind of an error.

`io_error`, `invalid_argument` and internal errors raise the base class.
**/
[[noreturn]] inline void throw_error(error err)
{
    if (err.is_malformed_message())
        throw malformed_message_error(std::move(err));
    switch (err.code())
    {
        case error_code::no_renderable_content:
            throw no_renderable_content_error(std::move(err));
        case error_code::decode_error:
            throw decode_error(std::move(err));
        case error_code::dangling_footnote:
            throw dangling_footnote_error(std::move(err));
        default:
            throw exception(std::move(err));
    }
}

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw_error(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result_void&& r)
{
    if (!r)
        throw_error(std::move(r.error()));
}

} // namespace mailcast
