/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Conversion of text in a named charset to UTF-8, on top of iconv.

*/


#pragma once

#include <cctype>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>
#include <iconv.h>
#include <mailcast/codec/codec.hpp>
#include <mailcast/detail/ascii.hpp>


namespace mailcast
{


/**
How undecodable byte sequences are treated.
**/
enum class decode_policy_t
{
    /**
    Undecodable input is an error.
    **/
    STRICT,

    /**
    Each undecodable byte becomes the replacement character U+FFFD.
    **/
    REPLACE
};


/**
Converter from a named charset to UTF-8.
**/
class charset_converter
{
public:

    /**
    UTF-8 encoding of the replacement character U+FFFD.
    **/
    inline static const std::string REPLACEMENT_CHARACTER{"\xEF\xBF\xBD"};

    /**
    Opening the conversion descriptor.

    @param from_charset Source charset label, as found in a MIME header.
    @throw codec_error  Unknown charset.
    **/
    explicit charset_converter(std::string_view from_charset)
        : charset_(canonical_name(from_charset))
    {
        // glibc can race on its gconv module cache inside iconv_open.
        std::lock_guard<std::mutex> lock(open_mutex());
        descriptor_ = iconv_open(codec::CHARSET_UTF8.c_str(), charset_.c_str());
        if (descriptor_ == reinterpret_cast<iconv_t>(-1))
            throw codec_error("Unknown charset `" + std::string(from_charset) + "`.");
    }

    ~charset_converter()
    {
        if (descriptor_ != reinterpret_cast<iconv_t>(-1))
            iconv_close(descriptor_);
    }

    charset_converter(const charset_converter&) = delete;

    charset_converter(charset_converter&&) = delete;

    void operator=(const charset_converter&) = delete;

    void operator=(charset_converter&&) = delete;

    /**
    Converting the text to UTF-8.

    @param input       Text in the source charset.
    @param policy      Treatment of undecodable sequences.
    @return            Text in UTF-8.
    @throw codec_error Undecodable sequence in strict mode.
    **/
    std::string convert(std::string_view input, decode_policy_t policy = decode_policy_t::STRICT) const
    {
        if (input.empty())
            return "";

        // iconv API is not const-correct for the input buffer.
        char* inptr = const_cast<char*>(input.data());
        std::size_t inbytesleft = input.length();
        iconv(descriptor_, nullptr, nullptr, nullptr, nullptr);

        std::string output(input.length() * 2 + 4, '\0');
        std::size_t total_written = 0;

        while (inbytesleft > 0)
        {
            char* outptr = output.data() + total_written;
            std::size_t outbytesleft = output.size() - total_written;

            std::size_t res = iconv(descriptor_, &inptr, &inbytesleft, &outptr, &outbytesleft);
            total_written = output.size() - outbytesleft;

            if (res != static_cast<std::size_t>(-1))
                continue;

            if (errno == E2BIG)
                output.resize(output.size() * 2);
            else if (errno == EILSEQ || errno == EINVAL)
            {
                if (policy == decode_policy_t::STRICT)
                    throw codec_error("Cannot decode `" + charset_ + "` text at byte " +
                        std::to_string(input.length() - inbytesleft) + ".");
                if (output.size() - total_written < REPLACEMENT_CHARACTER.size())
                    output.resize(output.size() * 2);
                output.replace(total_written, REPLACEMENT_CHARACTER.size(), REPLACEMENT_CHARACTER);
                total_written += REPLACEMENT_CHARACTER.size();
                ++inptr;
                --inbytesleft;
                iconv(descriptor_, nullptr, nullptr, nullptr, nullptr);
            }
            else
                throw codec_error(std::string("Charset conversion failed: ") + std::strerror(errno) + ".");
        }
        output.resize(total_written);
        return output;
    }

    /**
    Returning the charset name given to iconv.
    **/
    const std::string& charset() const
    {
        return charset_;
    }

    /**
    Mapping the charset labels seen in mail onto names known to iconv.

    @param label Charset label.
    @return      Uppercase iconv name.
    **/
    static std::string canonical_name(std::string_view label)
    {
        std::string name = detail::trim_copy(label);
        if (name.size() >= 2 && name.front() == '"' && name.back() == '"')
            name = name.substr(1, name.size() - 2);
        for (char& c : name)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (name == "UTF8" || name == "UNICODE-1-1-UTF-8")
            return codec::CHARSET_UTF8;
        if (name == "ASCII" || name == "US-ASCII" || name == "ANSI_X3.4-1968")
            return codec::CHARSET_ASCII;
        if (name == "LATIN-1" || name == "LATIN1" || name == "L1" || name == "ISO8859-1" || name == "ISO_8859-1")
            return "ISO-8859-1";
        if (name.rfind("CP12", 0) == 0 && name.size() == 6)
            return "WINDOWS-" + name.substr(2);
        return name;
    }

private:

    static std::mutex& open_mutex()
    {
        static std::mutex mtx;
        return mtx;
    }

    /**
    Name of the source charset.
    **/
    std::string charset_;

    /**
    Conversion descriptor.
    **/
    iconv_t descriptor_;
};


/**
Converting text from the given charset to UTF-8.

@param text        Text to convert.
@param charset     Source charset, empty for UTF-8.
@param policy      Treatment of undecodable sequences.
@return            UTF-8 text.
@throw codec_error Unknown charset, or undecodable text in strict mode.
**/
inline std::string to_utf8(std::string_view text, std::string_view charset, decode_policy_t policy = decode_policy_t::STRICT)
{
    charset_converter conv(charset.empty() ? std::string_view(codec::CHARSET_UTF8) : charset);
    return conv.convert(text, policy);
}


} // namespace mailcast
