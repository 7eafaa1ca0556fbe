/*

q_codec.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <vector>
#include <tuple>
#include <boost/algorithm/string.hpp>
#include <mailcast/codec/codec.hpp>
#include <mailcast/codec/base64.hpp>
#include <mailcast/codec/charset.hpp>
#include <mailcast/codec/quoted_printable.hpp>


namespace mailcast
{


/**
Q codec, decoding the encoded words of RFC 2047 headers into UTF-8.
**/
class q_codec : public codec
{
public:

    /**
    Setting the decoder line policy.

    @param lines_policy Line policy enforced in strict mode.
    **/
    explicit q_codec(std::string::size_type lines_policy)
        : codec(lines_policy)
    {
    }

    q_codec(const q_codec&) = delete;

    q_codec(q_codec&&) = delete;

    /**
    Default destructor.
    **/
    ~q_codec() = default;

    void operator=(const q_codec&) = delete;

    void operator=(q_codec&&) = delete;

    /**
    Decoding a single encoded word without its `=?` and `?=` delimiters, that is `charset?method?text`.

    @param text        String to decode.
    @return            Decoded string in its original charset, the charset and the codec method.
    @throw codec_error Missing Q codec separator for charset.
    @throw codec_error Missing Q codec separator for codec type.
    @throw codec_error Bad encoding method.
    @throw *           `decode_qp(const string&)`, `base64::decode(const string&)`.
    **/
    std::tuple<std::string, std::string, codec_t> decode(const std::string& text) const
    {
        std::string::size_type method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string::npos)
            throw codec_error("Missing Q codec separator for charset.");
        std::string charset = boost::to_upper_copy(text.substr(0, method_pos));
        // RFC 2231 language suffix.
        std::string::size_type lang_pos = charset.find('*');
        if (lang_pos != std::string::npos)
            charset.erase(lang_pos);
        if (charset.empty())
            throw codec_error("Missing Q codec charset.");
        std::string::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string::npos)
            throw codec_error("Missing Q codec separator for codec type.");
        std::string method = text.substr(method_pos + 1, content_pos - method_pos - 1);
        std::string text_c = text.substr(content_pos + 1);

        std::string dec_text;
        codec_t method_type;
        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            base64 b64(lines_policy_);
            b64.strict_mode(strict_mode_);
            dec_text = b64.decode(text_c);
            method_type = codec_t::BASE64;
        }
        else if (boost::iequals(method, QP_CODEC_STR))
        {
            dec_text = decode_qp(text_c);
            method_type = codec_t::QUOTED_PRINTABLE;
        }
        else
            throw codec_error("Bad encoding method.");

        return std::make_tuple(dec_text, charset, method_type);
    }

    /**
    Decoding every encoded word of a header value into UTF-8.

    Text outside of encoded words is kept. Whitespace between two adjacent encoded words is dropped. A `=?` which does not open a well formed
    encoded word is kept as text.

    @param text        Header value to decode.
    @return            UTF-8 string, the charset of the last encoded word (or of the plain text) and its codec method.
    @throw codec_error Unknown charset, or encoded word which cannot be decoded.
    **/
    std::tuple<std::string, std::string, codec_t> check_decode(const std::string& text) const
    {
        std::string dec_text;
        std::string charset = is_8bit_string(text) ? CHARSET_UTF8 : CHARSET_ASCII;
        // If there is no q encoding, then it's ascii or utf8.
        codec_t method_type = is_8bit_string(text) ? codec_t::UTF8 : codec_t::ASCII;
        std::string pending_space;
        bool last_was_encoded = false;

        std::string::size_type pos = 0;
        while (pos < text.size())
        {
            std::string::size_type word_end = std::string::npos;
            if (text.compare(pos, 2, ENCODED_WORD_BEGIN) == 0)
                word_end = find_word_end(text, pos);

            if (word_end != std::string::npos)
            {
                auto word = decode(text.substr(pos + 2, word_end - pos - 2));
                if (!last_was_encoded)
                    dec_text += pending_space;
                pending_space.clear();
                charset = std::get<1>(word);
                method_type = std::get<2>(word);
                charset_converter conv(charset);
                dec_text += conv.convert(std::get<0>(word), strict_mode_ ? decode_policy_t::STRICT : decode_policy_t::REPLACE);
                last_was_encoded = true;
                pos = word_end + 2;
            }
            else if (text[pos] == SPACE_CHAR || text[pos] == TAB_CHAR)
            {
                pending_space += text[pos];
                pos++;
            }
            else
            {
                dec_text += pending_space;
                pending_space.clear();
                dec_text += text[pos];
                last_was_encoded = false;
                pos++;
            }
        }
        dec_text += pending_space;

        return std::make_tuple(dec_text, charset, method_type);
    }

private:

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};

    /**
    Opening delimiter of an encoded word.
    **/
    inline static const std::string ENCODED_WORD_BEGIN{"=?"};

    /**
    Closing delimiter of an encoded word.
    **/
    inline static const std::string ENCODED_WORD_END{"?="};

    /**
    Locating the closing delimiter of the encoded word starting at the given position.

    @param text  Header value.
    @param begin Position of the opening delimiter.
    @return      Position of the closing delimiter, `npos` if the word is not well formed.
    **/
    static std::string::size_type find_word_end(const std::string& text, std::string::size_type begin)
    {
        std::string::size_type method_pos = text.find(QUESTION_MARK_CHAR, begin + 2);
        if (method_pos == std::string::npos || method_pos == begin + 2)
            return std::string::npos;
        std::string::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos != method_pos + 2)
            return std::string::npos;
        std::string::size_type end_pos = text.find(ENCODED_WORD_END, content_pos + 1);
        if (end_pos == std::string::npos)
            return std::string::npos;
        for (std::string::size_type i = begin; i < end_pos; i++)
            if (text[i] == SPACE_CHAR || text[i] == TAB_CHAR)
                return std::string::npos;
        return end_pos;
    }

    /**
    Decoding by using variation of the Quoted Printable method.

    @param text String to decode.
    @return     Decoded string.
    @throw *    `quoted_printable::decode(const vector<string>&)`
    **/
    std::string decode_qp(const std::string& text) const
    {
        quoted_printable qp(lines_policy_);
        qp.q_codec_mode(true);
        qp.strict_mode(strict_mode_);
        std::vector<std::string> lines;
        lines.push_back(text);
        return qp.decode(lines);
    }
};


} // namespace mailcast
