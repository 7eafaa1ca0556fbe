/*

footnotes.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <string>
#include <mailcast/detail/regex.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/detail/utf8.hpp>


namespace mailcast
{


/**
Moving footnote definitions to the places which point at them.

Definitions are lines of the form `[n] text`; pointers are `[n]` anywhere else in the text.
**/
class footnote_inliner
{
public:

    /**
    Footnote definitions keyed by their number as written.
    **/
    using footnote_table_t = std::map<std::string, std::string>;

    inline static const std::string FOOTNOTE_BEGINS{"Footnote begins. "};

    inline static const std::string FOOTNOTE_ENDS{" Footnote ends."};

    footnote_inliner()
        : definition_(R"(^\[(\d+)\]\s*(.+)$)", detail::regex_syntax), pointer_(R"(\[(\d+)\])", detail::regex_syntax)
    {
    }

    /**
    Inlining the footnotes of a text.

    @param text Normalized text.
    @return     Trimmed text with the definition lines removed and every pointer replaced, or `dangling_footnote` naming the first
                pointer without definition.
    **/
    result<std::string> inline_footnotes(std::string text) const
    {
        footnote_table_t footnotes = collect(text);
        auto inlined = substitute(text, footnotes);
        if (!inlined)
            return inlined;
        return detail::trim_unicode_copy(*inlined);
    }

    /**
    Recording the definitions of a text into a table and deleting their lines.

    A later definition of the same number replaces the earlier one.

    @param text Text whose definition lines are deleted.
    @return     Definitions found.
    **/
    footnote_table_t collect(std::string& text) const
    {
        footnote_table_t footnotes;
        detail::sregex_iterator end;
        for (detail::sregex_iterator it(text.begin(), text.end(), definition_); it != end; ++it)
            footnotes[(*it)[1].str()] = (*it)[2].str();
        if (!footnotes.empty())
            text = detail::regex_replace(text, definition_, "");
        return footnotes;
    }

    /**
    Replacing every pointer with its definition.

    @param text      Text without definition lines.
    @param footnotes Definitions.
    @return          Text, or `dangling_footnote`.
    **/
    result<std::string> substitute(const std::string& text, const footnote_table_t& footnotes) const
    {
        std::string out;
        out.reserve(text.size());
        auto last = text.begin();
        detail::sregex_iterator end;
        for (detail::sregex_iterator it(text.begin(), text.end(), pointer_); it != end; ++it)
        {
            const std::string number = (*it)[1].str();
            auto def = footnotes.find(number);
            if (def == footnotes.end())
                return fail<std::string>(error_code::dangling_footnote, "Footnote " + number + " not found.", number);

            out.append(last, (*it)[0].first);
            out += FOOTNOTE_BEGINS + detail::trim_unicode_copy(def->second) + FOOTNOTE_ENDS;
            last = (*it)[0].second;
        }
        out.append(last, text.end());
        return out;
    }

private:

    detail::regex definition_;
    detail::regex pointer_;
};


} // namespace mailcast
