/*

cleaner.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/text/markup.hpp>


namespace mailcast
{


/**
Turning the markup of a newsletter into plain text ready for normalization.
**/
class structural_cleaner
{
public:

    inline static const std::string HIDDEN_STYLE{"display: none"};

    inline static const std::string FOOTNOTE_ID_PREFIX{"footnote-"};

    inline static const std::string BLOCK_QUOTE_BEGINS{"\n\nBlock quote begins.\n"};

    inline static const std::string BLOCK_QUOTE_ENDS{"\n\nBlock quote ends.\n"};

    inline static const std::string BLOCK_SEPARATOR{"\n\n"};

    inline static const std::vector<std::string_view> BLOCK_ELEMENTS{"p", "h1", "h2", "h3", "h4", "h5", "h6"};

    /**
    Cleaning markup into text.

    @param markup Markup text.
    @return       Flattened text.
    **/
    std::string clean(std::string_view markup) const
    {
        markup_document doc = markup_document::parse(markup);
        remove_hidden(doc);
        truncate_after_footnotes(doc);
        annotate_block_quotes(doc);
        separate_blocks(doc);
        return doc.flatten();
    }

    /**
    Removing the elements hidden by their inline style.
    **/
    void remove_hidden(markup_document& doc) const
    {
        auto hidden = doc.find_all([](const markup_document::node_t& n)
        {
            if (n.kind != markup_document::node_kind_t::ELEMENT)
                return false;
            for (const auto& attr : n.attributes)
                if (attr.first == "style" && attr.second.find(HIDDEN_STYLE) != std::string::npos)
                    return true;
            return false;
        });
        for (auto id : hidden)
            doc.remove(id);
        doc.compact();
        if (!hidden.empty())
            MAILCAST_TRACE("removed " + std::to_string(hidden.size()) + " hidden elements");
    }

    /**
    Removing whatever follows the last footnote element, at its level and at the level of each of its ancestors.
    **/
    void truncate_after_footnotes(markup_document& doc) const
    {
        auto footnotes = doc.find_all([](const markup_document::node_t& n)
        {
            if (n.kind != markup_document::node_kind_t::ELEMENT)
                return false;
            for (const auto& attr : n.attributes)
                if (attr.first == "id")
                    return is_footnote_id(attr.second);
            return false;
        });
        if (footnotes.empty())
            return;

        MAILCAST_TRACE("truncating after footnote element " + std::to_string(footnotes.back()));
        for (auto id = footnotes.back(); id != markup_document::ROOT; id = doc.at(id).parent)
            doc.remove_following_siblings(id);
        doc.compact();
    }

    void annotate_block_quotes(markup_document& doc) const
    {
        for (auto id : doc.find_elements({"blockquote"}))
        {
            doc.insert_text_before(id, BLOCK_QUOTE_BEGINS);
            doc.insert_text_after(id, BLOCK_QUOTE_ENDS);
        }
    }

    void separate_blocks(markup_document& doc) const
    {
        for (auto id : doc.find_elements(BLOCK_ELEMENTS))
            doc.insert_text_before(id, BLOCK_SEPARATOR);
    }

    /**
    Checking whether an identifier is `footnote-` followed by decimal digits only.
    **/
    static bool is_footnote_id(std::string_view id)
    {
        return id.size() > FOOTNOTE_ID_PREFIX.size() && id.compare(0, FOOTNOTE_ID_PREFIX.size(), FOOTNOTE_ID_PREFIX) == 0 &&
            detail::is_all_digits(id.substr(FOOTNOTE_ID_PREFIX.size()));
    }
};


} // namespace mailcast
