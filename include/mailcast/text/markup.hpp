/*

markup.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailcast/detail/ascii.hpp>
#include <mailcast/text/html_entities.hpp>


namespace mailcast
{


/**
Markup tree stored as an arena of nodes addressed by index.

Node zero is the document. Removal marks a node, which hides its subtree, and `compact()` drops the marked nodes from the child lists.
**/
class markup_document
{
public:

    using node_id = std::size_t;

    static constexpr node_id ROOT = 0;

    static constexpr node_id NO_NODE = static_cast<node_id>(-1);

    enum class node_kind_t {DOCUMENT, ELEMENT, TEXT, COMMENT};

    /**
    Attribute as lowercase name and decoded value.
    **/
    using attribute_t = std::pair<std::string, std::string>;

    struct node_t
    {
        node_kind_t kind = node_kind_t::DOCUMENT;

        /**
        Lowercase tag name of an element.
        **/
        std::string name;

        std::vector<attribute_t> attributes;

        /**
        Decoded content of a text or comment node.
        **/
        std::string text;

        node_id parent = NO_NODE;

        std::vector<node_id> children;

        bool removed = false;
    };

    inline static const std::vector<std::string_view> VOID_ELEMENTS{"area", "base", "br", "col", "embed", "hr", "img", "input", "link",
        "meta", "param", "source", "track", "wbr", "command", "keygen", "menuitem"};

    /**
    Elements whose content is taken literally up to their end tag.
    **/
    inline static const std::vector<std::string_view> RAW_TEXT_ELEMENTS{"script", "style"};

    markup_document()
    {
        nodes_.emplace_back();
    }

    /**
    Parsing markup.

    Parsing never fails: unmatched end tags are ignored, unclosed elements end with the document, and a `<` which does not open a tag
    is text.

    @param markup Markup text.
    @return       Document.
    **/
    static markup_document parse(std::string_view markup)
    {
        markup_document doc;
        markup_parser(doc, markup).run();
        return doc;
    }

    const node_t& at(node_id id) const
    {
        return nodes_.at(id);
    }

    std::size_t size() const
    {
        return nodes_.size();
    }

    /**
    Returning the value of an element attribute.

    @param id   Element.
    @param name Lowercase attribute name.
    @return     Value, or nothing if absent.
    **/
    std::optional<std::string> attribute(node_id id, std::string_view name) const
    {
        for (const auto& attr : nodes_.at(id).attributes)
            if (attr.first == name)
                return attr.second;
        return std::nullopt;
    }

    /**
    Finding the nodes which satisfy a predicate, in document order, skipping removed subtrees.
    **/
    std::vector<node_id> find_all(const std::function<bool(const node_t&)>& predicate) const
    {
        std::vector<node_id> found;
        visit(ROOT, [&](node_id id)
        {
            if (predicate(nodes_[id]))
                found.push_back(id);
        });
        return found;
    }

    /**
    Finding the elements with one of the given tag names, in document order.
    **/
    std::vector<node_id> find_elements(const std::vector<std::string_view>& names) const
    {
        return find_all([&names](const node_t& n)
        {
            return n.kind == node_kind_t::ELEMENT && std::find(names.begin(), names.end(), n.name) != names.end();
        });
    }

    /**
    Marking a node and its subtree as removed.
    **/
    void remove(node_id id)
    {
        if (id != ROOT)
            nodes_.at(id).removed = true;
    }

    /**
    Dropping the removed nodes from the child lists.
    **/
    void compact()
    {
        for (auto& n : nodes_)
        {
            n.children.erase(std::remove_if(n.children.begin(), n.children.end(), [this](node_id child) { return nodes_[child].removed; }),
                n.children.end());
        }
    }

    /**
    Marking every sibling which follows the node as removed.
    **/
    void remove_following_siblings(node_id id)
    {
        node_id parent = nodes_.at(id).parent;
        if (parent == NO_NODE)
            return;
        const auto& siblings = nodes_[parent].children;
        auto it = std::find(siblings.begin(), siblings.end(), id);
        if (it == siblings.end())
            return;
        for (++it; it != siblings.end(); ++it)
            nodes_[*it].removed = true;
    }

    /**
    Inserting a text node as the previous sibling of a node.

    @return Inserted node.
    **/
    node_id insert_text_before(node_id id, std::string text)
    {
        return insert_text(id, std::move(text), 0);
    }

    /**
    Inserting a text node as the next sibling of a node.

    @return Inserted node.
    **/
    node_id insert_text_after(node_id id, std::string text)
    {
        return insert_text(id, std::move(text), 1);
    }

    /**
    Concatenating the text of the document, leaving out comments and the content of raw text elements.
    **/
    std::string flatten() const
    {
        std::string text;
        flatten(ROOT, text);
        return text;
    }

private:

    /**
    Tokenizing markup into a document.
    **/
    class markup_parser
    {
    public:

        markup_parser(markup_document& doc, std::string_view markup) : doc_(doc), markup_(markup)
        {
            open_.push_back(ROOT);
        }

        void run()
        {
            while (pos_ < markup_.size())
            {
                if (markup_[pos_] != '<')
                {
                    std::string_view::size_type lt = markup_.find('<', pos_);
                    if (lt == std::string_view::npos)
                        lt = markup_.size();
                    add_text(html::decode_character_references(markup_.substr(pos_, lt - pos_)));
                    pos_ = lt;
                    continue;
                }

                if (starts_with("<!--"))
                    parse_comment();
                else if (starts_with("<![CDATA["))
                    parse_cdata();
                else if (starts_with("<!") || starts_with("<?"))
                    skip_past('>', pos_ + 2);
                else if (starts_with("</") && pos_ + 2 < markup_.size() && detail::is_ascii_alpha(markup_[pos_ + 2]))
                    parse_end_tag();
                else if (pos_ + 1 < markup_.size() && detail::is_ascii_alpha(markup_[pos_ + 1]))
                    parse_start_tag();
                else
                {
                    add_text("<");
                    pos_++;
                }
            }
        }

    private:

        bool starts_with(std::string_view prefix) const
        {
            return markup_.compare(pos_, prefix.size(), prefix) == 0;
        }

        void skip_past(char ch, std::string_view::size_type from)
        {
            std::string_view::size_type found = markup_.find(ch, from);
            pos_ = found == std::string_view::npos ? markup_.size() : found + 1;
        }

        node_id current() const
        {
            return open_.back();
        }

        node_id add_node(node_t n)
        {
            const node_id parent = current();
            n.parent = parent;
            doc_.nodes_.push_back(std::move(n));
            node_id id = doc_.nodes_.size() - 1;
            doc_.nodes_[parent].children.push_back(id);
            return id;
        }

        void add_text(std::string text)
        {
            if (text.empty())
                return;
            auto& siblings = doc_.nodes_[current()].children;
            if (!siblings.empty() && doc_.nodes_[siblings.back()].kind == node_kind_t::TEXT)
            {
                doc_.nodes_[siblings.back()].text += text;
                return;
            }
            node_t n;
            n.kind = node_kind_t::TEXT;
            n.text = std::move(text);
            add_node(std::move(n));
        }

        void parse_comment()
        {
            std::string_view::size_type end = markup_.find("-->", pos_ + 4);
            node_t n;
            n.kind = node_kind_t::COMMENT;
            n.text = std::string(markup_.substr(pos_ + 4, (end == std::string_view::npos ? markup_.size() : end) - pos_ - 4));
            add_node(std::move(n));
            pos_ = end == std::string_view::npos ? markup_.size() : end + 3;
        }

        void parse_cdata()
        {
            const std::string_view::size_type begin = pos_ + 9;
            std::string_view::size_type end = markup_.find("]]>", begin);
            add_text(std::string(markup_.substr(begin, (end == std::string_view::npos ? markup_.size() : end) - begin)));
            pos_ = end == std::string_view::npos ? markup_.size() : end + 3;
        }

        std::string read_name()
        {
            std::string_view::size_type begin = pos_;
            while (pos_ < markup_.size() && !detail::is_ascii_space(markup_[pos_]) && markup_[pos_] != '>' && markup_[pos_] != '/' &&
                markup_[pos_] != '=')
                pos_++;
            return detail::to_lower_copy(markup_.substr(begin, pos_ - begin));
        }

        void skip_spaces()
        {
            while (pos_ < markup_.size() && detail::is_ascii_space(markup_[pos_]))
                pos_++;
        }

        void parse_end_tag()
        {
            pos_ += 2;
            std::string name = read_name();
            skip_past('>', pos_);

            auto it = std::find_if(open_.rbegin(), open_.rend() - 1, [this, &name](node_id id) { return doc_.nodes_[id].name == name; });
            if (it == open_.rend() - 1)
                return;
            open_.erase(std::next(it).base(), open_.end());
        }

        void parse_start_tag()
        {
            pos_++;
            node_t n;
            n.kind = node_kind_t::ELEMENT;
            n.name = read_name();

            bool self_closing = false;
            while (pos_ < markup_.size())
            {
                skip_spaces();
                if (pos_ >= markup_.size())
                    break;
                if (markup_[pos_] == '>')
                {
                    pos_++;
                    break;
                }
                if (markup_[pos_] == '/')
                {
                    pos_++;
                    if (pos_ < markup_.size() && markup_[pos_] == '>')
                    {
                        self_closing = true;
                        pos_++;
                        break;
                    }
                    continue;
                }

                std::string attr_name = read_name();
                if (attr_name.empty())
                {
                    // Stray `=`.
                    pos_++;
                    continue;
                }
                skip_spaces();
                std::string attr_value;
                if (pos_ < markup_.size() && markup_[pos_] == '=')
                {
                    pos_++;
                    skip_spaces();
                    attr_value = read_attribute_value();
                }
                n.attributes.emplace_back(std::move(attr_name), html::decode_character_references(attr_value));
            }

            const std::string name = n.name;
            node_id id = add_node(std::move(n));
            if (std::find(RAW_TEXT_ELEMENTS.begin(), RAW_TEXT_ELEMENTS.end(), name) != RAW_TEXT_ELEMENTS.end() && !self_closing)
            {
                parse_raw_text(id, name);
                return;
            }
            if (!self_closing && std::find(VOID_ELEMENTS.begin(), VOID_ELEMENTS.end(), name) == VOID_ELEMENTS.end())
                open_.push_back(id);
        }

        std::string read_attribute_value()
        {
            if (pos_ >= markup_.size())
                return {};
            char quote = markup_[pos_];
            if (quote == '"' || quote == '\'')
            {
                std::string_view::size_type end = markup_.find(quote, pos_ + 1);
                if (end == std::string_view::npos)
                    end = markup_.size();
                std::string value(markup_.substr(pos_ + 1, end - pos_ - 1));
                pos_ = std::min(end + 1, markup_.size());
                return value;
            }
            std::string_view::size_type begin = pos_;
            while (pos_ < markup_.size() && !detail::is_ascii_space(markup_[pos_]) && markup_[pos_] != '>')
                pos_++;
            return std::string(markup_.substr(begin, pos_ - begin));
        }

        void parse_raw_text(node_id element, const std::string& name)
        {
            const std::string end_tag = "</" + name;
            std::string_view::size_type end = pos_;
            for (; end < markup_.size(); end++)
            {
                if (markup_[end] != '<')
                    continue;
                if (detail::istarts_with_ascii(markup_.substr(end), end_tag))
                {
                    std::string_view::size_type after = end + end_tag.size();
                    if (after >= markup_.size() || markup_[after] == '>' || markup_[after] == '/' || detail::is_ascii_space(markup_[after]))
                        break;
                }
            }
            if (end > pos_)
            {
                node_t n;
                n.kind = node_kind_t::TEXT;
                n.text = std::string(markup_.substr(pos_, end - pos_));
                n.parent = element;
                doc_.nodes_.push_back(std::move(n));
                doc_.nodes_[element].children.push_back(doc_.nodes_.size() - 1);
            }
            pos_ = end;
            if (pos_ < markup_.size())
                skip_past('>', pos_);
        }

        markup_document& doc_;
        std::string_view markup_;
        std::string_view::size_type pos_ = 0;
        std::vector<node_id> open_;
    };

    /**
    Walking the subtree of a node in document order.

    The walk keeps its own stack of open nodes, so arbitrarily deep nesting is fine.

    @param id      Node whose descendants are walked.
    @param descend Called on each node in document order; its children are walked only if it returns true.
    **/
    void walk(node_id id, const std::function<bool(node_id)>& descend) const
    {
        std::vector<std::pair<node_id, std::size_t>> stack{{id, 0}};
        while (!stack.empty())
        {
            auto& [parent, next] = stack.back();
            const auto& children = nodes_[parent].children;
            if (next == children.size())
            {
                stack.pop_back();
                continue;
            }
            node_id child = children[next++];
            if (!nodes_[child].removed && descend(child))
                stack.emplace_back(child, 0);
        }
    }

    void visit(node_id id, const std::function<void(node_id)>& visitor) const
    {
        walk(id, [&visitor](node_id child)
        {
            visitor(child);
            return true;
        });
    }

    void flatten(node_id id, std::string& text) const
    {
        walk(id, [this, &text](node_id child)
        {
            const node_t& n = nodes_[child];
            if (n.kind == node_kind_t::TEXT)
                text += n.text;
            return n.kind == node_kind_t::ELEMENT &&
                std::find(RAW_TEXT_ELEMENTS.begin(), RAW_TEXT_ELEMENTS.end(), n.name) == RAW_TEXT_ELEMENTS.end();
        });
    }

    node_id insert_text(node_id id, std::string text, std::ptrdiff_t offset)
    {
        node_id parent = nodes_.at(id).parent;
        if (parent == NO_NODE)
            return NO_NODE;

        node_t n;
        n.kind = node_kind_t::TEXT;
        n.text = std::move(text);
        n.parent = parent;
        nodes_.push_back(std::move(n));
        node_id inserted = nodes_.size() - 1;

        auto& siblings = nodes_[parent].children;
        auto it = std::find(siblings.begin(), siblings.end(), id);
        siblings.insert(it == siblings.end() ? it : it + offset, inserted);
        return inserted;
    }

    std::vector<node_t> nodes_;
};


} // namespace mailcast
