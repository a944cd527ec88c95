// bough_json.hpp - Bough - JSON Grammar
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_JSON_HPP
#define BOUGH_JSON_HPP

#include "bough_ast.hpp"

#include <functional>
#include <initializer_list>

namespace bough
{
//========================================================================
// JSON node
//========================================================================

    enum class json_kind
    {
        true_,
        false_,
        null,
        string,
        array,
        object,
        field   // key/value pair; only ever a child of an object
    };

    enum class json_style
    {
        compact,  // [true, false]
        pretty    // one child per line, indented
    };

    class json
    {
    public:
        using format_style = json_style;

        json() = default;

        static json make_true()                                { return json(json_kind::true_); }
        static json make_false()                               { return json(json_kind::false_); }
        static json make_null()                                { return json(json_kind::null); }
        static json make_string(std::string text);
        static json make_array(std::vector<node_ref> elements = {});
        static json make_object(std::vector<node_ref> fields = {});
        static json make_field(node_ref key, node_ref value);

        json_kind kind() const noexcept { return kind_; }
        std::string const & text() const noexcept { return text_; }

        size_t min_children() const noexcept;
        size_t max_children() const noexcept;

    //============================================================
    // Node contract
    //============================================================

        std::span<const node_ref> children() const noexcept { return children_; }
        std::span<node_ref> children_mut() noexcept { return children_; }

        delete_result delete_child(size_t index);
        insert_result insert_child(node_ref new_node, arena<json> & ar, size_t index);

        std::vector<char> replace_chars() const;
        std::optional<json> from_char(char c) const;
        std::vector<char> insert_chars() const;

        // What may replace the child in slot `index`; a field's key stays a string
        std::vector<char> slot_replace_chars(size_t index) const;

        std::string display_name() const;
        std::vector<rec_tok> display_tokens_rec(json_style const & style) const;
        extent size(arena<json> const & ar, json_style const & style) const;

        bool shallow_equals(json const & other) const noexcept;
        size_t shallow_hash() const noexcept;

        bool operator==(json const &) const = default;

    private:

        explicit json(json_kind kind) : kind_(kind) {}

        bool is_container() const noexcept
        {
            return kind_ == json_kind::array || kind_ == json_kind::object;
        }

        void container_tokens(
            std::vector<rec_tok> & out,
            std::string_view open,
            std::string_view close,
            json_style style) const;

        json_kind             kind_ = json_kind::null;
        std::string           text_;
        std::vector<node_ref> children_;
    };

//========================================================================
// Builder
//========================================================================
//
// Allocates whole JSON trees into an arena. Meant for hosts constructing
// a fresh document and for tests; interactive edits go through the node
// contract instead.

    class json_builder
    {
    public:
        explicit json_builder(arena<json> & ar) noexcept
            : ar_(ar)
        {}

        node_ref t()                        { return ar_.alloc(json::make_true()); }
        node_ref f()                        { return ar_.alloc(json::make_false()); }
        node_ref null()                     { return ar_.alloc(json::make_null()); }
        node_ref boolean(bool b)            { return b ? t() : f(); }
        node_ref str(std::string_view s)    { return ar_.alloc(json::make_string(std::string(s))); }

        node_ref array(std::initializer_list<node_ref> elements)
        {
            return ar_.alloc(json::make_array(elements));
        }

        node_ref field(std::string_view key, node_ref value)
        {
            return ar_.alloc(json::make_field(str(key), value));
        }

        node_ref object(std::initializer_list<std::pair<std::string_view, node_ref>> fields)
        {
            std::vector<node_ref> refs;
            refs.reserve(fields.size());
            for (auto const & [key, value] : fields)
                refs.push_back(field(key, value));
            return ar_.alloc(json::make_object(std::move(refs)));
        }

    private:
        arena<json> & ar_;
    };

//================================================================================================================
//
// JSON implementations
//
//================================================================================================================

    namespace detail
    {
        // Shortcut keys, in the order they are offered to the user
        inline constexpr std::string_view json_value_chars = "tfnsao";

        inline void escape_json_string(std::vector<rec_tok> & out, std::string_view text)
        {
            std::string run = "\"";

            auto flush = [&]
            {
                if (!run.empty())
                    out.push_back(tok::text(std::move(run), syntax::literal));
                run.clear();
            };

            for (char c : text)
            {
                std::string_view escape;
                switch (c)
                {
                    case '"':  escape = "\\\""; break;
                    case '\\': escape = "\\\\"; break;
                    case '\n': escape = "\\n";  break;
                    case '\t': escape = "\\t";  break;
                    case '\r': escape = "\\r";  break;
                    case '\b': escape = "\\b";  break;
                    case '\f': escape = "\\f";  break;
                    default: break;
                }

                bool control = static_cast<unsigned char>(c) < 0x20;
                if (escape.empty() && !control)
                {
                    run.push_back(c);
                    continue;
                }

                flush();
                if (escape.empty())
                    out.push_back(tok::text(fmt::format("\\u{:04x}", static_cast<unsigned char>(c)), syntax::special));
                else
                    out.push_back(tok::text(std::string(escape), syntax::special));
            }

            run.push_back('"');
            flush();
        }
    }

    inline json json::make_string(std::string text)
    {
        json j(json_kind::string);
        j.text_ = std::move(text);
        return j;
    }

    inline json json::make_array(std::vector<node_ref> elements)
    {
        json j(json_kind::array);
        j.children_ = std::move(elements);
        return j;
    }

    inline json json::make_object(std::vector<node_ref> fields)
    {
        json j(json_kind::object);
        j.children_ = std::move(fields);
        return j;
    }

    inline json json::make_field(node_ref key, node_ref value)
    {
        json j(json_kind::field);
        j.children_ = { key, value };
        return j;
    }

//============================================================
// Arity
//============================================================

    inline size_t json::min_children() const noexcept
    {
        return kind_ == json_kind::field ? 2 : 0;
    }

    inline size_t json::max_children() const noexcept
    {
        switch (kind_)
        {
            case json_kind::array:
            case json_kind::object: return unbounded;
            case json_kind::field:  return 2;
            default:                return 0;
        }
    }

//============================================================
// Editing
//============================================================

    inline delete_result json::delete_child(size_t index)
    {
        if (auto err = detail::check_delete(display_name(), children_.size(), index, min_children()))
            return *err;

        children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
        return {};
    }

    inline insert_result json::insert_child(node_ref new_node, arena<json> & ar, size_t index)
    {
        if (auto err = detail::check_insert(display_name(), children_.size(), max_children()))
            return *err;

        index = std::min(index, children_.size());

        json const * inserted = ar.get(new_node);

        // Arrays hold values only: a field contributes its value
        if (kind_ == json_kind::array && inserted && inserted->kind() == json_kind::field)
            new_node = inserted->children()[1];

        // Objects only hold fields: a bare value gets an empty key
        if (kind_ == json_kind::object)
        {
            if (!inserted || inserted->kind() != json_kind::field)
            {
                node_ref key = ar.alloc(make_string(""));
                new_node = ar.alloc(make_field(key, new_node));
            }
        }

        children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), new_node);
        return {};
    }

    inline std::vector<char> json::replace_chars() const
    {
        // A field is structural; replacing it would leave a non-field in an object
        if (kind_ == json_kind::field)
            return {};
        return std::vector<char>(detail::json_value_chars.begin(), detail::json_value_chars.end());
    }

    inline std::optional<json> json::from_char(char c) const
    {
        if (kind_ == json_kind::field)
            return std::nullopt;

        switch (c)
        {
            case 't': return make_true();
            case 'f': return make_false();
            case 'n': return make_null();
            case 's': return make_string("");
            case 'a': return make_array();
            case 'o': return make_object();
            default:  return std::nullopt;
        }
    }

    inline std::vector<char> json::insert_chars() const
    {
        if (!is_container())
            return {};
        return std::vector<char>(detail::json_value_chars.begin(), detail::json_value_chars.end());
    }

    inline std::vector<char> json::slot_replace_chars(size_t index) const
    {
        if (kind_ == json_kind::field && index == 0)
            return { 's' };
        return std::vector<char>(detail::json_value_chars.begin(), detail::json_value_chars.end());
    }

//============================================================
// Presentation
//============================================================

    inline std::string json::display_name() const
    {
        switch (kind_)
        {
            case json_kind::true_:  return "true";
            case json_kind::false_: return "false";
            case json_kind::null:   return "null";
            case json_kind::string: return "string";
            case json_kind::array:  return "array";
            case json_kind::object: return "object";
            case json_kind::field:  return "field";
        }
        return "json";
    }

    inline void json::container_tokens(
        std::vector<rec_tok> & out,
        std::string_view open,
        std::string_view close,
        json_style style) const
    {
        out.push_back(tok::text(std::string(open)));

        if (children_.empty())
        {
            out.push_back(tok::text(std::string(close)));
            return;
        }

        if (style == json_style::pretty)
        {
            out.push_back(tok::indent());
            out.push_back(tok::newline());
        }

        for (size_t i = 0; i < children_.size(); ++i)
        {
            if (i > 0)
            {
                out.push_back(tok::text(","));
                if (style == json_style::pretty)
                    out.push_back(tok::newline());
                else
                    out.push_back(tok::ws(1));
            }
            out.push_back(tok::child(children_[i]));
        }

        if (style == json_style::pretty)
        {
            out.push_back(tok::dedent());
            out.push_back(tok::newline());
        }

        out.push_back(tok::text(std::string(close)));
    }

    inline std::vector<rec_tok> json::display_tokens_rec(json_style const & style) const
    {
        std::vector<rec_tok> out;

        switch (kind_)
        {
            case json_kind::true_:
                out.push_back(tok::text("true", syntax::constant));
                break;
            case json_kind::false_:
                out.push_back(tok::text("false", syntax::constant));
                break;
            case json_kind::null:
                out.push_back(tok::text("null", syntax::constant));
                break;
            case json_kind::string:
                detail::escape_json_string(out, text_);
                break;
            case json_kind::array:
                container_tokens(out, "[", "]", style);
                break;
            case json_kind::object:
                container_tokens(out, "{", "}", style);
                break;
            case json_kind::field:
                out.push_back(tok::child(children_[0]));
                out.push_back(tok::text(":"));
                out.push_back(tok::ws(1));
                out.push_back(tok::child(children_[1]));
                break;
        }

        return out;
    }

    inline extent json::size(arena<json> const & ar, json_style const & style) const
    {
        return measure(ar, *this, style);
    }

    inline bool json::shallow_equals(json const & other) const noexcept
    {
        return kind_ == other.kind_ && text_ == other.text_;
    }

    inline size_t json::shallow_hash() const noexcept
    {
        size_t seed = std::hash<int>{}(static_cast<int>(kind_));
        detail::hash_combine(seed, std::hash<std::string>{}(text_));
        return seed;
    }

} // namespace bough

#endif // BOUGH_JSON_HPP
