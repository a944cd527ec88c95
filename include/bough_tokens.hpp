// bough_tokens.hpp - Bough - Display Tokens
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_TOKENS_HPP
#define BOUGH_TOKENS_HPP

#include "bough_core.hpp"

namespace bough
{
//========================================================================
// Syntax categories
//========================================================================
//
// A category names a class of text that is highlighted the same way. The
// set is open: grammars may emit any name, and presentation falls back to
// "default" for names it does not know.

    using syntax_category = std::string;

    namespace syntax
    {
        inline constexpr std::string_view plain      = "default";    // punctuation and the like
        inline constexpr std::string_view constant   = "const";      // true, false, null
        inline constexpr std::string_view literal    = "literal";    // strings, numbers
        inline constexpr std::string_view comment    = "comment";
        inline constexpr std::string_view ident      = "ident";
        inline constexpr std::string_view keyword    = "keyword";
        inline constexpr std::string_view preproc    = "preproc";
        inline constexpr std::string_view type       = "type";
        inline constexpr std::string_view special    = "special";    // escapes inside literals
        inline constexpr std::string_view underlined = "underlined";
        inline constexpr std::string_view error      = "error";
    }

    // Columns added to the indentation by one indent token
    inline constexpr size_t indent_width = 4;

//========================================================================
// Display tokens
//========================================================================

    struct text_token
    {
        std::string     content;
        syntax_category category;

        bool operator==(text_token const &) const = default;
    };

    struct whitespace_token
    {
        size_t count;

        bool operator==(whitespace_token const &) const = default;
    };

    struct newline_token
    {
        bool operator==(newline_token const &) const = default;
    };

    struct indent_token
    {
        bool operator==(indent_token const &) const = default;
    };

    struct dedent_token
    {
        bool operator==(dedent_token const &) const = default;
    };

    using display_token = std::variant<
        text_token,
        whitespace_token,
        newline_token,
        indent_token,
        dedent_token
    >;

    // A node's self-description unit: a token to emit now, or a child whose
    // own stream is spliced in at this point.
    using rec_tok = std::variant<display_token, node_ref>;

    inline bool is_text(display_token const & t)    { return std::holds_alternative<text_token>(t); }
    inline bool is_newline(display_token const & t) { return std::holds_alternative<newline_token>(t); }
    inline bool is_indent(display_token const & t)  { return std::holds_alternative<indent_token>(t); }
    inline bool is_dedent(display_token const & t)  { return std::holds_alternative<dedent_token>(t); }

//========================================================================
// Token construction shorthands
//========================================================================

    namespace tok
    {
        inline rec_tok text(std::string content, std::string_view category = syntax::plain)
        {
            return display_token{ text_token{ std::move(content), std::string(category) } };
        }

        inline rec_tok ws(size_t count)   { return display_token{ whitespace_token{ count } }; }
        inline rec_tok newline()          { return display_token{ newline_token{} }; }
        inline rec_tok indent()           { return display_token{ indent_token{} }; }
        inline rec_tok dedent()           { return display_token{ dedent_token{} }; }
        inline rec_tok child(node_ref c)  { return c; }
    }

} // namespace bough

#endif // BOUGH_TOKENS_HPP
