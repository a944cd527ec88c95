// bough_style.hpp - Bough - Colour Scheme
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_STYLE_HPP
#define BOUGH_STYLE_HPP

#include "bough_tokens.hpp"

#include <unordered_map>
#include <array>

#include <fmt/color.h>

namespace bough
{
//========================================================================
// Colour scheme
//========================================================================

    // Maps syntax categories to terminal text styles
    using color_scheme = std::unordered_map<std::string, fmt::text_style>;

    struct render_options
    {
        // Ignore categories and colour every token by the structural hash
        // of the node that emitted it. Useless for editing, invaluable for
        // seeing where one node ends and the next begins.
        bool debug_highlighting = false;
    };

    inline color_scheme default_color_scheme()
    {
        using fmt::terminal_color;

        return color_scheme{
            { "default",    fmt::fg(terminal_color::white) },
            { "const",      fmt::fg(terminal_color::red) },
            { "literal",    fmt::fg(terminal_color::yellow) },
            { "comment",    fmt::fg(terminal_color::green) },
            { "indent",     fmt::fg(terminal_color::cyan) },
            { "keyword",    fmt::fg(terminal_color::blue) },
            { "preproc",    fmt::fg(terminal_color::magenta) },
            { "type",       fmt::fg(terminal_color::bright_yellow) },
            { "special",    fmt::fg(terminal_color::bright_green) },
            { "underlined", fmt::fg(terminal_color::bright_red) },
            { "error",      fmt::fg(terminal_color::bright_red) }
        };
    }

    inline void set_style(color_scheme & scheme, std::string_view category, fmt::text_style style)
    {
        scheme.insert_or_assign(std::string(category), style);
    }

    // Unknown categories degrade to the scheme's "default" entry, and to no
    // styling at all when the scheme has none.
    inline fmt::text_style style_for(color_scheme const & scheme, std::string_view category)
    {
        if (auto it = scheme.find(std::string(category)); it != scheme.end())
            return it->second;
        if (auto it = scheme.find(std::string(syntax::plain)); it != scheme.end())
            return it->second;
        return fmt::text_style{};
    }

    namespace detail
    {
        inline fmt::text_style debug_style(size_t hash)
        {
            using fmt::terminal_color;

            static constexpr std::array<terminal_color, 12> palette{
                terminal_color::red,         terminal_color::green,
                terminal_color::yellow,      terminal_color::blue,
                terminal_color::magenta,     terminal_color::cyan,
                terminal_color::bright_red,  terminal_color::bright_green,
                terminal_color::bright_yellow, terminal_color::bright_blue,
                terminal_color::bright_magenta, terminal_color::bright_cyan
            };
            return fmt::fg(palette[hash % palette.size()]);
        }
    }

} // namespace bough

#endif // BOUGH_STYLE_HPP
