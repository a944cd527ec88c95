// bough_size.hpp - Bough - Rendered Extent
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_SIZE_HPP
#define BOUGH_SIZE_HPP

#include "bough_tokens.hpp"

#include <type_traits>

namespace bough
{
//========================================================================
// Extent
//========================================================================
//
// The on-screen footprint of a node when rendered from column 0 with no
// enclosing indentation: how many line breaks it contains and how wide
// its last line is.

    struct extent
    {
        size_t lines = 0;
        size_t last_line_length = 0;

        static extent single_line(size_t width) { return extent{ 0, width }; }

        bool is_single_line() const noexcept { return lines == 0; }

        bool operator==(extent const &) const = default;
    };

    // Text of `b` continuing on the last line of `a`
    inline extent operator+(extent const & a, extent const & b)
    {
        if (b.lines == 0)
            return extent{ a.lines, a.last_line_length + b.last_line_length };
        return extent{ a.lines + b.lines, b.last_line_length };
    }

    // Measure a flattened stream of (node, token) pairs or bare tokens
    template <typename Range>
    extent measure_tokens(Range const & stream)
    {
        extent result;
        size_t indentation = 0;

        auto step = [&](display_token const & t)
        {
            std::visit([&](auto const & v)
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, text_token>)
                    result.last_line_length += v.content.size();
                else if constexpr (std::is_same_v<T, whitespace_token>)
                    result.last_line_length += v.count;
                else if constexpr (std::is_same_v<T, newline_token>)
                {
                    ++result.lines;
                    result.last_line_length = indentation;
                }
                else if constexpr (std::is_same_v<T, indent_token>)
                    indentation += indent_width;
                else if constexpr (std::is_same_v<T, dedent_token>)
                    indentation -= std::min(indentation, indent_width);
            }, t);
        };

        for (auto const & item : stream)
        {
            if constexpr (std::is_same_v<std::decay_t<decltype(item)>, display_token>)
                step(item);
            else
                step(item.second);
        }

        return result;
    }

} // namespace bough

#endif // BOUGH_SIZE_HPP
