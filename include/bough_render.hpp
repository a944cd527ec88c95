// bough_render.hpp - Bough - Text, Styled and Tree-View Renderers
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_RENDER_HPP
#define BOUGH_RENDER_HPP

#include "bough_ast.hpp"
#include "bough_style.hpp"

#include <cassert>

namespace bough
{
//========================================================================
// RENDERER API
//========================================================================

    template <ast Node>
    void write_text(arena<Node> const & ar, node_ref root, std::string & out, format_style_of<Node> const & fs);

    template <ast Node>
    std::string to_text(arena<Node> const & ar, node_ref root, format_style_of<Node> const & fs);

    template <ast Node>
    void write_styled_text(
        arena<Node> const & ar,
        node_ref root,
        std::string & out,
        format_style_of<Node> const & fs,
        color_scheme const & scheme,
        render_options opt = {});

    template <ast Node>
    std::string to_styled_text(
        arena<Node> const & ar,
        node_ref root,
        format_style_of<Node> const & fs,
        color_scheme const & scheme,
        render_options opt = {});

    template <ast Node>
    void write_tree_view(arena<Node> const & ar, node_ref root, std::string & out);

    template <ast Node>
    std::string tree_view(arena<Node> const & ar, node_ref root);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        // Tracks the indentation prefix that follows every newline. Indent
        // and dedent must balance; a dedent below zero means the node that
        // emitted it is broken, and is logged and clamped to column 0.
        class layout_state
        {
        public:
            void indent()
            {
                indentation_.append(indent_width, ' ');
            }

            void dedent()
            {
                if (indentation_.size() < indent_width)
                {
                    log::error("dedent below column 0; a node emitted more dedents than indents");
                    indentation_.clear();
                    return;
                }
                indentation_.resize(indentation_.size() - indent_width);
            }

            void newline(std::string & out) const
            {
                out.push_back('\n');
                out.append(indentation_);
            }

        private:
            std::string indentation_;
        };

        // Shared by the plain and styled renderers; `emit_text` decides how
        // a text run reaches the output.
        template <typename Stream, typename EmitText>
        void render_stream(Stream const & stream, std::string & out, EmitText emit_text)
        {
            layout_state layout;

            for (auto const & item : stream)
            {
                node_ref origin = item.first;
                std::visit([&](auto const & v)
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, text_token>)
                        emit_text(origin, v);
                    else if constexpr (std::is_same_v<T, whitespace_token>)
                        out.append(v.count, ' ');
                    else if constexpr (std::is_same_v<T, newline_token>)
                        layout.newline(out);
                    else if constexpr (std::is_same_v<T, indent_token>)
                        layout.indent();
                    else if constexpr (std::is_same_v<T, dedent_token>)
                        layout.dedent();
                }, item.second);
            }
        }

        template <ast Node>
        void write_tree_view_recursive(
            arena<Node> const & ar,
            node_ref ref,
            std::string & out,
            std::string & indentation)
        {
            Node const * node = ar.get(ref);
            if (!node)
                return;

            out.append(indentation);
            out.append(node->display_name());
            out.push_back('\n');

            indentation.append("  ");
            for (node_ref c : node->children())
                write_tree_view_recursive(ar, c, out, indentation);
            indentation.resize(indentation.size() - 2);
        }
    }

//========================================================================
// Plain text
//========================================================================

    // Render an already flattened stream. Categories are ignored.
    template <typename Stream>
    void write_tokens(Stream const & stream, std::string & out)
    {
        detail::render_stream(stream, out, [&out](node_ref, text_token const & t)
        {
            out.append(t.content);
        });
    }

    template <ast Node>
    void write_text(arena<Node> const & ar, node_ref root, std::string & out, format_style_of<Node> const & fs)
    {
        write_tokens(display_tokens(ar, root, fs), out);
    }

    template <ast Node>
    std::string to_text(arena<Node> const & ar, node_ref root, format_style_of<Node> const & fs)
    {
        std::string s;
        write_text(ar, root, s, fs);
        return s;
    }

//========================================================================
// Styled text
//========================================================================

    template <ast Node>
    void write_styled_text(
        arena<Node> const & ar,
        node_ref root,
        std::string & out,
        format_style_of<Node> const & fs,
        color_scheme const & scheme,
        render_options opt)
    {
        auto stream = display_tokens(ar, root, fs);

        detail::render_stream(stream, out, [&](node_ref origin, text_token const & t)
        {
            fmt::text_style style = opt.debug_highlighting
                ? detail::debug_style(structural_hash(ar, origin))
                : style_for(scheme, t.category);
            out.append(fmt::format(style, "{}", t.content));
        });
    }

    template <ast Node>
    std::string to_styled_text(
        arena<Node> const & ar,
        node_ref root,
        format_style_of<Node> const & fs,
        color_scheme const & scheme,
        render_options opt)
    {
        std::string s;
        write_styled_text(ar, root, s, fs, scheme, opt);
        return s;
    }

//========================================================================
// Tree view
//========================================================================

    // One line per node, like the output of the Unix 'tree' command
    template <ast Node>
    void write_tree_view(arena<Node> const & ar, node_ref root, std::string & out)
    {
        std::string indentation;
        size_t start = out.size();

        detail::write_tree_view_recursive(ar, root, out, indentation);

        // Drop the newline after the last node
        if (out.size() > start)
        {
            assert(out.back() == '\n');
            out.pop_back();
        }
    }

    template <ast Node>
    std::string tree_view(arena<Node> const & ar, node_ref root)
    {
        std::string s;
        write_tree_view(ar, root, s);
        return s;
    }

} // namespace bough

#endif // BOUGH_RENDER_HPP
