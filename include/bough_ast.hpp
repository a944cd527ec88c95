// bough_ast.hpp - Bough - Node Contract
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_AST_HPP
#define BOUGH_AST_HPP

#include "bough_core.hpp"
#include "bough_arena.hpp"
#include "bough_tokens.hpp"
#include "bough_size.hpp"
#include "bough_log.hpp"

#include <concepts>
#include <span>
#include <utility>

namespace bough
{
//========================================================================
// Node contract
//========================================================================
//
// Every tree grammar the editor can work with is a node type satisfying
// this concept. The grammar decides its own arity bounds, shortcut keys
// and token layout; everything else (flattening, text output, the debug
// outline, deep comparison) is provided generically below.
//
// A node only ever sees its children as node_ref handles. Mutations that
// would break the grammar's arity bounds return an error value and leave
// both the node and the arena untouched.

    template <typename Node>
    concept ast =
        std::default_initializable<Node> &&
        std::equality_comparable<Node> &&
        requires(
            Node & n,
            Node const & cn,
            arena<Node> & a,
            arena<Node> const & ca,
            typename Node::format_style const & fs,
            node_ref ref,
            size_t index,
            char c)
        {
            // Structure
            { cn.children() }                  -> std::convertible_to<std::span<const node_ref>>;
            { n.children_mut() }               -> std::convertible_to<std::span<node_ref>>;

            // Arity bounds; unbounded for "any number"
            { cn.min_children() }              -> std::convertible_to<size_t>;
            { cn.max_children() }              -> std::convertible_to<size_t>;

            // Editing
            { n.delete_child(index) }          -> std::same_as<delete_result>;
            { n.insert_child(ref, a, index) }  -> std::same_as<insert_result>;
            { cn.replace_chars() }             -> std::same_as<std::vector<char>>;
            { cn.from_char(c) }                -> std::same_as<std::optional<Node>>;
            { cn.insert_chars() }              -> std::same_as<std::vector<char>>;

            // Presentation
            { cn.display_name() }              -> std::convertible_to<std::string>;
            { cn.display_tokens_rec(fs) }      -> std::same_as<std::vector<rec_tok>>;
            { cn.size(ca, fs) }                -> std::same_as<extent>;

            // Value identity, children excluded
            { cn.shallow_equals(cn) }          -> std::same_as<bool>;
            { cn.shallow_hash() }              -> std::convertible_to<size_t>;
        };

    template <ast Node>
    using format_style_of = typename Node::format_style;

    template <ast Node>
    using token_stream = std::vector<std::pair<node_ref, display_token>>;

//========================================================================
// Shortcut queries
//========================================================================

    template <ast Node>
    bool is_replace_char(Node const & node, char c)
    {
        return detail::contains_char(node.replace_chars(), c);
    }

    template <ast Node>
    bool is_insert_char(Node const & node, char c)
    {
        return detail::contains_char(node.insert_chars(), c);
    }

    // A parent may narrow what its child slots accept by providing
    // `slot_replace_chars(index)`; a JSON field's key slot only takes
    // strings. Without it a slot accepts whatever its child offers.
    template <ast Node>
    bool is_replace_char_at(Node const & parent, size_t index, Node const & child, char c)
    {
        if (!is_replace_char(child, c))
            return false;

        if constexpr (requires { { parent.slot_replace_chars(index) } -> std::same_as<std::vector<char>>; })
            return detail::contains_char(parent.slot_replace_chars(index), c);
        else
            return true;
    }

//========================================================================
// Token stream flattening
//========================================================================

    namespace detail
    {
        template <ast Node>
        void append_tokens(
            arena<Node> const & ar,
            Node const & node,
            node_ref self,
            format_style_of<Node> const & fs,
            token_stream<Node> & out)
        {
            for (auto & item : node.display_tokens_rec(fs))
            {
                if (auto * t = std::get_if<display_token>(&item))
                {
                    out.emplace_back(self, std::move(*t));
                    continue;
                }

                node_ref child_ref = std::get<node_ref>(item);
                Node const * child = ar.get(child_ref);
                if (!child)
                {
                    log::error("{} emitted child handle {} which is not in its arena", node.display_name(), child_ref.val);
                    continue;
                }
                append_tokens(ar, *child, child_ref, fs, out);
            }
        }
    }

    // Every token of the tree under `root`, in document order, paired with
    // the node that emitted it.
    template <ast Node>
    token_stream<Node> display_tokens(
        arena<Node> const & ar,
        node_ref root,
        format_style_of<Node> const & fs)
    {
        token_stream<Node> out;
        if (Node const * node = ar.get(root))
            detail::append_tokens(ar, *node, root, fs, out);
        return out;
    }

    // Footprint of one node, computed from its own token output. Grammars
    // implement size() by delegating here.
    template <ast Node>
    extent measure(arena<Node> const & ar, Node const & node, format_style_of<Node> const & fs)
    {
        token_stream<Node> out;
        detail::append_tokens(ar, node, invalid_id<node_tag>(), fs, out);
        return measure_tokens(out);
    }

//========================================================================
// Structural queries
//========================================================================

    template <ast Node>
    size_t node_count(arena<Node> const & ar, node_ref root)
    {
        Node const * node = ar.get(root);
        if (!node)
            return 0;

        size_t count = 1;
        for (node_ref c : node->children())
            count += node_count(ar, c);
        return count;
    }

    // Deep equality by value; handle numbers and arenas play no part
    template <ast Node>
    bool structurally_equal(
        arena<Node> const & ar_a, node_ref a,
        arena<Node> const & ar_b, node_ref b)
    {
        Node const * na = ar_a.get(a);
        Node const * nb = ar_b.get(b);
        if (!na || !nb)
            return na == nb;

        if (!na->shallow_equals(*nb))
            return false;

        auto ca = na->children();
        auto cb = nb->children();
        if (ca.size() != cb.size())
            return false;

        for (size_t i = 0; i < ca.size(); ++i)
        {
            if (!structurally_equal(ar_a, ca[i], ar_b, cb[i]))
                return false;
        }
        return true;
    }

    template <ast Node>
    size_t structural_hash(arena<Node> const & ar, node_ref root)
    {
        Node const * node = ar.get(root);
        if (!node)
            return 0;

        size_t seed = node->shallow_hash();
        for (node_ref c : node->children())
            detail::hash_combine(seed, structural_hash(ar, c));
        return seed;
    }

} // namespace bough

#endif // BOUGH_AST_HPP
