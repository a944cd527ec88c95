// bough_editor.hpp - Bough - Tree Editor
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_EDITOR_HPP
#define BOUGH_EDITOR_HPP

#include "bough_ast.hpp"
#include "bough_render.hpp"

namespace bough
{
    template <ast Node>
    class editor
    {
    public:
        using format_style = format_style_of<Node>;

        explicit editor(arena<Node> & ar, node_ref root) noexcept
            : arena_(ar)
            , root_(root)
        {}

        node_ref root() const noexcept { return root_; }
        arena<Node> const & nodes() const noexcept { return arena_; }

    //============================================================
    // Navigation
    //============================================================

        std::optional<node_ref> child(node_ref parent, size_t index) const;

        // Follow child indices down from the root
        std::optional<node_ref> locate(std::span<const size_t> path) const;

    //============================================================
    // Structural edits
    //============================================================
    // Every edit is all-or-nothing. A rejected edit leaves tree and arena
    // as they were and appends its description to messages().

        // Insert a node built from shortcut `c` as child `index` of `parent`
        bool insert_child(node_ref parent, size_t index, char c);

        bool delete_child(node_ref parent, size_t index);

        // Replace child `index` of `parent` wholesale with the node for `c`
        bool replace(node_ref parent, size_t index, char c);

        bool replace_root(char c);

    //============================================================
    // Reporting
    //============================================================

        std::span<const std::string> messages() const noexcept { return messages_; }
        void clear_messages() noexcept { messages_.clear(); }

    //============================================================
    // Rendering
    //============================================================

        std::string text(format_style const & fs) const { return to_text(arena_, root_, fs); }
        std::string outline() const { return tree_view(arena_, root_); }

    private:

        arena<Node> &            arena_;
        node_ref                 root_;
        std::vector<std::string> messages_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        void reject(std::string message);
    };

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

    template <ast Node>
    void editor<Node>::reject(std::string message)
    {
        log::warning("edit rejected: {}", message);
        messages_.push_back(std::move(message));
    }

//============================================================
// Navigation
//============================================================

    template <ast Node>
    std::optional<node_ref> editor<Node>::child(node_ref parent, size_t index) const
    {
        Node const * p = arena_.get(parent);
        if (!p)
            return std::nullopt;

        auto kids = p->children();
        if (index >= kids.size())
            return std::nullopt;

        return kids[index];
    }

    template <ast Node>
    std::optional<node_ref> editor<Node>::locate(std::span<const size_t> path) const
    {
        node_ref current = root_;
        for (size_t index : path)
        {
            auto next = child(current, index);
            if (!next)
                return std::nullopt;
            current = *next;
        }
        return current;
    }

//============================================================
// Structural edits
//============================================================

    template <ast Node>
    bool editor<Node>::insert_child(node_ref parent, size_t index, char c)
    {
        Node * p = arena_.get(parent);
        if (!p)
        {
            reject(fmt::format("node {} does not exist", parent.val));
            return false;
        }

        if (!is_insert_char(*p, c))
        {
            reject(fmt::format("'{}' does not insert anything into {}", c, p->display_name()));
            return false;
        }

        // Check the ceiling before allocating, so a refused insert leaves no
        // orphan behind in the arena
        if (auto err = detail::check_insert(p->display_name(), p->children().size(), p->max_children()))
        {
            reject(describe(*err));
            return false;
        }

        // Insert shortcuts name the same nodes a default node is replaced by
        auto fresh = Node{}.from_char(c);
        if (!fresh)
        {
            reject(fmt::format("'{}' does not name a node", c));
            return false;
        }

        node_ref new_ref = arena_.alloc(std::move(*fresh));

        if (auto result = p->insert_child(new_ref, arena_, index); !result)
        {
            reject(describe(result.error()));
            return false;
        }

        log::debug("inserted {} into {} at {}", new_ref.val, parent.val, index);
        return true;
    }

    template <ast Node>
    bool editor<Node>::delete_child(node_ref parent, size_t index)
    {
        Node * p = arena_.get(parent);
        if (!p)
        {
            reject(fmt::format("node {} does not exist", parent.val));
            return false;
        }

        if (auto result = p->delete_child(index); !result)
        {
            reject(describe(result.error()));
            return false;
        }

        log::debug("deleted child {} of {}", index, parent.val);
        return true;
    }

    template <ast Node>
    bool editor<Node>::replace(node_ref parent, size_t index, char c)
    {
        Node * p = arena_.get(parent);
        auto target = child(parent, index);
        if (!p || !target)
        {
            reject(fmt::format("node {} has no child {}", parent.val, index));
            return false;
        }

        Node const & old = arena_[*target];
        auto fresh = old.from_char(c);
        if (!fresh)
        {
            reject(fmt::format("'{}' cannot replace {}", c, old.display_name()));
            return false;
        }

        if (!is_replace_char_at(*p, index, old, c))
        {
            reject(fmt::format("'{}' cannot replace child {} of {}", c, index, p->display_name()));
            return false;
        }

        p->children_mut()[index] = arena_.alloc(std::move(*fresh));
        return true;
    }

    template <ast Node>
    bool editor<Node>::replace_root(char c)
    {
        Node const * old = arena_.get(root_);
        if (!old)
        {
            reject("the document has no root");
            return false;
        }

        auto fresh = old->from_char(c);
        if (!fresh)
        {
            reject(fmt::format("'{}' cannot replace {}", c, old->display_name()));
            return false;
        }

        root_ = arena_.alloc(std::move(*fresh));
        return true;
    }

} // namespace bough

#endif // BOUGH_EDITOR_HPP
