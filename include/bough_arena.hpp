// bough_arena.hpp - Bough - Node Arena
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_ARENA_HPP
#define BOUGH_ARENA_HPP

#include "bough_core.hpp"
#include "bough_log.hpp"

#include <deque>
#include <cassert>

namespace bough
{
//========================================================================
// Arena
//========================================================================
//
// Sole owner of every node of one edit session. Nodes only relate to each
// other through node_ref handles resolved here. Allocation-only: a node
// lives, at a fixed address, until the arena itself is destroyed.

    template <typename Node>
    class arena
    {
    public:
        arena() = default;

        arena(arena const &) = delete;
        arena & operator=(arena const &) = delete;
        arena(arena &&) noexcept = default;
        arena & operator=(arena &&) noexcept = default;

        //------------------------------------------------------------------------
        // Allocation
        //------------------------------------------------------------------------

        node_ref alloc(Node node)
        {
            node_ref ref{ nodes_.size() };
            nodes_.push_back(std::move(node));
            if (log::enabled(log::level::debug))
                log::debug("arena: allocated node {} ({})", ref.val, nodes_.back().display_name());
            return ref;
        }

        //------------------------------------------------------------------------
        // Access
        //------------------------------------------------------------------------

        size_t size() const noexcept
        {
            return nodes_.size();
        }

        bool contains(node_ref ref) const noexcept
        {
            return ref.val < nodes_.size();
        }

        Node * get(node_ref ref) noexcept
        {
            if (!contains(ref))
                return nullptr;
            return &nodes_[ref.val];
        }

        Node const * get(node_ref ref) const noexcept
        {
            if (!contains(ref))
                return nullptr;
            return &nodes_[ref.val];
        }

        Node & operator[](node_ref ref)
        {
            assert(contains(ref));
            return nodes_[ref.val];
        }

        Node const & operator[](node_ref ref) const
        {
            assert(contains(ref));
            return nodes_[ref.val];
        }

    private:

        // deque: push_back never relocates existing elements, so a node may
        // allocate siblings while a reference to itself is live.
        std::deque<Node> nodes_;
    };

} // namespace bough

#endif // BOUGH_ARENA_HPP
