// bough_core.hpp - Bough - Core Data Structures
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_CORE_HPP
#define BOUGH_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <cstddef>

#include <fmt/format.h>

namespace bough
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    // Child-count ceiling of node types that take any number of children
    inline constexpr size_t unbounded = npos();

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        id & operator= (size_t v) { val = v; return *this; }
        auto operator<=>(id const &) const = default;
        id & operator++() { ++val; return *this; }
        id operator++(int) { id temp = *this; ++val; return temp; }
    };

    template <typename Tag>
    constexpr id<Tag> invalid_id()
    {
        return id<Tag>{ npos() };
    }

    struct node_tag;

    using node_ref = id<node_tag>;

//========================================================================
// Edit errors
//========================================================================

    // Inserting would push the child count past the node type's ceiling
    struct too_many_children
    {
        std::string name;
        size_t      max_children;

        bool operator==(too_many_children const &) const = default;
    };

    // Deleting would leave fewer children than the node type requires
    struct too_few_children
    {
        std::string name;
        size_t      min_children;

        bool operator==(too_few_children const &) const = default;
    };

    // The requested child does not exist. Selection logic should never
    // produce this, but a node must not crash when it does.
    struct index_out_of_range
    {
        size_t len;
        size_t index;

        bool operator==(index_out_of_range const &) const = default;
    };

    using insert_error = std::variant<too_many_children>;
    using delete_error = std::variant<too_few_children, index_out_of_range>;

    inline bool is_too_few_children(delete_error const & e) { return std::holds_alternative<too_few_children>(e); }
    inline bool is_index_out_of_range(delete_error const & e) { return std::holds_alternative<index_out_of_range>(e); }

//========================================================================
// Edit results
//========================================================================

    // Outcome of a structural edit: either success, or exactly one error
    // describing why the node was left untouched.
    template <typename Error>
    struct edit_result
    {
        std::optional<Error> err;

        edit_result() = default;
        edit_result(Error e) : err(std::move(e)) {}

        bool ok() const noexcept { return !err.has_value(); }
        explicit operator bool() const noexcept { return ok(); }

        Error const & error() const { return *err; }
    };

    using insert_result = edit_result<insert_error>;
    using delete_result = edit_result<delete_error>;

//========================================================================
// Error descriptions
//========================================================================

    inline std::string describe(too_many_children const & e)
    {
        return fmt::format("Can't exceed child count limit of {} in {}", e.max_children, e.name);
    }

    inline std::string describe(too_few_children const & e)
    {
        return fmt::format("Node type {} can't have fewer than {} children.", e.name, e.min_children);
    }

    inline std::string describe(index_out_of_range const & e)
    {
        return fmt::format("Deleting child index {} is out of range 0..{}", e.index, e.len);
    }

    inline std::string describe(insert_error const & e)
    {
        return std::visit([](auto const & v) { return describe(v); }, e);
    }

    inline std::string describe(delete_error const & e)
    {
        return std::visit([](auto const & v) { return describe(v); }, e);
    }

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        // Arity check shared by every grammar's insert_child
        inline std::optional<insert_error>
        check_insert(std::string_view name, size_t len, size_t max_children)
        {
            if (max_children != unbounded && len >= max_children)
                return too_many_children{ std::string(name), max_children };
            return std::nullopt;
        }

        // Arity and bounds check shared by every grammar's delete_child
        inline std::optional<delete_error>
        check_delete(std::string_view name, size_t len, size_t index, size_t min_children)
        {
            if (index >= len)
                return index_out_of_range{ len, index };
            if (len <= min_children)
                return too_few_children{ std::string(name), min_children };
            return std::nullopt;
        }

        inline void hash_combine(size_t & seed, size_t value)
        {
            seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }

        inline bool contains_char(std::vector<char> const & chars, char c)
        {
            return std::find(chars.begin(), chars.end(), c) != chars.end();
        }
    }

} // namespace bough

#endif // BOUGH_CORE_HPP
