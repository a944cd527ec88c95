#ifndef BOUGH_TESTS_GRAMMAR__
#define BOUGH_TESTS_GRAMMAR__

#include "../include/bough_ast.hpp"

#include <functional>

namespace bough::tests
{
//========================================================================
// Fixture grammar
//========================================================================
//
// A small grammar with one node type per arity shape, so the generic
// machinery can be checked against bounds JSON does not have.
//
//   leaf     'x' | 'y'          0..0    x
//   wrapper  (child)            1..1    (x)
//   pair     <a, b>             2..2    <x, y>
//   list     [a b c]            0..inf  [x y]
//   block    {a b}              1..3    one child per indented line

    enum class fixture_kind
    {
        leaf,
        wrapper,
        pair,
        list,
        block
    };

    struct fixture_style
    {
        bool pad_lists = false;   // "[ x y ]" instead of "[x y]"
    };

    class fixture
    {
    public:
        using format_style = fixture_style;

        fixture() = default;

        static fixture leaf(char label)
        {
            fixture f(fixture_kind::leaf);
            f.label_ = label;
            return f;
        }

        static fixture wrapper(node_ref c)                  { return fixture(fixture_kind::wrapper, { c }); }
        static fixture pair(node_ref a, node_ref b)         { return fixture(fixture_kind::pair, { a, b }); }
        static fixture list(std::vector<node_ref> cs = {})  { return fixture(fixture_kind::list, std::move(cs)); }
        static fixture block(std::vector<node_ref> cs)      { return fixture(fixture_kind::block, std::move(cs)); }

        fixture_kind kind() const noexcept { return kind_; }
        char label() const noexcept { return label_; }

        size_t min_children() const noexcept
        {
            switch (kind_)
            {
                case fixture_kind::wrapper: return 1;
                case fixture_kind::pair:    return 2;
                case fixture_kind::block:   return 1;
                default:                    return 0;
            }
        }

        size_t max_children() const noexcept
        {
            switch (kind_)
            {
                case fixture_kind::leaf:    return 0;
                case fixture_kind::wrapper: return 1;
                case fixture_kind::pair:    return 2;
                case fixture_kind::block:   return 3;
                default:                    return unbounded;
            }
        }

        std::span<const node_ref> children() const noexcept { return children_; }
        std::span<node_ref> children_mut() noexcept { return children_; }

        delete_result delete_child(size_t index)
        {
            if (auto err = detail::check_delete(display_name(), children_.size(), index, min_children()))
                return *err;
            children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
            return {};
        }

        insert_result insert_child(node_ref new_node, arena<fixture> &, size_t index)
        {
            if (auto err = detail::check_insert(display_name(), children_.size(), max_children()))
                return *err;
            index = std::min(index, children_.size());
            children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), new_node);
            return {};
        }

        std::vector<char> replace_chars() const { return { 'x', 'y', 'l' }; }

        std::optional<fixture> from_char(char c) const
        {
            switch (c)
            {
                case 'x':
                case 'y': return leaf(c);
                case 'l': return list();
                default:  return std::nullopt;
            }
        }

        std::vector<char> insert_chars() const
        {
            if (kind_ == fixture_kind::list || kind_ == fixture_kind::block)
                return { 'x', 'y', 'l' };
            return {};
        }

        std::string display_name() const
        {
            switch (kind_)
            {
                case fixture_kind::leaf:    return std::string("leaf ") + label_;
                case fixture_kind::wrapper: return "wrapper";
                case fixture_kind::pair:    return "pair";
                case fixture_kind::list:    return "list";
                case fixture_kind::block:   return "block";
            }
            return "fixture";
        }

        std::vector<rec_tok> display_tokens_rec(fixture_style const & style) const
        {
            std::vector<rec_tok> out;
            switch (kind_)
            {
                case fixture_kind::leaf:
                    out.push_back(tok::text(std::string(1, label_), syntax::ident));
                    break;

                case fixture_kind::wrapper:
                    out.push_back(tok::text("("));
                    out.push_back(tok::child(children_[0]));
                    out.push_back(tok::text(")"));
                    break;

                case fixture_kind::pair:
                    out.push_back(tok::text("<"));
                    out.push_back(tok::child(children_[0]));
                    out.push_back(tok::text(","));
                    out.push_back(tok::ws(1));
                    out.push_back(tok::child(children_[1]));
                    out.push_back(tok::text(">"));
                    break;

                case fixture_kind::list:
                    out.push_back(tok::text("[", syntax::keyword));
                    if (style.pad_lists)
                        out.push_back(tok::ws(1));
                    for (size_t i = 0; i < children_.size(); ++i)
                    {
                        if (i > 0)
                            out.push_back(tok::ws(1));
                        out.push_back(tok::child(children_[i]));
                    }
                    if (style.pad_lists)
                        out.push_back(tok::ws(1));
                    out.push_back(tok::text("]", syntax::keyword));
                    break;

                case fixture_kind::block:
                    out.push_back(tok::text("{"));
                    out.push_back(tok::indent());
                    for (node_ref c : children_)
                    {
                        out.push_back(tok::newline());
                        out.push_back(tok::child(c));
                    }
                    out.push_back(tok::dedent());
                    out.push_back(tok::newline());
                    out.push_back(tok::text("}"));
                    break;
            }
            return out;
        }

        extent size(arena<fixture> const & ar, fixture_style const & style) const
        {
            return measure(ar, *this, style);
        }

        bool shallow_equals(fixture const & other) const noexcept
        {
            return kind_ == other.kind_ && label_ == other.label_;
        }

        size_t shallow_hash() const noexcept
        {
            size_t seed = std::hash<int>{}(static_cast<int>(kind_));
            detail::hash_combine(seed, std::hash<char>{}(label_));
            return seed;
        }

        bool operator==(fixture const &) const = default;

    private:

        explicit fixture(fixture_kind kind, std::vector<node_ref> cs = {})
            : kind_(kind)
            , children_(std::move(cs))
        {}

        fixture_kind          kind_ = fixture_kind::list;
        char                  label_ = 0;
        std::vector<node_ref> children_;
    };

    static_assert(ast<fixture>);

}

#endif
