#include "include/bough.hpp"

#include <fmt/core.h>

using namespace bough;

int main()
{
    log::set_level(log::level::info);

    // A small document built directly into the session arena
    arena<json> ar;
    json_builder b(ar);

    auto root = b.object({
        { "name",    b.str("bough") },
        { "stable",  b.f() },
        { "authors", b.array({ b.str("A. Gardener"), b.null() }) }
    });

    editor<json> ed(ar, root);

    // The same edits a user would make with shortcut keys
    ed.insert_child(ed.root(), 3, 'a');

    std::vector<size_t> path{ 3 };
    if (auto field = ed.locate(path))
    {
        if (auto value = ed.child(*field, 1))
        {
            ed.insert_child(*value, 0, 't');
            ed.insert_child(*value, 1, 'o');
        }
    }

    // Refused: a field always has exactly a key and a value
    if (auto field = ed.locate(path))
        ed.delete_child(*field, 0);

    fmt::print("Compact:\n{}\n\n", ed.text(json_style::compact));
    fmt::print("Pretty:\n{}\n\n", ed.text(json_style::pretty));
    fmt::print("Highlighted:\n{}\n\n", to_styled_text(ar, ed.root(), json_style::pretty, default_color_scheme()));

    render_options debug;
    debug.debug_highlighting = true;
    fmt::print("Node boundaries:\n{}\n\n", to_styled_text(ar, ed.root(), json_style::pretty, default_color_scheme(), debug));

    fmt::print("Outline:\n{}\n\n", ed.outline());

    extent sz = ar[ed.root()].size(ar, json_style::pretty);
    fmt::print("Pretty size: {} line breaks, last line {} wide\n", sz.lines, sz.last_line_length);

    for (auto const & message : ed.messages())
        fmt::print("Refused: {}\n", message);

    return 0;
}
