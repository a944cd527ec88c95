#ifndef BOUGH_TESTS_EDITOR__
#define BOUGH_TESTS_EDITOR__

#include "bough_test_harness.hpp"
#include "bough_test_grammar.hpp"
#include "../include/bough_editor.hpp"
#include "../include/bough_json.hpp"

#include <array>

namespace bough::tests
{

namespace
{
    // Silences rejection warnings for the lifetime of a test
    struct quiet_log
    {
        log::level previous = log::get_level();
        quiet_log() { log::set_level(log::level::none); }
        ~quiet_log() { log::set_level(previous); }
    };
}

//============================================================================
// Building a document by keystrokes
//============================================================================

static bool type_a_document()
{
    arena<json> ar;
    auto root = ar.alloc(json::make_null());
    editor<json> ed(ar, root);

    EXPECT(ed.replace_root('o'), "null can become an object");
    EXPECT(ed.insert_child(ed.root(), 0, 't'), "objects take values");
    EXPECT(ed.text(json_style::compact) == R"({"": true})", "rendered text mismatch");

    // Replace the value inside the synthesised field with an array
    std::array<size_t, 1> field_path{ 0 };
    auto field = ed.locate(field_path);
    EXPECT(field.has_value(), "field should be reachable");
    EXPECT(ed.replace(*field, 1, 'a'), "values can be replaced");
    EXPECT(ed.insert_child(*ed.child(*field, 1), 0, 'n'), "arrays take values");
    EXPECT(ed.insert_child(*ed.child(*field, 1), 1, 'f'), "arrays take more values");

    EXPECT(ed.text(json_style::compact) == R"({"": [null, false]})", "rendered text mismatch");
    EXPECT(ed.messages().empty(), "no edit should have been refused");

    return true;
}

static bool outline_follows_edits()
{
    arena<json> ar;
    json_builder b(ar);
    editor<json> ed(ar, b.array({}));

    EXPECT(ed.insert_child(ed.root(), 0, 's'), "insert should succeed");
    EXPECT(ed.outline() == "array\n  string", "outline mismatch");

    EXPECT(ed.delete_child(ed.root(), 0), "delete should succeed");
    EXPECT(ed.outline() == "array", "outline mismatch after delete");

    return true;
}

//============================================================================
// Refusals
//============================================================================

static bool refused_delete_is_reported()
{
    quiet_log quiet;

    arena<fixture> ar;
    auto x = ar.alloc(fixture::leaf('x'));
    auto w = ar.alloc(fixture::wrapper(x));
    editor<fixture> ed(ar, w);

    std::string before = ed.text(fixture_style{});

    EXPECT(!ed.delete_child(w, 0), "wrapper keeps its child");
    EXPECT(ed.messages().size() == 1, "refusal should be recorded");
    EXPECT(ed.messages()[0] == "Node type wrapper can't have fewer than 1 children.", "message mismatch");
    EXPECT(ed.text(fixture_style{}) == before, "tree must be untouched");

    ed.clear_messages();
    EXPECT(ed.messages().empty(), "messages can be cleared");

    return true;
}

static bool refused_insert_allocates_nothing()
{
    quiet_log quiet;

    arena<fixture> ar;
    auto a = ar.alloc(fixture::leaf('x'));
    auto b = ar.alloc(fixture::leaf('y'));
    auto c = ar.alloc(fixture::leaf('x'));
    auto blk = ar.alloc(fixture::block({ a, b, c }));
    editor<fixture> ed(ar, blk);

    size_t before = ar.size();

    EXPECT(!ed.insert_child(blk, 0, 'x'), "block is full");
    EXPECT(ar.size() == before, "no orphan node may be left behind");
    EXPECT(ed.messages().back() == "Can't exceed child count limit of 3 in block", "message mismatch");

    return true;
}

static bool invalid_shortcuts_are_refused()
{
    quiet_log quiet;

    arena<json> ar;
    json_builder b(ar);
    auto root = b.array({ b.t() });
    editor<json> ed(ar, root);

    size_t before = ar.size();

    EXPECT(!ed.insert_child(root, 0, 'q'), "'q' inserts nothing");
    EXPECT(!ed.replace(root, 0, 'q'), "'q' replaces nothing");
    EXPECT(!ed.replace(root, 5, 't'), "no child 5");
    EXPECT(!ed.insert_child(ar[root].children()[0], 0, 't'), "true takes no children");
    EXPECT(!ed.delete_child(root, 1), "no child 1");
    EXPECT(ed.messages().size() == 5, "every refusal is recorded");
    EXPECT(ed.messages()[4] == "Deleting child index 1 is out of range 0..1", "message mismatch");
    EXPECT(ar.size() == before, "nothing was allocated");
    EXPECT(ed.text(json_style::compact) == "[true]", "tree is unchanged");

    return true;
}

static bool field_key_stays_a_string()
{
    quiet_log quiet;

    arena<json> ar;
    json_builder b(ar);
    auto root = b.object({ { "k", b.null() } });
    editor<json> ed(ar, root);

    auto field = *ed.child(root, 0);
    size_t before = ar.size();

    EXPECT(!ed.replace(field, 0, 't'), "a key cannot become true");
    EXPECT(!ed.replace(field, 0, 'o'), "a key cannot become an object");
    EXPECT(ed.messages().size() == 2, "both refusals are recorded");
    EXPECT(ed.messages()[0] == "'t' cannot replace child 0 of field", "message mismatch");
    EXPECT(ar.size() == before, "nothing was allocated");
    EXPECT(ed.text(json_style::compact) == R"({"k": null})", "tree is unchanged");

    EXPECT(ed.replace(field, 0, 's'), "a key can be reset to an empty string");
    EXPECT(ed.replace(field, 1, 'f'), "the value slot takes any value");
    EXPECT(ed.text(json_style::compact) == R"({"": false})", "rendered text mismatch");

    return true;
}

static bool rejections_reach_the_log_sink()
{
    std::vector<std::string> captured;
    auto previous = log::get_level();

    log::set_level(log::level::warning);
    log::set_sink([&captured](log::level lv, std::string_view msg)
    {
        if (lv == log::level::warning)
            captured.emplace_back(msg);
    });

    arena<json> ar;
    json_builder b(ar);
    editor<json> ed(ar, b.t());
    bool refused = !ed.insert_child(ed.root(), 0, 't');

    log::set_sink({});
    log::set_level(previous);

    EXPECT(refused, "true takes no children");
    EXPECT(captured.size() == 1, "one warning expected");
    EXPECT(captured[0].find("edit rejected") != std::string::npos, "warning should name the rejection");

    return true;
}

//============================================================================
// Navigation
//============================================================================

static bool locate_walks_child_indices()
{
    arena<json> ar;
    json_builder b(ar);
    auto inner = b.array({ b.null() });
    auto root = b.array({ b.t(), inner });
    editor<json> ed(ar, root);

    std::vector<size_t> path{ 1, 0 };
    auto found = ed.locate(path);
    EXPECT(found.has_value(), "path should resolve");
    EXPECT(ar[*found].kind() == json_kind::null, "path should reach the null");

    std::vector<size_t> bad{ 1, 3 };
    EXPECT(!ed.locate(bad).has_value(), "out of range path does not resolve");
    EXPECT(ed.locate({}) == root, "empty path is the root");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_editor_tests()
{
    SUBCAT("Keystroke editing");
    RUN_TEST(type_a_document);
    RUN_TEST(outline_follows_edits);

    SUBCAT("Refusals");
    RUN_TEST(refused_delete_is_reported);
    RUN_TEST(refused_insert_allocates_nothing);
    RUN_TEST(invalid_shortcuts_are_refused);
    RUN_TEST(field_key_stays_a_string);
    RUN_TEST(rejections_reach_the_log_sink);

    SUBCAT("Navigation");
    RUN_TEST(locate_walks_child_indices);
}

}

#endif
