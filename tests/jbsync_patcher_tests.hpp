#ifndef JBSYNC_TESTS_PATCHER__
#define JBSYNC_TESTS_PATCHER__

#include "jbsync_test_harness.hpp"
#include "../include/jbsync_patcher.hpp"

namespace jbsync::tests
{
using namespace jbsync;

namespace patcher_fixture
{
    constexpr std::string_view src =
        "{\n"
        "\"p\": {\n"
        "    \"name\": \"x\", // keep me\n"
        "    \"nodes\": [\n"
        "        [\"id\", \"posX\"],\n"
        "        [\"a\", 1.500],\n"
        "        [\"b\", 0.25],\n"
        "    ],\n"
        "    \"slots\": [\n"
        "        [\"type\"],\n"
        "        [\"old\"],\n"
        "    ],\n"
        "},\n"
        "}\n";

    inline value * cell(value & root, size_t row, size_t col)
    {
        return root.find("p")->find("nodes")->at(row)->at(col);
    }
}

inline bool patch_changed_scalars_only()
{
    using namespace patcher_fixture;

    auto ctx = parse(src);
    EXPECT(!ctx.has_errors(), "fixture should parse");

    auto & doc = ctx.result;
    value baseline = materialise(doc);
    value current = baseline;

    *cell(current, 1, 1) = 2.25;
    *current.find("p")->find("name") = "y";

    EXPECT(patch_values(doc, baseline, current) == 2, "two scalars should change");

    std::string out = stringify(doc);
    EXPECT(out.find("[\"a\", 2.25]") != std::string::npos, "number should be rewritten");
    EXPECT(out.find("\"name\": \"y\", // keep me") != std::string::npos, "string should change, comment should stay");
    EXPECT(out.find("[\"b\", 0.25]") != std::string::npos, "untouched number should keep its text");
    EXPECT(doc.size() == parse(src).result.size(), "patching never changes the token count");

    return true;
}

inline bool equal_values_keep_their_formatting()
{
    using namespace patcher_fixture;

    auto ctx = parse(src);
    auto & doc = ctx.result;
    value baseline = materialise(doc);
    value current = baseline;

    *cell(current, 1, 1) = 1.5;

    EXPECT(patch_values(doc, baseline, current) == 0, "equal value should not count as a change");
    EXPECT(stringify(doc) == src, "1.500 should keep its three decimals");

    return true;
}

inline bool slots_are_never_patched()
{
    using namespace patcher_fixture;

    auto ctx = parse(src);
    auto & doc = ctx.result;
    value baseline = materialise(doc);
    value current = baseline;

    *current.find("p")->find("slots")->at(1)->at(0) = "new";

    EXPECT(patch_values(doc, baseline, current) == 0, "slots should be skipped");
    EXPECT(stringify(doc) == src, "text should be unchanged");

    return true;
}

inline bool structural_mismatch_leaves_value()
{
    using namespace patcher_fixture;

    auto ctx = parse(src);
    auto & doc = ctx.result;
    value baseline = materialise(doc);
    value current = baseline;

    // An object where the tokens hold an array
    *current.find("p")->find("nodes") = value(object{ { "id", "a" } });

    EXPECT(patch_values(doc, baseline, current) == 0, "mismatched subtree should be left alone");
    EXPECT(stringify(doc) == src, "text should be unchanged");

    return true;
}

inline bool path_tracks_keys_and_indices()
{
    auto ctx = parse(R"({"p": {"beams": [["id1:", "id2:"], ["a", "b"]]}})");
    EXPECT(!ctx.has_errors(), "fixture should parse");

    structural_path path;
    size_t scalars = 0;
    for (auto const & t : ctx.result)
    {
        if (path.step(t) != path_event::scalar) continue;
        ++scalars;

        if (t.text == "b")
        {
            auto frames = path.frames();
            EXPECT(frames.size() == 3, "row scalar sits three frames deep");
            EXPECT(std::get<std::string>(frames[0].key) == "p", "first frame is the part");
            EXPECT(std::get<std::string>(frames[1].key) == "beams", "second frame is the section");
            EXPECT(std::get<size_t>(frames[2].key) == 1, "third frame is the row");
            EXPECT(std::get<size_t>(path.slot()) == 1, "slot is the cell index");
        }
    }
    EXPECT(scalars == 4, "four cell scalars expected");

    return true;
}

inline void run_patcher_tests()
{
    SUBCAT("Leaf values");
    RUN_TEST(patch_changed_scalars_only);
    RUN_TEST(equal_values_keep_their_formatting);
    RUN_TEST(slots_are_never_patched);
    RUN_TEST(structural_mismatch_leaves_value);
    SUBCAT("Paths");
    RUN_TEST(path_tracks_keys_and_indices);
}

}

#endif
