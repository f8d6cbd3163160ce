#ifndef JBSYNC_TESTS_ENTITIES__
#define JBSYNC_TESTS_ENTITIES__

#include "jbsync_test_harness.hpp"
#include "../include/jbsync_entities.hpp"

namespace jbsync::tests
{
using namespace jbsync;

namespace entities_fixture
{
    constexpr std::string_view src = R"({
"p": {
    "nodes": [
        ["id", "posX", "posY", "posZ"],
        {"nodeWeight": 2},
        ["a", 0, 0, 0],
        ["b", 1, 0.5, 0],
        ["a", 5, 5, 5],
        ["e", "=$w", 0, 0],
        [3, 0, 0, 0],
    ],
    "beams": [
        ["id1:", "id2:"],
        {"beamSpring": 1},
        ["a", "b"],
        ["b"],
        ["b", "e"],
    ],
    "triangles": [
        ["id1:", "id2:", "id3:"],
        ["a", "b", "e"],
    ],
},
"q": {
    "information": {"name": "q"},
},
})";

    inline entity_data extract(sync_options const & opt = {})
    {
        return extract_entities(materialise(parse(src).result), opt);
    }
}

inline bool nodes_are_read_in_file_order()
{
    auto data = entities_fixture::extract();

    EXPECT(data.nodes.size() == 3, "duplicate and id-less rows should be skipped");
    EXPECT(data.nodes[0].id == "a" && data.nodes[1].id == "b" && data.nodes[2].id == "e", "file order expected");
    EXPECT(data.find_node("a")->pos == vec3{}, "first definition of a duplicate wins");
    EXPECT((data.find_node("b")->pos == vec3{ 1, 0.5, 0 }), "position should be read from the columns");
    EXPECT(data.find_node("b")->part_origin == "p", "owning part should be recorded");
    EXPECT(data.find_node("nope") == nullptr, "unknown id should not be found");

    return true;
}

inline bool expression_coordinates_are_kept()
{
    auto data = entities_fixture::extract();
    auto e = data.find_node("e");

    EXPECT(e != nullptr, "node with an expression should be read");
    EXPECT(e->pos_expr[0] == "=$w", "expression text should be kept");
    EXPECT(e->pos.x == 0.0, "unevaluated expression reads as zero");

    sync_options opt;
    opt.evaluate_expression = [](std::string_view) -> std::optional<double> { return 0.75; };
    auto evaluated = entities_fixture::extract(opt);
    EXPECT(evaluated.find_node("e")->pos.x == 0.75, "evaluation hook should provide the value");

    return true;
}

inline bool rows_keep_their_ordinal()
{
    auto data = entities_fixture::extract();

    EXPECT(data.parts.contains("q"), "parts without tables are still listed");

    auto const & p = data.parts.at("p");
    EXPECT(p.beams.size() == 2, "short beam row should be skipped");
    EXPECT(p.beams[0].index == 1 && p.beams[1].index == 3, "index counts array rows after the header");
    EXPECT(p.beams[1].ids == (std::vector<std::string>{ "b", "e" }), "reference columns should be read");
    EXPECT(p.triangles.size() == 1 && p.triangles[0].ids.size() == 3, "triangle should be read");
    EXPECT(p.quads.empty(), "no quads in the part");

    return true;
}

inline bool header_names_columns()
{
    auto tree = materialise(parse(R"([["posX", "id", "posY", "posZ"], ["x", 1, 2, 3]])").result);
    auto header = read_header(tree);

    EXPECT(header.id_column() == 1, "id column should be found by name");
    EXPECT(header.position_column(0) == 0, "posX column should be found by name");
    EXPECT(header.reference_columns().empty(), "node tables have no reference columns");

    auto beams = read_header(materialise(parse(R"([["id1:", "id2:", "note"]])").result));
    EXPECT(beams.reference_columns() == (std::vector<size_t>{ 0, 1 }), "columns ending in ':' are references");

    return true;
}

inline bool actions_merge_with_global()
{
    actions_set set;
    set.global.nodes_to_delete.insert("x");
    set.part("p").beams_to_delete.insert(2);
    set.part("q").nodes_to_move["y"] = { 1, 2, 3 };

    auto p = set.for_part("p");
    EXPECT(p.nodes_to_delete.contains("x"), "global deletions reach every part");
    EXPECT(p.beams_to_delete.contains(2), "part actions are kept");
    EXPECT(p.nodes_to_move.empty(), "other parts' actions do not leak");
    EXPECT(set.structural(), "deletions are structural");

    actions_set moves;
    moves.part("q").nodes_to_move["y"] = { 1, 2, 3 };
    EXPECT(!moves.empty() && !moves.structural(), "moves alone are not structural");

    EXPECT(actions_set{}.empty(), "fresh set should be empty");

    return true;
}

inline void run_entities_tests()
{
    SUBCAT("Extraction");
    RUN_TEST(nodes_are_read_in_file_order);
    RUN_TEST(expression_coordinates_are_kept);
    RUN_TEST(rows_keep_their_ordinal);
    RUN_TEST(header_names_columns);
    SUBCAT("Actions");
    RUN_TEST(actions_merge_with_global);
}

}

#endif
