#ifndef JBSYNC_TESTS_SESSION__
#define JBSYNC_TESTS_SESSION__

#include "jbsync_test_harness.hpp"
#include "../include/jbsync_session.hpp"

namespace jbsync::tests
{
using namespace jbsync;

namespace session_fixture
{
    constexpr std::string_view src =
        "{\n"
        "\"p\": {\n"
        "    \"nodes\": [\n"
        "        [\"id\", \"posX\", \"posY\", \"posZ\"],\n"
        "        [\"a\", 0, 0, 0],\n"
        "        [\"b\", 1, 0, 0], // tip\n"
        "        [\"l_node\", 0.5, 1, 0],\n"
        "    ],\n"
        "    \"beams\": [\n"
        "        [\"id1:\", \"id2:\"],\n"
        "        [\"a\", \"b\"],\n"
        "        [\"a\", \"l_node\"],\n"
        "    ],\n"
        "    \"triangles\": [\n"
        "        [\"id1:\", \"id2:\", \"id3:\"],\n"
        "        [\"a\", \"b\", \"l_node\"],\n"
        "    ],\n"
        "},\n"
        "}\n";

    inline std::vector<geometry_snapshot> imported()
    {
        geometry_snapshot snap;
        snap.parts = { "p" };
        snap.vertices = {
            { "a", "a", false, "p", { 0, 0, 0 } },
            { "b", "b", false, "p", { 1, 0, 0 } },
            { "l_node", "l_node", false, "p", { 0.5, 1, 0 } },
        };
        snap.edges = {
            { 0, 1, "p", "1" },
            { 0, 2, "p", "2" },
        };
        snap.faces = { { { 0, 1, 2 }, 1, "p" } };
        return { snap };
    }

    inline std::string replaced(std::string text, std::string_view from, std::string_view to)
    {
        for (size_t at = text.find(from); at != std::string::npos; at = text.find(from, at + to.size()))
            text.replace(at, from.size(), to);
        return text;
    }

    inline sync_options seeded()
    {
        sync_options opt;
        opt.id_seed = 42;
        return opt;
    }
}

inline bool move_and_rename_commit()
{
    using namespace session_fixture;

    editor_context ctx;
    sync_session session(seeded(), ctx);

    auto snaps = imported();
    snaps[0].vertices[1].current_id = "b2";
    snaps[0].vertices[1].position.x = 1.25;

    auto r = session.export_cycle(src, snaps);

    EXPECT(r.status == cycle_status::committed, "edit should commit");
    EXPECT(!r.reimport_needed, "moves and renames need no reimport");

    std::string expected = replaced(std::string(src), "[\"b\", 1, 0, 0]", "[\"b2\", 1.25, 0, 0]");
    expected = replaced(expected, "\"b\"", "\"b2\"");
    EXPECT(r.text == expected, "node row and every reference should change, comment should stay");

    EXPECT(snaps[0].vertices[1].original_id == "b2", "snapshot should be rebound to the new id");
    EXPECT(ctx.last_good && ctx.last_good->find_node("b2"), "last good tables should follow the commit");

    auto again = session.export_cycle(r.text, snaps);
    EXPECT(again.status == cycle_status::unchanged, "second cycle should find nothing to do");
    EXPECT(again.text == r.text, "text should be returned as given");

    return true;
}

inline bool added_geometry_is_idempotent()
{
    using namespace session_fixture;

    editor_context ctx;
    sync_session session(seeded(), ctx);

    auto snaps = imported();
    snaps[0].vertices.push_back({ "TEMP", "TEMP", true, "p", { 0, 2, 0 } });
    snaps[0].add_edge(0, 3, "p");

    auto r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::committed, "add should commit");
    EXPECT(r.reimport_needed, "added rows need a reimport");
    EXPECT(r.summary.rows_added == 2, "node and beam rows expected");

    std::string const & id = snaps[0].vertices[3].current_id;
    EXPECT(id != "TEMP" && r.text.find("[\"" + id + "\", 0, 2, 0]") != std::string::npos, "node row should carry the new id");
    EXPECT(r.text.find("[\"a\",\"" + id + "\"]") != std::string::npos
        || r.text.find("[\"" + id + "\",\"a\"]") != std::string::npos, "beam row should be added");
    EXPECT(snaps[0].edges[2].row_indices == "3", "new edge should be bound to its row");

    auto again = session.export_cycle(r.text, snaps);
    EXPECT(again.status == cycle_status::unchanged, "second cycle should find nothing to do");

    return true;
}

inline bool fine_positions_settle_after_commit()
{
    using namespace session_fixture;

    sync_options opt = seeded();
    editor_context ctx;
    sync_session session(opt, ctx);

    auto snaps = imported();
    snaps[0].vertices[1].position.x = 1.23456;

    auto r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::committed, "move should commit");
    EXPECT(r.text.find("[\"b\", 1.2346, 0, 0]") != std::string::npos, "coordinate should be written with 4 decimals");
    EXPECT(snaps[0].vertices[1].position.x == 1.2346, "snapshot should hold the written value");

    auto fresh = extract_entities(materialise(parse(r.text).result), opt);
    auto scheme = identifier_scheme::make(opt.naming).result;
    id_generator ids {1};
    remap_table remap;
    auto copy = snaps[0];
    auto rc = reconciler(fresh, opt, scheme, ids, remap).reconcile(copy);
    EXPECT(rc.result.actions.empty(), "written geometry should reconcile to nothing");

    auto again = session.export_cycle(r.text, snaps);
    EXPECT(again.status == cycle_status::unchanged, "second cycle should find nothing to do");
    EXPECT(again.text == r.text, "text should be returned as given");

    return true;
}

inline bool mirror_follows_renamed_source()
{
    using namespace session_fixture;

    sync_options opt = seeded();
    opt.naming.position = affix_position::front;

    editor_context ctx;
    sync_session session(opt, ctx);

    auto snaps = imported();
    snaps[0].vertices[2].current_id = "l_tip";
    snaps[0].vertices.push_back({ "TEMP", "TEMP", true, "p", { -0.5, 1, 0 } });

    auto r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::committed, "edit should commit");
    EXPECT(snaps[0].vertices[3].current_id == "r_tip", "placeholder should mirror the new name");
    EXPECT(r.text.find("[\"l_tip\", 0.5, 1, 0],\n        [\"r_tip\", -0.5, 1, 0],") != std::string::npos,
        "mirrored row should follow its renamed source");
    EXPECT(r.text.find("ADDED NODES") == std::string::npos, "no marker for a mirrored row");

    return true;
}

inline bool flipped_face_swaps_references()
{
    using namespace session_fixture;

    editor_context ctx;
    sync_session session({}, ctx);

    auto snaps = imported();
    snaps[0].faces[0].flip = true;

    auto r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::committed, "flip should commit");
    EXPECT(r.text.find("[\"a\", \"l_node\", \"b\"]") != std::string::npos, "second and third reference should swap");
    EXPECT(!snaps[0].faces[0].flip && snaps[0].faces[0].row_index == 1, "face should be rebound unflipped");

    return true;
}

inline bool expression_moves_use_hook()
{
    constexpr std::string_view expr_src =
        "{\n"
        "\"p\": {\n"
        "    \"nodes\": [\n"
        "        [\"id\", \"posX\", \"posY\", \"posZ\"],\n"
        "        [\"e\", \"=$w\", 0, 0],\n"
        "    ],\n"
        "},\n"
        "}\n";

    auto moved = []
    {
        geometry_snapshot snap;
        snap.parts = { "p" };
        snap.vertices = { { "e", "e", false, "p", { 0.25, 0, 0 } } };
        return std::vector<geometry_snapshot>{ snap };
    };

    editor_context plain_ctx;
    sync_session plain({}, plain_ctx);
    auto snaps = moved();
    auto r = plain.export_cycle(expr_src, snaps);
    EXPECT(r.status == cycle_status::unchanged, "expression should be left alone without a hook");

    sync_options opt;
    opt.offset_expression = [](std::string_view expr, double delta)
    {
        return std::string(expr) + "+" + format_number(delta).text;
    };

    editor_context hooked_ctx;
    sync_session hooked(opt, hooked_ctx);
    snaps = moved();
    r = hooked.export_cycle(expr_src, snaps);
    EXPECT(r.status == cycle_status::committed, "hook should produce an edit");
    EXPECT(r.text.find("[\"e\", \"=$w+0.25\", 0, 0]") != std::string::npos, "offset should be folded into the expression");

    return true;
}

inline bool collision_waits_for_decision()
{
    using namespace session_fixture;

    editor_context ctx;
    sync_session session(seeded(), ctx);

    auto snaps = imported();
    snaps[0].vertices.push_back({ "TEMP", "TEMP", true, "p", { 1, 0, 0 } });
    snaps[0].add_edge(2, 3, "p");

    auto r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::pending_confirmation, "collision should stop the cycle");
    EXPECT(r.text == src, "text must not change while pending");
    EXPECT(r.requests.size() == 1 && r.requests[0].collided_existing_id == "b", "request should name b");
    EXPECT(ctx.gate.pending(), "gate should hold the request");
    EXPECT(snaps[0].vertices[3].is_fake, "snapshot should show the waiting vertex");

    auto blocked = session.export_cycle(src, snaps);
    EXPECT(blocked.status == cycle_status::blocked, "no cycle while pending");
    EXPECT(blocked.text == src, "blocked cycle returns the input");

    session.resolve(gate_decision::delete_placeholders, snaps);
    EXPECT(!ctx.gate.pending(), "gate should be idle after the decision");
    EXPECT(ctx.export_requested, "decision should ask for another cycle");
    EXPECT(ctx.remap.empty(), "remap should be cleared");
    EXPECT(snaps[0].vertices.size() == 3, "placeholder should be merged into b");

    auto merged = session.export_cycle(src, snaps);
    EXPECT(merged.status == cycle_status::committed, "merged edge should commit");
    EXPECT(merged.text.find("[\"b\",\"l_node\"]") != std::string::npos, "edge should now reach b");
    EXPECT(!ctx.export_requested, "request should be consumed");

    return true;
}

inline bool failures_leave_text_alone()
{
    using namespace session_fixture;

    editor_context ctx;
    sync_session session(seeded(), ctx);

    auto snaps = imported();
    std::string_view broken = "{ \"p\": [ }";
    auto r = session.export_cycle(broken, snaps);
    EXPECT(r.status == cycle_status::parse_failed, "broken text should not be exported");
    EXPECT(r.text == broken, "input should be returned");

    snaps[0].parts = { "ghost" };
    snaps[0].vertices.push_back({ "TEMP", "TEMP", true, "ghost", { 5, 5, 5 } });

    r = session.export_cycle(src, snaps);
    EXPECT(r.status == cycle_status::aborted, "unknown part should abort the cycle");
    EXPECT(r.text == src, "text must stay as it was");
    EXPECT(snaps[0].vertices[3].current_id == "TEMP", "snapshot must not change on abort");
    EXPECT(snaps[0].vertices[3].is_placeholder, "placeholder should still be new");

    return true;
}

inline void run_session_tests()
{
    SUBCAT("Export cycle");
    RUN_TEST(move_and_rename_commit);
    RUN_TEST(added_geometry_is_idempotent);
    RUN_TEST(fine_positions_settle_after_commit);
    RUN_TEST(mirror_follows_renamed_source);
    RUN_TEST(flipped_face_swaps_references);
    RUN_TEST(expression_moves_use_hook);
    SUBCAT("Confirmation and failure");
    RUN_TEST(collision_waits_for_decision);
    RUN_TEST(failures_leave_text_alone);
}

}

#endif
