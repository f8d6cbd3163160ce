#ifndef JBSYNC_TESTS_GATE__
#define JBSYNC_TESTS_GATE__

#include "jbsync_test_harness.hpp"
#include "../include/jbsync_gate.hpp"

namespace jbsync::tests
{
using namespace jbsync;

namespace gate_fixture
{
    // `fake` sits on `c` and shares a triangle with `a` and `d`
    inline geometry_snapshot collided()
    {
        geometry_snapshot snap;
        snap.parts = { "p" };
        snap.vertices = {
            { "a", "a", false, "p", { 0, 0, 0 } },
            { "c", "c", false, "p", { 1, 0, 0 } },
            { "fake", "fake", false, "p", { 1, 0, 0 }, true },
            { "d", "d", false, "p", { 0, 1, 0 } },
        };
        snap.edges = {
            { 0, 2, "p", "-1" },
            { 2, 3, "p", "-1" },
            { 1, 3, "p", "-1" },
        };
        snap.faces = {
            { { 0, 2, 3 }, -1, "p" },
            { { 1, 2, 3 }, -1, "p" },
        };
        return snap;
    }

    inline confirmation_request request(std::string target = "c")
    {
        return { "fake", "fake", { 1, 0, 0 }, std::move(target) };
    }
}

inline bool gate_blocks_until_resolved()
{
    confirmation_gate gate;
    EXPECT(!gate.pending(), "new gate should be idle");

    gate.enter({});
    EXPECT(!gate.pending(), "no requests, nothing to wait for");

    gate.enter({ gate_fixture::request() });
    EXPECT(gate.pending(), "requests should make the gate pending");
    EXPECT(gate.requests().size() == 1, "request should be held");

    return true;
}

inline bool delete_merges_into_target()
{
    std::vector<geometry_snapshot> snaps { gate_fixture::collided() };
    remap_table remap { { "fake", "c" } };

    confirmation_gate gate;
    gate.enter({ gate_fixture::request() });
    gate.resolve(gate_decision::delete_placeholders, snaps, remap);

    auto const & snap = snaps[0];
    EXPECT(!gate.pending() && gate.requests().empty(), "gate should return to idle");
    EXPECT(remap.empty(), "remap entry should be dropped");
    EXPECT(snap.vertices.size() == 3, "placeholder should be removed");
    EXPECT(!snap.find_vertex("fake").has_value(), "placeholder id should be gone");

    // a-fake becomes a-c; fake-d is already c-d
    EXPECT(snap.edges.size() == 2, "edges should be reconnected without duplicates");
    EXPECT(snap.has_edge(0, 1), "a should connect to c");
    EXPECT(snap.has_edge(1, 2), "c-d should remain");

    // a-fake-d becomes a-c-d; c-fake-d collapses
    EXPECT(snap.faces.size() == 1, "collapsed face should be dropped");
    EXPECT((snap.faces[0].verts == std::vector<size_t>{ 0, 1, 2 }), "face should use the target");
    EXPECT(snap.faces[0].row_index == -1, "rebuilt face is a new row");

    return true;
}

inline bool cancel_keeps_placeholders()
{
    std::vector<geometry_snapshot> snaps { gate_fixture::collided() };
    remap_table remap { { "fake", "c" } };

    confirmation_gate gate;
    gate.enter({ gate_fixture::request() });
    gate.resolve(gate_decision::cancel, snaps, remap);

    EXPECT(!gate.pending(), "gate should return to idle");
    EXPECT(remap.empty(), "remap entry should be dropped");
    EXPECT(snaps[0].vertices.size() == 4, "placeholder should stay");
    EXPECT(!snaps[0].vertices[2].is_fake, "placeholder should be an ordinary vertex again");

    return true;
}

inline bool missing_target_keeps_placeholder()
{
    std::vector<geometry_snapshot> snaps { gate_fixture::collided() };
    remap_table remap { { "fake", "gone" } };

    confirmation_gate gate;
    gate.enter({ gate_fixture::request("gone") });
    gate.resolve(gate_decision::delete_placeholders, snaps, remap);

    EXPECT(!gate.pending(), "gate should return to idle");
    EXPECT(snaps[0].vertices.size() == 4, "nothing to merge into");
    EXPECT(!snaps[0].vertices[2].is_fake, "placeholder should be kept as a vertex");

    snaps[0].remove_vertex(2);
    gate.enter({ gate_fixture::request() });
    gate.resolve(gate_decision::delete_placeholders, snaps, remap);
    EXPECT(!gate.pending(), "vanished placeholder still clears the gate");

    return true;
}

inline void run_gate_tests()
{
    SUBCAT("Confirmation");
    RUN_TEST(gate_blocks_until_resolved);
    RUN_TEST(delete_merges_into_target);
    RUN_TEST(cancel_keeps_placeholders);
    RUN_TEST(missing_target_keeps_placeholder);
}

}

#endif
