#include "include/jbsync.hpp"
#include <iostream>

// Example part: a small frame with one triangle
const char* example_jbeam = R"({
    "frame": {
        "information": {
            "authors": "example",
            "name": "Frame",
        },
        "slotType": "frame",
        "nodes": [
            ["id", "posX", "posY", "posZ"],
            {"nodeWeight": 2.5},
            ["f1l", 0.5, 0.0, 0.25],
            ["f1r", -0.5, 0.0, 0.25],
            ["f2", 0.0, 1.0, 0.25], // nose
            ["f3l", 0.5, 2.0, 0.25],
        ],
        "beams": [
            ["id1:", "id2:"],
            {"beamSpring": 4000000, "beamDamp": 100},
            ["f1l", "f1r"],
            ["f1l", "f2"],
            ["f1r", "f2"],
            ["f2", "f3l"],
        ],
        "triangles": [
            ["id1:", "id2:", "id3:"],
            ["f1l", "f1r", "f2"],
        ],
    },
}
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

// Snapshot as an importer would build it from the text
jbsync::geometry_snapshot import_snapshot()
{
    jbsync::geometry_snapshot snap;
    snap.parts = { "frame" };
    snap.vertices = {
        { "f1l", "f1l", false, "frame", { 0.5, 0.0, 0.25 } },
        { "f1r", "f1r", false, "frame", { -0.5, 0.0, 0.25 } },
        { "f2",  "f2",  false, "frame", { 0.0, 1.0, 0.25 } },
        { "f3l", "f3l", false, "frame", { 0.5, 2.0, 0.25 } },
    };
    snap.edges = {
        { 0, 1, "frame", "1" },
        { 0, 2, "frame", "2" },
        { 1, 2, "frame", "3" },
        { 2, 3, "frame", "4" },
    };
    snap.faces = { { { 0, 1, 2 }, 1, "frame" } };
    return snap;
}

void show(jbsync::cycle_result const & r)
{
    static char const * names[] = { "committed", "unchanged", "pending confirmation", "blocked", "parse failed", "aborted" };
    std::cout << "status: " << names[static_cast<int>(r.status)]
              << (r.reimport_needed ? " (reimport needed)" : "") << "\n";
    if (r.status == jbsync::cycle_status::committed)
        std::cout << r.text;
}

void test_move_and_rename(std::string & text)
{
    print_separator("TEST 1: Move and rename a node");

    jbsync::editor_context ctx;
    jbsync::sync_session session({}, ctx);

    std::vector<jbsync::geometry_snapshot> snaps { import_snapshot() };
    snaps[0].vertices[2].current_id = "nose";
    snaps[0].vertices[2].position.y = 1.25;

    auto r = session.export_cycle(text, snaps);
    show(r);
    if (r.status == jbsync::cycle_status::committed)
        text = r.text;
}

void test_symmetrical_add(std::string & text)
{
    print_separator("TEST 2: New node mirrored from an existing one");

    jbsync::sync_options opt;
    opt.id_seed = 42;

    jbsync::editor_context ctx;
    jbsync::sync_session session(opt, ctx);

    std::vector<jbsync::geometry_snapshot> snaps { import_snapshot() };
    auto & snap = snaps[0];
    snap.vertices[2].current_id = snap.vertices[2].original_id = "nose";
    snap.vertices[2].position.y = 1.25;

    // Right side copy of f3l, wired to the nose
    snap.vertices.push_back({ "TEMP_0", "TEMP_0", true, "frame", { -0.5, 2.0, 0.25 } });
    snap.add_edge(2, 4, "frame");

    auto r = session.export_cycle(text, snaps);
    show(r);
    if (r.status == jbsync::cycle_status::committed)
        text = r.text;
}

void test_collision()
{
    print_separator("TEST 3: New node on top of an existing one");

    jbsync::editor_context ctx;
    jbsync::sync_session session({}, ctx);

    std::string text = example_jbeam;
    std::vector<jbsync::geometry_snapshot> snaps { import_snapshot() };
    snaps[0].vertices.push_back({ "TEMP_1", "TEMP_1", true, "frame", { 0.5, 0.0, 0.25 } });
    snaps[0].add_edge(3, 4, "frame");

    auto r = session.export_cycle(text, snaps);
    show(r);
    for (auto const & req : r.requests)
        std::cout << "  '" << req.display_name << "' collides with '" << req.collided_existing_id << "'\n";

    session.resolve(jbsync::gate_decision::delete_placeholders, snaps);
    std::cout << "after merge: " << snaps[0].vertices.size() << " vertices, export requested: "
              << std::boolalpha << ctx.export_requested << "\n";

    show(session.export_cycle(text, snaps));
}

int main()
{
    jbsync::log::init();

    std::string text = example_jbeam;
    test_move_and_rename(text);
    test_symmetrical_add(text);
    test_collision();

    return 0;
}
