// jbsync_session.hpp - JBeam Sync - Export Session
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_SESSION_HPP
#define JBSYNC_SESSION_HPP

#include "jbsync_table_editor.hpp"
#include "jbsync_reconciler.hpp"
#include "jbsync_gate.hpp"

#include <span>

namespace jbsync
{
//========================================================================
// Editor context
//========================================================================

    // Per-document state that outlives a single export cycle. Owned by the
    // caller and handed to the session by reference.
    struct editor_context
    {
        remap_table                remap;
        confirmation_gate          gate;
        id_generator               ids;
        std::optional<entity_data> last_good;       // tables of the last parsed text
        bool                       export_requested {false};

        void reset_cycle() { remap.clear(); }
    };

//========================================================================
// Export cycle
//========================================================================

    enum class cycle_status
    {
        committed,
        unchanged,
        pending_confirmation,
        blocked,                // gate is waiting for a decision
        parse_failed,
        aborted                 // table edit failed; text left as it was
    };

    struct cycle_result
    {
        cycle_status status;
        std::string  text;                  // new text on commit, the input otherwise
        bool         reimport_needed {false};
        std::vector<confirmation_request> requests;
        edit_summary summary;
    };

    class sync_session
    {
    public:
        sync_session(sync_options opt, editor_context & ctx);

        sync_options const & options() const noexcept { return opt_; }
        identifier_scheme const & scheme() const noexcept { return scheme_; }

        // Reconciles the snapshots against `text` and patches it. Snapshots
        // are only written back when the cycle commits, finds nothing to do
        // or stops for confirmation.
        cycle_result export_cycle(std::string_view text, std::span<geometry_snapshot> snapshots);

        // Resolves a pending confirmation and asks for one more cycle
        void resolve(gate_decision decision, std::span<geometry_snapshot> snapshots);

    private:
        sync_options      opt_;
        identifier_scheme scheme_;
        editor_context &  ctx_;
    };

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        // Renames, moves and flips on the current value tree; the patcher
        // carries them into the tokens
        struct tree_update_impl
        {
            value & tree;
            entity_data const & originals;
            reconcile_result const & changes;
            sync_options const & opt;

            bool moved(std::string const & part, std::string const & id) const
            {
                auto it = changes.actions.parts.find(part);
                return it != changes.actions.parts.end() && it->second.nodes_to_move.contains(id);
            }

            void set_coordinate(value & cell, node_entry const & node, size_t axis, double now)
            {
                if (cell.is_number())
                {
                    cell = static_cast<double>(static_cast<float>(now));
                    return;
                }
                if (!cell.is_string()) return;

                double delta = now - node.pos[axis];
                if (std::abs(delta) <= EXPRESSION_OFFSET_EPSILON) return;

                if (opt.offset_expression)
                    cell = opt.offset_expression(*cell.as_string(), static_cast<double>(static_cast<float>(delta)));
                else
                    log::warn("node '{}': coordinate {} is an expression; move not written", node.id, *cell.as_string());
            }

            void update_nodes(std::string const & part, value & section)
            {
                auto header = read_header(section);
                size_t id_col = header.id_column();
                bool header_seen = false;

                for (auto & row : *section.as_array())
                {
                    if (!row.is_array()) continue;
                    if (!header_seen) { header_seen = true; continue; }

                    auto id_cell = row.at(id_col);
                    if (!id_cell || !id_cell->is_string()) continue;

                    std::string id = *id_cell->as_string();
                    auto state = changes.node_states.find(id);
                    auto node = originals.find_node(id);

                    // Rows of a node defined in another part are left alone
                    if (state == changes.node_states.end() || state->second.part_origin != part || !node)
                        continue;

                    if (moved(part, id))
                        for (size_t axis = 0; axis < 3; ++axis)
                            if (auto cell = row.at(header.position_column(axis)))
                                set_coordinate(*cell, *node, axis, state->second.pos[axis]);

                    if (state->second.current_id != id)
                        *id_cell = state->second.current_id;
                }
            }

            static void rename_refs(value & v, std::map<std::string, std::string> const & renames)
            {
                if (auto s = v.as_string())
                {
                    if (auto it = renames.find(*s); it != renames.end())
                        v = it->second;
                }
                else if (auto a = v.as_array())
                {
                    for (auto & item : *a)
                        rename_refs(item, renames);
                }
                else if (auto o = v.as_object())
                {
                    for (auto & m : *o)
                        rename_refs(m.val, renames);
                }
            }

            static void flip_rows(value & section, std::set<size_t> const & rows, size_t a, size_t b)
            {
                auto refs = read_header(section).reference_columns();
                size_t col_a = a < refs.size() ? refs[a] : a;
                size_t col_b = b < refs.size() ? refs[b] : b;

                size_t ordinal = 0;
                for (auto & row : *section.as_array())
                {
                    if (!row.is_array()) continue;
                    if (ordinal++ == 0 || !rows.contains(ordinal - 1)) continue;

                    auto cells = row.as_array();
                    if (col_a < cells->size() && col_b < cells->size())
                        std::swap((*cells)[col_a], (*cells)[col_b]);
                }
            }

            void run()
            {
                auto parts = tree.as_object();
                if (!parts) return;

                auto const & renames = changes.actions.global.nodes_to_rename;

                for (auto & part : *parts)
                {
                    auto sections = part.val.as_object();
                    if (!sections) continue;

                    auto acts = changes.actions.for_part(part.key);

                    for (auto & section : *sections)
                    {
                        if (!section.val.is_array()) continue;

                        if (section.key == "nodes")
                            update_nodes(part.key, section.val);
                        else if (section.key != "slots" && opt.affect_node_references && !renames.empty())
                            rename_refs(section.val, renames);

                        if (section.key == "triangles" && !acts.tris_flipped.empty())
                            flip_rows(section.val, acts.tris_flipped, 1, 2);
                        else if (section.key == "quads" && !acts.quads_flipped.empty())
                            flip_rows(section.val, acts.quads_flipped, 1, 3);
                    }
                }
            }
        };

//---------------------------------------------------------------------------

        inline std::string join_indices(std::vector<size_t> const & indices)
        {
            std::string out;
            for (size_t i : indices)
            {
                if (!out.empty()) out += ',';
                out += std::to_string(i);
            }
            return out;
        }

        // Makes the snapshot's ids durable, snaps positions to the numbers
        // the text holds and points edges and faces at their rows
        inline void rebind(geometry_snapshot & snap, entity_data const & fresh)
        {
            for (auto & v : snap.vertices)
            {
                if (v.is_fake) continue;

                v.original_id = v.current_id;
                v.is_placeholder = false;

                // Written numbers carry at most 4 decimals
                if (auto node = fresh.find_node(v.current_id))
                    for (size_t axis = 0; axis < 3; ++axis)
                        if (!node->pos_expr[axis])
                            v.position[axis] = node->pos[axis];
            }

            std::map<std::string, std::map<id_pair, std::vector<size_t>>> beams;
            std::map<std::string, std::map<id_tuple, size_t>> faces;

            for (auto const & part : snap.parts)
            {
                auto it = fresh.parts.find(part);
                if (it == fresh.parts.end()) continue;

                for (auto const & row : it->second.beams)
                    beams[part][id_pair(row.ids[0], row.ids[1])].push_back(row.index);

                for (auto kind : { table_kind::triangles, table_kind::quads })
                    for (auto const & row : it->second.of(kind))
                    {
                        auto key = row.ids;
                        std::sort(key.begin(), key.end());
                        faces[part].emplace(std::move(key), row.index);
                    }
            }

            for (auto & e : snap.edges)
            {
                e.row_indices = std::string(NO_ROW);
                if (e.v1 >= snap.vertices.size() || e.v2 >= snap.vertices.size()) continue;

                id_pair key(snap.vertices[e.v1].current_id, snap.vertices[e.v2].current_id);
                std::string part = e.origin_table.empty() ? snap.active_part() : e.origin_table;

                std::vector<size_t> const * rows = nullptr;
                if (auto it = beams.find(part); it != beams.end())
                    if (auto r = it->second.find(key); r != it->second.end())
                        rows = &r->second;

                // Beam moved to another covered part
                if (!rows)
                {
                    for (auto const & [name, table] : beams)
                    {
                        if (auto r = table.find(key); r != table.end())
                        {
                            rows = &r->second;
                            part = name;
                            break;
                        }
                    }
                }
                if (!rows) continue;

                e.row_indices = join_indices(*rows);
                e.origin_table = part;
            }

            for (auto & f : snap.faces)
            {
                f.flip = false;
                f.row_index = 0;

                id_tuple key;
                for (size_t v : f.verts)
                    if (v < snap.vertices.size())
                        key.push_back(snap.vertices[v].current_id);
                std::sort(key.begin(), key.end());

                for (auto & [name, rows] : faces)
                {
                    if (auto it = rows.find(key); it != rows.end())
                    {
                        f.row_index = static_cast<int>(it->second);
                        f.origin_table = name;
                        break;
                    }
                }
            }
        }
    }

//---------------------------------------------------------------------------

    inline sync_session::sync_session(sync_options opt, editor_context & ctx)
        : opt_(std::move(opt))
        , ctx_(ctx)
    {
        auto made = identifier_scheme::make(opt_.naming);
        for (auto const & e : made.errors)
            log::warn("{}", e.message);
        scheme_ = std::move(made.result);

        if (opt_.id_seed)
            ctx_.ids.seed(*opt_.id_seed);
    }

//---------------------------------------------------------------------------

    inline cycle_result sync_session::export_cycle(std::string_view text, std::span<geometry_snapshot> snapshots)
    {
        cycle_result out { cycle_status::unchanged, std::string(text) };

        if (ctx_.gate.pending())
        {
            log::warn("export refused while {} confirmation(s) are pending", ctx_.gate.requests().size());
            out.status = cycle_status::blocked;
            out.requests = ctx_.gate.requests();
            return out;
        }
        ctx_.export_requested = false;

        auto parsed = parse(text);
        if (parsed.has_errors())
        {
            for (auto const & e : parsed.errors)
                log::error("parse error at {}:{}: {}", e.loc.line, e.loc.column, e.message);
            out.status = cycle_status::parse_failed;
            return out;
        }

        document doc = std::move(parsed.result);
        value baseline = materialise(doc);
        value current = baseline;
        ctx_.last_good = extract_entities(baseline, opt_);
        entity_data const & originals = *ctx_.last_good;

        // Work on copies; the caller's snapshots only change on success
        std::vector<geometry_snapshot> work(snapshots.begin(), snapshots.end());
        reconcile_result changes;

        for (auto & snap : work)
        {
            reconciler r(originals, opt_, scheme_, ctx_.ids, ctx_.remap);
            auto rc = r.reconcile(snap);

            changes.actions.merge(rc.result.actions);
            changes.node_states.merge(rc.result.node_states);
            changes.requests.insert(changes.requests.end(), rc.result.requests.begin(), rc.result.requests.end());
        }

        if (!changes.requests.empty())
        {
            std::copy(work.begin(), work.end(), snapshots.begin());
            ctx_.gate.enter(changes.requests);
            out.status = cycle_status::pending_confirmation;
            out.requests = std::move(changes.requests);
            return out;
        }

        detail::tree_update_impl update { current, originals, changes, opt_ };
        update.run();

        auto edited = apply_part_actions(doc, baseline, current, changes.actions, scheme_, opt_);
        if (edited.has_errors())
        {
            for (auto const & e : edited.errors)
                log::error("{}", e.message);
            ctx_.reset_cycle();
            out.status = cycle_status::aborted;
            return out;
        }
        out.summary = edited.result;

        std::string written = stringify(doc);
        if (written != text)
        {
            out.status = cycle_status::committed;
            out.text = std::move(written);
            out.reimport_needed = changes.actions.structural();

            auto reparsed = parse(out.text);
            if (!reparsed.has_errors())
                ctx_.last_good = extract_entities(materialise(reparsed.result), opt_);

            log::info("export committed: {} value(s) patched, {} row(s) added, {} row(s) deleted, {} section(s) created, {} duplicate(s) commented out",
                out.summary.values_patched, out.summary.rows_added, out.summary.rows_deleted, out.summary.sections_created,
                out.summary.members_commented);
        }

        for (auto & snap : work)
            detail::rebind(snap, *ctx_.last_good);
        std::copy(work.begin(), work.end(), snapshots.begin());

        ctx_.reset_cycle();
        return out;
    }

//---------------------------------------------------------------------------

    inline void sync_session::resolve(gate_decision decision, std::span<geometry_snapshot> snapshots)
    {
        if (!ctx_.gate.pending())
            return;

        ctx_.gate.resolve(decision, snapshots, ctx_.remap);
        ctx_.export_requested = true;
    }

} // namespace jbsync

#endif
