// jbsync_reconciler.hpp - JBeam Sync - Entity Reconciler
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_RECONCILER_HPP
#define JBSYNC_RECONCILER_HPP

#include "jbsync_entities.hpp"
#include "jbsync_geometry.hpp"

#include <charconv>
#include <map>
#include <set>

namespace jbsync
{
//========================================================================
// Reconciliation results
//========================================================================

    // Where an original node ends up after the cycle
    struct node_state
    {
        std::string current_id;
        vec3        pos;
        std::string part_origin;
    };

    // A new vertex sitting on an existing node
    struct confirmation_request
    {
        std::string placeholder_id;
        std::string display_name;
        vec3        position;
        std::string collided_existing_id;
    };

    // Placeholder id -> existing id it collided with
    using remap_table = std::map<std::string, std::string>;

    enum class reconcile_warning_kind
    {
        duplicate_vertex,       // second vertex claiming the same node
        unnamed_vertex,         // vertex waiting for confirmation
        skipped_edge,
        skipped_face,
        dangling_reference      // kept row references a deleted node
    };

    using reconcile_warning = error<reconcile_warning_kind>;

    struct reconcile_result
    {
        actions_set actions;
        std::map<std::string, node_state> node_states;     // keyed by original id
        std::vector<confirmation_request> requests;
    };

    using reconcile_context = context<reconcile_result, reconcile_warning>;

//========================================================================
// Reconciler
//========================================================================

    // Diffs one geometry snapshot against the original entity tables.
    // Vertices are renamed in place as they receive durable ids; collided
    // placeholders are marked fake and entered into `remap`.
    class reconciler
    {
    public:
        reconciler(
            entity_data const & originals,
            sync_options const & opt,
            identifier_scheme const & scheme,
            id_generator & ids,
            remap_table & remap ) noexcept
            : originals_(originals)
            , opt_(opt)
            , scheme_(scheme)
            , ids_(ids)
            , remap_(remap)
        {}

        reconcile_context reconcile(geometry_snapshot & snap);

    private:
        entity_data const &       originals_;
        sync_options const &      opt_;
        identifier_scheme const & scheme_;
        id_generator &            ids_;
        remap_table &             remap_;
    };

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        enum class vertex_role
        {
            existing,       // represents an original node
            symmetric,      // mirrored copy of an original node
            anomaly,        // real vertex unknown to the originals
            placeholder,
            fake
        };

        inline std::vector<size_t> parse_row_indices(std::string_view text)
        {
            std::vector<size_t> out;
            while (!text.empty())
            {
                size_t comma = text.find(',');
                auto item = trim_sv(text.substr(0, comma));

                long long n = 0;
                auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), n);
                if (ec == std::errc() && ptr == item.data() + item.size() && n > 0)
                    out.push_back(static_cast<size_t>(n));

                if (comma == std::string_view::npos) break;
                text.remove_prefix(comma + 1);
            }
            return out;
        }

        struct reconcile_impl
        {
            entity_data const &       originals;
            sync_options const &      opt;
            identifier_scheme const & scheme;
            id_generator &            ids;
            remap_table &             remap;
            geometry_snapshot &       snap;

            reconcile_context ctx {};

            std::vector<vertex_role> roles;
            std::map<size_t, std::string> mirror_sources;   // symmetric vertex -> source node
            std::set<std::string> claimed;
            std::set<std::string> deleted;
            std::map<std::string, std::string> final_ids;   // original -> current
            std::map<std::string, vec3> current_pos;        // original -> current
            std::set<std::string> used_ids;
            std::vector<std::pair<std::string, vec3>> accepted;

            void warn(reconcile_warning_kind kind, std::string message)
            {
                log::warn("{}", message);
                ctx.errors.push_back({ kind, {}, std::move(message) });
            }

            entity_actions & part_actions(std::string const & part) { return ctx.result.actions.part(part); }

            // Renames and deletions reach every part when references are affected
            entity_actions & scoped_actions(std::string const & part)
            {
                return opt.affect_node_references ? ctx.result.actions.global : part_actions(part);
            }

            vec3 position_of(node_entry const & node) const
            {
                auto it = current_pos.find(node.id);
                return it == current_pos.end() ? node.pos : it->second;
            }

            std::string final_id(std::string const & original) const
            {
                auto it = final_ids.find(original);
                return it == final_ids.end() ? original : it->second;
            }

            void run();
            void claim_pass();
            void rename_counterparts();
            void queue_deletions();
            void naming_pass();
            void name_placeholder(vertex & v);
            void reconcile_beams();
            void reconcile_faces();

            std::optional<std::string> find_mirror(vec3 const & pos) const;
            std::optional<std::pair<std::string, vec3>> find_collision(vec3 const & pos) const;
            std::optional<std::string> endpoint_id(vertex const & v) const;
            bool is_face_side(size_t a, size_t b) const;
        };

//---------------------------------------------------------------------------

        inline void reconcile_impl::run()
        {
            claim_pass();
            if (opt.rename_symmetrical_counterpart)
                rename_counterparts();
            queue_deletions();
            naming_pass();
            reconcile_beams();
            reconcile_faces();
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::claim_pass()
        {
            double collision_sq = opt.collision_tolerance * opt.collision_tolerance;

            std::set<std::string> carried;
            for (auto const & v : snap.vertices)
                if (!v.is_placeholder && !v.is_fake)
                    carried.insert(v.original_id);

            roles.assign(snap.vertices.size(), vertex_role::existing);
            std::set<std::string> standard;

            for (size_t i = 0; i < snap.vertices.size(); ++i)
            {
                auto & v = snap.vertices[i];
                if (v.is_fake)        { roles[i] = vertex_role::fake; continue; }
                if (v.is_placeholder) { roles[i] = vertex_role::placeholder; continue; }

                auto orig = originals.find_node(v.original_id);
                if (!orig) { roles[i] = vertex_role::anomaly; continue; }

                // A symmetrize leaves the source id on the mirrored copy
                bool moved = length_squared(v.position - orig->pos) > collision_sq;
                if (moved && near(v.position, mirrored(orig->pos), opt.mirror_tolerance))
                {
                    auto c = scheme.counterpart(v.original_id);
                    if (c && *c != v.original_id)
                    {
                        claimed.insert(v.original_id);

                        if (!originals.find_node(*c))
                        {
                            roles[i] = vertex_role::symmetric;
                            mirror_sources[i] = v.original_id;
                            v.original_id = *c;
                            v.current_id = *c;
                            continue;
                        }
                        if (carried.contains(*c))
                        {
                            roles[i] = vertex_role::placeholder;
                            v.is_placeholder = true;
                            continue;
                        }
                        v.original_id = *c;
                        v.current_id = *c;
                        orig = originals.find_node(*c);
                    }
                }

                if (!standard.insert(v.original_id).second)
                {
                    warn(reconcile_warning_kind::duplicate_vertex,
                        "second vertex for node '" + v.original_id + "'; treated as new");
                    roles[i] = vertex_role::placeholder;
                    v.is_placeholder = true;
                    continue;
                }

                claimed.insert(v.original_id);
                final_ids[v.original_id] = v.current_id;
                current_pos[v.original_id] = v.position;
            }
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::rename_counterparts()
        {
            std::vector<std::pair<std::string, std::string>> primary;
            for (size_t i = 0; i < snap.vertices.size(); ++i)
            {
                auto const & v = snap.vertices[i];
                if (roles[i] == vertex_role::existing && v.current_id != v.original_id)
                    primary.emplace_back(v.original_id, v.current_id);
            }

            for (auto const & [was, now] : primary)
            {
                auto from = scheme.counterpart(was);
                auto to = scheme.counterpart(now);
                if (!from || !to || *from == *to) continue;

                // A counterpart renamed by hand keeps its own name
                auto it = final_ids.find(*from);
                if (it == final_ids.end() || it->second != *from) continue;

                it->second = *to;
                for (size_t i = 0; i < snap.vertices.size(); ++i)
                    if (roles[i] == vertex_role::existing && snap.vertices[i].original_id == *from)
                        snap.vertices[i].current_id = *to;

                log::debug("counterpart rename {} -> {}", *from, *to);
            }
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::queue_deletions()
        {
            for (auto const & node : originals.nodes)
            {
                if (claimed.contains(node.id) || !snap.covers(node.part_origin))
                    continue;

                deleted.insert(node.id);
                scoped_actions(node.part_origin).nodes_to_delete.insert(node.id);
            }

            for (auto const & node : originals.nodes)
                if (!deleted.contains(node.id))
                    used_ids.insert(final_id(node.id));
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::naming_pass()
        {
            double collision_sq = opt.collision_tolerance * opt.collision_tolerance;

            for (size_t i = 0; i < snap.vertices.size(); ++i)
            {
                auto & v = snap.vertices[i];

                switch (roles[i])
                {
                    case vertex_role::existing:
                    {
                        auto orig = originals.find_node(v.original_id);
                        auto const & part = orig->part_origin;

                        if (length_squared(v.position - orig->pos) > collision_sq)
                            part_actions(part).nodes_to_move[v.original_id] = v.position;
                        if (v.current_id != v.original_id)
                            scoped_actions(part).nodes_to_rename[v.original_id] = v.current_id;

                        ctx.result.node_states[v.original_id] = { v.current_id, v.position, part };
                        break;
                    }

                    case vertex_role::symmetric:
                        part_actions(snap.part_of(v)).nodes_to_add_symmetrically[v.current_id] =
                            { mirror_sources[i], v.position };
                        used_ids.insert(v.current_id);
                        accepted.emplace_back(v.current_id, v.position);
                        break;

                    case vertex_role::anomaly:
                    {
                        if (v.current_id.empty() || used_ids.contains(v.current_id))
                        {
                            name_placeholder(v);
                            break;
                        }

                        auto mirror = scheme.enabled() ? find_mirror(v.position) : std::nullopt;
                        auto & acts = part_actions(snap.part_of(v));
                        if (mirror)
                            acts.nodes_to_add_symmetrically[v.current_id] = { *mirror, v.position };
                        else
                            acts.nodes_to_add[v.current_id] = v.position;

                        v.original_id = v.current_id;
                        used_ids.insert(v.current_id);
                        accepted.emplace_back(v.current_id, v.position);
                        break;
                    }

                    case vertex_role::placeholder:
                        name_placeholder(v);
                        break;

                    case vertex_role::fake:
                        warn(reconcile_warning_kind::unnamed_vertex,
                            "vertex '" + v.current_id + "' is waiting for confirmation; skipped");
                        break;
                }
                v.is_placeholder = false;
            }
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::name_placeholder(vertex & v)
        {
            auto mirror = scheme.enabled() ? find_mirror(v.position) : std::nullopt;

            std::string random = ids.next_id();
            std::string uuid_name = scheme.enabled()
                ? scheme.qualify(scheme.affix_for_x(v.position.x, opt.mirror_tolerance), random)
                : random;

            std::string display = uuid_name;
            if (mirror)
                if (auto m = scheme.counterpart(final_id(*mirror)); m && !used_ids.contains(*m))
                    display = *m;

            if (auto hit = find_collision(v.position))
            {
                v.current_id = uuid_name;
                v.original_id = uuid_name;
                v.is_fake = true;
                remap[uuid_name] = hit->first;
                ctx.result.requests.push_back({ uuid_name, display, hit->second, hit->first });
                log::info("new node at ({}, {}, {}) collides with '{}'; confirmation needed",
                    v.position.x, v.position.y, v.position.z, hit->first);
                return;
            }

            v.current_id = display;
            v.original_id = display;
            used_ids.insert(display);
            accepted.emplace_back(display, v.position);

            auto & acts = part_actions(snap.part_of(v));
            if (mirror)
                acts.nodes_to_add_symmetrically[display] = { *mirror, v.position };
            else
                acts.nodes_to_add[display] = v.position;
        }

//---------------------------------------------------------------------------

        // Returns the source row id as written in the file; renames of this
        // cycle are applied by the caller
        inline std::optional<std::string> reconcile_impl::find_mirror(vec3 const & pos) const
        {
            vec3 target = mirrored(pos);
            for (auto const & node : originals.nodes)
            {
                if (deleted.contains(node.id)) continue;
                if (near(position_of(node), target, opt.mirror_tolerance))
                    return node.id;
            }
            return std::nullopt;
        }

//---------------------------------------------------------------------------

        // Existing nodes report their final id; new nodes of this cycle
        // their accepted name
        inline std::optional<std::pair<std::string, vec3>> reconcile_impl::find_collision(vec3 const & pos) const
        {
            double collision_sq = opt.collision_tolerance * opt.collision_tolerance;

            for (auto const & node : originals.nodes)
            {
                if (deleted.contains(node.id)) continue;
                vec3 at = position_of(node);
                if (length_squared(at - pos) < collision_sq)
                    return std::make_pair(final_id(node.id), at);
            }
            for (auto const & [id, at] : accepted)
                if (length_squared(at - pos) < collision_sq)
                    return std::make_pair(id, at);

            return std::nullopt;
        }

//---------------------------------------------------------------------------

        inline std::optional<std::string> reconcile_impl::endpoint_id(vertex const & v) const
        {
            if (!v.is_fake)
                return v.current_id.empty() ? std::nullopt : std::optional<std::string>(v.current_id);

            auto it = remap.find(v.current_id);
            if (it == remap.end()) return std::nullopt;
            return it->second;
        }

//---------------------------------------------------------------------------

        inline bool reconcile_impl::is_face_side(size_t a, size_t b) const
        {
            for (auto const & f : snap.faces)
            {
                size_t n = f.verts.size();
                for (size_t k = 0; k < n; ++k)
                {
                    size_t p = f.verts[k];
                    size_t q = f.verts[(k + 1) % n];
                    if ((p == a && q == b) || (p == b && q == a)) return true;
                }
            }
            return false;
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::reconcile_beams()
        {
            std::map<std::string, std::set<id_pair>> original_pairs;
            for (auto const & part : snap.parts)
                if (auto it = originals.parts.find(part); it != originals.parts.end())
                    for (auto const & row : it->second.beams)
                        original_pairs[part].emplace(row.ids[0], row.ids[1]);

            std::map<std::string, std::set<size_t>> kept;

            for (auto & e : snap.edges)
            {
                if (e.v1 >= snap.vertices.size() || e.v2 >= snap.vertices.size())
                {
                    warn(reconcile_warning_kind::skipped_edge, "edge references a missing vertex; skipped");
                    continue;
                }

                auto const & a = snap.vertices[e.v1];
                auto const & b = snap.vertices[e.v2];
                auto id_a = endpoint_id(a);
                auto id_b = endpoint_id(b);
                if (!id_a || !id_b || *id_a == *id_b)
                    continue;

                std::string part = e.origin_table.empty() ? snap.active_part() : e.origin_table;
                id_pair now(*id_a, *id_b);

                if (e.row_indices == NEW_ROW)
                {
                    part_actions(part).beams_to_add.insert(now);
                    continue;
                }

                if (e.row_indices == NO_ROW)
                {
                    // Sides of faces are not beams
                    if (!is_face_side(e.v1, e.v2))
                        part_actions(part).beams_to_add.insert(now);
                    continue;
                }

                auto indices = parse_row_indices(e.row_indices);
                id_pair was(a.original_id, b.original_id);

                if (indices.empty() || !original_pairs[part].contains(was))
                {
                    part_actions(part).beams_to_add.insert(now);
                    e.row_indices = std::string(NEW_ROW);
                    e.origin_table = part;
                    continue;
                }
                kept[part].insert(indices.begin(), indices.end());
            }

            for (auto const & part : snap.parts)
            {
                auto it = originals.parts.find(part);
                if (it == originals.parts.end()) continue;

                for (auto const & row : it->second.beams)
                {
                    bool any_deleted = deleted.contains(row.ids[0]) || deleted.contains(row.ids[1]);

                    if ((opt.affect_node_references && any_deleted) || (!any_deleted && !kept[part].contains(row.index)))
                        part_actions(part).beams_to_delete.insert(row.index);
                    else if (any_deleted)
                        warn(reconcile_warning_kind::dangling_reference,
                            "part '" + part + "': beam " + std::to_string(row.index) + " references a deleted node");
                }
            }
        }

//---------------------------------------------------------------------------

        inline void reconcile_impl::reconcile_faces()
        {
            std::map<std::string, std::set<size_t>> kept_tris;
            std::map<std::string, std::set<size_t>> kept_quads;

            for (auto const & f : snap.faces)
            {
                size_t n = f.verts.size();
                if (n < 3) continue;
                if (n > 4)
                {
                    warn(reconcile_warning_kind::skipped_face, "face with 5 or more vertices is not exported");
                    continue;
                }

                std::string part = f.origin_table.empty() ? snap.active_part() : f.origin_table;
                bool tri = n == 3;

                if (f.row_index == 0)
                    continue;

                if (f.row_index < 0)
                {
                    id_tuple ids_now;
                    for (size_t v : f.verts)
                    {
                        auto id = v < snap.vertices.size() ? endpoint_id(snap.vertices[v]) : std::nullopt;
                        if (!id) break;
                        ids_now.push_back(*id);
                    }

                    auto sorted = ids_now;
                    std::sort(sorted.begin(), sorted.end());
                    bool degenerate = std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end();

                    if (ids_now.size() != n || degenerate)
                    {
                        warn(reconcile_warning_kind::skipped_face, "new face with unresolved or repeated nodes; skipped");
                        continue;
                    }

                    auto & acts = part_actions(part);
                    (tri ? acts.tris_to_add : acts.quads_to_add).insert(std::move(ids_now));
                    continue;
                }

                size_t index = static_cast<size_t>(f.row_index);
                (tri ? kept_tris : kept_quads)[part].insert(index);
                if (f.flip)
                {
                    auto & acts = part_actions(part);
                    (tri ? acts.tris_flipped : acts.quads_flipped).insert(index);
                }
            }

            for (auto const & part : snap.parts)
            {
                auto it = originals.parts.find(part);
                if (it == originals.parts.end()) continue;

                for (auto kind : { table_kind::triangles, table_kind::quads })
                {
                    auto & kept = (kind == table_kind::triangles ? kept_tris : kept_quads)[part];

                    for (auto const & row : it->second.of(kind))
                    {
                        bool any_deleted = std::any_of(row.ids.begin(), row.ids.end(),
                            [&](std::string const & id) { return deleted.contains(id); });

                        if ((opt.affect_node_references && any_deleted) || (!any_deleted && !kept.contains(row.index)))
                        {
                            auto & acts = part_actions(part);
                            (kind == table_kind::triangles ? acts.tris_to_delete : acts.quads_to_delete).insert(row.index);
                        }
                        else if (any_deleted)
                            warn(reconcile_warning_kind::dangling_reference,
                                "part '" + part + "': " + std::string(section_name(kind)) + " row "
                                + std::to_string(row.index) + " references a deleted node");
                    }
                }
            }
        }
    }

//---------------------------------------------------------------------------

    inline reconcile_context reconciler::reconcile(geometry_snapshot & snap)
    {
        detail::reconcile_impl impl { originals_, opt_, scheme_, ids_, remap_, snap };
        impl.run();

        log::debug("reconciled {} vertices, {} edges, {} faces; {} confirmation request(s)",
            snap.vertices.size(), snap.edges.size(), snap.faces.size(), impl.ctx.result.requests.size());

        return std::move(impl.ctx);
    }

} // namespace jbsync

#endif
