// jbsync_gate.hpp - JBeam Sync - Confirmation Gate
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_GATE_HPP
#define JBSYNC_GATE_HPP

#include "jbsync_reconciler.hpp"

#include <span>

namespace jbsync
{
//========================================================================
// Confirmation gate
//========================================================================

    enum class gate_decision
    {
        delete_placeholders,    // merge each placeholder into the node it hit
        cancel                  // keep the placeholders as new nodes
    };

    // Holds collided placeholders until the user decides. While pending no
    // export cycle may run for the document.
    class confirmation_gate
    {
    public:
        bool pending() const noexcept { return pending_; }

        std::vector<confirmation_request> const & requests() const noexcept { return requests_; }

        void enter(std::vector<confirmation_request> requests)
        {
            requests_ = std::move(requests);
            pending_ = !requests_.empty();
        }

        // Applies the decision to every request and returns to idle. Edits
        // the snapshots holding the placeholders and drops their remap
        // entries.
        void resolve(gate_decision decision, std::span<geometry_snapshot> snapshots, remap_table & remap);

    private:
        bool pending_ {false};
        std::vector<confirmation_request> requests_;

        static void merge_into(geometry_snapshot & snap, size_t placeholder, size_t target);
    };

//========================================================================
// Implementation
//========================================================================

    inline void confirmation_gate::merge_into(geometry_snapshot & snap, size_t placeholder, size_t target)
    {
        std::string part = snap.part_of(snap.vertices[target]);

        // Reconnect edges
        std::vector<size_t> neighbours;
        for (auto const & e : snap.edges)
        {
            if (e.v1 == placeholder) neighbours.push_back(e.v2);
            else if (e.v2 == placeholder) neighbours.push_back(e.v1);
        }
        for (size_t n : neighbours)
        {
            if (n == target || n == placeholder || snap.has_edge(target, n)) continue;
            snap.add_edge(target, n, part);
        }

        // Reconnect faces
        std::vector<face> rebuilt;
        for (auto const & f : snap.faces)
        {
            if (std::find(f.verts.begin(), f.verts.end(), placeholder) == f.verts.end())
                continue;

            face copy { f.verts, -1, part, false };
            std::replace(copy.verts.begin(), copy.verts.end(), placeholder, target);

            auto sorted = copy.verts;
            std::sort(sorted.begin(), sorted.end());
            if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
                continue;   // collapsed onto the target
            if (snap.has_face(copy.verts))
                continue;

            rebuilt.push_back(std::move(copy));
        }
        snap.faces.insert(snap.faces.end(), rebuilt.begin(), rebuilt.end());

        snap.remove_vertex(placeholder);
    }

//---------------------------------------------------------------------------

    inline void confirmation_gate::resolve(gate_decision decision, std::span<geometry_snapshot> snapshots, remap_table & remap)
    {
        for (auto const & req : requests_)
        {
            geometry_snapshot * snap = nullptr;
            std::optional<size_t> placeholder;

            for (auto & s : snapshots)
            {
                if (auto i = s.find_vertex(req.placeholder_id); i && s.vertices[*i].is_fake)
                {
                    snap = &s;
                    placeholder = i;
                    break;
                }
            }

            remap.erase(req.placeholder_id);

            if (!snap)
            {
                log::warn("placeholder '{}' is no longer in the mesh", req.placeholder_id);
                continue;
            }

            auto & v = snap->vertices[*placeholder];

            if (decision == gate_decision::cancel)
            {
                v.is_fake = false;
                continue;
            }

            auto target = snap->find_vertex(req.collided_existing_id);
            if (!target || *target == *placeholder)
            {
                log::warn("node '{}' for placeholder '{}' not found; placeholder kept",
                    req.collided_existing_id, req.placeholder_id);
                v.is_fake = false;
                continue;
            }

            merge_into(*snap, *placeholder, *target);
            log::info("placeholder '{}' merged into '{}'", req.placeholder_id, req.collided_existing_id);
        }

        requests_.clear();
        pending_ = false;
    }

} // namespace jbsync

#endif
