// jbsync_geometry.hpp - JBeam Sync - Geometry Snapshots
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_GEOMETRY_HPP
#define JBSYNC_GEOMETRY_HPP

#include "jbsync_core.hpp"

#include <cstdio>
#include <optional>
#include <random>

namespace jbsync
{
//========================================================================
// Snapshot elements
//========================================================================

    struct vertex
    {
        std::string current_id;
        std::string original_id;
        bool        is_placeholder {false};  // created this session, no durable id yet
        std::string origin_table;            // owning part
        vec3        position;
        bool        is_fake {false};         // waiting for confirmation
    };

    // Row index markers of an edge
    inline constexpr std::string_view NEW_ROW = "-1";
    inline constexpr std::string_view NO_ROW  = "";

    struct edge
    {
        size_t      v1;
        size_t      v2;
        std::string origin_table;
        std::string row_indices;    // "1,4" | "-1" (new) | "" (not a beam)
    };

    struct face
    {
        std::vector<size_t> verts;
        int         row_index {0};  // 0 not a row | -1 new | n
        std::string origin_table;
        bool        flip {false};
    };

//========================================================================
// Geometry snapshot
//========================================================================

    // The editor's weakly identified vertex/edge/face graph for one or
    // more parts of a document
    struct geometry_snapshot
    {
        std::vector<std::string> parts;     // first entry receives new rows
        std::vector<vertex> vertices;
        std::vector<edge>   edges;
        std::vector<face>   faces;

        bool covers(std::string_view part) const
        {
            return std::find(parts.begin(), parts.end(), part) != parts.end();
        }

        std::string const & active_part() const
        {
            static std::string const none;
            return parts.empty() ? none : parts.front();
        }

        // Part of a vertex, or the active part when it has none
        std::string const & part_of(vertex const & v) const
        {
            return v.origin_table.empty() ? active_part() : v.origin_table;
        }

        std::optional<size_t> find_vertex(std::string_view current_id) const
        {
            for (size_t i = 0; i < vertices.size(); ++i)
                if (vertices[i].current_id == current_id) return i;
            return std::nullopt;
        }

        bool has_edge(size_t a, size_t b) const
        {
            for (auto const & e : edges)
                if ((e.v1 == a && e.v2 == b) || (e.v1 == b && e.v2 == a)) return true;
            return false;
        }

        // New connectivity is flagged as a row to add
        void add_edge(size_t a, size_t b, std::string origin)
        {
            edges.push_back({ a, b, std::move(origin), std::string(NEW_ROW) });
        }

        bool has_face(std::vector<size_t> const & verts) const
        {
            auto key = verts;
            std::sort(key.begin(), key.end());
            for (auto const & f : faces)
            {
                auto other = f.verts;
                std::sort(other.begin(), other.end());
                if (other == key) return true;
            }
            return false;
        }

        void remove_vertex(size_t index);
    };

//---------------------------------------------------------------------------

    inline void geometry_snapshot::remove_vertex(size_t index)
    {
        if (index >= vertices.size()) return;

        auto touches = [index](size_t v) { return v == index; };
        auto shift = [index](size_t & v) { if (v > index) --v; };

        std::erase_if(edges, [&](edge const & e) { return touches(e.v1) || touches(e.v2); });
        std::erase_if(faces, [&](face const & f) { return std::any_of(f.verts.begin(), f.verts.end(), touches); });

        for (auto & e : edges)
        {
            shift(e.v1);
            shift(e.v2);
        }
        for (auto & f : faces)
            for (auto & v : f.verts)
                shift(v);

        vertices.erase(vertices.begin() + static_cast<std::ptrdiff_t>(index));
    }

//========================================================================
// Random identifiers
//========================================================================

    // xorshift64* generator; identifiers are rendered in uuid4 layout
    class id_generator
    {
    public:
        id_generator() { seed(std::random_device{}() | (uint64_t(std::random_device{}()) << 32)); }
        explicit id_generator(uint64_t s) { seed(s); }

        void seed(uint64_t s)
        {
            // Must be non-zero for xorshift
            state_ = s == 0 ? 0x9E3779B97F4A7C15ULL : s;
        }

        uint64_t next()
        {
            uint64_t x = state_;
            x ^= x >> 12;
            x ^= x << 25;
            x ^= x >> 27;
            state_ = x;
            return x * 2685821657736338717ULL;
        }

        std::string next_id()
        {
            uint64_t hi = next();
            uint64_t lo = next();

            // version 4, variant 10xx
            hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
            lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

            char buf[40];
            std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
            return buf;
        }

    private:
        uint64_t state_ {0x9E3779B97F4A7C15ULL};
    };

} // namespace jbsync

#endif
