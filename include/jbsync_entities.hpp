// jbsync_entities.hpp - JBeam Sync - Entity Tables and Actions
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_ENTITIES_HPP
#define JBSYNC_ENTITIES_HPP

#include "jbsync_config.hpp"

#include <map>
#include <set>
#include <optional>

namespace jbsync
{
//========================================================================
// Known list-of-rows tables
//========================================================================

    enum class table_kind
    {
        nodes,
        beams,
        triangles,
        quads
    };

    inline std::string_view section_name(table_kind kind)
    {
        switch (kind)
        {
            case table_kind::nodes:     return "nodes";
            case table_kind::beams:     return "beams";
            case table_kind::triangles: return "triangles";
            case table_kind::quads:     return "quads";
        }
        return {};
    }

    inline std::optional<table_kind> table_from_name(std::string_view name)
    {
        if (name == "nodes")     return table_kind::nodes;
        if (name == "beams")     return table_kind::beams;
        if (name == "triangles") return table_kind::triangles;
        if (name == "quads")     return table_kind::quads;
        return std::nullopt;
    }

    // Number of node references in one row of the table
    inline size_t reference_count(table_kind kind)
    {
        switch (kind)
        {
            case table_kind::nodes:     return 1;
            case table_kind::beams:     return 2;
            case table_kind::triangles: return 3;
            case table_kind::quads:     return 4;
        }
        return 0;
    }

//========================================================================
// Section headers
//========================================================================

    // The first array entry of a section names its columns. Columns whose
    // name ends in ':' hold node references.
    struct section_header
    {
        std::vector<std::string> columns;

        std::optional<size_t> find(std::string_view name) const
        {
            for (size_t i = 0; i < columns.size(); ++i)
                if (columns[i] == name) return i;
            return std::nullopt;
        }

        std::vector<size_t> reference_columns() const
        {
            std::vector<size_t> out;
            for (size_t i = 0; i < columns.size(); ++i)
                if (!columns[i].empty() && columns[i].back() == ':')
                    out.push_back(i);
            return out;
        }

        // Column of the node id in a nodes section
        size_t id_column() const { return find("id").value_or(0); }

        size_t position_column(size_t axis) const
        {
            static constexpr std::string_view names[] = { "posX", "posY", "posZ" };
            return find(names[axis]).value_or(axis + 1);
        }
    };

    inline section_header read_header(value const & section)
    {
        section_header header;
        auto rows = section.as_array();
        if (!rows) return header;

        for (auto const & row : *rows)
        {
            auto cells = row.as_array();
            if (!cells) continue;

            for (auto const & cell : *cells)
                header.columns.push_back(cell.is_string() ? *cell.as_string() : std::string{});
            break;
        }
        return header;
    }

//========================================================================
// Original entity data
//========================================================================

    struct node_entry
    {
        std::string id;
        vec3        pos;
        std::string part_origin;
        // Source text of coordinates written as expressions
        std::array<std::optional<std::string>, 3> pos_expr;
    };

    struct row_entry
    {
        std::vector<std::string> ids;
        size_t      index;          // 1-based among the section's array rows
        std::string part_origin;
    };

    struct part_rows
    {
        std::vector<row_entry> beams;
        std::vector<row_entry> triangles;
        std::vector<row_entry> quads;

        std::vector<row_entry> const & of(table_kind kind) const
        {
            switch (kind)
            {
                case table_kind::triangles: return triangles;
                case table_kind::quads:     return quads;
                default:                    return beams;
            }
        }

        std::vector<row_entry> & of(table_kind kind)
        {
            return const_cast<std::vector<row_entry>&>(std::as_const(*this).of(kind));
        }
    };

    // Tables of the last synchronised text
    struct entity_data
    {
        std::vector<node_entry>       nodes;        // file order
        std::map<std::string, size_t> node_index;
        std::map<std::string, part_rows> parts;

        node_entry const * find_node(std::string_view id) const
        {
            auto it = node_index.find(std::string(id));
            return it == node_index.end() ? nullptr : &nodes[it->second];
        }
    };

    entity_data extract_entities(value const & tree, sync_options const & opt);

//========================================================================
// Entity actions
//========================================================================

    struct symmetrical_add
    {
        std::string mirror_source;
        vec3        pos;
    };

    using id_tuple = std::vector<std::string>;

    struct entity_actions
    {
        std::map<std::string, vec3>             nodes_to_add;
        std::set<std::string>                   nodes_to_delete;
        std::map<std::string, std::string>      nodes_to_rename;
        std::map<std::string, vec3>             nodes_to_move;
        std::map<std::string, symmetrical_add>  nodes_to_add_symmetrically;

        std::set<id_pair>   beams_to_add;
        std::set<size_t>    beams_to_delete;

        std::set<id_tuple>  tris_to_add;
        std::set<size_t>    tris_to_delete;
        std::set<size_t>    tris_flipped;

        std::set<id_tuple>  quads_to_add;
        std::set<size_t>    quads_to_delete;
        std::set<size_t>    quads_flipped;

        bool empty() const
        {
            return nodes_to_add.empty() && nodes_to_delete.empty() && nodes_to_rename.empty()
                && nodes_to_move.empty() && nodes_to_add_symmetrically.empty()
                && beams_to_add.empty() && beams_to_delete.empty()
                && tris_to_add.empty() && tris_to_delete.empty() && tris_flipped.empty()
                && quads_to_add.empty() && quads_to_delete.empty() && quads_flipped.empty();
        }

        // Rows are added or removed
        bool structural() const
        {
            return !nodes_to_add.empty() || !nodes_to_delete.empty() || !nodes_to_add_symmetrically.empty()
                || !beams_to_add.empty() || !beams_to_delete.empty()
                || !tris_to_add.empty() || !tris_to_delete.empty()
                || !quads_to_add.empty() || !quads_to_delete.empty();
        }

        std::set<size_t> const & rows_to_delete(table_kind kind) const
        {
            switch (kind)
            {
                case table_kind::triangles: return tris_to_delete;
                case table_kind::quads:     return quads_to_delete;
                default:                    return beams_to_delete;
            }
        }

        void merge(entity_actions const & other);
    };

    // Actions of every part plus the global set holding renames and
    // deletions that reach references in all parts
    struct actions_set
    {
        std::map<std::string, entity_actions> parts;
        entity_actions global;

        entity_actions & part(std::string const & name) { return parts[name]; }

        // Part actions merged with the global set
        entity_actions for_part(std::string const & name) const
        {
            entity_actions out;
            if (auto it = parts.find(name); it != parts.end())
                out = it->second;
            out.merge(global);
            return out;
        }

        bool empty() const
        {
            if (!global.empty()) return false;
            for (auto const & [name, a] : parts)
                if (!a.empty()) return false;
            return true;
        }

        bool structural() const
        {
            if (global.structural()) return true;
            for (auto const & [name, a] : parts)
                if (a.structural()) return true;
            return false;
        }

        void merge(actions_set const & other)
        {
            global.merge(other.global);
            for (auto const & [name, a] : other.parts)
                parts[name].merge(a);
        }
    };

//========================================================================
// Implementation
//========================================================================

    inline void entity_actions::merge(entity_actions const & other)
    {
        for (auto const & [k, v] : other.nodes_to_add) nodes_to_add.insert_or_assign(k, v);
        nodes_to_delete.insert(other.nodes_to_delete.begin(), other.nodes_to_delete.end());
        for (auto const & [k, v] : other.nodes_to_rename) nodes_to_rename.insert_or_assign(k, v);
        for (auto const & [k, v] : other.nodes_to_move) nodes_to_move.insert_or_assign(k, v);
        for (auto const & [k, v] : other.nodes_to_add_symmetrically) nodes_to_add_symmetrically.insert_or_assign(k, v);

        beams_to_add.insert(other.beams_to_add.begin(), other.beams_to_add.end());
        beams_to_delete.insert(other.beams_to_delete.begin(), other.beams_to_delete.end());

        tris_to_add.insert(other.tris_to_add.begin(), other.tris_to_add.end());
        tris_to_delete.insert(other.tris_to_delete.begin(), other.tris_to_delete.end());
        tris_flipped.insert(other.tris_flipped.begin(), other.tris_flipped.end());

        quads_to_add.insert(other.quads_to_add.begin(), other.quads_to_add.end());
        quads_to_delete.insert(other.quads_to_delete.begin(), other.quads_to_delete.end());
        quads_flipped.insert(other.quads_flipped.begin(), other.quads_flipped.end());
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        struct extractor_impl
        {
            sync_options const & opt;
            entity_data data;

            void read_nodes(std::string const & part, value const & section)
            {
                auto header = read_header(section);
                size_t id_col = header.id_column();
                bool header_seen = false;

                for (auto const & row : *section.as_array())
                {
                    auto cells = row.as_array();
                    if (!cells) continue;
                    if (!header_seen) { header_seen = true; continue; }

                    auto id = row.at(id_col);
                    if (!id || !id->is_string())
                    {
                        log::warn("part '{}': node row {} has no id; ignored", part, to_text(row));
                        continue;
                    }

                    node_entry node { *id->as_string(), {}, part, {} };
                    bool usable = true;

                    for (size_t axis = 0; axis < 3; ++axis)
                    {
                        auto cell = row.at(header.position_column(axis));
                        if (cell && cell->is_number())
                        {
                            node.pos[axis] = *cell->as_number();
                        }
                        else if (cell && cell->is_string())
                        {
                            node.pos_expr[axis] = *cell->as_string();
                            if (opt.evaluate_expression)
                                node.pos[axis] = opt.evaluate_expression(*cell->as_string()).value_or(0.0);
                        }
                        else
                            usable = false;
                    }

                    if (!usable)
                    {
                        log::warn("part '{}': node '{}' has no usable position; ignored", part, node.id);
                        continue;
                    }

                    if (data.node_index.contains(node.id))
                    {
                        log::warn("part '{}': duplicate node id '{}'; first definition kept", part, node.id);
                        continue;
                    }

                    data.node_index.emplace(node.id, data.nodes.size());
                    data.nodes.push_back(std::move(node));
                }
            }

            void read_rows(std::string const & part, table_kind kind, value const & section)
            {
                auto refs = read_header(section).reference_columns();
                auto & out = data.parts[part].of(kind);
                size_t index = 0;
                bool header_seen = false;

                for (auto const & row : *section.as_array())
                {
                    if (!row.is_array()) continue;
                    if (!header_seen) { header_seen = true; continue; }
                    ++index;

                    row_entry entry { {}, index, part };
                    for (size_t col : refs)
                    {
                        auto cell = row.at(col);
                        if (cell && cell->is_string())
                            entry.ids.push_back(*cell->as_string());
                    }

                    if (entry.ids.size() < reference_count(kind))
                    {
                        log::warn("part '{}': {} row {} has too few node references; ignored",
                            part, section_name(kind), index);
                        continue;
                    }
                    entry.ids.resize(reference_count(kind));
                    out.push_back(std::move(entry));
                }
            }
        };
    }

//---------------------------------------------------------------------------

    inline entity_data extract_entities(value const & tree, sync_options const & opt)
    {
        detail::extractor_impl impl { opt, {} };

        auto parts = tree.as_object();
        if (!parts) return std::move(impl.data);

        for (auto const & part : *parts)
        {
            auto sections = part.val.as_object();
            if (!sections) continue;

            impl.data.parts[part.key];

            for (auto const & section : *sections)
            {
                auto kind = table_from_name(section.key);
                if (!kind || !section.val.is_array()) continue;

                if (*kind == table_kind::nodes)
                    impl.read_nodes(part.key, section.val);
                else
                    impl.read_rows(part.key, *kind, section.val);
            }
        }
        return std::move(impl.data);
    }

} // namespace jbsync

#endif
