// jbsync_table_editor.hpp - JBeam Sync - Table Editor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_TABLE_EDITOR_HPP
#define JBSYNC_TABLE_EDITOR_HPP

#include "jbsync_patcher.hpp"
#include "jbsync_entities.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace jbsync
{
//========================================================================
// Row formatting
//========================================================================

    inline std::string_view added_marker(table_kind kind)
    {
        switch (kind)
        {
            case table_kind::nodes:     return "//ADDED NODES BY EDITOR//";
            case table_kind::beams:     return "//ADDED BEAMS BY EDITOR//";
            case table_kind::triangles: return "//ADDED TRIANGLES BY EDITOR//";
            case table_kind::quads:     return "//ADDED QUADS BY EDITOR//";
        }
        return {};
    }

    // Builds `["id", x, y, z]` for nodes, `["a","b"]` style rows otherwise
    inline document make_row(table_kind kind, std::span<std::string const> ids, vec3 const * pos = nullptr)
    {
        std::string_view sep = kind == table_kind::nodes ? ", " : ",";
        document row;
        bool first = true;

        auto cell = [&](token t)
        {
            if (!first) row.push_back(make_wsc(sep));
            first = false;
            row.push_back(std::move(t));
        };

        row.push_back(make_punct(token_kind::array_open));
        for (auto const & id : ids)
            cell(make_string(id));
        if (pos)
            for (size_t axis = 0; axis < 3; ++axis)
                cell(make_number((*pos)[axis]));
        row.push_back(make_punct(token_kind::array_close));
        return row;
    }

    inline document make_header(table_kind kind)
    {
        std::vector<std::string> names;
        switch (kind)
        {
            case table_kind::nodes:     names = { "id", "posX", "posY", "posZ" }; break;
            case table_kind::beams:     names = { "id1:", "id2:" }; break;
            case table_kind::triangles: names = { "id1:", "id2:", "id3:" }; break;
            case table_kind::quads:     names = { "id1:", "id2:", "id3:", "id4:" }; break;
        }
        return make_row(kind, names);
    }

//========================================================================
// Table editor
//========================================================================

    enum class table_edit_error_kind
    {
        missing_section_boundary,   // part or section cannot be located
        malformed_section           // table section is not a list of rows
    };

    using table_edit_error = error<table_edit_error_kind>;

    struct edit_summary
    {
        size_t values_patched   {0};
        size_t rows_deleted     {0};
        size_t rows_added       {0};
        size_t sections_created {0};
        size_t members_commented {0};
    };

    using edit_context = context<edit_summary, table_edit_error>;

    // Token-level row surgery inside list-of-rows sections. Every primitive
    // leaves no two adjacent wsc tokens behind.
    class table_editor
    {
    public:
        explicit table_editor(document& doc) noexcept
            : doc_(doc)
        {}

        // Removes the row spanning [open, close] together with its comma
        // and line
        void delete_row(size_t open, size_t close);

        // Appends rows before the section's closing bracket behind the
        // section's marker comment, writing the marker once. Returns the new
        // index of the closing bracket.
        size_t append_rows(size_t section_close, table_kind kind, std::span<document const> rows);

        // Inserts rows directly after the row [open, close], indented like
        // it. Returns the index following the inserted tokens.
        size_t insert_after_row(size_t open, size_t close, std::span<document const> rows);

        // Writes an empty section with its header row after the member value
        // ending at `anchor`. Returns the indices of the section brackets.
        std::pair<size_t, size_t> append_section(size_t anchor, table_kind kind);

        // Copy of the row [open, close] with the given cells replaced
        document derive_row(size_t open, size_t close, std::map<size_t, token> const & cells) const;

        // Wraps the member [first, last] in a block comment
        void comment_out(size_t first, size_t last);

    private:
        document& doc_;

        void merge_wsc(size_t i);
        size_t matching_open(size_t close) const;
    };

    // Patches scalars from `current` and applies the row edits of every
    // part in one pass over the document. On error the document is left
    // half-patched and must be discarded.
    edit_context apply_part_actions(
        document& doc,
        value const & baseline,
        value const & current,
        actions_set const & actions,
        identifier_scheme const & scheme,
        sync_options const & opt );

//========================================================================
// Editor implementation
//========================================================================

    inline void table_editor::merge_wsc(size_t i)
    {
        if (i + 1 >= doc_.size()) return;
        if (!is_wsc(doc_[i]) || !is_wsc(doc_[i + 1])) return;

        doc_[i].text += doc_[i + 1].text;
        doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(i + 1));
    }

//---------------------------------------------------------------------------

    inline size_t table_editor::matching_open(size_t close) const
    {
        int depth = 0;
        for (size_t k = close + 1; k-- > 0;)
        {
            if (is_close(doc_[k])) ++depth;
            else if (is_open(doc_[k]) && --depth == 0) return k;
        }
        return 0;
    }

//---------------------------------------------------------------------------

    inline void table_editor::delete_row(size_t open, size_t close)
    {
        constexpr auto npos = std::string::npos;

        bool shares_left = !(open > 0 && is_wsc(doc_[open - 1]) && doc_[open - 1].text.find('\n') != npos);
        bool shares_right = true;
        bool erase_next = false;

        if (close + 1 < doc_.size() && is_wsc(doc_[close + 1]))
        {
            auto & next = doc_[close + 1].text;
            size_t nl = next.find('\n');
            if (nl == npos)
                erase_next = true;
            else
            {
                shares_right = false;
                // A sibling on the row's line keeps the line break
                next.erase(0, shares_left ? nl : nl + 1);
                erase_next = next.empty();
            }
        }

        // Alone on its line: drop the indent as well
        if (!shares_left && !shares_right)
        {
            auto & prev = doc_[open - 1].text;
            prev.erase(prev.rfind('\n') + 1);
        }

        size_t last = erase_next ? close + 2 : close + 1;
        doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(open), doc_.begin() + static_cast<std::ptrdiff_t>(last));

        if (open > 0)
            merge_wsc(open - 1);
    }

//---------------------------------------------------------------------------

    inline size_t table_editor::append_rows(size_t section_close, table_kind kind, std::span<document const> rows)
    {
        constexpr auto npos = std::string::npos;
        if (rows.empty()) return section_close;

        std::string_view marker = added_marker(kind);
        size_t section_open = matching_open(section_close);

        bool has_marker = false;
        for (size_t k = section_open; k < section_close && !has_marker; ++k)
            has_marker = is_wsc(doc_[k]) && doc_[k].text.find(marker) != npos;

        // Split the closing whitespace: `head` stays on the last line (and
        // takes the marker), `tail` carries the line break before ']'
        std::string head;
        std::string tail(detail::NL_INDENT);
        size_t at = section_close;

        if (section_close > 0 && is_wsc(doc_[section_close - 1]))
        {
            at = section_close - 1;
            std::string const & ws = doc_[at].text;

            size_t m = ws.find(marker);
            size_t split = m != npos ? ws.find('\n', m + marker.size()) : ws.find('\n');
            if (split == npos)
                head = ws;
            else
            {
                head = ws.substr(0, split);
                tail = ws.substr(split);
            }
            doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(at));
        }

        if (!has_marker)
        {
            head += '\n';
            head += detail::NL_TWO_INDENT;
            head += marker;
        }

        document out;
        std::string lead = std::move(head);
        for (auto const & row : rows)
        {
            lead += detail::NL_TWO_INDENT;
            out.push_back(make_wsc(lead));
            out.insert(out.end(), row.begin(), row.end());
            lead = ",";
        }
        out.push_back(make_wsc(lead + tail));

        doc_.insert(doc_.begin() + static_cast<std::ptrdiff_t>(at), out.begin(), out.end());
        return at + out.size();
    }

//---------------------------------------------------------------------------

    inline size_t table_editor::insert_after_row(size_t open, size_t close, std::span<document const> rows)
    {
        constexpr auto npos = std::string::npos;
        if (rows.empty()) return close + 1;

        std::string indent(detail::NL_TWO_INDENT);
        if (open > 0 && is_wsc(doc_[open - 1]))
        {
            auto const & ws = doc_[open - 1].text;
            if (size_t nl = ws.rfind('\n'); nl != npos)
                indent = ws.substr(nl);
        }

        size_t at = close + 1;
        std::string head = ",";
        std::string tail;

        if (at < doc_.size() && is_wsc(doc_[at]))
        {
            std::string const & ws = doc_[at].text;
            size_t nl = ws.find('\n');
            head = ws.substr(0, nl);
            if (nl != npos)
                tail = ws.substr(nl);
            doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(at));
        }

        if (tail.empty())
        {
            bool section_end = at < doc_.size() && doc_[at].kind == token_kind::array_close;
            tail = section_end ? std::string(detail::NL_INDENT) : indent;
        }

        document out;
        std::string lead = std::move(head);
        for (auto const & row : rows)
        {
            out.push_back(make_wsc(lead + indent));
            out.insert(out.end(), row.begin(), row.end());
            lead = ",";
        }
        out.push_back(make_wsc(lead + tail));

        doc_.insert(doc_.begin() + static_cast<std::ptrdiff_t>(at), out.begin(), out.end());
        return at + out.size();
    }

//---------------------------------------------------------------------------

    inline std::pair<size_t, size_t> table_editor::append_section(size_t anchor, table_kind kind)
    {
        size_t at = anchor + 1;
        std::string head;
        std::string tail = "\n";

        if (at < doc_.size() && is_wsc(doc_[at]))
        {
            std::string const & ws = doc_[at].text;
            size_t nl = ws.find('\n');
            head = ws.substr(0, nl);
            if (nl != std::string::npos)
                tail = ws.substr(nl);
            doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(at));
        }

        document out;
        out.push_back(make_wsc(head + std::string(detail::NL_INDENT)));
        out.push_back(make_string(section_name(kind)));
        out.push_back(make_punct(token_kind::colon));
        size_t open = at + out.size();
        out.push_back(make_punct(token_kind::array_open));
        out.push_back(make_wsc(detail::NL_TWO_INDENT));

        auto header = make_header(kind);
        out.insert(out.end(), header.begin(), header.end());

        out.push_back(make_wsc("," + std::string(detail::NL_INDENT)));
        size_t close = at + out.size();
        out.push_back(make_punct(token_kind::array_close));
        out.push_back(make_wsc("," + tail));

        doc_.insert(doc_.begin() + static_cast<std::ptrdiff_t>(at), out.begin(), out.end());
        return { open, close };
    }

//---------------------------------------------------------------------------

    inline void table_editor::comment_out(size_t first, size_t last)
    {
        std::string text = "/*" + stringify(doc_, first, last + 1) + "*/";

        doc_.erase(doc_.begin() + static_cast<std::ptrdiff_t>(first), doc_.begin() + static_cast<std::ptrdiff_t>(last + 1));
        doc_.insert(doc_.begin() + static_cast<std::ptrdiff_t>(first), make_wsc(text));

        merge_wsc(first);
        if (first > 0)
            merge_wsc(first - 1);
    }

//---------------------------------------------------------------------------

    inline document table_editor::derive_row(size_t open, size_t close, std::map<size_t, token> const & cells) const
    {
        document out(doc_.begin() + static_cast<std::ptrdiff_t>(open), doc_.begin() + static_cast<std::ptrdiff_t>(close + 1));

        int depth = 0;
        size_t column = 0;
        for (auto & t : out)
        {
            if (is_open(t))
            {
                if (depth == 1) ++column;
                ++depth;
            }
            else if (is_close(t))
                --depth;
            else if (depth == 1 && is_scalar(t))
            {
                if (auto it = cells.find(column); it != cells.end())
                    t = it->second;
                ++column;
            }
        }
        return out;
    }

//========================================================================
// Part action planning
//========================================================================

    namespace detail
    {
        struct planned_edit
        {
            enum class op { delete_row, insert_after, append_rows, add_sections, comment_out };

            op     what;
            size_t at;      // original index the edit is ordered by
            size_t open;
            size_t close;
            table_kind kind {table_kind::nodes};
            std::vector<document> rows;
            std::vector<std::pair<table_kind, std::vector<document>>> sections;
        };

        // Key tokens of parts, sections and section-level object members
        // overridden by a later duplicate
        inline std::set<size_t> shadowed_members(document const & doc)
        {
            structural_path path;
            std::map<std::string, size_t> last;
            std::set<size_t> shadowed;

            for (size_t i = 0; i < doc.size(); ++i)
            {
                if (path.step(doc[i]) != path_event::key || path.depth() > 2)
                    continue;

                auto where = describe(path.frames(), decode_string(doc[i].text));
                auto [it, fresh] = last.try_emplace(where, i);
                if (!fresh)
                {
                    shadowed.insert(it->second);
                    it->second = i;
                }
            }
            return shadowed;
        }

        struct table_planner_impl
        {
            document & doc;
            value const & baseline;
            value const & current;
            actions_set const & actions;
            identifier_scheme const & scheme;
            sync_options const & opt;

            edit_context ctx {};
            std::vector<planned_edit> edits;
            std::set<std::string> parts_seen;

            struct part_walk
            {
                std::string name;
                entity_actions acts;
                size_t open;
                std::optional<size_t> last_member_end;
                std::set<table_kind> present;
                std::set<table_kind> malformed;
                std::map<std::string, symmetrical_add> pending_symmetric;
                std::set<id_pair> pending_beams;
            };

            struct section_walk
            {
                std::string key;
                std::optional<table_kind> kind;
                value const * tree;
                std::optional<size_t> id_column;
                std::array<size_t, 3> pos_columns;
                std::vector<size_t> refs;
                size_t array_rows {0};
            };

            std::optional<part_walk> part;
            std::optional<section_walk> section;
            size_t row_open {0};
            bool row_is_array {false};

            void run();

            void open_part(std::string const & name, size_t i);
            void close_part();
            void open_section(std::string const & key, token const & t);
            void close_section(size_t i);
            void close_row(size_t index, size_t i);

            std::vector<document> rows_to_append(table_kind kind, bool section_exists);
            void plan_symmetric_nodes(std::string const & id, size_t i);
            void plan_symmetric_beam(value const & row, size_t i);
        };

//---------------------------------------------------------------------------

        inline void table_planner_impl::run()
        {
            auto shadowed = shadowed_members(doc);
            structural_path path;

            bool shadow = false;
            size_t shadow_depth = 0;
            size_t shadow_start = 0;
            std::string shadow_where;

            for (size_t i = 0; i < doc.size(); ++i)
            {
                auto ev = path.step(doc[i]);
                if (ev == path_event::none || ev == path_event::colon)
                    continue;

                if (shadow)
                {
                    bool done = (ev == path_event::scalar || ev == path_event::close) && path.depth() == shadow_depth;
                    if (done)
                    {
                        shadow = false;
                        if (part && shadow_depth == 1)
                            part->last_member_end = i;

                        // A nested "*/" would end the comment early
                        bool closes_comment = std::any_of(doc.begin() + static_cast<std::ptrdiff_t>(shadow_start),
                            doc.begin() + static_cast<std::ptrdiff_t>(i + 1),
                            [](token const & t) { return t.text.find("*/") != std::string::npos; });

                        if (closes_comment)
                            log::warn("duplicate key {}; earlier definition holds a block comment and is left in place",
                                shadow_where);
                        else
                        {
                            log::warn("duplicate key {}; earlier definition commented out", shadow_where);
                            edits.push_back({ planned_edit::op::comment_out, shadow_start, shadow_start, i });
                        }
                    }
                    continue;
                }

                if (ev == path_event::key)
                {
                    if (shadowed.contains(i))
                    {
                        shadow_where = describe(path.frames(), decode_string(doc[i].text));
                        shadow = true;
                        shadow_depth = path.depth();
                        shadow_start = i;
                    }
                    continue;
                }

                auto frames = path.frames();

                if (ev == path_event::scalar)
                {
                    if (!is_slots_path(frames) && patch_leaf(baseline, current, frames, path.slot(), doc[i]))
                        ++ctx.result.values_patched;
                    if (part && frames.size() == 1)
                        part->last_member_end = i;
                    continue;
                }

                if (ev == path_event::open)
                {
                    if (frames.size() == 1 && frames[0].parent_is_object && doc[i].kind == token_kind::object_open)
                        open_part(std::get<std::string>(frames[0].key), i);
                    else if (frames.size() == 2 && part)
                        open_section(std::get<std::string>(frames[1].key), doc[i]);
                    else if (frames.size() == 3 && section)
                    {
                        row_open = i;
                        row_is_array = doc[i].kind == token_kind::array_open;
                        if (row_is_array) ++section->array_rows;
                    }
                    continue;
                }

                // close
                auto const & popped = path.popped();
                if (!popped) continue;

                if (path.depth() == 2 && section)
                    close_row(std::get<size_t>(popped->key), i);
                else if (path.depth() == 1 && part)
                    close_section(i);
                else if (path.depth() == 0 && part)
                    close_part();
            }

            for (auto const & [name, acts] : actions.parts)
            {
                bool adds = !acts.nodes_to_add.empty() || !acts.nodes_to_add_symmetrically.empty()
                    || !acts.beams_to_add.empty() || !acts.tris_to_add.empty() || !acts.quads_to_add.empty();
                if (adds && !parts_seen.contains(name))
                    ctx.errors.push_back({ table_edit_error_kind::missing_section_boundary, {},
                        "part '" + name + "' not found in document" });
            }
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::open_part(std::string const & name, size_t i)
        {
            parts_seen.insert(name);

            auto acts = actions.for_part(name);
            if (acts.empty())
                return;

            part_walk p { name, std::move(acts), i, std::nullopt, {}, {}, {}, {} };
            p.pending_symmetric = p.acts.nodes_to_add_symmetrically;
            p.pending_beams = p.acts.beams_to_add;
            part = std::move(p);
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::open_section(std::string const & key, token const & t)
        {
            auto kind = table_from_name(key);

            if (t.kind != token_kind::array_open)
            {
                if (kind) part->malformed.insert(*kind);
                return;
            }

            value const * tree = nullptr;
            if (auto p = baseline.find(part->name))
                tree = p->find(key);

            section_walk s { key, kind, tree, std::nullopt, {}, {}, 0 };
            if (tree)
            {
                auto header = read_header(*tree);
                if (kind == table_kind::nodes)
                {
                    s.id_column = header.id_column();
                    for (size_t axis = 0; axis < 3; ++axis)
                        s.pos_columns[axis] = header.position_column(axis);
                }
                s.refs = header.reference_columns();
            }
            section = std::move(s);
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::close_row(size_t index, size_t i)
        {
            if (!row_is_array || !section->tree || section->key == "slots")
                return;
            if (section->array_rows == 1)
                return;     // header

            value const * row = section->tree->at(index);
            if (!row) return;

            auto const & acts = part->acts;
            size_t ordinal = section->array_rows - 1;
            bool remove = false;

            std::optional<std::string> node_id;
            if (section->kind == table_kind::nodes)
            {
                auto cell = row->at(*section->id_column);
                if (cell && cell->is_string())
                {
                    node_id = *cell->as_string();
                    remove = acts.nodes_to_delete.contains(*node_id);
                }
            }
            else if (section->kind)
                remove = acts.rows_to_delete(*section->kind).contains(ordinal);

            if (!remove && opt.affect_node_references && !acts.nodes_to_delete.empty())
            {
                for (size_t col : section->refs)
                {
                    auto cell = row->at(col);
                    if (cell && cell->is_string() && acts.nodes_to_delete.contains(*cell->as_string()))
                    {
                        remove = true;
                        break;
                    }
                }
            }

            if (remove)
            {
                edits.push_back({ planned_edit::op::delete_row, row_open, row_open, i });
                return;
            }

            if (node_id && !part->pending_symmetric.empty())
                plan_symmetric_nodes(*node_id, i);
            else if (section->kind == table_kind::beams && !part->pending_beams.empty())
                plan_symmetric_beam(*row, i);
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::plan_symmetric_nodes(std::string const & id, size_t i)
        {
            table_editor ed(doc);
            std::vector<document> rows;

            for (auto it = part->pending_symmetric.begin(); it != part->pending_symmetric.end();)
            {
                if (it->second.mirror_source != id)
                {
                    ++it;
                    continue;
                }

                std::map<size_t, token> cells;
                cells.emplace(*section->id_column, make_string(it->first));
                for (size_t axis = 0; axis < 3; ++axis)
                    cells.emplace(section->pos_columns[axis], make_number(it->second.pos[axis]));

                rows.push_back(ed.derive_row(row_open, i, cells));
                it = part->pending_symmetric.erase(it);
            }

            if (!rows.empty())
            {
                planned_edit e { planned_edit::op::insert_after, i + 1, row_open, i };
                e.rows = std::move(rows);
                edits.push_back(std::move(e));
            }
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::plan_symmetric_beam(value const & row, size_t i)
        {
            if (section->refs.size() < 2) return;

            auto a = row.at(section->refs[0]);
            auto b = row.at(section->refs[1]);
            if (!a || !b || !a->is_string() || !b->is_string()) return;

            // Pending beams carry the ids of this cycle
            auto const & renames = part->acts.nodes_to_rename;
            auto renamed = [&renames](std::string const & id)
            {
                auto it = renames.find(id);
                return it == renames.end() ? id : it->second;
            };
            std::string id_a = renamed(*a->as_string());
            std::string id_b = renamed(*b->as_string());

            auto sym_a = scheme.counterpart(id_a);
            auto sym_b = scheme.counterpart(id_b);
            if (!sym_a && !sym_b) return;

            // A centre node keeps its own id
            id_pair candidate(sym_a.value_or(id_a), sym_b.value_or(id_b));

            auto found = part->pending_beams.find(candidate);
            if (found == part->pending_beams.end()) return;

            std::map<size_t, token> cells;
            cells.emplace(section->refs[0], make_string(candidate.first));
            cells.emplace(section->refs[1], make_string(candidate.second));

            planned_edit e { planned_edit::op::insert_after, i + 1, row_open, i };
            e.rows.push_back(table_editor(doc).derive_row(row_open, i, cells));
            edits.push_back(std::move(e));

            part->pending_beams.erase(found);
        }

//---------------------------------------------------------------------------

        inline std::vector<document> table_planner_impl::rows_to_append(table_kind kind, bool section_exists)
        {
            std::vector<document> rows;
            auto const & acts = part->acts;

            switch (kind)
            {
                case table_kind::nodes:
                    for (auto const & [id, pos] : acts.nodes_to_add)
                        rows.push_back(make_row(kind, std::span(&id, 1), &pos));
                    for (auto const & [id, sym] : part->pending_symmetric)
                    {
                        if (section_exists)
                            log::warn("part '{}': mirror row '{}' of node '{}' not found; appending",
                                part->name, sym.mirror_source, id);
                        rows.push_back(make_row(kind, std::span(&id, 1), &sym.pos));
                    }
                    part->pending_symmetric.clear();
                    break;

                case table_kind::beams:
                    for (auto const & beam : part->pending_beams)
                    {
                        std::string ids[] = { beam.first, beam.second };
                        rows.push_back(make_row(kind, ids));
                    }
                    part->pending_beams.clear();
                    break;

                case table_kind::triangles:
                    for (auto const & tri : acts.tris_to_add)
                        rows.push_back(make_row(kind, tri));
                    break;

                case table_kind::quads:
                    for (auto const & quad : acts.quads_to_add)
                        rows.push_back(make_row(kind, quad));
                    break;
            }
            return rows;
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::close_section(size_t i)
        {
            part->last_member_end = i;
            if (!section) return;

            auto kind = section->kind;
            section.reset();
            if (!kind || part->present.contains(*kind)) return;

            part->present.insert(*kind);
            auto rows = rows_to_append(*kind, true);
            if (rows.empty()) return;

            planned_edit e { planned_edit::op::append_rows, i, i, i, *kind };
            e.rows = std::move(rows);
            edits.push_back(std::move(e));
        }

//---------------------------------------------------------------------------

        inline void table_planner_impl::close_part()
        {
            static constexpr table_kind order[] = {
                table_kind::nodes, table_kind::beams, table_kind::triangles, table_kind::quads };

            size_t anchor = part->last_member_end.value_or(part->open);
            planned_edit e { planned_edit::op::add_sections, anchor + 1, anchor, anchor };

            for (auto kind : order)
            {
                if (part->present.contains(kind)) continue;

                auto rows = rows_to_append(kind, false);
                if (rows.empty()) continue;

                if (part->malformed.contains(kind))
                {
                    ctx.errors.push_back({ table_edit_error_kind::malformed_section, {},
                        "part '" + part->name + "': section '" + std::string(section_name(kind)) + "' is not a list of rows" });
                    continue;
                }
                e.sections.emplace_back(kind, std::move(rows));
            }

            if (!e.sections.empty())
                edits.push_back(std::move(e));
            part.reset();
        }
    }

//---------------------------------------------------------------------------

    inline edit_context apply_part_actions(
        document& doc,
        value const & baseline,
        value const & current,
        actions_set const & actions,
        identifier_scheme const & scheme,
        sync_options const & opt )
    {
        detail::table_planner_impl planner { doc, baseline, current, actions, scheme, opt };
        planner.run();

        if (planner.ctx.has_errors())
            return std::move(planner.ctx);

        auto & edits = planner.edits;
        auto & summary = planner.ctx.result;

        std::stable_sort(edits.begin(), edits.end(),
            [](detail::planned_edit const & a, detail::planned_edit const & b) { return a.at < b.at; });

        using op = detail::planned_edit::op;
        table_editor ed(doc);
        std::ptrdiff_t delta = 0;

        // Edits never overlap; each only shifts the tokens behind it
        for (auto & e : edits)
        {
            auto adjust = [delta](size_t index) { return static_cast<size_t>(static_cast<std::ptrdiff_t>(index) + delta); };
            size_t before = doc.size();

            switch (e.what)
            {
                case op::delete_row:
                    ed.delete_row(adjust(e.open), adjust(e.close));
                    ++summary.rows_deleted;
                    break;

                case op::insert_after:
                    ed.insert_after_row(adjust(e.open), adjust(e.close), e.rows);
                    summary.rows_added += e.rows.size();
                    break;

                case op::append_rows:
                    ed.append_rows(adjust(e.close), e.kind, e.rows);
                    summary.rows_added += e.rows.size();
                    break;

                case op::add_sections:
                {
                    size_t anchor = adjust(e.open);
                    for (auto const & [kind, rows] : e.sections)
                    {
                        auto [open, close] = ed.append_section(anchor, kind);
                        anchor = ed.append_rows(close, kind, rows);
                        ++summary.sections_created;
                        summary.rows_added += rows.size();
                    }
                    break;
                }

                case op::comment_out:
                    ed.comment_out(adjust(e.open), adjust(e.close));
                    ++summary.members_commented;
                    break;
            }

            delta += static_cast<std::ptrdiff_t>(doc.size()) - static_cast<std::ptrdiff_t>(before);
        }

        return std::move(planner.ctx);
    }

} // namespace jbsync

#endif
