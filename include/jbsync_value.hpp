// jbsync_value.hpp - JBeam Sync - Value Trees
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_VALUE_HPP
#define JBSYNC_VALUE_HPP

#include "jbsync_tokens.hpp"

#include <variant>
#include <span>
#include <utility>
#include <type_traits>

namespace jbsync
{
//========================================================================
// Value tree
//========================================================================

    struct value;
    struct member;

    using array  = std::vector<value>;
    using object = std::vector<member>;    // insertion ordered

    struct value
    {
        std::variant<std::monostate, bool, double, std::string, array, object> data;

        value() = default;
        value(bool b)               : data(b) {}
        value(int n)                : data(static_cast<double>(n)) {}
        value(double d)             : data(d) {}
        value(char const * s)       : data(std::string(s)) {}
        value(std::string s)        : data(std::move(s)) {}
        value(array a)              : data(std::move(a)) {}
        value(object o)             : data(std::move(o)) {}

        bool is_null() const    { return std::holds_alternative<std::monostate>(data); }
        bool is_bool() const    { return std::holds_alternative<bool>(data); }
        bool is_number() const  { return std::holds_alternative<double>(data); }
        bool is_string() const  { return std::holds_alternative<std::string>(data); }
        bool is_array() const   { return std::holds_alternative<array>(data); }
        bool is_object() const  { return std::holds_alternative<object>(data); }

        bool const *        as_bool() const   { return std::get_if<bool>(&data); }
        double const *      as_number() const { return std::get_if<double>(&data); }
        std::string const * as_string() const { return std::get_if<std::string>(&data); }
        array const *       as_array() const  { return std::get_if<array>(&data); }
        object const *      as_object() const { return std::get_if<object>(&data); }

        array *  as_array()  { return std::get_if<array>(&data); }
        object * as_object() { return std::get_if<object>(&data); }

        value const * find(std::string_view key) const;
        value * find(std::string_view key);

        value const * at(size_t index) const;
        value * at(size_t index);
    };

    struct member
    {
        std::string key;
        value       val;
    };

    bool operator==(value const & a, value const & b);
    inline bool operator==(member const & a, member const & b) { return a.key == b.key && a.val == b.val; }

//========================================================================
// Value tree API
//========================================================================

    // Builds the logical tree of a well-formed token document.
    // A later duplicate key replaces the earlier value in place.
    value materialise(document const & doc);

    // Compact SJSON rendering of a value tree
    std::string to_text(value const & v);

//========================================================================
// Structural paths
//========================================================================

    using path_key = std::variant<std::string, size_t>;

    struct path_frame
    {
        path_key key;
        bool     parent_is_object;
    };

    enum class resolve_status
    {
        found,
        absent,     // key or index not present
        mismatch    // path walks through the wrong container kind
    };

    struct resolve_result
    {
        resolve_status status;
        value const *  target;
    };

    resolve_result resolve(value const & root, std::span<path_frame const> frames, path_key const & slot);

    inline std::string describe(std::span<path_frame const> frames, path_key const & slot)
    {
        std::string out;
        auto add = [&out](path_key const & k)
        {
            out += '/';
            if (auto s = std::get_if<std::string>(&k)) out += *s;
            else out += std::to_string(std::get<size_t>(k));
        };
        for (auto const & f : frames) add(f.key);
        add(slot);
        return out;
    }

//========================================================================
// Implementation
//========================================================================

    inline value const * value::find(std::string_view key) const
    {
        auto obj = as_object();
        if (!obj) return nullptr;
        for (auto const & m : *obj)
            if (m.key == key) return &m.val;
        return nullptr;
    }

    inline value * value::find(std::string_view key)
    {
        return const_cast<value*>(std::as_const(*this).find(key));
    }

    inline value const * value::at(size_t index) const
    {
        auto arr = as_array();
        if (!arr || index >= arr->size()) return nullptr;
        return &(*arr)[index];
    }

    inline value * value::at(size_t index)
    {
        return const_cast<value*>(std::as_const(*this).at(index));
    }

//---------------------------------------------------------------------------

    inline bool operator==(value const & a, value const & b)
    {
        return a.data == b.data;
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        struct materialiser_impl
        {
            document const & doc;
            size_t i {0};

            void skip_wsc()
            {
                while (i < doc.size() && is_wsc(doc[i])) ++i;
            }

            value read_value()
            {
                skip_wsc();
                if (i >= doc.size()) return {};

                token const & t = doc[i++];
                switch (t.kind)
                {
                    case token_kind::object_open: return read_object();
                    case token_kind::array_open:  return read_array();
                    case token_kind::string:      return value(decode_string(t.text));
                    case token_kind::number:      return value(std::strtod(t.text.c_str(), nullptr));
                    case token_kind::literal:
                        if (t.text == "true")  return value(true);
                        if (t.text == "false") return value(false);
                        return {};
                    default:
                        return {};
                }
            }

            value read_object()
            {
                object out;
                for (;;)
                {
                    skip_wsc();
                    if (i >= doc.size()) break;
                    if (doc[i].kind == token_kind::object_close) { ++i; break; }

                    std::string key = decode_string(doc[i++].text);
                    skip_wsc();
                    ++i;    // colon
                    value v = read_value();

                    auto existing = std::find_if(out.begin(), out.end(),
                        [&key](member const & m) { return m.key == key; });
                    if (existing != out.end())
                        existing->val = std::move(v);
                    else
                        out.push_back({ std::move(key), std::move(v) });
                }
                return value(std::move(out));
            }

            value read_array()
            {
                array out;
                for (;;)
                {
                    skip_wsc();
                    if (i >= doc.size()) break;
                    if (doc[i].kind == token_kind::array_close) { ++i; break; }
                    out.push_back(read_value());
                }
                return value(std::move(out));
            }
        };

        inline void write_text(std::string & out, value const & v)
        {
            std::visit([&out](auto const & x)
            {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    out += "null";
                else if constexpr (std::is_same_v<T, bool>)
                    out += x ? "true" : "false";
                else if constexpr (std::is_same_v<T, double>)
                    out += format_number(x).text;
                else if constexpr (std::is_same_v<T, std::string>)
                {
                    out += '"';
                    out += encode_string(x);
                    out += '"';
                }
                else if constexpr (std::is_same_v<T, array>)
                {
                    out += '[';
                    for (size_t k = 0; k < x.size(); ++k)
                    {
                        if (k) out += ", ";
                        write_text(out, x[k]);
                    }
                    out += ']';
                }
                else
                {
                    out += '{';
                    for (size_t k = 0; k < x.size(); ++k)
                    {
                        if (k) out += ", ";
                        out += '"';
                        out += encode_string(x[k].key);
                        out += "\": ";
                        write_text(out, x[k].val);
                    }
                    out += '}';
                }
            }, v.data);
        }
    }

//---------------------------------------------------------------------------

    inline value materialise(document const & doc)
    {
        detail::materialiser_impl impl { doc };
        return impl.read_value();
    }

//---------------------------------------------------------------------------

    inline std::string to_text(value const & v)
    {
        std::string out;
        detail::write_text(out, v);
        return out;
    }

//---------------------------------------------------------------------------

    inline resolve_result resolve(value const & root, std::span<path_frame const> frames, path_key const & slot)
    {
        auto step = [](value const & node, path_key const & key) -> resolve_result
        {
            if (auto name = std::get_if<std::string>(&key))
            {
                if (!node.is_object()) return { resolve_status::mismatch, nullptr };
                auto found = node.find(*name);
                return { found ? resolve_status::found : resolve_status::absent, found };
            }

            if (!node.is_array()) return { resolve_status::mismatch, nullptr };
            auto found = node.at(std::get<size_t>(key));
            return { found ? resolve_status::found : resolve_status::absent, found };
        };

        value const * node = &root;
        for (auto const & f : frames)
        {
            auto r = step(*node, f.key);
            if (r.status != resolve_status::found)
                return r;
            node = r.target;
        }
        return step(*node, slot);
    }

} // namespace jbsync

#endif
