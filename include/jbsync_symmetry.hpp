// jbsync_symmetry.hpp - JBeam Sync - Symmetrical Node Naming
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_SYMMETRY_HPP
#define JBSYNC_SYMMETRY_HPP

#include "jbsync_value.hpp"
#include "jbsync_log.hpp"

#include <optional>

namespace jbsync
{
//========================================================================
// Naming options
//========================================================================

    enum class affix_position
    {
        front,  // l_node
        back    // node_l
    };

    enum class id_side
    {
        left,   // positive x
        right,  // negative x
        middle,
        none
    };

    struct naming_options
    {
        bool use_prefixes {true};
        // List of [left, right] affix pairs as SJSON text
        std::string pairs {R"([["l", "r"], ["ll", "rr"]])"};
        std::string middle;
        affix_position position {affix_position::back};
    };

    enum class naming_error_kind
    {
        invalid_identifier_scheme,  // pair text unusable; default pair in effect
        invalid_pair                // one entry skipped
    };

    using naming_error = error<naming_error_kind>;

    struct affix_pair
    {
        std::string left;
        std::string right;
    };

    struct base_name_result
    {
        std::string base;
        id_side     side;
        std::string affix;
    };

//========================================================================
// Identifier scheme
//========================================================================

    class identifier_scheme
    {
    public:
        identifier_scheme() : identifier_scheme(naming_options{}, { { "l", "r" }, { "ll", "rr" } }) {}

        // Parses the pair text of the options. Unparseable text falls back
        // to a single ["l", "r"] pair and reports invalid_identifier_scheme.
        static context<identifier_scheme, naming_error> make(naming_options const & opt);

        bool enabled() const noexcept { return options_.use_prefixes; }
        naming_options const & options() const noexcept { return options_; }
        std::vector<affix_pair> const & pairs() const noexcept { return pairs_; }

        // Strips the longest matching affix
        base_name_result base_name(std::string_view id) const;

        // Mirrored name of a left or right id. The result always maps
        // back to `id`; otherwise there is no counterpart.
        std::optional<std::string> counterpart(std::string_view id) const;

        // Affix for a new node on the given side of the x axis; the first
        // configured pair names new nodes
        std::string affix_for_x(double x, double tolerance) const;

        std::string qualify(std::string_view affix, std::string_view base) const;

    private:
        identifier_scheme(naming_options opt, std::vector<affix_pair> pairs);

        naming_options          options_;
        std::vector<affix_pair> pairs_;     // as configured
        std::vector<affix_pair> matching_;  // longest affix first
    };

//========================================================================
// Implementation
//========================================================================

    inline identifier_scheme::identifier_scheme(naming_options opt, std::vector<affix_pair> pairs)
        : options_(std::move(opt))
        , pairs_(std::move(pairs))
        , matching_(pairs_)
    {
        std::stable_sort(matching_.begin(), matching_.end(), [](affix_pair const & a, affix_pair const & b)
        {
            return std::max(a.left.size(), a.right.size()) > std::max(b.left.size(), b.right.size());
        });
    }

//---------------------------------------------------------------------------

    inline context<identifier_scheme, naming_error> identifier_scheme::make(naming_options const & opt)
    {
        std::vector<naming_error> errors;
        std::vector<affix_pair> pairs;

        auto parsed = parse(opt.pairs);
        value tree = parsed.has_errors() ? value{} : materialise(parsed.result);
        auto list = tree.as_array();

        if (!list)
        {
            log::warn("could not parse symmetrical pairs '{}'; using [[\"l\", \"r\"]]", opt.pairs);
            errors.push_back({ naming_error_kind::invalid_identifier_scheme, {},
                "symmetrical pairs must be a list of [left, right] lists" });
            pairs.push_back({ "l", "r" });
        }
        else
        {
            for (auto const & entry : *list)
            {
                auto p = entry.as_array();
                if (p && p->size() == 2 && (*p)[0].is_string() && (*p)[1].is_string())
                {
                    pairs.push_back({ *(*p)[0].as_string(), *(*p)[1].as_string() });
                    continue;
                }
                errors.push_back({ naming_error_kind::invalid_pair, {},
                    "ignoring symmetrical pair " + to_text(entry) });
            }
        }

        return { identifier_scheme(opt, std::move(pairs)), std::move(errors) };
    }

//---------------------------------------------------------------------------

    inline base_name_result identifier_scheme::base_name(std::string_view id) const
    {
        if (!options_.use_prefixes)
            return { std::string(id), id_side::none, {} };

        bool front = options_.position == affix_position::front;

        auto strip = [&](std::string const & affix) -> std::optional<std::string>
        {
            if (affix.empty()) return std::nullopt;
            if (front && id.starts_with(affix)) return std::string(id.substr(affix.size()));
            if (!front && id.ends_with(affix))  return std::string(id.substr(0, id.size() - affix.size()));
            return std::nullopt;
        };

        for (auto const & p : matching_)
        {
            if (auto base = strip(p.left))  return { *base, id_side::left, p.left };
            if (auto base = strip(p.right)) return { *base, id_side::right, p.right };
        }

        if (auto base = strip(options_.middle))
            return { *base, id_side::middle, options_.middle };

        return { std::string(id), id_side::none, {} };
    }

//---------------------------------------------------------------------------

    inline std::optional<std::string> identifier_scheme::counterpart(std::string_view id) const
    {
        if (!options_.use_prefixes)
            return std::nullopt;

        auto bn = base_name(id);
        if (bn.side != id_side::left && bn.side != id_side::right)
            return std::nullopt;

        std::optional<std::string> swapped;
        for (auto const & p : matching_)
        {
            if (bn.side == id_side::left && p.left == bn.affix)   { swapped = p.right; break; }
            if (bn.side == id_side::right && p.right == bn.affix) { swapped = p.left; break; }
        }
        if (!swapped || swapped->empty())
            return std::nullopt;

        std::string mirrored = qualify(*swapped, bn.base);

        // e.g. "xrl" -> "xrr" would read back as "x" + "rr"
        auto back = base_name(mirrored);
        if (back.base != bn.base || back.affix != *swapped || back.side == bn.side)
            return std::nullopt;

        return mirrored;
    }

//---------------------------------------------------------------------------

    inline std::string identifier_scheme::affix_for_x(double x, double tolerance) const
    {
        if (!options_.use_prefixes)
            return {};

        if (x < -tolerance)
        {
            for (auto const & p : pairs_)
                if (!p.right.empty()) return p.right;
            return {};
        }
        if (x > tolerance)
        {
            for (auto const & p : pairs_)
                if (!p.left.empty()) return p.left;
            return {};
        }
        return options_.middle;
    }

//---------------------------------------------------------------------------

    inline std::string identifier_scheme::qualify(std::string_view affix, std::string_view base) const
    {
        std::string out;
        out.reserve(affix.size() + base.size());
        if (options_.position == affix_position::front)
        {
            out += affix;
            out += base;
        }
        else
        {
            out += base;
            out += affix;
        }
        return out;
    }

} // namespace jbsync

#endif
