// jbsync_config.hpp - JBeam Sync - Synchronisation Options
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_CONFIG_HPP
#define JBSYNC_CONFIG_HPP

#include "jbsync_symmetry.hpp"

#include <functional>
#include <optional>

namespace jbsync
{
//========================================================================
// Options
//========================================================================

    // Folds a coordinate delta into an expression coordinate and returns
    // the new expression text
    using offset_expression_fn = std::function<std::string(std::string_view expression, double delta)>;

    // Evaluates an expression coordinate; nullopt when it cannot
    using evaluate_expression_fn = std::function<std::optional<double>(std::string_view expression)>;

    struct sync_options
    {
        // Renames and deletions touch every row referencing the node
        bool affect_node_references {true};
        // Renaming a left/right node also renames its mirror
        bool rename_symmetrical_counterpart {false};

        naming_options naming;

        double mirror_tolerance {MIRROR_TOLERANCE};
        double collision_tolerance {COLLISION_TOLERANCE};

        // Seed of the random id generator; nullopt seeds from the system
        std::optional<uint64_t> id_seed;

        offset_expression_fn   offset_expression;
        evaluate_expression_fn evaluate_expression;
    };

//========================================================================
// Loading
//========================================================================

    enum class config_error_kind
    {
        invalid_document,
        unknown_key,
        wrong_type,
        invalid_value,
        invalid_identifier_scheme
    };

    using config_error   = error<config_error_kind>;
    using config_context = context<sync_options, config_error>;

    // Reads options from an SJSON object. Problems are reported and the
    // value from `defaults` is kept.
    config_context load_options(std::string_view text, sync_options defaults = {});

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct options_loader
        {
            config_context & ctx;

            void wrong_type(std::string const & key, char const * expected)
            {
                ctx.errors.push_back({ config_error_kind::wrong_type, {},
                    "'" + key + "' must be " + expected });
            }

            void read_bool(member const & m, bool & out)
            {
                if (auto b = m.val.as_bool()) out = *b;
                else wrong_type(m.key, "a boolean");
            }

            void read_tolerance(member const & m, double & out)
            {
                auto n = m.val.as_number();
                if (!n) { wrong_type(m.key, "a number"); return; }
                if (*n <= 0.0)
                {
                    ctx.errors.push_back({ config_error_kind::invalid_value, {},
                        "'" + m.key + "' must be positive" });
                    return;
                }
                out = *n;
            }

            void read_string(member const & m, std::string & out)
            {
                if (auto s = m.val.as_string()) out = *s;
                else wrong_type(m.key, "a string");
            }

            void read_pairs(member const & m)
            {
                if (auto s = m.val.as_string()) ctx.result.naming.pairs = *s;
                else if (m.val.is_array())      ctx.result.naming.pairs = to_text(m.val);
                else wrong_type(m.key, "a list of pairs");
            }

            void read_position(member const & m)
            {
                auto s = m.val.as_string();
                if (!s) { wrong_type(m.key, "\"FRONT\" or \"BACK\""); return; }

                auto upper = to_upper(*s);
                if (upper == "FRONT")     ctx.result.naming.position = affix_position::front;
                else if (upper == "BACK") ctx.result.naming.position = affix_position::back;
                else
                    ctx.errors.push_back({ config_error_kind::invalid_value, {},
                        "'" + m.key + "' must be \"FRONT\" or \"BACK\"" });
            }

            void read_seed(member const & m)
            {
                auto n = m.val.as_number();
                if (!n || *n < 0.0) { wrong_type(m.key, "a non-negative number"); return; }
                ctx.result.id_seed = static_cast<uint64_t>(*n);
            }

            void read(member const & m)
            {
                auto & o = ctx.result;

                if (m.key == "affectNodeReferences")              read_bool(m, o.affect_node_references);
                else if (m.key == "renameSymmetricalCounterpart") read_bool(m, o.rename_symmetrical_counterpart);
                else if (m.key == "useNodeNamingPrefixes")        read_bool(m, o.naming.use_prefixes);
                else if (m.key == "symmetricalPairs")             read_pairs(m);
                else if (m.key == "middleIdentifier")             read_string(m, o.naming.middle);
                else if (m.key == "identifierPosition")           read_position(m);
                else if (m.key == "mirrorTolerance")              read_tolerance(m, o.mirror_tolerance);
                else if (m.key == "collisionTolerance")           read_tolerance(m, o.collision_tolerance);
                else if (m.key == "idSeed")                       read_seed(m);
                else
                    ctx.errors.push_back({ config_error_kind::unknown_key, {},
                        "unknown option '" + m.key + "'" });
            }
        };
    }

//---------------------------------------------------------------------------

    inline config_context load_options(std::string_view text, sync_options defaults)
    {
        config_context ctx { std::move(defaults), {} };

        auto parsed = parse(text);
        if (parsed.has_errors())
        {
            for (auto const & pe : parsed.errors)
                ctx.errors.push_back({ config_error_kind::invalid_document, pe.loc, pe.message });
            return ctx;
        }

        value tree = materialise(parsed.result);
        auto obj = tree.as_object();
        if (!obj)
        {
            ctx.errors.push_back({ config_error_kind::invalid_document, {}, "options must be an object" });
            return ctx;
        }

        detail::options_loader loader { ctx };
        for (auto const & m : *obj)
            loader.read(m);

        // Surface a broken pair list now rather than on first use
        auto scheme = identifier_scheme::make(ctx.result.naming);
        for (auto const & ne : scheme.errors)
            if (ne.kind == naming_error_kind::invalid_identifier_scheme)
                ctx.errors.push_back({ config_error_kind::invalid_identifier_scheme, {}, ne.message });

        return ctx;
    }

} // namespace jbsync

#endif
