// jbsync_core.hpp - JBeam Sync - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_CORE_HPP
#define JBSYNC_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <cmath>
#include <cstdint>
#include <algorithm>

namespace jbsync
{
//========================================================================
// Geometry primitives
//========================================================================

    struct vec3
    {
        double x {0.0};
        double y {0.0};
        double z {0.0};

        double operator[](size_t i) const { return i == 0 ? x : (i == 1 ? y : z); }
        double & operator[](size_t i) { return i == 0 ? x : (i == 1 ? y : z); }

        bool operator==(vec3 const &) const = default;
    };

    inline vec3 operator-(vec3 const & a, vec3 const & b) { return { a.x - b.x, a.y - b.y, a.z - b.z }; }

    inline double length_squared(vec3 const & v) { return v.x * v.x + v.y * v.y + v.z * v.z; }

    inline vec3 mirrored(vec3 const & v) { return { -v.x, v.y, v.z }; }

    // Component-wise comparison within tolerance (strict)
    inline bool near(vec3 const & a, vec3 const & b, double tolerance)
    {
        return std::abs(a.x - b.x) < tolerance
            && std::abs(a.y - b.y) < tolerance
            && std::abs(a.z - b.z) < tolerance;
    }

    // Tolerance for mirror lookups (same y/z, negated x)
    inline constexpr double MIRROR_TOLERANCE = 1e-5;
    // Tolerance for exact position collisions
    inline constexpr double COLLISION_TOLERANCE = 1e-6;
    // Smallest coordinate delta folded into an expression coordinate
    inline constexpr double EXPRESSION_OFFSET_EPSILON = 1e-6;

//========================================================================
// Entity identity
//========================================================================

    // Sorted pair of node ids; the key of a beam row
    struct id_pair
    {
        std::string first;
        std::string second;

        id_pair() = default;
        id_pair(std::string a, std::string b)
        {
            if (b < a) std::swap(a, b);
            first = std::move(a);
            second = std::move(b);
        }

        auto operator<=>(id_pair const &) const = default;
    };

//========================================================================
// Errors and generation context
//========================================================================

    struct source_location
    {
        size_t line   {0};
        size_t column {0};
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline constexpr std::string_view INDENT        = "    ";
        inline constexpr std::string_view TWO_INDENT    = "        ";
        inline constexpr std::string_view NL_INDENT     = "\n    ";
        inline constexpr std::string_view NL_TWO_INDENT = "\n        ";

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string to_upper(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(), ::toupper);
            return result;
        }

        // Single precision equality; absorbs formatting noise
        // between a literal and its recomputed double.
        inline bool same_float(double a, double b)
        {
            return static_cast<float>(a) == static_cast<float>(b);
        }
    }

} // namespace jbsync

#endif
