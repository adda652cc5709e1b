#pragma once
/*
===============================================================================
NAMING — Debug-aware names for portfolio variables, constraints and assets
===============================================================================

OVERVIEW
--------
Builds the symbolic names attached to Gurobi variables and constraints, and the
display labels used for assets in reports and charts. Debug builds produce
readable names ("w_3", "budget"); release builds skip variable naming entirely
so model construction stays allocation-free.

KEY COMPONENTS
--------------
• make_name::  Debug-aware naming (empty strings in release builds)
• force_name:: Always-on naming for labels, logs and CSV headers
• assetLabel() Default display label for asset i ("A0", "A1", ...)

USAGE EXAMPLES
--------------
    auto v = make_name::index("w", 3);      // "w_3" (debug) or "" (release)
    auto c = force_name::math("w", 3);      // "w[3]"
    auto a = markowitz::assetLabel(7);      // "A7"

BUILD CONFIGURATION
-------------------
Define MARKOWITZ_DEBUG (or build with _DEBUG) to enable debug names.

EXCEPTION SAFETY
----------------
• Empty base name with indices throws std::invalid_argument (debug builds)
• force_name:: functions always validate the base name

===============================================================================
*/

#include <string>
#include <string_view>
#include <stdexcept>
#include <type_traits>
#include <concepts>
#include <format>
#include <vector>

#if defined(MARKOWITZ_DEBUG) || defined(_DEBUG)
inline constexpr bool MARKOWITZ_DEBUG_NAMES = true;
#else
inline constexpr bool MARKOWITZ_DEBUG_NAMES = false;
#endif

/// @brief Returns true if debug-style naming is enabled
[[nodiscard]] constexpr bool naming_enabled() noexcept {
    return MARKOWITZ_DEBUG_NAMES;
}

/// @brief Returns true if debug-style naming is disabled
[[nodiscard]] constexpr bool naming_disabled() noexcept {
    return !MARKOWITZ_DEBUG_NAMES;
}

namespace naming_detail {

    template<typename T>
    concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

    inline void check_base_name(std::string_view base, bool has_indices) {
        if (has_indices && base.empty()) {
            throw std::invalid_argument(
                "naming: base name cannot be empty when indices are present");
        }
    }

    /// "w", 3, 1 -> "w_3_1"
    template<Integral... Indices>
    inline std::string index_impl(std::string_view base, Indices... idx) {
        check_base_name(base, sizeof...(idx) > 0);

        std::string result(base);
        ((result.append("_").append(std::to_string(static_cast<long long>(idx)))), ...);
        return result;
    }

    inline std::string index_impl(std::string_view base, const std::vector<int>& idx) {
        check_base_name(base, !idx.empty());

        std::string result(base);
        for (int i : idx) {
            result.append("_").append(std::to_string(i));
        }
        return result;
    }

    /// "w", 3, 1 -> "w[3,1]"
    template<Integral... Indices>
    inline std::string math_impl(std::string_view base, Indices... idx) {
        constexpr std::size_t N = sizeof...(idx);
        check_base_name(base, N > 0);

        if constexpr (N == 0) {
            return std::string(base);
        }
        else {
            std::string result(base);
            result.append("[");
            bool first = true;
            ((result.append(first ? (first = false, "") : ",")
                .append(std::to_string(static_cast<long long>(idx)))), ...);
            result.append("]");
            return result;
        }
    }

} // namespace naming_detail

// ============================================================================
// make_name:: — names only when naming_enabled()
// ============================================================================
namespace make_name {

    template<naming_detail::Integral... Indices>
    [[nodiscard]] inline std::string index(std::string_view base, Indices... idx) {
        if constexpr (naming_disabled()) {
            return {};
        }
        else {
            return naming_detail::index_impl(base, idx...);
        }
    }

    [[nodiscard]] inline std::string index(std::string_view base, const std::vector<int>& idx) {
        if constexpr (naming_disabled()) {
            return {};
        }
        else {
            return naming_detail::index_impl(base, idx);
        }
    }

    /// @brief Plain name (no indices), e.g. for scalar constraints
    [[nodiscard]] inline std::string plain(std::string_view base) {
        if constexpr (naming_disabled()) {
            return {};
        }
        else {
            return std::string(base);
        }
    }

} // namespace make_name

// ============================================================================
// force_name:: — always produces a name
// ============================================================================
namespace force_name {

    template<naming_detail::Integral... Indices>
    [[nodiscard]] inline std::string index(std::string_view base, Indices... idx) {
        return naming_detail::index_impl(base, idx...);
    }

    template<naming_detail::Integral... Indices>
    [[nodiscard]] inline std::string math(std::string_view base, Indices... idx) {
        return naming_detail::math_impl(base, idx...);
    }

} // namespace force_name

namespace markowitz {

    /**
     * @brief Default display label for an asset
     * @param i Zero-based asset index
     * @return "A<i>"
     * @throws std::invalid_argument if i is negative
     */
    [[nodiscard]] inline std::string assetLabel(int i) {
        if (i < 0) {
            throw std::invalid_argument(
                std::format("assetLabel: negative asset index {}", i));
        }
        return std::format("A{}", i);
    }

    /// @brief Labels "A0".."A<n-1>"
    [[nodiscard]] inline std::vector<std::string> assetLabels(int n) {
        std::vector<std::string> labels;
        labels.reserve(n > 0 ? static_cast<std::size_t>(n) : 0);
        for (int i = 0; i < n; ++i) {
            labels.push_back(assetLabel(i));
        }
        return labels;
    }

} // namespace markowitz
