#pragma once
/*
===============================================================================
NAMING — Symbolic names for variables and constraints of the sizing model
===============================================================================

OVERVIEW
--------
Every model element is named after its family and its (scenario, timeslot)
position, e.g. "storageLevel_2_17" or "balance_0_5". These names survive the
LP writer unchanged, which makes the exported file readable.

    make_name::index("capacity", s, t)   "capacity_s_t", or "" if disabled
    make_name::concat("numberOfModules") "numberOfModules", or "" if disabled
    force_name::index / force_name::concat
                                         same, regardless of the switch

BUILD CONFIGURATION
-------------------
Names are attached when SIZING_DEBUG, _DEBUG or SIZING_SYMBOLIC_NAMES is
defined; CMake defines the last one unless SIZING_SYMBOLIC_NAMES=OFF. Without
names the engine falls back to C0, C1, ... and R0, R1, ...

===============================================================================
*/

#include <format>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#if defined(SIZING_DEBUG) || defined(_DEBUG) || defined(SIZING_SYMBOLIC_NAMES)
#define SIZING_NAMES 1
#else
#define SIZING_NAMES 0
#endif

/// @brief True if model elements receive symbolic names
[[nodiscard]] constexpr bool naming_enabled() noexcept {
    return SIZING_NAMES != 0;
}

[[nodiscard]] constexpr bool naming_disabled() noexcept {
    return !naming_enabled();
}

namespace naming_detail {

    template<typename T>
    concept Index = std::is_integral_v<std::remove_cvref_t<T>>;

    /// @brief base, then "_<i>" for every index
    template<Index... Indices>
    std::string indexed(std::string_view base, Indices... idx) {
        if (sizeof...(idx) > 0 && base.empty()) {
            throw std::invalid_argument("naming: an indexed name needs a non-empty base");
        }

        std::string name(base);
        (std::format_to(std::back_inserter(name), "_{}", idx), ...);
        return name;
    }

    /// @brief All parts formatted with "{}" and joined without separator
    template<typename... Parts>
    std::string joined(const Parts&... parts) {
        std::string name;
        (std::format_to(std::back_inserter(name), "{}", parts), ...);
        return name;
    }

} // namespace naming_detail

namespace make_name {

    template<typename... Parts>
    std::string concat(const Parts&... parts) {
        if constexpr (naming_enabled()) {
            return naming_detail::joined(parts...);
        }
        else {
            return {};
        }
    }

    template<naming_detail::Index... Indices>
    std::string index(std::string_view base, Indices... idx) {
        if constexpr (naming_enabled()) {
            return naming_detail::indexed(base, idx...);
        }
        else {
            return {};
        }
    }

} // namespace make_name

/// Used for log messages, where a name is wanted even in unnamed builds
namespace force_name {

    template<typename... Parts>
    std::string concat(const Parts&... parts) {
        return naming_detail::joined(parts...);
    }

    template<naming_detail::Index... Indices>
    std::string index(std::string_view base, Indices... idx) {
        return naming_detail::indexed(base, idx...);
    }

} // namespace force_name
