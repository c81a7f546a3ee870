#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for the storage sizing model
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel so that
per-field storage (six operational variables, five constraint families) can
be laid out in fixed-size blocks and iterated without hand-maintained sizes.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• enum_index(): enumerator -> std::size_t position
• enum_values<E>(): all enumerators (without COUNT) in declaration order

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Field, Level, Delta);

    static_assert(Field_COUNT == 2);
    for (Field f : sizing::enum_values<Field>()) {
        table[sizing::enum_index(f)] = ...;
    }

===============================================================================
*/

#include <array>
#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with an automatic COUNT sentinel
 *
 * @details Expands to
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = Name::COUNT;
 *
 * @warning Do not declare COUNT yourself; enumerators must stay sequential
 *          from zero because they are used as array offsets.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace sizing {

    /// @brief Position of an enumerator (its offset inside a field block)
    template<typename E>
        requires std::is_enum_v<E>
    [[nodiscard]] constexpr std::size_t enum_index(E e) noexcept {
        return static_cast<std::size_t>(e);
    }

    /// @brief Number of user enumerators of an enum declared with COUNT
    template<typename E>
        requires std::is_enum_v<E>
    [[nodiscard]] constexpr std::size_t enum_count() noexcept {
        return static_cast<std::size_t>(E::COUNT);
    }

    namespace enum_detail {
        template<typename E, std::size_t... Is>
        constexpr std::array<E, sizeof...(Is)> values_impl(std::index_sequence<Is...>) {
            return { static_cast<E>(Is)... };
        }
    } // namespace enum_detail

    /**
     * @brief All enumerators of E except COUNT, in declaration order
     *
     * @example
     *     for (auto f : enum_values<ScenarioField>()) { ... }
     */
    template<typename E>
        requires std::is_enum_v<E>
    [[nodiscard]] constexpr auto enum_values() {
        return enum_detail::values_impl<E>(std::make_index_sequence<enum_count<E>()>{});
    }

} // namespace sizing
