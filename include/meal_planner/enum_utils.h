#pragma once
/*
===============================================================================
ENUM UTILS — Registry keys for the plan model
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel so that
VariableTable and ConstraintTable can size their slot arrays at compile time.
PlanBuilder keys its variable groups (batches, units) and constraint
families (serving target, ingredient balance, ...) with these enums.

USAGE
-----
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(PlanVars, Batches, Units);

    std::array<Slot, PlanVars_COUNT> slots{};
    slots[enumIndex(PlanVars::Units)] = ...;

THREAD SAFETY
-------------
• Compile-time only; no shared state

===============================================================================
*/

#include <cstddef>

/**
 * @macro MEALPLAN_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT and a Name_COUNT constant
 *
 * @details
 * Expands to:
 *     enum class Name { A, B, COUNT };
 *     static constexpr std::size_t Name_COUNT = 2;
 *
 * @warning Do not list COUNT yourself; enumerators start at 0.
 */
#define MEALPLAN_DECLARE_ENUM_WITH_COUNT(Name, ...)                       \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace mealplan {

    /// @brief Number of enumerators, excluding the COUNT sentinel
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief True if value names a real enumerator (not COUNT, not out of range)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size<Enum>::value;
    }

    /// @brief Array slot for an enumerator
    template<typename Enum>
    constexpr std::size_t enumIndex(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

} // namespace mealplan
