/*
===============================================================================
TEST ENUM_UTILS — Tests for enum_utils.h
===============================================================================

OVERVIEW
--------
Validates MEALPLAN_DECLARE_ENUM_WITH_COUNT and the traits VariableTable and
ConstraintTable rely on to size their slot arrays.

TEST ORGANIZATION
-----------------
• Section A: Macro expansion
• Section B: enum_size / enumIndex / is_valid_enum_value
• Section C: The plan model's own registries

DEPENDENCIES
------------
• Catch2 v3 - Test framework
• enum_utils.h - System under test
• plan_builder.h - PlanVars / PlanCons declarations

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <meal_planner/enum_utils.h>
#include <meal_planner/plan_builder.h>

#include <array>
#include <type_traits>

using namespace mealplan;

// ============================================================================
// SECTION A: MACRO EXPANSION
// ============================================================================

/**
 * @test MacroExpansion::CreatesValidEnumClass
 * @given MEALPLAN_DECLARE_ENUM_WITH_COUNT(TestEnum, A, B, C)
 * @then A strongly-typed enum with values 0..2, COUNT = 3 and TestEnum_COUNT = 3
 */
TEST_CASE("A1: MacroExpansion::CreatesValidEnumClass", "[enum_utils][macro]")
{
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(TestEnum, A, B, C);

    SECTION("Enum type is properly defined")
    {
        REQUIRE(std::is_enum_v<TestEnum>);
        REQUIRE_FALSE(std::is_convertible_v<TestEnum, int>);
    }

    SECTION("Enumerators have sequential values")
    {
        REQUIRE(static_cast<int>(TestEnum::A) == 0);
        REQUIRE(static_cast<int>(TestEnum::C) == 2);
        REQUIRE(static_cast<int>(TestEnum::COUNT) == 3);
    }

    SECTION("Size constant")
    {
        static_assert(TestEnum_COUNT == 3);
        REQUIRE(TestEnum_COUNT == static_cast<std::size_t>(TestEnum::COUNT));
    }
}

TEST_CASE("A2: MacroExpansion::SingleEnumerator", "[enum_utils][macro]")
{
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(SingleEnum, OnlyValue);

    REQUIRE(static_cast<int>(SingleEnum::OnlyValue) == 0);
    REQUIRE(SingleEnum_COUNT == 1);
}

// ============================================================================
// SECTION B: TRAITS
// ============================================================================

TEST_CASE("B1: Traits::SizeIndexAndValidity", "[enum_utils][traits]")
{
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Color, Red, Green, Blue);

    static_assert(enum_size<Color>::value == 3);
    static_assert(enumIndex(Color::Blue) == 2);

    REQUIRE(is_valid_enum_value(Color::Red));
    REQUIRE(is_valid_enum_value(Color::Blue));
    REQUIRE_FALSE(is_valid_enum_value(Color::COUNT));
    REQUIRE_FALSE(is_valid_enum_value(static_cast<Color>(42)));
}

TEST_CASE("B2: Traits::UsableAsArraySize", "[enum_utils][traits]")
{
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Slot, First, Second);

    std::array<int, enum_size<Slot>::value> slots{};
    slots[enumIndex(Slot::Second)] = 7;

    REQUIRE(slots.size() == 2);
    REQUIRE(slots[1] == 7);
}

// ============================================================================
// SECTION C: PLAN MODEL REGISTRIES
// ============================================================================

/**
 * @test PlanEnums::OneSlotPerFamily
 * @then Two variable families (batches, units) and five constraint families
 */
TEST_CASE("C1: PlanEnums::OneSlotPerFamily", "[enum_utils][plan]")
{
    REQUIRE(PlanVars_COUNT == 2);
    REQUIRE(PlanCons_COUNT == 5);
    REQUIRE(enumIndex(PlanCons::IncludeEvery) == 4);
}
