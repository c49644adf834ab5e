#pragma once
/*
===============================================================================
NAMING — Symbolic names for Gurobi variables and constraints
===============================================================================

OVERVIEW
--------
Builds solver-safe names for model elements keyed by catalog identifiers
(recipe ids, SKU ids, ingredient ids, meal types). Two flavours:

• make_name::  — names only in debug builds (MEALPLAN_DEBUG or _DEBUG),
                 empty strings otherwise so release models carry no names
• force_name:: — always produces a name; used where names are read back,
                 e.g. IIS reports that list conflicting constraints

Styles:
    force_name::keyed("batches", "tomato soup")  ->  "batches[tomato_soup]"
    force_name::index("units", 3)                 ->  "units_3"

Identifiers are sanitized: any character outside [A-Za-z0-9_.:-] becomes
'_', so a free-text id can never produce a name the LP writer rejects.
Names are capped at 255 characters (Gurobi's limit).

THREAD SAFETY
-------------
• Pure functions, no shared state

===============================================================================
*/

#include <string>
#include <string_view>
#include <format>
#include <concepts>
#include <type_traits>
#include <stdexcept>

#if defined(MEALPLAN_DEBUG) || defined(_DEBUG)
inline constexpr bool MEALPLAN_DEBUG_NAMES = true;
#else
inline constexpr bool MEALPLAN_DEBUG_NAMES = false;
#endif

namespace mealplan {

    /// @brief True in debug builds; make_name:: returns empty strings otherwise
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return MEALPLAN_DEBUG_NAMES;
    }

    namespace naming_detail {

        inline constexpr std::size_t kMaxNameLength = 255;

        template<typename T>
        concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

        inline bool isNameChar(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '_' || c == '.' ||
                   c == ':' || c == '-';
        }

        /// @brief Replace characters the LP/MPS writers reject
        inline std::string sanitize(std::string_view raw) {
            std::string out;
            out.reserve(raw.size());
            for (char c : raw) {
                out.push_back(isNameChar(c) ? c : '_');
            }
            return out;
        }

        inline std::string clamp(std::string name) {
            if (name.size() > kMaxNameLength) {
                name.resize(kMaxNameLength);
            }
            return name;
        }

        inline void check_base_name(std::string_view base) {
            if (base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when a key is present");
            }
        }

        inline std::string keyed_impl(std::string_view base, std::string_view key) {
            check_base_name(base);
            return clamp(std::format("{}[{}]", base, sanitize(key)));
        }

        template<Integral... Indices>
        inline std::string index_impl(std::string_view base, Indices... idx) {
            if constexpr (sizeof...(idx) == 0) {
                return std::string(base);
            }
            else {
                check_base_name(base);
                std::string result(base);
                ((result.append("_").append(std::to_string(static_cast<long long>(idx)))), ...);
                return clamp(std::move(result));
            }
        }

    } // namespace naming_detail

    namespace make_name {

        inline std::string plain(std::string_view base) {
            if (!naming_enabled()) {
                return {};
            }
            return naming_detail::clamp(naming_detail::sanitize(base));
        }

        inline std::string keyed(std::string_view base, std::string_view key) {
            if (!naming_enabled()) {
                return {};
            }
            return naming_detail::keyed_impl(base, key);
        }

        template<typename... Indices>
            requires (naming_detail::Integral<Indices> && ...)
        inline std::string index(std::string_view base, Indices... idx) {
            if (!naming_enabled()) {
                return {};
            }
            return naming_detail::index_impl(base, idx...);
        }

    } // namespace make_name

    namespace force_name {

        inline std::string plain(std::string_view base) {
            return naming_detail::clamp(naming_detail::sanitize(base));
        }

        inline std::string keyed(std::string_view base, std::string_view key) {
            return naming_detail::keyed_impl(base, key);
        }

        template<typename... Indices>
            requires (naming_detail::Integral<Indices> && ...)
        inline std::string index(std::string_view base, Indices... idx) {
            return naming_detail::index_impl(base, idx...);
        }

    } // namespace force_name

} // namespace mealplan
