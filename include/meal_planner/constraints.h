#pragma once
/*
===============================================================================
CONSTRAINTS — Keyed constraint families for the plan model
===============================================================================

OVERVIEW
--------
Constraint families in the plan model are keyed the same way as variables:
one balance row per ingredient id, one minimum per meal type, one inclusion
row per required recipe. A scalar row (the serving target) is a family with
a single entry under the empty key.

KEY COMPONENTS
--------------
• KeyedConstraintSet — ordered key -> GRBConstr container
• ConstraintFactory  — adds rows from a generator returning GRBTempConstr
• ConstraintTable    — enum-keyed registry of families
• rhs(), sense(), slack() — row inspection helpers

NAMING
------
Rows are named through make_name:: (debug builds only) unless the caller
asks for names explicitly. PlanBuilder always asks, so IIS reports and
model dumps carry row names in every build.

===============================================================================
*/

#include <string>
#include <vector>
#include <array>
#include <utility>
#include <format>
#include <stdexcept>
#include <unordered_map>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"

namespace mealplan {

    // ============================================================================
    // KEYED CONSTRAINT SET
    // ============================================================================
    class KeyedConstraintSet {
    public:
        struct Entry {
            std::string key;
            GRBConstr constr;
        };

    private:
        std::vector<Entry> entries_;
        std::unordered_map<std::string, std::size_t> index_;

    public:
        KeyedConstraintSet() = default;

        void add(const std::string& key, GRBConstr c) {
            if (index_.contains(key)) {
                throw std::invalid_argument(
                    std::format("KeyedConstraintSet::add: duplicate key '{}'", key));
            }
            index_.emplace(key, entries_.size());
            entries_.push_back(Entry{ key, std::move(c) });
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] bool contains(const std::string& key) const {
            return index_.contains(key);
        }

        GRBConstr& at(const std::string& key) {
            auto it = index_.find(key);
            if (it == index_.end()) {
                throw std::out_of_range(
                    std::format("KeyedConstraintSet::at: key '{}' not found", key));
            }
            return entries_[it->second].constr;
        }

        const GRBConstr& at(const std::string& key) const {
            return const_cast<KeyedConstraintSet*>(this)->at(key);
        }

        /// @brief The single row of a scalar family
        /// @throws std::runtime_error unless the family holds exactly one row
        const GRBConstr& scalar() const {
            if (entries_.size() != 1) {
                throw std::runtime_error(std::format(
                    "KeyedConstraintSet::scalar: family holds {} rows", entries_.size()));
            }
            return entries_.front().constr;
        }

        using const_iterator = std::vector<Entry>::const_iterator;
        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }

        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries_) {
                fn(e.key, e.constr);
            }
        }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
    public:
        /**
         * @brief Add one row per key
         * @tparam KeyRange  Range of string-convertible keys
         * @tparam Generator Callable `GRBTempConstr(const std::string& key)`
         * @param alwaysName Name rows even in release builds
         *
         * @example
         *     auto bal = ConstraintFactory::addKeyed(model, "ingredient_balance",
         *         ingredientIds, [&](const std::string& i) {
         *             return demand(i) <= supply(i);
         *         });
         */
        template<typename KeyRange, typename Generator>
        static KeyedConstraintSet addKeyed(GRBModel& model,
            const std::string& baseName,
            const KeyRange& keys,
            Generator&& gen,
            bool alwaysName = false)
        {
            KeyedConstraintSet result;
            for (const auto& rawKey : keys) {
                std::string key(rawKey);
                GRBTempConstr tmp = gen(key);
                std::string name = alwaysName
                    ? force_name::keyed(baseName, key)
                    : make_name::keyed(baseName, key);
                result.add(key, addConstrOpt(model, tmp, name));
            }
            return result;
        }

        /// @brief Add a single row stored under the empty key
        static KeyedConstraintSet addScalar(GRBModel& model,
            const std::string& baseName,
            const GRBTempConstr& tmp,
            bool alwaysName = false)
        {
            KeyedConstraintSet result;
            std::string name = alwaysName
                ? force_name::plain(baseName)
                : make_name::plain(baseName);
            result.add(std::string{}, addConstrOpt(model, tmp, name));
            return result;
        }

    private:
        static GRBConstr addConstrOpt(GRBModel& model,
            const GRBTempConstr& tmp,
            const std::string& name)
        {
            if (name.empty()) {
                return model.addConstr(tmp);
            }
            return model.addConstr(tmp, name);
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    template<typename EnumT, std::size_t MAX = enum_size<EnumT>::value>
    class ConstraintTable {
    private:
        std::array<KeyedConstraintSet, MAX> table_;
        std::array<bool, MAX> filled_{};

        static std::size_t slot(EnumT key, const char* where) {
            std::size_t idx = enumIndex(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("ConstraintTable::{}: key {} >= {}", where, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, KeyedConstraintSet&& rows) {
            std::size_t idx = slot(key, "set");
            table_[idx] = std::move(rows);
            filled_[idx] = true;
        }

        [[nodiscard]] bool has(EnumT key) const {
            return filled_[slot(key, "has")];
        }

        KeyedConstraintSet& get(EnumT key) {
            std::size_t idx = slot(key, "get");
            if (!filled_[idx]) {
                throw std::runtime_error(
                    std::format("ConstraintTable::get: slot {} was never set", idx));
            }
            return table_[idx];
        }

        const KeyedConstraintSet& get(EnumT key) const {
            return const_cast<ConstraintTable*>(this)->get(key);
        }

        KeyedConstraintSet& operator()(EnumT key) { return get(key); }
        const KeyedConstraintSet& operator()(EnumT key) const { return get(key); }
    };

    // ============================================================================
    // ROW INSPECTION
    // ============================================================================

    inline double rhs(const GRBConstr& c) {
        return c.get(GRB_DoubleAttr_RHS);
    }

    inline char sense(const GRBConstr& c) {
        return c.get(GRB_CharAttr_Sense);
    }

    /// @brief Row slack of the incumbent; requires a solution
    inline double slack(const GRBConstr& c) {
        return c.get(GRB_DoubleAttr_Slack);
    }

} // namespace mealplan
