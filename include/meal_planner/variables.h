#pragma once
/*
===============================================================================
VARIABLES — Keyed decision variables for the plan model
===============================================================================

OVERVIEW
--------
The plan model has one integer variable per recipe (batches) and one per
SKU (purchased units). Both families are indexed by catalog identifiers,
not by dense integer ranges, so the container here maps string keys to
GRBVar while keeping insertion order (the order of the input catalogs).

KEY COMPONENTS
--------------
• KeyedVariableSet — ordered key -> GRBVar container with O(1) lookup
• VariableFactory  — creates one variable per key with shared type/bounds
• VariableTable    — enum-keyed registry of KeyedVariableSet slots
• value(), values() — solution extraction (requires an incumbent)

USAGE
-----
    auto batches = VariableFactory::addKeyed(model, GRB_INTEGER, 0.0,
                                             GRB_INFINITY, "batches", ids);
    GRBVar& x = batches.at("soup");
    model.optimize();
    for (const auto& [id, v] : values(batches)) { ... }

EXCEPTION SAFETY
----------------
• at(): std::out_of_range for an unknown key
• addKeyed(): std::invalid_argument on duplicate keys (nothing is added to
  the returned set, but variables already created stay in the GRBModel)
• value()/values(): GRBException when the model has no solution

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
    // KEYED VARIABLE SET
    // ============================================================================
    /**
     * @class KeyedVariableSet
     * @brief Variables indexed by string keys, iterated in insertion order
     */
    class KeyedVariableSet {
    public:
        struct Entry {
            std::string key;
            GRBVar var;
        };

    private:
        std::vector<Entry> entries_;
        std::unordered_map<std::string, std::size_t> index_;

    public:
        KeyedVariableSet() = default;

        /// @brief Append a variable under key
        /// @throws std::invalid_argument if key is already present
        void add(const std::string& key, GRBVar var) {
            if (index_.contains(key)) {
                throw std::invalid_argument(
                    std::format("KeyedVariableSet::add: duplicate key '{}'", key));
            }
            index_.emplace(key, entries_.size());
            entries_.push_back(Entry{ key, std::move(var) });
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] bool contains(const std::string& key) const {
            return index_.contains(key);
        }

        GRBVar& at(const std::string& key) {
            auto it = index_.find(key);
            if (it == index_.end()) {
                throw std::out_of_range(
                    std::format("KeyedVariableSet::at: key '{}' not found", key));
            }
            return entries_[it->second].var;
        }

        const GRBVar& at(const std::string& key) const {
            return const_cast<KeyedVariableSet*>(this)->at(key);
        }

        GRBVar& operator()(const std::string& key) { return at(key); }
        const GRBVar& operator()(const std::string& key) const { return at(key); }

        /// @brief Pointer to the variable, or nullptr if key is unknown
        GRBVar* try_get(const std::string& key) noexcept {
            auto it = index_.find(key);
            return it == index_.end() ? nullptr : &entries_[it->second].var;
        }

        const GRBVar* try_get(const std::string& key) const noexcept {
            return const_cast<KeyedVariableSet*>(this)->try_get(key);
        }

        using iterator = std::vector<Entry>::iterator;
        using const_iterator = std::vector<Entry>::const_iterator;

        iterator begin() noexcept { return entries_.begin(); }
        iterator end() noexcept { return entries_.end(); }
        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }

        template<typename Fn>
        void forEach(Fn&& fn) {
            for (auto& e : entries_) {
                fn(e.key, e.var);
            }
        }

        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries_) {
                fn(e.key, e.var);
            }
        }
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    class VariableFactory {
    public:
        /**
         * @brief Create one variable per key
         * @param model    Gurobi model receiving the variables
         * @param vtype    GRB_INTEGER, GRB_BINARY or GRB_CONTINUOUS
         * @param lb       Lower bound for every variable
         * @param ub       Upper bound for every variable
         * @param baseName Name stem; "batches" yields "batches[<key>]"
         * @param keys     Any range of strings (or string-convertible values)
         * @throws std::invalid_argument on a repeated key
         */
        template<typename KeyRange>
        static KeyedVariableSet addKeyed(GRBModel& model,
            char vtype,
            double lb,
            double ub,
            const std::string& baseName,
            const KeyRange& keys)
        {
            KeyedVariableSet result;
            for (const auto& rawKey : keys) {
                std::string key(rawKey);
                if (result.contains(key)) {
                    throw std::invalid_argument(std::format(
                        "VariableFactory::addKeyed: duplicate key '{}' in '{}'",
                        key, baseName));
                }
                result.add(key, addVarOpt(model, lb, ub, vtype,
                                          make_name::keyed(baseName, key)));
            }
            return result;
        }

    private:
        static GRBVar addVarOpt(GRBModel& model,
            double lb,
            double ub,
            char vtype,
            const std::string& name)
        {
            if (name.empty()) {
                return model.addVar(lb, ub, 0.0, vtype);
            }
            return model.addVar(lb, ub, 0.0, vtype, name);
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Fixed-size registry of variable families keyed by an enum
     *
     * @details Slots start empty; get() on an empty slot is a programming
     *          error and throws std::runtime_error.
     */
    template<typename EnumT, std::size_t MAX = enum_size<EnumT>::value>
    class VariableTable {
    private:
        std::array<KeyedVariableSet, MAX> table_;
        std::array<bool, MAX> filled_{};

        static std::size_t slot(EnumT key, const char* where) {
            std::size_t idx = enumIndex(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("VariableTable::{}: key {} >= {}", where, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, KeyedVariableSet&& vars) {
            std::size_t idx = slot(key, "set");
            table_[idx] = std::move(vars);
            filled_[idx] = true;
        }

        [[nodiscard]] bool has(EnumT key) const {
            return filled_[slot(key, "has")];
        }

        KeyedVariableSet& get(EnumT key) {
            std::size_t idx = slot(key, "get");
            if (!filled_[idx]) {
                throw std::runtime_error(
                    std::format("VariableTable::get: slot {} was never set", idx));
            }
            return table_[idx];
        }

        const KeyedVariableSet& get(EnumT key) const {
            return const_cast<VariableTable*>(this)->get(key);
        }

        KeyedVariableSet& operator()(EnumT key) { return get(key); }
        const KeyedVariableSet& operator()(EnumT key) const { return get(key); }

        /// @brief Shortcut for get(key).at(id)
        GRBVar& var(EnumT key, const std::string& id) { return get(key).at(id); }
        const GRBVar& var(EnumT key, const std::string& id) const { return get(key).at(id); }
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /// @brief Incumbent value of a variable
    /// @throws GRBException if the model holds no solution
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Incumbent values of a keyed set, in insertion order
    /// @throws GRBException if the model holds no solution
    inline std::vector<std::pair<std::string, double>> values(const KeyedVariableSet& vs) {
        std::vector<std::pair<std::string, double>> out;
        out.reserve(vs.size());
        vs.forEach([&](const std::string& key, const GRBVar& v) {
            out.emplace_back(key, v.get(GRB_DoubleAttr_X));
        });
        return out;
    }

    inline double lb(const GRBVar& v) { return v.get(GRB_DoubleAttr_LB); }
    inline double ub(const GRBVar& v) { return v.get(GRB_DoubleAttr_UB); }

} // namespace mealplan
