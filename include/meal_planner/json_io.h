#pragma once
/*
===============================================================================
JSON I/O — Request, configuration and result documents
===============================================================================

OVERVIEW
--------
The JSON forms are an edge adapter for the command-line driver; solve()
itself takes and returns typed structs.

    request   { "target_servings": 8,
                "recipes":  [ { "recipe_id", "servings_per_batch",
                                "ingredient_requirements": { id: qty },
                                "meal_type": "entree" } ],
                "supply":   [ { "sku_id", "ingredient_id", "quantity_per_unit",
                                "unit_cost", "retailer" } ],
                "retailers": [ ... ],             optional filter
                "options":  { ... PlanOptions ... },
                "placeholders": { "enabled", "quantity_per_unit", "unit_cost" } }

    config    { "time_limit_seconds", "batch_penalty", "threads", "mip_gap",
                "placeholders": { ... } }

    result    { "schema_version": 1, "status": "Optimal", ... }

Absent option keys keep their current value, which is how a PlannerConfig
supplies defaults that a request's "options" object overrides.

ERRORS
------
parse/load entry points turn nlohmann parse and type errors into
InvalidPlanInput; the field is "json" with the library's message.
Counts (target_servings, servings_per_batch, minimums, threads,
schema_version) must be integral JSON numbers within int range; 4.7 or
1e12 is rejected under the count's own field name, never truncated.

===============================================================================
*/

#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "anomaly.h"
#include "errors.h"
#include "plan_types.h"
#include "shopping_list.h"
#include "supply_preparation.h"

namespace mealplan {

    using json = nlohmann::json;

    inline constexpr int kResultSchemaVersion = 1;

    namespace json_detail {

        /// @throws InvalidPlanInput unless v is an integral JSON number that fits in int
        inline int toInt(const json& v, const std::string& field) {
            if (!v.is_number_integer()) {
                throw InvalidPlanInput(field, std::format("expected an integer, got {}", v.dump()));
            }
            constexpr auto lo = static_cast<std::int64_t>(std::numeric_limits<int>::min());
            constexpr auto hi = static_cast<std::int64_t>(std::numeric_limits<int>::max());
            if (v.is_number_unsigned()) {
                if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(hi)) {
                    throw InvalidPlanInput(field, std::format("{} is out of range", v.dump()));
                }
                return static_cast<int>(v.get<std::uint64_t>());
            }
            std::int64_t x = v.get<std::int64_t>();
            if (x < lo || x > hi) {
                throw InvalidPlanInput(field, std::format("{} is out of range", v.dump()));
            }
            return static_cast<int>(x);
        }

        inline int getInt(const json& j, const char* key, const std::string& field) {
            return toInt(j.at(key), field);
        }

        /// @brief getInt(), or fallback when key is absent
        inline int valueInt(const json& j, const char* key, int fallback, const std::string& field) {
            return j.contains(key) ? toInt(j.at(key), field) : fallback;
        }

    } // namespace json_detail

    // ============================================================================
    // CATALOG RECORDS
    // ============================================================================

    inline void to_json(json& j, const RecipeOption& r) {
        j = json{
            {"recipe_id", r.recipe_id},
            {"servings_per_batch", r.servings_per_batch},
            {"ingredient_requirements", r.ingredient_requirements},
            {"meal_type", toString(r.meal_type)},
        };
    }

    inline void from_json(const json& j, RecipeOption& r) {
        j.at("recipe_id").get_to(r.recipe_id);
        r.servings_per_batch = json_detail::getInt(j, "servings_per_batch",
            std::format("recipes[{}].servings_per_batch", r.recipe_id));
        r.ingredient_requirements = j.value("ingredient_requirements", std::map<IngredientId, double>{});
        r.meal_type = parseMealType(j.value("meal_type", std::string("unknown")));
    }

    inline void to_json(json& j, const SupplyOption& s) {
        j = json{
            {"sku_id", s.sku_id},
            {"ingredient_id", s.ingredient_id},
            {"quantity_per_unit", s.quantity_per_unit},
            {"unit_cost", s.unit_cost},
        };
        if (!s.retailer.empty()) {
            j["retailer"] = s.retailer;
        }
    }

    inline void from_json(const json& j, SupplyOption& s) {
        j.at("sku_id").get_to(s.sku_id);
        j.at("ingredient_id").get_to(s.ingredient_id);
        j.at("quantity_per_unit").get_to(s.quantity_per_unit);
        s.unit_cost = j.value("unit_cost", 0.0);
        s.retailer = j.value("retailer", std::string());
    }

    // ============================================================================
    // OPTIONS & POLICY
    // ============================================================================

    inline void to_json(json& j, const PlanOptions& o) {
        json minimums = json::object();
        for (const auto& [type, minimum] : o.meal_type_minimums) {
            minimums[toString(type)] = minimum;
        }
        j = json{
            {"time_limit_seconds", o.time_limit_seconds},
            {"batch_penalty", o.batch_penalty},
            {"meal_type_minimums", minimums},
            {"required_recipe_ids", o.required_recipe_ids},
            {"include_every_recipe_ids", o.include_every_recipe_ids},
            {"include_every_servings_per_person", o.include_every_servings_per_person},
            {"threads", o.threads},
            {"mip_gap", o.mip_gap ? json(*o.mip_gap) : json(nullptr)},
            {"explain_infeasibility", o.explain_infeasibility},
        };
    }

    /// @brief Overlay: keys absent from j leave o unchanged. progress is never touched.
    inline void from_json(const json& j, PlanOptions& o) {
        o.time_limit_seconds = j.value("time_limit_seconds", o.time_limit_seconds);
        o.batch_penalty = j.value("batch_penalty", o.batch_penalty);
        o.include_every_servings_per_person = json_detail::valueInt(j, "include_every_servings_per_person",
            o.include_every_servings_per_person, "include_every_servings_per_person");
        o.threads = json_detail::valueInt(j, "threads", o.threads, "threads");
        o.explain_infeasibility = j.value("explain_infeasibility", o.explain_infeasibility);

        if (j.contains("mip_gap")) {
            const auto& gap = j.at("mip_gap");
            o.mip_gap = gap.is_null() ? std::nullopt : std::optional<double>(gap.get<double>());
        }
        if (j.contains("meal_type_minimums")) {
            o.meal_type_minimums.clear();
            for (const auto& item : j.at("meal_type_minimums").items()) {
                MealType type = parseMealType(item.key());
                o.meal_type_minimums[type] = json_detail::toInt(item.value(),
                    std::format("meal_type_minimums[{}]", toString(type)));
            }
        }
        if (j.contains("required_recipe_ids")) {
            j.at("required_recipe_ids").get_to(o.required_recipe_ids);
        }
        if (j.contains("include_every_recipe_ids")) {
            j.at("include_every_recipe_ids").get_to(o.include_every_recipe_ids);
        }
    }

    inline void to_json(json& j, const PlaceholderPolicy& p) {
        j = json{
            {"enabled", p.enabled},
            {"quantity_per_unit", p.quantity_per_unit},
            {"unit_cost", p.unit_cost},
        };
    }

    inline void from_json(const json& j, PlaceholderPolicy& p) {
        p.enabled = j.value("enabled", p.enabled);
        p.quantity_per_unit = j.value("quantity_per_unit", p.quantity_per_unit);
        p.unit_cost = j.value("unit_cost", p.unit_cost);
    }

    // ============================================================================
    // RESULT, SHOPPING LIST, ANOMALIES
    // ============================================================================

    inline void to_json(json& j, const PlanResult& r) {
        j = json{
            {"schema_version", kResultSchemaVersion},
            {"status", toString(r.status)},
            {"objective_value", r.objective_value ? json(*r.objective_value) : json(nullptr)},
            {"recipe_batches", r.recipe_batches},
            {"sku_units", r.sku_units},
            {"has_incumbent", r.has_incumbent},
            {"grocery_cost", r.grocery_cost},
            {"total_servings", r.total_servings},
            {"total_batches", r.total_batches},
            {"placeholder_ingredients", r.placeholder_ingredients},
            {"mip_gap", r.mip_gap ? json(*r.mip_gap) : json(nullptr)},
            {"runtime_seconds", r.runtime_seconds},
            {"conflicting_constraints", r.conflicting_constraints},
        };
    }

    /// @throws InvalidPlanInput for a schema_version other than 1
    inline void from_json(const json& j, PlanResult& r) {
        int version = json_detail::getInt(j, "schema_version", "schema_version");
        if (version != kResultSchemaVersion) {
            throw InvalidPlanInput("schema_version",
                std::format("unsupported version {}, expected {}", version, kResultSchemaVersion));
        }
        r.status = parsePlanStatus(j.at("status").get<std::string>());
        const auto& obj = j.at("objective_value");
        r.objective_value = obj.is_null() ? std::nullopt : std::optional<double>(obj.get<double>());
        j.at("recipe_batches").get_to(r.recipe_batches);
        j.at("sku_units").get_to(r.sku_units);
        r.has_incumbent = j.value("has_incumbent", r.objective_value.has_value());
        r.grocery_cost = j.value("grocery_cost", 0.0);
        r.total_servings = j.value("total_servings", 0LL);
        r.total_batches = j.value("total_batches", 0LL);
        r.placeholder_ingredients = j.value("placeholder_ingredients", std::vector<IngredientId>{});
        if (j.contains("mip_gap") && !j.at("mip_gap").is_null()) {
            r.mip_gap = j.at("mip_gap").get<double>();
        }
        r.runtime_seconds = j.value("runtime_seconds", 0.0);
        r.conflicting_constraints = j.value("conflicting_constraints", std::vector<std::string>{});
    }

    inline void to_json(json& j, const ShoppingLine& l) {
        j = json{
            {"sku_id", l.sku_id},
            {"ingredient_id", l.ingredient_id},
            {"units", l.units},
            {"unit_cost", l.unit_cost},
            {"line_cost", l.line_cost},
            {"placeholder", l.placeholder},
            {"retailer", l.retailer},
        };
    }

    inline void from_json(const json& j, ShoppingLine& l) {
        j.at("sku_id").get_to(l.sku_id);
        j.at("ingredient_id").get_to(l.ingredient_id);
        j.at("units").get_to(l.units);
        j.at("unit_cost").get_to(l.unit_cost);
        j.at("line_cost").get_to(l.line_cost);
        l.placeholder = j.value("placeholder", isPlaceholderSku(l.sku_id));
        l.retailer = j.value("retailer", std::string());
    }

    inline void to_json(json& j, const IngredientTotals& t) {
        j = json{{"required", t.required}, {"purchased", t.purchased}, {"leftover", t.leftover}};
    }

    inline void from_json(const json& j, IngredientTotals& t) {
        j.at("required").get_to(t.required);
        j.at("purchased").get_to(t.purchased);
        t.leftover = j.value("leftover", t.purchased - t.required);
    }

    inline void to_json(json& j, const ShoppingList& s) {
        j = json{
            {"lines", s.lines},
            {"ingredients", s.ingredients},
            {"total_cost", s.total_cost},
            {"has_placeholders", s.has_placeholders},
        };
    }

    inline void from_json(const json& j, ShoppingList& s) {
        j.at("lines").get_to(s.lines);
        j.at("ingredients").get_to(s.ingredients);
        j.at("total_cost").get_to(s.total_cost);
        s.has_placeholders = j.value("has_placeholders", false);
    }

    inline void to_json(json& j, const Anomaly& a) {
        j = json{
            {"sku_id", a.sku_id},
            {"ingredient_id", a.ingredient_id},
            {"units", a.units},
            {"line_cost", a.line_cost},
            {"reasons", a.reasons},
        };
    }

    inline void from_json(const json& j, Anomaly& a) {
        j.at("sku_id").get_to(a.sku_id);
        j.at("ingredient_id").get_to(a.ingredient_id);
        j.at("units").get_to(a.units);
        j.at("line_cost").get_to(a.line_cost);
        j.at("reasons").get_to(a.reasons);
    }

    // ============================================================================
    // DOCUMENTS
    // ============================================================================

    /// @brief Defaults shared by every request of one deployment
    struct PlannerConfig {
        double time_limit_seconds = 10.0;
        double batch_penalty = 1e-4;
        int threads = 0;
        std::optional<double> mip_gap;
        PlaceholderPolicy placeholders;

        PlanOptions defaultOptions() const {
            PlanOptions o;
            o.time_limit_seconds = time_limit_seconds;
            o.batch_penalty = batch_penalty;
            o.threads = threads;
            o.mip_gap = mip_gap;
            return o;
        }
    };

    inline void from_json(const json& j, PlannerConfig& c) {
        c.time_limit_seconds = j.value("time_limit_seconds", c.time_limit_seconds);
        c.batch_penalty = j.value("batch_penalty", c.batch_penalty);
        c.threads = json_detail::valueInt(j, "threads", c.threads, "threads");
        if (j.contains("mip_gap")) {
            const auto& gap = j.at("mip_gap");
            c.mip_gap = gap.is_null() ? std::nullopt : std::optional<double>(gap.get<double>());
        }
        if (j.contains("placeholders")) {
            from_json(j.at("placeholders"), c.placeholders);
        }
    }

    struct PlanRequest {
        int target_servings = 0;
        std::vector<RecipeOption> recipes;
        std::vector<SupplyOption> supply;
        std::set<std::string> retailers;    ///< empty keeps every retailer
        PlanOptions options;
        PlaceholderPolicy placeholders;
    };

    inline void to_json(json& j, const PlanRequest& r) {
        j = json{
            {"target_servings", r.target_servings},
            {"recipes", r.recipes},
            {"supply", r.supply},
            {"options", r.options},
            {"placeholders", r.placeholders},
        };
        if (!r.retailers.empty()) {
            j["retailers"] = r.retailers;
        }
    }

    /// @brief Keys absent from j keep the values already in r (config defaults)
    inline void from_json(const json& j, PlanRequest& r) {
        r.target_servings = json_detail::getInt(j, "target_servings", "target_servings");
        j.at("recipes").get_to(r.recipes);
        r.supply = j.value("supply", std::vector<SupplyOption>{});
        r.retailers = j.value("retailers", std::set<std::string>{});
        if (j.contains("options")) {
            from_json(j.at("options"), r.options);
        }
        if (j.contains("placeholders")) {
            from_json(j.at("placeholders"), r.placeholders);
        }
    }

    namespace json_detail {

        template<typename Fn>
        auto guarded(Fn&& fn) -> decltype(fn()) {
            try {
                return fn();
            } catch (const json::exception& e) {
                throw InvalidPlanInput("json", e.what());
            }
        }

        inline std::string readFile(const std::string& path) {
            std::ifstream in(path);
            if (!in) {
                throw std::runtime_error(std::format("cannot open '{}'", path));
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

    } // namespace json_detail

    /// @throws InvalidPlanInput on malformed JSON or wrong field types
    inline PlannerConfig parsePlannerConfig(const std::string& text) {
        return json_detail::guarded([&] {
            PlannerConfig c;
            from_json(json::parse(text), c);
            return c;
        });
    }

    /**
     * @brief Parse a request, starting from the given deployment defaults
     * @throws InvalidPlanInput on malformed JSON or wrong field types
     */
    inline PlanRequest parsePlanRequest(const std::string& text, const PlannerConfig& config = {}) {
        return json_detail::guarded([&] {
            PlanRequest r;
            r.options = config.defaultOptions();
            r.placeholders = config.placeholders;
            from_json(json::parse(text), r);
            return r;
        });
    }

    /// @throws InvalidPlanInput on malformed JSON or an unsupported schema_version
    inline PlanResult parsePlanResult(const std::string& text) {
        return json_detail::guarded([&] {
            return json::parse(text).get<PlanResult>();
        });
    }

    /// @throws std::runtime_error when the file cannot be read
    inline PlannerConfig loadPlannerConfig(const std::string& path) {
        return parsePlannerConfig(json_detail::readFile(path));
    }

    inline PlanRequest loadPlanRequest(const std::string& path, const PlannerConfig& config = {}) {
        return parsePlanRequest(json_detail::readFile(path), config);
    }

    /// @brief Output document of the command-line driver
    inline json planReport(const PlanResult& result,
                           const ShoppingList& list,
                           const std::vector<Anomaly>& anomalies,
                           const std::vector<IngredientId>& missing)
    {
        json j = result;
        j["shopping_list"] = list;
        j["anomalies"] = anomalies;
        j["missing_ingredients"] = missing;
        return j;
    }

} // namespace mealplan
