/*
================================================================================
EXAMPLE 02: PLAN FROM JSON - Command-line planner
================================================================================

USAGE
-----
    02_plan_from_json --request=examples/data/weekly_request.json \
                      [--config=examples/data/planner_config.json] \
                      [--output=plan.json] [--time_limit=30] [--explain] [--v=1]

FLOW
----
    config (optional) -> request -> retailer filter -> placeholders -> solve()
        -> shopping list -> anomaly flags -> result JSON

EXIT CODES
----------
    0   a plan exists (Optimal, or Not Solved with an incumbent)
    2   Infeasible, Unbounded, Undefined or no incumbent
    1   invalid input, unreadable file or solver error

================================================================================
*/

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include <meal_planner/meal_planner.h>

ABSL_FLAG(std::string, request, "", "Path of the plan request JSON (required).");
ABSL_FLAG(std::string, config, "", "Path of a planner config JSON with deployment defaults.");
ABSL_FLAG(std::string, output, "", "Where to write the result JSON; stdout when empty.");
ABSL_FLAG(double, time_limit, 0.0, "Solver time limit in seconds; overrides config and request when > 0.");
ABSL_FLAG(bool, explain, false, "List conflicting constraints when the plan is infeasible.");

namespace {

std::vector<mealplan::SupplyOption> filterRetailers(const mealplan::PlanRequest& request) {
    if (request.retailers.empty()) {
        return request.supply;
    }
    std::vector<mealplan::SupplyOption> kept;
    for (const auto& s : request.supply) {
        if (request.retailers.contains(s.retailer)) {
            kept.push_back(s);
        }
    }
    LOG(INFO) << "plan.retailers kept " << kept.size() << " of " << request.supply.size() << " skus";
    return kept;
}

int run() {
    const std::string requestPath = absl::GetFlag(FLAGS_request);
    if (requestPath.empty()) {
        std::cerr << "--request is required\n";
        return 1;
    }

    mealplan::PlannerConfig config;
    if (const std::string configPath = absl::GetFlag(FLAGS_config); !configPath.empty()) {
        config = mealplan::loadPlannerConfig(configPath);
    }

    mealplan::PlanRequest request = mealplan::loadPlanRequest(requestPath, config);
    if (absl::GetFlag(FLAGS_time_limit) > 0.0) {
        request.options.time_limit_seconds = absl::GetFlag(FLAGS_time_limit);
    }
    if (absl::GetFlag(FLAGS_explain)) {
        request.options.explain_infeasibility = true;
    }

    auto augmented = mealplan::withPlaceholders(request.recipes, filterRetailers(request),
                                                request.placeholders);

    auto result = mealplan::solve(request.target_servings, request.recipes,
                                  augmented.options, request.options);
    auto list = mealplan::buildShoppingList(result, request.recipes, augmented.options);
    auto anomalies = mealplan::detectAnomalies(list);
    for (const auto& a : anomalies) {
        LOG(WARNING) << "plan.anomaly sku=" << a.sku_id << " units=" << a.units
                     << " cost=" << a.line_cost;
    }

    const std::string report =
        mealplan::planReport(result, list, anomalies, augmented.missing).dump(2);

    if (const std::string outputPath = absl::GetFlag(FLAGS_output); !outputPath.empty()) {
        std::ofstream out(outputPath);
        if (!out) {
            std::cerr << "cannot write '" << outputPath << "'\n";
            return 1;
        }
        out << report << "\n";
    } else {
        std::cout << report << "\n";
    }

    return result.usable() ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage("Plan recipe batches and grocery purchases from a JSON request.");
    absl::ParseCommandLine(argc, argv);
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
    absl::InitializeLog();

    try {
        return run();
    } catch (mealplan::InvalidPlanInput& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
