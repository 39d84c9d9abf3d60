#pragma once

#include <set>
#include <string>
#include "../algorithms/priority.hpp"

namespace libprecise {

/**
 * @brief Configuration parameters for product resolution
 *
 * YAML layout:
 *
 *     required_categories: [CLK, BIA, SP3]
 *     priority:
 *       project_types: [MGX]
 *       solution_types: [FIN, RAP, ULT]
 *     listing:
 *       workers: 4
 */
struct ResolverConfig {
    /// File categories every settled epoch must carry
    std::set<std::string> required_categories = {"CLK", "BIA", "SP3"};

    /// Preference order used by selectOptimal
    PriorityTable priority = PriorityTable::defaults();

    /// Worker threads for per-week listing fetches
    int listing_workers = 4;
};

/**
 * @brief Load configuration from a YAML file
 * @param filename Path to configuration file
 * @param config Updated only on success; missing keys keep their current value
 * @param error Optional description of the failure
 * @return true if successful, false otherwise
 */
bool loadConfig(const std::string& filename, ResolverConfig& config, std::string* error = nullptr);

/**
 * @brief Parse configuration from YAML text
 */
bool parseConfig(const std::string& yaml_text, ResolverConfig& config, std::string* error = nullptr);

} // namespace libprecise
