#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "core/product.hpp"
#include "core/catalog.hpp"
#include "core/config.hpp"
#include "algorithms/coverage.hpp"
#include "algorithms/priority.hpp"
#include "io/product_filename.hpp"
#include "io/listing.hpp"

/**
 * @file resolver.hpp
 * @brief Main header file for LibPrecise++
 *
 * Include this file to access precise product coverage resolution:
 * listing parsing, catalog queries, coverage and preferred combination.
 */

namespace libprecise {

/**
 * @brief Statistics of the last resolution
 */
struct ResolverStats {
    size_t weeks_fetched = 0;           ///< GPS weeks requested from the listing provider
    size_t total_lines = 0;             ///< Listing lines handed to the catalog
    size_t accepted_records = 0;        ///< Lines that parsed into records
    size_t rejected_lines = 0;          ///< Non-blank lines that did not parse
    size_t candidates = 0;              ///< Combinations passing the upper-bound pass
    size_t valid_combinations = 0;      ///< Combinations passing both passes
    double processing_time_ms = 0.0;

    void reset() {
        *this = ResolverStats{};
    }
};

/**
 * @brief Main product resolver class
 *
 * Runs the listing -> catalog -> coverage pipeline for one window and
 * picks the preferred combination of an analysis center. A window with no
 * covering combination is reported through CoverageResult::status, never
 * as an exception.
 */
class ProductResolver {
public:
    ProductResolver();
    explicit ProductResolver(const ResolverConfig& config);
    ~ProductResolver();

    /**
     * @brief Load configuration from file
     * @param config_file Path to YAML configuration file
     * @param error Optional description of the failure
     * @return true if successful, false otherwise (current configuration kept)
     */
    bool loadConfig(const std::string& config_file, std::string* error = nullptr);

    void setConfig(const ResolverConfig& config);

    const ResolverConfig& getConfig() const;

    /**
     * @brief Resolve coverage from raw listing lines
     * @param lines Listing lines, one entry per line
     * @param window Requested window
     */
    CoverageResult resolve(const std::vector<std::string>& lines, const TimeWindow& window);

    /**
     * @brief Fetch every GPS week of the window from a provider, then resolve
     */
    CoverageResult resolve(io::ListingProvider& provider, const TimeWindow& window);

    /**
     * @brief Preferred combination of one center using the configured priorities
     * @return std::nullopt when no preferred combination is available
     */
    std::optional<ProductCombination> selectOptimal(const CoverageResult& result,
                                                    const std::string& analysis_center) const;

    /**
     * @brief Statistics of the last resolve() call
     */
    ResolverStats getStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace libprecise
