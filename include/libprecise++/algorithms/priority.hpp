#pragma once

#include <optional>
#include <string>
#include <vector>
#include "coverage.hpp"

namespace libprecise {

/**
 * @brief Ordered preference lists for picking one combination
 *
 * Project types are evaluated outermost: the first project type with any
 * preferred solution type wins, even if a later project type offers a
 * higher-ranked solution type.
 */
struct PriorityTable {
    std::vector<std::string> project_types;     ///< Most preferred first
    std::vector<std::string> solution_types;    ///< Most preferred first

    /**
     * @brief MGX; FIN before RAP before ULT
     */
    static PriorityTable defaults() {
        PriorityTable table;
        table.project_types = {"MGX"};
        table.solution_types = {"FIN", "RAP", "ULT"};
        return table;
    }
};

/**
 * @brief Pick the preferred combination among valid ones
 * @return Preferred combination, or std::nullopt if the priority lists do not
 *         intersect the candidates (no preference, not an error)
 */
std::optional<ProductCombination> selectOptimal(const std::vector<ProductCombination>& combinations,
                                                const PriorityTable& priority);

/**
 * @brief Pick the preferred combination of one analysis center
 */
std::optional<ProductCombination> selectOptimal(const CoverageResult& coverage,
                                                const std::string& analysis_center,
                                                const PriorityTable& priority);

} // namespace libprecise
