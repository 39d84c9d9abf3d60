#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "../core/catalog.hpp"
#include "../core/product.hpp"
#include "../core/types.hpp"

namespace libprecise {

/**
 * @brief Outcome of a coverage query
 */
enum class CoverageStatus {
    COVERED,        ///< At least one combination covers the window
    NO_COVERAGE,    ///< No valid product combination for the window
    INVALID_WINDOW  ///< Window start is after window end
};

/**
 * @brief Lower-bound verdict for one candidate
 */
enum class CandidateOutcome {
    COMPLETE,            ///< Every settled epoch carries all required categories
    NO_SETTLED_HISTORY,  ///< No epoch settled at window start; accepted as is
    MISSING_CATEGORY     ///< Some settled epoch lacks a required category
};

/**
 * @brief Diagnostics for one combination that passed the upper-bound pass
 */
struct CandidateReport {
    ProductIdentity identity;
    CandidateOutcome outcome = CandidateOutcome::COMPLETE;
    size_t settled_epochs = 0;                  ///< Distinct end_validity instants checked
    Timestamp failing_epoch;                    ///< First incomplete epoch (MISSING_CATEGORY only)
    std::vector<std::string> missing_categories;///< Categories absent at failing_epoch

    bool isValid() const {
        return outcome != CandidateOutcome::MISSING_CATEGORY;
    }
};

/**
 * @brief Combinations with full coverage of one window, per analysis center
 */
class CoverageResult {
public:
    CoverageStatus status = CoverageStatus::NO_COVERAGE;

    /// analysis center -> sorted valid (project, solution) pairs
    std::map<std::string, std::vector<ProductCombination>> valid_products;

    /// Every upper-bound candidate, in identity order
    std::vector<CandidateReport> candidates;

    bool isCovered() const { return status == CoverageStatus::COVERED; }

    /**
     * @brief Analysis centers with at least one valid combination
     */
    std::vector<std::string> analysisCenters() const;

    /**
     * @brief Valid combinations of one center (empty for an unknown center)
     */
    std::vector<ProductCombination> combinations(const std::string& analysis_center) const;

    /**
     * @brief Distinct valid project types of one center
     */
    std::vector<std::string> projectTypes(const std::string& analysis_center) const;

    /**
     * @brief Distinct valid solution types of one center
     */
    std::vector<std::string> solutionTypes(const std::string& analysis_center) const;

    /**
     * @brief Check a user-chosen combination against the result
     */
    bool isValidCombination(const std::string& analysis_center,
                            const std::string& project_type,
                            const std::string& solution_type) const;

    /**
     * @brief Total number of valid combinations across centers
     */
    size_t numValidCombinations() const;
};

/**
 * @brief Decides which product combinations cover a window without gaps
 *
 * Two passes over an immutable catalog:
 *  - upper bound: a combination is a candidate only if one of its files
 *    reaches window.end (end_validity + duration >= window.end);
 *  - lower bound: every distinct end_validity at or before window.start
 *    must carry all required file categories. One incomplete epoch rejects
 *    the whole combination. A candidate without any settled epoch passes.
 */
class CoverageResolver {
public:
    CoverageResolver() = default;

    /**
     * @brief Resolve coverage for a window
     * @param catalog Parsed product records
     * @param window Requested window
     * @param required_categories File categories every settled epoch must carry
     * @return Result with status COVERED, NO_COVERAGE or INVALID_WINDOW
     */
    CoverageResult resolve(const ProductCatalog& catalog,
                           const TimeWindow& window,
                           const std::set<std::string>& required_categories) const;

private:
    using EpochCategories = std::map<Timestamp, std::set<std::string>>;

    /**
     * @brief Upper-bound pass
     */
    std::set<ProductIdentity> findCandidates(const ProductCatalog& catalog,
                                             const Timestamp& window_end) const;

    /**
     * @brief Settled epochs of every combination, keyed by end_validity
     */
    std::map<ProductIdentity, EpochCategories> collectSettledEpochs(const ProductCatalog& catalog,
                                                                    const Timestamp& window_start) const;

    /**
     * @brief Lower-bound pass for one candidate
     */
    CandidateReport checkSettledEpochs(const ProductIdentity& identity,
                                       const EpochCategories* epochs,
                                       const std::set<std::string>& required_categories) const;
};

/**
 * @brief Human-readable status
 */
std::string statusToString(CoverageStatus status);

/**
 * @brief Human-readable candidate outcome
 */
std::string outcomeToString(CandidateOutcome outcome);

} // namespace libprecise
