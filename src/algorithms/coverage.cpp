#include <libprecise++/algorithms/coverage.hpp>
#include <algorithm>
#include <utility>

namespace libprecise {

std::vector<std::string> CoverageResult::analysisCenters() const {
    std::vector<std::string> centers;
    centers.reserve(valid_products.size());
    for (const auto& entry : valid_products) {
        centers.push_back(entry.first);
    }
    return centers;
}

std::vector<ProductCombination> CoverageResult::combinations(const std::string& analysis_center) const {
    auto it = valid_products.find(analysis_center);
    if (it == valid_products.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> CoverageResult::projectTypes(const std::string& analysis_center) const {
    std::vector<std::string> result;
    for (const auto& combination : combinations(analysis_center)) {
        if (std::find(result.begin(), result.end(), combination.project_type) == result.end()) {
            result.push_back(combination.project_type);
        }
    }
    return result;
}

std::vector<std::string> CoverageResult::solutionTypes(const std::string& analysis_center) const {
    std::vector<std::string> result;
    for (const auto& combination : combinations(analysis_center)) {
        if (std::find(result.begin(), result.end(), combination.solution_type) == result.end()) {
            result.push_back(combination.solution_type);
        }
    }
    return result;
}

bool CoverageResult::isValidCombination(const std::string& analysis_center,
                                        const std::string& project_type,
                                        const std::string& solution_type) const {
    auto it = valid_products.find(analysis_center);
    if (it == valid_products.end()) {
        return false;
    }
    const ProductCombination wanted(project_type, solution_type);
    return std::find(it->second.begin(), it->second.end(), wanted) != it->second.end();
}

size_t CoverageResult::numValidCombinations() const {
    size_t count = 0;
    for (const auto& entry : valid_products) {
        count += entry.second.size();
    }
    return count;
}

CoverageResult CoverageResolver::resolve(const ProductCatalog& catalog,
                                         const TimeWindow& window,
                                         const std::set<std::string>& required_categories) const {
    CoverageResult result;

    if (!window.isValid()) {
        result.status = CoverageStatus::INVALID_WINDOW;
        return result;
    }

    const auto candidates = findCandidates(catalog, window.end);
    const auto settled = collectSettledEpochs(catalog, window.start);

    // std::set iteration keeps each center's list sorted
    for (const auto& identity : candidates) {
        auto it = settled.find(identity);
        const EpochCategories* epochs = (it != settled.end()) ? &it->second : nullptr;

        CandidateReport report = checkSettledEpochs(identity, epochs, required_categories);
        if (report.isValid()) {
            result.valid_products[identity.analysis_center].emplace_back(
                identity.project_type, identity.solution_type);
        }
        result.candidates.push_back(std::move(report));
    }

    result.status = result.valid_products.empty() ? CoverageStatus::NO_COVERAGE
                                                  : CoverageStatus::COVERED;
    return result;
}

std::set<ProductIdentity> CoverageResolver::findCandidates(const ProductCatalog& catalog,
                                                           const Timestamp& window_end) const {
    std::set<ProductIdentity> candidates;
    for (const auto* record : catalog.recordsCoveringOrPast(window_end)) {
        candidates.insert(record->identity());
    }
    return candidates;
}

std::map<ProductIdentity, CoverageResolver::EpochCategories>
CoverageResolver::collectSettledEpochs(const ProductCatalog& catalog,
                                       const Timestamp& window_start) const {
    std::map<ProductIdentity, EpochCategories> settled;
    for (const auto* record : catalog.recordsSettledBeforeOrAt(window_start)) {
        settled[record->identity()][record->end_validity].insert(record->file_category);
    }
    return settled;
}

CandidateReport CoverageResolver::checkSettledEpochs(const ProductIdentity& identity,
                                                     const EpochCategories* epochs,
                                                     const std::set<std::string>& required_categories) const {
    CandidateReport report;
    report.identity = identity;

    // A combination with nothing settled before the window has no epoch that
    // could be incomplete. It is accepted, but reported separately.
    if (epochs == nullptr || epochs->empty()) {
        report.outcome = CandidateOutcome::NO_SETTLED_HISTORY;
        return report;
    }

    report.settled_epochs = epochs->size();
    report.outcome = CandidateOutcome::COMPLETE;

    for (const auto& epoch : *epochs) {
        const auto& present = epoch.second;
        for (const auto& category : required_categories) {
            if (present.find(category) == present.end()) {
                report.missing_categories.push_back(category);
            }
        }

        if (!report.missing_categories.empty()) {
            report.outcome = CandidateOutcome::MISSING_CATEGORY;
            report.failing_epoch = epoch.first;
            break;
        }
    }

    return report;
}

std::string statusToString(CoverageStatus status) {
    switch (status) {
        case CoverageStatus::COVERED:        return "covered";
        case CoverageStatus::NO_COVERAGE:    return "no valid product combination for window";
        case CoverageStatus::INVALID_WINDOW: return "window start is after window end";
    }
    return "unknown";
}

std::string outcomeToString(CandidateOutcome outcome) {
    switch (outcome) {
        case CandidateOutcome::COMPLETE:           return "complete";
        case CandidateOutcome::NO_SETTLED_HISTORY: return "no settled history";
        case CandidateOutcome::MISSING_CATEGORY:   return "missing category";
    }
    return "unknown";
}

} // namespace libprecise
