#include <libprecise++/algorithms/priority.hpp>
#include <set>

namespace libprecise {

std::optional<ProductCombination> selectOptimal(const std::vector<ProductCombination>& combinations,
                                                const PriorityTable& priority) {
    for (const auto& project_type : priority.project_types) {
        std::set<std::string> solutions;
        for (const auto& combination : combinations) {
            if (combination.project_type == project_type) {
                solutions.insert(combination.solution_type);
            }
        }

        for (const auto& solution_type : priority.solution_types) {
            if (solutions.count(solution_type) > 0) {
                return ProductCombination(project_type, solution_type);
            }
        }
    }

    return std::nullopt;
}

std::optional<ProductCombination> selectOptimal(const CoverageResult& coverage,
                                                const std::string& analysis_center,
                                                const PriorityTable& priority) {
    return selectOptimal(coverage.combinations(analysis_center), priority);
}

} // namespace libprecise
