#pragma once

#include <string>
#include <tuple>
#include "types.hpp"

namespace libprecise {

/**
 * @brief (analysis center, project type, solution type) key of a product line
 */
struct ProductIdentity {
    std::string analysis_center;    ///< e.g. "COD"
    std::string project_type;       ///< e.g. "MGX"
    std::string solution_type;      ///< e.g. "FIN"

    ProductIdentity() = default;
    ProductIdentity(const std::string& center, const std::string& project, const std::string& solution)
        : analysis_center(center), project_type(project), solution_type(solution) {}

    /**
     * @brief "CENTER/PROJECT/SOLUTION"
     */
    std::string toString() const {
        return analysis_center + "/" + project_type + "/" + solution_type;
    }

    bool operator<(const ProductIdentity& other) const {
        return std::tie(analysis_center, project_type, solution_type) <
               std::tie(other.analysis_center, other.project_type, other.solution_type);
    }

    bool operator==(const ProductIdentity& other) const {
        return analysis_center == other.analysis_center &&
               project_type == other.project_type &&
               solution_type == other.solution_type;
    }
};

/**
 * @brief (project type, solution type) pair offered by one analysis center
 */
struct ProductCombination {
    std::string project_type;
    std::string solution_type;

    ProductCombination() = default;
    ProductCombination(const std::string& project, const std::string& solution)
        : project_type(project), solution_type(solution) {}

    bool operator<(const ProductCombination& other) const {
        return std::tie(project_type, solution_type) <
               std::tie(other.project_type, other.solution_type);
    }

    bool operator==(const ProductCombination& other) const {
        return project_type == other.project_type && solution_type == other.solution_type;
    }

    bool operator!=(const ProductCombination& other) const {
        return !(*this == other);
    }
};

/**
 * @brief One parsed entry of a product archive listing
 */
struct ProductRecord {
    std::string analysis_center;
    std::string project_type;
    std::string solution_type;
    Timestamp end_validity;         ///< Last instant the file is authoritative for
    TimeSpan duration{0};           ///< Reach of the data past end_validity
    std::string file_category;      ///< Content kind, e.g. "CLK", "BIA", "SP3"
    std::string raw_name;           ///< Original filename, diagnostics only

    ProductIdentity identity() const {
        return ProductIdentity(analysis_center, project_type, solution_type);
    }

    /**
     * @brief Last instant covered by this file's data
     */
    Timestamp coverageEnd() const {
        return end_validity + duration;
    }

    bool operator==(const ProductRecord& other) const {
        return analysis_center == other.analysis_center &&
               project_type == other.project_type &&
               solution_type == other.solution_type &&
               end_validity == other.end_validity &&
               duration == other.duration &&
               file_category == other.file_category;
    }
};

} // namespace libprecise
