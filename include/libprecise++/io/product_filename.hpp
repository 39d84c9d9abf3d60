#pragma once

#include <optional>
#include <string>
#include "../core/product.hpp"

namespace libprecise {
namespace io {

/**
 * @brief Product archive filename codec
 *
 * Long product names follow
 *
 *     AAA0PPPSSS_YYYYDDDHHMM_DDu_RRu_xxx.CCC[.ext]
 *
 * AAA analysis center, 0 padding digit, PPP project type, SSS solution type,
 * YYYYDDDHHMM end of validity, DDu duration, RRu sample rate, xxx content,
 * CCC file category, ext compression suffix.
 */
namespace product_filename {

    /// Offsets of the fixed-width fields
    constexpr size_t CENTER_POS = 0;
    constexpr size_t PADDING_POS = 3;
    constexpr size_t PROJECT_POS = 4;
    constexpr size_t SOLUTION_POS = 7;
    constexpr size_t TIMESTAMP_POS = 11;
    constexpr size_t DURATION_POS = 23;
    constexpr size_t SAMPLE_RATE_POS = 27;
    constexpr size_t CONTENT_POS = 31;
    constexpr size_t CATEGORY_DOT_POS = 34;
    constexpr size_t CATEGORY_POS = 35;

    /**
     * @brief Parse a product filename
     * @return Record, or std::nullopt if the name does not follow the grammar
     *         or its timestamp does not decode
     *
     * The duration is always read as a number of days; its unit letter is
     * accepted but not interpreted.
     */
    std::optional<ProductRecord> parse(const std::string& filename);

    /**
     * @brief Parse one listing line ("<filename> [metadata...]")
     *
     * Only the first whitespace-delimited token is considered.
     */
    std::optional<ProductRecord> parseLine(const std::string& line);

    /**
     * @brief Check if a name follows the product filename grammar
     */
    bool isProductFilename(const std::string& filename);

    /**
     * @brief First whitespace-delimited token of a listing line
     */
    std::string firstToken(const std::string& line);

    /**
     * @brief Generate the canonical filename for a record
     *
     * Padding is "0", duration "NND", sample rate "01D" and content "OSB".
     * Returns an empty string for a record that cannot be represented
     * (wrong code lengths, duration not a whole number of days in 0..99).
     */
    std::string format(const ProductRecord& record);
}

} // namespace io
} // namespace libprecise
