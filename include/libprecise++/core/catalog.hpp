#pragma once

#include <map>
#include <string>
#include <vector>
#include "product.hpp"

namespace libprecise {

/**
 * @brief Immutable table of parsed product records
 *
 * Built once from a batch of listing lines. Lines that do not follow the
 * product filename grammar are dropped and counted. Query results point
 * into the catalog and stay valid for its lifetime; concurrent queries
 * need no locking.
 */
class ProductCatalog {
public:
    using RecordRefs = std::vector<const ProductRecord*>;
    using IdentityGroups = std::map<ProductIdentity, RecordRefs>;

    ProductCatalog() = default;
    explicit ProductCatalog(std::vector<ProductRecord> records);

    /**
     * @brief Parse a batch of listing lines into a catalog
     */
    static ProductCatalog build(const std::vector<std::string>& lines);

    /**
     * @brief All records in insertion order
     */
    const std::vector<ProductRecord>& records() const { return records_; }

    size_t size() const { return records_.size(); }

    bool empty() const { return records_.empty(); }

    /**
     * @brief Non-blank lines that did not yield a record
     */
    size_t rejectedLines() const { return rejected_lines_; }

    /**
     * @brief Records grouped by (center, project, solution)
     */
    IdentityGroups groupByIdentity() const;

    /**
     * @brief Records whose data reaches instant or beyond
     *        (end_validity + duration >= instant)
     */
    RecordRefs recordsCoveringOrPast(const Timestamp& instant) const;

    /**
     * @brief Records already settled at instant (end_validity <= instant)
     */
    RecordRefs recordsSettledBeforeOrAt(const Timestamp& instant) const;

private:
    std::vector<ProductRecord> records_;
    size_t rejected_lines_ = 0;
};

} // namespace libprecise
