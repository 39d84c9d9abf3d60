#include <libprecise++/core/catalog.hpp>
#include <libprecise++/io/product_filename.hpp>
#include <utility>

namespace libprecise {

ProductCatalog::ProductCatalog(std::vector<ProductRecord> records)
    : records_(std::move(records)) {}

ProductCatalog ProductCatalog::build(const std::vector<std::string>& lines) {
    ProductCatalog catalog;
    catalog.records_.reserve(lines.size());

    for (const auto& line : lines) {
        if (io::product_filename::firstToken(line).empty()) {
            continue; // Blank line
        }

        auto record = io::product_filename::parseLine(line);
        if (!record) {
            catalog.rejected_lines_++;
            continue;
        }
        catalog.records_.push_back(std::move(*record));
    }

    return catalog;
}

ProductCatalog::IdentityGroups ProductCatalog::groupByIdentity() const {
    IdentityGroups groups;
    for (const auto& record : records_) {
        groups[record.identity()].push_back(&record);
    }
    return groups;
}

ProductCatalog::RecordRefs ProductCatalog::recordsCoveringOrPast(const Timestamp& instant) const {
    RecordRefs result;
    for (const auto& record : records_) {
        if (record.coverageEnd() >= instant) {
            result.push_back(&record);
        }
    }
    return result;
}

ProductCatalog::RecordRefs ProductCatalog::recordsSettledBeforeOrAt(const Timestamp& instant) const {
    RecordRefs result;
    for (const auto& record : records_) {
        if (record.end_validity <= instant) {
            result.push_back(&record);
        }
    }
    return result;
}

} // namespace libprecise
