#include <libprecise++/resolver.hpp>
#include <chrono>

namespace libprecise {

class ProductResolver::Impl {
public:
    ResolverConfig config_;
    ResolverStats stats_;
    CoverageResolver coverage_;

    Impl() = default;
    explicit Impl(const ResolverConfig& config) : config_(config) {}

    CoverageResult run(const std::vector<std::string>& lines, const TimeWindow& window) {
        auto start_time = std::chrono::high_resolution_clock::now();

        const ProductCatalog catalog = ProductCatalog::build(lines);
        CoverageResult result = coverage_.resolve(catalog, window, config_.required_categories);

        auto end_time = std::chrono::high_resolution_clock::now();

        stats_.total_lines = lines.size();
        stats_.accepted_records = catalog.size();
        stats_.rejected_lines = catalog.rejectedLines();
        stats_.candidates = result.candidates.size();
        stats_.valid_combinations = result.numValidCombinations();
        stats_.processing_time_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();

        return result;
    }
};

ProductResolver::ProductResolver() : pImpl(std::make_unique<Impl>()) {}

ProductResolver::ProductResolver(const ResolverConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

ProductResolver::~ProductResolver() = default;

bool ProductResolver::loadConfig(const std::string& config_file, std::string* error) {
    return libprecise::loadConfig(config_file, pImpl->config_, error);
}

void ProductResolver::setConfig(const ResolverConfig& config) {
    pImpl->config_ = config;
}

const ResolverConfig& ProductResolver::getConfig() const {
    return pImpl->config_;
}

CoverageResult ProductResolver::resolve(const std::vector<std::string>& lines, const TimeWindow& window) {
    pImpl->stats_.reset();
    return pImpl->run(lines, window);
}

CoverageResult ProductResolver::resolve(io::ListingProvider& provider, const TimeWindow& window) {
    pImpl->stats_.reset();

    if (!window.isValid()) {
        CoverageResult result;
        result.status = CoverageStatus::INVALID_WINDOW;
        return result;
    }

    const auto weeks = gpsWeekRange(window);
    const auto lines = io::fetchListings(provider, weeks, pImpl->config_.listing_workers);

    CoverageResult result = pImpl->run(lines, window);
    pImpl->stats_.weeks_fetched = weeks.size();
    return result;
}

std::optional<ProductCombination> ProductResolver::selectOptimal(const CoverageResult& result,
                                                                 const std::string& analysis_center) const {
    return libprecise::selectOptimal(result, analysis_center, pImpl->config_.priority);
}

ResolverStats ProductResolver::getStats() const {
    return pImpl->stats_;
}

} // namespace libprecise
