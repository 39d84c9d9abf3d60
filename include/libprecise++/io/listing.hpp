#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace libprecise {
namespace io {

/**
 * @brief Source of raw archive listing lines, one GPS week at a time
 *
 * Implementations must be safe to call from several threads at once for
 * different weeks.
 */
class ListingProvider {
public:
    ListingProvider() = default;
    virtual ~ListingProvider() = default;

    /**
     * @brief Raw lines ("<filename> [metadata...]") of one archive week
     */
    virtual std::vector<std::string> listWeek(int gps_week) = 0;
};

/**
 * @brief Listing held in memory, keyed by GPS week
 */
class MemoryListingProvider : public ListingProvider {
public:
    MemoryListingProvider() = default;
    explicit MemoryListingProvider(std::map<int, std::vector<std::string>> weeks)
        : weeks_(std::move(weeks)) {}

    /**
     * @brief Add lines to a week
     */
    void addLines(int gps_week, const std::vector<std::string>& lines);

    std::vector<std::string> listWeek(int gps_week) override;

private:
    std::map<int, std::vector<std::string>> weeks_;
};

/**
 * @brief Local mirror laid out like the product archive (<root>/<week>/<files>)
 *
 * A missing week directory yields no lines.
 */
class DirectoryListingProvider : public ListingProvider {
public:
    explicit DirectoryListingProvider(const std::string& root) : root_(root) {}

    std::vector<std::string> listWeek(int gps_week) override;

    const std::string& getRoot() const { return root_; }

private:
    std::string root_;
};

/**
 * @brief Fetch several weeks in parallel and concatenate them in week order
 * @param provider Listing source
 * @param weeks GPS weeks to fetch
 * @param workers Size of the worker pool (clamped to 1..weeks.size())
 * @return Lines of all weeks; a filename listed in several weeks is kept once
 *
 * An exception thrown by the provider is rethrown once all workers have
 * finished.
 */
std::vector<std::string> fetchListings(ListingProvider& provider,
                                       const std::vector<int>& weeks,
                                       int workers = 4);

/**
 * @brief Read a flat listing file, one entry per line
 */
bool readListingFile(const std::string& filename, std::vector<std::string>& lines);

/**
 * @brief Write a listing snapshot as "<filename> <YYYY-MM-DD HH:MM:SS>"
 *
 * Lines whose filename does not parse, and repeated filenames, are skipped.
 * @return false if the file cannot be written
 */
bool writeListingFile(const std::string& filename, const std::vector<std::string>& lines);

} // namespace io
} // namespace libprecise
