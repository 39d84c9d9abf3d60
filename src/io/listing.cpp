#include <libprecise++/io/listing.hpp>
#include <libprecise++/io/product_filename.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

namespace libprecise {
namespace io {

void MemoryListingProvider::addLines(int gps_week, const std::vector<std::string>& lines) {
    auto& week_lines = weeks_[gps_week];
    week_lines.insert(week_lines.end(), lines.begin(), lines.end());
}

std::vector<std::string> MemoryListingProvider::listWeek(int gps_week) {
    auto it = weeks_.find(gps_week);
    if (it == weeks_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> DirectoryListingProvider::listWeek(int gps_week) {
    namespace fs = std::filesystem;

    const fs::path week_dir = fs::path(root_) / std::to_string(gps_week);
    std::error_code ec;
    if (!fs::is_directory(week_dir, ec)) {
        return {};
    }

    std::vector<std::string> lines;
    for (const auto& entry : fs::directory_iterator(week_dir)) {
        if (entry.is_regular_file()) {
            lines.push_back(entry.path().filename().string());
        }
    }

    // Directory order is unspecified
    std::sort(lines.begin(), lines.end());
    return lines;
}

std::vector<std::string> fetchListings(ListingProvider& provider,
                                       const std::vector<int>& weeks,
                                       int workers) {
    if (weeks.empty()) {
        return {};
    }

    // One slot per week; workers never touch another week's slot
    std::vector<std::vector<std::string>> batches(weeks.size());
    std::vector<std::exception_ptr> errors(weeks.size());
    std::atomic<size_t> next_week{0};

    auto work = [&]() {
        for (size_t i = next_week++; i < weeks.size(); i = next_week++) {
            try {
                batches[i] = provider.listWeek(weeks[i]);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    const size_t pool_size = std::min(weeks.size(), static_cast<size_t>(std::max(workers, 1)));
    std::vector<std::thread> pool;
    pool.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        pool.emplace_back(work);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::vector<std::string> lines;
    std::set<std::string> seen_files;
    for (const auto& batch : batches) {
        for (const auto& line : batch) {
            const std::string filename = product_filename::firstToken(line);
            if (filename.empty()) {
                continue;
            }
            if (!seen_files.insert(filename).second) {
                continue;
            }
            lines.push_back(line);
        }
    }

    return lines;
}

bool readListingFile(const std::string& filename, std::vector<std::string>& lines) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    lines.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return true;
}

bool writeListingFile(const std::string& filename, const std::vector<std::string>& lines) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::set<std::string> seen_files;
    for (const auto& line : lines) {
        const std::string name = product_filename::firstToken(line);
        auto record = product_filename::parse(name);
        if (!record) {
            continue;
        }
        if (!seen_files.insert(name).second) {
            continue;
        }
        file << name << " " << time_utils::formatDateTime(record->end_validity) << "\n";
    }

    return file.good();
}

} // namespace io
} // namespace libprecise
