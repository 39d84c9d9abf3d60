#include <libprecise++/io/product_filename.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace libprecise {
namespace io {
namespace product_filename {

namespace {

bool isUpperAlnum(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) ||
           (c >= 'A' && c <= 'Z');
}

bool isUpper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool matches(const std::string& s, size_t pos, size_t len, bool (*pred)(char)) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (!pred(s[i])) {
            return false;
        }
    }
    return true;
}

// NNu: two digits followed by a unit letter
bool isSpanField(const std::string& s, size_t pos) {
    return matches(s, pos, 2, isDigit) &&
           std::isalpha(static_cast<unsigned char>(s[pos + 2]));
}

} // namespace

std::string firstToken(const std::string& line) {
    std::istringstream iss(line);
    std::string token;
    iss >> token;
    return token;
}

std::optional<ProductRecord> parse(const std::string& filename) {
    if (filename.length() <= CATEGORY_POS) {
        return std::nullopt;
    }

    if (!matches(filename, CENTER_POS, 3, isUpperAlnum)) return std::nullopt;
    if (!isDigit(filename[PADDING_POS])) return std::nullopt;
    if (!matches(filename, PROJECT_POS, 3, isUpper)) return std::nullopt;
    if (!matches(filename, SOLUTION_POS, 3, isUpper)) return std::nullopt;
    if (filename[TIMESTAMP_POS - 1] != '_') return std::nullopt;
    if (!matches(filename, TIMESTAMP_POS, 11, isDigit)) return std::nullopt;
    if (filename[DURATION_POS - 1] != '_') return std::nullopt;
    if (!isSpanField(filename, DURATION_POS)) return std::nullopt;
    if (filename[SAMPLE_RATE_POS - 1] != '_') return std::nullopt;
    if (!isSpanField(filename, SAMPLE_RATE_POS)) return std::nullopt;
    if (filename[CONTENT_POS - 1] != '_') return std::nullopt;
    if (filename[CATEGORY_DOT_POS] != '.') return std::nullopt;

    // Category runs up to the end or the compression suffix
    size_t category_end = filename.find('.', CATEGORY_POS);
    if (category_end == std::string::npos) {
        category_end = filename.length();
    }
    if (category_end == CATEGORY_POS) return std::nullopt;
    if (!matches(filename, CATEGORY_POS, category_end - CATEGORY_POS, isUpperAlnum)) {
        return std::nullopt;
    }

    const int year = std::stoi(filename.substr(TIMESTAMP_POS, 4));
    const int day_of_year = std::stoi(filename.substr(TIMESTAMP_POS + 4, 3));
    const int hour = std::stoi(filename.substr(TIMESTAMP_POS + 7, 2));
    const int minute = std::stoi(filename.substr(TIMESTAMP_POS + 9, 2));

    ProductRecord record;
    if (!time_utils::fromYearDayOfYear(year, day_of_year, hour, minute, record.end_validity)) {
        return std::nullopt;
    }

    const int duration_days = std::stoi(filename.substr(DURATION_POS, 2));
    record.duration = TimeSpan(duration_days * constants::SECONDS_PER_DAY);

    record.analysis_center = filename.substr(CENTER_POS, 3);
    record.project_type = filename.substr(PROJECT_POS, 3);
    record.solution_type = filename.substr(SOLUTION_POS, 3);
    record.file_category = filename.substr(CATEGORY_POS, category_end - CATEGORY_POS);
    record.raw_name = filename;

    return record;
}

std::optional<ProductRecord> parseLine(const std::string& line) {
    const std::string filename = firstToken(line);
    if (filename.empty()) {
        return std::nullopt;
    }
    return parse(filename);
}

bool isProductFilename(const std::string& filename) {
    return parse(filename).has_value();
}

std::string format(const ProductRecord& record) {
    if (record.analysis_center.length() != 3 ||
        record.project_type.length() != 3 ||
        record.solution_type.length() != 3 ||
        record.file_category.empty()) {
        return "";
    }

    const long long seconds = record.duration.count();
    if (seconds < 0 || seconds % constants::SECONDS_PER_DAY != 0 ||
        seconds / constants::SECONDS_PER_DAY > 99) {
        return "";
    }

    int year, day_of_year, hour, minute;
    time_utils::toYearDayOfYear(record.end_validity, year, day_of_year, hour, minute);
    if (year < 0 || year > 9999) {
        return "";
    }

    std::ostringstream oss;
    oss << record.analysis_center << '0' << record.project_type << record.solution_type << '_'
        << std::setfill('0')
        << std::setw(4) << year
        << std::setw(3) << day_of_year
        << std::setw(2) << hour
        << std::setw(2) << minute << '_'
        << std::setw(2) << seconds / constants::SECONDS_PER_DAY << "D_01D_OSB."
        << record.file_category;
    return oss.str();
}

} // namespace product_filename
} // namespace io
} // namespace libprecise
