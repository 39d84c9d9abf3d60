#include <iostream>
#include <libprecise++/resolver.hpp>

int main() {
    try {
        // Create resolver with default categories (CLK, BIA, SP3) and priorities
        libprecise::ProductResolver resolver;

        std::cout << "Reading product listing..." << std::endl;

        std::vector<std::string> lines;
        if (!libprecise::io::readListingFile("data/CDDIS.list", lines)) {
            std::cerr << "Error: Could not read data/CDDIS.list" << std::endl;
            return 1;
        }

        const auto window = libprecise::TimeWindow::fromStrings("2025-07-05_00:00:00",
                                                                "2025-07-05_23:59:30");
        auto result = resolver.resolve(lines, window);

        if (!result.isCovered()) {
            std::cerr << "Error: " << libprecise::statusToString(result.status) << std::endl;
            return 1;
        }

        auto stats = resolver.getStats();
        std::cout << "Resolution Results:" << std::endl;
        std::cout << "  Records accepted: " << stats.accepted_records << std::endl;
        std::cout << "  Lines rejected: " << stats.rejected_lines << std::endl;
        std::cout << "  Valid combinations: " << stats.valid_combinations << std::endl;

        for (const auto& center : result.analysisCenters()) {
            auto optimal = resolver.selectOptimal(result, center);
            std::cout << "  " << center << ": ";
            if (optimal) {
                std::cout << optimal->project_type << "/" << optimal->solution_type << std::endl;
            } else {
                std::cout << "no preferred combination" << std::endl;
            }
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
