// verify_sorted.cpp
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "../extmerge/verifier.hpp"

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: ./verify_sorted <file> [asc|desc] [expected_records]\n";
        return 1;
    }

    const std::string filename = argv[1];
    const std::string direction = (argc >= 3) ? argv[2] : "asc";
    const bool check_count = argc >= 4;
    const uint64_t expected = check_count ? std::stoull(argv[3]) : 0;

    if (direction != "asc" && direction != "desc")
    {
        std::cerr << "ERROR: direction must be asc or desc, got " << direction << "\n";
        return 1;
    }

    extmerge::VerifyOptions options;
    options.order = direction == "asc" ? extmerge::ascending_order() : extmerge::descending_order();
    options.read_buffer = 1024 * 1024;

    std::cout << "Verifying file: " << filename << "\n";
    std::cout << "Expected order: " << direction << "\n";

    extmerge::VerifyReport report;
    try
    {
        std::cout << "File size: " << (std::filesystem::file_size(filename) / 1024.0 / 1024.0) << " MB\n\n";
        report = extmerge::verify_order(filename, options);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (!report.sorted)
    {
        std::cerr << "ERROR: Records not sorted at record " << report.violation_index << "\n";
        std::cerr << "       Previous: \"" << report.previous << "\"\n";
        std::cerr << "       Current:  \"" << report.current << "\"\n";
        return 1;
    }
    if (check_count && report.records != expected)
    {
        std::cerr << "ERROR: Count mismatch. Expected " << expected << ", got " << report.records << "\n";
        return 1;
    }

    std::cout << "=== VERIFICATION SUCCESSFUL ===\n";
    std::cout << "Total records: " << report.records << "\n";
    return 0;
}
