#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../extmerge/merger.hpp"

static inline double get_time()
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(high_resolution_clock::now().time_since_epoch()).count();
}

int main(int argc, char **argv)
{
    if (argc < 6)
    {
        std::cerr << "Usage: ./merge_seq <final_out> <mem_budget_kb> <reclaim 0|1> <src_1> <src_2> [src_n...]\n";
        std::cerr << "Example: ./merge_seq merged.txt 1024 1 runs/run_0.txt runs/run_1.txt\n";
        return 1;
    }

    const std::string output_file = argv[1];
    const uint64_t mem_budget_kb = std::stoull(argv[2]);
    const bool reclaim = std::stoi(argv[3]) != 0;

    std::vector<std::filesystem::path> inputs;
    for (int i = 4; i < argc; ++i)
        inputs.emplace_back(argv[i]);

    extmerge::MergeOptions options = extmerge::MergeOptions::with_budget(mem_budget_kb * 1024ull);
    options.reclaim_disk_space = reclaim;
    options.context.mode = extmerge::ExecutionContext::Mode::Sequential;

    std::cout << "=== Sequential Merge Configuration ===\n";
    std::cout << "Memory budget: " << mem_budget_kb << " KB\n";
    std::cout << "Write ratio: " << options.write_ratio << "\n";
    std::cout << "Input files: " << inputs.size() << "\n";
    std::cout << "Reclaim disk space: " << (reclaim ? "yes" : "no") << "\n\n";

    const double t_start = get_time();
    extmerge::MergeStats stats;

    try
    {
        stats = extmerge::merge_files_inverse(inputs, output_file, options);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: Merge failed: " << e.what() << "\n";
        return 1;
    }

    const double total_time = get_time() - t_start;
    std::cout << "\n=== Sequential Merge Complete ===\n";
    std::cout << "Output (reverse order): " << output_file << "\n";
    std::cout << "Time: " << std::fixed << std::setprecision(2) << total_time << " s\n";
    std::cout << "Records: " << stats.records << "\n";
    std::cout << "Throughput: " << (stats.bytes_written / 1024.0 / 1024.0 / total_time) << " MB/s\n";
    std::cout << "Total bytes: " << (stats.bytes_written / 1024.0 / 1024.0) << " MB\n";

    return 0;
}
