#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <omp.h>

#include "../extmerge/buffer_plan.hpp"
#include "../extmerge/merger.hpp"

namespace fs = std::filesystem;

int main(int argc, char **argv)
{
    if (argc < 7)
    {
        std::cerr << "Usage: ./merge_omp <final_out> <mem_budget_kb> <reclaim 0|1> <queue_capacity> <src_1> <src_2> [src_n...]\n";
        return 1;
    }

    const std::string final_out = argv[1];
    const uint64_t mem_budget_kb = std::stoull(argv[2]);
    const bool reclaim = std::stoi(argv[3]) != 0;
    const size_t queue_capacity = std::stoull(argv[4]);

    std::vector<fs::path> files;
    for (int i = 5; i < argc; ++i)
        files.emplace_back(argv[i]);

    extmerge::MergeOptions options = extmerge::MergeOptions::with_budget(mem_budget_kb * 1024ULL);
    options.reclaim_disk_space = reclaim;
    options.context.mode = extmerge::ExecutionContext::Mode::Threaded;
    options.context.queue_capacity = queue_capacity;

    // One producer thread per source plus the merging thread.
    const int threads = static_cast<int>(files.size()) + 1;
    if (threads > omp_get_thread_limit())
    {
        std::cout << "WARNING: " << threads << " threads needed but the OpenMP limit is "
                  << omp_get_thread_limit() << "; sources will be scanned sequentially\n";
    }

    std::vector<uint64_t> sizes;
    uint64_t total_input = 0;
    for (const auto &f : files)
    {
        std::error_code ec;
        const uint64_t s = fs::file_size(f, ec);
        sizes.push_back(ec ? 0 : s);
        total_input += sizes.back();
    }

    std::cout << "=== merge_omp configuration ===\n"
              << "Total RAM Budget: " << mem_budget_kb << " KB\n"
              << "Threads: " << threads << "\n"
              << "Queue capacity: " << queue_capacity << " records/source\n"
              << "Reclaim disk space: " << (reclaim ? "yes" : "no") << "\n"
              << "Input files: " << files.size() << "\n"
              << "Input bytes: " << total_input << "\n";

    try
    {
        const extmerge::MergeBufferPlan plan =
            extmerge::plan_merge_buffers(options.memory_budget, options.write_ratio, sizes);
        std::cout << "Output buffer: " << plan.write_buffer_size << " bytes\n";
        for (size_t i = 0; i < files.size(); ++i)
            std::cout << "  " << files[i].string() << ": read buffer " << plan.read_buffer_sizes[i] << " bytes\n";
        std::cout << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    const double t0 = omp_get_wtime();
    extmerge::MergeStats stats;
    try
    {
        stats = extmerge::merge_files_inverse(files, final_out, options);
    }
    catch (const extmerge::SourceScanFailure &e)
    {
        std::cerr << "FATAL: Merge failed: " << e.what() << "\n";
        for (const auto &m : e.close_errors())
            std::cerr << "       while closing: " << m << "\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "FATAL: Merge failed: " << e.what() << "\n";
        return 2;
    }
    const double t1 = omp_get_wtime();

    std::cout << "Merge complete in " << std::fixed << std::setprecision(2)
              << (t1 - t0) << " s\n\n";

    std::cout << "=== Merge Complete ===\n";
    std::cout << "Output (reverse order): " << final_out << "\n";
    std::cout << "Records: " << stats.records << "\n";
    std::cout << "Bytes: " << stats.bytes_written << "\n";
    return 0;
}
