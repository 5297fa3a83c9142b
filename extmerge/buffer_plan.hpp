// buffer_plan.hpp
#ifndef EXTMERGE_BUFFER_PLAN_HPP
#define EXTMERGE_BUFFER_PLAN_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

namespace extmerge
{

    static constexpr size_t MIN_WRITE_BUFFER_BYTES = 16;
    static constexpr size_t MIN_READ_BUFFER_BYTES = 16;
    static constexpr size_t DEFAULT_BUFFER_BYTES = 8192;
    static constexpr uint64_t DEFAULT_MEMORY_BUDGET = 2 * DEFAULT_BUFFER_BYTES;
    static constexpr double DEFAULT_WRITE_RATIO = 0.5;

    struct MergeBufferPlan
    {
        size_t write_buffer_size = 0;
        std::vector<size_t> read_buffer_sizes; // one per source, same order
    };

    // Splits total_bytes into one write buffer and one read buffer per source.
    // Read buffers are proportional to the source sizes. Every size is raised to
    // its minimum, so many tiny sources can push the total above total_bytes.
    inline MergeBufferPlan plan_merge_buffers(uint64_t total_bytes,
                                              double write_ratio,
                                              const std::vector<uint64_t> &source_sizes)
    {
        if (source_sizes.size() < 2)
        {
            throw InvalidConfiguration("number of given sources (" + std::to_string(source_sizes.size()) +
                                       ") must be greater than 1");
        }
        if (!(write_ratio > 0.0 && write_ratio < 1.0))
        {
            throw InvalidConfiguration("write ratio " + std::to_string(write_ratio) + " must be in (0, 1)");
        }

        MergeBufferPlan plan;
        plan.write_buffer_size = std::max(static_cast<size_t>(static_cast<double>(total_bytes) * write_ratio),
                                          MIN_WRITE_BUFFER_BYTES);

        const uint64_t left = total_bytes > plan.write_buffer_size ? total_bytes - plan.write_buffer_size : 0;
        const size_t read_budget = std::max(static_cast<size_t>(left), MIN_READ_BUFFER_BYTES);

        uint64_t files_size = 0;
        for (uint64_t s : source_sizes)
            files_size += s;

        plan.read_buffer_sizes.reserve(source_sizes.size());
        if (files_size == 0)
        {
            plan.read_buffer_sizes.assign(source_sizes.size(), MIN_READ_BUFFER_BYTES);
            return plan;
        }

        const double ratio = static_cast<double>(read_budget) / static_cast<double>(files_size);
        for (uint64_t s : source_sizes)
        {
            const size_t share = static_cast<size_t>(ratio * static_cast<double>(s));
            plan.read_buffer_sizes.push_back(std::max(share, MIN_READ_BUFFER_BYTES));
        }
        return plan;
    }

    // Used for caller supplied sizes; the planner output always passes.
    inline void check_buffer_plan(const MergeBufferPlan &plan)
    {
        if (plan.write_buffer_size < MIN_WRITE_BUFFER_BYTES)
        {
            throw BufferTooSmall("write buffer", plan.write_buffer_size, MIN_WRITE_BUFFER_BYTES);
        }
        for (size_t i = 0; i < plan.read_buffer_sizes.size(); ++i)
        {
            if (plan.read_buffer_sizes[i] < MIN_READ_BUFFER_BYTES)
            {
                throw BufferTooSmall("read buffer #" + std::to_string(i), plan.read_buffer_sizes[i],
                                     MIN_READ_BUFFER_BYTES);
            }
        }
    }

} // namespace extmerge

#endif
