// merge_options.hpp
#ifndef EXTMERGE_MERGE_OPTIONS_HPP
#define EXTMERGE_MERGE_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "buffer_plan.hpp"
#include "charset.hpp"
#include "order.hpp"

namespace extmerge
{

    static constexpr size_t DEFAULT_QUEUE_CAPACITY = 64;

    // Where the per-source producers run.
    struct ExecutionContext
    {
        enum class Mode
        {
            Sequential, // merge pulls from the readers directly
            Threaded    // one OpenMP thread per source, FastFlow queues in between
        };

        Mode mode = Mode::Threaded;
        size_t queue_capacity = DEFAULT_QUEUE_CAPACITY; // records per source queue
    };

    // Buffer size for a given file.
    using BufferSizeProvider = std::function<size_t(const std::filesystem::path &)>;

    struct MergeOptions
    {
        // Must be the reverse of the order the sources are sorted in.
        ByteComparator comparator = descending_order();
        std::string delimiter = "\n";
        std::string bom;

        // Either a budget split by the planner...
        uint64_t memory_budget = DEFAULT_MEMORY_BUDGET;
        double write_ratio = DEFAULT_WRITE_RATIO;

        // ...or explicit sizes. When set, both must be set and the budget is ignored.
        BufferSizeProvider source_buffer;
        BufferSizeProvider target_buffer;

        // Truncate sources while merging and delete them at the end.
        bool reclaim_disk_space = false;

        ExecutionContext context;

        static MergeOptions with_budget(uint64_t bytes, double ratio = DEFAULT_WRITE_RATIO)
        {
            MergeOptions o;
            o.memory_budget = bytes;
            o.write_ratio = ratio;
            return o;
        }

        static MergeOptions with_buffers(BufferSizeProvider source, BufferSizeProvider target)
        {
            MergeOptions o;
            o.source_buffer = std::move(source);
            o.target_buffer = std::move(target);
            return o;
        }

        // Delimiter and BOM encoded for cs; records compared by code unit, descending.
        static MergeOptions for_charset(Charset cs, std::string_view delimiter = "\n")
        {
            MergeOptions o;
            o.delimiter = encode_ascii(delimiter, cs);
            o.bom = bom_bytes(cs);
            o.comparator = reversed(code_unit_order(cs));
            return o;
        }

        bool uses_buffer_providers() const { return source_buffer || target_buffer; }
    };

    struct MergeStats
    {
        uint64_t records = 0;
        uint64_t bytes_written = 0;
    };

    // Options of the forward rewrite pass.
    struct InvertOptions
    {
        std::string delimiter = "\n";
        std::string bom;
        size_t read_buffer = DEFAULT_BUFFER_BYTES;
        size_t write_buffer = DEFAULT_BUFFER_BYTES;
    };

} // namespace extmerge

#endif
