// merger.hpp
#ifndef EXTMERGE_MERGER_HPP
#define EXTMERGE_MERGER_HPP

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include <omp.h>

#include "buffer_plan.hpp"
#include "disk_reclaimer.hpp"
#include "errors.hpp"
#include "kway_merge.hpp"
#include "merge_options.hpp"
#include "record_queue.hpp"
#include "record_source.hpp"
#include "reverse_line_reader.hpp"
#include "segment_tracker.hpp"
#include "target_writer.hpp"

namespace extmerge
{

    namespace detail
    {
        namespace fs = std::filesystem;

        struct SourceCursor
        {
            fs::path path;
            uint64_t length = 0;
            std::ifstream in;
            std::unique_ptr<SegmentTracker> segment;
            std::unique_ptr<ReverseLineReader> reader;
        };

        using Cursors = std::vector<std::unique_ptr<SourceCursor>>;

        inline std::string resolved(const fs::path &p)
        {
            std::error_code ec;
            const fs::path c = fs::weakly_canonical(p, ec);
            return ec ? fs::absolute(p).lexically_normal().string() : c.string();
        }

        inline uint64_t source_size(const fs::path &p)
        {
            std::error_code ec;
            const uint64_t size = fs::file_size(p, ec);
            if (ec)
                throw SourceScanFailure(p, "cannot get size: " + ec.message());
            return size;
        }

        inline void validate(const std::vector<fs::path> &sources, const fs::path &target, const MergeOptions &opt)
        {
            if (sources.size() < 2)
            {
                throw InvalidConfiguration("number of given sources (" + std::to_string(sources.size()) +
                                           ") must be greater than 1");
            }

            std::set<std::string> seen;
            for (const auto &s : sources)
            {
                if (!seen.insert(resolved(s)).second)
                    throw InvalidConfiguration("source " + s.string() + " is given more than once");
            }
            if (seen.count(resolved(target)))
                throw InvalidConfiguration("target " + target.string() + " is also a source");

            if (opt.delimiter.empty())
                throw InvalidConfiguration("empty delimiter");
            if (!opt.comparator)
                throw InvalidConfiguration("no comparator");
            if (opt.context.mode == ExecutionContext::Mode::Threaded && opt.context.queue_capacity == 0)
                throw InvalidConfiguration("queue capacity must be positive");
            if (opt.uses_buffer_providers() && !(opt.source_buffer && opt.target_buffer))
                throw InvalidConfiguration("source and target buffer providers must be given together");
        }

        inline MergeBufferPlan resolve_buffers(const std::vector<fs::path> &sources, const fs::path &target,
                                               const std::vector<uint64_t> &sizes, const MergeOptions &opt)
        {
            MergeBufferPlan plan;
            if (opt.uses_buffer_providers())
            {
                plan.write_buffer_size = opt.target_buffer(target);
                for (const auto &s : sources)
                    plan.read_buffer_sizes.push_back(opt.source_buffer(s));
                check_buffer_plan(plan);
            }
            else
            {
                plan = plan_merge_buffers(opt.memory_budget, opt.write_ratio, sizes);
            }

            // The reader needs room for two delimiters to make progress.
            for (size_t i = 0; i < plan.read_buffer_sizes.size(); ++i)
            {
                if (plan.read_buffer_sizes[i] < 2 * opt.delimiter.size())
                {
                    throw BufferTooSmall("read buffer of " + sources[i].string(), plan.read_buffer_sizes[i],
                                         2 * opt.delimiter.size());
                }
            }
            return plan;
        }

        // Best effort: every stream gets its close attempt.
        inline std::vector<std::string> close_all(Cursors &cursors)
        {
            std::vector<std::string> errors;
            for (auto &c : cursors)
            {
                if (!c->in.is_open())
                    continue;
                c->in.clear();
                c->in.close();
                if (c->in.fail())
                    errors.push_back("failed to close source " + c->path.string());
            }
            return errors;
        }

        // Orchestrator body shared by both execution modes.
        inline void drain_merge(KWayMerger &merger, TargetWriter &writer, DiskReclaimer &reclaimer,
                                const std::string &bom)
        {
            writer.write_prefix(bom);
            std::string record;
            while (merger.next(record))
            {
                writer.write_record(record);
                reclaimer.shrink();
            }
            writer.finish();
            reclaimer.shrink();
        }

        inline void run_sequential(Cursors &cursors, TargetWriter &writer, DiskReclaimer &reclaimer,
                                   const MergeOptions &opt, TaskGroup &group)
        {
            try
            {
                std::vector<std::unique_ptr<InlineSource>> owned;
                std::vector<RecordSource *> sources;
                for (auto &c : cursors)
                {
                    owned.push_back(std::make_unique<InlineSource>(c->path, *c->reader));
                    sources.push_back(owned.back().get());
                }
                KWayMerger merger(sources, opt.comparator);
                drain_merge(merger, writer, reclaimer, opt.bom);
            }
            catch (...)
            {
                group.fail(std::current_exception());
            }
        }

        // Thread 0 merges and writes, thread i+1 scans source i.
        inline void run_threaded(Cursors &cursors, TargetWriter &writer, DiskReclaimer &reclaimer,
                                 const MergeOptions &opt, TaskGroup &group)
        {
            std::vector<std::unique_ptr<RecordQueue>> queues;
            queues.reserve(cursors.size());
            for (size_t i = 0; i < cursors.size(); ++i)
                queues.push_back(std::make_unique<RecordQueue>(opt.context.queue_capacity));

            const int wanted = static_cast<int>(cursors.size()) + 1;

#pragma omp parallel num_threads(wanted)
            {
                const int tid = omp_get_thread_num();
                const int granted = omp_get_num_threads();

                if (granted < wanted)
                {
                    if (tid == 0)
                    {
                        std::cerr << "WARNING: OpenMP granted " << granted << " of " << wanted
                                  << " threads; scanning sources sequentially\n";
                        run_sequential(cursors, writer, reclaimer, opt, group);
                    }
                }
                else if (tid == 0)
                {
                    try
                    {
                        std::vector<std::unique_ptr<QueuedSource>> owned;
                        std::vector<RecordSource *> sources;
                        for (auto &q : queues)
                        {
                            owned.push_back(std::make_unique<QueuedSource>(*q, group));
                            sources.push_back(owned.back().get());
                        }
                        KWayMerger merger(sources, opt.comparator);
                        drain_merge(merger, writer, reclaimer, opt.bom);
                    }
                    catch (...)
                    {
                        group.fail(std::current_exception());
                    }
                }
                else
                {
                    SourceCursor &c = *cursors[static_cast<size_t>(tid - 1)];
                    try
                    {
                        produce_records(c.path, *c.reader, *queues[static_cast<size_t>(tid - 1)], group);
                    }
                    catch (...)
                    {
                        group.fail(std::current_exception());
                    }
                }
            }
        }
    } // namespace detail

    /**
     * Merges sorted line files into target, reading every source from its end to
     * its beginning. Sources must be sorted in the reverse of options.comparator
     * (ascending files with the default descending comparator), so the target
     * comes out reversed: invert_file() restores the direct order.
     *
     * Buffers come from options.memory_budget split by plan_merge_buffers(), or
     * from the buffer providers. With reclaim_disk_space the sources are truncated
     * while the merge runs and deleted when it completes.
     *
     * Throws InvalidConfiguration or BufferTooSmall before touching any file
     * content; SourceScanFailure, IoFailure or ReclamationInvariantViolation later.
     * Output written before a failure is left in place.
     *
     * A source with no content after its BOM yields no records, so an empty
     * file contributes nothing to the target, not even an empty record.
     */
    inline MergeStats merge_files_inverse(const std::vector<std::filesystem::path> &sources,
                                          const std::filesystem::path &target,
                                          const MergeOptions &options)
    {
        using namespace detail;

        validate(sources, target, options);

        std::vector<uint64_t> sizes;
        sizes.reserve(sources.size());
        for (const auto &s : sources)
            sizes.push_back(source_size(s));

        const MergeBufferPlan plan = resolve_buffers(sources, target, sizes, options);

        for (size_t i = 0; i < sources.size(); ++i)
        {
            if (sizes[i] < options.bom.size())
            {
                throw SourceScanFailure(sources[i], "file of " + std::to_string(sizes[i]) +
                                                        " bytes is shorter than the BOM");
            }
        }

        Cursors cursors;
        cursors.reserve(sources.size());
        DiskReclaimer reclaimer(options.reclaim_disk_space, options.bom.size());
        for (size_t i = 0; i < sources.size(); ++i)
        {
            auto c = std::make_unique<SourceCursor>();
            c->path = sources[i];
            c->length = sizes[i];
            c->in.open(sources[i], std::ios::binary);
            if (!c->in)
                throw SourceScanFailure(sources[i], "cannot open");

            c->segment = std::make_unique<SegmentTracker>(c->length);
            SegmentTracker *segment = c->segment.get();
            c->reader = std::make_unique<ReverseLineReader>(
                c->in, options.bom.size(), segment->get(), plan.read_buffer_sizes[i], options.delimiter,
                [segment](uint64_t boundary)
                { segment->advance(boundary); });
            reclaimer.track(c->path, *c->segment, c->length);
            cursors.push_back(std::move(c));
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out)
            throw IoFailure("cannot open target " + target.string());

        TargetWriter writer(out, plan.write_buffer_size, options.delimiter);
        TaskGroup group;

        if (options.context.mode == ExecutionContext::Mode::Threaded)
            run_threaded(cursors, writer, reclaimer, options, group);
        else
            run_sequential(cursors, writer, reclaimer, options, group);

        std::vector<std::string> close_errors = close_all(cursors);
        out.clear();
        out.close();
        if (out.fail())
            close_errors.push_back("failed to close target " + target.string());

        if (std::exception_ptr err = group.first_error())
        {
            try
            {
                std::rethrow_exception(err);
            }
            catch (SourceScanFailure &e)
            {
                for (const auto &m : close_errors)
                    e.add_close_error(m);
                throw;
            }
            catch (...)
            {
                for (const auto &m : close_errors)
                    std::cerr << "WARNING: " << m << "\n";
                throw;
            }
        }
        if (!close_errors.empty())
            throw IoFailure(close_errors.front());

        reclaimer.finalize();

        MergeStats stats;
        stats.records = writer.records();
        stats.bytes_written = writer.bytes_written();
        return stats;
    }

    /**
     * Rewrites source into target with the records in reverse order, keeping
     * the BOM in front. Applied to a merge_files_inverse() result it yields the
     * direct order.
     */
    inline MergeStats invert_file(const std::filesystem::path &source, const std::filesystem::path &target,
                                  const InvertOptions &options = InvertOptions())
    {
        if (detail::resolved(source) == detail::resolved(target))
            throw InvalidConfiguration("cannot invert " + source.string() + " in place");
        if (options.delimiter.empty())
            throw InvalidConfiguration("empty delimiter");
        if (options.read_buffer < MIN_READ_BUFFER_BYTES)
            throw BufferTooSmall("read buffer", options.read_buffer, MIN_READ_BUFFER_BYTES);
        if (options.write_buffer < MIN_WRITE_BUFFER_BYTES)
            throw BufferTooSmall("write buffer", options.write_buffer, MIN_WRITE_BUFFER_BYTES);

        const uint64_t length = detail::source_size(source);
        if (length < options.bom.size())
            throw SourceScanFailure(source, "file is shorter than the BOM");

        std::ifstream in(source, std::ios::binary);
        if (!in)
            throw SourceScanFailure(source, "cannot open");
        ReverseLineReader reader(in, options.bom.size(), length, options.read_buffer, options.delimiter);

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out)
            throw IoFailure("cannot open target " + target.string());
        TargetWriter writer(out, options.write_buffer, options.delimiter);

        InlineSource records(source, reader);
        writer.write_prefix(options.bom);
        std::string rec;
        while (records.pull(rec))
            writer.write_record(rec);
        writer.finish();

        out.close();
        if (out.fail())
            throw IoFailure("failed to close target " + target.string());

        MergeStats stats;
        stats.records = writer.records();
        stats.bytes_written = writer.bytes_written();
        return stats;
    }

} // namespace extmerge

#endif
