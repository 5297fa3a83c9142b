// disk_reclaimer.hpp
#ifndef EXTMERGE_DISK_RECLAIMER_HPP
#define EXTMERGE_DISK_RECLAIMER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "segment_tracker.hpp"

namespace extmerge
{

    // Gives disk space back while the merge runs: sources are cut down to their
    // segment boundary after every merge step and removed at the end.
    // Does nothing when disabled.
    class DiskReclaimer
    {
    public:
        DiskReclaimer(bool enabled, uint64_t drained_size) : enabled_(enabled), drained_size_(drained_size) {}

        bool enabled() const { return enabled_; }

        void track(const std::filesystem::path &path, const SegmentTracker &segment, uint64_t length)
        {
            sources_.push_back({path, &segment, length});
        }

        // Every byte at or past a boundary is already a record in memory.
        void shrink()
        {
            if (!enabled_)
                return;
            for (auto &s : sources_)
            {
                const uint64_t seg = s.segment->get();
                if (seg == s.truncated)
                    continue;

                std::error_code ec;
                std::filesystem::resize_file(s.path, seg, ec);
                if (ec)
                {
                    throw IoFailure("cannot truncate " + s.path.string() + " to " + std::to_string(seg) +
                                    ": " + ec.message());
                }
                s.truncated = seg;
            }
        }

        // Call once the source streams are closed.
        void finalize()
        {
            if (!enabled_)
                return;
            for (const auto &s : sources_)
            {
                std::error_code ec;
                const uint64_t size = std::filesystem::file_size(s.path, ec);
                if (ec)
                    throw IoFailure("cannot stat " + s.path.string() + ": " + ec.message());
                if (size != drained_size_)
                    throw ReclamationInvariantViolation(s.path, size, s.segment->get(), drained_size_);

                if (!std::filesystem::remove(s.path, ec) || ec)
                    throw IoFailure("cannot delete drained source " + s.path.string() + ": " + ec.message());
            }
        }

    private:
        struct Tracked
        {
            std::filesystem::path path;
            const SegmentTracker *segment;
            uint64_t truncated; // last size we cut the file to
        };

        bool enabled_;
        uint64_t drained_size_;
        std::vector<Tracked> sources_;
    };

} // namespace extmerge

#endif
