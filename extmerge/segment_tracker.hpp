// segment_tracker.hpp
#ifndef EXTMERGE_SEGMENT_TRACKER_HPP
#define EXTMERGE_SEGMENT_TRACKER_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "errors.hpp"

namespace extmerge
{

    // Exclusive end of the still unconsumed prefix of one source.
    // Written by that source's reader only, read by the reclaimer.
    class SegmentTracker
    {
    public:
        explicit SegmentTracker(uint64_t length) : end_(length) {}

        SegmentTracker(const SegmentTracker &) = delete;
        SegmentTracker &operator=(const SegmentTracker &) = delete;

        void advance(uint64_t boundary)
        {
            const uint64_t cur = end_.load(std::memory_order_relaxed);
            if (boundary > cur)
            {
                throw MergeError("segment boundary moved forward: " + std::to_string(cur) + " -> " +
                                 std::to_string(boundary));
            }
            end_.store(boundary, std::memory_order_release);
        }

        uint64_t get() const { return end_.load(std::memory_order_acquire); }

    private:
        std::atomic<uint64_t> end_;
    };

} // namespace extmerge

#endif
