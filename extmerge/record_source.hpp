// record_source.hpp
#ifndef EXTMERGE_RECORD_SOURCE_HPP
#define EXTMERGE_RECORD_SOURCE_HPP

#include <atomic>
#include <exception>
#include <filesystem>
#include <mutex>
#include <string>

#include "errors.hpp"
#include "reverse_line_reader.hpp"

namespace extmerge
{

    // ------------------ cancellation ------------------

    // Shared by the producers and the orchestrator of one merge.
    // Keeps the first failure; any failure cancels everybody.
    class TaskGroup
    {
    public:
        void fail(std::exception_ptr err)
        {
            {
                std::lock_guard<std::mutex> lock(mu_);
                if (!first_)
                    first_ = err;
            }
            cancelled_.store(true, std::memory_order_release);
        }

        bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

        std::exception_ptr first_error() const
        {
            std::lock_guard<std::mutex> lock(mu_);
            return first_;
        }

    private:
        mutable std::mutex mu_;
        std::exception_ptr first_;
        std::atomic<bool> cancelled_{false};
    };

    // ------------------ sources ------------------

    // Ordered stream of records pulled by the merge.
    class RecordSource
    {
    public:
        virtual ~RecordSource() = default;

        // Returns false when the source has no more records.
        virtual bool pull(std::string &out) = 0;
    };

    // Reads on the caller's thread.
    class InlineSource : public RecordSource
    {
    public:
        InlineSource(std::filesystem::path path, ReverseLineReader &reader)
            : path_(std::move(path)), reader_(reader) {}

        bool pull(std::string &out) override
        {
            try
            {
                return reader_.next(out);
            }
            catch (const std::exception &e)
            {
                throw SourceScanFailure(path_, e.what());
            }
        }

    private:
        std::filesystem::path path_;
        ReverseLineReader &reader_;
    };

} // namespace extmerge

#endif
