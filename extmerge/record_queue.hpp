// record_queue.hpp
#ifndef EXTMERGE_RECORD_QUEUE_HPP
#define EXTMERGE_RECORD_QUEUE_HPP

#include <atomic>
#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// FastFlow bounded single-producer/single-consumer queue
#include <ff/buffer.hpp>

#include "errors.hpp"
#include "record_source.hpp"
#include "reverse_line_reader.hpp"

namespace extmerge
{

    // Records travelling from one producer thread to the orchestrator.
    class RecordQueue
    {
    public:
        explicit RecordQueue(size_t capacity) : buffer_(capacity)
        {
            if (!buffer_.init())
                throw std::runtime_error("RecordQueue: cannot allocate queue of " + std::to_string(capacity));
        }

        RecordQueue(const RecordQueue &) = delete;
        RecordQueue &operator=(const RecordQueue &) = delete;

        // Only valid once both ends are gone.
        ~RecordQueue()
        {
            void *p = nullptr;
            while (buffer_.pop(&p))
                delete static_cast<std::string *>(p);
        }

        // Producer side. Takes ownership on success.
        bool offer(std::unique_ptr<std::string> &rec)
        {
            if (!buffer_.push(rec.get()))
                return false;
            rec.release();
            return true;
        }

        // Consumer side. nullptr when empty.
        std::unique_ptr<std::string> poll()
        {
            void *p = nullptr;
            if (!buffer_.pop(&p))
                return nullptr;
            return std::unique_ptr<std::string>(static_cast<std::string *>(p));
        }

        // No more offers after this.
        void close() { closed_.store(true, std::memory_order_release); }
        bool closed() const { return closed_.load(std::memory_order_acquire); }

    private:
        ff::SWSR_Ptr_Buffer buffer_;
        std::atomic<bool> closed_{false};
    };

    // Consumer end of a RecordQueue, waits for the producer.
    class QueuedSource : public RecordSource
    {
    public:
        QueuedSource(RecordQueue &queue, const TaskGroup &group) : queue_(queue), group_(group) {}

        bool pull(std::string &out) override
        {
            while (true)
            {
                if (take_(out))
                    return true;
                if (queue_.closed())
                    return take_(out); // pushes made before close() are visible now
                if (group_.cancelled())
                    throw OperationCancelled("merge cancelled while waiting for records");
                std::this_thread::yield();
            }
        }

    private:
        RecordQueue &queue_;
        const TaskGroup &group_;

        bool take_(std::string &out)
        {
            std::unique_ptr<std::string> rec = queue_.poll();
            if (!rec)
                return false;
            out.swap(*rec);
            return true;
        }
    };

    // Producer loop: drains the reader into the queue, blocking while it is full.
    // Reader errors are reported to the group as SourceScanFailure.
    inline void produce_records(const std::filesystem::path &path, ReverseLineReader &reader, RecordQueue &queue,
                                TaskGroup &group)
    {
        try
        {
            while (!group.cancelled())
            {
                auto rec = std::make_unique<std::string>();
                if (!reader.next(*rec))
                {
                    queue.close();
                    return;
                }
                while (!queue.offer(rec))
                {
                    if (group.cancelled())
                        return;
                    std::this_thread::yield();
                }
            }
        }
        catch (const std::exception &e)
        {
            group.fail(std::make_exception_ptr(SourceScanFailure(path, e.what())));
        }
    }

} // namespace extmerge

#endif
