// errors.hpp
#ifndef EXTMERGE_ERRORS_HPP
#define EXTMERGE_ERRORS_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace extmerge
{

    // Base of everything the merge throws on purpose.
    class MergeError : public std::runtime_error
    {
    public:
        explicit MergeError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // Bad arguments. Always thrown before any byte is read or written.
    class InvalidConfiguration : public MergeError
    {
    public:
        explicit InvalidConfiguration(const std::string &msg) : MergeError("invalid configuration: " + msg) {}
    };

    class BufferTooSmall : public MergeError
    {
    public:
        BufferTooSmall(const std::string &what_buffer, size_t size, size_t minimum)
            : MergeError("buffer too small: " + what_buffer + " has " + std::to_string(size) +
                         " bytes, minimum is " + std::to_string(minimum)),
              size_(size), minimum_(minimum) {}

        size_t size() const { return size_; }
        size_t minimum() const { return minimum_; }

    private:
        size_t size_;
        size_t minimum_;
    };

    class IoFailure : public MergeError
    {
    public:
        explicit IoFailure(const std::string &msg) : MergeError(msg) {}
    };

    // A source could not be sized, opened or scanned.
    // Close errors hit while tearing the merge down are attached to it.
    class SourceScanFailure : public MergeError
    {
    public:
        SourceScanFailure(const std::filesystem::path &source, const std::string &reason)
            : MergeError("failed to scan source " + source.string() + ": " + reason), source_(source) {}

        const std::filesystem::path &source() const { return source_; }
        const std::vector<std::string> &close_errors() const { return close_errors_; }
        void add_close_error(const std::string &msg) { close_errors_.push_back(msg); }

    private:
        std::filesystem::path source_;
        std::vector<std::string> close_errors_;
    };

    class ReclamationInvariantViolation : public MergeError
    {
    public:
        ReclamationInvariantViolation(const std::filesystem::path &source, uint64_t actual, uint64_t segment,
                                      uint64_t expected)
            : MergeError("source " + source.string() + " must be drained to " + std::to_string(expected) +
                         " bytes; real-size=" + std::to_string(actual) + ", segment-size=" + std::to_string(segment)),
              source_(source), actual_(actual) {}

        const std::filesystem::path &source() const { return source_; }
        uint64_t actual_size() const { return actual_; }

    private:
        std::filesystem::path source_;
        uint64_t actual_;
    };

    // Raised on the orchestrating thread once another task has failed.
    class OperationCancelled : public MergeError
    {
    public:
        explicit OperationCancelled(const std::string &msg) : MergeError(msg) {}
    };

} // namespace extmerge

#endif
