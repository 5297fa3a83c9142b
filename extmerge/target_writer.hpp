// target_writer.hpp
#ifndef EXTMERGE_TARGET_WRITER_HPP
#define EXTMERGE_TARGET_WRITER_HPP

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "buffer_plan.hpp"
#include "errors.hpp"

namespace extmerge
{

    // Serializes records as r1 + sep + r2 + sep + ... through one fixed buffer.
    // The buffer is written out exactly when it is full, and by finish().
    class TargetWriter
    {
    public:
        TargetWriter(std::ostream &out, size_t buf_size, std::string separator)
            : out_(out), buf_(buf_size), sep_(std::move(separator))
        {
            if (buf_size < MIN_WRITE_BUFFER_BYTES)
                throw BufferTooSmall("write buffer", buf_size, MIN_WRITE_BUFFER_BYTES);
        }

        // Goes straight to the stream, bypassing the buffer (used for the BOM).
        void write_prefix(std::string_view bytes)
        {
            if (bytes.empty())
                return;
            if (pos_ > 0)
                flush_();
            write_out_(bytes.data(), bytes.size());
        }

        void write_record(std::string_view record)
        {
            if (records_ > 0)
                append_(sep_);
            append_(record);
            ++records_;
        }

        void finish()
        {
            if (pos_ > 0)
                flush_();
            out_.flush();
            if (!out_.good())
                throw IoFailure("flush failed on target");
        }

        uint64_t records() const { return records_; }
        uint64_t bytes_written() const { return bytes_written_; }
        size_t buffered() const { return pos_; }

    private:
        std::ostream &out_;
        std::vector<char> buf_;
        std::string sep_;
        size_t pos_ = 0;
        uint64_t records_ = 0;
        uint64_t bytes_written_ = 0;

        void append_(std::string_view data)
        {
            while (!data.empty())
            {
                const size_t n = std::min(data.size(), buf_.size() - pos_);
                std::memcpy(buf_.data() + pos_, data.data(), n);
                pos_ += n;
                data.remove_prefix(n);
                if (pos_ == buf_.size())
                    flush_();
            }
        }

        void flush_()
        {
            write_out_(buf_.data(), pos_);
            pos_ = 0;
        }

        void write_out_(const char *data, size_t n)
        {
            out_.write(data, static_cast<std::streamsize>(n));
            if (!out_.good())
                throw IoFailure("write failed on target after " + std::to_string(bytes_written_) + " bytes");
            bytes_written_ += n;
        }
    };

} // namespace extmerge

#endif
