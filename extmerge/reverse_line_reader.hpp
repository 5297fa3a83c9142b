// reverse_line_reader.hpp
#ifndef EXTMERGE_REVERSE_LINE_READER_HPP
#define EXTMERGE_REVERSE_LINE_READER_HPP

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace extmerge
{

    // Splits the byte range [begin, end) of a stream into delimiter separated
    // records and hands them out from the last one to the first one.
    //
    // Layout of buf_: bytes [head_, size) mirror the file range starting at
    // cursor_; [head_, tail_) is the part not yet turned into records.
    // Bytes of a record that does not fit into the buffer are moved to spill_.
    class ReverseLineReader
    {
    public:
        // Called with the new boundary each time a record is produced: the
        // offset of the record's leading delimiter, or begin for the first record.
        using Listener = std::function<void(uint64_t)>;

        ReverseLineReader(std::istream &in, uint64_t begin, uint64_t end, size_t buf_size,
                          std::string delimiter, Listener listener = Listener())
            : in_(in), buf_(buf_size), delim_(std::move(delimiter)), listener_(std::move(listener)),
              begin_(begin), cursor_(end), head_(buf_size), tail_(buf_size), done_(begin == end)
        {
            if (delim_.empty())
                throw InvalidConfiguration("ReverseLineReader: empty delimiter");
            if (buf_size < 2 * delim_.size())
                throw BufferTooSmall("read buffer", buf_size, 2 * delim_.size());
            if (begin > end)
            {
                throw MergeError("ReverseLineReader: range start " + std::to_string(begin) +
                                 " is past its end " + std::to_string(end));
            }
        }

        // Produces the previous record. Returns false once the range start is reached.
        bool next(std::string &out)
        {
            if (done_)
                return false;

            while (true)
            {
                const std::string_view window(buf_.data() + head_, tail_ - head_);
                const size_t found = window.rfind(delim_);
                if (found != std::string_view::npos)
                {
                    const size_t d = head_ + found;
                    const size_t from = d + delim_.size();
                    out.assign(buf_.data() + from, tail_ - from);
                    take_spill_(out);
                    tail_ = d;
                    publish_(cursor_ + (d - head_));
                    return true;
                }

                if (cursor_ == begin_)
                {
                    // Whatever is left is the first record of the range.
                    out.assign(buf_.data() + head_, tail_ - head_);
                    take_spill_(out);
                    tail_ = head_;
                    done_ = true;
                    publish_(begin_);
                    return true;
                }

                refill_();
            }
        }

        uint64_t boundary() const { return boundary_; }

    private:
        std::istream &in_;
        std::vector<char> buf_;
        std::string delim_;
        Listener listener_;

        uint64_t begin_ = 0;
        uint64_t cursor_ = 0; // file offset of buf_[head_]
        size_t head_ = 0;
        size_t tail_ = 0;
        bool done_ = false;
        uint64_t boundary_ = 0;

        // Oversized record chunks, the one closest to the file end first.
        std::vector<std::string> spill_;

        void publish_(uint64_t boundary)
        {
            boundary_ = boundary;
            if (listener_)
                listener_(boundary);
        }

        void take_spill_(std::string &out)
        {
            for (auto it = spill_.rbegin(); it != spill_.rend(); ++it)
                out += *it;
            spill_.clear();
        }

        // Moves the pending window to the back of buf_ and loads the bytes
        // preceding it into the freed front part.
        void refill_()
        {
            const size_t cap = buf_.size();

            if (tail_ - head_ == cap)
            {
                // No delimiter in a full buffer. Keep delim-1 leading bytes, which
                // may be the tail of a delimiter that starts before cursor_.
                const size_t keep = delim_.size() - 1;
                spill_.emplace_back(buf_.data() + head_ + keep, tail_ - head_ - keep);
                tail_ = head_ + keep;
            }

            const size_t pending = tail_ - head_;
            if (tail_ != cap)
            {
                std::memmove(buf_.data() + cap - pending, buf_.data() + head_, pending);
                head_ = cap - pending;
                tail_ = cap;
            }

            const size_t n = static_cast<size_t>(std::min<uint64_t>(head_, cursor_ - begin_));
            cursor_ -= n;
            head_ -= n;

            in_.clear();
            in_.seekg(static_cast<std::streamoff>(cursor_));
            in_.read(buf_.data() + head_, static_cast<std::streamsize>(n));
            if (static_cast<size_t>(in_.gcount()) != n)
            {
                throw IoFailure("short read at offset " + std::to_string(cursor_) + ": wanted " +
                                std::to_string(n) + " bytes, got " + std::to_string(in_.gcount()));
            }
        }
    };

} // namespace extmerge

#endif
