// kway_merge.hpp
#ifndef EXTMERGE_KWAY_MERGE_HPP
#define EXTMERGE_KWAY_MERGE_HPP

#include <queue>
#include <string>
#include <vector>

#include "errors.hpp"
#include "order.hpp"
#include "record_source.hpp"

namespace extmerge
{

    // Lazily interleaves ordered sources into one ordered stream.
    // Equal records come out in source order.
    class KWayMerger
    {
    public:
        KWayMerger(std::vector<RecordSource *> sources, ByteComparator cmp)
            : sources_(std::move(sources)), heads_(sources_.size()), cmp_(std::move(cmp)),
              heap_(HeapCmp{this})
        {
            if (!cmp_)
                throw InvalidConfiguration("KWayMerger: no comparator");
        }

        KWayMerger(const KWayMerger &) = delete;
        KWayMerger &operator=(const KWayMerger &) = delete;

        bool next(std::string &out)
        {
            if (!primed_)
            {
                for (size_t i = 0; i < sources_.size(); ++i)
                {
                    if (sources_[i]->pull(heads_[i]))
                        heap_.push(i);
                }
                primed_ = true;
            }
            if (heap_.empty())
                return false;

            const size_t idx = heap_.top();
            heap_.pop();
            out.swap(heads_[idx]);
            if (sources_[idx]->pull(heads_[idx]))
                heap_.push(idx);
            return true;
        }

    private:
        // priority_queue keeps the "largest" on top, so this answers
        // "does a come out after b".
        struct HeapCmp
        {
            const KWayMerger *self;

            bool operator()(size_t a, size_t b) const
            {
                const std::string &ra = self->heads_[a];
                const std::string &rb = self->heads_[b];
                if (self->cmp_(rb, ra))
                    return true;
                if (self->cmp_(ra, rb))
                    return false;
                return a > b;
            }
        };

        std::vector<RecordSource *> sources_;
        std::vector<std::string> heads_;
        ByteComparator cmp_;
        std::priority_queue<size_t, std::vector<size_t>, HeapCmp> heap_;
        bool primed_ = false;
    };

} // namespace extmerge

#endif
