// order.hpp
#ifndef EXTMERGE_ORDER_HPP
#define EXTMERGE_ORDER_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string_view>

#include "charset.hpp"

namespace extmerge
{

    // "a comes before b" over raw record bytes.
    using ByteComparator = std::function<bool(std::string_view, std::string_view)>;

    // Unsigned lexicographic byte order.
    inline ByteComparator ascending_order()
    {
        return [](std::string_view a, std::string_view b)
        { return a < b; };
    }

    inline ByteComparator descending_order()
    {
        return [](std::string_view a, std::string_view b)
        { return b < a; };
    }

    inline ByteComparator reversed(ByteComparator cmp)
    {
        return [cmp = std::move(cmp)](std::string_view a, std::string_view b)
        { return cmp(b, a); };
    }

    namespace detail
    {
        inline uint32_t load_unit(std::string_view s, size_t at, size_t width, bool le)
        {
            uint32_t v = 0;
            for (size_t i = 0; i < width; ++i)
            {
                const size_t k = le ? width - 1 - i : i;
                v = (v << 8) | static_cast<unsigned char>(s[at + k]);
            }
            return v;
        }
    } // namespace detail

    // Lexicographic order over the code units of cs.
    // For UTF-8 and big endian charsets this is plain byte order.
    inline ByteComparator code_unit_order(Charset cs)
    {
        if (!is_little_endian(cs))
            return ascending_order();

        const size_t width = code_unit_size(cs);
        return [width](std::string_view a, std::string_view b)
        {
            const size_t n = std::min(a.size(), b.size()) / width;
            for (size_t i = 0; i < n; ++i)
            {
                const uint32_t ua = detail::load_unit(a, i * width, width, true);
                const uint32_t ub = detail::load_unit(b, i * width, width, true);
                if (ua != ub)
                    return ua < ub;
            }
            // Trailing partial units fall back to byte order.
            return a.substr(n * width) < b.substr(n * width);
        };
    }

} // namespace extmerge

#endif
