// charset.hpp
#ifndef EXTMERGE_CHARSET_HPP
#define EXTMERGE_CHARSET_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace extmerge
{

    // Encodings a line file may be written in.
    // UTF_16 is big endian and always starts with a byte-order mark.
    enum class Charset
    {
        UTF_8,
        UTF_16,
        UTF_16BE,
        UTF_16LE,
        UTF_32BE,
        UTF_32LE
    };

    inline size_t code_unit_size(Charset cs)
    {
        switch (cs)
        {
        case Charset::UTF_8:
            return 1;
        case Charset::UTF_16:
        case Charset::UTF_16BE:
        case Charset::UTF_16LE:
            return 2;
        case Charset::UTF_32BE:
        case Charset::UTF_32LE:
            return 4;
        }
        return 1;
    }

    inline bool is_little_endian(Charset cs)
    {
        return cs == Charset::UTF_16LE || cs == Charset::UTF_32LE;
    }

    // Bytes an encoder puts in front of the content.
    inline std::string bom_bytes(Charset cs)
    {
        if (cs == Charset::UTF_16)
            return std::string("\xFE\xFF", 2);
        return std::string();
    }

    // Encodes 7-bit text (delimiters, mostly) into code units of the charset.
    inline std::string encode_ascii(std::string_view text, Charset cs)
    {
        const size_t width = code_unit_size(cs);
        const bool le = is_little_endian(cs);

        std::string out;
        out.reserve(text.size() * width);
        for (char c : text)
        {
            if (static_cast<unsigned char>(c) > 0x7F)
            {
                throw InvalidConfiguration("encode_ascii: non-ASCII byte in \"" + std::string(text) + "\"");
            }
            if (le)
            {
                out.push_back(c);
                out.append(width - 1, '\0');
            }
            else
            {
                out.append(width - 1, '\0');
                out.push_back(c);
            }
        }
        return out;
    }

} // namespace extmerge

#endif
