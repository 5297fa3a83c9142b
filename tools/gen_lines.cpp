/**
 * gen_lines.cpp
 * Sorted line file generator for the merge drivers.
 *
 * Writes <prefix><i>.txt for i in [0, files): each holds `lines` random
 * lowercase keys, sorted ascending, one per line, no trailing newline.
 * Ascending files are what the default (descending) merge comparator expects.
 *
 * Deterministic for a given seed.
 */

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

struct Args
{
    std::string prefix;
    uint64_t files = 2;
    uint64_t lines = 0;
    uint32_t max_len = 16;
    uint64_t seed = 0;
};

// Minimal CLI parsing (intentional)
bool parse_args(int argc, char **argv, Args &a)
{
    for (int i = 1; i < argc; ++i)
    {
        if (strcmp(argv[i], "--prefix") == 0 && i + 1 < argc)
        {
            a.prefix = argv[++i];
        }
        else if (strcmp(argv[i], "--files") == 0 && i + 1 < argc)
        {
            a.files = std::stoull(argv[++i]);
        }
        else if (strcmp(argv[i], "--lines") == 0 && i + 1 < argc)
        {
            a.lines = std::stoull(argv[++i]);
        }
        else if (strcmp(argv[i], "--max-len") == 0 && i + 1 < argc)
        {
            a.max_len = std::stoul(argv[++i]);
        }
        else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
        {
            a.seed = std::stoull(argv[++i]);
        }
    }
    return !a.prefix.empty() && a.files >= 2 && a.lines > 0 && a.max_len > 0;
}

int main(int argc, char **argv)
{
    Args args;
    if (!parse_args(argc, argv, args))
    {
        std::cerr
            << "Usage: ./gen_lines "
            << "--prefix P "
            << "--files N (>= 2) "
            << "--lines M "
            << "[--max-len L] "
            << "[--seed S]\n";
        return 1;
    }

    std::mt19937_64 rng(args.seed);
    std::uniform_int_distribution<uint32_t> len_dist(1, args.max_len);
    std::uniform_int_distribution<int> char_dist('a', 'z');

    static constexpr size_t IO_BUFFER_SIZE = 4 * 1024 * 1024;
    std::vector<char> io_buf;
    io_buf.reserve(IO_BUFFER_SIZE);

    for (uint64_t f = 0; f < args.files; ++f)
    {
        std::vector<std::string> keys(args.lines);
        for (auto &k : keys)
        {
            k.resize(len_dist(rng));
            for (auto &c : k)
                c = static_cast<char>(char_dist(rng));
        }
        std::sort(keys.begin(), keys.end());

        const std::string name = args.prefix + std::to_string(f) + ".txt";
        std::ofstream out(name, std::ios::binary);
        if (!out)
        {
            std::cerr << "Error: cannot open output file " << name << "\n";
            return 1;
        }

        for (size_t i = 0; i < keys.size(); ++i)
        {
            if (io_buf.size() + keys[i].size() + 1 > IO_BUFFER_SIZE)
            {
                out.write(io_buf.data(), io_buf.size());
                io_buf.clear();
            }
            if (i > 0)
                io_buf.push_back('\n');
            io_buf.insert(io_buf.end(), keys[i].begin(), keys[i].end());
        }
        if (!io_buf.empty())
        {
            out.write(io_buf.data(), io_buf.size());
            io_buf.clear();
        }

        out.close();
        if (!out)
        {
            std::cerr << "Error: write failed on " << name << "\n";
            return 1;
        }
        std::cout << "[GenLines] Generated " << name << " (" << args.lines << " lines)\n";
    }

    std::cout << "Done.\n";
    return 0;
}
