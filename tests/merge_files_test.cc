#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "extmerge/charset.hpp"
#include "extmerge/errors.hpp"
#include "extmerge/merge_options.hpp"
#include "extmerge/merger.hpp"
#include "extmerge/verifier.hpp"
#include "test_util.hpp"

using namespace extmerge;
using extmerge_test::join;
using extmerge_test::split;

namespace fs = std::filesystem;

namespace
{
    using Mode = ExecutionContext::Mode;

    std::string mode_name(const ::testing::TestParamInfo<Mode> &info)
    {
        return info.param == Mode::Threaded ? "Threaded" : "Sequential";
    }
} // namespace

class MergeFilesTest : public extmerge_test::TempDirTest, public ::testing::WithParamInterface<Mode>
{
protected:
    MergeOptions options() const
    {
        MergeOptions o;
        o.context.mode = GetParam();
        o.context.queue_capacity = 4;
        return o;
    }

    // Tiny buffers so every refill and flush path runs.
    MergeOptions tight_options(size_t read = MIN_READ_BUFFER_BYTES, size_t write = MIN_WRITE_BUFFER_BYTES) const
    {
        MergeOptions o = options();
        o.source_buffer = [read](const fs::path &)
        { return read; };
        o.target_buffer = [write](const fs::path &)
        { return write; };
        return o;
    }
};

TEST_P(MergeFilesTest, MergesDescendingAndInvertRestoresAscending)
{
    const fs::path a = write("a.txt", "b\nd\nf");
    const fs::path b = write("b.txt", "a\nc\ne");
    const fs::path out = path("out.txt");

    const MergeStats stats = merge_files_inverse({a, b}, out, options());

    EXPECT_EQ(read(out), "f\ne\nd\nc\nb\na");
    EXPECT_EQ(stats.records, 6u);
    EXPECT_EQ(stats.bytes_written, 11u);
    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));

    const fs::path direct = path("direct.txt");
    const MergeStats inverted = invert_file(out, direct);
    EXPECT_EQ(read(direct), "a\nb\nc\nd\ne\nf");
    EXPECT_EQ(inverted.records, 6u);
}

TEST_P(MergeFilesTest, SubsetSourceKeepsEveryRecord)
{
    const fs::path a = write("a.txt", "a\nb\nc");
    const fs::path b = write("b.txt", "a\nb");
    const fs::path out = path("out.txt");

    const MergeStats stats = merge_files_inverse({a, b}, out, options());

    EXPECT_EQ(stats.records, 5u);
    EXPECT_EQ(read(out), "c\nb\nb\na\na");
}

TEST_P(MergeFilesTest, EmptyRecordIsFramedBySeparators)
{
    // "a\n" holds the records "a" and "".
    const fs::path a = write("a.txt", "a\n");
    const fs::path b = write("b.txt", "b");
    const fs::path out = path("out.txt");

    const MergeStats stats = merge_files_inverse({a, b}, out, tight_options());

    EXPECT_EQ(stats.records, 3u);
    EXPECT_EQ(read(out), "b\na\n");
}

TEST_P(MergeFilesTest, EmptySourcesGiveEmptyTarget)
{
    const fs::path a = write("a.txt", "");
    const fs::path b = write("b.txt", "");
    const fs::path out = path("out.txt");

    const MergeStats stats = merge_files_inverse({a, b}, out, options());

    EXPECT_EQ(stats.records, 0u);
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(read(out), "");
}

TEST_P(MergeFilesTest, EmptyFileContributesNoRecord)
{
    const fs::path a = write("a.txt", "");
    const fs::path b = write("b.txt", "a\nb");
    const fs::path out = path("out.txt");

    const MergeStats stats = merge_files_inverse({a, b}, out, options());

    EXPECT_EQ(stats.records, 2u);
    EXPECT_EQ(read(out), "b\na");
}

TEST_P(MergeFilesTest, MultiByteDelimiter)
{
    const fs::path a = write("a.txt", "apple\r\ncherry");
    const fs::path b = write("b.txt", "banana\r\ndate\r\nfig");
    const fs::path out = path("out.txt");

    MergeOptions o = tight_options();
    o.delimiter = "\r\n";
    merge_files_inverse({a, b}, out, o);

    EXPECT_EQ(read(out), "fig\r\ndate\r\ncherry\r\nbanana\r\napple");
}

TEST_P(MergeFilesTest, RoundTripOfSkewedRandomSources)
{
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> len_dist(0, 6);
    std::uniform_int_distribution<int> char_dist('a', 'e');

    const std::vector<size_t> counts{2, 3, 40, 700, 5};
    std::vector<fs::path> sources;
    std::vector<std::string> all;
    for (size_t f = 0; f < counts.size(); ++f)
    {
        std::vector<std::string> lines(counts[f]);
        for (auto &l : lines)
        {
            l.resize(static_cast<size_t>(len_dist(rng)));
            for (auto &c : l)
                c = static_cast<char>(char_dist(rng));
        }
        std::sort(lines.begin(), lines.end());
        all.insert(all.end(), lines.begin(), lines.end());
        sources.push_back(write("src" + std::to_string(f) + ".txt", join(lines)));
    }
    std::sort(all.begin(), all.end());

    const fs::path out = path("out.txt");
    MergeOptions o = options();
    o.memory_budget = 200; // far below the input size
    o.write_ratio = 0.3;
    const MergeStats stats = merge_files_inverse(sources, out, o);
    EXPECT_EQ(stats.records, all.size());

    VerifyOptions desc;
    desc.order = descending_order();
    const VerifyReport merged = verify_order(out, desc);
    EXPECT_TRUE(merged.sorted) << "at record " << merged.violation_index;
    EXPECT_EQ(merged.records, all.size());

    const fs::path direct = path("direct.txt");
    InvertOptions inv;
    inv.read_buffer = 32;
    inv.write_buffer = 32;
    invert_file(out, direct, inv);
    EXPECT_EQ(read(direct), join(all));
}

TEST_P(MergeFilesTest, ReclaimDeletesSourcesAndNeverGrowsThem)
{
    std::vector<std::string> left;
    std::vector<std::string> right;
    for (int i = 0; i < 300; ++i)
    {
        char key[8];
        std::snprintf(key, sizeof(key), "k%05d", i);
        (i % 3 == 0 ? left : right).push_back(key);
    }
    const fs::path a = write("a.txt", join(left));
    const fs::path b = write("b.txt", join(right));
    const fs::path out = path("out.txt");

    auto last = std::make_shared<std::map<std::string, uint64_t>>();
    (*last)[a.string()] = fs::file_size(a);
    (*last)[b.string()] = fs::file_size(b);

    MergeOptions o = tight_options(24, 32);
    o.reclaim_disk_space = true;
    o.comparator = [last](std::string_view x, std::string_view y)
    {
        for (auto &entry : *last)
        {
            std::error_code ec;
            const uint64_t size = fs::file_size(entry.first, ec);
            if (ec)
                continue;
            EXPECT_LE(size, entry.second) << entry.first << " grew";
            entry.second = size;
        }
        return y < x;
    };

    const MergeStats stats = merge_files_inverse({a, b}, out, o);

    EXPECT_EQ(stats.records, 300u);
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));

    const std::vector<std::string> merged = split(read(out));
    ASSERT_EQ(merged.size(), 300u);
    EXPECT_EQ(merged.front(), "k00299");
    EXPECT_EQ(merged.back(), "k00000");
}

TEST_P(MergeFilesTest, BomIsWrittenOnceAndSourcesDrainToIt)
{
    const std::string bom = bom_bytes(Charset::UTF_16);
    const std::string nl = encode_ascii("\n", Charset::UTF_16);
    auto u16 = [](const std::string &s)
    { return encode_ascii(s, Charset::UTF_16); };

    const fs::path a = write("a.txt", bom + u16("b") + nl + u16("d"));
    const fs::path b = write("b.txt", bom + u16("a") + nl + u16("c") + nl + u16("e"));
    const fs::path out = path("out.txt");

    MergeOptions o = MergeOptions::for_charset(Charset::UTF_16);
    o.context = options().context;
    o.reclaim_disk_space = true;
    const MergeStats stats = merge_files_inverse({a, b}, out, o);

    EXPECT_EQ(stats.records, 5u);
    EXPECT_EQ(read(out), bom + u16("e") + nl + u16("d") + nl + u16("c") + nl + u16("b") + nl + u16("a"));
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));

    InvertOptions inv;
    inv.delimiter = nl;
    inv.bom = bom;
    const fs::path direct = path("direct.txt");
    invert_file(out, direct, inv);
    EXPECT_EQ(read(direct), bom + u16("a") + nl + u16("b") + nl + u16("c") + nl + u16("d") + nl + u16("e"));
}

TEST_P(MergeFilesTest, ManySources)
{
    std::vector<fs::path> sources;
    std::vector<std::string> expected;
    for (int f = 0; f < 9; ++f)
    {
        std::vector<std::string> lines;
        for (int i = 0; i < 50; ++i)
        {
            lines.push_back(std::to_string(1000 + i * 9 + f));
            expected.push_back(lines.back());
        }
        sources.push_back(write("s" + std::to_string(f) + ".txt", join(lines)));
    }
    std::sort(expected.rbegin(), expected.rend());

    const fs::path out = path("out.txt");
    merge_files_inverse(sources, out, tight_options(32, 64));

    EXPECT_EQ(read(out), join(expected));
}

TEST_P(MergeFilesTest, UndersizedBufferFailsBeforeAnyIo)
{
    const fs::path a = write("a.txt", "a\nb");
    const fs::path b = write("b.txt", "c");
    const fs::path out = path("out.txt");

    EXPECT_THROW(merge_files_inverse({a, b}, out, tight_options(MIN_READ_BUFFER_BYTES - 1)), BufferTooSmall);
    EXPECT_THROW(merge_files_inverse({a, b}, out, tight_options(MIN_READ_BUFFER_BYTES, 1)), BufferTooSmall);

    MergeOptions wide = tight_options(MIN_READ_BUFFER_BYTES);
    wide.delimiter = std::string(9, '|');
    EXPECT_THROW(merge_files_inverse({a, b}, out, wide), BufferTooSmall);

    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(read(a), "a\nb");
    EXPECT_EQ(read(b), "c");
}

TEST_P(MergeFilesTest, RejectsInvalidConfiguration)
{
    const fs::path a = write("a.txt", "a");
    const fs::path b = write("b.txt", "b");
    const fs::path out = path("out.txt");

    EXPECT_THROW(merge_files_inverse({a}, out, options()), InvalidConfiguration);
    EXPECT_THROW(merge_files_inverse({a, a}, out, options()), InvalidConfiguration);
    EXPECT_THROW(merge_files_inverse({a, dir_ / "." / "a.txt"}, out, options()), InvalidConfiguration);
    EXPECT_THROW(merge_files_inverse({a, b}, b, options()), InvalidConfiguration);

    MergeOptions ratio = options();
    ratio.write_ratio = 1.0;
    EXPECT_THROW(merge_files_inverse({a, b}, out, ratio), InvalidConfiguration);

    MergeOptions half = options();
    half.source_buffer = [](const fs::path &)
    { return size_t(64); };
    EXPECT_THROW(merge_files_inverse({a, b}, out, half), InvalidConfiguration);

    MergeOptions nodelim = options();
    nodelim.delimiter.clear();
    EXPECT_THROW(merge_files_inverse({a, b}, out, nodelim), InvalidConfiguration);

    EXPECT_FALSE(fs::exists(out));
}

TEST_P(MergeFilesTest, MissingOrShortSourceIsAScanFailure)
{
    const fs::path a = write("a.txt", "a");
    const fs::path out = path("out.txt");

    EXPECT_THROW(merge_files_inverse({a, path("missing.txt")}, out, options()), SourceScanFailure);

    MergeOptions o = options();
    o.bom = "\xEF\xBB\xBF";
    const fs::path b = write("b.txt", "b");
    try
    {
        merge_files_inverse({a, b}, out, o);
        FAIL() << "expected SourceScanFailure";
    }
    catch (const SourceScanFailure &e)
    {
        EXPECT_EQ(e.source(), a);
    }
}

TEST_P(MergeFilesTest, ScanFailureMidMergeSurfacesOnce)
{
    std::vector<std::string> lines;
    for (int i = 0; i < 2000; ++i)
        lines.push_back("line" + std::to_string(100000 + i));
    const fs::path a = write("a.txt", "a\nb");
    const fs::path b = write("b.txt", join(lines));
    const fs::path out = path("out.txt");

    // Cutting b under the reader makes its next refill come up short.
    auto cut = std::make_shared<bool>(false);
    MergeOptions o = tight_options();
    o.context.queue_capacity = 1;
    o.comparator = [cut, b](std::string_view x, std::string_view y)
    {
        if (!*cut)
        {
            fs::resize_file(b, 0);
            *cut = true;
        }
        return y < x;
    };

    try
    {
        merge_files_inverse({a, b}, out, o);
        FAIL() << "expected SourceScanFailure";
    }
    catch (const SourceScanFailure &e)
    {
        EXPECT_EQ(e.source(), b);
        EXPECT_TRUE(e.close_errors().empty());
    }
    EXPECT_TRUE(fs::exists(a));
}

TEST_P(MergeFilesTest, OrderingFailureStopsBlockedProducers)
{
    std::vector<fs::path> sources;
    for (int f = 0; f < 4; ++f)
    {
        std::vector<std::string> lines;
        for (int i = 0; i < 5000; ++i)
            lines.push_back(std::to_string(100000 + i));
        sources.push_back(write("s" + std::to_string(f) + ".txt", join(lines)));
    }
    const fs::path out = path("out.txt");

    MergeOptions o = tight_options();
    o.context.queue_capacity = 1;
    o.comparator = [](std::string_view, std::string_view) -> bool
    { throw std::runtime_error("comparator gave up"); };

    try
    {
        merge_files_inverse(sources, out, o);
        FAIL() << "expected the comparator error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_STREQ(e.what(), "comparator gave up");
    }
    for (const auto &s : sources)
        EXPECT_TRUE(fs::exists(s));
}

TEST_P(MergeFilesTest, TargetWriteFailureStopsBlockedProducers)
{
    const fs::path full("/dev/full");
    if (!fs::exists(full))
        GTEST_SKIP() << "no /dev/full";

    std::vector<fs::path> sources;
    for (int f = 0; f < 4; ++f)
    {
        std::vector<std::string> lines;
        for (int i = 0; i < 5000; ++i)
            lines.push_back(std::to_string(100000 + i * 4 + f));
        sources.push_back(write("s" + std::to_string(f) + ".txt", join(lines)));
    }

    MergeOptions o = tight_options();
    o.context.queue_capacity = 1;
    o.reclaim_disk_space = true;

    EXPECT_THROW(merge_files_inverse(sources, full, o), IoFailure);
}

INSTANTIATE_TEST_SUITE_P(Modes, MergeFilesTest, ::testing::Values(Mode::Sequential, Mode::Threaded), mode_name);

class InvertFileTest : public extmerge_test::TempDirTest
{
};

TEST_F(InvertFileTest, ReversesRecordOrder)
{
    const fs::path src = write("src.txt", "3\n2\n\n1");
    const fs::path dst = path("dst.txt");

    const MergeStats stats = invert_file(src, dst);

    EXPECT_EQ(read(dst), "1\n\n2\n3");
    EXPECT_EQ(stats.records, 4u);
    EXPECT_EQ(read(src), "3\n2\n\n1");
}

TEST_F(InvertFileTest, RejectsInPlace)
{
    const fs::path src = write("src.txt", "b\na");
    EXPECT_THROW(invert_file(src, src), InvalidConfiguration);
}

TEST_F(InvertFileTest, RejectsSmallBuffers)
{
    const fs::path src = write("src.txt", "b\na");
    InvertOptions o;
    o.read_buffer = MIN_READ_BUFFER_BYTES - 1;
    EXPECT_THROW(invert_file(src, path("dst.txt"), o), BufferTooSmall);
}
