// verifier.hpp
#ifndef EXTMERGE_VERIFIER_HPP
#define EXTMERGE_VERIFIER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "buffer_plan.hpp"
#include "errors.hpp"
#include "order.hpp"
#include "record_source.hpp"
#include "reverse_line_reader.hpp"

namespace extmerge
{

    struct VerifyOptions
    {
        ByteComparator order = ascending_order(); // order the file should be in
        std::string delimiter = "\n";
        std::string bom;
        size_t read_buffer = DEFAULT_BUFFER_BYTES;
    };

    struct VerifyReport
    {
        uint64_t records = 0;
        bool sorted = true;
        uint64_t violation_index = 0; // record index, from the file start, of the first out-of-order record
        std::string previous;
        std::string current;
    };

    // Scans the whole file, so records is the full count even when unsorted.
    inline VerifyReport verify_order(const std::filesystem::path &path, const VerifyOptions &options = VerifyOptions())
    {
        std::error_code ec;
        const uint64_t length = std::filesystem::file_size(path, ec);
        if (ec)
            throw SourceScanFailure(path, "cannot get size: " + ec.message());
        if (length < options.bom.size())
            throw SourceScanFailure(path, "file is shorter than the BOM");

        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw SourceScanFailure(path, "cannot open");

        ReverseLineReader reader(in, options.bom.size(), length, options.read_buffer, options.delimiter);
        InlineSource records(path, reader);

        // Walking backwards, a later record must never come before an earlier one.
        VerifyReport report;
        uint64_t from_end = 0;
        uint64_t violation_from_end = 0;
        std::string later;
        std::string rec;
        while (records.pull(rec))
        {
            if (from_end > 0 && options.order(later, rec))
            {
                report.sorted = false;
                violation_from_end = from_end - 1;
                report.previous = rec;
                report.current = later;
            }
            later.swap(rec);
            ++from_end;
        }

        report.records = from_end;
        if (!report.sorted)
            report.violation_index = report.records - 1 - violation_from_end;
        return report;
    }

} // namespace extmerge

#endif
