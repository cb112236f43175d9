#pragma once

#include <cstdint>
#include <ctime>
#include <span>
#include <string>
#include <vector>

namespace pnt::io
{
// In-memory ZIP archive builder.
// - Entries are DEFLATE-compressed (LodePNG's deflate); an entry falls back to "store" when
//   compression does not shrink it.
// - ZIP64 is not supported.
// - Entry names are normalized to forward slashes; ".." segments and duplicates are rejected.
class ZipWriter
{
public:
    struct Options
    {
        // Timestamp written for every entry. 0 means the DOS epoch (1980-01-01), which keeps
        // archives byte-identical across runs.
        std::time_t mod_time = 0;
        // zlib-style level 0..9 (0 = store only).
        int compression = 6;
    };

    ZipWriter() = default;
    explicit ZipWriter(const Options& opt) : m_opt(opt) {}

    bool AddFile(const std::string& name, std::span<const std::uint8_t> data, std::string& err);

    // Writes the central directory and end record; returns the whole archive.
    // The writer cannot take more entries afterwards.
    bool Finalize(std::vector<std::uint8_t>& out_archive, std::string& err);

    std::size_t EntryCount() const { return m_entries.size(); }

private:
    struct Entry
    {
        std::string name;
        std::uint32_t crc32 = 0;
        std::uint32_t comp_size = 0;
        std::uint32_t uncomp_size = 0;
        std::uint32_t local_header_offset = 0;
        std::uint16_t method = 0;
        std::uint16_t dos_time = 0;
        std::uint16_t dos_date = 0;
    };

    static bool SanitizeName(const std::string& in, std::string& out, std::string& err);
    static void DosTimeDate(std::time_t t, std::uint16_t& out_time, std::uint16_t& out_date);

    Options m_opt;
    std::vector<std::uint8_t> m_buf;
    std::vector<Entry> m_entries;
    bool m_finalized = false;
};
} // namespace pnt::io
