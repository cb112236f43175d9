#include "io/zip_writer.h"

#include <algorithm>
#include <cstdlib>
#include <limits>

// LodePNG ships a raw DEFLATE encoder and CRC-32 (compiled via src/io/lodepng_unit.cpp).
#include <lodepng.h>

namespace pnt::io
{
namespace
{
constexpr std::uint32_t kSigLocalHeader = 0x04034b50u;
constexpr std::uint32_t kSigCentralHeader = 0x02014b50u;
constexpr std::uint32_t kSigEndOfCentral = 0x06054b50u;

constexpr std::uint16_t kVersionMadeBy = 20; // 2.0
constexpr std::uint16_t kVersionNeeded = 20; // 2.0
constexpr std::uint16_t kMethodStore = 0;
constexpr std::uint16_t kMethodDeflate = 8;

static void PutLe16(std::vector<std::uint8_t>& b, std::uint16_t v)
{
    b.push_back((std::uint8_t)(v & 0xFFu));
    b.push_back((std::uint8_t)((v >> 8) & 0xFFu));
}

static void PutLe32(std::vector<std::uint8_t>& b, std::uint32_t v)
{
    b.push_back((std::uint8_t)(v & 0xFFu));
    b.push_back((std::uint8_t)((v >> 8) & 0xFFu));
    b.push_back((std::uint8_t)((v >> 16) & 0xFFu));
    b.push_back((std::uint8_t)((v >> 24) & 0xFFu));
}

static bool Deflate(std::span<const std::uint8_t> data, int level, std::vector<std::uint8_t>& out, std::string& err)
{
    out.clear();

    LodePNGCompressSettings settings;
    lodepng_compress_settings_init(&settings);
    const int lvl = std::clamp(level, 1, 9);
    settings.btype = 2;
    settings.use_lz77 = 1;
    settings.windowsize = (lvl >= 6) ? 32768u : 2048u;
    settings.nicematch = (lvl >= 7) ? 258u : 128u;
    settings.lazymatching = 1;

    unsigned char* buf = nullptr;
    size_t buf_size = 0;
    const unsigned e = lodepng_deflate(&buf, &buf_size, data.data(), data.size(), &settings);
    if (e != 0)
    {
        free(buf);
        err = std::string("lodepng_deflate failed: ") + lodepng_error_text(e);
        return false;
    }
    out.assign(buf, buf + buf_size);
    free(buf);
    return true;
}
} // namespace

void ZipWriter::DosTimeDate(std::time_t t, std::uint16_t& out_time, std::uint16_t& out_date)
{
    if (t <= 0)
    {
        out_time = 0;
        out_date = (std::uint16_t)((0 << 9) | (1 << 5) | 1); // 1980-01-01
        return;
    }

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif

    const int year = std::clamp(tm.tm_year + 1900, 1980, 2107);
    const int month = std::clamp(tm.tm_mon + 1, 1, 12);
    const int day = std::clamp(tm.tm_mday, 1, 31);
    const int hour = std::clamp(tm.tm_hour, 0, 23);
    const int minute = std::clamp(tm.tm_min, 0, 59);
    const int sec2 = std::clamp(tm.tm_sec / 2, 0, 29);

    out_date = (std::uint16_t)(((year - 1980) << 9) | (month << 5) | day);
    out_time = (std::uint16_t)((hour << 11) | (minute << 5) | sec2);
}

bool ZipWriter::SanitizeName(const std::string& in, std::string& out, std::string& err)
{
    out.clear();

    std::string norm = in;
    std::replace(norm.begin(), norm.end(), '\\', '/');

    std::vector<std::string> parts;
    std::string cur;
    for (char c : norm)
    {
        if (c == '/')
        {
            if (!cur.empty() && cur != ".")
                parts.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty() && cur != ".")
        parts.push_back(cur);

    if (parts.empty())
    {
        err = "zip entry name is empty";
        return false;
    }
    for (const std::string& p : parts)
    {
        if (p == "..")
        {
            err = "zip entry name contains '..' segment: " + in;
            return false;
        }
        if (!out.empty())
            out.push_back('/');
        out += p;
    }
    return true;
}

bool ZipWriter::AddFile(const std::string& name, std::span<const std::uint8_t> data, std::string& err)
{
    err.clear();
    if (m_finalized)
    {
        err = "zip archive already finalized";
        return false;
    }

    Entry e;
    if (!SanitizeName(name, e.name, err))
        return false;
    if (e.name.size() > std::numeric_limits<std::uint16_t>::max())
    {
        err = "zip entry name too long: " + e.name;
        return false;
    }
    for (const Entry& existing : m_entries)
    {
        if (existing.name == e.name)
        {
            err = "duplicate zip entry: " + e.name;
            return false;
        }
    }
    if (data.size() > std::numeric_limits<std::uint32_t>::max())
    {
        err = "zip entry too large (ZIP64 not supported): " + e.name;
        return false;
    }

    std::vector<std::uint8_t> packed;
    e.method = kMethodStore;
    if (m_opt.compression > 0 && !data.empty())
    {
        if (!Deflate(data, m_opt.compression, packed, err))
            return false;
        if (packed.size() < data.size())
            e.method = kMethodDeflate;
    }
    std::span<const std::uint8_t> payload = (e.method == kMethodDeflate)
                                                ? std::span<const std::uint8_t>(packed)
                                                : data;

    if ((std::uint64_t)m_buf.size() + 30u + e.name.size() + payload.size() > std::numeric_limits<std::uint32_t>::max())
    {
        err = "zip archive too large (ZIP64 not supported)";
        return false;
    }

    e.crc32 = data.empty() ? 0u : lodepng_crc32(data.data(), data.size());
    e.uncomp_size = (std::uint32_t)data.size();
    e.comp_size = (std::uint32_t)payload.size();
    e.local_header_offset = (std::uint32_t)m_buf.size();
    DosTimeDate(m_opt.mod_time, e.dos_time, e.dos_date);

    PutLe32(m_buf, kSigLocalHeader);
    PutLe16(m_buf, kVersionNeeded);
    PutLe16(m_buf, 0); // flags
    PutLe16(m_buf, e.method);
    PutLe16(m_buf, e.dos_time);
    PutLe16(m_buf, e.dos_date);
    PutLe32(m_buf, e.crc32);
    PutLe32(m_buf, e.comp_size);
    PutLe32(m_buf, e.uncomp_size);
    PutLe16(m_buf, (std::uint16_t)e.name.size());
    PutLe16(m_buf, 0); // extra len
    m_buf.insert(m_buf.end(), e.name.begin(), e.name.end());
    m_buf.insert(m_buf.end(), payload.begin(), payload.end());

    m_entries.push_back(std::move(e));
    return true;
}

bool ZipWriter::Finalize(std::vector<std::uint8_t>& out_archive, std::string& err)
{
    err.clear();
    out_archive.clear();
    if (m_finalized)
    {
        err = "zip archive already finalized";
        return false;
    }
    if (m_entries.size() > std::numeric_limits<std::uint16_t>::max())
    {
        err = "too many zip entries (ZIP64 not supported)";
        return false;
    }

    const std::uint32_t cd_offset = (std::uint32_t)m_buf.size();
    for (const Entry& e : m_entries)
    {
        PutLe32(m_buf, kSigCentralHeader);
        PutLe16(m_buf, kVersionMadeBy);
        PutLe16(m_buf, kVersionNeeded);
        PutLe16(m_buf, 0); // flags
        PutLe16(m_buf, e.method);
        PutLe16(m_buf, e.dos_time);
        PutLe16(m_buf, e.dos_date);
        PutLe32(m_buf, e.crc32);
        PutLe32(m_buf, e.comp_size);
        PutLe32(m_buf, e.uncomp_size);
        PutLe16(m_buf, (std::uint16_t)e.name.size());
        PutLe16(m_buf, 0); // extra len
        PutLe16(m_buf, 0); // comment len
        PutLe16(m_buf, 0); // disk number start
        PutLe16(m_buf, 0); // internal attrs
        PutLe32(m_buf, 0); // external attrs
        PutLe32(m_buf, e.local_header_offset);
        m_buf.insert(m_buf.end(), e.name.begin(), e.name.end());
    }
    const std::uint32_t cd_size = (std::uint32_t)m_buf.size() - cd_offset;

    PutLe32(m_buf, kSigEndOfCentral);
    PutLe16(m_buf, 0); // this disk
    PutLe16(m_buf, 0); // cd start disk
    PutLe16(m_buf, (std::uint16_t)m_entries.size());
    PutLe16(m_buf, (std::uint16_t)m_entries.size());
    PutLe32(m_buf, cd_size);
    PutLe32(m_buf, cd_offset);
    PutLe16(m_buf, 0); // comment len

    m_finalized = true;
    out_archive = std::move(m_buf);
    m_buf.clear();
    return true;
}
} // namespace pnt::io
