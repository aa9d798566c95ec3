#include "snclass/ZipArchive.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>
#include <zlib.h>

namespace snclass {

static std::uint16_t rd16(const std::uint8_t* p)
{
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}
static std::uint32_t rd32(const std::uint8_t* p)
{
    return  static_cast<std::uint32_t>(p[0])        | (static_cast<std::uint32_t>(p[1]) << 8)
         | (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

static bool has_sig(const Bytes& z, std::size_t i, std::uint8_t b2, std::uint8_t b3)
{
    return i + 4 <= z.size() && z[i] == 0x50 && z[i + 1] == 0x4b
        && z[i + 2] == b2 && z[i + 3] == b3;
}

/* ---------------------------------------------------------------------- */
ZipArchive::ZipArchive(Bytes data)
    : data_(std::move(data))
{
    const Bytes& z = data_;
    if (z.size() < 22)
        throw FormatError("zip: archive too small (" + std::to_string(z.size()) + " bytes)");

    /* EOCD (0x06054b50) sits in the last 64 KiB + 22 bytes */
    std::size_t eocd = z.size();
    const std::size_t max_back = std::min<std::size_t>(z.size(), 0x10000 + 22);
    for (std::size_t back = 22; back <= max_back; ++back) {
        if (has_sig(z, z.size() - back, 0x05, 0x06)) { eocd = z.size() - back; break; }
    }
    if (eocd == z.size())
        throw FormatError("zip: end of central directory not found");

    const std::uint16_t entries = rd16(&z[eocd + 10]);
    const std::uint32_t cd_ofs  = rd32(&z[eocd + 16]);

    std::size_t i = cd_ofs;
    for (std::uint16_t e = 0; e < entries; ++e) {
        if (!has_sig(z, i, 0x01, 0x02) || i + 46 > z.size())
            throw FormatError("zip: bad central directory entry " + std::to_string(e));

        ZipMember m;
        m.method           = rd16(&z[i + 10]);
        m.crc32            = rd32(&z[i + 16]);
        m.comp_size        = rd32(&z[i + 20]);
        m.uncomp_size      = rd32(&z[i + 24]);
        const std::uint16_t nlen = rd16(&z[i + 28]);
        const std::uint16_t xlen = rd16(&z[i + 30]);
        const std::uint16_t clen = rd16(&z[i + 32]);
        m.local_header_ofs = rd32(&z[i + 42]);
        i += 46;
        if (i + nlen > z.size())
            throw FormatError("zip: truncated central directory");
        m.name.assign(reinterpret_cast<const char*>(&z[i]), nlen);
        i += static_cast<std::size_t>(nlen) + xlen + clen;
        members_.push_back(std::move(m));
    }
}

/* ---------------------------------------------------------------------- */
Bytes ZipArchive::extract(const ZipMember& m) const
{
    const Bytes& z = data_;
    const std::size_t h = m.local_header_ofs;
    if (!has_sig(z, h, 0x03, 0x04) || h + 30 > z.size())
        throw FormatError("zip: bad local header for '" + m.name + "'");

    const std::size_t data_ofs = h + 30 + rd16(&z[h + 26]) + rd16(&z[h + 28]);
    if (data_ofs + m.comp_size > z.size())
        throw FormatError("zip: member '" + m.name + "' is truncated");
    const std::uint8_t* src = z.data() + data_ofs;

    Bytes out;
    if (m.method == 0) {
        out.assign(src, src + m.comp_size);
    } else if (m.method == 8 && m.uncomp_size == 0) {
        // empty file: nothing to inflate, the CRC check below still applies
    } else if (m.method == 8) {
        out.resize(m.uncomp_size);
        z_stream strm{};
        strm.next_in   = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(src));
        strm.avail_in  = m.comp_size;
        strm.next_out  = reinterpret_cast<Bytef*>(out.data());
        strm.avail_out = m.uncomp_size;
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK)
            throw FormatError("zip: inflateInit2 failed for '" + m.name + "'");
        const int ret = inflate(&strm, Z_FINISH);
        inflateEnd(&strm);
        if (ret != Z_STREAM_END)
            throw FormatError("zip: corrupt deflate stream in '" + m.name + "'");
    } else {
        throw FormatError("zip: unsupported compression method "
                          + std::to_string(m.method) + " for '" + m.name + "'");
    }

    const uLong crc = crc32(crc32(0L, Z_NULL, 0), out.data(), static_cast<uInt>(out.size()));
    if (crc != m.crc32)
        throw FormatError("zip: CRC mismatch in '" + m.name + "'");
    return out;
}

bool is_skippable_member(const ZipMember& m)
{
    if (m.is_directory()) return true;
    if (m.name.rfind("__MACOSX/", 0) == 0) return true;

    const auto slash = m.name.find_last_of('/');
    const std::string base = slash == std::string::npos ? m.name : m.name.substr(slash + 1);
    return base.empty() || base.front() == '.';
}

} // namespace snclass
