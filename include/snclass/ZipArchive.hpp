#pragma once
#include "Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace snclass {

struct ZipMember {
    std::string   name;
    std::uint16_t method           = 0;     // 0 stored, 8 deflate
    std::uint32_t crc32            = 0;
    std::uint32_t comp_size        = 0;
    std::uint32_t uncomp_size      = 0;
    std::uint32_t local_header_ofs = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/*
 * Minimal in-memory zip reader: end-of-central-directory scan, central
 * directory, local headers; stored and deflated members; CRC-32 check.
 *
 * The constructor fails with FormatError when the archive itself is
 * unreadable; extract() fails per member.
 */
class ZipArchive {
public:
    explicit ZipArchive(Bytes data);

    const std::vector<ZipMember>& members() const { return members_; }

    Bytes extract(const ZipMember& m) const;

private:
    Bytes                  data_;
    std::vector<ZipMember> members_;
};

// Directories, "__MACOSX/" resource forks and dot-files
bool is_skippable_member(const ZipMember& m);

} // namespace snclass
