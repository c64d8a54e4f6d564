#pragma once

#include <tar-chunker/block.hxx>

namespace tar_chunker::detail {

/**
 * @struct TarHeader
 * @brief POSIX ustar header block ("ustar\0" magic, version "00").
 *
 * Numeric fields hold octal text, or base-256 binary for values too wide
 * for it. Text fields are NUL padded but need not be NUL terminated.
 */
struct __attribute__((packed)) TarHeader {
  char name[100];
  char mode[8];
  char uid[8];
  char gid[8];
  char size[12];
  char mtime[12];
  char chksum[8]; /**< @brief Byte sum of the block, counted as spaces. */
  char typeflag[1];
  char linkname[100]; /**< @brief Target of hard and symbolic links. */
  char magic[6];
  char version[2];
  char uname[32];
  char gname[32];
  char devmajor[8];
  char devminor[8];
  char prefix[155]; /**< @brief Joined to name with '/' when non-empty. */
  char padding[12];
};

static_assert(sizeof(TarHeader) == 512, "TarHeader must be 512 bytes");

/**
 * @struct GnuTarHeader
 * @brief Old GNU header layout ("ustar  \0" magic).
 *
 * GNU tar reuses the ustar prefix area for access/change times, the
 * multi-volume offset and the old sparse map. Continuation records are
 * written in this layout.
 */
struct __attribute__((packed)) GnuTarHeader {
  char name[100];
  char mode[8];
  char uid[8];
  char gid[8];
  char size[12];
  char mtime[12];
  char chksum[8];
  char typeflag[1];
  char linkname[100];
  char magic[8]; /**< @brief "ustar  \0" (magic and version merged). */
  char uname[32];
  char gname[32];
  char devmajor[8];
  char devminor[8];
  char atime[12];
  char ctime[12];
  char offset[12];    /**< @brief Multi-volume: payload bytes already
                         stored in earlier volumes. */
  char longnames[4];
  char unused[1];
  char sparse[96];    /**< @brief Four (offset, numbytes) sparse pairs. */
  char isextended[1]; /**< @brief Non-zero when sparse extension blocks
                         follow the header. */
  char realsize[12];  /**< @brief Full size of a sparse or split file. */
  char pad[17];
};

static_assert(sizeof(GnuTarHeader) == 512, "GnuTarHeader must be 512 bytes");

/// Extension block following an old GNU sparse header.
struct __attribute__((packed)) GnuSparseExtension {
  char sparse[504]; /**< @brief 21 (offset, numbytes) pairs. */
  char isextended[1];
  char padding[7];
};

static_assert(sizeof(GnuSparseExtension) == 512,
              "GnuSparseExtension must be 512 bytes");

inline constexpr char kUstarMagic[6] = {'u', 's', 't', 'a', 'r', '\0'};
inline constexpr char kGnuMagic[8] = {'u', 's', 't', 'a', 'r', ' ', ' ', '\0'};

namespace typeflag {
inline constexpr char kRegular = '0';
inline constexpr char kRegularOld = '\0';
inline constexpr char kHardLink = '1';
inline constexpr char kSymlink = '2';
inline constexpr char kCharDevice = '3';
inline constexpr char kBlockDevice = '4';
inline constexpr char kDirectory = '5';
inline constexpr char kFifo = '6';
inline constexpr char kContiguous = '7';
inline constexpr char kPaxExtended = 'x';
inline constexpr char kPaxGlobal = 'g';
inline constexpr char kGnuLongName = 'L';
inline constexpr char kGnuLongLink = 'K';
inline constexpr char kGnuSparse = 'S';
inline constexpr char kGnuMultiVolume = 'M';
} // namespace typeflag

} // namespace tar_chunker::detail
