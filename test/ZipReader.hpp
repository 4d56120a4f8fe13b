#ifndef FOLDERMON_TEST_ZIPREADER_HPP
#define FOLDERMON_TEST_ZIPREADER_HPP

// Minimal ZIP reader used by the tests to open produced bundles. Supports
// stored and deflated entries, no ZIP64.

#include <cstdint>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

namespace foldermon {
namespace test {

inline std::uint16_t get16(const std::vector<unsigned char> &b, size_t at) {
  if (at + 2 > b.size()) throw std::runtime_error("truncated zip");
  return static_cast<std::uint16_t>(b[at] | (b[at + 1] << 8));
}

inline std::uint32_t get32(const std::vector<unsigned char> &b, size_t at) {
  if (at + 4 > b.size()) throw std::runtime_error("truncated zip");
  return static_cast<std::uint32_t>(b[at]) |
         (static_cast<std::uint32_t>(b[at + 1]) << 8) |
         (static_cast<std::uint32_t>(b[at + 2]) << 16) |
         (static_cast<std::uint32_t>(b[at + 3]) << 24);
}

inline std::string inflateRaw(const unsigned char *data, size_t size,
                              size_t expected) {
  // One spare byte of output room so inflate can always reach the end of
  // the stream, including for empty entries.
  std::string out(expected + 1, '\0');
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  zs.next_in = const_cast<Bytef *>(data);
  zs.avail_in = static_cast<uInt>(size);
  zs.next_out = reinterpret_cast<Bytef *>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());
  int ret = inflate(&zs, Z_FINISH);
  size_t produced = zs.total_out;
  inflateEnd(&zs);
  if (ret != Z_STREAM_END || produced != expected) {
    throw std::runtime_error("inflate failed");
  }
  out.resize(expected);
  return out;
}

// Central directory fields the tests look at.
struct ZipEntryInfo {
  std::uint16_t flags;
  std::uint16_t localFlags;
  std::uint16_t dosTime;
  std::uint16_t dosDate;
};

// Entry name -> content. Throws std::runtime_error on anything malformed,
// including CRC mismatches. Fills info with header fields when given.
inline std::map<std::string, std::string>
readZip(const std::string &path,
        std::map<std::string, ZipEntryInfo> *info = nullptr) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::vector<unsigned char> b((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());

  if (b.size() < 22) throw std::runtime_error("too small for a zip");
  size_t eocd = b.size() - 22;
  while (get32(b, eocd) != 0x06054b50) {
    if (eocd == 0) throw std::runtime_error("no end of central directory");
    --eocd;
  }

  std::uint16_t count = get16(b, eocd + 10);
  std::uint32_t cdOffset = get32(b, eocd + 16);

  std::map<std::string, std::string> entries;
  size_t p = cdOffset;
  for (std::uint16_t i = 0; i < count; ++i) {
    if (get32(b, p) != 0x02014b50) throw std::runtime_error("bad central header");
    std::uint16_t flags = get16(b, p + 8);
    std::uint16_t method = get16(b, p + 10);
    std::uint16_t dosTime = get16(b, p + 12);
    std::uint16_t dosDate = get16(b, p + 14);
    std::uint32_t crc = get32(b, p + 16);
    std::uint32_t csize = get32(b, p + 20);
    std::uint32_t usize = get32(b, p + 24);
    std::uint16_t nameLen = get16(b, p + 28);
    std::uint16_t extraLen = get16(b, p + 30);
    std::uint16_t commentLen = get16(b, p + 32);
    std::uint32_t local = get32(b, p + 42);
    if (p + 46 + nameLen > b.size()) throw std::runtime_error("truncated name");
    std::string name(b.begin() + p + 46, b.begin() + p + 46 + nameLen);
    p += 46 + nameLen + extraLen + commentLen;

    if (get32(b, local) != 0x04034b50) throw std::runtime_error("bad local header");
    if (get32(b, local + 14) != crc || get32(b, local + 18) != csize ||
        get32(b, local + 22) != usize) {
      throw std::runtime_error("local header disagrees for " + name);
    }
    size_t dataAt = local + 30 + get16(b, local + 26) + get16(b, local + 28);
    if (dataAt + csize > b.size()) throw std::runtime_error("truncated data");

    std::string content;
    if (method == 0) {
      content.assign(b.begin() + dataAt, b.begin() + dataAt + csize);
    } else if (method == 8) {
      content = inflateRaw(b.data() + dataAt, csize, usize);
    } else {
      throw std::runtime_error("unsupported method");
    }

    uLong actual = crc32(0L, Z_NULL, 0);
    actual = crc32(actual, reinterpret_cast<const Bytef *>(content.data()),
                   static_cast<uInt>(content.size()));
    if (actual != crc) throw std::runtime_error("crc mismatch for " + name);

    entries[name] = content;
    if (info) {
      (*info)[name] = ZipEntryInfo{flags, get16(b, local + 6), dosTime, dosDate};
    }
  }
  return entries;
}

} // namespace test
} // namespace foldermon

#endif // FOLDERMON_TEST_ZIPREADER_HPP
