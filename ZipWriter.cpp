#include "ZipWriter.hpp"
#include <limits>
#include <stdexcept>
#include <utility>
#include <zlib.h>

namespace foldermon {

namespace {

constexpr std::uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr std::uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr std::uint32_t END_OF_CENTRAL_DIR_SIG = 0x06054b50;

constexpr std::uint16_t VERSION_NEEDED = 20;
constexpr std::uint16_t VERSION_MADE_BY = (3 << 8) | 20; // unix, 2.0
constexpr std::uint16_t FLAG_UTF8_NAME = 0x0800;
constexpr std::uint16_t METHOD_DEFLATE = 8;
constexpr std::uint32_t UNIX_FILE_ATTRS = 0100644u << 16;

// Offset of the crc field inside a local file header.
constexpr std::uint64_t LOCAL_HEADER_CRC_OFFSET = 14;

constexpr std::size_t CHUNK = 64 * 1024;
constexpr std::uint64_t MAX_32 = std::numeric_limits<std::uint32_t>::max();
constexpr std::size_t MAX_ENTRIES = std::numeric_limits<std::uint16_t>::max();

struct DeflateStream {
  z_stream zs{};

  DeflateStream() {
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
      throw std::runtime_error("deflateInit2 failed");
    }
  }
  ~DeflateStream() { deflateEnd(&zs); }

  DeflateStream(const DeflateStream &) = delete;
  DeflateStream &operator=(const DeflateStream &) = delete;
};

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above
// U+10FFFF.
bool isValidUtf8(const std::string &s) {
  std::size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t extra;
    std::uint32_t cp;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= s.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    static const std::uint32_t minForLength[] = {0, 0x80, 0x800, 0x10000};
    if (cp < minForLength[extra] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// Bit 11 is only claimed for names that need it and really are UTF-8.
// Plain ASCII needs no flag; other byte strings are stored as they are.
std::uint16_t nameFlags(const std::string &name) {
  bool ascii = true;
  for (char c : name) {
    if (static_cast<unsigned char>(c) >= 0x80) {
      ascii = false;
      break;
    }
  }
  return (!ascii && isValidUtf8(name)) ? FLAG_UTF8_NAME : 0;
}

void toDosDateTime(std::time_t t, std::uint16_t &dosTime,
                   std::uint16_t &dosDate) {
  struct tm tm{};
  if (localtime_r(&t, &tm) == nullptr || tm.tm_year < 80) {
    // DOS dates start at 1980-01-01 00:00.
    dosTime = 0;
    dosDate = (1 << 5) | 1;
    return;
  }
  if (tm.tm_year > 207) {
    // The 7-bit year field ends with 2107-12-31 23:59:58.
    dosTime = (23 << 11) | (59 << 5) | 29;
    dosDate = (127 << 9) | (12 << 5) | 31;
    return;
  }
  dosTime = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) |
                                       (tm.tm_sec / 2));
  dosDate = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) |
                                       ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

} // namespace

ZipWriter::ZipWriter(const std::string &zipPath) : path(zipPath) {
  out.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("cannot create " + path);
  }
}

ZipWriter::~ZipWriter() {
  // An unfinished archive is left on disk as is, without a central
  // directory.
  if (out.is_open()) {
    out.close();
  }
}

void ZipWriter::addEntry(const std::string &name, std::istream &in,
                         std::time_t modified) {
  if (closed) {
    throw std::runtime_error("archive already closed: " + path);
  }
  if (entries.size() >= MAX_ENTRIES) {
    throw std::runtime_error("too many entries for " + path);
  }
  if (name.empty() || name.size() > std::numeric_limits<std::uint16_t>::max()) {
    throw std::runtime_error("invalid entry name: '" + name + "'");
  }

  std::uint64_t headerOffset = position();
  if (headerOffset > MAX_32) {
    throw std::runtime_error("archive too large: " + path);
  }

  Entry entry{};
  entry.name = name;
  entry.localHeaderOffset = static_cast<std::uint32_t>(headerOffset);
  entry.flags = nameFlags(name);
  toDosDateTime(modified, entry.dosTime, entry.dosDate);

  put32(LOCAL_HEADER_SIG);
  put16(VERSION_NEEDED);
  put16(entry.flags);
  put16(METHOD_DEFLATE);
  put16(entry.dosTime);
  put16(entry.dosDate);
  put32(0); // crc, patched below
  put32(0); // compressed size
  put32(0); // uncompressed size
  put16(static_cast<std::uint16_t>(name.size()));
  put16(0);
  putBytes(name.data(), name.size());

  DeflateStream deflater;
  std::vector<char> inBuf(CHUNK);
  std::vector<unsigned char> outBuf(CHUNK);
  uLong crc = crc32(0L, Z_NULL, 0);

  int flush = Z_NO_FLUSH;
  do {
    in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
    std::streamsize n = in.gcount();
    if (in.bad()) {
      throw std::runtime_error("read error while adding " + name);
    }
    flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

    crc = crc32(crc, reinterpret_cast<const Bytef *>(inBuf.data()),
                static_cast<uInt>(n));
    deflater.zs.next_in = reinterpret_cast<Bytef *>(inBuf.data());
    deflater.zs.avail_in = static_cast<uInt>(n);

    do {
      deflater.zs.next_out = outBuf.data();
      deflater.zs.avail_out = static_cast<uInt>(outBuf.size());
      int ret = deflate(&deflater.zs, flush);
      if (ret == Z_STREAM_ERROR) {
        throw std::runtime_error("deflate failed for " + name);
      }
      std::size_t produced = outBuf.size() - deflater.zs.avail_out;
      putBytes(reinterpret_cast<const char *>(outBuf.data()), produced);
    } while (deflater.zs.avail_out == 0);
  } while (flush != Z_FINISH);

  if (deflater.zs.total_in > MAX_32 || deflater.zs.total_out > MAX_32) {
    throw std::runtime_error("entry too large for a non-ZIP64 archive: " +
                             name);
  }
  entry.crc = static_cast<std::uint32_t>(crc);
  entry.compressedSize = static_cast<std::uint32_t>(deflater.zs.total_out);
  entry.uncompressedSize = static_cast<std::uint32_t>(deflater.zs.total_in);

  std::uint64_t end = position();
  out.seekp(static_cast<std::streamoff>(headerOffset + LOCAL_HEADER_CRC_OFFSET));
  put32(entry.crc);
  put32(entry.compressedSize);
  put32(entry.uncompressedSize);
  out.seekp(static_cast<std::streamoff>(end));
  checkStream("seek");

  entries.push_back(std::move(entry));
}

void ZipWriter::close() {
  if (closed) {
    return;
  }

  std::uint64_t centralOffset = position();
  for (const Entry &e : entries) {
    put32(CENTRAL_HEADER_SIG);
    put16(VERSION_MADE_BY);
    put16(VERSION_NEEDED);
    put16(e.flags);
    put16(METHOD_DEFLATE);
    put16(e.dosTime);
    put16(e.dosDate);
    put32(e.crc);
    put32(e.compressedSize);
    put32(e.uncompressedSize);
    put16(static_cast<std::uint16_t>(e.name.size()));
    put16(0); // extra
    put16(0); // comment
    put16(0); // disk number
    put16(0); // internal attributes
    put32(UNIX_FILE_ATTRS);
    put32(e.localHeaderOffset);
    putBytes(e.name.data(), e.name.size());
  }
  std::uint64_t centralSize = position() - centralOffset;
  if (centralOffset > MAX_32 || centralSize > MAX_32) {
    throw std::runtime_error("archive too large: " + path);
  }

  put32(END_OF_CENTRAL_DIR_SIG);
  put16(0);
  put16(0);
  put16(static_cast<std::uint16_t>(entries.size()));
  put16(static_cast<std::uint16_t>(entries.size()));
  put32(static_cast<std::uint32_t>(centralSize));
  put32(static_cast<std::uint32_t>(centralOffset));
  put16(0);

  out.flush();
  checkStream("flush");
  out.close();
  if (out.fail()) {
    throw std::runtime_error("cannot close " + path);
  }
  closed = true;
}

void ZipWriter::put16(std::uint16_t value) {
  char b[2] = {static_cast<char>(value & 0xff),
               static_cast<char>((value >> 8) & 0xff)};
  putBytes(b, sizeof(b));
}

void ZipWriter::put32(std::uint32_t value) {
  char b[4] = {static_cast<char>(value & 0xff),
               static_cast<char>((value >> 8) & 0xff),
               static_cast<char>((value >> 16) & 0xff),
               static_cast<char>((value >> 24) & 0xff)};
  putBytes(b, sizeof(b));
}

void ZipWriter::putBytes(const char *data, std::size_t size) {
  if (size == 0) {
    return;
  }
  out.write(data, static_cast<std::streamsize>(size));
  checkStream("write");
}

std::uint64_t ZipWriter::position() {
  std::streamoff pos = out.tellp();
  if (pos < 0) {
    throw std::runtime_error("cannot tell position in " + path);
  }
  return static_cast<std::uint64_t>(pos);
}

void ZipWriter::checkStream(const char *what) {
  if (!out) {
    throw std::runtime_error(std::string(what) + " failed on " + path);
  }
}

} // namespace foldermon
