#ifndef FOLDERMON_ZIPWRITER_HPP
#define FOLDERMON_ZIPWRITER_HPP

#include <cstdint>
#include <ctime>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace foldermon {

// Streaming ZIP writer. Entries are deflated with zlib; each local header
// is patched with its CRC and sizes once the entry's data is written.
// No ZIP64: entries above 4 GiB or more than 65535 entries are rejected.
// All failures throw std::runtime_error.
class ZipWriter {
public:
  explicit ZipWriter(const std::string &zipPath);
  ~ZipWriter();

  ZipWriter(const ZipWriter &) = delete;
  ZipWriter &operator=(const ZipWriter &) = delete;

  // Copies the whole stream into a new entry named name (forward slashes).
  void addEntry(const std::string &name, std::istream &in,
                std::time_t modified);

  // Writes the central directory and closes the file. Must be called once
  // for the archive to be valid.
  void close();

  std::size_t entryCount() const { return entries.size(); }

private:
  struct Entry {
    std::string name;
    std::uint32_t crc;
    std::uint32_t compressedSize;
    std::uint32_t uncompressedSize;
    std::uint32_t localHeaderOffset;
    std::uint16_t flags;
    std::uint16_t dosTime;
    std::uint16_t dosDate;
  };

  void put16(std::uint16_t value);
  void put32(std::uint32_t value);
  void putBytes(const char *data, std::size_t size);
  std::uint64_t position();
  void checkStream(const char *what);

  std::string path;
  std::ofstream out;
  std::vector<Entry> entries;
  bool closed = false;
};

} // namespace foldermon

#endif // FOLDERMON_ZIPWRITER_HPP
