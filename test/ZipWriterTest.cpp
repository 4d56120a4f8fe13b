#include <cassert>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "TestUtils.hpp"
#include "ZipReader.hpp"
#include "ZipWriter.hpp"

using foldermon::ZipWriter;
using foldermon::test::TempDir;
using foldermon::test::readZip;

static void testEmptyArchiveIsValid(const TempDir &dir) {
  std::string path = (dir / "empty.zip").string();
  {
    ZipWriter zip(path);
    zip.close();
    assert(zip.entryCount() == 0);
  }
  auto entries = readZip(path);
  assert(entries.empty());
  // End of central directory record only.
  assert(std::filesystem::file_size(path) == 22);
}

static void testEntriesKeepTheirBytes(const TempDir &dir) {
  std::string path = (dir / "mixed.zip").string();

  std::string big;
  for (int i = 0; i < 200000; ++i) {
    big += static_cast<char>((i * 7919) % 251);
  }
  std::string binary("\0\x01\xff\x7f", 4);

  {
    ZipWriter zip(path);
    std::istringstream a("hello");
    std::istringstream b(big);
    std::istringstream c(binary);
    std::istringstream d("");
    zip.addEntry("a.txt", a, 0);
    zip.addEntry("sub/deeper/big.bin", b, 1700000000);
    zip.addEntry("sub/c.bin", c, 1700000000);
    zip.addEntry("empty.txt", d, 1700000000);
    zip.close();
  }

  auto entries = readZip(path);
  assert(entries.size() == 4);
  assert(entries.at("a.txt") == "hello");
  assert(entries.at("sub/deeper/big.bin") == big);
  assert(entries.at("sub/c.bin") == binary);
  assert(entries.at("empty.txt").empty());
}

static void testRejectsUseAfterClose(const TempDir &dir) {
  ZipWriter zip((dir / "closed.zip").string());
  zip.close();
  std::istringstream in("late");
  bool threw = false;
  try {
    zip.addEntry("late.txt", in, 0);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

static void testUnwritablePathThrows(const TempDir &dir) {
  bool threw = false;
  try {
    ZipWriter zip((dir / "missing_dir" / "x.zip").string());
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
}

static void testUtf8FlagOnlyForUtf8Names(const TempDir &dir) {
  std::string path = (dir / "names.zip").string();
  const std::string latin1("caf\xe9.txt");
  const std::string utf8("caf\xc3\xa9.txt");
  const std::string overlong("\xc0\xaf" "etc");
  {
    ZipWriter zip(path);
    std::istringstream a("latin1"), b("utf8"), c("ascii"), d("overlong");
    zip.addEntry(latin1, a, 1700000000);
    zip.addEntry(utf8, b, 1700000000);
    zip.addEntry("plain.txt", c, 1700000000);
    zip.addEntry(overlong, d, 1700000000);
    zip.close();
  }

  std::map<std::string, foldermon::test::ZipEntryInfo> info;
  auto entries = readZip(path, &info);
  assert(entries.size() == 4);
  assert(entries.at(latin1) == "latin1");

  const std::uint16_t utf8Flag = 0x0800;
  assert((info.at(latin1).flags & utf8Flag) == 0);
  assert((info.at(latin1).localFlags & utf8Flag) == 0);
  assert((info.at(overlong).flags & utf8Flag) == 0);
  assert((info.at("plain.txt").flags & utf8Flag) == 0);
  assert((info.at(utf8).flags & utf8Flag) != 0);
  assert((info.at(utf8).localFlags & utf8Flag) != 0);
}

static void testDosDateIsClamped(const TempDir &dir) {
  std::string path = (dir / "dates.zip").string();
  // 2200-01-01 is past the last DOS date, 1970 is before the first.
  const std::time_t farFuture = 7258118400;
  {
    ZipWriter zip(path);
    std::istringstream a("future"), b("past");
    zip.addEntry("future.txt", a, farFuture);
    zip.addEntry("past.txt", b, 0);
    zip.close();
  }

  std::map<std::string, foldermon::test::ZipEntryInfo> info;
  readZip(path, &info);
  assert(info.at("future.txt").dosDate == ((127 << 9) | (12 << 5) | 31));
  assert(info.at("future.txt").dosTime == ((23 << 11) | (59 << 5) | 29));
  assert(info.at("past.txt").dosDate == ((0 << 9) | (1 << 5) | 1));
  assert(info.at("past.txt").dosTime == 0);
}

int main() {
  std::cout << "[Test] ZipWriter..." << std::endl;
  TempDir dir("zipwriter");

  testEmptyArchiveIsValid(dir);
  testEntriesKeepTheirBytes(dir);
  testRejectsUseAfterClose(dir);
  testUnwritablePathThrows(dir);
  testUtf8FlagOnlyForUtf8Names(dir);
  testDosDateIsClamped(dir);

  std::cout << "[Test] ZipWriter passed." << std::endl;
  return 0;
}
