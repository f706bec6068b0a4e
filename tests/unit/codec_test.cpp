#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/gzip.hpp"
#include "internal/util/sha256.hpp"

namespace {

using namespace sqlvault::util;

void TestSha256KnownVectors() {
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestGzipRestoresOriginalBytes() {
  std::string script;
  for (int i = 0; i < 5000; ++i) {
    script += "INSERT INTO \"t\" (\"id\") VALUES (" + std::to_string(i) + ");\n";
  }
  script.push_back('\0');
  script += "trailing binary \xff\xfe";

  const auto compressed = GzipCompress(script);
  assert(compressed.size() < script.size());
  assert(static_cast<unsigned char>(compressed[0]) == 0x1f);
  assert(static_cast<unsigned char>(compressed[1]) == 0x8b);
  assert(GzipDecompress(compressed) == script);
}

void TestGzipIsDeterministic() {
  const std::string text = "-- SQLVault Database Backup\nBEGIN TRANSACTION;\nCOMMIT;\n";
  assert(GzipCompress(text) == GzipCompress(text));
}

void TestCorruptGzipIsAnIntegrityError() {
  auto compressed = GzipCompress(std::string(4096, 'x'));

  auto flipped = compressed;
  flipped[flipped.size() / 2] ^= 0x5A;

  const std::string inputs[] = {
      "not gzip at all",
      compressed.substr(0, compressed.size() / 2),
      flipped,
      compressed + "junk",
  };

  for (const auto& input : inputs) {
    bool threw = false;
    try {
      (void)GzipDecompress(input);
    } catch (const IntegrityError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestFormatSize() {
  assert(FormatSize(0) == "0.0B");
  assert(FormatSize(512) == "512.0B");
  assert(FormatSize(1536) == "1.5KB");
  assert(FormatSize(5ull * 1024 * 1024) == "5.0MB");
  assert(FormatSize(3ull * 1024 * 1024 * 1024) == "3.0GB");
}

} // namespace

int main() {
  TestSha256KnownVectors();
  TestGzipRestoresOriginalBytes();
  TestGzipIsDeterministic();
  TestCorruptGzipIsAnIntegrityError();
  TestFormatSize();

  std::cout << "sqlvault_unit_codec: pass\n";
  return 0;
}
