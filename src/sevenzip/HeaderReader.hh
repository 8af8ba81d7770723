#pragma once

#include <stdint.h>

#include <phosg/Strings.hh>
#include <string>
#include <vector>

// Cursor over header bytes. All reads throw TruncatedDataError if the data
// ends early.
class HeaderReader {
public:
  HeaderReader(const void* data, size_t size);
  // The reader doesn't copy data, so it must outlive the reader
  explicit HeaderReader(const std::string& data);
  explicit HeaderReader(std::string&& data) = delete;
  ~HeaderReader() = default;

  uint8_t get_u8();
  uint16_t get_u16l();
  uint32_t get_u32l();
  uint64_t get_u64l();

  // 7z variable-length number. The count of leading one bits in the first
  // byte is the number of extension bytes that follow (little-endian); the
  // remaining low bits of the first byte are the value's high bits.
  uint64_t get_number();
  // A number that will be used as an element count; it must not exceed
  // max_count (and every element is assumed to need at least one byte)
  size_t get_count(size_t max_count = SIZE_MAX);

  std::vector<bool> get_bit_vector(size_t count);
  // A single byte that is either nonzero ("all defined") or zero, followed by
  // an explicit bit vector
  std::vector<bool> get_optional_bit_vector(size_t count);

  std::string read(size_t size);
  void skip(size_t size);
  void go(size_t offset);

  size_t where() const;
  size_t size() const;
  size_t remaining() const;
  bool eof() const;

private:
  void require(size_t size) const;

  phosg::StringReader r;
};
