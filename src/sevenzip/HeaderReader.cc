#include "HeaderReader.hh"

#include <inttypes.h>

#include "Errors.hh"

using namespace std;

HeaderReader::HeaderReader(const void* data, size_t size)
    : r(data, size) {}

HeaderReader::HeaderReader(const string& data)
    : r(data.data(), data.size()) {}

void HeaderReader::require(size_t size) const {
  if (this->remaining() < size) {
    throw TruncatedDataError(phosg::string_printf(
        "header ends at offset 0x%zX while reading 0x%zX bytes",
        this->where(), size));
  }
}

uint8_t HeaderReader::get_u8() {
  this->require(1);
  return this->r.get_u8();
}

uint16_t HeaderReader::get_u16l() {
  this->require(2);
  return this->r.get_u16l();
}

uint32_t HeaderReader::get_u32l() {
  this->require(4);
  return this->r.get_u32l();
}

uint64_t HeaderReader::get_u64l() {
  this->require(8);
  return this->r.get_u64l();
}

uint64_t HeaderReader::get_number() {
  uint8_t first = this->get_u8();
  uint8_t mask = 0x80;
  uint64_t value = 0;
  for (size_t x = 0; x < 8; x++) {
    if ((first & mask) == 0) {
      uint64_t high_part = first & (mask - 1);
      value |= (high_part << (8 * x));
      return value;
    }
    value |= (static_cast<uint64_t>(this->get_u8()) << (8 * x));
    mask >>= 1;
  }
  return value;
}

size_t HeaderReader::get_count(size_t max_count) {
  uint64_t count = this->get_number();
  if (count > max_count || count > this->remaining()) {
    throw MalformedHeaderError(phosg::string_printf(
        "count %" PRIu64 " at offset 0x%zX is out of range", count,
        this->where()));
  }
  return count;
}

vector<bool> HeaderReader::get_bit_vector(size_t count) {
  this->require((count + 7) / 8);
  vector<bool> ret;
  ret.reserve(count);
  uint8_t mask = 0;
  uint8_t byte = 0;
  while (ret.size() < count) {
    if (mask == 0) {
      byte = this->r.get_u8();
      mask = 0x80;
    }
    ret.emplace_back(byte & mask);
    mask >>= 1;
  }
  return ret;
}

vector<bool> HeaderReader::get_optional_bit_vector(size_t count) {
  if (this->get_u8()) {
    return vector<bool>(count, true);
  }
  return this->get_bit_vector(count);
}

string HeaderReader::read(size_t size) {
  this->require(size);
  return this->r.readx(size);
}

void HeaderReader::skip(size_t size) {
  this->require(size);
  this->r.skip(size);
}

void HeaderReader::go(size_t offset) {
  if (offset > this->size()) {
    throw TruncatedDataError(phosg::string_printf(
        "seek to 0x%zX is beyond end of header (0x%zX bytes)", offset,
        this->size()));
  }
  this->r.go(offset);
}

size_t HeaderReader::where() const {
  return this->r.where();
}

size_t HeaderReader::size() const {
  return this->r.size();
}

size_t HeaderReader::remaining() const {
  return this->r.size() - this->r.where();
}

bool HeaderReader::eof() const {
  return this->remaining() == 0;
}
