#pragma once

#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "Header.hh"
#include "Sink.hh"

// One file's slice of a folder's decoded output
struct SubStreamRange {
  size_t file_index;
  uint64_t offset;
  uint64_t size;
  std::optional<uint32_t> expected_crc;
};

// Ranges of every file stored in the given folder, in declaration order
std::vector<SubStreamRange> folder_substreams(const Header& header,
    size_t folder_index);

struct SubStreamResult {
  size_t file_index;
  uint64_t size;
  uint32_t crc;
  std::optional<uint32_t> expected_crc;

  bool crc_ok() const {
    return !this->expected_crc || (*this->expected_crc == this->crc);
  }
};

// Splits a folder's decoded output, which may arrive in chunks of any size,
// into its files. sinks has one entry per range; null entries are checksummed
// but not written anywhere. Each sink is closed as soon as its range is
// complete.
class SubStreamSplitter {
public:
  SubStreamSplitter(std::vector<SubStreamRange>&& ranges,
      std::vector<Sink*>&& sinks, uint64_t folder_size);
  ~SubStreamSplitter() = default;

  void write(const void* data, size_t size);
  void write(const std::string& data);

  // Throws DecompressionError if fewer or more bytes than the folder's
  // size were written
  std::vector<SubStreamResult> finish();

private:
  void close_completed_ranges();

  std::vector<SubStreamRange> ranges;
  std::vector<Sink*> sinks;
  uint64_t folder_size;
  uint64_t offset;
  size_t current_range;
  uint32_t current_crc;
  std::vector<SubStreamResult> results;
};
