#include "SubStreams.hh"

#include <inttypes.h>
#include <lzma.h>

#include <algorithm>
#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

vector<SubStreamRange> folder_substreams(const Header& header, size_t folder_index) {
  const auto& folders = header.folders();
  if (folder_index >= folders.size()) {
    throw out_of_range(phosg::string_printf("folder %zu does not exist", folder_index));
  }
  const auto& substreams = header.main_streams->substreams;

  // Offsets come from the substream sizes, not from the files, since the header
  // may declare substreams that no file refers to
  size_t first = substreams.folder_first_substream[folder_index];
  size_t count = substreams.num_unpack_streams[folder_index];
  vector<uint64_t> offsets;
  uint64_t offset = 0;
  for (size_t x = 0; x < count; x++) {
    offsets.emplace_back(offset);
    offset += substreams.unpack_sizes[first + x];
  }

  vector<SubStreamRange> ret;
  const auto& files = header.files_info.files;
  for (size_t x = 0; x < files.size(); x++) {
    const auto& file = files[x];
    if (!file.folder_index || *file.folder_index != folder_index) {
      continue;
    }
    ret.emplace_back(SubStreamRange{
        .file_index = x,
        .offset = offsets.at(file.substream_index),
        .size = file.uncompressed_size,
        .expected_crc = file.crc});
  }
  return ret;
}

SubStreamSplitter::SubStreamSplitter(vector<SubStreamRange>&& ranges,
    vector<Sink*>&& sinks, uint64_t folder_size)
    : ranges(std::move(ranges)),
      sinks(std::move(sinks)),
      folder_size(folder_size),
      offset(0),
      current_range(0),
      current_crc(0) {
  if (this->sinks.size() != this->ranges.size()) {
    throw logic_error("sink count does not match substream count");
  }
  uint64_t prev_end = 0;
  for (const auto& range : this->ranges) {
    if (range.offset < prev_end) {
      throw logic_error("substream ranges overlap or are out of order");
    }
    prev_end = range.offset + range.size;
  }
}

void SubStreamSplitter::close_completed_ranges() {
  while (this->current_range < this->ranges.size()) {
    const auto& range = this->ranges[this->current_range];
    if (this->offset < range.offset + range.size) {
      break;
    }
    this->results.emplace_back(SubStreamResult{
        .file_index = range.file_index,
        .size = range.size,
        .crc = this->current_crc,
        .expected_crc = range.expected_crc});
    Sink* sink = this->sinks[this->current_range];
    if (sink) {
      sink->close();
    }
    this->current_range++;
    this->current_crc = 0;
  }
}

void SubStreamSplitter::write(const void* data, size_t size) {
  const uint8_t* p = reinterpret_cast<const uint8_t*>(data);
  this->close_completed_ranges();
  while (size > 0) {
    if (this->current_range >= this->ranges.size()) {
      this->offset += size;
      break;
    }

    const auto& range = this->ranges[this->current_range];
    if (this->offset < range.offset) {
      size_t skip = min<uint64_t>(size, range.offset - this->offset);
      p += skip;
      size -= skip;
      this->offset += skip;
      continue;
    }

    size_t bytes = min<uint64_t>(size, range.offset + range.size - this->offset);
    this->current_crc = lzma_crc32(p, bytes, this->current_crc);
    Sink* sink = this->sinks[this->current_range];
    if (sink) {
      sink->write(p, bytes);
    }
    p += bytes;
    size -= bytes;
    this->offset += bytes;
    this->close_completed_ranges();
  }
}

void SubStreamSplitter::write(const string& data) {
  this->write(data.data(), data.size());
}

vector<SubStreamResult> SubStreamSplitter::finish() {
  this->close_completed_ranges();
  if (this->offset != this->folder_size) {
    throw DecompressionError(phosg::string_printf(
        "folder produced 0x%" PRIX64 " bytes; expected 0x%" PRIX64,
        this->offset, this->folder_size));
  }
  if (this->current_range < this->ranges.size()) {
    throw DecompressionError(phosg::string_printf(
        "substreams extend past the end of the folder (0x%" PRIX64 " bytes)",
        this->folder_size));
  }
  return std::move(this->results);
}
