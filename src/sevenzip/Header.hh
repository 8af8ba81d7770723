#pragma once

#include <stdint.h>

#include <optional>
#include <phosg/Encoding.hh>
#include <string>
#include <vector>

#include "HeaderReader.hh"

enum class PropertyID : uint8_t {
  END = 0x00,
  HEADER = 0x01,
  ARCHIVE_PROPERTIES = 0x02,
  ADDITIONAL_STREAMS_INFO = 0x03,
  MAIN_STREAMS_INFO = 0x04,
  FILES_INFO = 0x05,
  PACK_INFO = 0x06,
  UNPACK_INFO = 0x07,
  SUBSTREAMS_INFO = 0x08,
  SIZE = 0x09,
  CRC = 0x0A,
  FOLDER = 0x0B,
  CODERS_UNPACK_SIZE = 0x0C,
  NUM_UNPACK_STREAM = 0x0D,
  EMPTY_STREAM = 0x0E,
  EMPTY_FILE = 0x0F,
  ANTI = 0x10,
  NAME = 0x11,
  CTIME = 0x12,
  ATIME = 0x13,
  MTIME = 0x14,
  WIN_ATTRIBUTES = 0x15,
  COMMENT = 0x16,
  ENCODED_HEADER = 0x17,
  START_POS = 0x18,
  DUMMY = 0x19,
};

const char* name_for_property_id(uint8_t id);

struct SignatureHeader {
  uint8_t signature[6]; // 37 7A BC AF 27 1C
  uint8_t version_major;
  uint8_t version_minor;
  phosg::le_uint32_t start_header_crc; // Covers the next 20 bytes
  phosg::le_uint64_t next_header_offset; // Relative to the end of this struct
  phosg::le_uint64_t next_header_size;
  phosg::le_uint32_t next_header_crc;
} __attribute__((packed));

static constexpr uint8_t SIGNATURE[6] = {'7', 'z', 0xBC, 0xAF, 0x27, 0x1C};

enum FileAttribute {
  FILE_ATTRIBUTE_READONLY = 0x00000001,
  FILE_ATTRIBUTE_HIDDEN = 0x00000002,
  FILE_ATTRIBUTE_SYSTEM = 0x00000004,
  FILE_ATTRIBUTE_DIRECTORY = 0x00000010,
  FILE_ATTRIBUTE_ARCHIVE = 0x00000020,
  FILE_ATTRIBUTE_REPARSE_POINT = 0x00000400,
  // If set, the high 16 bits hold a POSIX st_mode
  FILE_ATTRIBUTE_UNIX_EXTENSION = 0x00008000,
};

struct Coder {
  std::string method_id;
  size_t num_in_streams = 1;
  size_t num_out_streams = 1;
  std::string properties;
};

struct BindPair {
  size_t in_index;
  size_t out_index;
};

struct Folder {
  std::vector<Coder> coders;
  std::vector<BindPair> bind_pairs;
  // Folder in-stream index fed by each of this folder's pack streams, in pack
  // stream order
  std::vector<size_t> packed_streams;
  // One entry per out stream (across all coders, in coder order)
  std::vector<uint64_t> unpack_sizes;
  std::optional<uint32_t> crc;

  size_t num_in_streams_total() const;
  size_t num_out_streams_total() const;
  // Index of the out stream not consumed by any bind pair. Throws
  // MalformedFolderError if there isn't exactly one.
  size_t main_out_stream() const;
  // Size of the folder's final output
  uint64_t unpack_size() const;
};

struct PackInfo {
  uint64_t pack_pos = 0; // Relative to the end of the signature header
  std::vector<uint64_t> sizes;
  std::vector<std::optional<uint32_t>> crcs;
  // Absolute offsets of each pack stream in the archive, derived from pack_pos
  // and sizes
  std::vector<uint64_t> offsets;
};

struct SubStreamsInfo {
  // One entry per folder
  std::vector<size_t> num_unpack_streams;
  // One entry per substream, across all folders in folder order
  std::vector<uint64_t> unpack_sizes;
  // Only substreams whose CRC was stored explicitly have a value here; a
  // folder with a single substream may rely on the folder CRC instead
  std::vector<std::optional<uint32_t>> crcs;
  // Index into unpack_sizes/crcs of each folder's first substream
  std::vector<size_t> folder_first_substream;
};

struct StreamsInfo {
  PackInfo pack_info;
  std::vector<Folder> folders;
  SubStreamsInfo substreams;
  // Index into pack_info of each folder's first pack stream
  std::vector<size_t> folder_first_pack_stream;
};

struct FileEntry {
  size_t id = 0;
  std::string filename; // UTF-8
  bool is_directory = false;
  bool is_empty_file = false;
  bool is_anti = false;
  std::optional<uint32_t> attributes;
  std::optional<uint64_t> creation_time;
  std::optional<uint64_t> access_time;
  std::optional<uint64_t> last_write_time;
  std::optional<uint64_t> start_pos;
  uint64_t uncompressed_size = 0;
  std::optional<uint32_t> crc;
  // Present only for entries backed by a substream
  std::optional<size_t> folder_index;
  size_t substream_index = 0; // Within the folder

  bool has_stream() const {
    return this->folder_index.has_value();
  }
  bool is_symlink() const;
  // POSIX mode bits, if the attributes carry them
  std::optional<uint32_t> posix_mode() const;
};

struct FilesInfo {
  std::vector<FileEntry> files;
  std::vector<bool> empty_stream;
  std::vector<bool> empty_file; // One entry per empty stream
  std::vector<bool> anti; // One entry per empty stream
};

struct Header {
  std::optional<StreamsInfo> additional_streams;
  std::optional<StreamsInfo> main_streams;
  FilesInfo files_info;

  // Every folder in main_streams, or an empty list
  const std::vector<Folder>& folders() const;
};

// Parses the structures below from header bytes. r must be positioned after
// the property ID that introduces the structure.
PackInfo parse_pack_info(HeaderReader& r);
Folder parse_folder(HeaderReader& r);
std::vector<Folder> parse_unpack_info(HeaderReader& r);
SubStreamsInfo parse_substreams_info(HeaderReader& r,
    const std::vector<Folder>& folders);
StreamsInfo parse_streams_info(HeaderReader& r);
FilesInfo parse_files_info(HeaderReader& r);

// Parses a plain (not encoded) header; r must be positioned after the HEADER
// property ID
Header parse_header(HeaderReader& r);

// 100ns ticks since 1601-01-01 UTC
int64_t filetime_to_unix(uint64_t filetime);
uint64_t unix_to_filetime(int64_t t);
std::string format_filetime(uint64_t filetime);

std::string utf16le_to_utf8(const std::string& data);
