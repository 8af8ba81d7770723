#include "Header.hh"

#include <inttypes.h>
#include <sys/stat.h>
#include <time.h>

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

const char* name_for_property_id(uint8_t id) {
  static const char* names[] = {"END", "HEADER", "ARCHIVE_PROPERTIES",
      "ADDITIONAL_STREAMS_INFO", "MAIN_STREAMS_INFO", "FILES_INFO",
      "PACK_INFO", "UNPACK_INFO", "SUBSTREAMS_INFO", "SIZE", "CRC", "FOLDER",
      "CODERS_UNPACK_SIZE", "NUM_UNPACK_STREAM", "EMPTY_STREAM", "EMPTY_FILE",
      "ANTI", "NAME", "CTIME", "ATIME", "MTIME", "WIN_ATTRIBUTES", "COMMENT",
      "ENCODED_HEADER", "START_POS", "DUMMY"};
  if (id < sizeof(names) / sizeof(names[0])) {
    return names[id];
  }
  return "unknown";
}

static uint8_t id_of(PropertyID id) {
  return static_cast<uint8_t>(id);
}

static void expect_property(HeaderReader& r, PropertyID expected) {
  size_t offset = r.where();
  uint8_t id = r.get_u8();
  if (id != id_of(expected)) {
    throw MalformedHeaderError(phosg::string_printf(
        "expected property %s at offset 0x%zX; found %s (%02hhX)",
        name_for_property_id(id_of(expected)), offset,
        name_for_property_id(id), id));
  }
}

static void skip_property_data(HeaderReader& r) {
  uint64_t size = r.get_number();
  if (size > r.remaining()) {
    throw TruncatedDataError(phosg::string_printf(
        "property of 0x%" PRIX64 " bytes at offset 0x%zX extends beyond end of header",
        size, r.where()));
  }
  r.skip(size);
}

static vector<optional<uint32_t>> parse_digests(HeaderReader& r, size_t count) {
  auto defined = r.get_optional_bit_vector(count);
  vector<optional<uint32_t>> ret;
  ret.reserve(count);
  for (bool is_defined : defined) {
    if (is_defined) {
      ret.emplace_back(r.get_u32l());
    } else {
      ret.emplace_back();
    }
  }
  return ret;
}

PackInfo parse_pack_info(HeaderReader& r) {
  PackInfo ret;
  ret.pack_pos = r.get_number();
  size_t num_pack_streams = r.get_count();

  for (;;) {
    uint8_t id = r.get_u8();
    if (id == id_of(PropertyID::END)) {
      break;
    } else if (id == id_of(PropertyID::SIZE)) {
      ret.sizes.clear();
      while (ret.sizes.size() < num_pack_streams) {
        ret.sizes.emplace_back(r.get_number());
      }
    } else if (id == id_of(PropertyID::CRC)) {
      ret.crcs = parse_digests(r, num_pack_streams);
    } else {
      skip_property_data(r);
    }
  }

  if (ret.sizes.size() != num_pack_streams) {
    throw MalformedHeaderError("pack info does not contain pack stream sizes");
  }
  ret.crcs.resize(num_pack_streams);

  uint64_t offset = sizeof(SignatureHeader) + ret.pack_pos;
  if (offset < ret.pack_pos) {
    throw MalformedHeaderError("pack position is out of range");
  }
  for (uint64_t size : ret.sizes) {
    ret.offsets.emplace_back(offset);
    if (offset + size < offset) {
      throw MalformedHeaderError("pack stream size is out of range");
    }
    offset += size;
  }
  return ret;
}

Folder parse_folder(HeaderReader& r) {
  static const size_t MAX_CODERS = 64;
  static const size_t MAX_STREAMS = 64;

  Folder ret;
  size_t num_coders = r.get_count(MAX_CODERS);
  if (num_coders == 0) {
    throw MalformedFolderError("folder has no coders");
  }

  size_t total_in = 0;
  size_t total_out = 0;
  while (ret.coders.size() < num_coders) {
    uint8_t flags = r.get_u8();
    if (flags & 0x80) {
      throw MalformedHeaderError("alternative coder methods are not supported");
    }
    auto& coder = ret.coders.emplace_back();
    coder.method_id = r.read(flags & 0x0F);
    if (flags & 0x10) {
      coder.num_in_streams = r.get_count(MAX_STREAMS);
      coder.num_out_streams = r.get_count(MAX_STREAMS);
    }
    if (flags & 0x20) {
      coder.properties = r.read(r.get_count());
    }
    total_in += coder.num_in_streams;
    total_out += coder.num_out_streams;
  }

  if (total_out == 0) {
    throw MalformedFolderError("folder has no output streams");
  }
  size_t num_bind_pairs = total_out - 1;
  if (num_bind_pairs > total_in) {
    throw MalformedFolderError("folder has more bind pairs than input streams");
  }
  while (ret.bind_pairs.size() < num_bind_pairs) {
    auto& bp = ret.bind_pairs.emplace_back();
    bp.in_index = r.get_number();
    bp.out_index = r.get_number();
  }

  size_t num_packed_streams = total_in - num_bind_pairs;
  if (num_packed_streams == 1) {
    for (size_t x = 0; x < total_in; x++) {
      bool is_bound = false;
      for (const auto& bp : ret.bind_pairs) {
        if (bp.in_index == x) {
          is_bound = true;
          break;
        }
      }
      if (!is_bound) {
        ret.packed_streams.emplace_back(x);
        break;
      }
    }
    if (ret.packed_streams.empty()) {
      throw MalformedFolderError("folder has no unbound input stream");
    }
  } else {
    while (ret.packed_streams.size() < num_packed_streams) {
      ret.packed_streams.emplace_back(r.get_number());
    }
  }

  return ret;
}

vector<Folder> parse_unpack_info(HeaderReader& r) {
  expect_property(r, PropertyID::FOLDER);
  size_t num_folders = r.get_count();
  if (r.get_u8() != 0) {
    throw UnsupportedHeaderEncodingError("folders stored in additional streams are not supported");
  }

  vector<Folder> ret;
  ret.reserve(num_folders);
  while (ret.size() < num_folders) {
    ret.emplace_back(parse_folder(r));
  }

  expect_property(r, PropertyID::CODERS_UNPACK_SIZE);
  for (auto& folder : ret) {
    size_t num_out_streams = folder.num_out_streams_total();
    while (folder.unpack_sizes.size() < num_out_streams) {
      folder.unpack_sizes.emplace_back(r.get_number());
    }
  }

  for (;;) {
    uint8_t id = r.get_u8();
    if (id == id_of(PropertyID::END)) {
      break;
    } else if (id == id_of(PropertyID::CRC)) {
      auto crcs = parse_digests(r, num_folders);
      for (size_t x = 0; x < num_folders; x++) {
        ret[x].crc = crcs[x];
      }
    } else {
      skip_property_data(r);
    }
  }

  return ret;
}

SubStreamsInfo parse_substreams_info(HeaderReader& r,
    const vector<Folder>& folders) {
  SubStreamsInfo ret;
  ret.num_unpack_streams.assign(folders.size(), 1);

  uint8_t id;
  for (;;) {
    id = r.get_u8();
    if (id == id_of(PropertyID::NUM_UNPACK_STREAM)) {
      for (auto& num : ret.num_unpack_streams) {
        uint64_t value = r.get_number();
        if (value > 0x7FFFFFFF) {
          throw MalformedHeaderError("too many substreams in folder");
        }
        num = value;
      }
    } else if ((id == id_of(PropertyID::CRC)) ||
        (id == id_of(PropertyID::SIZE)) || (id == id_of(PropertyID::END))) {
      break;
    } else {
      skip_property_data(r);
    }
  }

  // All but the last size in each folder are stored explicitly; the last is
  // whatever remains of the folder's output
  bool sizes_present = (id == id_of(PropertyID::SIZE));
  for (size_t x = 0; x < folders.size(); x++) {
    size_t num = ret.num_unpack_streams[x];
    ret.folder_first_substream.emplace_back(ret.unpack_sizes.size());
    if (num == 0) {
      continue;
    }
    if (!sizes_present && num > 1) {
      throw MalformedHeaderError("substream sizes are missing");
    }

    uint64_t folder_size = folders[x].unpack_size();
    uint64_t sum = 0;
    for (size_t y = 1; sizes_present && (y < num); y++) {
      uint64_t size = r.get_number();
      sum += size;
      if (sum < size || sum > folder_size) {
        throw MalformedHeaderError(phosg::string_printf(
            "substream sizes exceed size of folder %zu", x));
      }
      ret.unpack_sizes.emplace_back(size);
    }
    ret.unpack_sizes.emplace_back(folder_size - sum);
  }
  if (sizes_present) {
    id = r.get_u8();
  }

  ret.crcs.resize(ret.unpack_sizes.size());
  size_t num_digests = 0;
  for (size_t x = 0; x < folders.size(); x++) {
    size_t num = ret.num_unpack_streams[x];
    if (num != 1 || !folders[x].crc.has_value()) {
      num_digests += num;
    }
  }

  for (;;) {
    if (id == id_of(PropertyID::END)) {
      break;
    } else if (id == id_of(PropertyID::CRC)) {
      auto digests = parse_digests(r, num_digests);
      size_t digest_index = 0;
      for (size_t x = 0; x < folders.size(); x++) {
        size_t num = ret.num_unpack_streams[x];
        if (num == 1 && folders[x].crc.has_value()) {
          continue;
        }
        size_t first = ret.folder_first_substream[x];
        for (size_t y = 0; y < num; y++) {
          ret.crcs[first + y] = digests[digest_index++];
        }
      }
    } else {
      skip_property_data(r);
    }
    id = r.get_u8();
  }

  return ret;
}

static SubStreamsInfo default_substreams_info(const vector<Folder>& folders) {
  SubStreamsInfo ret;
  for (const auto& folder : folders) {
    ret.folder_first_substream.emplace_back(ret.unpack_sizes.size());
    ret.num_unpack_streams.emplace_back(1);
    ret.unpack_sizes.emplace_back(folder.unpack_size());
    ret.crcs.emplace_back();
  }
  return ret;
}

StreamsInfo parse_streams_info(HeaderReader& r) {
  StreamsInfo ret;
  bool has_substreams = false;
  for (;;) {
    size_t offset = r.where();
    uint8_t id = r.get_u8();
    if (id == id_of(PropertyID::END)) {
      break;
    } else if (id == id_of(PropertyID::PACK_INFO)) {
      ret.pack_info = parse_pack_info(r);
    } else if (id == id_of(PropertyID::UNPACK_INFO)) {
      ret.folders = parse_unpack_info(r);
    } else if (id == id_of(PropertyID::SUBSTREAMS_INFO)) {
      ret.substreams = parse_substreams_info(r, ret.folders);
      has_substreams = true;
    } else {
      throw MalformedHeaderError(phosg::string_printf(
          "unexpected property %s (%02hhX) in streams info at offset 0x%zX",
          name_for_property_id(id), id, offset));
    }
  }

  if (!has_substreams) {
    ret.substreams = default_substreams_info(ret.folders);
  }

  size_t pack_stream_index = 0;
  for (size_t x = 0; x < ret.folders.size(); x++) {
    ret.folder_first_pack_stream.emplace_back(pack_stream_index);
    pack_stream_index += ret.folders[x].packed_streams.size();
  }
  if (pack_stream_index > ret.pack_info.sizes.size()) {
    throw MalformedHeaderError(phosg::string_printf(
        "folders use %zu pack streams, but only %zu are present",
        pack_stream_index, ret.pack_info.sizes.size()));
  }

  return ret;
}

static vector<optional<uint64_t>> parse_optional_u64s(HeaderReader& r,
    size_t count) {
  auto defined = r.get_optional_bit_vector(count);
  if (r.get_u8() != 0) {
    throw UnsupportedHeaderEncodingError("file properties stored in additional streams are not supported");
  }
  vector<optional<uint64_t>> ret;
  for (bool is_defined : defined) {
    if (is_defined) {
      ret.emplace_back(r.get_u64l());
    } else {
      ret.emplace_back();
    }
  }
  return ret;
}

FilesInfo parse_files_info(HeaderReader& r) {
  FilesInfo ret;
  size_t num_files = r.get_number();
  if (num_files > r.remaining() * 8) {
    throw MalformedHeaderError("file count is out of range");
  }
  ret.files.resize(num_files);
  for (size_t x = 0; x < num_files; x++) {
    ret.files[x].id = x;
  }

  size_t num_empty_streams = 0;
  for (;;) {
    uint8_t type = r.get_u8();
    if (type == id_of(PropertyID::END)) {
      break;
    }
    uint64_t size = r.get_number();
    if (size > r.remaining()) {
      throw TruncatedDataError(phosg::string_printf(
          "file property %s is larger than the remaining header",
          name_for_property_id(type)));
    }
    size_t end_offset = r.where() + size;

    switch (static_cast<PropertyID>(type)) {
      case PropertyID::EMPTY_STREAM:
        ret.empty_stream = r.get_bit_vector(num_files);
        num_empty_streams = 0;
        for (bool is_empty : ret.empty_stream) {
          num_empty_streams += is_empty;
        }
        ret.empty_file.assign(num_empty_streams, false);
        ret.anti.assign(num_empty_streams, false);
        break;

      case PropertyID::EMPTY_FILE:
        ret.empty_file = r.get_bit_vector(num_empty_streams);
        break;

      case PropertyID::ANTI:
        ret.anti = r.get_bit_vector(num_empty_streams);
        break;

      case PropertyID::NAME: {
        if (r.get_u8() != 0) {
          throw UnsupportedHeaderEncodingError("file names stored in additional streams are not supported");
        }
        for (auto& file : ret.files) {
          string utf16;
          for (;;) {
            if (r.where() + 2 > end_offset) {
              throw MalformedHeaderError("file name is not terminated");
            }
            uint16_t ch = r.get_u16l();
            if (ch == 0) {
              break;
            }
            utf16.push_back(ch & 0xFF);
            utf16.push_back(ch >> 8);
          }
          file.filename = utf16le_to_utf8(utf16);
        }
        break;
      }

      case PropertyID::CTIME:
      case PropertyID::ATIME:
      case PropertyID::MTIME:
      case PropertyID::START_POS: {
        auto values = parse_optional_u64s(r, num_files);
        for (size_t x = 0; x < num_files; x++) {
          auto& file = ret.files[x];
          if (type == id_of(PropertyID::CTIME)) {
            file.creation_time = values[x];
          } else if (type == id_of(PropertyID::ATIME)) {
            file.access_time = values[x];
          } else if (type == id_of(PropertyID::MTIME)) {
            file.last_write_time = values[x];
          } else {
            file.start_pos = values[x];
          }
        }
        break;
      }

      case PropertyID::WIN_ATTRIBUTES: {
        auto defined = r.get_optional_bit_vector(num_files);
        if (r.get_u8() != 0) {
          throw UnsupportedHeaderEncodingError("file attributes stored in additional streams are not supported");
        }
        for (size_t x = 0; x < num_files; x++) {
          if (defined[x]) {
            ret.files[x].attributes = r.get_u32l();
          }
        }
        break;
      }

      default:
        r.skip(size);
        break;
    }

    if (r.where() > end_offset) {
      throw MalformedHeaderError(phosg::string_printf(
          "file property %s overran its declared size",
          name_for_property_id(type)));
    }
    r.go(end_offset);
  }

  return ret;
}

// Assigns each file that has data to the next substream, skipping folders
// that contain no substreams, and fills in the per-file fields that depend on
// which kind of entry it is
static void assign_substreams(Header& header) {
  auto& info = header.files_info;
  const auto& folders = header.folders();

  size_t folder_index = 0;
  size_t index_in_folder = 0;
  size_t empty_index = 0;
  for (size_t x = 0; x < info.files.size(); x++) {
    auto& file = info.files[x];
    bool is_empty_stream = !info.empty_stream.empty() && info.empty_stream[x];

    if (is_empty_stream) {
      bool is_empty_file = (empty_index < info.empty_file.size()) && info.empty_file[empty_index];
      file.is_anti = (empty_index < info.anti.size()) && info.anti[empty_index];
      file.is_directory = !is_empty_file;
      file.is_empty_file = is_empty_file;
      file.uncompressed_size = 0;
      empty_index++;
      continue;
    }

    if (!header.main_streams) {
      throw MalformedHeaderError(phosg::string_printf(
          "file %zu (%s) has data, but the archive has no streams",
          x, file.filename.c_str()));
    }
    const auto& substreams = header.main_streams->substreams;
    if (index_in_folder == 0) {
      while (folder_index < folders.size() && substreams.num_unpack_streams[folder_index] == 0) {
        folder_index++;
      }
      if (folder_index >= folders.size()) {
        throw MalformedHeaderError(phosg::string_printf(
            "file %zu (%s) has data, but there are no more substreams",
            x, file.filename.c_str()));
      }
    }

    size_t substream = substreams.folder_first_substream[folder_index] + index_in_folder;
    file.folder_index = folder_index;
    file.substream_index = index_in_folder;
    file.uncompressed_size = substreams.unpack_sizes[substream];
    file.crc = substreams.crcs[substream];
    if (!file.crc && substreams.num_unpack_streams[folder_index] == 1) {
      file.crc = folders[folder_index].crc;
    }

    index_in_folder++;
    if (index_in_folder >= substreams.num_unpack_streams[folder_index]) {
      folder_index++;
      index_in_folder = 0;
    }
  }
}

Header parse_header(HeaderReader& r) {
  Header ret;

  uint8_t id = r.get_u8();
  if (id == id_of(PropertyID::ARCHIVE_PROPERTIES)) {
    for (;;) {
      uint8_t type = r.get_u8();
      if (type == id_of(PropertyID::END)) {
        break;
      }
      skip_property_data(r);
    }
    id = r.get_u8();
  }

  if (id == id_of(PropertyID::ADDITIONAL_STREAMS_INFO)) {
    ret.additional_streams = parse_streams_info(r);
    id = r.get_u8();
  }

  if (id == id_of(PropertyID::MAIN_STREAMS_INFO)) {
    ret.main_streams = parse_streams_info(r);
    id = r.get_u8();
  }

  if (id == id_of(PropertyID::FILES_INFO)) {
    ret.files_info = parse_files_info(r);
    id = r.get_u8();
  }

  if (id != id_of(PropertyID::END)) {
    throw MalformedHeaderError(phosg::string_printf(
        "unexpected property %s (%02hhX) at end of header",
        name_for_property_id(id), id));
  }

  assign_substreams(ret);
  return ret;
}

const vector<Folder>& Header::folders() const {
  static const vector<Folder> no_folders;
  return this->main_streams ? this->main_streams->folders : no_folders;
}

optional<uint32_t> FileEntry::posix_mode() const {
  if (this->attributes && (*this->attributes & FILE_ATTRIBUTE_UNIX_EXTENSION)) {
    return *this->attributes >> 16;
  }
  return nullopt;
}

bool FileEntry::is_symlink() const {
  auto mode = this->posix_mode();
  return mode && S_ISLNK(*mode);
}

// Difference between 1601-01-01 and 1970-01-01, in 100ns ticks
static const uint64_t FILETIME_UNIX_EPOCH = 116444736000000000ULL;

int64_t filetime_to_unix(uint64_t filetime) {
  return (static_cast<int64_t>(filetime) - static_cast<int64_t>(FILETIME_UNIX_EPOCH)) / 10000000;
}

uint64_t unix_to_filetime(int64_t t) {
  return static_cast<uint64_t>(t * 10000000 + static_cast<int64_t>(FILETIME_UNIX_EPOCH));
}

string format_filetime(uint64_t filetime) {
  time_t t = filetime_to_unix(filetime);
  struct tm tm;
  gmtime_r(&t, &tm);
  char buf[0x40];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

string utf16le_to_utf8(const string& data) {
  string ret;
  for (size_t x = 0; x + 1 < data.size(); x += 2) {
    uint32_t ch = static_cast<uint8_t>(data[x]) | (static_cast<uint8_t>(data[x + 1]) << 8);

    // Combine surrogate pairs; unpaired surrogates become U+FFFD
    if (ch >= 0xD800 && ch <= 0xDBFF) {
      uint32_t low = (x + 3 < data.size())
          ? (static_cast<uint8_t>(data[x + 2]) | (static_cast<uint8_t>(data[x + 3]) << 8))
          : 0;
      if (low >= 0xDC00 && low <= 0xDFFF) {
        ch = 0x10000 + ((ch - 0xD800) << 10) + (low - 0xDC00);
        x += 2;
      } else {
        ch = 0xFFFD;
      }
    } else if (ch >= 0xDC00 && ch <= 0xDFFF) {
      ch = 0xFFFD;
    }

    if (ch < 0x80) {
      ret.push_back(ch);
    } else if (ch < 0x800) {
      ret.push_back(0xC0 | (ch >> 6));
      ret.push_back(0x80 | (ch & 0x3F));
    } else if (ch < 0x10000) {
      ret.push_back(0xE0 | (ch >> 12));
      ret.push_back(0x80 | ((ch >> 6) & 0x3F));
      ret.push_back(0x80 | (ch & 0x3F));
    } else {
      ret.push_back(0xF0 | (ch >> 18));
      ret.push_back(0x80 | ((ch >> 12) & 0x3F));
      ret.push_back(0x80 | ((ch >> 6) & 0x3F));
      ret.push_back(0x80 | (ch & 0x3F));
    }
  }
  return ret;
}
