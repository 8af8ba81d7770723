#include "Archive.hh"

#include <inttypes.h>
#include <lzma.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

// Encoded headers may themselves describe an encoded header; real archives
// never nest more than once
static const size_t MAX_HEADER_ENCODING_DEPTH = 4;

SevenZipArchive::SevenZipArchive(const string& filename,
    const DecoderRegistry& registry)
    : SevenZipArchive(open_byte_source(filename), registry) {}

SevenZipArchive::SevenZipArchive(unique_ptr<ByteSource>&& source,
    const DecoderRegistry& registry)
    : registry(registry),
      source(std::move(source)) {
  if (!this->source) {
    throw invalid_argument("byte source is null");
  }
  this->parsed_header = this->read_header();
}

unique_ptr<SevenZipArchive> SevenZipArchive::from_data(string&& data,
    const DecoderRegistry& registry) {
  return make_unique<SevenZipArchive>(
      make_unique<StringByteSource>(std::move(data)), registry);
}

Header SevenZipArchive::read_header() {
  if (this->source->size() < sizeof(SignatureHeader)) {
    throw NotA7zArchiveError(phosg::string_printf(
        "data is too small to be a 7z archive (0x%" PRIX64 " bytes)",
        this->source->size()));
  }

  SignatureHeader sig;
  this->source->pread(&sig, sizeof(sig), 0);
  if (memcmp(sig.signature, SIGNATURE, sizeof(SIGNATURE))) {
    throw NotA7zArchiveError("signature is incorrect");
  }
  if (sig.version_major != 0) {
    throw NotA7zArchiveError(phosg::string_printf(
        "unsupported format version %hhu.%hhu", sig.version_major, sig.version_minor));
  }

  // The start header is everything after the CRC field
  const uint8_t* start_header = reinterpret_cast<const uint8_t*>(&sig) + 12;
  uint32_t start_header_crc = lzma_crc32(start_header, sizeof(SignatureHeader) - 12, 0);
  if (start_header_crc != sig.start_header_crc.load()) {
    throw NotA7zArchiveError(phosg::string_printf(
        "start header checksum mismatch: expected %08X, got %08X",
        sig.start_header_crc.load(), start_header_crc));
  }

  uint64_t next_header_size = sig.next_header_size;
  if (next_header_size == 0) {
    return Header();
  }
  uint64_t next_header_offset = sig.next_header_offset;
  uint64_t available = this->source->size() - sizeof(SignatureHeader);
  if ((next_header_offset > available) || (next_header_size > available - next_header_offset)) {
    throw TruncatedDataError(phosg::string_printf(
        "header (0x%" PRIX64 " bytes at offset 0x%" PRIX64 ") extends beyond end of archive (0x%" PRIX64 " bytes)",
        next_header_size, next_header_offset + sizeof(SignatureHeader),
        this->source->size()));
  }

  string data = this->source->pread(next_header_size,
      next_header_offset + sizeof(SignatureHeader));
  uint32_t header_crc = lzma_crc32(
      reinterpret_cast<const uint8_t*>(data.data()), data.size(), 0);
  if (header_crc != sig.next_header_crc.load()) {
    throw NotA7zArchiveError(phosg::string_printf(
        "header checksum mismatch: expected %08X, got %08X",
        sig.next_header_crc.load(), header_crc));
  }

  for (size_t depth = 0; depth <= MAX_HEADER_ENCODING_DEPTH; depth++) {
    HeaderReader r(data);
    uint8_t id = r.get_u8();
    if (id == static_cast<uint8_t>(PropertyID::HEADER)) {
      return parse_header(r);
    } else if (id == static_cast<uint8_t>(PropertyID::ENCODED_HEADER)) {
      StreamsInfo streams_info = parse_streams_info(r);
      data = this->decode_encoded_header(streams_info);
    } else {
      throw MalformedHeaderError(phosg::string_printf(
          "header begins with %s (%02hhX)", name_for_property_id(id), id));
    }
  }
  throw MalformedHeaderError("header encoding is nested too deeply");
}

string SevenZipArchive::decode_encoded_header(const StreamsInfo& streams_info) {
  if (streams_info.folders.empty()) {
    throw MalformedHeaderError("encoded header has no folders");
  }

  string ret;
  for (size_t folder_index = 0; folder_index < streams_info.folders.size(); folder_index++) {
    const auto& folder = streams_info.folders[folder_index];
    for (const auto& coder : folder.coders) {
      if (coder.method_id == METHOD_AES) {
        throw UnsupportedHeaderEncodingError("header is encrypted");
      }
      if (!this->registry.contains(coder.method_id)) {
        throw UnsupportedHeaderEncodingError(phosg::string_printf(
            "header is compressed with unsupported method %s (%s)",
            format_method_id(coder.method_id).c_str(), method_name(coder.method_id)));
      }
    }

    auto pack_streams = read_folder_pack_streams(*this->source, streams_info, folder_index);
    string decoded = decode_folder(folder, std::move(pack_streams), this->registry);

    optional<uint32_t> expected_crc = folder.crc;
    const auto& substreams = streams_info.substreams;
    if (!expected_crc && substreams.num_unpack_streams[folder_index] == 1) {
      expected_crc = substreams.crcs[substreams.folder_first_substream[folder_index]];
    }
    if (expected_crc) {
      uint32_t actual_crc = lzma_crc32(
          reinterpret_cast<const uint8_t*>(decoded.data()), decoded.size(), 0);
      if (actual_crc != *expected_crc) {
        throw NotA7zArchiveError(phosg::string_printf(
            "encoded header checksum mismatch: expected %08X, got %08X",
            *expected_crc, actual_crc));
      }
    }
    ret += decoded;
  }
  return ret;
}

void SevenZipArchive::check_open() const {
  shared_lock<shared_mutex> g(this->state_lock);
  if (!this->source) {
    throw UseAfterCloseError("archive is closed");
  }
}

const Header& SevenZipArchive::header() const {
  this->check_open();
  return this->parsed_header;
}

const vector<FileEntry>& SevenZipArchive::entries() const {
  return this->header().files_info.files;
}

const FileEntry& SevenZipArchive::entry(size_t id) const {
  const auto& files = this->entries();
  if (id >= files.size()) {
    throw out_of_range(phosg::string_printf(
        "entry %zu does not exist (archive has %zu entries)", id, files.size()));
  }
  return files[id];
}

vector<string> SevenZipArchive::list_names() const {
  vector<string> ret;
  for (const auto& file : this->entries()) {
    ret.emplace_back(file.filename);
  }
  return ret;
}

bool is_safe_entry_name(const string& name) {
  if (name.empty() || name[0] == '/') {
    return false;
  }
  for (const auto& component : phosg::split(name, '/')) {
    if (component == "..") {
      return false;
    }
  }
  return true;
}

bool is_safe_link_target(const string& link_name, const string& target) {
  if (target.empty() || target[0] == '/') {
    return false;
  }

  // Depth of the directory containing the link
  int64_t depth = 0;
  auto name_components = phosg::split(link_name, '/');
  for (size_t x = 0; x + 1 < name_components.size(); x++) {
    const auto& component = name_components[x];
    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      return false;
    }
    depth++;
  }

  for (const auto& component : phosg::split(target, '/')) {
    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      if (--depth < 0) {
        return false;
      }
    } else {
      depth++;
    }
  }
  return true;
}

// True if any directory between dir and dir/name is a symbolic link
static bool has_symlink_parent(const string& dir, const string& name) {
  auto components = phosg::split(name, '/');
  string path = dir;
  for (size_t x = 0; x + 1 < components.size(); x++) {
    path += (path.empty() ? "" : "/") + components[x];
    struct stat st;
    if (!lstat(path.c_str(), &st) && S_ISLNK(st.st_mode)) {
      return true;
    }
  }
  return false;
}

bool create_symlink_in_dir(const string& dir, const string& link_name,
    const string& target) {
  if (!is_safe_link_target(link_name, target)) {
    fprintf(stderr, "warning: skipping symbolic link %s with unsafe target \"%s\"\n",
        link_name.c_str(), target.c_str());
    return false;
  }
  if (has_symlink_parent(dir, link_name)) {
    fprintf(stderr, "warning: skipping symbolic link %s inside another symbolic link\n",
        link_name.c_str());
    return false;
  }
  try {
    SymlinkSink sink(dir.empty() ? link_name : (dir + "/" + link_name));
    sink.write(target.data(), target.size());
    sink.close();
  } catch (const runtime_error& e) {
    fprintf(stderr, "warning: skipping symbolic link %s: %s\n",
        link_name.c_str(), e.what());
    return false;
  }
  return true;
}

static void throw_first_folder_error(const ExtractionResult& result) {
  if (result.folder_errors.empty()) {
    return;
  }
  for (size_t x = 1; x < result.folder_errors.size(); x++) {
    const auto& e = result.folder_errors[x];
    fprintf(stderr, "warning: folder %zu failed: %s\n", e.folder_index, e.message.c_str());
  }
  for (const auto& e : result.checksum_mismatches) {
    fprintf(stderr, "warning: %s\n", e.what());
  }
  result.rethrow_first_error();
}

ExtractionResult SevenZipArchive::extract_all(const string& dir,
    size_t num_threads, ErrorMode error_mode) {
  this->check_open();
  Worker worker(this->parsed_header, this->registry);

  struct PendingSymlink {
    size_t file_index;
    shared_ptr<StringSink> target;
  };
  vector<PendingSymlink> symlinks;

  const auto& files = this->parsed_header.files_info.files;
  for (size_t x = 0; x < files.size(); x++) {
    const auto& file = files[x];
    if (file.is_anti) {
      continue;
    }
    if (!is_safe_entry_name(file.filename)) {
      fprintf(stderr, "warning: skipping entry %zu with unsafe name \"%s\"\n",
          x, file.filename.c_str());
      continue;
    }

    string path = dir.empty() ? file.filename : (dir + "/" + file.filename);
    if (file.is_directory) {
      worker.register_sink(x, make_shared<DirectorySink>(path));
    } else if (file.is_symlink()) {
      // The link is created after all other entries are written, so no entry
      // can be written through it
      auto target = make_shared<StringSink>();
      worker.register_sink(x, target);
      symlinks.emplace_back(PendingSymlink{x, target});
    } else {
      worker.register_sink(x, make_shared<FileSink>(path));
    }
  }

  auto result = this->extract(worker, num_threads, ErrorMode::COLLECT);

  for (const auto& link : symlinks) {
    // Links whose folders failed are never created
    if (link.target->closed()) {
      create_symlink_in_dir(dir, files[link.file_index].filename, link.target->data());
    }
  }

  if (error_mode == ErrorMode::THROW) {
    throw_first_folder_error(result);
  }
  return result;
}

ExtractionResult SevenZipArchive::extract_selected(
    const map<size_t, shared_ptr<Sink>>& sinks, size_t num_threads,
    ErrorMode error_mode) {
  this->check_open();
  Worker worker(this->parsed_header, this->registry);
  for (const auto& [file_id, sink] : sinks) {
    if (sink) {
      worker.register_sink(file_id, sink);
    } else {
      worker.register_discard(file_id);
    }
  }
  return this->extract(worker, num_threads, error_mode);
}

ExtractionResult SevenZipArchive::test(size_t num_threads, ErrorMode error_mode) {
  this->check_open();
  Worker worker(this->parsed_header, this->registry);
  for (size_t x = 0; x < this->parsed_header.files_info.files.size(); x++) {
    worker.register_discard(x);
  }
  return this->extract(worker, num_threads, error_mode);
}

ExtractionResult SevenZipArchive::extract(Worker& worker, size_t num_threads,
    ErrorMode error_mode) {
  ExtractionResult result;
  {
    shared_lock<shared_mutex> g(this->state_lock);
    if (!this->source) {
      throw UseAfterCloseError("archive is closed");
    }
    result = worker.extract(*this->source, num_threads, &this->source_lock);
  }
  if (error_mode == ErrorMode::THROW) {
    throw_first_folder_error(result);
  }
  return result;
}

void SevenZipArchive::close() {
  unique_lock<shared_mutex> g(this->state_lock);
  this->source.reset();
}

bool SevenZipArchive::is_closed() const {
  shared_lock<shared_mutex> g(this->state_lock);
  return !this->source;
}

future<ExtractionResult> extract_all_async(SevenZipArchive& archive,
    const string& dir, size_t num_threads) {
  return async(launch::async, [&archive, dir, num_threads]() -> ExtractionResult {
    return archive.extract_all(dir, num_threads);
  });
}
