#include "Worker.hh"

#include <inttypes.h>
#include <lzma.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <phosg/Strings.hh>
#include <set>
#include <thread>

#include "SubStreams.hh"

using namespace std;

vector<string> read_folder_pack_streams(ByteSource& source,
    const StreamsInfo& streams_info, size_t folder_index) {
  const auto& folder = streams_info.folders.at(folder_index);
  const auto& pack_info = streams_info.pack_info;
  size_t first_pack_stream = streams_info.folder_first_pack_stream.at(folder_index);

  vector<string> ret;
  for (size_t x = 0; x < folder.packed_streams.size(); x++) {
    size_t pack_index = first_pack_stream + x;
    if (pack_index >= pack_info.sizes.size()) {
      throw MalformedFolderError(phosg::string_printf(
          "folder %zu refers to pack stream %zu, but there are only %zu",
          folder_index, pack_index, pack_info.sizes.size()));
    }
    string data = source.pread(pack_info.sizes[pack_index], pack_info.offsets[pack_index]);
    const auto& expected_crc = pack_info.crcs[pack_index];
    if (expected_crc) {
      uint32_t actual_crc = lzma_crc32(reinterpret_cast<const uint8_t*>(data.data()), data.size(), 0);
      if (actual_crc != *expected_crc) {
        throw DecompressionError(phosg::string_printf(
            "pack stream %zu checksum mismatch: expected %08X, got %08X",
            pack_index, *expected_crc, actual_crc));
      }
    }
    ret.emplace_back(std::move(data));
  }
  return ret;
}

void ExtractionResult::rethrow_first_error() const {
  if (!this->folder_errors.empty()) {
    rethrow_exception(this->folder_errors.front().error);
  }
}

Worker::Worker(const Header& header, const DecoderRegistry& registry)
    : header(header),
      registry(registry) {}

void Worker::check_file_id(size_t file_id) const {
  if (file_id >= this->header.files_info.files.size()) {
    throw out_of_range(phosg::string_printf(
        "file %zu does not exist (archive has %zu entries)",
        file_id, this->header.files_info.files.size()));
  }
}

void Worker::register_sink(size_t file_id, shared_ptr<Sink> sink) {
  this->check_file_id(file_id);
  if (!sink) {
    throw invalid_argument("sink is null; use register_discard instead");
  }
  this->registered[file_id] = std::move(sink);
}

void Worker::register_discard(size_t file_id) {
  this->check_file_id(file_id);
  this->registered[file_id] = nullptr;
}

Worker::FolderResult Worker::extract_folder(ByteSource& source,
    mutex& source_lock, size_t folder_index) const {
  const auto& streams_info = *this->header.main_streams;
  const auto& folder = streams_info.folders[folder_index];

  vector<string> pack_streams;
  {
    lock_guard<mutex> g(source_lock);
    pack_streams = read_folder_pack_streams(source, streams_info, folder_index);
  }

  string decoded = decode_folder(folder, std::move(pack_streams), this->registry);

  // A folder CRC on a folder with one substream is that file's CRC, which is
  // checked below along with the others
  size_t num_substreams = streams_info.substreams.num_unpack_streams[folder_index];
  if (folder.crc && num_substreams != 1) {
    uint32_t actual_crc = lzma_crc32(reinterpret_cast<const uint8_t*>(decoded.data()), decoded.size(), 0);
    if (actual_crc != *folder.crc) {
      throw DecompressionError(phosg::string_printf(
          "folder %zu checksum mismatch: expected %08X, got %08X",
          folder_index, *folder.crc, actual_crc));
    }
  }

  auto ranges = folder_substreams(this->header, folder_index);
  vector<Sink*> sinks;
  for (const auto& range : ranges) {
    auto it = this->registered.find(range.file_index);
    sinks.emplace_back((it == this->registered.end()) ? nullptr : it->second.get());
  }

  SubStreamSplitter splitter(std::move(ranges), std::move(sinks), decoded.size());
  splitter.write(decoded);

  FolderResult ret;
  for (const auto& result : splitter.finish()) {
    if (!this->registered.count(result.file_index) || result.crc_ok()) {
      continue;
    }
    const auto& file = this->header.files_info.files[result.file_index];
    ret.checksum_mismatches.emplace_back(result.file_index, file.filename,
        *result.expected_crc, result.crc);
  }
  return ret;
}

ExtractionResult Worker::extract(ByteSource& source, size_t num_threads,
    mutex* source_lock) {
  mutex& lock = source_lock ? *source_lock : this->own_source_lock;
  const auto& files = this->header.files_info.files;

  set<size_t> folder_set;
  for (const auto& [file_id, sink] : this->registered) {
    const auto& file = files[file_id];
    if (file.has_stream()) {
      folder_set.emplace(*file.folder_index);
    } else if (sink) {
      sink->close();
    }
  }
  vector<size_t> folders(folder_set.begin(), folder_set.end());

  vector<FolderResult> folder_results(folders.size());
  vector<optional<FolderError>> folder_errors(folders.size());
  atomic<size_t> next_folder(0);
  auto thread_fn = [&]() -> void {
    for (;;) {
      size_t x = next_folder++;
      if (x >= folders.size()) {
        return;
      }
      try {
        folder_results[x] = this->extract_folder(source, lock, folders[x]);
      } catch (const exception& e) {
        folder_errors[x] = FolderError{folders[x], current_exception(), e.what()};
      }
    }
  };

  if (num_threads == 0) {
    num_threads = thread::hardware_concurrency();
  }
  num_threads = min<size_t>(num_threads, folders.size());
  if (num_threads <= 1) {
    thread_fn();
  } else {
    vector<thread> threads;
    for (size_t x = 0; x < num_threads; x++) {
      threads.emplace_back(thread_fn);
    }
    for (auto& t : threads) {
      t.join();
    }
  }

  ExtractionResult ret;
  for (size_t x = 0; x < folders.size(); x++) {
    if (folder_errors[x]) {
      ret.folder_errors.emplace_back(std::move(*folder_errors[x]));
      continue;
    }
    ret.decoded_folders.emplace_back(folders[x]);
    for (auto& e : folder_results[x].checksum_mismatches) {
      ret.checksum_mismatches.emplace_back(std::move(e));
    }
  }
  return ret;
}
