#pragma once

#include <stdint.h>

#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ByteSource.hh"
#include "Decoders.hh"
#include "Errors.hh"
#include "Header.hh"
#include "Sink.hh"

struct FolderError {
  size_t folder_index;
  std::exception_ptr error;
  std::string message;
};

struct ExtractionResult {
  // Files whose decoded contents didn't match their stored CRC
  std::vector<ChecksumMismatchError> checksum_mismatches;
  // Folders that were read and decoded successfully, in increasing order
  std::vector<size_t> decoded_folders;
  // Folders that could not be decoded, in increasing order
  std::vector<FolderError> folder_errors;

  bool ok() const {
    return this->checksum_mismatches.empty() && this->folder_errors.empty();
  }
  // Rethrows the first folder error unchanged, if there is one
  void rethrow_first_error() const;
};

// Reads the pack streams that feed the given folder
std::vector<std::string> read_folder_pack_streams(ByteSource& source,
    const StreamsInfo& streams_info, size_t folder_index);

// One extraction pass over an archive. Files are registered with a sink (or
// discarded, which still decodes and checks them), then extract() decodes only
// the folders that contain registered files.
class Worker {
public:
  explicit Worker(const Header& header,
      const DecoderRegistry& registry = DecoderRegistry::builtin());
  ~Worker() = default;

  void register_sink(size_t file_id, std::shared_ptr<Sink> sink);
  void register_discard(size_t file_id);

  // If source_lock is given, it's held while pack data is read from source, so
  // the same source may be shared with other workers. Errors from one folder
  // don't prevent other folders from being extracted; they are returned in
  // folder_errors along with the results of the other folders.
  ExtractionResult extract(ByteSource& source, size_t num_threads = 1,
      std::mutex* source_lock = nullptr);

private:
  struct FolderResult {
    std::vector<ChecksumMismatchError> checksum_mismatches;
  };

  void check_file_id(size_t file_id) const;
  FolderResult extract_folder(ByteSource& source, std::mutex& source_lock,
      size_t folder_index) const;

  const Header& header;
  const DecoderRegistry& registry;
  // Null for discarded files
  std::map<size_t, std::shared_ptr<Sink>> registered;
  std::mutex own_source_lock;
};
