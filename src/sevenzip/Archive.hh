#pragma once

#include <stdint.h>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ByteSource.hh"
#include "Decoders.hh"
#include "Header.hh"
#include "Sink.hh"
#include "Worker.hh"

enum class ErrorMode {
  // Rethrow the first folder error after all folders have been processed;
  // the other folder errors and any checksum mismatches are logged
  THROW,
  // Return folder errors in ExtractionResult::folder_errors
  COLLECT,
};

// An open 7z archive. The header is parsed when the archive is opened; after
// close(), every method except is_closed() throws UseAfterCloseError.
class SevenZipArchive {
public:
  // Opens a file. If filename ends with .001, all consecutively-numbered
  // volumes are read as one archive.
  explicit SevenZipArchive(const std::string& filename,
      const DecoderRegistry& registry = DecoderRegistry::builtin());
  explicit SevenZipArchive(std::unique_ptr<ByteSource>&& source,
      const DecoderRegistry& registry = DecoderRegistry::builtin());
  ~SevenZipArchive() = default;
  SevenZipArchive(const SevenZipArchive&) = delete;
  SevenZipArchive& operator=(const SevenZipArchive&) = delete;

  static std::unique_ptr<SevenZipArchive> from_data(std::string&& data,
      const DecoderRegistry& registry = DecoderRegistry::builtin());

  const Header& header() const;
  const std::vector<FileEntry>& entries() const;
  // Throws out_of_range if id is not a valid entry index
  const FileEntry& entry(size_t id) const;
  std::vector<std::string> list_names() const;

  // Extracts the contents of every entry under dir. Anti items are skipped, as
  // are entries whose names are absolute or contain .. components. Symbolic
  // links are created after everything else, and only if their targets stay
  // inside dir.
  ExtractionResult extract_all(const std::string& dir, size_t num_threads = 1,
      ErrorMode error_mode = ErrorMode::THROW);
  // Writes each given entry to its sink. Null sinks mean the entry is decoded
  // and checked, but its contents are discarded.
  ExtractionResult extract_selected(
      const std::map<size_t, std::shared_ptr<Sink>>& sinks,
      size_t num_threads = 1, ErrorMode error_mode = ErrorMode::THROW);
  // Decodes and checks every entry without writing anything
  ExtractionResult test(size_t num_threads = 1,
      ErrorMode error_mode = ErrorMode::THROW);
  // Runs an extraction pass with a worker that the caller has set up. close()
  // waits for running extractions to finish.
  ExtractionResult extract(Worker& worker, size_t num_threads = 1,
      ErrorMode error_mode = ErrorMode::THROW);

  void close();
  bool is_closed() const;

private:
  void check_open() const;
  Header read_header();
  std::string decode_encoded_header(const StreamsInfo& streams_info);

  const DecoderRegistry& registry;
  // Held shared by extractions and exclusively by close()
  mutable std::shared_mutex state_lock;
  // Held while pack data is read
  std::mutex source_lock;
  std::unique_ptr<ByteSource> source;
  Header parsed_header;
};

// False if name is empty or absolute, or has a .. component
bool is_safe_entry_name(const std::string& name);
// False if a symbolic link named link_name (relative to the extraction
// directory) pointing to target would resolve outside that directory
bool is_safe_link_target(const std::string& link_name, const std::string& target);
// Creates the symbolic link dir/link_name pointing to target, unless the
// target is unsafe, a parent of the link under dir is itself a symbolic link,
// or the link can't be created. Skipped links are reported with a warning on
// stderr, and false is returned.
bool create_symlink_in_dir(const std::string& dir, const std::string& link_name,
    const std::string& target);

// Runs archive.extract_all on another thread. get() on the returned future
// rethrows any exception extract_all threw, including UseAfterCloseError if
// the archive was closed before the extraction began. close() waits for a
// running extraction; the archive object must stay alive until the future is
// ready.
std::future<ExtractionResult> extract_all_async(SevenZipArchive& archive,
    const std::string& dir, size_t num_threads = 1);
