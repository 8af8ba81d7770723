#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <exception>
#include <map>
#include <memory>
#include <phosg/Strings.hh>
#include <string>
#include <unordered_set>

#include "sevenzip/Archive.hh"
#include "sevenzip/Errors.hh"

using namespace std;

enum class Mode {
  EXTRACT,
  LIST,
  TEST,
};

void print_help() {
  fprintf(stderr, "\
Usage: 7zdump [options] <archive.7z> [member names...]\n\
\n\
Extracts the contents of a 7z archive. If member names are given, only those\n\
members are extracted. If the archive filename ends with .001, the following\n\
volumes (.002, .003, ...) are read as well.\n\
\n\
Options:\n\
  -h, --help: Show this message.\n\
  --list: List the archive's contents instead of extracting them.\n\
  --test: Decode everything and check checksums, but don\'t write any files.\n\
  --output-dir=DIR: Extract into DIR instead of the current directory.\n\
  --threads=N: Decode up to N folders in parallel (0 = one per CPU core).\n\
\n");
}

static void print_entry(const FileEntry& file) {
  string crc_str = file.crc ? phosg::string_printf("%08X", *file.crc) : "--------";
  string time_str = file.last_write_time ? format_filetime(*file.last_write_time) : "-------------------";
  char type = file.is_anti ? 'A' : file.is_directory ? 'D' : file.is_symlink() ? 'L' : 'F';
  string folder_str = file.folder_index
      ? phosg::string_printf("%zu:%zu", *file.folder_index, file.substream_index)
      : "-";
  fprintf(stderr, "> entry: %08zX %c %s %012" PRIX64 " %s %6s %s\n", file.id, type,
      time_str.c_str(), file.uncompressed_size, crc_str.c_str(),
      folder_str.c_str(), file.filename.c_str());
}

static bool is_unsupported_method_error(const exception_ptr& error) {
  try {
    rethrow_exception(error);
  } catch (const UnsupportedCompressionMethodError&) {
    return true;
  } catch (const exception&) {
    return false;
  }
  return false;
}

// Returns 0 if everything was fine, 3 if the only problems were unsupported
// methods, or 2 otherwise
static int report_result(const ExtractionResult& result) {
  bool all_unsupported = result.checksum_mismatches.empty();
  for (const auto& e : result.folder_errors) {
    fprintf(stderr, "error: folder %zu: %s\n", e.folder_index, e.message.c_str());
    all_unsupported &= is_unsupported_method_error(e.error);
  }
  for (const auto& e : result.checksum_mismatches) {
    fprintf(stderr, "error: %s\n", e.what());
  }
  fprintf(stderr, "%zu folder(s) decoded; %zu folder error(s); %zu checksum error(s)\n",
      result.decoded_folders.size(), result.folder_errors.size(),
      result.checksum_mismatches.size());
  if (result.ok()) {
    return 0;
  }
  return all_unsupported ? 3 : 2;
}

int main(int argc, char* argv[]) {
  Mode mode = Mode::EXTRACT;
  string output_dir;
  size_t num_threads = 1;
  const char* filename = nullptr;
  unordered_set<string> target_filenames;
  for (int x = 1; x < argc; x++) {
    if (!strcmp(argv[x], "-h") || !strcmp(argv[x], "--help")) {
      print_help();
      return 0;
    } else if (!strcmp(argv[x], "--list")) {
      mode = Mode::LIST;
    } else if (!strcmp(argv[x], "--test")) {
      mode = Mode::TEST;
    } else if (!strncmp(argv[x], "--output-dir=", 13)) {
      output_dir = &argv[x][13];
    } else if (!strncmp(argv[x], "--threads=", 10)) {
      num_threads = strtoull(&argv[x][10], nullptr, 0);
    } else if (!strncmp(argv[x], "--", 2)) {
      fprintf(stderr, "7zdump: unknown command line option: %s\n", argv[x]);
      return 1;
    } else if (!filename) {
      filename = argv[x];
    } else {
      target_filenames.emplace(argv[x]);
    }
  }
  if (!filename) {
    print_help();
    return 1;
  }

  try {
    SevenZipArchive archive(filename);
    const auto& entries = archive.entries();
    fprintf(stderr, "%s: %zu entries in %zu folders\n", filename, entries.size(),
        archive.header().folders().size());

    if (mode == Mode::LIST) {
      for (const auto& file : entries) {
        print_entry(file);
      }
      return 0;

    } else if (mode == Mode::TEST) {
      return report_result(archive.test(num_threads, ErrorMode::COLLECT));

    } else if (target_filenames.empty()) {
      for (const auto& file : entries) {
        print_entry(file);
      }
      return report_result(archive.extract_all(output_dir, num_threads, ErrorMode::COLLECT));

    } else {
      map<size_t, shared_ptr<Sink>> sinks;
      map<size_t, shared_ptr<StringSink>> symlink_targets;
      for (const auto& file : entries) {
        if (!target_filenames.count(file.filename) || file.is_anti) {
          continue;
        }
        if (!is_safe_entry_name(file.filename)) {
          fprintf(stderr, "warning: skipping entry with unsafe name \"%s\"\n", file.filename.c_str());
          continue;
        }
        print_entry(file);
        string path = output_dir.empty() ? file.filename : (output_dir + "/" + file.filename);
        if (file.is_directory) {
          sinks.emplace(file.id, make_shared<DirectorySink>(path));
        } else if (file.is_symlink()) {
          // Created after everything else is written
          auto target = make_shared<StringSink>();
          sinks.emplace(file.id, target);
          symlink_targets.emplace(file.id, target);
        } else {
          sinks.emplace(file.id, make_shared<FileSink>(path));
        }
      }
      if (sinks.size() == 0) {
        fprintf(stderr, "none of the given members are in the archive\n");
        return 1;
      }
      auto result = archive.extract_selected(sinks, num_threads, ErrorMode::COLLECT);
      for (const auto& [file_id, target] : symlink_targets) {
        if (target->closed()) {
          create_symlink_in_dir(output_dir, entries[file_id].filename, target->data());
        }
      }
      return report_result(result);
    }

  } catch (const UnsupportedCompressionMethodError& e) {
    fprintf(stderr, "%s: %s\n", filename, e.what());
    return 3;
  } catch (const SevenZipError& e) {
    fprintf(stderr, "%s: %s\n", filename, e.what());
    return 2;
  } catch (const exception& e) {
    fprintf(stderr, "%s: %s\n", filename, e.what());
    return 1;
  }
}
