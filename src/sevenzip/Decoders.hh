#pragma once

#include <lzma.h>
#include <stdint.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Header.hh"

// Method ids, as stored in coder records
extern const std::string METHOD_COPY;
extern const std::string METHOD_DELTA;
extern const std::string METHOD_LZMA;
extern const std::string METHOD_LZMA2;
extern const std::string METHOD_BCJ_X86;
extern const std::string METHOD_BCJ2;
extern const std::string METHOD_BCJ_PPC;
extern const std::string METHOD_BCJ_IA64;
extern const std::string METHOD_BCJ_ARM;
extern const std::string METHOD_BCJ_ARMT;
extern const std::string METHOD_BCJ_SPARC;
extern const std::string METHOD_BCJ_ARM64;
extern const std::string METHOD_PPMD;
extern const std::string METHOD_DEFLATE;
extern const std::string METHOD_DEFLATE64;
extern const std::string METHOD_BZIP2;
extern const std::string METHOD_ZSTD;
extern const std::string METHOD_AES;

std::string format_method_id(const std::string& method_id);
// Returns a name for any method id this library knows of, whether or not it
// can decode it, or "unknown"
const char* method_name(const std::string& method_id);

// Decodes the input streams of one coder. inputs has one entry per in stream
// of the coder; the result must be exactly output_size bytes long. Pack
// streams may be longer than the coded data (alignment padding); the extra
// bytes must be ignored.
typedef std::function<std::string(const Coder& coder,
    std::vector<std::string>&& inputs, uint64_t output_size)>
    DecodeFunction;

struct DecoderRegistration {
  std::string name;
  size_t num_in_streams;
  DecodeFunction decode;
};

class DecoderRegistry {
public:
  DecoderRegistry() = default;
  ~DecoderRegistry() = default;

  // All the methods this library implements
  static const DecoderRegistry& builtin();

  void add(const std::string& method_id, const std::string& name,
      size_t num_in_streams, DecodeFunction decode);
  bool contains(const std::string& method_id) const;
  // Throws UnsupportedCompressionMethodError if the method isn't registered
  const DecoderRegistration& at(const std::string& method_id) const;

  // Throws UnsupportedCompressionMethodError for the first coder in the
  // folder that can't be decoded, or MalformedFolderError if a coder's stream
  // counts don't match its method
  void check_folder(const Folder& folder) const;

private:
  std::unordered_map<std::string, DecoderRegistration> decoders;
};

// Runs every coder of the folder in dependency order and returns the folder's
// final output. pack_streams holds the folder's pack streams in order.
std::string decode_folder(const Folder& folder,
    std::vector<std::string>&& pack_streams,
    const DecoderRegistry& registry = DecoderRegistry::builtin());

// Returns a zero-filled buffer of the given size. Sizes that can't be
// allocated throw DecompressionError.
std::string allocate_output(uint64_t size, const char* method);
// Runs a liblzma raw decoder chain over input and returns exactly output_size
// bytes
std::string run_lzma_decoder(const lzma_filter* filters, const char* method,
    const std::string& input, uint64_t output_size);

std::string decode_copy(std::string&& input, uint64_t output_size);
std::string decode_lzma(const std::string& properties, const std::string& input,
    uint64_t output_size);
std::string decode_lzma2(const std::string& properties, const std::string& input,
    uint64_t output_size);
std::string decode_deflate(const std::string& input, uint64_t output_size);

// Defined in Filters.cc
void register_filter_decoders(DecoderRegistry& registry);
