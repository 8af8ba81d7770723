#include "Decoders.hh"

#include <inttypes.h>
#include <lzma.h>
#include <stdlib.h>
#include <zlib.h>

#include <algorithm>
#include <memory>
#include <new>
#include <stdexcept>
#include <phosg/Strings.hh>

#include "CoderGraph.hh"
#include "Errors.hh"

using namespace std;

const string METHOD_COPY("\x00", 1);
const string METHOD_DELTA("\x03", 1);
const string METHOD_LZMA("\x03\x01\x01", 3);
const string METHOD_LZMA2("\x21", 1);
const string METHOD_BCJ_X86("\x03\x03\x01\x03", 4);
const string METHOD_BCJ2("\x03\x03\x01\x1B", 4);
const string METHOD_BCJ_PPC("\x03\x03\x02\x05", 4);
const string METHOD_BCJ_IA64("\x03\x03\x04\x01", 4);
const string METHOD_BCJ_ARM("\x03\x03\x05\x01", 4);
const string METHOD_BCJ_ARMT("\x03\x03\x07\x01", 4);
const string METHOD_BCJ_SPARC("\x03\x03\x08\x05", 4);
const string METHOD_BCJ_ARM64("\x0A", 1);
const string METHOD_PPMD("\x03\x04\x01", 3);
const string METHOD_DEFLATE("\x04\x01\x08", 3);
const string METHOD_DEFLATE64("\x04\x01\x09", 3);
const string METHOD_BZIP2("\x04\x02\x02", 3);
const string METHOD_ZSTD("\x04\xF7\x11\x01", 4);
const string METHOD_AES("\x06\xF1\x07\x01", 4);

string format_method_id(const string& method_id) {
  if (method_id.empty()) {
    return "(empty)";
  }
  string ret;
  for (char ch : method_id) {
    ret += phosg::string_printf("%02hhX", static_cast<uint8_t>(ch));
  }
  return ret;
}

const char* method_name(const string& method_id) {
  static const unordered_map<string, const char*> names({
      {METHOD_COPY, "Copy"},
      {METHOD_DELTA, "Delta"},
      {METHOD_LZMA, "LZMA"},
      {METHOD_LZMA2, "LZMA2"},
      {METHOD_BCJ_X86, "BCJ"},
      {METHOD_BCJ2, "BCJ2"},
      {METHOD_BCJ_PPC, "PPC"},
      {METHOD_BCJ_IA64, "IA64"},
      {METHOD_BCJ_ARM, "ARM"},
      {METHOD_BCJ_ARMT, "ARMT"},
      {METHOD_BCJ_SPARC, "SPARC"},
      {METHOD_BCJ_ARM64, "ARM64"},
      {METHOD_PPMD, "PPMD"},
      {METHOD_DEFLATE, "Deflate"},
      {METHOD_DEFLATE64, "Deflate64"},
      {METHOD_BZIP2, "BZip2"},
      {METHOD_ZSTD, "ZSTD"},
      {METHOD_AES, "7zAES"},
  });
  try {
    return names.at(method_id);
  } catch (const out_of_range&) {
    return "unknown";
  }
}

void DecoderRegistry::add(const string& method_id, const string& name,
    size_t num_in_streams, DecodeFunction decode) {
  this->decoders[method_id] = {name, num_in_streams, std::move(decode)};
}

bool DecoderRegistry::contains(const string& method_id) const {
  return this->decoders.count(method_id);
}

const DecoderRegistration& DecoderRegistry::at(const string& method_id) const {
  try {
    return this->decoders.at(method_id);
  } catch (const out_of_range&) {
    throw UnsupportedCompressionMethodError(method_id);
  }
}

void DecoderRegistry::check_folder(const Folder& folder) const {
  for (size_t x = 0; x < folder.coders.size(); x++) {
    const auto& coder = folder.coders[x];
    const auto& reg = this->at(coder.method_id);
    if (coder.num_in_streams != reg.num_in_streams || coder.num_out_streams != 1) {
      throw MalformedFolderError(phosg::string_printf(
          "coder %zu (%s) has %zu in and %zu out streams; expected %zu and 1",
          x, reg.name.c_str(), coder.num_in_streams, coder.num_out_streams,
          reg.num_in_streams));
    }
  }
}

string decode_folder(const Folder& folder, vector<string>&& pack_streams,
    const DecoderRegistry& registry) {
  CoderGraph graph = plan_folder(folder);
  registry.check_folder(folder);
  if (pack_streams.size() != folder.packed_streams.size()) {
    throw MalformedFolderError(phosg::string_printf(
        "folder needs %zu pack streams but %zu were given",
        folder.packed_streams.size(), pack_streams.size()));
  }

  vector<string> out_streams(folder.unpack_sizes.size());
  for (size_t coder_index : graph.order) {
    const auto& coder = folder.coders[coder_index];
    const auto& reg = registry.at(coder.method_id);

    vector<string> inputs;
    size_t first_in_stream = graph.coder_first_in_stream[coder_index];
    for (size_t x = 0; x < coder.num_in_streams; x++) {
      size_t in_index = first_in_stream + x;
      if (graph.in_stream_pack_index[in_index]) {
        inputs.emplace_back(std::move(pack_streams[*graph.in_stream_pack_index[in_index]]));
      } else {
        inputs.emplace_back(std::move(out_streams[*graph.in_stream_source[in_index]]));
      }
    }

    size_t out_index = graph.coder_first_out_stream[coder_index];
    uint64_t output_size = folder.unpack_sizes[out_index];
    string output = reg.decode(coder, std::move(inputs), output_size);
    if (output.size() != output_size) {
      throw DecompressionError(phosg::string_printf(
          "%s coder produced 0x%zX bytes; expected 0x%" PRIX64,
          reg.name.c_str(), output.size(), output_size));
    }
    out_streams[out_index] = std::move(output);
  }

  return std::move(out_streams[graph.main_out_stream]);
}

string decode_copy(string&& input, uint64_t output_size) {
  if (input.size() < output_size) {
    throw DecompressionError(phosg::string_printf(
        "copy stream is 0x%zX bytes; expected at least 0x%" PRIX64,
        input.size(), output_size));
  }
  input.resize(output_size);
  return std::move(input);
}

static const char* name_for_lzma_ret(lzma_ret ret) {
  switch (ret) {
    case LZMA_OK:
      return "LZMA_OK";
    case LZMA_STREAM_END:
      return "LZMA_STREAM_END";
    case LZMA_MEM_ERROR:
      return "LZMA_MEM_ERROR";
    case LZMA_MEMLIMIT_ERROR:
      return "LZMA_MEMLIMIT_ERROR";
    case LZMA_OPTIONS_ERROR:
      return "LZMA_OPTIONS_ERROR";
    case LZMA_DATA_ERROR:
      return "LZMA_DATA_ERROR";
    case LZMA_BUF_ERROR:
      return "LZMA_BUF_ERROR";
    case LZMA_PROG_ERROR:
      return "LZMA_PROG_ERROR";
    default:
      return "unknown error";
  }
}

struct LZMAStream {
  lzma_stream strm = LZMA_STREAM_INIT;

  LZMAStream() = default;
  LZMAStream(const LZMAStream&) = delete;
  LZMAStream& operator=(const LZMAStream&) = delete;
  ~LZMAStream() {
    lzma_end(&this->strm);
  }
};

string allocate_output(uint64_t size, const char* method) {
  string ret;
  if (size > ret.max_size()) {
    throw DecompressionError(phosg::string_printf(
        "%s output size 0x%" PRIX64 " is too large", method, size));
  }
  try {
    ret.resize(size);
  } catch (const bad_alloc&) {
    throw DecompressionError(phosg::string_printf(
        "cannot allocate 0x%" PRIX64 " bytes for %s output", size, method));
  } catch (const length_error&) {
    throw DecompressionError(phosg::string_printf(
        "%s output size 0x%" PRIX64 " is too large", method, size));
  }
  return ret;
}

string run_lzma_decoder(const lzma_filter* filters, const char* method,
    const string& input, uint64_t output_size) {
  string output = allocate_output(output_size, method);

  LZMAStream s;
  lzma_ret ret = lzma_raw_decoder(&s.strm, filters);
  if (ret != LZMA_OK) {
    throw DecompressionError(phosg::string_printf("cannot start %s decoder (%s)",
        method, name_for_lzma_ret(ret)));
  }

  s.strm.next_in = reinterpret_cast<const uint8_t*>(input.data());
  s.strm.avail_in = input.size();
  s.strm.next_out = reinterpret_cast<uint8_t*>(output.data());
  s.strm.avail_out = output.size();

  // Stop as soon as the declared size has been produced: 7z LZMA streams
  // usually have no end marker, and pack streams may contain padding after
  // the coded data
  while (s.strm.avail_out > 0) {
    ret = lzma_code(&s.strm, s.strm.avail_in ? LZMA_RUN : LZMA_FINISH);
    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) {
      throw DecompressionError(phosg::string_printf(
          "%s data is corrupt after 0x%" PRIX64 " bytes (%s)", method,
          static_cast<uint64_t>(s.strm.total_out), name_for_lzma_ret(ret)));
    }
  }

  if (s.strm.total_out != output_size) {
    throw DecompressionError(phosg::string_printf(
        "%s stream ended after 0x%" PRIX64 " bytes; expected 0x%" PRIX64,
        method, static_cast<uint64_t>(s.strm.total_out), output_size));
  }
  return output;
}

static string decode_lzma_filter(lzma_vli filter_id, const char* method,
    const string& properties, const string& input, uint64_t output_size) {
  lzma_filter filters[2];
  filters[0].id = filter_id;
  filters[0].options = nullptr;
  filters[1].id = LZMA_VLI_UNKNOWN;
  filters[1].options = nullptr;

  lzma_ret ret = lzma_properties_decode(&filters[0], nullptr,
      reinterpret_cast<const uint8_t*>(properties.data()), properties.size());
  if (ret != LZMA_OK) {
    throw DecompressionError(phosg::string_printf("invalid %s properties (%s)",
        method, name_for_lzma_ret(ret)));
  }
  unique_ptr<void, void (*)(void*)> options(filters[0].options, free);

  return run_lzma_decoder(filters, method, input, output_size);
}

string decode_lzma(const string& properties, const string& input,
    uint64_t output_size) {
  if (properties.size() != 5) {
    throw DecompressionError(phosg::string_printf(
        "LZMA properties are 0x%zX bytes; expected 5", properties.size()));
  }
  return decode_lzma_filter(LZMA_FILTER_LZMA1, "LZMA", properties, input,
      output_size);
}

string decode_lzma2(const string& properties, const string& input,
    uint64_t output_size) {
  if (properties.size() != 1) {
    throw DecompressionError(phosg::string_printf(
        "LZMA2 properties are 0x%zX bytes; expected 1", properties.size()));
  }
  return decode_lzma_filter(LZMA_FILTER_LZMA2, "LZMA2", properties, input,
      output_size);
}

struct InflateStream {
  z_stream strm;

  InflateStream() {
    this->strm.zalloc = Z_NULL;
    this->strm.zfree = Z_NULL;
    this->strm.opaque = Z_NULL;
    this->strm.next_in = Z_NULL;
    this->strm.avail_in = 0;
    int ret = inflateInit2(&this->strm, -MAX_WBITS);
    if (ret != Z_OK) {
      throw DecompressionError(phosg::string_printf(
          "cannot start Deflate decoder (%d)", ret));
    }
  }
  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;
  ~InflateStream() {
    inflateEnd(&this->strm);
  }
};

string decode_deflate(const string& input, uint64_t output_size) {
  static const size_t MAX_CHUNK_SIZE = 0x40000000;

  string output = allocate_output(output_size, "Deflate");
  const uint8_t* in = reinterpret_cast<const uint8_t*>(input.data());
  uint8_t* out = reinterpret_cast<uint8_t*>(output.data());

  InflateStream s;
  s.strm.next_in = const_cast<uint8_t*>(in);
  s.strm.next_out = out;
  for (;;) {
    size_t out_done = s.strm.next_out - out;
    if (out_done == output.size()) {
      break;
    }
    if (s.strm.avail_in == 0) {
      size_t in_done = s.strm.next_in - in;
      s.strm.avail_in = min<size_t>(input.size() - in_done, MAX_CHUNK_SIZE);
    }
    s.strm.avail_out = min<size_t>(output.size() - out_done, MAX_CHUNK_SIZE);

    int ret = inflate(&s.strm, Z_NO_FLUSH);
    if (ret == Z_STREAM_END) {
      break;
    }
    if (ret == Z_BUF_ERROR) {
      throw DecompressionError(phosg::string_printf(
          "Deflate stream ended after 0x%zX bytes; expected 0x%" PRIX64,
          static_cast<size_t>(s.strm.next_out - out), output_size));
    }
    if (ret != Z_OK) {
      throw DecompressionError(phosg::string_printf("Deflate data is corrupt (%s)",
          s.strm.msg ? s.strm.msg : "unknown error"));
    }
  }

  size_t bytes_written = s.strm.next_out - out;
  if (bytes_written != output_size) {
    throw DecompressionError(phosg::string_printf(
        "Deflate stream ended after 0x%zX bytes; expected 0x%" PRIX64,
        bytes_written, output_size));
  }
  return output;
}

const DecoderRegistry& DecoderRegistry::builtin() {
  static const DecoderRegistry registry = []() {
    DecoderRegistry ret;
    ret.add(METHOD_COPY, "Copy", 1,
        [](const Coder&, vector<string>&& inputs, uint64_t output_size) {
          return decode_copy(std::move(inputs[0]), output_size);
        });
    ret.add(METHOD_LZMA, "LZMA", 1,
        [](const Coder& coder, vector<string>&& inputs, uint64_t output_size) {
          return decode_lzma(coder.properties, inputs[0], output_size);
        });
    ret.add(METHOD_LZMA2, "LZMA2", 1,
        [](const Coder& coder, vector<string>&& inputs, uint64_t output_size) {
          return decode_lzma2(coder.properties, inputs[0], output_size);
        });
    ret.add(METHOD_DEFLATE, "Deflate", 1,
        [](const Coder&, vector<string>&& inputs, uint64_t output_size) {
          return decode_deflate(inputs[0], output_size);
        });
    register_filter_decoders(ret);
    return ret;
  }();
  return registry;
}
