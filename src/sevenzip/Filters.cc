#include "Filters.hh"

#include <inttypes.h>
#include <lzma.h>
#include <string.h>

#include <algorithm>
#include <phosg/Strings.hh>
#include <vector>

#include "Decoders.hh"
#include "Errors.hh"

using namespace std;

// liblzma only runs the delta and branch filters in front of another filter,
// so the filter input is wrapped in LZMA2 uncompressed chunks (control byte
// 01 for the first chunk, which resets the dictionary, 02 for the rest; then
// the chunk size - 1 as a big-endian u16) followed by the end marker
static const size_t LZMA2_MAX_UNCOMPRESSED_CHUNK_SIZE = 0x10000;

static string wrap_in_lzma2_uncompressed_chunks(const string& data) {
  size_t num_chunks = (data.size() + LZMA2_MAX_UNCOMPRESSED_CHUNK_SIZE - 1) /
      LZMA2_MAX_UNCOMPRESSED_CHUNK_SIZE;
  string ret;
  ret.reserve(data.size() + num_chunks * 3 + 1);
  for (size_t offset = 0; offset < data.size(); offset += LZMA2_MAX_UNCOMPRESSED_CHUNK_SIZE) {
    size_t chunk_size = min<size_t>(data.size() - offset, LZMA2_MAX_UNCOMPRESSED_CHUNK_SIZE);
    ret.push_back((offset == 0) ? 0x01 : 0x02);
    ret.push_back(static_cast<char>((chunk_size - 1) >> 8));
    ret.push_back(static_cast<char>((chunk_size - 1) & 0xFF));
    ret.append(data, offset, chunk_size);
  }
  ret.push_back(0x00);
  return ret;
}

string decode_lzma_filter_stage(lzma_vli filter_id, void* options,
    const char* method, string&& input, uint64_t output_size) {
  string data = decode_copy(std::move(input), output_size);

  lzma_options_lzma lzma2_options;
  if (lzma_lzma_preset(&lzma2_options, 0)) {
    throw DecompressionError("cannot initialize LZMA2 options");
  }
  lzma2_options.dict_size = LZMA_DICT_SIZE_MIN;

  lzma_filter filters[3];
  filters[0].id = filter_id;
  filters[0].options = options;
  filters[1].id = LZMA_FILTER_LZMA2;
  filters[1].options = &lzma2_options;
  filters[2].id = LZMA_VLI_UNKNOWN;
  filters[2].options = nullptr;
  return run_lzma_decoder(filters, method,
      wrap_in_lzma2_uncompressed_chunks(data), output_size);
}

// Range decoder used by BCJ2; same bit model as LZMA's
class BCJ2RangeDecoder {
public:
  explicit BCJ2RangeDecoder(const string& data)
      : data(data),
        offset(0),
        range(0xFFFFFFFF),
        code(0) {
    for (size_t x = 0; x < 5; x++) {
      this->code = (this->code << 8) | this->next_byte();
    }
  }

  bool decode_bit(uint16_t& prob) {
    uint32_t bound = (this->range >> 11) * prob;
    bool ret;
    if (this->code < bound) {
      this->range = bound;
      prob += (0x800 - prob) >> 5;
      ret = false;
    } else {
      this->range -= bound;
      this->code -= bound;
      prob -= prob >> 5;
      ret = true;
    }
    if (this->range < 0x01000000) {
      this->range <<= 8;
      this->code = (this->code << 8) | this->next_byte();
    }
    return ret;
  }

private:
  uint8_t next_byte() {
    if (this->offset >= this->data.size()) {
      throw DecompressionError("BCJ2 range coder stream is truncated");
    }
    return this->data[this->offset++];
  }

  const string& data;
  size_t offset;
  uint32_t range;
  uint32_t code;
};

static inline bool bcj2_is_jump(uint8_t b0, uint8_t b1) {
  return ((b1 & 0xFE) == 0xE8) || (b0 == 0x0F && (b1 & 0xF0) == 0x80);
}

string bcj2_decode(const string& main_stream, const string& call_stream,
    const string& jump_stream, const string& rc_stream, uint64_t output_size) {
  // probs[0-255]: E8 preceded by each possible byte; [256]: E9; [257]: Jcc
  vector<uint16_t> probs(258, 0x400);
  BCJ2RangeDecoder rc(rc_stream);

  string ret = allocate_output(output_size, "BCJ2");
  ret.clear();
  size_t main_offset = 0;
  size_t call_offset = 0;
  size_t jump_offset = 0;
  uint8_t prev_byte = 0;
  while (ret.size() < output_size) {
    if (main_offset >= main_stream.size()) {
      throw DecompressionError(phosg::string_printf(
          "BCJ2 main stream ended after 0x%zX bytes; expected 0x%" PRIX64,
          ret.size(), output_size));
    }
    uint8_t b = main_stream[main_offset++];
    ret.push_back(b);
    if (!bcj2_is_jump(prev_byte, b)) {
      prev_byte = b;
      continue;
    }
    if (ret.size() == output_size) {
      break;
    }

    uint16_t& prob = (b == 0xE8) ? probs[prev_byte] : (b == 0xE9) ? probs[256] : probs[257];
    if (!rc.decode_bit(prob)) {
      prev_byte = b;
      continue;
    }

    const string& src_stream = (b == 0xE8) ? call_stream : jump_stream;
    size_t& src_offset = (b == 0xE8) ? call_offset : jump_offset;
    if (src_offset + 4 > src_stream.size()) {
      throw DecompressionError(phosg::string_printf("BCJ2 %s stream is truncated",
          (b == 0xE8) ? "call" : "jump"));
    }
    uint32_t src = (static_cast<uint32_t>(static_cast<uint8_t>(src_stream[src_offset])) << 24) |
        (static_cast<uint32_t>(static_cast<uint8_t>(src_stream[src_offset + 1])) << 16) |
        (static_cast<uint32_t>(static_cast<uint8_t>(src_stream[src_offset + 2])) << 8) |
        static_cast<uint32_t>(static_cast<uint8_t>(src_stream[src_offset + 3]));
    src_offset += 4;

    uint32_t dest = src - static_cast<uint32_t>(ret.size() + 4);
    for (size_t x = 0; x < 4 && ret.size() < output_size; x++) {
      ret.push_back(dest >> (8 * x));
    }
    prev_byte = dest >> 24;
  }

  return ret;
}

static lzma_options_bcj branch_filter_options(const Coder& coder) {
  lzma_options_bcj ret;
  ret.start_offset = 0;
  if (coder.properties.empty()) {
    return ret;
  }
  if (coder.properties.size() != 4) {
    throw DecompressionError(phosg::string_printf(
        "branch filter properties are 0x%zX bytes; expected 0 or 4",
        coder.properties.size()));
  }
  const uint8_t* p = reinterpret_cast<const uint8_t*>(coder.properties.data());
  ret.start_offset = p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<uint32_t>(p[3]) << 24);
  return ret;
}

static DecodeFunction make_branch_decoder(lzma_vli filter_id, const char* name) {
  return [filter_id, name](const Coder& coder, vector<string>&& inputs, uint64_t output_size) -> string {
    lzma_options_bcj options = branch_filter_options(coder);
    return decode_lzma_filter_stage(filter_id, &options, name,
        std::move(inputs[0]), output_size);
  };
}

void register_filter_decoders(DecoderRegistry& registry) {
  registry.add(METHOD_DELTA, "Delta", 1,
      [](const Coder& coder, vector<string>&& inputs, uint64_t output_size) -> string {
        if (coder.properties.size() != 1) {
          throw DecompressionError(phosg::string_printf(
              "Delta properties are 0x%zX bytes; expected 1", coder.properties.size()));
        }
        lzma_options_delta options;
        memset(&options, 0, sizeof(options));
        options.type = LZMA_DELTA_TYPE_BYTE;
        options.dist = static_cast<uint8_t>(coder.properties[0]) + 1;
        return decode_lzma_filter_stage(LZMA_FILTER_DELTA, &options, "Delta",
            std::move(inputs[0]), output_size);
      });

  registry.add(METHOD_BCJ_X86, "BCJ", 1, make_branch_decoder(LZMA_FILTER_X86, "BCJ"));
  registry.add(METHOD_BCJ_PPC, "PPC", 1, make_branch_decoder(LZMA_FILTER_POWERPC, "PPC"));
  registry.add(METHOD_BCJ_ARM, "ARM", 1, make_branch_decoder(LZMA_FILTER_ARM, "ARM"));
  registry.add(METHOD_BCJ_ARMT, "ARMT", 1, make_branch_decoder(LZMA_FILTER_ARMTHUMB, "ARMT"));
  registry.add(METHOD_BCJ_SPARC, "SPARC", 1, make_branch_decoder(LZMA_FILTER_SPARC, "SPARC"));
  registry.add(METHOD_BCJ_ARM64, "ARM64", 1, make_branch_decoder(LZMA_FILTER_ARM64, "ARM64"));

  registry.add(METHOD_BCJ2, "BCJ2", 4,
      [](const Coder&, vector<string>&& inputs, uint64_t output_size) -> string {
        return bcj2_decode(inputs[0], inputs[1], inputs[2], inputs[3], output_size);
      });
}
