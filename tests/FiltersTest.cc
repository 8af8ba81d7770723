#include <gtest/gtest.h>
#include <lzma.h>

#include <string>
#include <vector>

#include "ArchiveBuilder.hh"
#include "sevenzip/Decoders.hh"
#include "sevenzip/Errors.hh"
#include "sevenzip/Filters.hh"

using namespace std;

// Random bytes, half of them drawn from the opcode bytes the branch filters
// look for, so every filter finds something to convert
static string make_branchy_data(size_t size, uint32_t seed) {
  static const uint8_t interesting[] = {0x00, 0xFF, 0xE8, 0xE9, 0x0F, 0x80,
      0xEB, 0x48, 0x49, 0x01, 0xF0, 0xF8, 0x40, 0x7F, 0xC0, 0x94, 0x90, 0x25};
  string ret;
  uint32_t state = seed;
  while (ret.size() < size) {
    state = state * 1103515245 + 12345;
    uint8_t r = state >> 16;
    if (r & 1) {
      ret.push_back(static_cast<char>(interesting[(r >> 1) % sizeof(interesting)]));
    } else {
      ret.push_back(static_cast<char>(state >> 24));
    }
  }
  return ret;
}

// Compresses data with liblzma's [filter, LZMA2] chain, then decodes it as the
// equivalent two-coder 7z folder
static string filter_round_trip(const string& data, lzma_vli filter_id,
    void* filter_options, const string& method_id, const string& properties) {
  Coder filter;
  filter.method_id = method_id;
  filter.properties = properties;
  Coder lzma2;
  lzma2.method_id = METHOD_LZMA2;
  string packed = filter_lzma2_compress(data, filter_id, filter_options, &lzma2.properties);

  Folder f;
  f.coders = {filter, lzma2};
  f.bind_pairs = {{0, 1}};
  f.packed_streams = {1};
  f.unpack_sizes = {data.size(), data.size()};
  return decode_folder(f, {packed});
}

// Decodes data as a folder holding only the given filter
static string decode_filter_only(const string& method_id,
    const string& properties, const string& data, uint64_t size) {
  Coder c;
  c.method_id = method_id;
  c.properties = properties;
  Folder f;
  f.coders = {c};
  f.packed_streams = {0};
  f.unpack_sizes = {size};
  return decode_folder(f, {data});
}

TEST(FiltersTest, DeltaDecode) {
  EXPECT_EQ(decode_filter_only(METHOD_DELTA, string("\x00", 1),
                string("\x01\x01\x01\x01\x05\x05", 6), 6),
      string("\x01\x02\x03\x04\x09\x0E", 6));
  EXPECT_EQ(decode_filter_only(METHOD_DELTA, string("\x01", 1),
                string("\x01\x02\x01\x01\x01\x01", 6), 6),
      string("\x01\x02\x02\x03\x03\x04", 6));
  // Trailing padding in the pack stream is ignored
  EXPECT_EQ(decode_filter_only(METHOD_DELTA, string("\x00", 1),
                string("\x01\x01\x01\xAA\xBB", 5), 3),
      string("\x01\x02\x03", 3));
  EXPECT_THROW(decode_filter_only(METHOD_DELTA, string("\x00", 1), "ab", 3),
      DecompressionError);
}

TEST(FiltersTest, FiltersSpanSeveralChunks) {
  string data = make_branchy_data(200000, 9);
  lzma_options_delta opts;
  opts.type = LZMA_DELTA_TYPE_BYTE;
  opts.dist = 4;
  EXPECT_EQ(filter_round_trip(data, LZMA_FILTER_DELTA, &opts, METHOD_DELTA, string("\x03", 1)), data);
  EXPECT_EQ(filter_round_trip(data, LZMA_FILTER_ARM64, nullptr, METHOD_BCJ_ARM64, ""), data);
}

TEST(FiltersTest, DeltaMatchesLiblzma) {
  string data = make_branchy_data(20000, 1);
  for (uint32_t dist : {1U, 2U, 4U, 7U, 256U}) {
    lzma_options_delta opts;
    opts.type = LZMA_DELTA_TYPE_BYTE;
    opts.dist = dist;
    string props(1, static_cast<char>(dist - 1));
    EXPECT_EQ(filter_round_trip(data, LZMA_FILTER_DELTA, &opts, METHOD_DELTA, props), data)
        << "distance " << dist;
  }
}

TEST(FiltersTest, DeltaRequiresProperty) {
  Coder c;
  c.method_id = METHOD_DELTA;
  Folder f;
  f.coders = {c};
  f.packed_streams = {0};
  f.unpack_sizes = {4};
  EXPECT_THROW(decode_folder(f, {"abcd"}), DecompressionError);
}

struct BranchFilterCase {
  const char* name;
  lzma_vli filter_id;
  const string* method_id;
};

static const vector<BranchFilterCase> branch_filter_cases = {
    {"x86", LZMA_FILTER_X86, &METHOD_BCJ_X86},
    {"PPC", LZMA_FILTER_POWERPC, &METHOD_BCJ_PPC},
    {"ARM", LZMA_FILTER_ARM, &METHOD_BCJ_ARM},
    {"ARMT", LZMA_FILTER_ARMTHUMB, &METHOD_BCJ_ARMT},
    {"SPARC", LZMA_FILTER_SPARC, &METHOD_BCJ_SPARC},
    {"ARM64", LZMA_FILTER_ARM64, &METHOD_BCJ_ARM64},
};

TEST(FiltersTest, BranchFiltersFindInstructions) {
  string data = make_branchy_data(8192, 2);
  for (const auto& c : branch_filter_cases) {
    EXPECT_NE(decode_filter_only(*c.method_id, "", data, data.size()), data) << c.name;
  }
}

TEST(FiltersTest, BranchFiltersMatchLiblzma) {
  for (const auto& c : branch_filter_cases) {
    // Odd sizes leave a tail too short for an instruction
    for (size_t size : {0U, 3U, 4097U, 65539U}) {
      string data = make_branchy_data(size, 3 + size);
      EXPECT_EQ(filter_round_trip(data, c.filter_id, nullptr, *c.method_id, ""), data)
          << c.name << " size " << size;
    }
  }
}

TEST(FiltersTest, X86OnCodeLikeData) {
  string data = make_x86_code(100000);
  EXPECT_EQ(filter_round_trip(data, LZMA_FILTER_X86, nullptr, METHOD_BCJ_X86, ""), data);
}

TEST(FiltersTest, BranchFilterStartOffset) {
  string data = make_branchy_data(30000, 4);
  lzma_options_bcj opts;
  opts.start_offset = 0x1000;
  string props("\x00\x10\x00\x00", 4);
  for (const auto& c : branch_filter_cases) {
    EXPECT_EQ(filter_round_trip(data, c.filter_id, &opts, *c.method_id, props), data) << c.name;
  }

  // Start offset changes the result
  EXPECT_NE(decode_filter_only(METHOD_BCJ_X86, "", data, data.size()),
      decode_filter_only(METHOD_BCJ_X86, props, data, data.size()));

  // Properties of the wrong size
  Coder coder;
  coder.method_id = METHOD_BCJ_X86;
  coder.properties = "\x01\x02";
  Folder f;
  f.coders = {coder};
  f.packed_streams = {0};
  f.unpack_sizes = {4};
  EXPECT_THROW(decode_folder(f, {"abcd"}), DecompressionError);
}

TEST(FiltersTest, BCJ2) {
  string data = make_x86_code(50000);
  auto streams = bcj2_encode(data);
  EXPECT_FALSE(streams.call_stream.empty());
  EXPECT_FALSE(streams.jump_stream.empty());
  EXPECT_LT(streams.main_stream.size(), data.size());

  EXPECT_EQ(bcj2_decode(streams.main_stream, streams.call_stream,
                streams.jump_stream, streams.rc_stream, data.size()),
      data);

  // A shorter output stops cleanly in the middle of an operand
  for (size_t size : {0U, 1U, 2U, 3U, 4U, 5U, 6U, 7U, 100U}) {
    EXPECT_EQ(bcj2_decode(streams.main_stream, streams.call_stream,
                  streams.jump_stream, streams.rc_stream, size),
        data.substr(0, size));
  }
}

TEST(FiltersTest, BCJ2TruncatedStreams) {
  string data = make_x86_code(20000);
  auto streams = bcj2_encode(data);
  EXPECT_THROW(bcj2_decode(streams.main_stream, streams.call_stream.substr(0, streams.call_stream.size() - 4),
                   streams.jump_stream, streams.rc_stream, data.size()),
      DecompressionError);
  EXPECT_THROW(bcj2_decode(streams.main_stream, streams.call_stream,
                   streams.jump_stream.substr(0, 2), streams.rc_stream, data.size()),
      DecompressionError);
  EXPECT_THROW(bcj2_decode(streams.main_stream.substr(0, 100), streams.call_stream,
                   streams.jump_stream, streams.rc_stream, data.size()),
      DecompressionError);
  EXPECT_THROW(bcj2_decode(streams.main_stream, streams.call_stream,
                   streams.jump_stream, streams.rc_stream.substr(0, 3), data.size()),
      DecompressionError);
}

TEST(FiltersTest, BCJ2FolderWithLZMASubstreams) {
  string data = make_x86_code(40000);
  auto streams = bcj2_encode(data);

  Coder bcj2;
  bcj2.method_id = METHOD_BCJ2;
  bcj2.num_in_streams = 4;
  Coder main_coder, call_coder, jump_coder;
  main_coder.method_id = call_coder.method_id = jump_coder.method_id = METHOD_LZMA;
  string packed_main = lzma_compress(streams.main_stream, &main_coder.properties);
  string packed_call = lzma_compress(streams.call_stream, &call_coder.properties);
  string packed_jump = lzma_compress(streams.jump_stream, &jump_coder.properties);

  Folder f;
  f.coders = {bcj2, main_coder, call_coder, jump_coder};
  f.bind_pairs = {{0, 1}, {1, 2}, {2, 3}};
  f.packed_streams = {4, 5, 6, 3};
  f.unpack_sizes = {data.size(), streams.main_stream.size(),
      streams.call_stream.size(), streams.jump_stream.size()};
  EXPECT_EQ(decode_folder(f, {packed_main, packed_call, packed_jump, streams.rc_stream}), data);
}
