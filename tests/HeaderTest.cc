#include <gtest/gtest.h>
#include <sys/stat.h>

#include <string>
#include <vector>

#include "ArchiveBuilder.hh"
#include "sevenzip/Decoders.hh"
#include "sevenzip/Errors.hh"
#include "sevenzip/Header.hh"

using namespace std;

static Header parse(const string& data) {
  HeaderReader r(data);
  uint8_t id = r.get_u8();
  if (id != static_cast<uint8_t>(PropertyID::HEADER)) {
    throw logic_error("test header does not begin with HEADER");
  }
  return parse_header(r);
}

TEST(HeaderTest, SolidFolderWithDirectoryAndEmptyFile) {
  ArchiveBuilder b;
  b.add_directory("docs");
  b.add_folder({{"docs/a.txt", "alpha"}, {"docs/b.txt", "bravo!"}, {"c.bin", string(100, 'c')}});
  b.add_empty_file("empty");

  Header h = parse(b.build_header());
  ASSERT_TRUE(h.main_streams);
  ASSERT_EQ(h.folders().size(), 1U);
  const auto& files = h.files_info.files;
  ASSERT_EQ(files.size(), 5U);

  EXPECT_EQ(files[0].filename, "docs");
  EXPECT_TRUE(files[0].is_directory);
  EXPECT_FALSE(files[0].is_empty_file);
  EXPECT_FALSE(files[0].has_stream());

  EXPECT_EQ(files[1].filename, "docs/a.txt");
  EXPECT_FALSE(files[1].is_directory);
  EXPECT_EQ(files[1].uncompressed_size, 5U);
  EXPECT_EQ(*files[1].folder_index, 0U);
  EXPECT_EQ(files[1].substream_index, 0U);
  EXPECT_EQ(*files[1].crc, crc32_of("alpha"));

  EXPECT_EQ(files[2].uncompressed_size, 6U);
  EXPECT_EQ(files[2].substream_index, 1U);
  EXPECT_EQ(*files[2].crc, crc32_of("bravo!"));

  // The last substream's size is implied by the folder size
  EXPECT_EQ(files[3].uncompressed_size, 100U);
  EXPECT_EQ(files[3].substream_index, 2U);

  EXPECT_EQ(files[4].filename, "empty");
  EXPECT_TRUE(files[4].is_empty_file);
  EXPECT_FALSE(files[4].is_directory);
  EXPECT_EQ(files[4].uncompressed_size, 0U);
  EXPECT_FALSE(files[4].has_stream());

  for (size_t x = 0; x < files.size(); x++) {
    EXPECT_EQ(files[x].id, x);
    int kinds = files[x].is_directory + files[x].is_empty_file + files[x].has_stream();
    EXPECT_EQ(kinds, 1) << x;
  }
}

TEST(HeaderTest, NonSolidFoldersAndPackOffsets) {
  ArchiveBuilder b;
  b.add_folder({{"one", "111111"}}, ArchiveBuilder::Method::COPY, 2);
  b.add_folder({{"two", "22"}}, ArchiveBuilder::Method::COPY);

  Header h = parse(b.build_header());
  const auto& pack_info = h.main_streams->pack_info;
  EXPECT_EQ(pack_info.sizes, (vector<uint64_t>{8, 2}));
  EXPECT_EQ(pack_info.offsets, (vector<uint64_t>{32, 40}));
  EXPECT_EQ(h.main_streams->folder_first_pack_stream, (vector<size_t>{0, 1}));
  EXPECT_EQ(*h.files_info.files[0].folder_index, 0U);
  EXPECT_EQ(*h.files_info.files[1].folder_index, 1U);
  EXPECT_EQ(h.files_info.files[1].uncompressed_size, 2U);
}

TEST(HeaderTest, FolderCRCUsedForSingleSubstream) {
  ArchiveBuilder b;
  auto& f = b.add_folder({{"only", "contents"}});
  f.crc = crc32_of("contents");

  Header h = parse(b.build_header());
  EXPECT_EQ(*h.folders()[0].crc, crc32_of("contents"));
  EXPECT_FALSE(h.main_streams->substreams.crcs[0].has_value());
  EXPECT_EQ(*h.files_info.files[0].crc, crc32_of("contents"));
}

TEST(HeaderTest, MissingSubstreamCRCs) {
  ArchiveBuilder b;
  auto& f = b.add_folder({{"a", "aa"}, {"b", "bb"}});
  f.write_substream_crcs = false;
  b.add_folder({{"c", "cc"}});

  Header h = parse(b.build_header());
  EXPECT_FALSE(h.files_info.files[0].crc.has_value());
  EXPECT_FALSE(h.files_info.files[1].crc.has_value());
  EXPECT_EQ(*h.files_info.files[2].crc, crc32_of("cc"));
}

TEST(HeaderTest, TimestampsAndAttributes) {
  ArchiveBuilder b;
  b.add_folder({{"a", "x"}, {"link", "a"}});
  b.entry(0).mtime = 12786932616ULL * 10000000ULL;
  b.entry(0).attributes = FILE_ATTRIBUTE_ARCHIVE | FILE_ATTRIBUTE_UNIX_EXTENSION |
      (static_cast<uint32_t>(S_IFREG | 0644) << 16);
  b.entry(1).attributes = FILE_ATTRIBUTE_UNIX_EXTENSION |
      (static_cast<uint32_t>(S_IFLNK | 0777) << 16);

  Header h = parse(b.build_header());
  const auto& files = h.files_info.files;
  ASSERT_TRUE(files[0].last_write_time);
  EXPECT_EQ(format_filetime(*files[0].last_write_time), "2006-03-15 21:43:36");
  EXPECT_EQ(filetime_to_unix(*files[0].last_write_time), 1142459016);
  EXPECT_FALSE(files[1].last_write_time.has_value());
  EXPECT_FALSE(files[0].creation_time.has_value());

  EXPECT_EQ(*files[0].posix_mode(), static_cast<uint32_t>(S_IFREG | 0644));
  EXPECT_FALSE(files[0].is_symlink());
  EXPECT_TRUE(files[1].is_symlink());
}

TEST(HeaderTest, TimeConversions) {
  EXPECT_EQ(filetime_to_unix(116444736000000000ULL), 0);
  EXPECT_EQ(unix_to_filetime(0), 116444736000000000ULL);
  EXPECT_EQ(unix_to_filetime(1142459016), 127869326160000000ULL);
  EXPECT_EQ(format_filetime(116444736000000000ULL), "1970-01-01 00:00:00");
}

TEST(HeaderTest, UnicodeNames) {
  ArchiveBuilder b;
  b.add_folder({{"caf\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC.txt", "x"}, {"\xF0\x9F\x98\x80", "y"}});
  Header h = parse(b.build_header());
  EXPECT_EQ(h.files_info.files[0].filename, "caf\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC.txt");
  EXPECT_EQ(h.files_info.files[1].filename, "\xF0\x9F\x98\x80");
}

TEST(HeaderTest, UTF16Conversion) {
  EXPECT_EQ(utf16le_to_utf8(string("a\x00\xE9\x00", 4)), "a\xC3\xA9");
  EXPECT_EQ(utf16le_to_utf8(string("\x3D\xD8\x00\xDE", 4)), "\xF0\x9F\x98\x80");
  // Unpaired surrogates
  EXPECT_EQ(utf16le_to_utf8(string("\x3D\xD8" "a\x00", 4)), "\xEF\xBF\xBD" "a");
  EXPECT_EQ(utf16le_to_utf8(string("\x00\xDE", 2)), "\xEF\xBF\xBD");
}

TEST(HeaderTest, AntiItems) {
  ArchiveBuilder b;
  b.add_anti_item("gone.txt");
  b.add_anti_item("gone_dir", true);
  b.add_folder({{"kept", "k"}});

  Header h = parse(b.build_header());
  const auto& files = h.files_info.files;
  EXPECT_TRUE(files[0].is_anti);
  EXPECT_TRUE(files[0].is_empty_file);
  EXPECT_TRUE(files[1].is_anti);
  EXPECT_TRUE(files[1].is_directory);
  EXPECT_FALSE(files[2].is_anti);
  EXPECT_EQ(*files[2].folder_index, 0U);
}

TEST(HeaderTest, UnknownPropertiesAreSkipped) {
  ArchiveBuilder b;
  b.write_unknown_properties = true;
  b.add_folder({{"a", "aaa"}});
  Header h = parse(b.build_header());
  EXPECT_EQ(h.files_info.files[0].filename, "a");
  EXPECT_EQ(h.files_info.files[0].uncompressed_size, 3U);
}

TEST(HeaderTest, ArchivePropertiesAreSkipped) {
  ArchiveBuilder b;
  b.add_folder({{"a", "aaa"}});
  string header = b.build_header();
  // 02 (archive properties) 0x42 <size 2> xx xx 00
  header.insert(1, string("\x02\x42\x02\xAA\xBB\x00", 6));
  Header h = parse(header);
  EXPECT_EQ(h.files_info.files.size(), 1U);
}

TEST(HeaderTest, EmptyHeader) {
  Header h = parse(string("\x01\x00", 2));
  EXPECT_FALSE(h.main_streams.has_value());
  EXPECT_TRUE(h.folders().empty());
  EXPECT_TRUE(h.files_info.files.empty());
}

TEST(HeaderTest, ParseFolderSimpleAndComplex) {
  {
    // One LZMA2 coder with a 1-byte property
    HeaderReader r("\x01\x21\x21\x01\x18", 5);
    Folder f = parse_folder(r);
    ASSERT_EQ(f.coders.size(), 1U);
    EXPECT_EQ(f.coders[0].method_id, METHOD_LZMA2);
    EXPECT_EQ(f.coders[0].properties, "\x18");
    EXPECT_TRUE(f.bind_pairs.empty());
    EXPECT_EQ(f.packed_streams, (vector<size_t>{0}));
    EXPECT_TRUE(r.eof());
  }
  {
    // BCJ2 (4 in, 1 out) fed by three LZMA coders and one raw pack stream
    string data;
    data.push_back(4);
    data.push_back(0x14);
    data += METHOD_BCJ2;
    data += string("\x04\x01", 2);
    for (size_t x = 0; x < 3; x++) {
      data.push_back(0x23);
      data += METHOD_LZMA;
      data += string("\x05\x5D\x00\x00\x10\x00", 6);
    }
    data += string("\x00\x01\x01\x02\x02\x03", 6);
    data += string("\x04\x05\x06\x03", 4);

    HeaderReader r(data);
    Folder f = parse_folder(r);
    EXPECT_EQ(f.coders.size(), 4U);
    EXPECT_EQ(f.coders[0].num_in_streams, 4U);
    EXPECT_EQ(f.num_in_streams_total(), 7U);
    EXPECT_EQ(f.num_out_streams_total(), 4U);
    ASSERT_EQ(f.bind_pairs.size(), 3U);
    EXPECT_EQ(f.bind_pairs[2].in_index, 2U);
    EXPECT_EQ(f.bind_pairs[2].out_index, 3U);
    EXPECT_EQ(f.packed_streams, (vector<size_t>{4, 5, 6, 3}));
    EXPECT_TRUE(r.eof());
  }
}

TEST(HeaderTest, MalformedStructures) {
  // Alternative methods flag
  {
    HeaderReader r("\x01\x81\x21", 3);
    EXPECT_THROW(parse_folder(r), MalformedHeaderError);
  }
  // No coders
  {
    HeaderReader r("\x00", 1);
    EXPECT_THROW(parse_folder(r), MalformedFolderError);
  }
  // Truncated coder record
  {
    HeaderReader r("\x01\x23\x03\x01", 4);
    EXPECT_THROW(parse_folder(r), TruncatedDataError);
  }
  // Unexpected property at the top level
  EXPECT_THROW(parse(string("\x01\x09\x00", 3)), MalformedHeaderError);
  // Header ends early
  EXPECT_THROW(parse(string("\x01\x05", 2)), TruncatedDataError);
  // Folders stored externally
  {
    HeaderReader r("\x0B\x01\x01", 3);
    EXPECT_THROW(parse_unpack_info(r), UnsupportedHeaderEncodingError);
  }
}

TEST(HeaderTest, SubstreamSizesLargerThanFolder) {
  ArchiveBuilder b;
  b.add_folder({{"a", "aaaa"}, {"b", "bbbb"}}, ArchiveBuilder::Method::COPY);
  b.folder(0).unpack_sizes[0] = 3;
  EXPECT_THROW(parse(b.build_header()), MalformedHeaderError);
}

TEST(HeaderTest, MoreFilesThanSubstreams) {
  ArchiveBuilder b;
  b.add_folder({{"a", "aaaa"}}, ArchiveBuilder::Method::COPY);
  // An entry that claims to have data, with no substream left for it
  auto& e = b.add_empty_file("b");
  e.is_empty_file = false;
  e.has_stream = true;
  EXPECT_THROW(parse(b.build_header()), MalformedHeaderError);
}

TEST(HeaderTest, FoldersWithoutSubstreamsAreSkipped) {
  ArchiveBuilder b;
  b.add_folder({{"a", "aaaa"}}, ArchiveBuilder::Method::COPY);
  BuilderFolder f;
  f.coders.emplace_back(Coder{METHOD_COPY, 1, 1, ""});
  f.packed_streams.emplace_back(0);
  f.unpack_sizes.emplace_back(0);
  f.pack_streams.emplace_back("");
  b.add_raw_folder(std::move(f), {});
  b.add_folder({{"c", "cc"}}, ArchiveBuilder::Method::COPY);

  Header h = parse(b.build_header());
  EXPECT_EQ(h.folders().size(), 3U);
  EXPECT_EQ(*h.files_info.files[0].folder_index, 0U);
  EXPECT_EQ(*h.files_info.files[1].folder_index, 2U);
}
