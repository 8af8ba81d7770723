#include "Errors.hh"

#include <phosg/Strings.hh>

#include "Decoders.hh"

using namespace std;

UnsupportedCompressionMethodError::UnsupportedCompressionMethodError(
    const string& method_id)
    : SevenZipError(phosg::string_printf("unsupported compression method %s (%s)",
          format_method_id(method_id).c_str(), method_name(method_id))),
      id(method_id) {}

ChecksumMismatchError::ChecksumMismatchError(size_t file_index,
    const string& filename, uint32_t expected, uint32_t actual)
    : SevenZipError(phosg::string_printf(
          "checksum mismatch in file %zu (%s): expected %08X, got %08X",
          file_index, filename.c_str(), expected, actual)),
      index(file_index),
      expected_crc(expected),
      actual_crc(actual) {}
