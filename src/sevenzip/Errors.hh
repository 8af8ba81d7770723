#pragma once

#include <stdint.h>

#include <stdexcept>
#include <string>

class SevenZipError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad signature, bad start header or header CRC, or a header that can't be a
// valid 7z header
class NotA7zArchiveError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};

class MalformedHeaderError : public NotA7zArchiveError {
public:
  using NotA7zArchiveError::NotA7zArchiveError;
};

class TruncatedDataError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};

class MalformedFolderError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};

class UnsupportedHeaderEncodingError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};

class UnsupportedCompressionMethodError : public SevenZipError {
public:
  explicit UnsupportedCompressionMethodError(const std::string& method_id);

  // Raw method id bytes, as stored in the coder record
  const std::string& method_id() const {
    return this->id;
  }

private:
  std::string id;
};

class DecompressionError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};

class ChecksumMismatchError : public SevenZipError {
public:
  ChecksumMismatchError(size_t file_index, const std::string& filename,
      uint32_t expected, uint32_t actual);

  size_t file_index() const {
    return this->index;
  }
  uint32_t expected() const {
    return this->expected_crc;
  }
  uint32_t actual() const {
    return this->actual_crc;
  }

private:
  size_t index;
  uint32_t expected_crc;
  uint32_t actual_crc;
};

class UseAfterCloseError : public SevenZipError {
public:
  using SevenZipError::SevenZipError;
};
