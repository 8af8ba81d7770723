#pragma once

#include <stdint.h>

#include <memory>
#include <phosg/Filesystem.hh>
#include <string>
#include <vector>

// Random-access byte source that an archive is read from. Reads never buffer
// more than requested, and a read that extends past the end of the source
// throws TruncatedDataError.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual uint64_t size() const = 0;
  virtual void pread(void* data, size_t size, uint64_t offset) = 0;

  std::string pread(size_t size, uint64_t offset);

protected:
  void check_range(size_t size, uint64_t offset) const;
};

class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(const std::string& filename);
  virtual ~FileByteSource() = default;

  virtual uint64_t size() const;
  virtual void pread(void* data, size_t size, uint64_t offset);
  using ByteSource::pread;

private:
  std::string filename;
  phosg::scoped_fd fd;
  uint64_t file_size;
};

class StringByteSource : public ByteSource {
public:
  explicit StringByteSource(std::string&& data);
  explicit StringByteSource(const std::string& data);
  virtual ~StringByteSource() = default;

  virtual uint64_t size() const;
  virtual void pread(void* data, size_t size, uint64_t offset);
  using ByteSource::pread;

private:
  std::string data;
};

// Several sources read back to back as one (split volumes: x.7z.001,
// x.7z.002, ...)
class MultiVolumeByteSource : public ByteSource {
public:
  explicit MultiVolumeByteSource(std::vector<std::unique_ptr<ByteSource>>&& volumes);
  virtual ~MultiVolumeByteSource() = default;

  virtual uint64_t size() const;
  virtual void pread(void* data, size_t size, uint64_t offset);
  using ByteSource::pread;

  size_t num_volumes() const {
    return this->volumes.size();
  }

private:
  std::vector<std::unique_ptr<ByteSource>> volumes;
  std::vector<uint64_t> volume_offsets;
  uint64_t total_size;
};

// Opens filename as a single file, or, if it ends with .001, as the first of a
// sequence of numbered volumes.
std::unique_ptr<ByteSource> open_byte_source(const std::string& filename);
