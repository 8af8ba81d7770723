#include "ByteSource.hh"

#include <fcntl.h>
#include <inttypes.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

string ByteSource::pread(size_t size, uint64_t offset) {
  string ret(size, '\0');
  this->pread(ret.data(), size, offset);
  return ret;
}

void ByteSource::check_range(size_t size, uint64_t offset) const {
  uint64_t source_size = this->size();
  if ((offset > source_size) || (size > source_size - offset)) {
    throw TruncatedDataError(phosg::string_printf(
        "read of 0x%zX bytes at offset 0x%" PRIX64 " extends beyond end of data (0x%" PRIX64 " bytes)",
        size, offset, source_size));
  }
}

FileByteSource::FileByteSource(const string& filename)
    : filename(filename),
      fd(filename, O_RDONLY) {
  struct stat st;
  if (fstat(this->fd, &st)) {
    throw runtime_error("cannot stat " + filename);
  }
  this->file_size = st.st_size;
}

uint64_t FileByteSource::size() const {
  return this->file_size;
}

void FileByteSource::pread(void* data, size_t size, uint64_t offset) {
  this->check_range(size, offset);
  phosg::preadx(this->fd, data, size, offset);
}

StringByteSource::StringByteSource(string&& data)
    : data(std::move(data)) {}

StringByteSource::StringByteSource(const string& data)
    : data(data) {}

uint64_t StringByteSource::size() const {
  return this->data.size();
}

void StringByteSource::pread(void* data, size_t size, uint64_t offset) {
  this->check_range(size, offset);
  memcpy(data, this->data.data() + offset, size);
}

MultiVolumeByteSource::MultiVolumeByteSource(
    vector<unique_ptr<ByteSource>>&& volumes)
    : volumes(std::move(volumes)),
      total_size(0) {
  if (this->volumes.empty()) {
    throw invalid_argument("no volumes given");
  }
  for (const auto& volume : this->volumes) {
    this->volume_offsets.emplace_back(this->total_size);
    this->total_size += volume->size();
  }
}

uint64_t MultiVolumeByteSource::size() const {
  return this->total_size;
}

void MultiVolumeByteSource::pread(void* data, size_t size, uint64_t offset) {
  this->check_range(size, offset);

  // Find the last volume that starts at or before offset, then read forward
  // across volume boundaries until the request is satisfied
  size_t z = this->volumes.size() - 1;
  while (this->volume_offsets[z] > offset) {
    z--;
  }

  uint8_t* out = reinterpret_cast<uint8_t*>(data);
  while (size > 0) {
    uint64_t volume_offset = offset - this->volume_offsets[z];
    uint64_t available = this->volumes[z]->size() - volume_offset;
    size_t bytes = (available < size) ? available : size;
    if (bytes > 0) {
      this->volumes[z]->pread(out, bytes, volume_offset);
    }
    out += bytes;
    offset += bytes;
    size -= bytes;
    z++;
  }
}

unique_ptr<ByteSource> open_byte_source(const string& filename) {
  if (!filename.ends_with(".001")) {
    return make_unique<FileByteSource>(filename);
  }

  string base = filename.substr(0, filename.size() - 3);
  vector<unique_ptr<ByteSource>> volumes;
  for (size_t x = 1;; x++) {
    string volume_filename = base + phosg::string_printf("%03zu", x);
    if (access(volume_filename.c_str(), F_OK)) {
      if (x == 1) {
        throw runtime_error("cannot open " + volume_filename);
      }
      break;
    }
    volumes.emplace_back(make_unique<FileByteSource>(volume_filename));
  }
  if (volumes.size() == 1) {
    return std::move(volumes[0]);
  }
  return make_unique<MultiVolumeByteSource>(std::move(volumes));
}
