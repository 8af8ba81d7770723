#include "Sink.hh"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>

using namespace std;

void mkdirs(const string& path) {
  if (path.empty()) {
    return;
  }
  size_t offset = 0;
  for (;;) {
    offset = path.find('/', offset + 1);
    string component = path.substr(0, offset);
    if (mkdir(component.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) && (errno != EEXIST)) {
      throw runtime_error(phosg::string_printf("cannot create directory %s (%s)",
          component.c_str(), strerror(errno)));
    }
    if (offset == string::npos) {
      break;
    }
  }

  struct stat st;
  if (stat(path.c_str(), &st) || !S_ISDIR(st.st_mode)) {
    throw runtime_error("cannot create directory " + path + ": not a directory");
  }
}

static void make_parent_dirs(const string& path) {
  size_t slash = path.rfind('/');
  if (slash != string::npos && slash > 0) {
    mkdirs(path.substr(0, slash));
  }
}

void StringSink::write(const void* data, size_t size) {
  this->contents.append(reinterpret_cast<const char*>(data), size);
}

void StringSink::close() {
  this->is_closed = true;
}

FileSink::FileSink(const string& filename)
    : filename(filename),
      f(nullptr, nullptr) {}

void FileSink::open_if_needed() {
  if (!this->f) {
    make_parent_dirs(this->filename);
    this->f = phosg::fopen_unique(this->filename, "wb");
  }
}

void FileSink::write(const void* data, size_t size) {
  this->open_if_needed();
  phosg::fwritex(this->f.get(), data, size);
}

void FileSink::close() {
  this->open_if_needed();
  if (fflush(this->f.get())) {
    throw runtime_error("cannot write " + this->filename);
  }
  this->f.reset();
}

DirectorySink::DirectorySink(const string& path) : path(path) {}

void DirectorySink::write(const void*, size_t) {}

void DirectorySink::close() {
  mkdirs(this->path);
}

SymlinkSink::SymlinkSink(const string& path) : path(path) {}

void SymlinkSink::write(const void* data, size_t size) {
  this->target.append(reinterpret_cast<const char*>(data), size);
}

void SymlinkSink::close() {
  make_parent_dirs(this->path);
  if (unlink(this->path.c_str()) && (errno != ENOENT)) {
    throw runtime_error(phosg::string_printf("cannot replace %s (%s)",
        this->path.c_str(), strerror(errno)));
  }
  if (symlink(this->target.c_str(), this->path.c_str())) {
    throw runtime_error(phosg::string_printf("cannot create symlink %s -> %s (%s)",
        this->path.c_str(), this->target.c_str(), strerror(errno)));
  }
}
