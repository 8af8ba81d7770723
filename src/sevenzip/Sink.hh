#pragma once

#include <stdint.h>
#include <stdio.h>

#include <memory>
#include <string>

// Destination for one extracted entry. write() may be called any number of
// times (including zero), then close() is called exactly once.
class Sink {
public:
  virtual ~Sink() = default;

  virtual void write(const void* data, size_t size) = 0;
  virtual void close() {}
};

class StringSink : public Sink {
public:
  StringSink() = default;
  virtual ~StringSink() = default;

  virtual void write(const void* data, size_t size);
  virtual void close();

  const std::string& data() const {
    return this->contents;
  }
  bool closed() const {
    return this->is_closed;
  }

private:
  std::string contents;
  bool is_closed = false;
};

// Writes to a file on disk. Parent directories are created as needed. The file
// is created even if nothing is written to it.
class FileSink : public Sink {
public:
  explicit FileSink(const std::string& filename);
  virtual ~FileSink() = default;

  virtual void write(const void* data, size_t size);
  virtual void close();

private:
  void open_if_needed();

  std::string filename;
  std::unique_ptr<FILE, void (*)(FILE*)> f;
};

// Creates a directory (and its parents) when closed. Written data is ignored.
class DirectorySink : public Sink {
public:
  explicit DirectorySink(const std::string& path);
  virtual ~DirectorySink() = default;

  virtual void write(const void* data, size_t size);
  virtual void close();

private:
  std::string path;
};

// Collects a link target and creates a symbolic link when closed
class SymlinkSink : public Sink {
public:
  explicit SymlinkSink(const std::string& path);
  virtual ~SymlinkSink() = default;

  virtual void write(const void* data, size_t size);
  virtual void close();

private:
  std::string path;
  std::string target;
};

// Creates path and any missing parents; throws runtime_error on failure
void mkdirs(const std::string& path);
