#include "CoderGraph.hh"

#include <phosg/Strings.hh>

#include "Errors.hh"

using namespace std;

size_t Folder::num_in_streams_total() const {
  size_t ret = 0;
  for (const auto& coder : this->coders) {
    ret += coder.num_in_streams;
  }
  return ret;
}

size_t Folder::num_out_streams_total() const {
  size_t ret = 0;
  for (const auto& coder : this->coders) {
    ret += coder.num_out_streams;
  }
  return ret;
}

size_t Folder::main_out_stream() const {
  size_t num_out_streams = this->num_out_streams_total();
  vector<bool> bound(num_out_streams, false);
  for (const auto& bp : this->bind_pairs) {
    if (bp.out_index >= num_out_streams) {
      throw MalformedFolderError(phosg::string_printf(
          "bind pair refers to nonexistent out stream %zu", bp.out_index));
    }
    if (bound[bp.out_index]) {
      throw MalformedFolderError(phosg::string_printf(
          "out stream %zu is bound more than once", bp.out_index));
    }
    bound[bp.out_index] = true;
  }

  optional<size_t> ret;
  for (size_t x = 0; x < num_out_streams; x++) {
    if (!bound[x]) {
      if (ret) {
        throw MalformedFolderError(phosg::string_printf(
            "folder has multiple final outputs (%zu and %zu)", *ret, x));
      }
      ret = x;
    }
  }
  if (!ret) {
    throw MalformedFolderError("folder has no final output");
  }
  return *ret;
}

uint64_t Folder::unpack_size() const {
  // Same as unpack_sizes[main_out_stream()], but doesn't validate the graph;
  // that happens when the folder is decoded
  for (size_t x = 0; x < this->unpack_sizes.size(); x++) {
    bool bound = false;
    for (const auto& bp : this->bind_pairs) {
      if (bp.out_index == x) {
        bound = true;
        break;
      }
    }
    if (!bound) {
      return this->unpack_sizes[x];
    }
  }
  return 0;
}

size_t CoderGraph::coder_for_in_stream(size_t in_index) const {
  size_t coder = 0;
  while (coder + 1 < this->coder_first_in_stream.size() &&
      this->coder_first_in_stream[coder + 1] <= in_index) {
    coder++;
  }
  return coder;
}

CoderGraph plan_folder(const Folder& folder) {
  CoderGraph ret;

  size_t num_in_streams = 0;
  size_t num_out_streams = 0;
  for (size_t x = 0; x < folder.coders.size(); x++) {
    const auto& coder = folder.coders[x];
    ret.coder_first_in_stream.emplace_back(num_in_streams);
    ret.coder_first_out_stream.emplace_back(num_out_streams);
    num_in_streams += coder.num_in_streams;
    num_out_streams += coder.num_out_streams;
    ret.out_stream_coder.resize(num_out_streams, x);
  }
  if (folder.unpack_sizes.size() != num_out_streams) {
    throw MalformedFolderError(phosg::string_printf(
        "folder has %zu out streams but %zu unpack sizes",
        num_out_streams, folder.unpack_sizes.size()));
  }

  ret.main_out_stream = folder.main_out_stream();

  ret.in_stream_pack_index.resize(num_in_streams);
  ret.in_stream_source.resize(num_in_streams);
  for (const auto& bp : folder.bind_pairs) {
    if (bp.in_index >= num_in_streams) {
      throw MalformedFolderError(phosg::string_printf(
          "bind pair refers to nonexistent in stream %zu", bp.in_index));
    }
    if (ret.in_stream_source[bp.in_index]) {
      throw MalformedFolderError(phosg::string_printf(
          "in stream %zu is bound more than once", bp.in_index));
    }
    ret.in_stream_source[bp.in_index] = bp.out_index;
  }
  for (size_t x = 0; x < folder.packed_streams.size(); x++) {
    size_t in_index = folder.packed_streams[x];
    if (in_index >= num_in_streams) {
      throw MalformedFolderError(phosg::string_printf(
          "pack stream %zu feeds nonexistent in stream %zu", x, in_index));
    }
    if (ret.in_stream_source[in_index] || ret.in_stream_pack_index[in_index]) {
      throw MalformedFolderError(phosg::string_printf(
          "in stream %zu has more than one source", in_index));
    }
    ret.in_stream_pack_index[in_index] = x;
  }
  for (size_t x = 0; x < num_in_streams; x++) {
    if (!ret.in_stream_source[x] && !ret.in_stream_pack_index[x]) {
      throw MalformedFolderError(phosg::string_printf(
          "in stream %zu has no source", x));
    }
  }

  // Kahn's algorithm; among the coders that are ready, the one declared first
  // always goes next, so the order is deterministic
  size_t num_coders = folder.coders.size();
  vector<size_t> num_pending_inputs(num_coders, 0);
  vector<vector<size_t>> consumers(num_coders);
  for (size_t x = 0; x < num_in_streams; x++) {
    if (ret.in_stream_source[x]) {
      size_t producer = ret.out_stream_coder[*ret.in_stream_source[x]];
      size_t consumer = ret.coder_for_in_stream(x);
      consumers[producer].emplace_back(consumer);
      num_pending_inputs[consumer]++;
    }
  }

  vector<bool> scheduled(num_coders, false);
  while (ret.order.size() < num_coders) {
    size_t next = num_coders;
    for (size_t x = 0; x < num_coders; x++) {
      if (!scheduled[x] && num_pending_inputs[x] == 0) {
        next = x;
        break;
      }
    }
    if (next == num_coders) {
      throw MalformedFolderError("coder graph contains a cycle");
    }
    scheduled[next] = true;
    ret.order.emplace_back(next);
    for (size_t consumer : consumers[next]) {
      num_pending_inputs[consumer]--;
    }
  }

  return ret;
}
