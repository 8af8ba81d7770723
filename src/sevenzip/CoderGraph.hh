#pragma once

#include <stdint.h>

#include <optional>
#include <vector>

#include "Header.hh"

// Decode plan for one folder. Streams are identified by their folder-wide
// index (in streams and out streams are numbered separately, in coder order).
struct CoderGraph {
  // First folder-wide in/out stream index of each coder
  std::vector<size_t> coder_first_in_stream;
  std::vector<size_t> coder_first_out_stream;
  // For each in stream, the pack stream (index within the folder) that feeds
  // it, or the out stream bound to it; exactly one of these is set
  std::vector<std::optional<size_t>> in_stream_pack_index;
  std::vector<std::optional<size_t>> in_stream_source;
  // Coder and stream-within-coder of each out stream
  std::vector<size_t> out_stream_coder;
  // The out stream that isn't bound to anything
  size_t main_out_stream;
  // Coders in an order where each coder comes after every coder that feeds it
  std::vector<size_t> order;

  size_t coder_for_in_stream(size_t in_index) const;
};

// Throws MalformedFolderError if the bind pairs and packed stream list don't
// describe an acyclic graph with exactly one final output
CoderGraph plan_folder(const Folder& folder);
