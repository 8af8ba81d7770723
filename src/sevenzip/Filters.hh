#pragma once

#include <lzma.h>
#include <stdint.h>

#include <string>

// Runs one of liblzma's delta or branch-conversion filters over input, which
// is truncated to output_size first. options points to the filter's
// lzma_options_delta or lzma_options_bcj.
std::string decode_lzma_filter_stage(lzma_vli filter_id, void* options,
    const char* method, std::string&& input, uint64_t output_size);

// Reassembles x86 code split by the BCJ2 encoder into a main stream, a CALL
// target stream, a JMP target stream, and a range-coded stream that says which
// E8/E9/Jcc opcodes were converted
std::string bcj2_decode(const std::string& main_stream,
    const std::string& call_stream, const std::string& jump_stream,
    const std::string& rc_stream, uint64_t output_size);
