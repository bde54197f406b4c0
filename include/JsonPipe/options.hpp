#pragma once

#include <cstddef>

#ifndef JSONPIPE_MAX_FRAGMENT_SIZE
#define JSONPIPE_MAX_FRAGMENT_SIZE 256
#endif

#ifndef JSONPIPE_DEFAULT_CHUNK_SIZE
#define JSONPIPE_DEFAULT_CHUNK_SIZE 65536
#endif

#ifndef JSONPIPE_ERROR_FRAGMENT_SIZE
#define JSONPIPE_ERROR_FRAGMENT_SIZE 32
#endif

namespace JsonPipe {

// Longest run of string/number/whitespace bytes consumed as one fragment
constexpr std::size_t MaxFragmentSize = JSONPIPE_MAX_FRAGMENT_SIZE;

constexpr std::size_t DefaultChunkSize = JSONPIPE_DEFAULT_CHUNK_SIZE;

// How much of the input is copied into a Failure for diagnostics
constexpr std::size_t ErrorFragmentSize = JSONPIPE_ERROR_FRAGMENT_SIZE;


/// pack*: emit a complete keyValue/stringValue/numberValue token.
/// stream*: emit start/fragment/end tokens as the value arrives.
/// Turning packing off for a class of values forces streaming on for it.
struct TokenizerOptions {
    bool packKeys      = true;
    bool packStrings   = true;
    bool packNumbers   = true;
    bool streamKeys    = true;
    bool streamStrings = true;
    bool streamNumbers = true;
    // Accept any number of concatenated top-level values
    bool jsonStreaming = false;

    constexpr TokenizerOptions & packValues(bool v) {
        packKeys = packStrings = packNumbers = v;
        return *this;
    }
    constexpr TokenizerOptions & streamValues(bool v) {
        streamKeys = streamStrings = streamNumbers = v;
        return *this;
    }

    constexpr TokenizerOptions normalized() const {
        TokenizerOptions o = *this;
        if(!o.packKeys)    o.streamKeys = true;
        if(!o.packStrings) o.streamStrings = true;
        if(!o.packNumbers) o.streamNumbers = true;
        return o;
    }
};

} // namespace JsonPipe
