#include "../test_helpers.hpp"

using namespace TestHelpers;

// Every split point, and one byte per chunk, yields the same tokens as the
// whole input once adjacent fragments are merged.

static_assert(ChunkingInvariant(R"({"name":"Ada","tags":["x","y"],"n":-12.5e3,"ok":true,"z":null})"),
              "Mixed document");

static_assert(ChunkingInvariant(R"(["a\"b\\c\u0041\ud83d\ude00"])"),
              "Escapes and a surrogate pair");

static_assert(ChunkingInvariant(R"(["\ud800x","\ud83d\n","\udc00"])") && ChunkingExact(R"(["\ud800","\ud83dA"])"),
              "Unpaired surrogates");

static_assert(ChunkingInvariant("[\"\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80\"]"),
              "Raw multi-byte code points");

static_assert(ChunkingInvariant(" [ 1 , 22 , 333 ] "),
              "Numbers and whitespace");

static_assert(ChunkingInvariant(R"([[],{},[{}],{"a":[]}])"),
              "Empty containers");

static_assert(ChunkingInvariant(R"({"a":)"),
              "Truncated input fails the same way for every split");

static_assert(ChunkingInvariant("[1,]"),
              "Malformed input fails the same way for every split");

static_assert([]() constexpr {
    TokenizerOptions o = PackedOnly();
    o.jsonStreaming = true;
    return ChunkingInvariant("1 2 true\n{\"a\":[3]}", o);
}(), "Concatenated values");

// Packed-only output is identical, token by token
static_assert(ChunkingExact(R"({"a":[1,2.5,"s\n",false],"b":{"c":null}})"),
              "Packed tokens do not depend on chunking");

static_assert(ChunkingExact("[\"\xC3\xA9\", 10e-2]"),
              "Packed multi-byte string and exponent");
