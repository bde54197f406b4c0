#include "../test_helpers.hpp"

using namespace TestHelpers;

static_assert([]() constexpr {
    TokenizerOptions o;
    o.packValues(false).streamValues(false);
    auto n = o.normalized();
    // packing off forces streaming on
    return n.streamKeys && n.streamStrings && n.streamNumbers
        && !n.packKeys && !n.packStrings && !n.packNumbers;
}(), "Disabling both packing and streaming keeps streaming");

static_assert([]() constexpr {
    TokenizerOptions o;
    o.packStrings = false;
    o.streamKeys = false;
    o.streamNumbers = false;
    return TokenizesTo(R"({"k":"v","n":1})", o, {
        {TokenKind::startObject, ""},
        {TokenKind::keyValue, "k"},
        {TokenKind::startString, ""},
        {TokenKind::stringFragment, "v"},
        {TokenKind::endString, ""},
        {TokenKind::keyValue, "n"},
        {TokenKind::numberValue, "1"},
        {TokenKind::endObject, ""},
    });
}(), "Per-class packing and streaming");

static_assert([]() constexpr {
    TokenizerOptions o;
    o.packKeys = false;
    o.streamStrings = false;
    o.streamNumbers = false;
    return TokenizesTo(R"({"k":"v"})", o, {
        {TokenKind::startObject, ""},
        {TokenKind::startKey, ""},
        {TokenKind::keyFragment, "k"},
        {TokenKind::endKey, ""},
        {TokenKind::stringValue, "v"},
        {TokenKind::endObject, ""},
    });
}(), "Streamed keys without keyValue");

static_assert(TokenizesTo("[\"a\",1]", PackedOnly(), {
                  {TokenKind::startArray, ""},
                  {TokenKind::stringValue, "a"},
                  {TokenKind::numberValue, "1"},
                  {TokenKind::endArray, ""},
              }),
              "Packed only");

static_assert([]() constexpr {
    TokenizerOptions o = PackedOnly();
    o.jsonStreaming = true;
    return JsonPipe::Tokenizer(o).state() == JsonPipe::tokenizer::ParserState::done
        && JsonPipe::Tokenizer().state() == JsonPipe::tokenizer::ParserState::value;
}(), "jsonStreaming starts between values");

static_assert(JsonPipe::MaxFragmentSize == 256 && JsonPipe::ErrorFragmentSize == 32,
              "Default limits");
