#include "../test_helpers.hpp"

using namespace TestHelpers;

static_assert(TokenizesTo("{\"a\":1}", {}, {
                  {TokenKind::startObject, ""},
                  {TokenKind::startKey, ""},
                  {TokenKind::keyFragment, "a"},
                  {TokenKind::endKey, ""},
                  {TokenKind::keyValue, "a"},
                  {TokenKind::startNumber, ""},
                  {TokenKind::numberFragment, "1"},
                  {TokenKind::endNumber, ""},
                  {TokenKind::numberValue, "1"},
                  {TokenKind::endObject, ""},
              }),
              "Full token stream of a one-member object");

static_assert(TokenizesTo("{}", {}, {{TokenKind::startObject, ""}, {TokenKind::endObject, ""}}),
              "Empty object");

static_assert(TokenizesTo(" [ ] ", {}, {{TokenKind::startArray, ""}, {TokenKind::endArray, ""}}),
              "Empty array with whitespace");

static_assert(TokenizesTo("{ \"a\" : [ {} , [] ] , \"b\" : null }", PackedOnly(), {
                  {TokenKind::startObject, ""},
                  {TokenKind::keyValue, "a"},
                  {TokenKind::startArray, ""},
                  {TokenKind::startObject, ""},
                  {TokenKind::endObject, ""},
                  {TokenKind::startArray, ""},
                  {TokenKind::endArray, ""},
                  {TokenKind::endArray, ""},
                  {TokenKind::keyValue, "b"},
                  {TokenKind::nullValue, ""},
                  {TokenKind::endObject, ""},
              }),
              "Nested containers with whitespace everywhere");

static_assert(TokenizesTo("{\"k\":\"v\"}", PackedOnly(), {
                  {TokenKind::startObject, ""},
                  {TokenKind::keyValue, "k"},
                  {TokenKind::stringValue, "v"},
                  {TokenKind::endObject, ""},
              }),
              "Key and string value are distinct token kinds");

static_assert([]() constexpr {
    auto r = Tokenize("[[[[1]]]]", PackedOnly());
    return r && r.tokens.size() == 9
        && r.tokens[4] == Token{TokenKind::numberValue, "1"};
}(), "Deep nesting");

static_assert([]() constexpr {
    JsonPipe::Tokenizer t;
    auto step = t(std::string("{\"a\":[1,"));
    return step.kind() == JsonPipe::pipeline::StepKind::many
        && t.depth() == 2
        && t.state() == JsonPipe::tokenizer::ParserState::value;
}(), "Depth and state after a partial chunk");

static_assert([]() constexpr {
    JsonPipe::Tokenizer t;
    auto step = t(std::string("[12"));
    // the open number is kept in the residue
    return step.kind() == JsonPipe::pipeline::StepKind::many
        && t.residue().empty()
        && t.offset() == 3;
}(), "Consumed offset advances past emitted bytes");
