#include "../test_helpers.hpp"
#include <JsonPipe/utf8.hpp>

using namespace TestHelpers;
using JsonPipe::Utf8Joiner;
using JsonPipe::pipeline::StepKind;

static_assert(Utf8Joiner::incompleteTail("abc") == 0, "ASCII is complete");
static_assert(Utf8Joiner::incompleteTail("a\xC3") == 1, "Lead byte of a two-byte sequence");
static_assert(Utf8Joiner::incompleteTail("a\xC3\xA9") == 0, "Complete two-byte sequence");
static_assert(Utf8Joiner::incompleteTail("\xF0\x9F\x98") == 3, "Three of four bytes");
static_assert(Utf8Joiner::incompleteTail("\xE2\x82") == 2, "Two of three bytes");
static_assert(Utf8Joiner::incompleteTail("") == 0, "Empty chunk");

static_assert([]() constexpr {
    Utf8Joiner j;
    auto a = j(std::string("a\xC3"));
    if(a.kind() != StepKind::value || a.values()[0] != "a" || j.pending() != "\xC3") return false;
    auto b = j(std::string("\xA9" "b"));
    return b.kind() == StepKind::value && b.values()[0] == "\xC3\xA9" "b" && j.pending().empty();
}(), "Split code point is rejoined");

static_assert([]() constexpr {
    Utf8Joiner j;
    auto a = j(std::string("\xF0"));
    auto b = j(std::string("\x9F"));
    auto c = j(std::string("\x98"));
    auto d = j(std::string("\x80"));
    return a.kind() == StepKind::none
        && b.kind() == StepKind::none
        && c.kind() == StepKind::none
        && d.kind() == StepKind::value
        && d.values()[0] == "\xF0\x9F\x98\x80";
}(), "Four-byte code point one byte at a time");

static_assert([]() constexpr {
    Utf8Joiner j;
    (void)j(std::string("x\xE2\x82"));
    auto rest = j.flush();
    // an unfinished sequence at end of input goes through unchanged
    return rest.kind() == StepKind::value && rest.values()[0] == "\xE2\x82";
}(), "Flush releases the pending bytes");

static_assert([]() constexpr {
    Utf8Joiner j;
    return j.flush().kind() == StepKind::none;
}(), "Flush with nothing pending");

static_assert([]() constexpr {
    auto r = TokenizeSplit("\"\xC3\xA9\"", 2);
    return r && TokensAre(r.tokens, {
        {TokenKind::startString, ""},
        {TokenKind::stringFragment, "\xC3\xA9"},
        {TokenKind::endString, ""},
        {TokenKind::stringValue, "\xC3\xA9"},
    });
}(), "Tokenizer never sees half a code point");
