#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace JsonPipe {

enum class TokenKind : std::uint8_t {
    startObject,
    endObject,
    startArray,
    endArray,
    startKey,
    keyFragment,
    endKey,
    keyValue,
    startString,
    stringFragment,
    endString,
    stringValue,
    startNumber,
    numberFragment,
    endNumber,
    numberValue,
    trueValue,
    falseValue,
    nullValue
};

constexpr std::string_view token_kind_to_string(TokenKind k) {
    switch(k) {
    case TokenKind::startObject:    return "startObject";
    case TokenKind::endObject:      return "endObject";
    case TokenKind::startArray:     return "startArray";
    case TokenKind::endArray:       return "endArray";
    case TokenKind::startKey:       return "startKey";
    case TokenKind::keyFragment:    return "keyFragment";
    case TokenKind::endKey:         return "endKey";
    case TokenKind::keyValue:       return "keyValue";
    case TokenKind::startString:    return "startString";
    case TokenKind::stringFragment: return "stringFragment";
    case TokenKind::endString:      return "endString";
    case TokenKind::stringValue:    return "stringValue";
    case TokenKind::startNumber:    return "startNumber";
    case TokenKind::numberFragment: return "numberFragment";
    case TokenKind::endNumber:      return "endNumber";
    case TokenKind::numberValue:    return "numberValue";
    case TokenKind::trueValue:      return "trueValue";
    case TokenKind::falseValue:     return "falseValue";
    case TokenKind::nullValue:      return "nullValue";
    }
    return "N/A";
}

/// One lexical event. `value` holds the text fragment, the decoded key or
/// string, or the literal number text; it is empty for structural tokens and
/// for true/false/null.
struct Token {
    TokenKind   kind = TokenKind::nullValue;
    std::string value;

    constexpr bool operator==(const Token &) const = default;
};

constexpr bool is_fragment(TokenKind k) {
    return k == TokenKind::keyFragment
        || k == TokenKind::stringFragment
        || k == TokenKind::numberFragment;
}

} // namespace JsonPipe
