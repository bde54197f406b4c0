#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include "token.hpp"

namespace JsonPipe {

namespace tokenizer {

enum class ParserState : std::uint8_t {
    value,
    value1,          // first element of an array, ']' allowed
    string,
    keyVal,
    key,
    key1,            // first key of an object, '}' allowed
    colon,
    arrayStop,
    objectStop,
    numberStart,
    numberDigit,
    numberFraction,
    numberFracStart,
    numberFracDigit,
    numberExponent,
    numberExpSign,
    numberExpStart,
    numberExpDigit,
    done
};

constexpr std::string_view parser_state_to_string(ParserState s) {
    switch(s) {
    case ParserState::value           : return "value"; break;
    case ParserState::value1          : return "value1"; break;
    case ParserState::string          : return "string"; break;
    case ParserState::keyVal          : return "keyVal"; break;
    case ParserState::key             : return "key"; break;
    case ParserState::key1            : return "key1"; break;
    case ParserState::colon           : return "colon"; break;
    case ParserState::arrayStop       : return "arrayStop"; break;
    case ParserState::objectStop      : return "objectStop"; break;
    case ParserState::numberStart     : return "numberStart"; break;
    case ParserState::numberDigit     : return "numberDigit"; break;
    case ParserState::numberFraction  : return "numberFraction"; break;
    case ParserState::numberFracStart : return "numberFracStart"; break;
    case ParserState::numberFracDigit : return "numberFracDigit"; break;
    case ParserState::numberExponent  : return "numberExponent"; break;
    case ParserState::numberExpSign   : return "numberExpSign"; break;
    case ParserState::numberExpStart  : return "numberExpStart"; break;
    case ParserState::numberExpDigit  : return "numberExpDigit"; break;
    case ParserState::done            : return "done"; break;
    }
    return "N/A";
}

enum class Parent : std::uint8_t {
    none,
    object,
    array
};


/// Incremental JSON lexer. Feed chunks with operator(), then flush() once at
/// end of input. Bytes that may still belong to an unfinished token stay in
/// the residue buffer until the next chunk arrives.
class Tokenizer {
public:
    using input_type  = std::string;
    using output_type = Token;

    constexpr explicit Tokenizer(TokenizerOptions opts = {})
        : m_opts(opts.normalized()),
          m_expect(m_opts.jsonStreaming ? ParserState::done : ParserState::value) {}

    constexpr pipeline::Step<Token> operator()(std::string chunk) {
        if(!m_failure) {
            return pipeline::Step<Token>::fail(m_failure);
        }
        if(m_done) {
            m_failure = Failure(StreamError::FLUSHED_PIPELINE);
            return pipeline::Step<Token>::fail(m_failure);
        }
        m_buffer += chunk;
        return run();
    }

    constexpr pipeline::Step<Token> flush() {
        if(!m_failure) {
            return pipeline::Step<Token>::fail(m_failure);
        }
        m_done = true;
        return run();
    }

    constexpr ParserState state() const {
        return m_expect;
    }
    constexpr std::size_t depth() const {
        return m_stack.size();
    }
    constexpr const Failure & failure() const {
        return m_failure;
    }
    constexpr const std::string & residue() const {
        return m_buffer;
    }
    // Absolute offset of the first residue byte
    constexpr std::size_t offset() const {
        return m_consumed;
    }

private:
    enum class EscapeStatus {
        ok,
        incomplete,
        invalid
    };

    TokenizerOptions    m_opts;
    ParserState         m_expect;
    Parent              m_parent = Parent::none;
    std::vector<Parent> m_stack;
    std::string         m_buffer;
    std::string         m_accumulator;
    std::size_t         m_consumed = 0;
    bool                m_openNumber = false;
    bool                m_done = false;
    Failure             m_failure;

    constexpr pipeline::Step<Token> run() {
        std::vector<Token> tokens;
        std::size_t index = 0;
        if(!scan(tokens, index)) {
            return pipeline::Step<Token>::fail(m_failure);
        }
        if(m_done && m_openNumber) {
            closeNumber(tokens);
        }
        m_consumed += index;
        m_buffer.erase(0, index);
        return pipeline::Step<Token>::many(std::move(tokens));
    }

    // Returns false on error; returns true when the buffer is exhausted or
    // the next token may still be extended by a later chunk.
    constexpr bool scan(std::vector<Token> & tokens, std::size_t & index) {
        const std::size_t size = m_buffer.size();
        for(;;) {
            switch(m_expect) {
            case ParserState::value:
            case ParserState::value1: {
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::EXPECTED_VALUE, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(isSpace(c)) {
                    index += spaceRun(index);
                    break;
                }
                switch(c) {
                case '"':
                    if(m_opts.streamStrings) {
                        tokens.push_back({TokenKind::startString, {}});
                    }
                    m_expect = ParserState::string;
                    ++index;
                    break;
                case '{':
                    tokens.push_back({TokenKind::startObject, {}});
                    pushParent(Parent::object);
                    m_expect = ParserState::key1;
                    ++index;
                    break;
                case '[':
                    tokens.push_back({TokenKind::startArray, {}});
                    pushParent(Parent::array);
                    m_expect = ParserState::value1;
                    ++index;
                    break;
                case ']':
                    if(m_expect != ParserState::value1) {
                        return setError(TokenizerError::UNEXPECTED_TOKEN, index);
                    }
                    tokens.push_back({TokenKind::endArray, {}});
                    popParent();
                    ++index;
                    break;
                case '-':
                    startNumber(tokens, c);
                    m_expect = ParserState::numberStart;
                    ++index;
                    break;
                case '0':
                    startNumber(tokens, c);
                    m_expect = ParserState::numberFraction;
                    ++index;
                    break;
                case '1': case '2': case '3': case '4': case '5':
                case '6': case '7': case '8': case '9':
                    startNumber(tokens, c);
                    m_expect = ParserState::numberDigit;
                    ++index;
                    break;
                case 't':
                case 'f':
                case 'n': {
                    const std::string_view lit = c == 't' ? "true" : (c == 'f' ? "false" : "null");
                    const std::size_t avail = size - index;
                    const std::size_t n = avail < lit.size() ? avail : lit.size();
                    if(std::string_view(m_buffer).substr(index, n) != lit.substr(0, n)) {
                        return setError(TokenizerError::EXPECTED_VALUE, index);
                    }
                    // "tru" or "true" at the end of the buffer may still become "truex"
                    if(avail <= lit.size() && !m_done) {
                        return true;
                    }
                    if(avail < lit.size()) {
                        return setError(TokenizerError::EXPECTED_VALUE, index);
                    }
                    if(avail > lit.size() && isWordChar(m_buffer[index + lit.size()])) {
                        return setError(TokenizerError::EXPECTED_VALUE, index);
                    }
                    tokens.push_back({c == 't' ? TokenKind::trueValue
                                               : (c == 'f' ? TokenKind::falseValue : TokenKind::nullValue), {}});
                    m_expect = afterValue();
                    index += lit.size();
                    break;
                }
                default:
                    return setError(TokenizerError::EXPECTED_VALUE, index);
                }
                break;
            }

            case ParserState::string:
            case ParserState::keyVal: {
                const bool isKey = m_expect == ParserState::keyVal;
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::UNTERMINATED_STRING, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(c == '"') {
                    if(isKey) {
                        if(m_opts.streamKeys) {
                            tokens.push_back({TokenKind::endKey, {}});
                        }
                        if(m_opts.packKeys) {
                            tokens.push_back({TokenKind::keyValue, std::move(m_accumulator)});
                            m_accumulator.clear();
                        }
                        m_expect = ParserState::colon;
                    } else {
                        if(m_opts.streamStrings) {
                            tokens.push_back({TokenKind::endString, {}});
                        }
                        if(m_opts.packStrings) {
                            tokens.push_back({TokenKind::stringValue, std::move(m_accumulator)});
                            m_accumulator.clear();
                        }
                        m_expect = afterValue();
                    }
                    ++index;
                    break;
                }
                if(c == '\\') {
                    std::string decoded;
                    std::size_t used = 0;
                    switch(decodeEscape(index, decoded, used)) {
                    case EscapeStatus::ok:
                        break;
                    case EscapeStatus::incomplete:
                        if(m_done) {
                            return setError(TokenizerError::ILLFORMED_ESCAPE, index);
                        }
                        return true;
                    case EscapeStatus::invalid:
                        return setError(TokenizerError::ILLFORMED_ESCAPE, index);
                    }
                    emitText(tokens, std::move(decoded), isKey);
                    index += used;
                    break;
                }
                // RFC 8259 section 7: control chars U+0000..U+001F must be escaped
                if(static_cast<unsigned char>(c) <= 0x1F) {
                    return setError(TokenizerError::ILLFORMED_STRING, index);
                }
                const std::size_t run = textRun(index);
                emitText(tokens, m_buffer.substr(index, run), isKey);
                index += run;
                break;
            }

            case ParserState::key:
            case ParserState::key1: {
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::EXPECTED_KEY, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(isSpace(c)) {
                    index += spaceRun(index);
                    break;
                }
                if(c == '"') {
                    if(m_opts.streamKeys) {
                        tokens.push_back({TokenKind::startKey, {}});
                    }
                    m_expect = ParserState::keyVal;
                    ++index;
                    break;
                }
                if(c == '}') {
                    if(m_expect != ParserState::key1) {
                        return setError(TokenizerError::UNEXPECTED_TOKEN, index);
                    }
                    tokens.push_back({TokenKind::endObject, {}});
                    popParent();
                    ++index;
                    break;
                }
                return setError(TokenizerError::EXPECTED_KEY, index);
            }

            case ParserState::colon: {
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::EXPECTED_COLON, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(isSpace(c)) {
                    index += spaceRun(index);
                    break;
                }
                if(c != ':') {
                    return setError(TokenizerError::EXPECTED_COLON, index);
                }
                m_expect = ParserState::value;
                ++index;
                break;
            }

            case ParserState::arrayStop:
            case ParserState::objectStop: {
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::EXPECTED_COMMA, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(isSpace(c)) {
                    if(m_openNumber) {
                        closeNumber(tokens);
                    }
                    index += spaceRun(index);
                    break;
                }
                const bool inArray = m_expect == ParserState::arrayStop;
                if(c == ',') {
                    if(m_openNumber) {
                        closeNumber(tokens);
                    }
                    m_expect = inArray ? ParserState::value : ParserState::key;
                    ++index;
                    break;
                }
                if(c == ']' || c == '}') {
                    if((c == ']') != inArray) {
                        return setError(TokenizerError::UNEXPECTED_TOKEN, index, StreamError::MISMATCHED_CLOSE);
                    }
                    if(m_openNumber) {
                        closeNumber(tokens);
                    }
                    tokens.push_back({inArray ? TokenKind::endArray : TokenKind::endObject, {}});
                    popParent();
                    ++index;
                    break;
                }
                return setError(TokenizerError::EXPECTED_COMMA, index);
            }

            case ParserState::numberStart:
            case ParserState::numberFracStart:
            case ParserState::numberExpStart: {
                const TokenizerError err = m_expect == ParserState::numberStart ? TokenizerError::EXPECTED_DIGIT
                                         : (m_expect == ParserState::numberFracStart ? TokenizerError::EXPECTED_FRACTION
                                                                                     : TokenizerError::EXPECTED_EXPONENT);
                if(index == size) {
                    if(m_done) {
                        return setError(err, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(!isDigit(c)) {
                    return setError(err, index);
                }
                appendNumber(tokens, std::string(1, c));
                ++index;
                if(m_expect == ParserState::numberStart) {
                    m_expect = c == '0' ? ParserState::numberFraction : ParserState::numberDigit;
                } else if(m_expect == ParserState::numberFracStart) {
                    m_expect = ParserState::numberFracDigit;
                } else {
                    m_expect = ParserState::numberExpDigit;
                }
                break;
            }

            case ParserState::numberDigit:
            case ParserState::numberFracDigit:
            case ParserState::numberExpDigit: {
                const std::size_t run = digitRun(index);
                if(run) {
                    appendNumber(tokens, m_buffer.substr(index, run));
                    index += run;
                    break;
                }
                if(index == size && !m_done) {
                    return true;
                }
                if(index < size && m_expect == ParserState::numberDigit) {
                    m_expect = ParserState::numberFraction;
                } else if(index < size && m_expect == ParserState::numberFracDigit) {
                    m_expect = ParserState::numberExponent;
                } else {
                    m_expect = afterValue();
                }
                break;
            }

            case ParserState::numberFraction:
            case ParserState::numberExponent: {
                if(index == size) {
                    if(!m_done) {
                        return true;
                    }
                    m_expect = afterValue();
                    break;
                }
                const char c = m_buffer[index];
                if(c == '.' && m_expect == ParserState::numberFraction) {
                    appendNumber(tokens, std::string(1, c));
                    m_expect = ParserState::numberFracStart;
                    ++index;
                } else if(c == 'e' || c == 'E') {
                    appendNumber(tokens, std::string(1, c));
                    m_expect = ParserState::numberExpSign;
                    ++index;
                } else {
                    m_expect = afterValue();
                }
                break;
            }

            case ParserState::numberExpSign: {
                if(index == size) {
                    if(m_done) {
                        return setError(TokenizerError::EXPECTED_EXPONENT, index);
                    }
                    return true;
                }
                const char c = m_buffer[index];
                if(c == '+' || c == '-') {
                    appendNumber(tokens, std::string(1, c));
                    ++index;
                }
                m_expect = ParserState::numberExpStart;
                break;
            }

            case ParserState::done: {
                if(index == size) {
                    return true;
                }
                const char c = m_buffer[index];
                if(isSpace(c)) {
                    if(m_openNumber) {
                        closeNumber(tokens);
                    }
                    index += spaceRun(index);
                    break;
                }
                if(!m_opts.jsonStreaming) {
                    return setError(TokenizerError::EXCESS_CHARACTERS, index);
                }
                if(m_openNumber) {
                    closeNumber(tokens);
                }
                m_expect = ParserState::value;
                break;
            }
            }
        }
    }

    constexpr bool setError(TokenizerError e, std::size_t index, StreamError se = StreamError::MALFORMED_INPUT) {
        m_failure = Failure(se, e, parser_state_to_string(m_expect),
                            m_buffer.substr(index, ErrorFragmentSize), m_consumed + index);
        return false;
    }

    constexpr ParserState afterValue() const {
        switch(m_parent) {
        case Parent::object: return ParserState::objectStop;
        case Parent::array:  return ParserState::arrayStop;
        case Parent::none:   return ParserState::done;
        }
        return ParserState::done;
    }

    constexpr void pushParent(Parent p) {
        m_stack.push_back(m_parent);
        m_parent = p;
    }

    constexpr void popParent() {
        m_parent = m_stack.back();
        m_stack.pop_back();
        m_expect = afterValue();
    }

    constexpr void emitText(std::vector<Token> & tokens, std::string text, bool isKey) {
        const bool packing = isKey ? m_opts.packKeys : m_opts.packStrings;
        const bool streaming = isKey ? m_opts.streamKeys : m_opts.streamStrings;
        if(packing) {
            m_accumulator += text;
        }
        if(streaming) {
            tokens.push_back({isKey ? TokenKind::keyFragment : TokenKind::stringFragment, std::move(text)});
        }
    }

    constexpr void startNumber(std::vector<Token> & tokens, char c) {
        m_openNumber = true;
        if(m_opts.streamNumbers) {
            tokens.push_back({TokenKind::startNumber, {}});
        }
        appendNumber(tokens, std::string(1, c));
    }

    constexpr void appendNumber(std::vector<Token> & tokens, std::string text) {
        if(m_opts.packNumbers) {
            m_accumulator += text;
        }
        if(m_opts.streamNumbers) {
            tokens.push_back({TokenKind::numberFragment, std::move(text)});
        }
    }

    constexpr void closeNumber(std::vector<Token> & tokens) {
        if(m_opts.streamNumbers) {
            tokens.push_back({TokenKind::endNumber, {}});
        }
        m_openNumber = false;
        if(m_opts.packNumbers) {
            tokens.push_back({TokenKind::numberValue, std::move(m_accumulator)});
            m_accumulator.clear();
        }
    }

    constexpr EscapeStatus decodeEscape(std::size_t index, std::string & out, std::size_t & used) const {
        const std::size_t avail = m_buffer.size() - index;
        if(avail < 2) {
            return EscapeStatus::incomplete;
        }
        char simple = 0;
        switch(m_buffer[index + 1]) {
        case '"':  simple = '"';  break;
        case '/':  simple = '/';  break;
        case '\\': simple = '\\'; break;
        case 'b':  simple = '\b'; break;
        case 'f':  simple = '\f'; break;
        case 'r':  simple = '\r'; break;
        case 'n':  simple = '\n'; break;
        case 't':  simple = '\t'; break;
        case 'u':  break;
        default:
            return EscapeStatus::invalid;
        }
        if(m_buffer[index + 1] != 'u') {
            out.push_back(simple);
            used = 2;
            return EscapeStatus::ok;
        }

        std::uint16_t u1 = 0;
        switch(readHex4(index + 2, u1)) {
        case EscapeStatus::ok:         break;
        case EscapeStatus::incomplete: return EscapeStatus::incomplete;
        default:                       return EscapeStatus::invalid;
        }

        // A surrogate without its other half decodes to U+FFFD
        constexpr std::uint32_t replacement = 0xFFFDu;
        std::uint32_t codepoint = u1;
        used = 6;
        if(u1 >= 0xD800u && u1 <= 0xDBFFu) {
            // High surrogate, a low one may follow as a second \uXXXX
            if(avail == 6) {
                if(!m_done) {
                    return EscapeStatus::incomplete;
                }
                codepoint = replacement;
            } else if(m_buffer[index + 6] != '\\') {
                codepoint = replacement;
            } else if(avail == 7) {
                return EscapeStatus::incomplete;
            } else if(m_buffer[index + 7] != 'u') {
                codepoint = replacement;
            } else {
                std::uint16_t u2 = 0;
                switch(readHex4(index + 8, u2)) {
                case EscapeStatus::ok:         break;
                case EscapeStatus::incomplete: return EscapeStatus::incomplete;
                default:                       return EscapeStatus::invalid;
                }
                if(u2 >= 0xDC00u && u2 <= 0xDFFFu) {
                    codepoint = 0x10000u
                                + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                                + (static_cast<std::uint32_t>(u2) - 0xDC00u);
                    used = 12;
                } else {
                    codepoint = replacement;
                }
            }
        } else if(u1 >= 0xDC00u && u1 <= 0xDFFFu) {
            codepoint = replacement;
        }

        if(codepoint <= 0x7Fu) {
            out.push_back(static_cast<char>(codepoint));
        } else if(codepoint <= 0x7FFu) {
            out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if(codepoint <= 0xFFFFu) {
            out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else { // up to 0x10FFFF
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
        return EscapeStatus::ok;
    }

    // Validates whatever part of the four hex digits is already buffered
    constexpr EscapeStatus readHex4(std::size_t index, std::uint16_t & out) const {
        out = 0;
        for(std::size_t i = 0; i < 4; ++i) {
            if(index + i >= m_buffer.size()) {
                return EscapeStatus::incomplete;
            }
            const char h = m_buffer[index + i];
            std::uint16_t v = 0;
            if(h >= '0' && h <= '9') {
                v = static_cast<std::uint16_t>(h - '0');
            } else if(h >= 'a' && h <= 'f') {
                v = static_cast<std::uint16_t>(h - 'a' + 10);
            } else if(h >= 'A' && h <= 'F') {
                v = static_cast<std::uint16_t>(h - 'A' + 10);
            } else {
                return EscapeStatus::invalid;
            }
            out = static_cast<std::uint16_t>((out << 4) | v);
        }
        return EscapeStatus::ok;
    }

    constexpr std::size_t spaceRun(std::size_t index) const {
        std::size_t n = 0;
        while(index + n < m_buffer.size() && n < MaxFragmentSize && isSpace(m_buffer[index + n])) {
            ++n;
        }
        return n;
    }

    constexpr std::size_t digitRun(std::size_t index) const {
        std::size_t n = 0;
        while(index + n < m_buffer.size() && n < MaxFragmentSize && isDigit(m_buffer[index + n])) {
            ++n;
        }
        return n;
    }

    // Plain string bytes up to the next quote, backslash or control char.
    // A run cut by the size cap never ends inside a UTF-8 sequence.
    constexpr std::size_t textRun(std::size_t index) const {
        std::size_t n = 0;
        while(index + n < m_buffer.size() && n < MaxFragmentSize) {
            const unsigned char c = static_cast<unsigned char>(m_buffer[index + n]);
            if(c == '"' || c == '\\' || c <= 0x1F) {
                break;
            }
            ++n;
        }
        if(n == MaxFragmentSize && index + n < m_buffer.size()) {
            std::size_t cut = n;
            while(cut > 0 && isContinuation(m_buffer[index + cut])) {
                --cut;
            }
            if(cut > 0) {
                n = cut;
            }
        }
        return n;
    }

    static constexpr bool isSpace(char a) {
        switch(a) {
        case 0x20:
        case 0x0A:
        case 0x0D:
        case 0x09:
            return true;
        }
        return false;
    }

    static constexpr bool isDigit(char a) {
        return a >= '0' && a <= '9';
    }

    static constexpr bool isWordChar(char a) {
        return isDigit(a) || (a >= 'a' && a <= 'z') || (a >= 'A' && a <= 'Z') || a == '_';
    }

    static constexpr bool isContinuation(char a) {
        return (static_cast<unsigned char>(a) & 0xC0) == 0x80;
    }
};

} // namespace tokenizer

using tokenizer::Tokenizer;

} // namespace JsonPipe
