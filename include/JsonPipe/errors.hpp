#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace JsonPipe {


enum class StreamError {
    NO_ERROR,
    MALFORMED_INPUT,
    MISMATCHED_CLOSE,
    TOP_LEVEL_SHAPE,
    PATH_NOT_FOUND,
    SOURCE_ERROR,
    CANCELLED,
    FLUSHED_PIPELINE
};

constexpr std::string_view error_to_string(StreamError e) {
    switch(e) {
    case StreamError::NO_ERROR: return "NO_ERROR"; break;
    case StreamError::MALFORMED_INPUT: return "MALFORMED_INPUT"; break;
    case StreamError::MISMATCHED_CLOSE: return "MISMATCHED_CLOSE"; break;
    case StreamError::TOP_LEVEL_SHAPE: return "TOP_LEVEL_SHAPE"; break;
    case StreamError::PATH_NOT_FOUND: return "PATH_NOT_FOUND"; break;
    case StreamError::SOURCE_ERROR: return "SOURCE_ERROR"; break;
    case StreamError::CANCELLED: return "CANCELLED"; break;
    case StreamError::FLUSHED_PIPELINE: return "FLUSHED_PIPELINE"; break;
    }
    return "N/A";
}


// ============================================================================
// Tokenizer Errors
// ============================================================================

enum class TokenizerError {
    NO_ERROR,
    EXPECTED_VALUE,
    UNEXPECTED_TOKEN,
    EXPECTED_KEY,
    EXPECTED_COLON,
    EXPECTED_COMMA,
    UNTERMINATED_STRING,
    ILLFORMED_STRING,
    ILLFORMED_ESCAPE,
    EXPECTED_DIGIT,
    EXPECTED_FRACTION,
    EXPECTED_EXPONENT,
    EXCESS_CHARACTERS
};

constexpr std::string_view tokenizer_error_to_string(TokenizerError e) {
    switch(e) {
    case TokenizerError::NO_ERROR            : return "NO_ERROR"; break;
    case TokenizerError::EXPECTED_VALUE      : return "EXPECTED_VALUE"; break;
    case TokenizerError::UNEXPECTED_TOKEN    : return "UNEXPECTED_TOKEN"; break;
    case TokenizerError::EXPECTED_KEY        : return "EXPECTED_KEY"; break;
    case TokenizerError::EXPECTED_COLON      : return "EXPECTED_COLON"; break;
    case TokenizerError::EXPECTED_COMMA      : return "EXPECTED_COMMA"; break;
    case TokenizerError::UNTERMINATED_STRING : return "UNTERMINATED_STRING"; break;
    case TokenizerError::ILLFORMED_STRING    : return "ILLFORMED_STRING"; break;
    case TokenizerError::ILLFORMED_ESCAPE    : return "ILLFORMED_ESCAPE"; break;
    case TokenizerError::EXPECTED_DIGIT      : return "EXPECTED_DIGIT"; break;
    case TokenizerError::EXPECTED_FRACTION   : return "EXPECTED_FRACTION"; break;
    case TokenizerError::EXPECTED_EXPONENT   : return "EXPECTED_EXPONENT"; break;
    case TokenizerError::EXCESS_CHARACTERS   : return "EXCESS_CHARACTERS"; break;
    }
    return "N/A";
}

/// Everything known about why a stream stopped: the stream-level error, the
/// tokenizer detail (for MALFORMED_INPUT / MISMATCHED_CLOSE), the parser state
/// it was raised in, a bounded copy of the offending input and its offset.
struct Failure {
    StreamError      m_error          = StreamError::NO_ERROR;
    TokenizerError   m_tokenizerError = TokenizerError::NO_ERROR;
    std::string_view m_state;
    std::string      m_fragment;
    std::size_t      m_offset         = 0;

    constexpr Failure() = default;
    constexpr Failure(StreamError err, std::string fragment = {})
        : m_error(err), m_fragment(std::move(fragment)) {}
    constexpr Failure(StreamError err, TokenizerError terr, std::string_view state,
                      std::string fragment, std::size_t offset)
        : m_error(err), m_tokenizerError(terr), m_state(state),
          m_fragment(std::move(fragment)), m_offset(offset) {}

    constexpr operator bool() const {
        return m_error == StreamError::NO_ERROR;
    }
    constexpr StreamError error() const {
        return m_error;
    }
    constexpr TokenizerError tokenizerError() const {
        return m_tokenizerError;
    }
    constexpr std::string_view state() const {
        return m_state;
    }
    constexpr const std::string & fragment() const {
        return m_fragment;
    }
    constexpr std::size_t offset() const {
        return m_offset;
    }
};

} // namespace JsonPipe
