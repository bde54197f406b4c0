#pragma once

#include <string>

#include <fmt/format.h>

#include "errors.hpp"

namespace JsonPipe {

/// One-line diagnostic, e.g.
/// "stream error 'MALFORMED_INPUT': EXPECTED_VALUE in state 'value' at offset 5: '...}...'"
inline std::string FailureToString(const Failure & f) {
    if(f) {
        return "no error";
    }
    std::string detail;
    if(f.tokenizerError() != TokenizerError::NO_ERROR) {
        detail = fmt::format(": {} in state '{}' at offset {}",
                             tokenizer_error_to_string(f.tokenizerError()), f.state(), f.offset());
    }
    std::string fragment;
    if(!f.fragment().empty()) {
        fragment = fmt::format(": '...{}...'", f.fragment());
    }
    return fmt::format("stream error '{}'{}{}", error_to_string(f.error()), detail, fragment);
}

} // namespace JsonPipe
