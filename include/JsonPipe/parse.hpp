#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "assembler.hpp"
#include "cursor.hpp"
#include "errors.hpp"
#include "filter.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include "source.hpp"
#include "streamers.hpp"
#include "tokenizer.hpp"
#include "utf8.hpp"
#include "value.hpp"

namespace JsonPipe {

/// Chunks in, tokens out.
constexpr auto MakeParser(TokenizerOptions opts = {}) {
    return pipeline::gen(Utf8Joiner{}, Tokenizer(opts));
}

using ParserPipeline = decltype(MakeParser());

/// The assembler builds values from packed tokens only, so packing is forced
/// on wherever a value is assembled. Fragment streaming is left as given.
constexpr TokenizerOptions AssemblingOptions(TokenizerOptions opts) {
    opts.packValues(true);
    return opts;
}


class DocumentResult {
    Value   m_value;
    Failure m_failure;
public:
    DocumentResult() = default;
    DocumentResult(Value v): m_value(std::move(v)) {}
    DocumentResult(Failure f): m_failure(std::move(f)) {}

    operator bool() const {
        return static_cast<bool>(m_failure);
    }
    const Value & value() const {
        return m_value;
    }
    Value & value() {
        return m_value;
    }
    const Failure & failure() const {
        return m_failure;
    }
    StreamError error() const {
        return m_failure.error();
    }
};

class ValuesResult {
    std::vector<Value> m_values;
    Failure            m_failure;
public:
    ValuesResult() = default;
    ValuesResult(std::vector<Value> values): m_values(std::move(values)) {}
    ValuesResult(Failure f): m_failure(std::move(f)) {}

    operator bool() const {
        return static_cast<bool>(m_failure);
    }
    const std::vector<Value> & values() const {
        return m_values;
    }
    const Failure & failure() const {
        return m_failure;
    }
    StreamError error() const {
        return m_failure.error();
    }
};


/// Assembles the single top-level value of the source.
inline DocumentResult ParseDocument(std::unique_ptr<ChunkSource> source,
                                    AssemblerOptions assembler = {},
                                    TokenizerOptions tokenizer = {},
                                    CancellationToken token = {}) {
    tokenizer = AssemblingOptions(tokenizer);
    tokenizer.jsonStreaming = false;
    Cursor cursor(std::move(source), pipeline::gen(MakeParser(tokenizer), Assembler(std::move(assembler))),
                  std::move(token));
    auto value = cursor.next();
    // drain so trailing garbage is reported
    while(cursor.next()) {}
    if(!cursor.failure()) {
        return cursor.failure();
    }
    if(!value) {
        return Failure(StreamError::MALFORMED_INPUT);
    }
    return std::move(*value);
}

inline DocumentResult Parse(std::string_view json, AssemblerOptions assembler = {}) {
    return ParseDocument(std::make_unique<StringSource>(std::string(json)), std::move(assembler));
}

/// One value per subtree whose path matches `path`.
inline ValuesResult PickValues(std::unique_ptr<ChunkSource> source,
                               FilterOptions filter,
                               StreamerOptions streamer = {},
                               TokenizerOptions tokenizer = {},
                               CancellationToken token = {}) {
    tokenizer = AssemblingOptions(tokenizer);
    Cursor cursor(std::move(source),
                  pipeline::gen(MakeParser(tokenizer), Pick(std::move(filter)), StreamValues(std::move(streamer))),
                  std::move(token));
    std::vector<Value> values;
    while(auto item = cursor.next()) {
        values.push_back(std::move(item->value));
    }
    if(!cursor.failure()) {
        return cursor.failure();
    }
    return values;
}

inline ValuesResult PickValues(std::unique_ptr<ChunkSource> source, std::string path) {
    FilterOptions filter;
    filter.filter = std::move(path);
    return PickValues(std::move(source), std::move(filter));
}

} // namespace JsonPipe
