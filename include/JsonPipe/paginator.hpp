#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cursor.hpp"
#include "errors.hpp"
#include "filter.hpp"
#include "log.hpp"
#include "parse.hpp"
#include "source.hpp"
#include "streamers.hpp"
#include "value.hpp"

namespace JsonPipe {

using SourceFactory = std::function<std::unique_ptr<ChunkSource>()>;

struct PaginatorOptions {
    std::size_t pageSize = 20;
    // Path of the array inside the document; empty means the document is the array
    std::string dataPath;
    // Applied to each element after transform; false drops it
    std::function<bool(const Value &)> filter;
    std::function<Value(Value)> transform;

    StreamerOptions  streamer;
    TokenizerOptions tokenizer;
};

struct Page {
    std::vector<Value> items;
    bool hasMore = false;
};

class PageResult {
    Page    m_page;
    Failure m_failure;
public:
    PageResult() = default;
    PageResult(Page p): m_page(std::move(p)) {}
    PageResult(Failure f): m_failure(std::move(f)) {}

    operator bool() const {
        return static_cast<bool>(m_failure);
    }
    const Page & page() const {
        return m_page;
    }
    const Failure & failure() const {
        return m_failure;
    }
    StreamError error() const {
        return m_failure.error();
    }
};


/// Serves the elements of a (possibly nested) top-level array a page at a
/// time. page(0) starts over from a fresh source; any other page number
/// continues where the previous page stopped. Elements are assembled one at
/// a time and one element is read ahead to tell whether more exist.
/// Each run started by page(0) has its own cancellation token; cancelling it
/// ends that run only.
class Paginator {
    using ArrayPipeline = pipeline::Pipeline<ParserPipeline, Filter, Streamer>;

public:
    Paginator(SourceFactory factory, PaginatorOptions opts = {})
        : m_factory(std::move(factory)), m_opts(std::move(opts)) {
        if(m_opts.pageSize == 0) {
            m_opts.pageSize = 20;
        }
    }

    PageResult page(std::size_t n) {
        if(n == 0 || !m_cursor) {
            restart();
        }
        if(m_run.cancelled()) {
            m_cursor->cancel();
            m_lookahead.reset();
            LogDebug("page {} cancelled", n);
            return Failure(StreamError::CANCELLED);
        }
        LogDebug("page {} (size {})", n, m_opts.pageSize);

        Page page;
        while(page.items.size() < m_opts.pageSize) {
            std::optional<Value> v = nextAccepted();
            if(!v) {
                break;
            }
            page.items.push_back(std::move(*v));
        }
        if(page.items.size() == m_opts.pageSize) {
            m_lookahead = nextAccepted();
        }
        if(!m_cursor->failure()) {
            m_lookahead.reset();
            LogDebug("page {} failed: {}", n, error_to_string(m_cursor->failure().error()));
            return m_cursor->failure();
        }
        page.hasMore = m_lookahead.has_value();
        return page;
    }

    // Cancels the current run; the next page(0) starts a new one
    void cancel() {
        m_run.cancel();
    }

    // Token of the current run, for cancelling it from another thread
    CancellationToken cancellation() const {
        return m_run;
    }

    // True when the last page reported hasMore
    bool hasMore() const {
        return m_lookahead.has_value();
    }

    const Failure & failure() const {
        static const Failure none;
        return m_cursor ? m_cursor->failure() : none;
    }

private:
    SourceFactory    m_factory;
    PaginatorOptions m_opts;
    std::unique_ptr<Cursor<ArrayPipeline>> m_cursor;
    std::optional<Value> m_lookahead;
    CancellationToken    m_run;

    void restart() {
        m_lookahead.reset();
        m_run.cancel();
        m_cursor.reset();
        m_run = CancellationToken{};
        FilterOptions filter;
        if(!m_opts.dataPath.empty()) {
            filter.filter = m_opts.dataPath;
            filter.once = true;
            filter.requireMatch = true;
        }
        TokenizerOptions tokenizer = AssemblingOptions(m_opts.tokenizer);
        tokenizer.jsonStreaming = false;
        m_cursor = std::make_unique<Cursor<ArrayPipeline>>(
            m_factory(),
            pipeline::gen(MakeParser(tokenizer), Pick(std::move(filter)), StreamArray(m_opts.streamer)),
            m_run);
    }

    std::optional<Value> nextAccepted() {
        if(m_lookahead) {
            std::optional<Value> v = std::move(m_lookahead);
            m_lookahead.reset();
            return v;
        }
        while(auto item = m_cursor->next()) {
            Value v = std::move(item->value);
            if(m_opts.transform) {
                v = m_opts.transform(std::move(v));
            }
            if(m_opts.filter && !m_opts.filter(v)) {
                continue;
            }
            return v;
        }
        return std::nullopt;
    }
};

} // namespace JsonPipe
