#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "source.hpp"

namespace JsonPipe {

/// Pull side of a pipeline: next() reads chunks from the source only until
/// at least one output is available. After a failure or cancellation the
/// queued outputs are discarded and nothing more is produced.
template<pipeline::Stage PipelineT>
class Cursor {
public:
    using value_type = typename PipelineT::output_type;

    Cursor(std::unique_ptr<ChunkSource> source, PipelineT pipeline, CancellationToken token = {})
        : m_source(std::move(source)), m_pipeline(std::move(pipeline)), m_token(std::move(token)) {}

    Cursor(const Cursor &) = delete;
    Cursor & operator=(const Cursor &) = delete;

    ~Cursor() {
        closeSource();
    }

    /// The next output, or std::nullopt at the end of the stream (check
    /// failure() to tell a clean end from an error).
    std::optional<value_type> next() {
        for(;;) {
            if(m_token.cancelled()) {
                cancel();
                return std::nullopt;
            }
            if(!m_queue.empty()) {
                value_type v = std::move(m_queue.front());
                m_queue.pop_front();
                return v;
            }
            if(m_finished) {
                return std::nullopt;
            }
            pump();
        }
    }

    /// Stops the stream: closes the source and drops queued outputs.
    void cancel() {
        if(m_failure.error() == StreamError::CANCELLED) {
            return;
        }
        LogDebug("cursor cancelled after {} chunks", m_chunks);
        m_queue.clear();
        m_finished = true;
        m_failure = Failure(StreamError::CANCELLED);
        closeSource();
    }

    const Failure & failure() const {
        return m_failure;
    }

    // True once no further outputs can be produced
    bool exhausted() const {
        return m_finished && m_queue.empty();
    }

    std::size_t chunksRead() const {
        return m_chunks;
    }

    const CancellationToken & token() const {
        return m_token;
    }

private:
    std::unique_ptr<ChunkSource> m_source;
    PipelineT                    m_pipeline;
    CancellationToken            m_token;
    std::deque<value_type>       m_queue;
    Failure                      m_failure;
    bool                         m_finished = false;
    bool                         m_closed = false;
    std::size_t                  m_chunks = 0;

    void pump() {
        auto sink = [this](value_type && v) { m_queue.push_back(std::move(v)); };
        std::string chunk;
        pipeline::Outcome outcome = pipeline::Outcome::ok;
        switch(m_source->read(chunk)) {
        case SourceStatus::ok:
            ++m_chunks;
            LogTrace("chunk #{}: {}", m_chunks, ByteSizeToString(chunk.size()));
            outcome = m_pipeline.push(std::move(chunk), sink);
            break;
        case SourceStatus::eof:
            LogTrace("end of input after {} chunks", m_chunks);
            outcome = m_pipeline.finish(sink);
            m_finished = true;
            closeSource();
            break;
        case SourceStatus::error:
            m_failure = Failure(StreamError::SOURCE_ERROR, m_source->errorMessage());
            LogError("source error: {}", m_failure.fragment());
            m_queue.clear();
            m_finished = true;
            closeSource();
            return;
        }
        if(outcome == pipeline::Outcome::failed) {
            m_failure = m_pipeline.failure();
            LogDebug("stream failed: {} at offset {}", error_to_string(m_failure.error()), m_failure.offset());
            m_queue.clear();
            m_finished = true;
            closeSource();
        } else if(outcome == pipeline::Outcome::stopped) {
            m_finished = true;
            closeSource();
        }
    }

    void closeSource() {
        if(!m_closed && m_source) {
            m_source->close();
            m_closed = true;
        }
    }
};

} // namespace JsonPipe
