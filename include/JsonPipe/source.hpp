#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"

namespace JsonPipe {

enum class SourceStatus {
    ok,     // chunk holds the next bytes
    eof,    // no more input, chunk untouched
    error   // see ChunkSource::errorMessage()
};

/// Produces the input document as a sequence of byte chunks.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual SourceStatus read(std::string & chunk) = 0;

    // Releases the underlying resource; reads after close() return eof
    virtual void close() {}

    virtual std::string errorMessage() const {
        return {};
    }
};


/// Serves an in-memory document in fixed-size slices.
class StringSource : public ChunkSource {
    std::string m_data;
    std::size_t m_chunkSize;
    std::size_t m_pos = 0;
    bool        m_closed = false;
public:
    explicit StringSource(std::string data, std::size_t chunkSize = DefaultChunkSize)
        : m_data(std::move(data)), m_chunkSize(chunkSize ? chunkSize : DefaultChunkSize) {}

    SourceStatus read(std::string & chunk) override {
        if(m_closed || m_pos >= m_data.size()) {
            return SourceStatus::eof;
        }
        chunk.assign(m_data, m_pos, m_chunkSize);
        m_pos += chunk.size();
        return SourceStatus::ok;
    }

    void close() override {
        m_closed = true;
    }

    std::size_t position() const {
        return m_pos;
    }
};


/// Serves an explicit list of chunks, one per read.
class ChunkListSource : public ChunkSource {
    std::vector<std::string> m_chunks;
    std::size_t m_next = 0;
    bool        m_closed = false;
public:
    explicit ChunkListSource(std::vector<std::string> chunks): m_chunks(std::move(chunks)) {}

    SourceStatus read(std::string & chunk) override {
        if(m_closed || m_next >= m_chunks.size()) {
            return SourceStatus::eof;
        }
        chunk = m_chunks[m_next++];
        return SourceStatus::ok;
    }

    void close() override {
        m_closed = true;
    }

    // Chunks handed out so far
    std::size_t consumed() const {
        return m_next;
    }
    bool closed() const {
        return m_closed;
    }
};


/// Buffered reads from a file, or from stdin for "-".
class FileSource : public ChunkSource {
    std::string   m_path;
    std::size_t   m_chunkSize;
    std::ifstream m_file;
    std::istream *m_in = nullptr;
    std::string   m_error;
public:
    explicit FileSource(std::string path, std::size_t chunkSize = DefaultChunkSize)
        : m_path(std::move(path)), m_chunkSize(chunkSize ? chunkSize : DefaultChunkSize) {
        if(m_path == "-") {
            m_in = &std::cin;
            return;
        }
        m_file.open(m_path, std::ios::binary);
        if(!m_file) {
            m_error = "cannot open " + m_path;
            LogError("{}", m_error);
            return;
        }
        m_in = &m_file;
        LogDebug("opened {}", m_path);
    }

    SourceStatus read(std::string & chunk) override {
        if(!m_error.empty()) {
            return SourceStatus::error;
        }
        if(!m_in) {
            return SourceStatus::eof;
        }
        chunk.resize(m_chunkSize);
        m_in->read(chunk.data(), static_cast<std::streamsize>(m_chunkSize));
        const std::size_t got = static_cast<std::size_t>(m_in->gcount());
        chunk.resize(got);
        if(m_in->bad()) {
            m_error = "read failed on " + m_path;
            LogError("{}", m_error);
            return SourceStatus::error;
        }
        if(got == 0) {
            return SourceStatus::eof;
        }
        LogTrace("read {} from {}", ByteSizeToString(got), m_path);
        return SourceStatus::ok;
    }

    void close() override {
        if(m_file.is_open()) {
            m_file.close();
        }
        m_in = nullptr;
    }

    std::string errorMessage() const override {
        return m_error;
    }

    bool isOpen() const {
        return m_in != nullptr && m_error.empty();
    }
};


/// A source that fails on the first read; stands in for locations that
/// cannot be opened so the error surfaces through the normal path.
class FailedSource : public ChunkSource {
    std::string m_error;
public:
    explicit FailedSource(std::string error): m_error(std::move(error)) {}

    SourceStatus read(std::string &) override {
        return SourceStatus::error;
    }
    std::string errorMessage() const override {
        return m_error;
    }
};


namespace source_detail {

inline int HexValue(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline std::string PercentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for(std::size_t i = 0; i < s.size(); ++i) {
        if(s[i] == '%' && i + 2 < s.size()) {
            const int hi = HexValue(s[i + 1]);
            const int lo = HexValue(s[i + 2]);
            if(hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace source_detail

/// Resolves a location to a source: "-" is stdin, "file://" URLs are
/// percent-decoded to a path, anything else is a file path. Network URLs
/// are not fetched here; their bodies come in as a ChunkSource.
inline std::unique_ptr<ChunkSource> OpenSource(std::string_view location,
                                               std::size_t chunkSize = DefaultChunkSize) {
    constexpr std::string_view fileScheme = "file://";
    if(location.starts_with("http://") || location.starts_with("https://")) {
        LogError("network location {} must be supplied as a ChunkSource", location);
        return std::make_unique<FailedSource>("unsupported location " + std::string(location));
    }
    if(location.starts_with(fileScheme)) {
        std::string_view rest = location.substr(fileScheme.size());
        // file://localhost/path
        if(rest.starts_with("localhost/")) {
            rest.remove_prefix(std::string_view("localhost").size());
        }
        return std::make_unique<FileSource>(source_detail::PercentDecode(rest), chunkSize);
    }
    return std::make_unique<FileSource>(std::string(location), chunkSize);
}


/// Shared flag observed by cursors and paginators; copies refer to the
/// same flag.
class CancellationToken {
    std::shared_ptr<std::atomic<bool>> m_flag = std::make_shared<std::atomic<bool>>(false);
public:
    void cancel() {
        m_flag->store(true);
    }
    bool cancelled() const {
        return m_flag->load();
    }
};

} // namespace JsonPipe
