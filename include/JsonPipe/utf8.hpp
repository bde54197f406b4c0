#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "pipeline.hpp"

namespace JsonPipe {

/// Holds back an incomplete trailing UTF-8 sequence of each chunk and
/// prepends it to the next one. Whatever is still pending at end of input
/// is passed through unchanged.
class Utf8Joiner {
    std::string m_pending;
public:
    using input_type  = std::string;
    using output_type = std::string;

    constexpr pipeline::Step<std::string> operator()(std::string chunk) {
        if(!m_pending.empty()) {
            chunk.insert(0, m_pending);
            m_pending.clear();
        }
        const std::size_t keep = incompleteTail(chunk);
        if(keep) {
            m_pending.assign(chunk, chunk.size() - keep, keep);
            chunk.resize(chunk.size() - keep);
        }
        if(chunk.empty()) {
            return pipeline::Step<std::string>::none();
        }
        return pipeline::Step<std::string>::value(std::move(chunk));
    }

    constexpr pipeline::Step<std::string> flush() {
        if(m_pending.empty()) {
            return pipeline::Step<std::string>::none();
        }
        std::string rest = std::move(m_pending);
        m_pending.clear();
        return pipeline::Step<std::string>::value(std::move(rest));
    }

    constexpr const std::string & pending() const {
        return m_pending;
    }

    // Number of trailing bytes forming the start of a multi-byte sequence
    // that the chunk does not complete.
    static constexpr std::size_t incompleteTail(const std::string & s) {
        const std::size_t size = s.size();
        for(std::size_t back = 1; back <= 4 && back <= size; ++back) {
            const unsigned char c = static_cast<unsigned char>(s[size - back]);
            if((c & 0xC0) == 0x80) {
                continue;
            }
            std::size_t expected = 1;
            if((c & 0xE0) == 0xC0) {
                expected = 2;
            } else if((c & 0xF0) == 0xE0) {
                expected = 3;
            } else if((c & 0xF8) == 0xF0) {
                expected = 4;
            }
            return back < expected ? back : 0;
        }
        return 0;
    }
};

} // namespace JsonPipe
