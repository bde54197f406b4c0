#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "assembler.hpp"
#include "errors.hpp"
#include "pipeline.hpp"
#include "token.hpp"
#include "value.hpp"

namespace JsonPipe {

enum class Verdict {
    undecided,
    accept,
    reject
};

/// Inspects the element under construction (via the assembler's current
/// value, path and depth) and decides whether to keep it.
using ObjectFilter = std::function<Verdict(const Assembler &)>;

struct StreamerOptions {
    AssemblerOptions assembler;
    ObjectFilter     objectFilter;
    // Keep elements the objectFilter never decided on
    bool             includeUndecided = false;
};

struct Item {
    std::size_t index = 0;
    Value       value;

    bool operator==(const Item &) const = default;
};

namespace streamers_detail {

// Stands in for the assembler while a rejected element is skipped
class DepthCounter {
    std::size_t m_depth = 0;
public:
    DepthCounter() = default;
    explicit DepthCounter(std::size_t initial): m_depth(initial) {}

    bool consume(const Token & t) {
        switch(t.kind) {
        case TokenKind::startObject:
        case TokenKind::startArray:
            ++m_depth;
            return true;
        case TokenKind::endObject:
        case TokenKind::endArray:
            --m_depth;
            return true;
        default:
            return false;
        }
    }

    std::size_t depth() const {
        return m_depth;
    }
};

} // namespace streamers_detail

/// Emits one Item per completed value at `level`: the elements of a
/// top-level array (level 1) or each top-level value (level 0). Completed
/// elements are moved out of the assembler right away.
class Streamer {
public:
    using input_type  = Token;
    using output_type = Item;

    Streamer(std::size_t level, bool requireArray, StreamerOptions opts)
        : m_level(level), m_requireArray(requireArray),
          m_filter(std::move(opts.objectFilter)), m_includeUndecided(opts.includeUndecided),
          m_asm(std::move(opts.assembler)),
          m_state(requireArray ? State::first : State::check) {}

    pipeline::Step<Item> operator()(Token t) {
        switch(m_state) {
        case State::first:
            if(m_requireArray && t.kind != TokenKind::startArray) {
                return pipeline::Step<Item>::fail(
                    Failure(StreamError::TOP_LEVEL_SHAPE, std::string(token_kind_to_string(t.kind))));
            }
            m_state = State::check;
            m_asm.consume(t);
            return pipeline::Step<Item>::none();

        case State::check: {
            if(!m_asm.consume(t)) {
                return pipeline::Step<Item>::none();
            }
            if(!m_asm.failure()) {
                return pipeline::Step<Item>::fail(m_asm.failure());
            }
            const bool completed = m_asm.depth() == m_level;
            if(!m_filter) {
                return completed ? push(false) : pipeline::Step<Item>::none();
            }
            switch(m_filter(m_asm)) {
            case Verdict::accept:
                if(completed) {
                    return push(false);
                }
                m_state = State::accept;
                break;
            case Verdict::reject:
                if(completed) {
                    return push(true);
                }
                m_state = State::reject;
                m_counter = streamers_detail::DepthCounter(m_asm.depth());
                m_asm.dropToLevel(m_level);
                break;
            case Verdict::undecided:
                if(completed) {
                    return push(!m_includeUndecided);
                }
                break;
            }
            return pipeline::Step<Item>::none();
        }

        case State::accept:
            if(!m_asm.consume(t)) {
                return pipeline::Step<Item>::none();
            }
            if(!m_asm.failure()) {
                return pipeline::Step<Item>::fail(m_asm.failure());
            }
            if(m_asm.depth() == m_level) {
                m_state = State::check;
                return push(false);
            }
            return pipeline::Step<Item>::none();

        case State::reject:
            if(m_counter.consume(t) && m_counter.depth() == m_level) {
                m_state = State::check;
                return push(true);
            }
            return pipeline::Step<Item>::none();
        }
        return pipeline::Step<Item>::none();
    }

    const Assembler & assembler() const {
        return m_asm;
    }

    // Source elements seen so far, discarded ones included
    std::size_t index() const {
        return m_index;
    }

private:
    enum class State {
        first,
        check,
        accept,
        reject
    };

    std::size_t  m_level;
    bool         m_requireArray;
    ObjectFilter m_filter;
    bool         m_includeUndecided;
    Assembler    m_asm;
    State        m_state;
    streamers_detail::DepthCounter m_counter;
    std::size_t  m_index = 0;

    pipeline::Step<Item> push(bool discard) {
        const std::size_t index = m_index++;
        if(m_level == 0) {
            Value v = m_asm.take();
            if(discard) {
                return pipeline::Step<Item>::none();
            }
            return pipeline::Step<Item>::value(Item{index, std::move(v)});
        }
        Value & current = m_asm.current();
        if(!current.is_array() || current.as_array().empty()) {
            // the reviver dropped it, or it was already abandoned
            return pipeline::Step<Item>::none();
        }
        Array & a = current.as_array();
        Value v = std::move(a.back());
        a.pop_back();
        if(discard) {
            return pipeline::Step<Item>::none();
        }
        return pipeline::Step<Item>::value(Item{index, std::move(v)});
    }
};

inline Streamer StreamArray(StreamerOptions opts = {}) {
    return Streamer(1, true, std::move(opts));
}

inline Streamer StreamValues(StreamerOptions opts = {}) {
    return Streamer(0, false, std::move(opts));
}

} // namespace JsonPipe
