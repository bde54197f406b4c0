#pragma once

#include <charconv>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "path.hpp"
#include "pipeline.hpp"
#include "token.hpp"
#include "value.hpp"

namespace JsonPipe {

/// Called with the member key (or the decimal array index, or "" for the
/// root) and the completed value. Returning std::nullopt drops the member.
using Reviver = std::function<std::optional<Value>(std::string_view key, Value value)>;

struct AssemblerOptions {
    Reviver reviver;
    // Keep numbers as their literal text instead of converting to double
    bool numberAsString = false;
};

/// Builds Values from a token stream. Only packed tokens are consumed
/// (keyValue, stringValue, numberValue), fragment tokens are ignored.
/// After a top-level value is complete done() is true and the next value
/// token starts a new one.
class Assembler {
public:
    using input_type  = Token;
    using output_type = Value;

    explicit Assembler(AssemblerOptions opts = {}): m_opts(std::move(opts)) {}

    /// Returns false for token kinds the assembler does not handle.
    bool consume(const Token & t) {
        if(!m_failure) {
            return true;
        }
        switch(t.kind) {
        case TokenKind::keyValue:
            m_key = t.value;
            return true;
        case TokenKind::stringValue:
            saveValue(Value(t.value));
            return true;
        case TokenKind::numberValue:
            if(m_opts.numberAsString) {
                saveValue(Value(t.value));
            } else {
                saveValue(Value(ParseNumber(t.value)));
            }
            return true;
        case TokenKind::nullValue:
            saveValue(Value(nullptr));
            return true;
        case TokenKind::trueValue:
            saveValue(Value(true));
            return true;
        case TokenKind::falseValue:
            saveValue(Value(false));
            return true;
        case TokenKind::startObject:
            startContainer(Value(Object{}));
            return true;
        case TokenKind::startArray:
            startContainer(Value(Array{}));
            return true;
        case TokenKind::endObject:
            endContainer(ValueType::object);
            return true;
        case TokenKind::endArray:
            endContainer(ValueType::array);
            return true;
        default:
            return false;
        }
    }

    /// Pipeline stage form: emits each completed top-level value.
    pipeline::Step<Value> operator()(Token t) {
        const bool handled = consume(t);
        if(!m_failure) {
            return pipeline::Step<Value>::fail(m_failure);
        }
        if(handled && m_done && m_hasValue) {
            return pipeline::Step<Value>::value(take());
        }
        return pipeline::Step<Value>::none();
    }

    bool done() const {
        return m_done;
    }

    // Open containers, counting the one currently being filled
    std::size_t depth() const {
        return m_stack.size() + (m_done ? 0 : 1);
    }

    /// Where the value under construction will land.
    path::PathStack path() const {
        path::PathStack p;
        for(const Frame & f : m_stack) {
            if(f.key) {
                p.push_back(path::PathElement::member(*f.key));
            } else if(f.container.is_array()) {
                p.push_back(path::PathElement::index(f.count));
            } else {
                p.push_back(path::PathElement::object());
            }
        }
        return p;
    }

    /// Abandons everything nested deeper than `level`.
    Assembler & dropToLevel(std::size_t level) {
        if(level >= depth()) {
            return *this;
        }
        if(level > 0) {
            const std::size_t index = level - 1;
            m_current = std::move(m_stack[index].container);
            m_key = std::move(m_stack[index].key);
            // the abandoned element still takes up its index
            m_count = m_stack[index].count + 1;
            m_stack.resize(index);
        } else {
            m_stack.clear();
            m_current = Value();
            m_key.reset();
            m_count = 0;
            m_done = true;
            m_hasValue = false;
        }
        return *this;
    }

    const Value & current() const {
        return m_current;
    }
    Value & current() {
        return m_current;
    }
    const std::optional<std::string> & key() const {
        return m_key;
    }

    /// Moves the current value out.
    Value take() {
        m_hasValue = false;
        return std::exchange(m_current, Value());
    }

    const Failure & failure() const {
        return m_failure;
    }

    // Literal JSON number text to double. Out-of-range magnitudes become
    // +-infinity or zero.
    static double ParseNumber(std::string_view text) {
        double d = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
        if(ec == std::errc::result_out_of_range) {
            const bool negative = !text.empty() && text.front() == '-';
            const auto e = text.find_first_of("eE");
            const bool tiny = e != std::string_view::npos && e + 1 < text.size() && text[e + 1] == '-';
            if(tiny) {
                return negative ? -0.0 : 0.0;
            }
            return negative ? -std::numeric_limits<double>::infinity()
                            : std::numeric_limits<double>::infinity();
        }
        return d;
    }

private:
    struct Frame {
        Value container;
        std::optional<std::string> key;
        std::size_t count = 0;
    };

    AssemblerOptions           m_opts;
    std::vector<Frame>         m_stack;
    Value                      m_current;
    std::optional<std::string> m_key;
    // Elements seen so far in the array being filled, dropped ones included
    std::size_t                m_count = 0;
    bool                       m_done = true;
    bool                       m_hasValue = false;
    Failure                    m_failure;

    void startContainer(Value empty) {
        if(m_done) {
            m_done = false;
        } else {
            m_stack.push_back(Frame{std::move(m_current), std::move(m_key), m_count});
        }
        m_current = std::move(empty);
        m_key.reset();
        m_count = 0;
    }

    void endContainer(ValueType closing) {
        if(m_done || m_current.type() != closing) {
            m_failure = Failure(StreamError::MISMATCHED_CLOSE,
                                std::string(closing == ValueType::object ? "}" : "]"));
            return;
        }
        if(m_stack.empty()) {
            m_done = true;
            m_hasValue = true;
            if(m_opts.reviver) {
                m_current = revive("", std::move(m_current)).value_or(Value());
            }
            return;
        }
        Value v = std::move(m_current);
        m_current = std::move(m_stack.back().container);
        m_key = std::move(m_stack.back().key);
        m_count = m_stack.back().count;
        m_stack.pop_back();
        saveValue(std::move(v));
    }

    void saveValue(Value v) {
        if(m_done) {
            m_hasValue = true;
            if(m_opts.reviver) {
                m_current = revive("", std::move(v)).value_or(Value());
            } else {
                m_current = std::move(v);
            }
            return;
        }
        if(m_current.is_array()) {
            Array & a = m_current.as_array();
            const std::size_t index = m_count++;
            if(m_opts.reviver) {
                if(auto r = revive(std::to_string(index), std::move(v))) {
                    a.push_back(std::move(*r));
                }
            } else {
                a.push_back(std::move(v));
            }
            return;
        }
        std::string key = m_key.value_or(std::string());
        m_key.reset();
        if(m_opts.reviver) {
            if(auto r = revive(key, std::move(v))) {
                m_current.as_object().set(std::move(key), std::move(*r));
            }
        } else {
            m_current.as_object().set(std::move(key), std::move(v));
        }
    }

    std::optional<Value> revive(std::string_view key, Value v) {
        return m_opts.reviver(key, std::move(v));
    }
};

} // namespace JsonPipe
