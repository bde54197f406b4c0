#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "path.hpp"
#include "pipeline.hpp"
#include "token.hpp"

namespace JsonPipe {

using path::PathElement;
using path::PathStack;

using PathPredicate = std::function<bool(const PathStack &, const Token &)>;

/// `filter` selects subtrees by their path: a literal path (the path itself
/// or anything below it), a regular expression matched against the joined
/// path, or a predicate. Without a filter every value matches.
struct FilterOptions {
    std::variant<std::monostate, std::string, std::regex, PathPredicate> filter;
    std::string pathSeparator = ".";
    // Stop filtering after the first decision
    bool once = false;
    // Fail with PATH_NOT_FOUND at end of input if nothing was picked
    bool requireMatch = false;
};

enum class FilterMode {
    pick,   // keep matching subtrees only
    ignore  // drop matching subtrees, keep everything else
};

/// Token stream filter. Tracks the path of every token and either keeps
/// (Pick) or removes (Ignore) whole subtrees whose path matches.
class Filter {
public:
    using input_type  = Token;
    using output_type = Token;

    Filter(FilterMode mode, FilterOptions opts)
        : m_mode(mode), m_once(opts.once), m_requireMatch(opts.requireMatch),
          m_predicate(makePredicate(std::move(opts))) {}

    pipeline::Step<Token> operator()(Token chunk) {
        std::vector<Token> out;

        // the packed value that may follow an accepted/rejected string, number or key
        if(m_optionalToken) {
            if(*m_optionalToken == chunk.kind) {
                m_optionalToken.reset();
                switch(m_state) {
                case State::process_key:
                    m_stack.back().set_key(chunk.value);
                    if(m_mode == FilterMode::ignore) {
                        m_keyTokens.push_back(std::move(chunk));
                    }
                    m_state = State::check;
                    break;
                case State::accept_value:
                    out.push_back(std::move(chunk));
                    m_state = m_once ? State::pass : State::check;
                    break;
                default:
                    m_state = m_once ? State::all : State::check;
                    break;
                }
                return pipeline::Step<Token>::many(std::move(out));
            }
            m_optionalToken.reset();
            switch(m_state) {
            case State::accept_value: m_state = m_once ? State::pass : State::check; break;
            case State::reject_value: m_state = m_once ? State::all : State::check; break;
            default:                  m_state = State::check; break;
            }
        }

        if(m_state != State::check) {
            return dispatch(std::move(chunk), out);
        }

        // update the last index in the stack
        if(!m_stack.empty() && m_stack.back().is_array()) {
            switch(chunk.kind) {
            case TokenKind::startObject:
            case TokenKind::startArray:
            case TokenKind::startString:
            case TokenKind::startNumber:
            case TokenKind::nullValue:
            case TokenKind::trueValue:
            case TokenKind::falseValue:
                m_stack.back().advance();
                break;
            case TokenKind::numberValue:
                if(m_previousToken != TokenKind::endNumber) m_stack.back().advance();
                break;
            case TokenKind::stringValue:
                if(m_previousToken != TokenKind::endString) m_stack.back().advance();
                break;
            default:
                break;
            }
        } else if(!m_stack.empty() && chunk.kind == TokenKind::keyValue) {
            m_stack.back().set_key(chunk.value);
        }
        m_previousToken = chunk.kind;

        if(!isCheckable(chunk.kind)) {
            if(chunk.kind == TokenKind::startKey) {
                m_state = State::process_key;
                return dispatch(std::move(chunk), out);
            }
            if(m_mode == FilterMode::ignore) {
                if(chunk.kind == TokenKind::keyValue) {
                    m_keyTokens.push_back(std::move(chunk));
                } else {
                    updateStack(chunk.kind);
                    out.push_back(std::move(chunk));
                }
                return pipeline::Step<Token>::many(std::move(out));
            }
            updateStack(chunk.kind);
            return pipeline::Step<Token>::none();
        }

        const bool match = m_predicate(m_stack, chunk);
        m_endToken = stopToken(chunk.kind);

        if(m_mode == FilterMode::pick) {
            if(!match) {
                updateStack(chunk.kind);
                return pipeline::Step<Token>::none();
            }
            m_matched = true;
            if(m_endToken) {
                m_state = optionalToken(*m_endToken) ? State::accept_value : State::accept;
                return dispatch(std::move(chunk), out);
            }
            out.push_back(std::move(chunk));
            if(m_once) {
                m_state = State::pass;
            }
            return pipeline::Step<Token>::many(std::move(out));
        }

        // ignore
        if(match) {
            m_keyTokens.clear();
            if(m_endToken) {
                m_state = optionalToken(*m_endToken) ? State::reject_value : State::reject;
                return dispatch(std::move(chunk), out);
            }
            if(m_once) {
                m_state = State::all;
            }
            return pipeline::Step<Token>::none();
        }
        flushKeys(out);
        if(m_endToken && optionalToken(*m_endToken)) {
            m_state = State::accept_value;
            return dispatch(std::move(chunk), out);
        }
        m_endToken.reset();
        updateStack(chunk.kind);
        out.push_back(std::move(chunk));
        return pipeline::Step<Token>::many(std::move(out));
    }

    pipeline::Step<Token> flush() {
        if(m_requireMatch && !m_matched) {
            return pipeline::Step<Token>::fail(Failure(StreamError::PATH_NOT_FOUND));
        }
        return pipeline::Step<Token>::none();
    }

    bool matched() const {
        return m_matched;
    }
    const PathStack & stack() const {
        return m_stack;
    }

private:
    enum class State {
        check,
        accept,
        reject,
        accept_value,
        reject_value,
        process_key,
        pass,
        all
    };

    FilterMode    m_mode;
    bool          m_once;
    bool          m_requireMatch;
    PathPredicate m_predicate;

    State     m_state = State::check;
    PathStack m_stack;
    std::size_t m_depth = 0;
    TokenKind m_previousToken = TokenKind::nullValue;
    std::optional<TokenKind> m_endToken;
    std::optional<TokenKind> m_optionalToken;
    std::vector<Token> m_keyTokens;
    bool      m_matched = false;

    pipeline::Step<Token> dispatch(Token chunk, std::vector<Token> & out) {
        switch(m_state) {
        case State::process_key:
            if(chunk.kind == TokenKind::endKey) {
                m_optionalToken = TokenKind::keyValue;
            }
            if(m_mode == FilterMode::ignore) {
                m_keyTokens.push_back(std::move(chunk));
            }
            break;
        case State::pass:
            break;
        case State::all:
            out.push_back(std::move(chunk));
            break;
        case State::accept:
        case State::reject: {
            switch(chunk.kind) {
            case TokenKind::startObject:
            case TokenKind::startArray:
                ++m_depth;
                break;
            case TokenKind::endObject:
            case TokenKind::endArray:
                --m_depth;
                break;
            default:
                break;
            }
            const bool accepting = m_state == State::accept;
            if(accepting) {
                out.push_back(std::move(chunk));
            }
            if(!m_depth) {
                m_endToken.reset();
                if(m_once) {
                    m_state = accepting ? State::pass : State::all;
                } else {
                    m_state = State::check;
                }
            }
            break;
        }
        case State::accept_value:
        case State::reject_value: {
            const bool accepting = m_state == State::accept_value;
            const TokenKind kind = chunk.kind;
            if(accepting) {
                out.push_back(std::move(chunk));
            }
            if(m_endToken && kind == *m_endToken) {
                m_optionalToken = optionalToken(kind);
                m_endToken.reset();
                if(!m_optionalToken) {
                    if(m_once) {
                        m_state = accepting ? State::pass : State::all;
                    } else {
                        m_state = State::check;
                    }
                }
            }
            break;
        }
        case State::check:
            break;
        }
        return pipeline::Step<Token>::many(std::move(out));
    }

    void updateStack(TokenKind kind) {
        switch(kind) {
        case TokenKind::startObject:
            m_stack.push_back(PathElement::object());
            break;
        case TokenKind::startArray:
            m_stack.push_back(PathElement::array());
            break;
        case TokenKind::endObject:
        case TokenKind::endArray:
            if(!m_stack.empty()) {
                m_stack.pop_back();
            }
            break;
        default:
            break;
        }
    }

    void flushKeys(std::vector<Token> & out) {
        for(Token & k : m_keyTokens) {
            out.push_back(std::move(k));
        }
        m_keyTokens.clear();
    }

    static bool isCheckable(TokenKind k) {
        switch(k) {
        case TokenKind::startObject:
        case TokenKind::startArray:
        case TokenKind::startString:
        case TokenKind::startNumber:
        case TokenKind::nullValue:
        case TokenKind::trueValue:
        case TokenKind::falseValue:
        case TokenKind::stringValue:
        case TokenKind::numberValue:
            return true;
        default:
            return false;
        }
    }

    static std::optional<TokenKind> stopToken(TokenKind k) {
        switch(k) {
        case TokenKind::startObject: return TokenKind::endObject;
        case TokenKind::startArray:  return TokenKind::endArray;
        case TokenKind::startString: return TokenKind::endString;
        case TokenKind::startNumber: return TokenKind::endNumber;
        default:                     return std::nullopt;
        }
    }

    // Packed token that may follow a streamed value
    static std::optional<TokenKind> optionalToken(TokenKind end) {
        switch(end) {
        case TokenKind::endString: return TokenKind::stringValue;
        case TokenKind::endNumber: return TokenKind::numberValue;
        default:                   return std::nullopt;
        }
    }

    static PathPredicate makePredicate(FilterOptions opts) {
        const std::string separator = opts.pathSeparator.empty() ? std::string(".") : opts.pathSeparator;
        switch(opts.filter.index()) {
        case 1: {
            std::string target = std::get<std::string>(std::move(opts.filter));
            std::string prefix = target + separator;
            return [target, prefix, separator](const PathStack & stack, const Token &) {
                const std::string joined = path::JoinPath(stack, separator);
                return joined == target || joined.starts_with(prefix);
            };
        }
        case 2: {
            std::regex re = std::get<std::regex>(std::move(opts.filter));
            return [re, separator](const PathStack & stack, const Token &) {
                return std::regex_search(path::JoinPath(stack, separator), re);
            };
        }
        case 3:
            return std::get<PathPredicate>(std::move(opts.filter));
        default:
            return [](const PathStack &, const Token &) { return true; };
        }
    }
};

inline Filter Pick(FilterOptions opts = {}) {
    return Filter(FilterMode::pick, std::move(opts));
}

inline Filter Ignore(FilterOptions opts = {}) {
    return Filter(FilterMode::ignore, std::move(opts));
}

} // namespace JsonPipe
