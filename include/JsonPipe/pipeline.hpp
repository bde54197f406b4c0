#pragma once

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace JsonPipe {

namespace pipeline {

enum class StepKind {
    none,   // nothing for this input
    value,  // exactly one output
    many,   // ordered fan-out, each value continues through the rest of the pipeline
    stop,   // controlled early exit, not an error
    fail    // abort with m_failure
};

/// What a stage produced for one input.
template<class T>
class Step {
    StepKind       m_kind = StepKind::none;
    std::vector<T> m_values;
    Failure        m_failure;

    constexpr explicit Step(StepKind k): m_kind(k) {}
public:
    using value_type = T;

    constexpr Step() = default;

    static constexpr Step none() {
        return Step(StepKind::none);
    }
    static constexpr Step value(T v) {
        Step s(StepKind::value);
        s.m_values.push_back(std::move(v));
        return s;
    }
    static constexpr Step many(std::vector<T> values) {
        if(values.empty()) {
            return none();
        }
        Step s(StepKind::many);
        s.m_values = std::move(values);
        return s;
    }
    static constexpr Step stop() {
        return Step(StepKind::stop);
    }
    static constexpr Step fail(Failure f) {
        Step s(StepKind::fail);
        s.m_failure = std::move(f);
        return s;
    }

    constexpr StepKind kind() const {
        return m_kind;
    }
    constexpr std::vector<T> & values() {
        return m_values;
    }
    constexpr const std::vector<T> & values() const {
        return m_values;
    }
    constexpr const Failure & failure() const {
        return m_failure;
    }
};


template<class S>
concept Stage = requires(S & s, typename S::input_type in) {
    typename S::output_type;
    { s(std::move(in)) } -> std::same_as<Step<typename S::output_type>>;
};

// A flushable stage gets one final call once its upstream is exhausted.
template<class S>
concept FlushableStage = Stage<S> && requires(S & s) {
    { s.flush() } -> std::same_as<Step<typename S::output_type>>;
};


template<class In, class Out, class Fn>
class FunctionStage {
protected:
    Fn m_fn;
public:
    using input_type  = In;
    using output_type = Out;

    constexpr explicit FunctionStage(Fn fn): m_fn(std::move(fn)) {}

    constexpr Step<Out> operator()(In in) {
        if constexpr (std::is_same_v<std::invoke_result_t<Fn &, In>, Step<Out>>) {
            return m_fn(std::move(in));
        } else {
            return Step<Out>::value(m_fn(std::move(in)));
        }
    }
};

template<class In, class Out, class Fn, class Final>
class FlushableFunctionStage : public FunctionStage<In, Out, Fn> {
    Final m_final;
public:
    constexpr FlushableFunctionStage(Fn fn, Final final)
        : FunctionStage<In, Out, Fn>(std::move(fn)), m_final(std::move(final)) {}

    constexpr Step<Out> flush() {
        return m_final();
    }
};

/// Wraps a callable returning either Out or Step<Out>.
template<class In, class Out = In, class Fn>
constexpr auto stage(Fn fn) {
    return FunctionStage<In, Out, Fn>(std::move(fn));
}

/// Same as stage(), plus a `final` callable invoked once at end of input.
template<class In, class Out = In, class Fn, class Final>
constexpr auto flushable(Fn fn, Final final) {
    return FlushableFunctionStage<In, Out, Fn, Final>(std::move(fn), std::move(final));
}

template<class T>
constexpr auto identity() {
    return stage<T, T>([](T v) { return v; });
}


enum class Outcome {
    ok,
    stopped,
    failed
};

namespace detail {

template<class A, class B>
constexpr bool connects() {
    return std::is_convertible_v<typename A::output_type, typename B::input_type>;
}

template<class First, class... Rest>
struct chain_traits {
    using first = First;
    using last  = typename chain_traits<Rest...>::last;
    static constexpr bool compatible = connects<First, typename chain_traits<Rest...>::first>()
                                       && chain_traits<Rest...>::compatible;
};

template<class Only>
struct chain_traits<Only> {
    using first = Only;
    using last  = Only;
    static constexpr bool compatible = true;
};

template<class Sink, class T>
constexpr bool deliver(Sink & sink, T && v) {
    if constexpr (std::is_same_v<std::invoke_result_t<Sink &, T &&>, void>) {
        sink(std::forward<T>(v));
        return true;
    } else {
        return static_cast<bool>(sink(std::forward<T>(v)));
    }
}

} // namespace detail


/// Stages composed into one. Every output of stage I is threaded through
/// stages I+1..N before stage I sees its next input, so nothing is batched
/// between stages. A Pipeline is itself a flushable Stage.
template<Stage... Stages>
class Pipeline {
    static_assert(sizeof...(Stages) > 0, "[[[ JsonPipe ]]] a pipeline needs at least one stage");
    static_assert(detail::chain_traits<Stages...>::compatible,
                  "[[[ JsonPipe ]]] output_type of each stage must convert to input_type of the next one");

    static constexpr std::size_t N = sizeof...(Stages);

    template<std::size_t I>
    using stage_t = std::tuple_element_t<I, std::tuple<Stages...>>;

    std::tuple<Stages...> m_stages;
    Failure m_failure;
    bool    m_flushed = false;
    bool    m_stopped = false;

public:
    using input_type  = typename detail::chain_traits<Stages...>::first::input_type;
    using output_type = typename detail::chain_traits<Stages...>::last::output_type;

    constexpr explicit Pipeline(Stages... stages): m_stages(std::move(stages)...) {}

    /// Pushes one input through every stage; `sink` receives each final
    /// output and may return false to stop the pipeline.
    template<class Sink>
    constexpr Outcome push(input_type in, Sink && sink) {
        if(m_stopped) {
            return Outcome::stopped;
        }
        if(m_flushed) {
            m_failure = Failure(StreamError::FLUSHED_PIPELINE);
            return Outcome::failed;
        }
        return settle(drive<0>(std::move(in), sink));
    }

    /// Signals end of input: flushable stages are flushed in pipeline order,
    /// each flush output continuing through the later stages.
    template<class Sink>
    constexpr Outcome finish(Sink && sink) {
        if(m_stopped) {
            return Outcome::stopped;
        }
        if(m_flushed) {
            m_failure = Failure(StreamError::FLUSHED_PIPELINE);
            return Outcome::failed;
        }
        m_flushed = true;
        return settle(flushFrom<0>(sink));
    }

    constexpr Step<output_type> operator()(input_type in) {
        std::vector<output_type> out;
        Outcome r = push(std::move(in), [&](output_type && v) { out.push_back(std::move(v)); });
        return collect(r, std::move(out));
    }

    constexpr Step<output_type> flush() {
        std::vector<output_type> out;
        Outcome r = finish([&](output_type && v) { out.push_back(std::move(v)); });
        return collect(r, std::move(out));
    }

    constexpr const Failure & failure() const {
        return m_failure;
    }
    constexpr bool flushed() const {
        return m_flushed;
    }

    template<std::size_t I>
    constexpr stage_t<I> & get() {
        return std::get<I>(m_stages);
    }

private:
    constexpr Outcome settle(Outcome r) {
        if(r == Outcome::stopped) {
            m_stopped = true;
        }
        return r;
    }

    constexpr Step<output_type> collect(Outcome r, std::vector<output_type> && out) {
        switch(r) {
        case Outcome::ok:      return Step<output_type>::many(std::move(out));
        case Outcome::stopped: return Step<output_type>::stop();
        case Outcome::failed:  return Step<output_type>::fail(m_failure);
        }
        return Step<output_type>::none();
    }

    template<std::size_t I, class Sink>
    constexpr Outcome drive(typename stage_t<I>::input_type in, Sink & sink) {
        return route<I + 1>(std::get<I>(m_stages)(std::move(in)), sink);
    }

    // Sends what stage I-1 produced into stage I (or the sink when I == N)
    template<std::size_t I, class T, class Sink>
    constexpr Outcome route(Step<T> step, Sink & sink) {
        switch(step.kind()) {
        case StepKind::none:
            return Outcome::ok;
        case StepKind::stop:
            return Outcome::stopped;
        case StepKind::fail:
            m_failure = step.failure();
            return Outcome::failed;
        case StepKind::value:
        case StepKind::many:
            for(auto & v : step.values()) {
                if constexpr (I == N) {
                    if(!detail::deliver(sink, std::move(v))) {
                        return Outcome::stopped;
                    }
                } else {
                    Outcome r = drive<I>(std::move(v), sink);
                    if(r != Outcome::ok) {
                        return r;
                    }
                }
            }
            return Outcome::ok;
        }
        return Outcome::ok;
    }

    template<std::size_t I, class Sink>
    constexpr Outcome flushFrom(Sink & sink) {
        if constexpr (I == N) {
            return Outcome::ok;
        } else {
            if constexpr (FlushableStage<stage_t<I>>) {
                Outcome r = route<I + 1>(std::get<I>(m_stages).flush(), sink);
                if(r != Outcome::ok) {
                    return r;
                }
            }
            return flushFrom<I + 1>(sink);
        }
    }
};


template<class... Stages>
constexpr auto gen(Stages... stages) {
    return Pipeline<Stages...>(std::move(stages)...);
}

} // namespace pipeline

} // namespace JsonPipe
