#pragma once

#include <future>

#include "matcher.h"

// continue an asynchronous chain from the pending step of a previous
// when_async(). nothing runs until the returned future is waited on;
// then the previous step completes first and the next clause after it.

template<typename T, typename R, typename Predicate, typename F>
inline std::future<Matcher<T, R>&> when_async(
    std::future<Matcher<T, R>&> &&pending,
    const Predicate &predicate,
    const F &f,
    const std::string &label = std::string(),
    const ErrorHandler<T> &handler = ErrorHandler<T>()) {

    return std::async(std::launch::deferred, [predicate, f, label, handler] (
        std::future<Matcher<T, R>&> previous) -> Matcher<T, R>& {

        return previous.get().when_async(predicate, f, label, handler).get();
    }, std::move(pending));
}

template<typename T, typename R, typename F>
inline auto otherwise_async(
    std::future<Matcher<T, R>&> &&pending,
    const F &f,
    const std::string &label = std::string()) {

    return std::async(std::launch::deferred, [f, label] (std::future<Matcher<T, R>&> previous) {
        return previous.get().otherwise_async(f, label).get();
    }, std::move(pending));
}

// builds a matcher for value and hands it to configure, which declares
// the clauses and returns the future of its last asynchronous step. the
// returned future yields the matcher once that step has completed.

template<typename R, typename T, typename Configure>
inline std::future<std::shared_ptr<Matcher<T, R>>> switch_async(
    const T &value,
    const Configure &configure,
    bool short_circuit = true,
    const ErrorHandler<T> &handler = ErrorHandler<T>()) {

    const auto matcher = std::make_shared<Matcher<T, R>>(value, short_circuit, handler);
    auto pending = configure(*matcher);

    return std::async(std::launch::deferred, [matcher] (decltype(pending) last) {
        last.get();
        return matcher;
    }, std::move(pending));
}
