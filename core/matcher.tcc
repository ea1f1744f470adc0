#pragma once

template<typename T, typename R>
Matcher<T, R>::Matcher(const T &subject, bool short_circuit, const Handler &error_handler) :

    m_subject(subject),
    m_short_circuit(short_circuit),
    m_error_handler(error_handler),
    m_error_policy(SwallowErrors),
    m_output(default_output()),
    m_matched(false),
    m_defaulted(false) {
}

template<typename T, typename R>
Matcher<T, R>::Matcher(const T &subject, const Options &options) :

    m_subject(subject),
    m_short_circuit(options.short_circuit),
    m_error_handler(options.error_handler),
    m_error_policy(options.error_policy),
    m_output(options.output),
    m_matched(false),
    m_defaulted(false) {
}

template<typename T, typename R>
void Matcher<T, R>::message(const char *tag, std::string &&text) const {
    if (m_output) {
        m_output->write("Matcher", tag, std::move(text));
    }
}

template<typename T, typename R>
void Matcher<T, R>::append(
    MatchLogKind kind,
    const std::string &label,
    optional<R> &&result,
    const std::exception_ptr &error) {

    m_log.emplace_back(
        m_log.size(),
        kind,
        std::chrono::system_clock::now(),
        label,
        m_subject,
        std::move(result),
        error);

#if FLUENTMATCH_DEBUG_LOG
    message("log", m_log.back().debugform());
#endif
}

template<typename T, typename R>
void Matcher<T, R>::record(MatchLogKind kind, const std::string &label, R &&value) {
    m_result = value;
    m_all_results.push_back(value);
    append(kind, label, optional<R>(std::move(value)), std::exception_ptr());
}

template<typename T, typename R>
bool Matcher<T, R>::handle(const std::exception_ptr &error, const Handler &handler) const {
    if (handler && handler(error, m_subject)) {
        return true;
    }
    if (m_error_handler && m_error_handler(error, m_subject)) {
        return true;
    }
    return false;
}

template<typename T, typename R>
void Matcher<T, R>::fail(const std::exception_ptr &error, const std::string &label, const Handler &handler) {
    bool handled;

    try {
        handled = handle(error, handler);
    } catch (...) {
        // a handler that throws aborts the chain, but the clause's
        // error still gets its entry.
        append(FailedEntry, label, optional<R>(), error);
        throw;
    }

    append(FailedEntry, label, optional<R>(), error);

    if (!handled) {
        if (m_error_policy == RethrowErrors) {
            message("rethrow", label + ": " + describe_exception(error));
            std::rethrow_exception(error);
        } else {
            message("unhandled", label + ": " + describe_exception(error));
        }
    }
}

template<typename T, typename R>
template<typename F>
void Matcher<T, R>::run(const F &f, const std::string &label, std::true_type) {
    f();
    m_matched = true;
    append(MatchedEntry, label, optional<R>(), std::exception_ptr());
}

template<typename T, typename R>
template<typename F>
void Matcher<T, R>::run(const F &f, const std::string &label, std::false_type) {
    R value = f();
    record(MatchedEntry, label, std::move(value));
    m_matched = true;
}

template<typename T, typename R>
template<typename Predicate, typename F>
Matcher<T, R> &Matcher<T, R>::evaluate(
    const Predicate &predicate,
    const F &f,
    const std::string &label,
    const Handler &handler) {

    if (skip()) {
        return *this;
    }

    try {
        if (predicate(m_subject)) {
            run(f, label);
        }
    } catch (...) {
        fail(std::current_exception(), label, handler);
    }

    return *this;
}

template<typename T, typename R>
template<typename Extract, typename F>
Matcher<T, R> &Matcher<T, R>::evaluate_extract(
    const Extract &extract,
    const F &f,
    const std::string &label,
    const Handler &handler) {

    if (skip()) {
        return *this;
    }

    try {
        const auto extracted = extract(m_subject);
        if (extracted) {
            run([&f, &extracted] () {
                return f(*extracted);
            }, label);
        }
    } catch (...) {
        fail(std::current_exception(), label, handler);
    }

    return *this;
}

template<typename T, typename R>
std::future<Matcher<T, R>&> Matcher<T, R>::ready() {
    std::promise<Matcher&> promise;
    promise.set_value(*this);
    return promise.get_future();
}

template<typename T, typename R>
template<typename Test, typename Start>
std::future<Matcher<T, R>&> Matcher<T, R>::evaluate_async(
    const Test &test,
    const Start &start,
    const std::string &label,
    const Handler &handler) {

    if (skip()) {
        return ready();
    }

    try {
        if (test(m_subject)) {
            return complete(start(), label, handler);
        }
    } catch (...) {
        fail(std::current_exception(), label, handler);
    }

    return ready();
}

template<typename T, typename R>
template<typename U>
std::future<Matcher<T, R>&> Matcher<T, R>::complete(
    std::future<U> &&pending,
    const std::string &label,
    const Handler &handler) {

    Matcher * const self = this;

    return std::async(std::launch::deferred, [self, label, handler] (std::future<U> body) -> Matcher& {
        self->finish(body, label, handler);
        return *self;
    }, std::move(pending));
}

template<typename T, typename R>
template<typename U>
void Matcher<T, R>::finish(std::future<U> &pending, const std::string &label, const Handler &handler) {
    try {
        R value = pending.get();
        record(MatchedEntry, label, std::move(value));
        m_matched = true;
    } catch (...) {
        fail(std::current_exception(), label, handler);
    }
}

template<typename T, typename R>
void Matcher<T, R>::finish(std::future<void> &pending, const std::string &label, const Handler &handler) {
    try {
        pending.get();
        m_matched = true;
        append(MatchedEntry, label, optional<R>(), std::exception_ptr());
    } catch (...) {
        fail(std::current_exception(), label, handler);
    }
}

template<typename T, typename R>
template<typename F>
optional<R> Matcher<T, R>::run_default(const F &f, const std::string &label, std::false_type) {
    if (!m_matched && !m_defaulted) {
        R value = f();
        m_defaulted = true;
        record(DefaultEntry, label, std::move(value));
    }
    return m_result;
}

template<typename T, typename R>
template<typename F>
void Matcher<T, R>::run_default(const F &f, const std::string &label, std::true_type) {
    if (!m_matched && !m_defaulted) {
        f();
        m_defaulted = true;
        append(DefaultEntry, label, optional<R>(), std::exception_ptr());
    }
}

template<typename T, typename R>
template<typename F, typename U>
std::future<optional<R>> Matcher<T, R>::run_default_async(
    const F &f, const std::string &label, std::future<U>*) {

    if (m_matched || m_defaulted) {
        std::promise<optional<R>> promise;
        promise.set_value(m_result);
        return promise.get_future();
    }

    Matcher * const self = this;

    return std::async(std::launch::deferred, [self, label] (std::future<U> body) -> optional<R> {
        R value = body.get();
        self->m_defaulted = true;
        self->record(DefaultEntry, label, std::move(value));
        return self->m_result;
    }, f());
}

template<typename T, typename R>
template<typename F>
std::future<void> Matcher<T, R>::run_default_async(
    const F &f, const std::string &label, std::future<void>*) {

    if (m_matched || m_defaulted) {
        std::promise<void> promise;
        promise.set_value();
        return promise.get_future();
    }

    Matcher * const self = this;

    return std::async(std::launch::deferred, [self, label] (std::future<void> body) {
        body.get();
        self->m_defaulted = true;
        self->append(DefaultEntry, label, optional<R>(), std::exception_ptr());
    }, f());
}
