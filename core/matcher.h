#ifndef FLUENTMATCH_MATCHER_H
#define FLUENTMATCH_MATCHER_H

#include <future>

#include "types.h"
#include "output.h"
#include "log.h"
#include "narrow.h"
#include "typename.h"

template<typename T>
struct MatchOptions {
    bool short_circuit = true;
    ErrorHandler<T> error_handler;
    ErrorPolicy error_policy = SwallowErrors;
    OutputRef output = default_output();
};

// a Matcher evaluates clauses against one subject, strictly in the order
// they are declared. in short circuit mode (the default) the first clause
// that matches decides the result and all later clauses are skipped
// without being evaluated. otherwise every matching clause contributes to
// all_results().
//
// each evaluated clause that matches or fails appends one entry to log().
// an exception thrown by a clause's predicate or body is offered to the
// clause's handler, then to the matcher's handler; an error neither of
// them accepts is swallowed (SwallowErrors) or rethrown (RethrowErrors)
// after it has been logged.
//
// the futures returned by the asynchronous clauses refer to the matcher:
// each must be waited on before the next clause is declared and before
// the matcher goes away.

template<typename T, typename R>
class Matcher {
public:
    using Entry = MatchLogEntry<T, R>;
    using Handler = ErrorHandler<T>;
    using Options = MatchOptions<T>;

private:
    const T m_subject;
    const bool m_short_circuit;
    const Handler m_error_handler;
    const ErrorPolicy m_error_policy;
    const OutputRef m_output;

    bool m_matched;
    bool m_defaulted;
    optional<R> m_result;
    std::vector<R> m_all_results;
    std::vector<Entry> m_log;

    template<typename P>
    static inline std::string label_of(
        const std::string &label, const P &p, const char *fallback, std::true_type) {

        if (label.empty()) {
            return p.name();
        } else {
            return label;
        }
    }

    template<typename P>
    static inline std::string label_of(
        const std::string &label, const P &p, const char *fallback, std::false_type) {

        return coalesce(label, fallback);
    }

    template<typename P>
    static inline std::string label_of(const std::string &label, const P &p, const char *fallback) {
        return label_of(label, p, fallback, has_name<P>());
    }

    // a default also ends a short circuit chain.
    inline bool skip() const {
        return (m_matched || m_defaulted) && m_short_circuit;
    }

    void message(const char *tag, std::string &&text) const;

    void append(
        MatchLogKind kind,
        const std::string &label,
        optional<R> &&result,
        const std::exception_ptr &error);

    void record(MatchLogKind kind, const std::string &label, R &&value);

    bool handle(const std::exception_ptr &error, const Handler &handler) const;

    void fail(const std::exception_ptr &error, const std::string &label, const Handler &handler);

    template<typename F>
    void run(const F &f, const std::string &label, std::true_type);

    template<typename F>
    void run(const F &f, const std::string &label, std::false_type);

    template<typename F>
    inline void run(const F &f, const std::string &label) {
        run(f, label, std::is_void<decltype(f())>());
    }

    template<typename Predicate, typename F>
    Matcher &evaluate(
        const Predicate &predicate,
        const F &f,
        const std::string &label,
        const Handler &handler);

    template<typename Extract, typename F>
    Matcher &evaluate_extract(
        const Extract &extract,
        const F &f,
        const std::string &label,
        const Handler &handler);

    std::future<Matcher&> ready();

    template<typename Test, typename Start>
    std::future<Matcher&> evaluate_async(
        const Test &test,
        const Start &start,
        const std::string &label,
        const Handler &handler);

    template<typename U>
    std::future<Matcher&> complete(
        std::future<U> &&pending,
        const std::string &label,
        const Handler &handler);

    template<typename U>
    void finish(std::future<U> &pending, const std::string &label, const Handler &handler);

    void finish(std::future<void> &pending, const std::string &label, const Handler &handler);

    template<typename F>
    optional<R> run_default(const F &f, const std::string &label, std::false_type);

    template<typename F>
    void run_default(const F &f, const std::string &label, std::true_type);

    template<typename F, typename U>
    std::future<optional<R>> run_default_async(const F &f, const std::string &label, std::future<U>*);

    template<typename F>
    std::future<void> run_default_async(const F &f, const std::string &label, std::future<void>*);

public:
    Matcher(const T &subject, bool short_circuit = true, const Handler &error_handler = Handler());

    Matcher(const T &subject, const Options &options);

    // predicate(subject) decides; f() produces the result, or returns
    // nothing for a clause that is run for its side effects.
    template<typename Predicate, typename F>
    inline typename std::enable_if<is_predicate<Predicate, T>::value, Matcher&>::type when(
        const Predicate &predicate,
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate(predicate, f, label_of(label, predicate, "Case"), handler);
    }

    // matches if subject == value.
    template<typename F>
    inline Matcher &when(
        const T &value,
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate([&value] (const T &subject) {
            return bool(subject == value);
        }, f, coalesce(label, "Case"), handler);
    }

    // matches if the subject is a TCase (see narrow.h); f receives
    // the subject as a const TCase&.
    template<typename TCase, typename F>
    inline Matcher &when_type(
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate_extract([] (const T &subject) {
            return narrow<TCase>(subject);
        }, f, coalesce(label, short_type_name<TCase>()), handler);
    }

    // extract(subject) yields something that tests true (a pointer, an
    // optional) if the clause matches; f receives what it points to.
    template<typename Extract, typename F>
    inline Matcher &when_extract(
        const Extract &extract,
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate_extract(extract, f, label_of(label, extract, "Case"), handler);
    }

    // asynchronous clauses: f() returns a std::future of the result (or
    // std::future<void>). the predicate is evaluated immediately; the
    // clause completes when the returned future is waited on.
    template<typename Predicate, typename F>
    inline typename std::enable_if<is_predicate<Predicate, T>::value, std::future<Matcher&>>::type when_async(
        const Predicate &predicate,
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate_async(predicate, f, label_of(label, predicate, "CaseAsync"), handler);
    }

    template<typename F>
    inline std::future<Matcher&> when_async(
        const T &value,
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        return evaluate_async([&value] (const T &subject) {
            return bool(subject == value);
        }, f, coalesce(label, "CaseAsync"), handler);
    }

    template<typename TCase, typename F>
    inline std::future<Matcher&> when_type_async(
        const F &f,
        const std::string &label = std::string(),
        const Handler &handler = Handler()) {

        const T &value = m_subject;

        return evaluate_async([] (const T &subject) {
            return narrow<TCase>(subject) != nullptr;
        }, [&f, &value] () {
            return f(*narrow<TCase>(value));
        }, coalesce(label, short_type_name<TCase>()), handler);
    }

    // runs f only if no clause matched. returns the result (as an
    // optional) for a result producing f, nothing otherwise.
    template<typename F>
    inline auto otherwise(const F &f, const std::string &label = std::string()) {
        return run_default(f, coalesce(label, "Default"), std::is_void<decltype(f())>());
    }

    template<typename F>
    inline auto otherwise_async(const F &f, const std::string &label = std::string()) {
        return run_default_async(f, coalesce(label, "DefaultAsync"), static_cast<decltype(f())*>(nullptr));
    }

    inline const T &subject() const {
        return m_subject;
    }

    inline bool short_circuit() const {
        return m_short_circuit;
    }

    inline ErrorPolicy error_policy() const {
        return m_error_policy;
    }

    // true once a clause (not the default) matched.
    inline bool matched() const {
        return m_matched;
    }

    inline bool defaulted() const {
        return m_defaulted;
    }

    inline const optional<R> &result() const {
        return m_result;
    }

    inline const std::vector<R> &all_results() const {
        return m_all_results;
    }

    inline const std::vector<Entry> &log() const {
        return m_log;
    }
};

#include "matcher.tcc"

#endif // FLUENTMATCH_MATCHER_H
