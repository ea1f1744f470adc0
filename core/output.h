#pragma once

#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <string>

// an Output receives what a matcher reports besides its results: the
// errors it swallows or rethrows and, with FLUENTMATCH_DEBUG_LOG, each
// log entry. name is the reporting component, tag the kind of message.

class Output {
public:
    virtual ~Output() {
    }

    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) = 0;
};

using OutputRef = std::shared_ptr<Output>;

// writes "name::tag: s" lines. one StreamOutput may be shared by
// matchers on different threads.
class StreamOutput : public Output {
private:
    std::ostream &m_stream;
    std::mutex m_mutex;

public:
    inline explicit StreamOutput(std::ostream &stream) : m_stream(stream) {
    }

    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s);
};

// reports go to stderr.
class DefaultOutput : public StreamOutput {
public:
    inline DefaultOutput() : StreamOutput(std::cerr) {
    }
};

class NoOutput : public Output {
public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s) {
    }
};

class TestOutput : public Output {
private:
    std::list<std::string> m_output;

public:
    virtual void write(
        const char *name,
        const char *tag,
        std::string &&s);

    void clear() {
        m_output.clear();
    }

    bool empty() const {
        return m_output.empty();
    }

    size_t size() const {
        return m_output.size();
    }

    const std::list<std::string> &lines() const {
        return m_output;
    }

    bool test_empty();

    bool test_line(const std::string &expected, bool fail_expected);
};

// the output of matchers that are not given one.
OutputRef default_output();
