#pragma once

#include <chrono>
#include <ostream>
#include <sstream>

#include "types.h"
#include "format.h"

enum MatchLogKind {
    MatchedEntry,
    FailedEntry,
    DefaultEntry
};

const char *log_kind_name(MatchLogKind kind);

using Timestamp = std::chrono::system_clock::time_point;

// ISO 8601, UTC, millisecond precision.
std::string format_timestamp(const Timestamp &time);

// one evaluation of one clause. an entry either carries a result,
// an error or neither (a body without a result); default entries
// never carry an error.

template<typename T, typename R>
class MatchLogEntry {
public:
    const size_t index;
    const MatchLogKind kind;
    const Timestamp timestamp;
    const std::string label;
    const T subject;
    const optional<R> result;
    const std::exception_ptr error;

    inline MatchLogEntry(
        size_t index_,
        MatchLogKind kind_,
        const Timestamp &timestamp_,
        const std::string &label_,
        const T &subject_,
        optional<R> &&result_,
        const std::exception_ptr &error_) :

        index(index_),
        kind(kind_),
        timestamp(timestamp_),
        label(label_),
        subject(subject_),
        result(std::move(result_)),
        error(error_) {
    }

    inline bool has_result() const {
        return bool(result);
    }

    inline bool has_error() const {
        return bool(error);
    }

    inline std::string error_message() const {
        return describe_exception(error);
    }

    std::string debugform() const;
};

template<typename T, typename R>
std::string MatchLogEntry<T, R>::debugform() const {
    std::ostringstream s;
    s << "#" << index << " " << format_timestamp(timestamp) << " " << label << ": ";
    s << format_value(subject);
    if (result) {
        s << " -> " << format_value(*result);
    } else if (error) {
        s << " !! " << error_message();
    }
    return s.str();
}

template<typename T, typename R>
inline std::ostream &operator<<(std::ostream &s, const MatchLogEntry<T, R> &entry) {
    s << entry.debugform();
    return s;
}
