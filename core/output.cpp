#include "output.h"

void StreamOutput::write(
    const char *name,
    const char *tag,
    std::string &&s) {

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << name << "::" << tag << ": " << s << std::endl;
}

void TestOutput::write(
    const char *name,
    const char *tag,
    std::string &&s) {

    m_output.emplace_back(std::string(name) + "::" + tag + ": " + s);
}

OutputRef default_output() {
    static const OutputRef output = std::make_shared<DefaultOutput>();
    return output;
}

bool TestOutput::test_empty() {
    if (!m_output.empty()) {
        for (const std::string &s : m_output) {
            std::cout << "unexpected output: " << s << std::endl;
        }
        m_output.clear();
        return false;
    } else {
        return true;
    }
}

bool TestOutput::test_line(const std::string &expected, bool fail_expected) {
    bool fail = false;
    std::string actual;

    if (m_output.size() >= 1) {
        actual = m_output.front();
        if (expected != actual) {
            fail = true;
        } else {
            m_output.erase(m_output.begin());
        }
    } else {
        fail = true;
        actual = "(nothing)";
    }

    if (fail && !fail_expected) {
        std::cout << "output mismatch: " << std::endl;
        std::cout << "expected: " << expected << std::endl;
        std::cout << "actual: " << actual << std::endl;
        return false;
    } else {
        return true;
    }
}
