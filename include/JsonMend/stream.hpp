#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "validator.hpp"

namespace JsonMend {

// Accumulates chunks of a streamed document and decodes the prefix received so far.
template<class T>
class StreamParser {
public:
    StreamParser() {
        m_buffer.reserve(1024);
    }

    explicit StreamParser(Validator<T> validator) : m_validator(std::move(validator)) {
        m_buffer.reserve(1024);
    }

    PartialUnmarshalled<T> feed(std::string_view chunk) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer.append(chunk);
        return m_validator.unmarshal_partial(m_buffer);
    }

    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer.clear();
    }

    std::string buffer() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffer;
    }

private:
    Validator<T> m_validator;
    std::string m_buffer;
    mutable std::mutex m_mutex;
};

} // namespace JsonMend
