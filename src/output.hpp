#pragma once
#include <string>

namespace zenbot {

// Where user-visible text goes. Called from the consumer loop while input may
// be read concurrently; implementations handle their own locking.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void emit_text(const std::string& text) = 0;
    virtual void emit_status(const std::string& text) = 0;
    virtual void begin_stream() = 0;
    virtual void emit_stream_chunk(const std::string& chunk) = 0;
    virtual void end_stream() = 0;
};

} // namespace zenbot
