#pragma once
#include "message.hpp"
#include <string>
#include <vector>

namespace zenbot {

// Conversation history. Index 0 always holds the system message, which is
// set once and never trimmed.
class History {
public:
    explicit History(std::string system_prompt);

    void append(Message msg);

    // Keep the system message plus the most recent max_messages entries.
    void trim(int max_messages);

    const std::vector<Message>& messages() const { return messages_; }
    const Message& system_message() const { return messages_.front(); }
    size_t size() const { return messages_.size(); }

private:
    std::vector<Message> messages_;
};

} // namespace zenbot
