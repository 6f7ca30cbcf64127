#include "history.hpp"

namespace zenbot {

History::History(std::string system_prompt) {
    messages_.push_back(Message::system(std::move(system_prompt)));
}

void History::append(Message msg) {
    messages_.push_back(std::move(msg));
}

void History::trim(int max_messages) {
    if (max_messages < 0) max_messages = 0;
    size_t keep = static_cast<size_t>(max_messages);
    size_t rest = messages_.size() - 1;
    if (rest <= keep) return;
    messages_.erase(messages_.begin() + 1, messages_.begin() + 1 + (rest - keep));
}

} // namespace zenbot
