#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace zenbot {

enum class EventType {
    user_message,
    reminder_due,
    tick     // internal only, never enqueued by producers
};

inline const char* event_type_name(EventType t) {
    switch (t) {
        case EventType::user_message: return "USER_MESSAGE";
        case EventType::reminder_due: return "REMINDER_DUE";
        case EventType::tick:         return "TICK";
    }
    return "UNKNOWN";
}

class Event {
public:
    explicit Event(EventType type, nlohmann::json payload = nullptr)
        : type_(type), payload_(std::move(payload)) {}

    static Event user_message(const std::string& text) {
        return Event(EventType::user_message, text);
    }
    static Event reminder_due(nlohmann::json payload) {
        return Event(EventType::reminder_due, std::move(payload));
    }
    static Event tick() { return Event(EventType::tick); }

    EventType type() const { return type_; }
    const nlohmann::json& payload() const { return payload_; }

private:
    EventType type_;
    nlohmann::json payload_;
};

} // namespace zenbot
