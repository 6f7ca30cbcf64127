#include <gtest/gtest.h>
#include "datetime_utils.hpp"
#include "test_support.hpp"
#include "toolbox.hpp"
#include "tools/builtin_tools.hpp"

using namespace zenbot;
using zenbot::testing::ScopedTimeZone;
using zenbot::testing::ScriptedBackend;
using zenbot::testing::TempDir;

class ReminderToolsTest : public ::testing::Test {
protected:
    ScopedTimeZone tz{"UTC0"};
    TempDir dir;
    std::shared_ptr<ReminderStore> store = std::make_shared<ReminderStore>(dir.file("reminders.db"));
    ScriptedBackend backend;
    LlmConfig llm;
    Toolbox box;

    void SetUp() override {
        llm.model = "test-model";
        register_builtin_tools(box, store, backend, llm);
    }

    static std::string tomorrow_dmy() {
        return format_date_dmy(add_days(local_date(std::time(nullptr)), 1));
    }
};

TEST_F(ReminderToolsTest, RegistersAllBuiltins) {
    auto names = box.tool_names();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_TRUE(box.has("datetime"));
    EXPECT_TRUE(box.has("set_reminder"));
    EXPECT_TRUE(box.has("list_reminders"));
    EXPECT_TRUE(box.has("delete_reminder"));
    EXPECT_EQ(box.get_tool("set_reminder")->user_message, "Setting your reminder...");
}

TEST_F(ReminderToolsTest, DatetimeReportsCurrentTime) {
    auto r = box.run_tool("datetime", nlohmann::json::object());
    ASSERT_FALSE(r.contains("error"));
    EXPECT_TRUE(r["iso"].is_string());
    EXPECT_EQ(r["date"].get<std::string>().size(), 10u);
    EXPECT_EQ(r["time"].get<std::string>().size(), 8u);
    EXPECT_TRUE(r["timestamp"].is_number_float());
    EXPECT_EQ(r["timezone"], "UTC");
    EXPECT_EQ(r["iso"].get<std::string>().substr(19), "+00:00");
}

// ── list_reminders ──────────────────────────────────────────────

TEST_F(ReminderToolsTest, ListEmpty) {
    auto r = box.run_tool("list_reminders", nlohmann::json::object());
    EXPECT_EQ(r["success"], true);
    EXPECT_EQ(r["count"], 0);
    EXPECT_EQ(r["message"], "You don't have any active reminders.");
    EXPECT_TRUE(r["reminders"].empty());
}

TEST_F(ReminderToolsTest, ListNumbersNewestFirst) {
    store->add("water plants", "2099-03-01T08:00:00+00:00");
    auto call = store->add("call mom", "2099-03-02T18:30:00+00:00", std::string("birthday"));
    auto done = store->add("old", "2099-03-03T08:00:00+00:00");
    store->mark_completed(done.id);

    auto r = box.run_tool("list_reminders", nlohmann::json::object());
    EXPECT_EQ(r["count"], 2);
    ASSERT_EQ(r["reminders"].size(), 2u);
    EXPECT_EQ(r["reminders"][0]["number"], 1);
    EXPECT_EQ(r["reminders"][0]["task"], "call mom");
    EXPECT_EQ(r["reminders"][0]["id"], call.id);
    EXPECT_EQ(r["reminders"][0]["notes"], "birthday");
    EXPECT_TRUE(r["reminders"][1]["notes"].is_null());

    std::string summary = r["summary"];
    EXPECT_EQ(summary.rfind("You have 2 reminder(s):\n\n1. **call mom** ", 0), 0u);
    EXPECT_NE(summary.find("2. **water plants** "), std::string::npos);
    EXPECT_NE(summary.find(" at 18:30"), std::string::npos);
}

// ── set_reminder ────────────────────────────────────────────────

TEST_F(ReminderToolsTest, SetReminderSavesAndConfirms) {
    backend.reply_text(R"({"task": "drink water", "time": "9:15 PM", "intended_date": "tomorrow", "notes": null})");
    backend.reply_text(R"({"confirmation_message": "Done, I'll ping you tomorrow at 21:15."})");

    auto r = box.run_tool("set_reminder", {{"request", "remind me to drink water tomorrow at 9:15 pm"}});
    ASSERT_EQ(r["success"], true) << r.dump();
    EXPECT_EQ(r["confirmation"], "Done, I'll ping you tomorrow at 21:15.");
    EXPECT_EQ(r["task"], "drink water");

    std::string when = r["when"];
    EXPECT_EQ(when.substr(10), "T21:15:00+00:00");

    auto saved = store->list_active();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].id, r["reminder_id"]);
    EXPECT_EQ(saved[0].when, when);
    EXPECT_FALSE(saved[0].notes.has_value());

    ASSERT_EQ(backend.requests.size(), 2u);
    auto& extract = backend.requests[0];
    EXPECT_FALSE(extract.stream);
    EXPECT_EQ(extract.model, "test-model");
    EXPECT_TRUE(extract.format.is_object());
    ASSERT_EQ(extract.messages.size(), 2u);
    EXPECT_EQ(extract.messages[1].content, "remind me to drink water tomorrow at 9:15 pm");
    EXPECT_NE(backend.requests[1].messages[1].content.find("Task: drink water"), std::string::npos);
}

TEST_F(ReminderToolsTest, SetReminderAcceptsFencedJson) {
    backend.reply_text("```json\n{\"task\": \"stretch\", \"time\": \"7:00\", \"intended_date\": \"tomorrow\"}\n```");
    backend.reply_text(R"({"confirmation_message": "ok"})");

    auto r = box.run_tool("set_reminder", {{"request", "stretch tomorrow at 7"}});
    EXPECT_EQ(r["success"], true) << r.dump();
    EXPECT_EQ(store->list_active().size(), 1u);
}

TEST_F(ReminderToolsTest, SetReminderFallsBackWhenConfirmationFails) {
    backend.reply_text(R"({"task": "drink water", "time": "21:15", "intended_date": "tomorrow", "notes": "cold"})");
    backend.fail("model offline");

    auto r = box.run_tool("set_reminder", {{"request", "water tomorrow 21:15"}});
    ASSERT_EQ(r["success"], true) << r.dump();
    EXPECT_EQ(r["confirmation"], "Reminder set: drink water on " + tomorrow_dmy() + " at 21:15.");
    ASSERT_EQ(store->list_active().size(), 1u);
    EXPECT_EQ(*store->list_active()[0].notes, "cold");
}

TEST_F(ReminderToolsTest, SetReminderFallsBackOnInvalidConfirmation) {
    backend.reply_text(R"({"task": "drink water", "time": "8:05", "intended_date": "tomorrow"})");
    backend.reply_text("sure thing!");

    auto r = box.run_tool("set_reminder", {{"request", "water tomorrow 8:05"}});
    EXPECT_EQ(r["confirmation"], "Reminder set: drink water on " + tomorrow_dmy() + " at 08:05.");
}

TEST_F(ReminderToolsTest, SetReminderExtractionFailure) {
    backend.reply_text("I think you want a reminder");
    auto r = box.run_tool("set_reminder", {{"request", "remind me"}});
    ASSERT_TRUE(r.contains("error"));
    EXPECT_EQ(r["error"].get<std::string>().rfind("Could not extract reminder details.", 0), 0u);
    EXPECT_TRUE(store->list_active().empty());
}

TEST_F(ReminderToolsTest, SetReminderMissingFieldIsExtractionFailure) {
    backend.reply_text(R"({"task": "drink water", "intended_date": "today"})");
    auto r = box.run_tool("set_reminder", {{"request", "drink water"}});
    EXPECT_EQ(r["error"].get<std::string>().rfind("Could not extract reminder details.", 0), 0u);
}

TEST_F(ReminderToolsTest, SetReminderBadTime) {
    backend.reply_text(R"({"task": "lunch", "time": "noon", "intended_date": "today"})");
    auto r = box.run_tool("set_reminder", {{"request", "lunch at noon"}});
    EXPECT_EQ(r["error"], "Could not parse time 'noon'. Please use a format like '9:15', '9:15 AM', or '14:30'.");
    EXPECT_TRUE(store->list_active().empty());
}

TEST_F(ReminderToolsTest, SetReminderBadDate) {
    backend.reply_text(R"({"task": "lunch", "time": "12:00", "intended_date": "next month"})");
    auto r = box.run_tool("set_reminder", {{"request", "lunch next month"}});
    EXPECT_EQ(r["error"], "Could not interpret date 'next month'. Use 'today', 'tomorrow', or a weekday name.");
}

TEST_F(ReminderToolsTest, SetReminderBackendFailureBecomesError) {
    backend.fail("connection refused");
    auto r = box.run_tool("set_reminder", {{"request", "water at 9:00"}});
    EXPECT_EQ(r["error"], "connection refused");
}

TEST_F(ReminderToolsTest, SetReminderRequiresRequest) {
    auto r = box.run_tool("set_reminder", nlohmann::json::object());
    EXPECT_EQ(r["error"], "Invalid arguments");
    EXPECT_TRUE(backend.requests.empty());
}

// ── delete_reminder ─────────────────────────────────────────────

TEST_F(ReminderToolsTest, DeleteWithEmptyStore) {
    auto r = box.run_tool("delete_reminder", {{"request", "delete water"}});
    EXPECT_EQ(r["error"], "You don't have any active reminders to delete.");
    EXPECT_TRUE(backend.requests.empty());
}

TEST_F(ReminderToolsTest, DeleteMatchedReminder) {
    auto water = store->add("drink water", "2099-03-01T08:00:00+00:00");
    auto call = store->add("call mom", "2099-03-02T18:30:00+00:00");
    backend.reply_text(nlohmann::json{{"reminder_id", water.id}, {"confidence", "high"}}.dump());
    backend.reply_text(R"({"confirmation_message": "Water reminder removed."})");

    auto r = box.run_tool("delete_reminder", {{"request", "delete the water one"}});
    ASSERT_EQ(r["success"], true) << r.dump();
    EXPECT_EQ(r["confirmation"], "Water reminder removed.");
    EXPECT_EQ(r["deleted_reminder"]["id"], water.id);
    EXPECT_EQ(r["deleted_reminder"]["task"], "drink water");

    auto left = store->list_active();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, call.id);

    const std::string& context = backend.requests[0].messages[1].content;
    EXPECT_NE(context.find("ID: " + water.id), std::string::npos);
    EXPECT_NE(context.find("User request: delete the water one"), std::string::npos);
}

TEST_F(ReminderToolsTest, DeleteCleansUpPastReminders) {
    auto water = store->add("drink water", "2099-03-01T08:00:00+00:00");
    store->add("stale", "2000-01-01T00:00:00+00:00");
    auto keep = store->add("keep", "2099-04-01T08:00:00+00:00");
    backend.reply_text(nlohmann::json{{"reminder_id", water.id}}.dump());
    backend.fail("offline");

    auto r = box.run_tool("delete_reminder", {{"request", "delete water"}});
    ASSERT_EQ(r["success"], true) << r.dump();
    EXPECT_EQ(r["confirmation"], "Reminder deleted: drink water (2099-03-01T08:00:00+00:00).");

    auto left = store->list_active(true);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, keep.id);
}

TEST_F(ReminderToolsTest, DeleteUnknownId) {
    store->add("drink water", "2099-03-01T08:00:00+00:00");
    backend.reply_text(R"({"reminder_id": "made-up-id", "confidence": "low"})");

    auto r = box.run_tool("delete_reminder", {{"request", "delete gym"}});
    EXPECT_EQ(r["error"], "The matched reminder could not be found in the database.");
    EXPECT_EQ(store->list_active().size(), 1u);
}

TEST_F(ReminderToolsTest, DeleteUnmatched) {
    store->add("drink water", "2099-03-01T08:00:00+00:00");
    backend.reply_text("no idea");

    auto r = box.run_tool("delete_reminder", {{"request", "delete something"}});
    EXPECT_EQ(r["error"], "Could not identify which reminder you want to delete. Please be more specific.");
}
