#include "reminder_store.hpp"
#include "datetime_utils.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <ctime>
#include <stdexcept>

namespace zenbot {

nlohmann::json Reminder::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"created_at", created_at},
        {"task", task},
        {"when", when},
        {"completed", completed}
    };
    j["notes"] = notes ? nlohmann::json(*notes) : nlohmann::json(nullptr);
    return j;
}

namespace {

class Connection {
public:
    explicit Connection(const std::string& path) {
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error("Failed to open reminder DB: " + msg);
        }
        sqlite3_busy_timeout(db_, 5000);
    }
    ~Connection() {
        if (db_) sqlite3_close(db_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() const { return db_; }

    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error("Reminder DB error: " + msg);
        }
    }

private:
    sqlite3* db_ = nullptr;
};

class Statement {
public:
    Statement(Connection& conn, const char* sql) : conn_(conn) {
        if (sqlite3_prepare_v2(conn.get(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(conn.get())));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, const std::optional<std::string>& value) {
        if (value) bind(idx, *value);
        else check(sqlite3_bind_null(stmt_, idx));
    }
    void bind(int idx, int value) {
        check(sqlite3_bind_int(stmt_, idx, value));
    }

    // True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error("Reminder DB step failed: " + std::string(sqlite3_errmsg(conn_.get())));
    }

    std::string text(int col) const {
        auto p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }

private:
    Connection& conn_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Reminder DB bind failed: " + std::string(sqlite3_errmsg(conn_.get())));
        }
    }
};

Reminder read_row(const Statement& st) {
    Reminder r;
    r.id = st.text(0);
    r.created_at = st.text(1);
    r.task = st.text(2);
    r.when = st.text(3);
    r.notes = st.optional_text(4);
    r.completed = st.integer(5) != 0;
    return r;
}

std::string require_id(const std::string& id) {
    std::string v = trim(id);
    if (v.empty()) throw std::invalid_argument("reminder id must not be empty");
    return v;
}

} // namespace

ReminderStore::ReminderStore(std::string db_path) : db_path_(std::move(db_path)) {
    fs::path p(db_path_);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    init_db();
}

void ReminderStore::init_db() {
    Connection conn(db_path_);
    conn.exec(R"(
        CREATE TABLE IF NOT EXISTS reminders (
            id TEXT PRIMARY KEY,
            created_at TEXT NOT NULL,
            task TEXT NOT NULL,
            when_time TEXT NOT NULL,
            notes TEXT,
            completed INTEGER DEFAULT 0
        );
    )");
}

Reminder ReminderStore::add(const std::string& task, const std::string& when,
                            const std::optional<std::string>& notes) {
    Reminder r;
    r.task = trim(task);
    r.when = trim(when);
    if (r.task.empty()) throw std::invalid_argument("reminder task must not be empty");
    if (r.when.empty()) throw std::invalid_argument("reminder time must not be empty");
    if (notes) {
        std::string n = trim(*notes);
        if (!n.empty()) r.notes = n;
    }
    r.id = generate_uuid();
    r.created_at = utc_iso_timestamp(std::time(nullptr));

    Connection conn(db_path_);
    Statement st(conn, "INSERT INTO reminders (id, created_at, task, when_time, notes, completed) "
                       "VALUES (?, ?, ?, ?, ?, 0)");
    st.bind(1, r.id);
    st.bind(2, r.created_at);
    st.bind(3, r.task);
    st.bind(4, r.when);
    st.bind(5, r.notes);
    st.step();
    return r;
}

std::optional<Reminder> ReminderStore::get_by_id(const std::string& id) {
    std::string key = require_id(id);
    Connection conn(db_path_);
    Statement st(conn, "SELECT id, created_at, task, when_time, notes, completed FROM reminders WHERE id = ?");
    st.bind(1, key);
    if (!st.step()) return std::nullopt;
    return read_row(st);
}

std::vector<Reminder> ReminderStore::list_active(bool include_completed) {
    Connection conn(db_path_);
    const char* sql = include_completed
        ? "SELECT id, created_at, task, when_time, notes, completed FROM reminders "
          "ORDER BY created_at DESC, rowid DESC"
        : "SELECT id, created_at, task, when_time, notes, completed FROM reminders "
          "WHERE completed = 0 ORDER BY created_at DESC, rowid DESC";
    Statement st(conn, sql);
    std::vector<Reminder> out;
    while (st.step()) out.push_back(read_row(st));
    return out;
}

bool ReminderStore::mark_completed(const std::string& id) {
    std::string key = require_id(id);
    Connection conn(db_path_);
    Statement st(conn, "UPDATE reminders SET completed = 1 WHERE id = ? AND completed = 0");
    st.bind(1, key);
    st.step();
    return sqlite3_changes(conn.get()) > 0;
}

bool ReminderStore::remove(const std::string& id) {
    std::string key = require_id(id);
    Connection conn(db_path_);
    Statement st(conn, "DELETE FROM reminders WHERE id = ?");
    st.bind(1, key);
    st.step();
    return sqlite3_changes(conn.get()) > 0;
}

} // namespace zenbot
