#include "storage/transcript_store.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace whispercore {

namespace {

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, std::int64_t v) { check(sqlite3_bind_int64(st_, idx, v)); }
    void bind(int idx, int v) { check(sqlite3_bind_int(st_, idx, v)); }
    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(st_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
    }
    void bind_null(int idx) { check(sqlite3_bind_null(st_, idx)); }

    // true while rows are available
    bool step() {
        const int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3_stmt* get() const { return st_; }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* st_ = nullptr;
};

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : std::string{};
}

constexpr const char* kSelectColumns =
    "SELECT id, created_ms, source, status, text, segments_json, language, model_used, "
    "used_gpu, error_code, error_message FROM transcriptions ";

StoredTranscript read_row(sqlite3_stmt* st) {
    StoredTranscript row;
    row.id = sqlite3_column_int64(st, 0);
    row.created_ms = sqlite3_column_int64(st, 1);
    row.source = column_text(st, 2);
    row.status = column_text(st, 3) == "failed" ? TranscriptStatus::Failed
                                                : TranscriptStatus::Completed;
    row.result.text = column_text(st, 4);

    const std::string segments = column_text(st, 5);
    if (!segments.empty()) {
        try {
            row.result.segments = nlohmann::json::parse(segments).get<std::vector<Segment>>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Corrupt segments_json in transcription " +
                                     std::to_string(row.id) + ": " + e.what());
        }
    }
    if (sqlite3_column_type(st, 6) != SQLITE_NULL) {
        row.result.language = column_text(st, 6);
    }
    row.result.model_used = column_text(st, 7);
    row.result.used_gpu = sqlite3_column_int(st, 8) != 0;
    if (sqlite3_column_type(st, 9) != SQLITE_NULL) {
        row.error_code = sqlite3_column_int(st, 9);
    }
    row.error_message = column_text(st, 10);
    return row;
}

} // namespace

const char* to_string(TranscriptStatus status) {
    return status == TranscriptStatus::Failed ? "failed" : "completed";
}

std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/whispercore/transcripts.db";
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.local/share/whispercore/transcripts.db";
}

TranscriptStore::TranscriptStore(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path + ": " + msg);
    }
    init_schema();
}

TranscriptStore::~TranscriptStore() {
    if (db_) sqlite3_close(db_);
}

void TranscriptStore::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS transcriptions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        created_ms INTEGER NOT NULL,
        source TEXT NOT NULL,
        status TEXT NOT NULL,
        text TEXT,
        segments_json TEXT,
        language TEXT,
        model_used TEXT,
        used_gpu INTEGER DEFAULT 0,
        error_code INTEGER,
        error_message TEXT
    );
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t TranscriptStore::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t TranscriptStore::record_success(const std::string& source,
                                             const TranscriptionResult& result) {
    Statement st(db_,
        "INSERT INTO transcriptions (created_ms, source, status, text, segments_json, "
        "language, model_used, used_gpu) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind(1, now_ms());
    st.bind(2, source);
    st.bind(3, std::string(to_string(TranscriptStatus::Completed)));
    st.bind(4, result.text);
    st.bind(5, nlohmann::json(result.segments).dump());
    if (result.language) st.bind(6, *result.language);
    else                 st.bind_null(6);
    st.bind(7, result.model_used);
    st.bind(8, result.used_gpu ? 1 : 0);
    st.step();
    return sqlite3_last_insert_rowid(db_);
}

std::int64_t TranscriptStore::record_failure(const std::string& source, const Error& error) {
    Statement st(db_,
        "INSERT INTO transcriptions (created_ms, source, status, error_code, error_message) "
        "VALUES (?, ?, ?, ?, ?);");
    st.bind(1, now_ms());
    st.bind(2, source);
    st.bind(3, std::string(to_string(TranscriptStatus::Failed)));
    st.bind(4, static_cast<int>(error.code));
    st.bind(5, error.message);
    st.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<StoredTranscript> TranscriptStore::recent(int limit) const {
    std::vector<StoredTranscript> out;
    if (limit <= 0) return out;

    Statement st(db_, (std::string(kSelectColumns) + "ORDER BY id DESC LIMIT ?;").c_str());
    st.bind(1, limit);
    while (st.step()) {
        out.push_back(read_row(st.get()));
    }
    return out;
}

std::optional<StoredTranscript> TranscriptStore::find(std::int64_t id) const {
    Statement st(db_, (std::string(kSelectColumns) + "WHERE id = ?;").c_str());
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_row(st.get());
}

} // namespace whispercore
