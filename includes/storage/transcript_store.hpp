#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace whispercore {

enum class TranscriptStatus { Completed, Failed };

const char* to_string(TranscriptStatus status);

struct StoredTranscript {
    std::int64_t id{0};
    std::int64_t created_ms{0};       // wall clock, ms since epoch
    std::string source;               // file path or "microphone"
    TranscriptStatus status{TranscriptStatus::Completed};
    TranscriptionResult result;       // empty for failures
    std::optional<int> error_code;
    std::string error_message;
};

// Transcription history on disk.
// Schema:
//  - transcriptions(id INTEGER PK, created_ms INTEGER, source TEXT, status TEXT,
//                   text TEXT, segments_json TEXT, language TEXT, model_used TEXT,
//                   used_gpu INTEGER, error_code INTEGER, error_message TEXT)
//
// Not thread-safe; use from one thread. All SQLite failures throw std::runtime_error.
class TranscriptStore {
public:
    explicit TranscriptStore(const std::string& db_path);
    ~TranscriptStore();

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    std::int64_t record_success(const std::string& source, const TranscriptionResult& result);
    std::int64_t record_failure(const std::string& source, const Error& error);

    // Newest first.
    std::vector<StoredTranscript> recent(int limit) const;
    std::optional<StoredTranscript> find(std::int64_t id) const;

    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
};

// $XDG_DATA_HOME/whispercore/transcripts.db or ~/.local/share/whispercore/transcripts.db
std::string default_db_path();

} // namespace whispercore
