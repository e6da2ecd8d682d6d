#include "reelcut/SQLiteStore.h"

#include <memory>
#include <stdexcept>
#include <string>

#include "reelcut/Utility.h"

namespace reelcut {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

StmtPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return StmtPtr(stmt, &sqlite3_finalize);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

void delete_for_video(sqlite3* db, const char* sql, sqlite3_int64 videoId) {
    auto stmt = prepare_or_throw(db, sql);
    sqlite3_bind_int64(stmt.get(), 1, videoId);
    step_done_or_throw(db, stmt.get());
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::string join_signal_kinds(const std::vector<SignalKind>& kinds) {
    std::string out;
    for (std::size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0) out += ",";
        out += signal_kind_to_string(kinds[i]);
    }
    return out;
}

}  // namespace

SQLiteStore::SQLiteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite database at " + path + ": " + message);
    }
}

SQLiteStore::~SQLiteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;
        PRAGMA foreign_keys=ON;

        CREATE TABLE IF NOT EXISTS videos (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            logical_id TEXT NOT NULL UNIQUE,
            title TEXT,
            duration_sec REAL,
            candidate_count INTEGER,
            used_chapter_clips INTEGER NOT NULL DEFAULT 0,
            missing_signals TEXT,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_videos_logical ON videos(logical_id);

        CREATE TRIGGER IF NOT EXISTS update_videos_timestamp
            AFTER UPDATE ON videos FOR EACH ROW
        BEGIN
            UPDATE videos SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
        END;

        -- Fused score timeline as a float32 BLOB at a fixed step
        CREATE TABLE IF NOT EXISTS score_timelines (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            video_id INTEGER NOT NULL,
            step REAL NOT NULL,
            length INTEGER NOT NULL,
            data_blob BLOB NOT NULL,
            FOREIGN KEY(video_id) REFERENCES videos(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_timelines_video ON score_timelines(video_id);

        -- Renormalized weights actually applied
        CREATE TABLE IF NOT EXISTS signal_weights (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            video_id INTEGER NOT NULL,
            signal TEXT NOT NULL,
            weight REAL NOT NULL,
            FOREIGN KEY(video_id) REFERENCES videos(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_weights_video ON signal_weights(video_id);

        CREATE TABLE IF NOT EXISTS clips (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            video_id INTEGER NOT NULL,
            rank INTEGER NOT NULL,
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            score REAL NOT NULL,
            dominant_signal TEXT NOT NULL,
            reason TEXT,
            FOREIGN KEY(video_id) REFERENCES videos(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_clips_video ON clips(video_id);

        CREATE TABLE IF NOT EXISTS subtitle_cues (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            clip_id INTEGER NOT NULL,
            cue_index INTEGER NOT NULL,
            word TEXT NOT NULL,
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            FOREIGN KEY(clip_id) REFERENCES clips(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_cues_clip ON subtitle_cues(clip_id);

        CREATE TABLE IF NOT EXISTS user_settings (
            user_id TEXT PRIMARY KEY,
            clip_count INTEGER,
            min_duration REAL,
            max_duration REAL,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )SQL";

    exec_or_throw(db_, schema);
}

void SQLiteStore::save_result(const HighlightResult& result) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // Upsert video record on logical_id
        sqlite3_int64 video_id = 0;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO videos (logical_id, title, duration_sec, candidate_count, used_chapter_clips, "
                "missing_signals, updated_at) "
                "VALUES (?,?,?,?,?,?, CURRENT_TIMESTAMP) "
                "ON CONFLICT(logical_id) DO UPDATE SET "
                "title=excluded.title, duration_sec=excluded.duration_sec, "
                "candidate_count=excluded.candidate_count, used_chapter_clips=excluded.used_chapter_clips, "
                "missing_signals=excluded.missing_signals, updated_at=CURRENT_TIMESTAMP "
                "RETURNING id;");

            const std::string missing = join_signal_kinds(result.missingSignals);
            sqlite3_bind_text(stmt.get(), 1, result.videoId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, result.title.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 3, result.durationSeconds);
            sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(result.candidateCount));
            sqlite3_bind_int(stmt.get(), 5, result.usedChapterClips ? 1 : 0);
            sqlite3_bind_text(stmt.get(), 6, missing.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
                throw std::runtime_error(sqlite3_errmsg(db_));
            }
            video_id = sqlite3_column_int64(stmt.get(), 0);
        }

        // Replace previous run data
        delete_for_video(db_, "DELETE FROM subtitle_cues WHERE clip_id IN (SELECT id FROM clips WHERE video_id=?);",
                         video_id);
        delete_for_video(db_, "DELETE FROM clips WHERE video_id=?;", video_id);
        delete_for_video(db_, "DELETE FROM score_timelines WHERE video_id=?;", video_id);
        delete_for_video(db_, "DELETE FROM signal_weights WHERE video_id=?;", video_id);

        // Timeline as BLOB (float array)
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO score_timelines (video_id, step, length, data_blob) VALUES (?,?,?,?);");

            std::vector<float> values;
            values.reserve(result.timeline.points.size());
            for (const auto& p : result.timeline.points) values.push_back(static_cast<float>(p.score));
            const int blob_size = static_cast<int>(values.size() * sizeof(float));

            sqlite3_bind_int64(stmt.get(), 1, video_id);
            sqlite3_bind_double(stmt.get(), 2, result.timeline.step);
            sqlite3_bind_int(stmt.get(), 3, static_cast<int>(values.size()));
            // zero-length blobs must not bind NULL (NOT NULL column)
            sqlite3_bind_blob(stmt.get(), 4, values.empty() ? "" : static_cast<const void*>(values.data()),
                              blob_size, SQLITE_TRANSIENT);
            step_done_or_throw(db_, stmt.get());
        }

        {
            auto stmt = prepare_or_throw(db_, "INSERT INTO signal_weights (video_id, signal, weight) VALUES (?,?,?);");
            for (const auto& [kind, weight] : result.timeline.weights) {
                const std::string name = signal_kind_to_string(kind);
                sqlite3_bind_int64(stmt.get(), 1, video_id);
                sqlite3_bind_text(stmt.get(), 2, name.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 3, weight);
                step_done_or_throw(db_, stmt.get());
            }
        }

        // Clips and their cues
        {
            auto clipStmt = prepare_or_throw(db_,
                "INSERT INTO clips (video_id, rank, start_sec, end_sec, score, dominant_signal, reason) "
                "VALUES (?,?,?,?,?,?,?);");
            auto cueStmt = prepare_or_throw(db_,
                "INSERT INTO subtitle_cues (clip_id, cue_index, word, start_sec, end_sec) VALUES (?,?,?,?,?);");

            for (const auto& clip : result.clips) {
                const std::string dominant = signal_kind_to_string(clip.dominantSignal);
                sqlite3_bind_int64(clipStmt.get(), 1, video_id);
                sqlite3_bind_int(clipStmt.get(), 2, clip.rank);
                sqlite3_bind_double(clipStmt.get(), 3, clip.start);
                sqlite3_bind_double(clipStmt.get(), 4, clip.end);
                sqlite3_bind_double(clipStmt.get(), 5, clip.score);
                sqlite3_bind_text(clipStmt.get(), 6, dominant.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(clipStmt.get(), 7, clip.reason.c_str(), -1, SQLITE_TRANSIENT);
                step_done_or_throw(db_, clipStmt.get());

                const sqlite3_int64 clip_id = sqlite3_last_insert_rowid(db_);
                int cue_index = 0;
                for (const auto& cue : clip.cues) {
                    sqlite3_bind_int64(cueStmt.get(), 1, clip_id);
                    sqlite3_bind_int(cueStmt.get(), 2, cue_index++);
                    sqlite3_bind_text(cueStmt.get(), 3, cue.word.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_double(cueStmt.get(), 4, cue.start);
                    sqlite3_bind_double(cueStmt.get(), 5, cue.end);
                    step_done_or_throw(db_, cueStmt.get());
                }
            }
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        // Keep the original error; a failed rollback has nothing to add
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::vector<SelectedClip> SQLiteStore::load_clips(const std::string& videoId) {
    std::vector<SelectedClip> clips;
    std::vector<sqlite3_int64> clipIds;
    {
        auto stmt = prepare_or_throw(db_,
            "SELECT c.id, c.rank, c.start_sec, c.end_sec, c.score, c.dominant_signal, c.reason "
            "FROM clips c JOIN videos v ON v.id = c.video_id "
            "WHERE v.logical_id = ? ORDER BY c.start_sec, c.id;");
        sqlite3_bind_text(stmt.get(), 1, videoId.c_str(), -1, SQLITE_TRANSIENT);

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            SelectedClip clip;
            clipIds.push_back(sqlite3_column_int64(stmt.get(), 0));
            clip.rank = sqlite3_column_int(stmt.get(), 1);
            clip.start = sqlite3_column_double(stmt.get(), 2);
            clip.end = sqlite3_column_double(stmt.get(), 3);
            clip.score = sqlite3_column_double(stmt.get(), 4);
            clip.dominantSignal = signal_kind_from_string(column_string(stmt.get(), 5));
            clip.reason = column_string(stmt.get(), 6);
            clips.push_back(std::move(clip));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(sqlite3_errmsg(db_));
        }
    }

    auto cueStmt = prepare_or_throw(db_,
        "SELECT word, start_sec, end_sec FROM subtitle_cues WHERE clip_id = ? ORDER BY cue_index;");
    for (std::size_t i = 0; i < clips.size(); ++i) {
        sqlite3_bind_int64(cueStmt.get(), 1, clipIds[i]);
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(cueStmt.get())) == SQLITE_ROW) {
            SubtitleCue cue;
            cue.word = column_string(cueStmt.get(), 0);
            cue.start = sqlite3_column_double(cueStmt.get(), 1);
            cue.end = sqlite3_column_double(cueStmt.get(), 2);
            clips[i].cues.push_back(std::move(cue));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(sqlite3_errmsg(db_));
        }
        sqlite3_reset(cueStmt.get());
    }
    return clips;
}

void SQLiteStore::save_user_settings(const UserSettings& settings) {
    auto stmt = prepare_or_throw(db_,
        "INSERT INTO user_settings (user_id, clip_count, min_duration, max_duration, updated_at) "
        "VALUES (?,?,?,?, CURRENT_TIMESTAMP) "
        "ON CONFLICT(user_id) DO UPDATE SET "
        "clip_count=excluded.clip_count, min_duration=excluded.min_duration, "
        "max_duration=excluded.max_duration, updated_at=CURRENT_TIMESTAMP;");

    sqlite3_bind_text(stmt.get(), 1, settings.userId.c_str(), -1, SQLITE_TRANSIENT);
    // Unset overrides are stored as NULL so the global default keeps applying
    if (settings.clipCount) {
        sqlite3_bind_int(stmt.get(), 2, *settings.clipCount);
    } else {
        sqlite3_bind_null(stmt.get(), 2);
    }
    if (settings.minDuration) {
        sqlite3_bind_double(stmt.get(), 3, *settings.minDuration);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    if (settings.maxDuration) {
        sqlite3_bind_double(stmt.get(), 4, *settings.maxDuration);
    } else {
        sqlite3_bind_null(stmt.get(), 4);
    }
    step_done_or_throw(db_, stmt.get());
}

std::optional<UserSettings> SQLiteStore::load_user_settings(const std::string& userId) {
    auto stmt = prepare_or_throw(db_,
        "SELECT clip_count, min_duration, max_duration FROM user_settings WHERE user_id = ?;");
    sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }

    UserSettings settings;
    settings.userId = userId;
    if (sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) settings.clipCount = sqlite3_column_int(stmt.get(), 0);
    if (sqlite3_column_type(stmt.get(), 1) != SQLITE_NULL) settings.minDuration = sqlite3_column_double(stmt.get(), 1);
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) settings.maxDuration = sqlite3_column_double(stmt.get(), 2);
    return settings;
}

}  // namespace reelcut
