#pragma once

#include "reelcut/ClipTypes.h"
#include "reelcut/Config.h"

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

namespace reelcut {

/**
 * SQLiteStore: persistence for finished runs and per-user settings.
 * Lives outside the engine; the engine itself never touches storage.
 */
class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();

    // Upsert the video by logical id and replace its timeline, weights, clips and cues.
    void save_result(const HighlightResult& result);

    // Clips of the latest saved run, sorted by start, cues included (lines are not stored).
    std::vector<SelectedClip> load_clips(const std::string& videoId);

    void save_user_settings(const UserSettings& settings);
    std::optional<UserSettings> load_user_settings(const std::string& userId);

  private:
    sqlite3* db_{nullptr};
};

}  // namespace reelcut
