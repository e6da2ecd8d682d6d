#pragma once

#include "reelcut/Config.h"
#include "reelcut/HighlightScorer.h"
#include "reelcut/selection/CandidateGenerator.h"
#include "reelcut/selection/ClipSelector.h"
#include "reelcut/signals/AudioEnergy.h"
#include "reelcut/signals/ChapterMarkers.h"
#include "reelcut/signals/KeywordDensity.h"
#include "reelcut/signals/SceneChange.h"
#include "reelcut/subtitles/SubtitleCueBuilder.h"

#include <vector>

namespace reelcut {

/**
 * HighlightEngine: complete highlight pipeline for one video
 *
 * Orchestrates: Extract -> Normalize -> Fuse -> Candidates -> Select -> Cues
 *
 * Pure computation over in-memory inputs (no I/O). One engine may serve many
 * videos, also concurrently: run() is const and keeps no per-run state.
 */
class HighlightEngine {
  public:
    /**
     * @param config Run configuration
     * @throws InvalidConfiguration if config is outside its documented domain
     */
    explicit HighlightEngine(HighlightConfig config);

    /**
     * Detect highlights and build subtitle cues.
     * @return Result with clips sorted by start; an empty clip list means no highlights
     * @throws InsufficientSignal if loudness, transcript, scene cuts and chapters are all empty
     */
    HighlightResult run(const HighlightRequest& request) const;

    const HighlightConfig& config() const { return config_; }

  private:
    // request.durationSeconds, or the latest timestamp across all inputs when unset
    double resolveDuration(const HighlightRequest& request) const;

    // Raw extraction + normalization; kinds without data are reported in missing
    SignalMap buildSignals(const HighlightRequest& request,
                           double durationSec,
                           std::vector<SignalKind>& missing) const;

    // Chapter spans used directly as clips (empty when too few fit the bounds)
    std::vector<SelectedClip> chapterClips(const HighlightRequest& request, double durationSec) const;

    HighlightConfig config_;

    // Signal extractors
    signals::AudioEnergyExtractor audioExtractor_;
    signals::KeywordDensityExtractor keywordExtractor_;
    signals::SceneChangeExtractor sceneExtractor_;
    signals::ChapterMarkerExtractor chapterExtractor_;

    // Fusion, window search and selection
    HighlightScorer scorer_;
    selection::CandidateGenerator candidateGenerator_;
    selection::ClipSelector selector_;

    subtitles::SubtitleCueBuilder cueBuilder_;
};

}  // namespace reelcut
