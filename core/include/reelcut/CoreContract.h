#pragma once

/**
 * CoreContract.h - ReelCut engine constants
 *
 * Defaults and valid domains for the highlight engine. The domains are part of
 * the contract with the front ends that collect per-user settings: values
 * outside them are rejected by validate_config(), never clamped.
 */

#include <cstddef>

namespace reelcut {
namespace contract {

// ============================================================================
// Timeline
// ============================================================================

/**
 * DEFAULT_SAMPLE_STEP_SEC - Fixed resolution of the fused score timeline
 *
 * Sample k covers [k*step, (k+1)*step).
 */
constexpr double DEFAULT_SAMPLE_STEP_SEC = 1.0;

/**
 * DEFAULT_DECAY_WINDOW_SEC - How long a normalized spike keeps influencing the timeline
 *
 * Linear falloff: a value v at t contributes v * (1 - dt / W) at t + dt, dt < W.
 */
constexpr double DEFAULT_DECAY_WINDOW_SEC = 5.0;

// Numerical tolerance for time comparisons (seconds).
constexpr double TIME_EPS = 1e-9;

// ============================================================================
// Signal extraction
// ============================================================================

/**
 * DEFAULT_KEYWORD_WINDOW_SEC - Half-width of the keyword counting window
 *
 * Density at a word = trigger matches starting within [t - W, t + W].
 */
constexpr double DEFAULT_KEYWORD_WINDOW_SEC = 5.0;

// Characters stripped from both ends of a transcript word before matching.
constexpr const char* KEYWORD_STRIP_CHARS = ".,!?;:\"'";

// Minimum distinct time between two scene cuts (seconds); closer cuts merge.
constexpr double SCENE_CUT_MERGE_SEC = 1e-6;

/**
 * RMS envelope framing for raw PCM (audio-analysis collaborator helper).
 */
constexpr double RMS_WINDOW_MS = 500.0;
constexpr double RMS_HOP_MS = 100.0;

// ============================================================================
// Candidate generation
// ============================================================================

/**
 * DEFAULT_PEAK_THRESHOLD - Minimum fused score for a local peak to seed a candidate
 */
constexpr double DEFAULT_PEAK_THRESHOLD = 0.1;

// ============================================================================
// Configuration domains
// ============================================================================

constexpr int CLIP_COUNT_MIN = 1;
constexpr int CLIP_COUNT_MAX = 5;
constexpr int DEFAULT_CLIP_COUNT = 3;

constexpr double MIN_DURATION_LOWER = 10.0;
constexpr double MIN_DURATION_UPPER = 30.0;
constexpr double DEFAULT_MIN_DURATION = 15.0;

constexpr double MAX_DURATION_LOWER = 30.0;
constexpr double MAX_DURATION_UPPER = 60.0;
constexpr double DEFAULT_MAX_DURATION = 60.0;

constexpr double DEFAULT_AUDIO_ENERGY_WEIGHT = 0.4;
constexpr double DEFAULT_KEYWORD_WEIGHT = 0.3;
constexpr double DEFAULT_SCENE_CHANGE_WEIGHT = 0.3;
constexpr double DEFAULT_CHAPTER_MARKER_WEIGHT = 0.2;

// ============================================================================
// Subtitles and presentation
// ============================================================================

constexpr int DEFAULT_WORDS_PER_LINE = 4;

// A line stays on screen this long after its last word so it does not vanish abruptly.
constexpr double LINE_TAIL_SEC = 0.3;

// Word-boundary snapping search radius (seconds).
constexpr double DEFAULT_SNAP_TOLERANCE_SEC = 2.0;

// Chapter titles are cut to this many bytes in clip reasons.
constexpr std::size_t CHAPTER_TITLE_MAX = 40;

}  // namespace contract
}  // namespace reelcut
