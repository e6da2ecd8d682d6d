#pragma once

#include "../ClipTypes.h"
#include "../CoreContract.h"

#include <vector>

namespace reelcut {
namespace signals {

/**
 * AudioEnergyExtractor: loudness measurements -> raw audio_energy signal
 *
 * Input: loudness samples at fixed intervals from the audio-analysis collaborator
 * Output: the same samples, unchanged in value (smoothing belongs to normalization)
 */
class AudioEnergyExtractor {
public:
    AudioEnergyExtractor() = default;

    /**
     * @param loudness Loudness samples (any scale)
     * @param durationSec Video duration; samples outside [0, duration) are dropped
     *                    (no upper bound when duration <= 0)
     * @return Raw signal; non-finite samples dropped, ordered by timestamp
     */
    RawSignal extract(const std::vector<SignalSample>& loudness, double durationSec) const;
};

/**
 * RMS envelope of mono PCM in [-1,1].
 * One sample per hop, stamped at the window start; windows never run past the end.
 */
std::vector<SignalSample> compute_rms_envelope(const std::vector<float>& pcm,
                                               int sampleRate,
                                               double windowMs = contract::RMS_WINDOW_MS,
                                               double hopMs = contract::RMS_HOP_MS);

}  // namespace signals
}  // namespace reelcut
