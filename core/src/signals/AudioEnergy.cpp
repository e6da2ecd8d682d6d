#include "reelcut/signals/AudioEnergy.h"
#include "reelcut/Normalization.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace reelcut {
namespace signals {

RawSignal AudioEnergyExtractor::extract(const std::vector<SignalSample>& loudness, double durationSec) const {
    RawSignal out;
    out.kind = SignalKind::AudioEnergy;
    out.impulse = false;
    out.samples = sanitize_series(loudness);
    // Stray samples past the video would otherwise stretch the min-max range
    out.samples.erase(std::remove_if(out.samples.begin(), out.samples.end(),
                                     [durationSec](const SignalSample& s) {
                                         return s.timestamp < 0.0 || (durationSec > 0.0 && s.timestamp >= durationSec);
                                     }),
                      out.samples.end());
    return out;
}

std::vector<SignalSample> compute_rms_envelope(const std::vector<float>& pcm,
                                               int sampleRate,
                                               double windowMs,
                                               double hopMs) {
    std::vector<SignalSample> out;
    if (pcm.empty() || sampleRate <= 0) return out;

    const auto window = static_cast<std::size_t>(static_cast<double>(sampleRate) * windowMs / 1000.0);
    const auto hop = static_cast<std::size_t>(static_cast<double>(sampleRate) * hopMs / 1000.0);
    if (window == 0 || hop == 0 || pcm.size() < window) return out;

    out.reserve((pcm.size() - window) / hop + 1);
    for (std::size_t i = 0; i + window <= pcm.size(); i += hop) {
        double acc = 0.0;
        for (std::size_t j = i; j < i + window; ++j) acc += static_cast<double>(pcm[j]) * pcm[j];
        SignalSample s;
        s.timestamp = static_cast<double>(i) / static_cast<double>(sampleRate);
        s.value = std::sqrt(acc / static_cast<double>(window));
        out.push_back(s);
    }
    return out;
}

}  // namespace signals
}  // namespace reelcut
