#include "reelcut/Normalization.h"
#include "reelcut/CoreContract.h"

#include <algorithm>
#include <cmath>

namespace reelcut {

std::vector<SignalSample> sanitize_series(std::vector<SignalSample> samples) {
    samples.erase(std::remove_if(samples.begin(), samples.end(),
                                 [](const SignalSample& s) {
                                     return !std::isfinite(s.timestamp) || !std::isfinite(s.value);
                                 }),
                  samples.end());
    std::stable_sort(samples.begin(), samples.end(),
                     [](const SignalSample& a, const SignalSample& b) { return a.timestamp < b.timestamp; });
    return samples;
}

NormalizedSignal normalize_signal(const RawSignal& raw) {
    NormalizedSignal out;
    out.kind = raw.kind;
    out.samples = sanitize_series(raw.samples);
    if (out.samples.empty()) return out;

    auto [lo_it, hi_it] = std::minmax_element(out.samples.begin(), out.samples.end(),
                                              [](const SignalSample& a, const SignalSample& b) {
                                                  return a.value < b.value;
                                              });
    double lo = lo_it->value;
    const double hi = hi_it->value;
    if (raw.impulse) lo = std::min(lo, 0.0);

    const double range = hi - lo;
    if (!(range > 1e-12)) {
        for (auto& s : out.samples) s.value = 0.5;
        return out;
    }
    for (auto& s : out.samples) s.value = std::clamp((s.value - lo) / range, 0.0, 1.0);
    return out;
}

std::size_t timeline_length(double duration, double step) {
    if (!(duration > 0.0) || !(step > 0.0)) return 1;
    const double n = std::ceil(duration / step - contract::TIME_EPS);
    return std::max<std::size_t>(1, static_cast<std::size_t>(n));
}

std::vector<double> decay_kernel(double step, double decayWindow) {
    std::vector<double> kernel{1.0};
    if (!(decayWindow > 0.0) || !(step > 0.0)) return kernel;
    for (std::size_t d = 1;; ++d) {
        const double dt = static_cast<double>(d) * step;
        if (dt >= decayWindow - contract::TIME_EPS) break;
        kernel.push_back(1.0 - dt / decayWindow);
    }
    return kernel;
}

std::vector<double> resample_with_decay(const NormalizedSignal& signal,
                                        double duration,
                                        double step,
                                        double decayWindow) {
    const std::size_t N = timeline_length(duration, step);
    std::vector<double> bins(N, 0.0);
    for (const auto& s : signal.samples) {
        if (s.timestamp < 0.0 || s.timestamp >= duration) continue;
        const auto k = std::min(N - 1, static_cast<std::size_t>(std::floor(s.timestamp / step + contract::TIME_EPS)));
        bins[k] = std::max(bins[k], s.value);
    }

    const std::vector<double> kernel = decay_kernel(step, decayWindow);
    std::vector<double> out(N, 0.0);
    for (std::size_t k = 0; k < N; ++k) {
        double acc = 0.0;
        const std::size_t reach = std::min(kernel.size(), k + 1);
        for (std::size_t d = 0; d < reach; ++d) acc = std::max(acc, bins[k - d] * kernel[d]);
        out[k] = acc;
    }
    return out;
}

}  // namespace reelcut
