#pragma once

#include "reelcut/ClipTypes.h"

#include <cstddef>
#include <vector>

namespace reelcut {

// ---------- series hygiene ----------

// Drop non-finite samples and order by timestamp (stable for equal timestamps).
std::vector<SignalSample> sanitize_series(std::vector<SignalSample> samples);

// ---------- normalization ----------

/**
 * Min-max rescale to [0,1] over the signal's own observed range.
 * Impulse signals include their implicit 0 baseline in the range.
 * A constant signal (min == max) maps to a flat 0.5.
 */
NormalizedSignal normalize_signal(const RawSignal& raw);

// ---------- fixed-step timeline ----------

// Number of grid points covering [0, duration): ceil(duration / step), at least 1.
std::size_t timeline_length(double duration, double step);

// kernel[d] = 1 - d*step/decayWindow for every d with d*step < decayWindow; kernel[0] = 1 always.
std::vector<double> decay_kernel(double step, double decayWindow);

/**
 * Sparse-to-dense resampling with linear decay.
 *
 * Samples are binned to floor(t/step) (bin = max of its samples), then
 * out[k] = max_d bin[k-d] * kernel[d]. Samples outside [0, duration) are ignored.
 */
std::vector<double> resample_with_decay(const NormalizedSignal& signal,
                                        double duration,
                                        double step,
                                        double decayWindow);

}  // namespace reelcut
