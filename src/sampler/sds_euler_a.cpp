#include "sds_scheduler.h"

#include "sds_log.h"

#include <algorithm>
#include <cmath>

namespace sds {

EulerAncestralDiscreteScheduler::EulerAncestralDiscreteScheduler(uint64_t seed, const SchedulerConfig & cfg)
    : DiscreteScheduler(cfg), rng(seed) {}

FloatTensor EulerAncestralDiscreteScheduler::step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample, int /*order*/) {
    const int idx = step_index(timestep);
    check_same_shape(noise_pred, sample);

    const float sigma_from = active_sigmas[(size_t)idx];
    const float sigma_to = active_sigmas[(size_t)idx + 1];
    const float sigma_up = std::sqrt(sigma_to * sigma_to * (sigma_from * sigma_from - sigma_to * sigma_to) /
                                     (sigma_from * sigma_from));
    const float sigma_down = std::sqrt(std::max(0.0f, sigma_to * sigma_to - sigma_up * sigma_up));
    const float dt = sigma_down - sigma_from;

    FloatTensor prev_sample(sample.shape());
    for (size_t i = 0; i < sample.size(); ++i) {
        const float pred_original = sample[i] - sigma_from * noise_pred[i];
        const float derivative = (sample[i] - pred_original) / sigma_from;
        prev_sample[i] = sample[i] + derivative * dt + normal(rng) * sigma_up;
    }

    SDS_LOG_DEBUG("euler_a step %d (t=%d): sigma %f, down %f, up %f", idx, timestep, sigma_from, sigma_down, sigma_up);
    return prev_sample;
}

}
