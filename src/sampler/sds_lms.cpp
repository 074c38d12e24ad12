#include "sds_scheduler.h"

#include "sds_error.h"
#include "sds_log.h"
#include "sds_math.h"

#include <algorithm>

namespace sds {

LMSDiscreteScheduler::LMSDiscreteScheduler(const SchedulerConfig & cfg) : DiscreteScheduler(cfg) {}

double LMSDiscreteScheduler::lms_coefficient(int order, int t, int current_order) const {
    const std::vector<float> & s = active_sigmas;
    auto basis = [&](double tau) {
        double prod = 1.0;
        for (int k = 0; k < order; ++k) {
            if (k == current_order) continue;
            prod *= (tau - s[(size_t)(t - k)]) / (s[(size_t)(t - current_order)] - s[(size_t)(t - k)]);
        }
        return prod;
    };
    // integrated upward from sigma[t+1] and negated, sigmas descend with t
    return -integrate(basis, s[(size_t)t + 1], s[(size_t)t]);
}

FloatTensor LMSDiscreteScheduler::step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample, int order) {
    if (order <= 0) {
        throw ConfigError("invalid multistep order " + std::to_string(order));
    }
    const int idx = step_index(timestep);
    check_same_shape(noise_pred, sample);
    const float sigma = active_sigmas[(size_t)idx];

    // x0 = sample - sigma * eps, d = (sample - x0) / sigma
    FloatTensor derivative(sample.shape());
    for (size_t i = 0; i < sample.size(); ++i) {
        const float pred_original = sample[i] - sigma * noise_pred[i];
        derivative[i] = (sample[i] - pred_original) / sigma;
    }
    derivatives.push_back(std::move(derivative));
    while ((int)derivatives.size() > order) {
        derivatives.pop_front();
    }

    const int order_lim = std::min(idx + 1, order);
    if ((int)derivatives.size() < order_lim) {
        throw StateError("derivative history holds " + std::to_string(derivatives.size()) +
                         " entries but step " + std::to_string(idx) + " needs " + std::to_string(order_lim));
    }
    std::vector<double> coeffs((size_t)order_lim);
    for (int cur = 0; cur < order_lim; ++cur) {
        coeffs[(size_t)cur] = lms_coefficient(order_lim, idx, cur);
    }

    // most recent derivative pairs with the first coefficient
    FloatTensor prev_sample = sample.copy();
    auto hist = derivatives.rbegin();
    for (int m = 0; m < order_lim; ++m, ++hist) {
        const float c = (float)coeffs[(size_t)m];
        const FloatTensor & d = *hist;
        for (size_t i = 0; i < prev_sample.size(); ++i) {
            prev_sample[i] += c * d[i];
        }
    }

    SDS_LOG_DEBUG("lms step %d (t=%d): sigma %f -> %f, order %d", idx, timestep, sigma,
                  active_sigmas[(size_t)idx + 1], order_lim);
    return prev_sample;
}

}
