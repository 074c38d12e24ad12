#pragma once

#include "sds_loader.h"
#include "sds_tensor.h"

#include <cstdint>
#include <deque>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace sds {

enum class ScheduleType {
    LINEAR,
    SCALED_LINEAR,
};

enum class SchedulerKind {
    LMS,
    EULER_ANCESTRAL,
};

const char * schedule_type_name(ScheduleType type);
ScheduleType parse_schedule_type(const std::string & name);

// "LMS" / "Euler Ancestral"
const char * scheduler_display_name(SchedulerKind kind);
// "lms" / "euler_a"
const char * scheduler_short_name(SchedulerKind kind);
SchedulerKind parse_scheduler_kind(const std::string & name);

struct SchedulerConfig {
    int num_train_timesteps = 1000;
    float beta_start = 0.00085f;
    float beta_end = 0.012f;
    ScheduleType beta_schedule = ScheduleType::SCALED_LINEAR;
    std::string prediction_type = "epsilon";

    // Reads diffusion.scheduler.* keys; absent keys keep their defaults.
    static SchedulerConfig from_metadata(const Metadata & m);
};

class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Standard deviation of the initial latent noise.
    virtual float init_noise_sigma() const = 0;

    // Discretizes the schedule into num_inference_steps descending timesteps.
    virtual const std::vector<int> & set_timesteps(int num_inference_steps) = 0;
    virtual const std::vector<int> & timesteps() const = 0;

    // Scales a model input by 1/sqrt(sigma^2 + 1) for the given timestep.
    virtual void scale_in_place(FloatTensor & sample, int timestep) const = 0;

    virtual FloatTensor step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample, int order) = 0;

    FloatTensor step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample) {
        return step(noise_pred, timestep, sample, 4);
    }
};

// Beta/alpha/sigma bookkeeping shared by the discrete-time schedulers.
class DiscreteScheduler : public Scheduler {
public:
    explicit DiscreteScheduler(const SchedulerConfig & cfg);

    float init_noise_sigma() const override { return initial_sigma; }
    const std::vector<int> & set_timesteps(int num_inference_steps) override;
    const std::vector<int> & timesteps() const override { return active_timesteps; }
    void scale_in_place(FloatTensor & sample, int timestep) const override;

    const SchedulerConfig & config() const { return cfg; }
    const std::vector<float> & alphas_cumprod() const { return alpha_cumprod; }
    // sigma per training step, index 0 = noisiest
    const std::vector<float> & train_sigmas() const { return train_sigma; }
    // sigma per active timestep plus a trailing 0
    const std::vector<float> & sigmas() const { return active_sigmas; }
    bool configured() const { return !active_timesteps.empty(); }

protected:
    // Throws StateError if unconfigured or timestep is not in the active list.
    int step_index(int timestep) const;
    static void check_same_shape(const FloatTensor & noise_pred, const FloatTensor & sample);
    virtual void on_timesteps_set() {}

    SchedulerConfig cfg;
    std::vector<float> alpha_cumprod;
    std::vector<float> train_sigma;
    float initial_sigma = 0.0f;

    std::vector<int> active_timesteps;
    std::vector<float> active_sigmas;
};

class LMSDiscreteScheduler : public DiscreteScheduler {
public:
    explicit LMSDiscreteScheduler(const SchedulerConfig & cfg = SchedulerConfig());

    using Scheduler::step;
    FloatTensor step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample, int order) override;

    // Integral of the Lagrange basis polynomial current_order over [sigma[t+1], sigma[t]].
    double lms_coefficient(int order, int t, int current_order) const;

    size_t history_size() const { return derivatives.size(); }

protected:
    void on_timesteps_set() override { derivatives.clear(); }

private:
    std::deque<FloatTensor> derivatives;
};

class EulerAncestralDiscreteScheduler : public DiscreteScheduler {
public:
    explicit EulerAncestralDiscreteScheduler(uint64_t seed, const SchedulerConfig & cfg = SchedulerConfig());

    using Scheduler::step;
    // order is accepted for interface compatibility and ignored.
    FloatTensor step(const FloatTensor & noise_pred, int timestep, const FloatTensor & sample, int order) override;

private:
    std::mt19937_64 rng;
    std::normal_distribution<float> normal{0.0f, 1.0f};
};

std::unique_ptr<Scheduler> make_scheduler(SchedulerKind kind, uint64_t seed, const SchedulerConfig & cfg = SchedulerConfig());

}
