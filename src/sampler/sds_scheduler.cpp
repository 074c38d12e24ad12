#include "sds_scheduler.h"

#include "sds_error.h"
#include "sds_log.h"
#include "sds_math.h"

#include <algorithm>
#include <cmath>

namespace sds {

const char * schedule_type_name(ScheduleType type) {
    switch (type) {
        case ScheduleType::LINEAR:        return "linear";
        case ScheduleType::SCALED_LINEAR: return "scaled_linear";
    }
    return "unknown";
}

ScheduleType parse_schedule_type(const std::string & name) {
    if (name == "linear") return ScheduleType::LINEAR;
    if (name == "scaled_linear") return ScheduleType::SCALED_LINEAR;
    throw ConfigError("unsupported beta schedule '" + name + "'");
}

const char * scheduler_display_name(SchedulerKind kind) {
    switch (kind) {
        case SchedulerKind::LMS:             return "LMS";
        case SchedulerKind::EULER_ANCESTRAL: return "Euler Ancestral";
    }
    return "unknown";
}

const char * scheduler_short_name(SchedulerKind kind) {
    switch (kind) {
        case SchedulerKind::LMS:             return "lms";
        case SchedulerKind::EULER_ANCESTRAL: return "euler_a";
    }
    return "unknown";
}

SchedulerKind parse_scheduler_kind(const std::string & name) {
    if (name == "lms" || name == "LMS") return SchedulerKind::LMS;
    if (name == "euler_a" || name == "Euler Ancestral" || name == "Euler a") return SchedulerKind::EULER_ANCESTRAL;
    throw ConfigError("unknown scheduler '" + name + "'");
}

static int parse_int_kv(const Metadata & m, const std::string & key, int def) {
    if (!has_kv(m, key)) return def;
    const std::string v = get_kv(m, key);
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::logic_error &) {
        throw ConfigError("metadata key " + key + " is not an integer: '" + v + "'");
    }
    if (used != v.size()) {
        throw ConfigError("metadata key " + key + " is not an integer: '" + v + "'");
    }
    return out;
}

static float parse_float_kv(const Metadata & m, const std::string & key, float def) {
    if (!has_kv(m, key)) return def;
    const std::string v = get_kv(m, key);
    size_t used = 0;
    float out = 0.0f;
    try {
        out = std::stof(v, &used);
    } catch (const std::logic_error &) {
        throw ConfigError("metadata key " + key + " is not a number: '" + v + "'");
    }
    if (used != v.size()) {
        throw ConfigError("metadata key " + key + " is not a number: '" + v + "'");
    }
    return out;
}

SchedulerConfig SchedulerConfig::from_metadata(const Metadata & m) {
    SchedulerConfig cfg;
    cfg.num_train_timesteps = parse_int_kv(m, "diffusion.scheduler.num_train_timesteps", cfg.num_train_timesteps);
    cfg.beta_start = parse_float_kv(m, "diffusion.scheduler.beta_start", cfg.beta_start);
    cfg.beta_end = parse_float_kv(m, "diffusion.scheduler.beta_end", cfg.beta_end);
    if (has_kv(m, "diffusion.scheduler.beta_schedule")) {
        cfg.beta_schedule = parse_schedule_type(get_kv(m, "diffusion.scheduler.beta_schedule"));
    }
    if (has_kv(m, "diffusion.scheduler.prediction_type")) {
        cfg.prediction_type = get_kv(m, "diffusion.scheduler.prediction_type");
    }
    return cfg;
}

DiscreteScheduler::DiscreteScheduler(const SchedulerConfig & config) : cfg(config) {
    if (cfg.num_train_timesteps < 2) {
        throw ConfigError("num_train_timesteps must be at least 2, got " + std::to_string(cfg.num_train_timesteps));
    }
    if (cfg.prediction_type != "epsilon") {
        throw ConfigError("unsupported prediction type '" + cfg.prediction_type + "'");
    }

    std::vector<float> betas;
    switch (cfg.beta_schedule) {
        case ScheduleType::LINEAR:
            betas = linspace(cfg.beta_start, cfg.beta_end, cfg.num_train_timesteps, true);
            break;
        case ScheduleType::SCALED_LINEAR:
            betas = linspace(std::sqrt(cfg.beta_start), std::sqrt(cfg.beta_end), cfg.num_train_timesteps, true);
            for (float & b : betas) b = b * b;
            break;
    }

    alpha_cumprod.resize(betas.size());
    float cum_prod = 1.0f;
    for (size_t i = 0; i < betas.size(); ++i) {
        cum_prod *= 1.0f - betas[i];
        alpha_cumprod[i] = cum_prod;
    }

    train_sigma.resize(alpha_cumprod.size());
    float cur_max = -INFINITY;
    for (size_t i = 0; i < alpha_cumprod.size(); ++i) {
        const float a = alpha_cumprod[alpha_cumprod.size() - 1 - i];
        train_sigma[i] = std::sqrt((1.0f - a) / a);
        cur_max = std::max(cur_max, train_sigma[i]);
    }
    initial_sigma = cur_max;

    SDS_LOG_DEBUG("scheduler: %d train steps, betas %s [%g, %g], init sigma %f",
                  cfg.num_train_timesteps, schedule_type_name(cfg.beta_schedule),
                  cfg.beta_start, cfg.beta_end, initial_sigma);
}

const std::vector<int> & DiscreteScheduler::set_timesteps(int num_inference_steps) {
    if (num_inference_steps <= 0) {
        throw ConfigError("invalid number of inference steps, " + std::to_string(num_inference_steps));
    }

    std::vector<float> positions;
    if (num_inference_steps == 1) {
        positions.push_back(0.0f);
    } else {
        positions = linspace(0.0f, (float)(cfg.num_train_timesteps - 1), num_inference_steps, true);
    }

    active_timesteps.resize(positions.size());
    if (num_inference_steps == 1) {
        active_timesteps[0] = cfg.num_train_timesteps - 1;
    } else {
        for (size_t i = 0; i < positions.size(); ++i) {
            active_timesteps[i] = (int)positions[positions.size() - 1 - i];
        }
    }

    const std::vector<float> range = arange(0.0f, (float)train_sigma.size(), 1.0f);
    active_sigmas = interpolate(positions, range, train_sigma);
    active_sigmas.push_back(0.0f);

    on_timesteps_set();
    return active_timesteps;
}

int DiscreteScheduler::step_index(int timestep) const {
    if (!configured()) {
        throw StateError("set_timesteps must be called before stepping");
    }
    const int idx = find_index(active_timesteps, timestep);
    if (idx < 0) {
        throw StateError("timestep " + std::to_string(timestep) + " is not in the active schedule");
    }
    return idx;
}

void DiscreteScheduler::check_same_shape(const FloatTensor & noise_pred, const FloatTensor & sample) {
    if (noise_pred.shape() != sample.shape()) {
        throw ShapeError("noise prediction shape " + shape_to_string(noise_pred.shape()) +
                         " does not match sample shape " + shape_to_string(sample.shape()));
    }
}

void DiscreteScheduler::scale_in_place(FloatTensor & sample, int timestep) const {
    const float sigma = active_sigmas[(size_t)step_index(timestep)];
    sample.scale(1.0f / std::sqrt(sigma * sigma + 1.0f));
}

std::unique_ptr<Scheduler> make_scheduler(SchedulerKind kind, uint64_t seed, const SchedulerConfig & cfg) {
    switch (kind) {
        case SchedulerKind::LMS:
            return std::unique_ptr<Scheduler>(new LMSDiscreteScheduler(cfg));
        case SchedulerKind::EULER_ANCESTRAL:
            return std::unique_ptr<Scheduler>(new EulerAncestralDiscreteScheduler(seed, cfg));
    }
    throw ConfigError("unknown scheduler kind");
}

}
