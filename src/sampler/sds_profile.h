#pragma once

#include "sds_scheduler.h"

#include <cstdint>
#include <string>

namespace sds {

// Saved sampler settings, one flat JSON object.
struct SamplerProfile {
    std::string scheduler = "lms";
    int32_t steps = 20;
    float   guidance_scale = 7.5f;
    uint64_t seed = 42;
    int32_t batch_size = 1;
    int32_t width = 512;
    int32_t height = 512;

    int32_t num_train_timesteps = 1000;
    float   beta_start = 0.00085f;
    float   beta_end = 0.012f;
    std::string beta_schedule = "scaled_linear";
    std::string prediction_type = "epsilon";
};

// Missing keys keep their defaults. Throws ConfigError if the file cannot
// be read or a present value is malformed.
SamplerProfile load_profile_json(const std::string & json_path);
void save_profile_json(const std::string & json_path, const SamplerProfile & p);

SchedulerConfig scheduler_config(const SamplerProfile & p);
SchedulerKind scheduler_kind(const SamplerProfile & p);

}
