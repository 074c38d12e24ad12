#pragma once

#include "sds_tensor.h"

#include <cstdint>

namespace sds {

// Element type the denoising model expects for its timestep input.
enum class TimestepType {
    INT32,
    INT64,
    FLOAT32,
    FLOAT64,
};

const char * timestep_type_name(TimestepType type);

struct TimestepValue {
    TimestepType type = TimestepType::INT64;
    int64_t value = 0;

    static TimestepValue encode(TimestepType type, int timestep) {
        TimestepValue v;
        v.type = type;
        v.value = timestep;
        return v;
    }

    int32_t as_i32() const { return (int32_t)value; }
    int64_t as_i64() const { return value; }
    float   as_f32() const { return (float)value; }
    double  as_f64() const { return (double)value; }
};

// Inputs of one model call. pooled_embedding and time_ids are only set on
// the SDXL path.
struct DenoiseInputs {
    const FloatTensor & sample;
    const FloatTensor & encoder_hidden_states;
    TimestepValue timestep;
    const FloatTensor * pooled_embedding = nullptr;
    const FloatTensor * time_ids = nullptr;
};

class Denoiser {
public:
    virtual ~Denoiser() = default;

    virtual TimestepType timestep_type() const = 0;

    // Predicted noise, expected to have the shape of inputs.sample.
    virtual FloatTensor denoise(const DenoiseInputs & inputs) = 0;
};

}
