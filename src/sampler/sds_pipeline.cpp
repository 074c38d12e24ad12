#include "sds_pipeline.h"

#include "sds_error.h"
#include "sds_log.h"

#include "ggml.h"

#include <algorithm>
#include <string>

namespace sds {

const char * timestep_type_name(TimestepType type) {
    switch (type) {
        case TimestepType::INT32:   return "i32";
        case TimestepType::INT64:   return "i64";
        case TimestepType::FLOAT32: return "f32";
        case TimestepType::FLOAT64: return "f64";
    }
    return "unknown";
}

AuxConditioning AuxConditioning::for_size(int height, int width) {
    AuxConditioning a;
    a.original_height = (float)height;
    a.original_width = (float)width;
    a.target_height = (float)height;
    a.target_width = (float)width;
    return a;
}

void validate(const SamplingRequest & req) {
    if (req.steps < 1) {
        throw ConfigError("steps must be at least 1, got " + std::to_string(req.steps));
    }
    if (req.batch_size < 1) {
        throw ConfigError("batch size must be at least 1, got " + std::to_string(req.batch_size));
    }
    if (req.height <= 0 || req.height % kLatentDownscale != 0 ||
        req.width <= 0 || req.width % kLatentDownscale != 0) {
        throw ConfigError("image size must be a positive multiple of 8, got " +
                          std::to_string(req.width) + "x" + std::to_string(req.height));
    }
    if (!req.text_embedding) {
        throw ConfigError("missing text embedding");
    }
    const int64_t expected = req.guided() ? 2 * (int64_t)req.batch_size : (int64_t)req.batch_size;
    if (req.text_embedding->rank() < 1 || req.text_embedding->dim(0) != expected) {
        throw ConfigError("text embedding " + shape_to_string(req.text_embedding->shape()) +
                          " does not have leading dimension " + std::to_string(expected));
    }
}

FloatTensor sample_initial_latent(int batch_size, int height, int width, float sigma, uint64_t seed) {
    FloatTensor latent(Shape{batch_size, kLatentChannels, height / kLatentDownscale, width / kLatentDownscale});
    std::mt19937_64 rng(seed);
    std::normal_distribution<float> normal(0.0f, sigma);
    for (size_t i = 0; i < latent.size(); ++i) {
        latent[i] = normal(rng);
    }
    return latent;
}

FloatTensor duplicate_batch(const FloatTensor & latent) {
    Shape shape = latent.shape();
    shape[0] *= 2;
    std::vector<float> buf;
    buf.reserve(latent.size() * 2);
    buf.insert(buf.end(), latent.values().begin(), latent.values().end());
    buf.insert(buf.end(), latent.values().begin(), latent.values().end());
    return FloatTensor(std::move(buf), std::move(shape));
}

FloatTensor build_time_ids(const AuxConditioning & aux, int rows) {
    const std::array<float, 6> row = aux.values();
    FloatTensor ids(Shape{rows, (int64_t)row.size()});
    for (int r = 0; r < rows; ++r) {
        std::copy(row.begin(), row.end(), ids.data() + (size_t)r * row.size());
    }
    return ids;
}

FloatTensor apply_guidance(const FloatTensor & noise_pred, float scale) {
    if (noise_pred.rank() < 1 || noise_pred.dim(0) % 2 != 0) {
        throw ShapeError("guided noise prediction needs an even batch, got " + shape_to_string(noise_pred.shape()));
    }
    Shape half = noise_pred.shape();
    half[0] /= 2;
    std::vector<FloatTensor> parts = noise_pred.split(half);
    FloatTensor & uncond = parts[0];
    const FloatTensor & text = parts[1];
    for (size_t i = 0; i < uncond.size(); ++i) {
        uncond[i] = uncond[i] + scale * (text[i] - uncond[i]);
    }
    return std::move(uncond);
}

static void check_embedding(const FloatTensor & e, const char * what) {
    if (e.rank() != 3 || e.dim(0) != 1) {
        throw ShapeError(std::string(what) + " embedding must be [1, tokens, dim], got " + shape_to_string(e.shape()));
    }
}

FloatTensor build_embedding_batch(const FloatTensor & uncond, const FloatTensor & cond, int batch_size) {
    check_embedding(uncond, "unconditional");
    check_embedding(cond, "conditional");
    if (uncond.shape() != cond.shape()) {
        throw ShapeError("embedding shapes differ, " + shape_to_string(uncond.shape()) + " vs " + shape_to_string(cond.shape()));
    }
    if (batch_size < 1) {
        throw ConfigError("batch size must be at least 1, got " + std::to_string(batch_size));
    }
    std::vector<float> buf;
    buf.reserve(cond.size() * 2 * (size_t)batch_size);
    for (int i = 0; i < batch_size; ++i) buf.insert(buf.end(), uncond.values().begin(), uncond.values().end());
    for (int i = 0; i < batch_size; ++i) buf.insert(buf.end(), cond.values().begin(), cond.values().end());
    return FloatTensor(std::move(buf), {2 * (int64_t)batch_size, cond.dim(1), cond.dim(2)});
}

FloatTensor build_embedding_batch(const FloatTensor & cond, int batch_size) {
    check_embedding(cond, "conditional");
    if (batch_size < 1) {
        throw ConfigError("batch size must be at least 1, got " + std::to_string(batch_size));
    }
    std::vector<float> buf;
    buf.reserve(cond.size() * (size_t)batch_size);
    for (int i = 0; i < batch_size; ++i) buf.insert(buf.end(), cond.values().begin(), cond.values().end());
    return FloatTensor(std::move(buf), {(int64_t)batch_size, cond.dim(1), cond.dim(2)});
}

FloatTensor unscale_latents(const FloatTensor & latents, float scaling_factor) {
    if (!(scaling_factor > 0.0f)) {
        throw ConfigError("latent scaling factor must be positive, got " + std::to_string(scaling_factor));
    }
    FloatTensor out = latents.copy();
    out.scale(1.0f / scaling_factor);
    return out;
}

FloatTensor sample_latents(const SamplingRequest & req, Denoiser & denoiser, const StepCallback & on_step) {
    validate(req);
    ggml_time_init();
    const int64_t t_start = ggml_time_ms();

    std::mt19937_64 run_rng(req.seed);
    std::unique_ptr<Scheduler> scheduler = make_scheduler(req.scheduler, run_rng(), req.scheduler_config);
    const std::vector<int> timesteps = scheduler->set_timesteps(req.steps);

    FloatTensor latents = sample_initial_latent(req.batch_size, req.height, req.width,
                                                scheduler->init_noise_sigma(), req.seed);

    const bool guided = req.guided();
    const bool sdxl = req.pooled_embedding != nullptr;
    const TimestepType ts_type = denoiser.timestep_type();
    SDS_LOG_INFO("sampling %d steps with %s, %dx%d batch %d, seed %llu",
                 req.steps, scheduler_display_name(req.scheduler), req.width, req.height,
                 req.batch_size, (unsigned long long)req.seed);
    SDS_LOG_INFO("classifier free guidance = %s (scale %.2f)", guided ? "true" : "false", req.guidance_scale);
    SDS_LOG_INFO("%s inference, timestep type %s", sdxl ? "SDXL" : "SD", timestep_type_name(ts_type));

    const FloatTensor time_ids = build_time_ids(req.aux_conditioning(), guided ? 2 * req.batch_size : req.batch_size);

    for (size_t t = 0; t < timesteps.size(); ++t) {
        const int timestep = timesteps[t];
        SDS_LOG_DEBUG("step %zu/%zu, timestep %d", t + 1, timesteps.size(), timestep);

        FloatTensor model_input = guided ? duplicate_batch(latents) : latents.copy();
        scheduler->scale_in_place(model_input, timestep);

        DenoiseInputs inputs{model_input, *req.text_embedding, TimestepValue::encode(ts_type, timestep),
                             sdxl ? req.pooled_embedding : nullptr, sdxl ? &time_ids : nullptr};
        FloatTensor noise_pred = denoiser.denoise(inputs);
        if (noise_pred.shape() != model_input.shape()) {
            throw ShapeError("expected output shape " + shape_to_string(model_input.shape()) +
                             ", found " + shape_to_string(noise_pred.shape()));
        }

        if (guided) {
            noise_pred = apply_guidance(noise_pred, req.guidance_scale);
        }

        latents = scheduler->step(noise_pred, timestep, latents, 4);

        if (on_step) {
            on_step((int)t + 1);
        }
    }

    SDS_LOG_INFO("sampling done in %.2fs", (ggml_time_ms() - t_start) / 1000.0);
    return latents;
}

}
