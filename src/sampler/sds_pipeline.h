#pragma once

#include "sds_denoiser.h"
#include "sds_scheduler.h"
#include "sds_tensor.h"

#include <array>
#include <cstdint>
#include <functional>
#include <random>

namespace sds {

constexpr int kLatentChannels = 4;
constexpr int kLatentDownscale = 8;
constexpr float kDefaultLatentScale = 0.18215f;

// SDXL micro-conditioning: original size, crop offset, target size.
struct AuxConditioning {
    float original_height = 0.0f;
    float original_width = 0.0f;
    float crop_top = 0.0f;
    float crop_left = 0.0f;
    float target_height = 0.0f;
    float target_width = 0.0f;

    static AuxConditioning for_size(int height, int width);

    std::array<float, 6> values() const {
        return {original_height, original_width, crop_top, crop_left, target_height, target_width};
    }
};

struct SamplingRequest {
    int steps = 20;
    float guidance_scale = 7.5f;
    int batch_size = 1;
    int height = 512;
    int width = 512;
    uint64_t seed = 0;
    SchedulerKind scheduler = SchedulerKind::LMS;
    SchedulerConfig scheduler_config;

    // [2*batch, tokens, dim] with guidance, [batch, tokens, dim] without
    const FloatTensor * text_embedding = nullptr;
    // present only for SDXL
    const FloatTensor * pooled_embedding = nullptr;

    bool has_aux = false;
    AuxConditioning aux;

    bool guided() const { return guidance_scale >= 1.0f; }
    AuxConditioning aux_conditioning() const { return has_aux ? aux : AuxConditioning::for_size(height, width); }
};

// Throws ConfigError on invalid steps, batch, size or embedding batch.
void validate(const SamplingRequest & req);

// [batch, 4, height/8, width/8] of N(0, sigma) drawn from a generator seeded with seed.
FloatTensor sample_initial_latent(int batch_size, int height, int width, float sigma, uint64_t seed);

// Stacks two copies of the batch, [B, ...] -> [2B, ...].
FloatTensor duplicate_batch(const FloatTensor & latent);

// [rows, 6], one aux row per batch entry.
FloatTensor build_time_ids(const AuxConditioning & aux, int rows);

// uncond + scale * (text - uncond) where noise_pred is [2B, ...] with the
// unconditional half first.
FloatTensor apply_guidance(const FloatTensor & noise_pred, float scale);

// [2*batch, tokens, dim] with all unconditional rows before the conditional ones.
FloatTensor build_embedding_batch(const FloatTensor & uncond, const FloatTensor & cond, int batch_size);
// [batch, tokens, dim]
FloatTensor build_embedding_batch(const FloatTensor & cond, int batch_size);

// latents / scaling_factor, ready for the decoder.
FloatTensor unscale_latents(const FloatTensor & latents, float scaling_factor = kDefaultLatentScale);

using StepCallback = std::function<void(int)>;

// Runs the full denoising loop and returns the final latent.
// on_step receives the 1-based index of each completed step.
FloatTensor sample_latents(const SamplingRequest & req, Denoiser & denoiser, const StepCallback & on_step = nullptr);

}
