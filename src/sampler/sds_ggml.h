#pragma once

#include "sds_denoiser.h"
#include "sds_tensor.h"

#include "ggml.h"

#include <cstddef>
#include <functional>

namespace sds {

// Owns a ggml_context for the lifetime of one model call.
struct GgmlContext {
    ggml_context * ctx = nullptr;

    explicit GgmlContext(size_t mem_size);
    GgmlContext(const GgmlContext &) = delete;
    GgmlContext & operator=(const GgmlContext &) = delete;
    GgmlContext(GgmlContext && other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    GgmlContext & operator=(GgmlContext && other) noexcept {
        if (this != &other) {
            release();
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    ~GgmlContext() { release(); }

    void release() {
        if (ctx) {
            ggml_free(ctx);
            ctx = nullptr;
        }
    }
};

// New F32 tensor holding a copy of t. ggml ne[] is the reversed shape, so a
// [B,C,H,W] tensor becomes ne = {W,H,C,B}. Throws ShapeError above rank 4.
ggml_tensor * to_ggml(ggml_context * ctx, const FloatTensor & t);

// Copies an F32 contiguous ggml tensor back, rank = ggml_n_dims(t) unless a
// larger rank is requested (leading dims of 1 are added).
FloatTensor from_ggml(const ggml_tensor * t, int rank = 0);

// I32, I64, F32 and F64 map to a timestep type; others are a ConfigError.
TimestepType timestep_type_from_ggml(ggml_type type);
ggml_type timestep_type_to_ggml(TimestepType type);

// Graph inputs handed to a GgmlGraphBuilder. pooled and time_ids are null
// outside the SDXL path.
struct GgmlDenoiseInputs {
    ggml_tensor * sample = nullptr;
    ggml_tensor * encoder_hidden_states = nullptr;
    ggml_tensor * timestep = nullptr;
    ggml_tensor * pooled = nullptr;
    ggml_tensor * time_ids = nullptr;
};

using GgmlGraphBuilder = std::function<ggml_tensor *(ggml_context *, const GgmlDenoiseInputs &)>;

struct GgmlDenoiserParams {
    ggml_type timestep_type = GGML_TYPE_I64;
    int n_threads = 1;
    // extra bytes on top of the input/output estimate for graph intermediates
    size_t work_mem = 64ull * 1024ull * 1024ull;
};

// Runs a ggml forward graph on the CPU for every denoise call.
class GgmlDenoiser : public Denoiser {
public:
    GgmlDenoiser(GgmlGraphBuilder builder, const GgmlDenoiserParams & params = GgmlDenoiserParams());

    TimestepType timestep_type() const override { return ts_type; }
    FloatTensor denoise(const DenoiseInputs & inputs) override;

    size_t estimate_memory(const DenoiseInputs & inputs) const;

private:
    GgmlGraphBuilder build;
    GgmlDenoiserParams params;
    TimestepType ts_type;
};

}
