#include "sds_ggml.h"

#include "sds_error.h"
#include "sds_log.h"

#include "ggml-cpu.h"

#include <cstring>
#include <string>

namespace sds {

GgmlContext::GgmlContext(size_t mem_size) {
    ggml_init_params ip { mem_size, nullptr, false };
    ctx = ggml_init(ip);
    if (!ctx) {
        throw Error("ggml_init failed for " + std::to_string(mem_size) + " bytes");
    }
}

ggml_tensor * to_ggml(ggml_context * ctx, const FloatTensor & t) {
    if (t.rank() > GGML_MAX_DIMS) {
        throw ShapeError("ggml tensors support at most " + std::to_string(GGML_MAX_DIMS) +
                         " dims, got " + shape_to_string(t.shape()));
    }
    int64_t ne[GGML_MAX_DIMS] = {1, 1, 1, 1};
    for (int i = 0; i < t.rank(); ++i) {
        ne[i] = t.dim(t.rank() - 1 - i);
    }
    ggml_tensor * out = ggml_new_tensor(ctx, GGML_TYPE_F32, t.rank(), ne);
    std::memcpy(out->data, t.data(), t.size() * sizeof(float));
    return out;
}

FloatTensor from_ggml(const ggml_tensor * t, int rank) {
    if (t->type != GGML_TYPE_F32) {
        throw ShapeError(std::string("expected an f32 tensor, got ") + ggml_type_name(t->type));
    }
    if (!ggml_is_contiguous(t)) {
        throw ShapeError("expected a contiguous tensor");
    }
    if (!t->data) {
        throw Error("tensor has no data");
    }
    const int n_dims = ggml_n_dims(t);
    if (rank == 0) rank = n_dims;
    if (rank < n_dims || rank > GGML_MAX_DIMS) {
        throw ShapeError("cannot view a " + std::to_string(n_dims) + "-d ggml tensor as rank " + std::to_string(rank));
    }
    Shape shape((size_t)rank);
    for (int i = 0; i < rank; ++i) {
        shape[(size_t)i] = t->ne[rank - 1 - i];
    }
    const float * src = (const float *) t->data;
    std::vector<float> buf(src, src + ggml_nelements(t));
    return FloatTensor(std::move(buf), std::move(shape));
}

TimestepType timestep_type_from_ggml(ggml_type type) {
    switch (type) {
        case GGML_TYPE_I32: return TimestepType::INT32;
        case GGML_TYPE_I64: return TimestepType::INT64;
        case GGML_TYPE_F32: return TimestepType::FLOAT32;
        case GGML_TYPE_F64: return TimestepType::FLOAT64;
        default: break;
    }
    throw ConfigError(std::string("unsupported timestep type ") + ggml_type_name(type));
}

ggml_type timestep_type_to_ggml(TimestepType type) {
    switch (type) {
        case TimestepType::INT32:   return GGML_TYPE_I32;
        case TimestepType::INT64:   return GGML_TYPE_I64;
        case TimestepType::FLOAT32: return GGML_TYPE_F32;
        case TimestepType::FLOAT64: return GGML_TYPE_F64;
    }
    return GGML_TYPE_I64;
}

static ggml_tensor * new_timestep(ggml_context * ctx, const TimestepValue & ts) {
    ggml_tensor * t = ggml_new_tensor_1d(ctx, timestep_type_to_ggml(ts.type), 1);
    switch (ts.type) {
        case TimestepType::INT32:   ((int32_t *) t->data)[0] = ts.as_i32(); break;
        case TimestepType::INT64:   ((int64_t *) t->data)[0] = ts.as_i64(); break;
        case TimestepType::FLOAT32: ((float *)   t->data)[0] = ts.as_f32(); break;
        case TimestepType::FLOAT64: ((double *)  t->data)[0] = ts.as_f64(); break;
    }
    return t;
}

GgmlDenoiser::GgmlDenoiser(GgmlGraphBuilder builder, const GgmlDenoiserParams & p)
    : build(std::move(builder)), params(p), ts_type(timestep_type_from_ggml(p.timestep_type)) {
    if (!build) {
        throw ConfigError("ggml denoiser needs a graph builder");
    }
    if (params.n_threads < 1) {
        throw ConfigError("n_threads must be at least 1, got " + std::to_string(params.n_threads));
    }
}

size_t GgmlDenoiser::estimate_memory(const DenoiseInputs & in) const {
    size_t floats = in.sample.size() * 2 + in.encoder_hidden_states.size();
    if (in.pooled_embedding) floats += in.pooled_embedding->size();
    if (in.time_ids) floats += in.time_ids->size();
    size_t mem = floats * sizeof(float) + 16;
    mem += 8 * ggml_tensor_overhead() + ggml_graph_overhead();
    mem += params.work_mem;
    return mem;
}

FloatTensor GgmlDenoiser::denoise(const DenoiseInputs & in) {
    GgmlContext g(estimate_memory(in));

    GgmlDenoiseInputs gin;
    gin.sample = to_ggml(g.ctx, in.sample);
    gin.encoder_hidden_states = to_ggml(g.ctx, in.encoder_hidden_states);
    gin.timestep = new_timestep(g.ctx, in.timestep);
    if (in.pooled_embedding) gin.pooled = to_ggml(g.ctx, *in.pooled_embedding);
    if (in.time_ids) gin.time_ids = to_ggml(g.ctx, *in.time_ids);

    ggml_tensor * out = build(g.ctx, gin);
    if (!out) {
        throw Error("graph builder returned no output tensor");
    }
    if (out->type != GGML_TYPE_F32) {
        out = ggml_cast(g.ctx, out, GGML_TYPE_F32);
    }
    if (!ggml_is_contiguous(out)) {
        out = ggml_cont(g.ctx, out);
    }

    ggml_cgraph * gf = ggml_new_graph(g.ctx);
    ggml_build_forward_expand(gf, out);
    const ggml_status status = ggml_graph_compute_with_ctx(g.ctx, gf, params.n_threads);
    if (status != GGML_STATUS_SUCCESS) {
        throw Error("graph compute failed with status " + std::to_string((int)status));
    }
    SDS_LOG_DEBUG("ggml denoise: %d nodes, %zu bytes used", ggml_graph_n_nodes(gf), ggml_used_mem(g.ctx));

    return from_ggml(out, in.sample.rank());
}

}
