#include "sds_loader.h"

#include "sds_error.h"
#include "sds_log.h"

#include "gguf.h"

#include <memory>

namespace sds {

namespace {

struct GgufDeleter {
    void operator()(gguf_context * uf) const { gguf_free(uf); }
};

using GgufPtr = std::unique_ptr<gguf_context, GgufDeleter>;

}

static std::string kv_to_str(const gguf_context * uf, int64_t i) {
    switch (gguf_get_kv_type(uf, i)) {
        case GGUF_TYPE_STRING:  return gguf_get_val_str(uf, i);
        case GGUF_TYPE_UINT8:   return std::to_string((int)gguf_get_val_u8(uf, i));
        case GGUF_TYPE_INT8:    return std::to_string((int)gguf_get_val_i8(uf, i));
        case GGUF_TYPE_UINT16:  return std::to_string((int)gguf_get_val_u16(uf, i));
        case GGUF_TYPE_INT16:   return std::to_string((int)gguf_get_val_i16(uf, i));
        case GGUF_TYPE_UINT32:  return std::to_string(gguf_get_val_u32(uf, i));
        case GGUF_TYPE_INT32:   return std::to_string(gguf_get_val_i32(uf, i));
        case GGUF_TYPE_UINT64:  return std::to_string((unsigned long long)gguf_get_val_u64(uf, i));
        case GGUF_TYPE_INT64:   return std::to_string((long long)gguf_get_val_i64(uf, i));
        case GGUF_TYPE_FLOAT32: return std::to_string(gguf_get_val_f32(uf, i));
        case GGUF_TYPE_FLOAT64: return std::to_string(gguf_get_val_f64(uf, i));
        case GGUF_TYPE_BOOL:    return gguf_get_val_bool(uf, i) ? "true" : "false";
        default:                return std::string();
    }
}

Metadata load_metadata(const std::string & path) {
    gguf_init_params params { true, nullptr };
    GgufPtr uf(gguf_init_from_file(path.c_str(), params));
    if (!uf) {
        throw ConfigError("failed to open gguf metadata from '" + path + "'");
    }

    Metadata m;
    m.path = path;
    const int64_t n_kv = gguf_get_n_kv(uf.get());
    m.kv.reserve((size_t)n_kv);
    for (int64_t i = 0; i < n_kv; ++i) {
        if (gguf_get_kv_type(uf.get(), i) == GGUF_TYPE_ARRAY) continue;
        m.kv.emplace(std::string(gguf_get_key(uf.get(), i)), kv_to_str(uf.get(), i));
    }
    SDS_LOG_DEBUG("read %zu metadata keys from '%s'", m.kv.size(), path.c_str());
    return m;
}

}
