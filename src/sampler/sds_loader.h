#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace sds {

// Scalar key/value metadata of a GGUF file, values rendered as strings.
struct Metadata {
    std::string path;
    std::unordered_map<std::string, std::string> kv;
};

// Reads the metadata section only; no tensor data is allocated.
// Throws ConfigError if the file cannot be parsed.
Metadata load_metadata(const std::string & path);

inline bool has_kv(const Metadata & m, const std::string & key) {
    return m.kv.find(key) != m.kv.end();
}

inline std::string get_kv(const Metadata & m, const std::string & key) {
    auto it = m.kv.find(key);
    return it == m.kv.end() ? std::string() : it->second;
}

inline std::vector<std::string> kv_keys_with_prefix(const Metadata & m, const std::string & prefix) {
    std::vector<std::string> out;
    for (const auto & kv : m.kv) {
        if (kv.first.rfind(prefix, 0) == 0) {
            out.push_back(kv.first);
        }
    }
    return out;
}

}
