#include "sds_profile.h"

#include "sds_error.h"
#include "sds_log.h"

#include <fstream>
#include <iterator>
#include <sstream>

namespace sds {

// Position just past the ':' following "key", npos if the key is absent.
static size_t find_value(const std::string & s, const char * key) {
    const std::string k = std::string("\"") + key + "\"";
    size_t i = s.find(k);
    if (i == std::string::npos) return std::string::npos;
    i = s.find(':', i + k.size());
    if (i == std::string::npos) return std::string::npos;
    return i + 1;
}

template <typename T>
static T get_json_number(const std::string & s, const char * key, T def) {
    const size_t i = find_value(s, key);
    if (i == std::string::npos) return def;
    std::stringstream ss(s.substr(i));
    T v;
    ss >> v;
    if (ss.fail()) {
        throw ConfigError(std::string("profile key ") + key + " is not a number");
    }
    return v;
}

static std::string get_json_str(const std::string & s, const char * key, const std::string & def) {
    size_t i = find_value(s, key);
    if (i == std::string::npos) return def;
    i = s.find_first_not_of(" \t\r\n", i);
    if (i == std::string::npos || s[i] != '"') {
        throw ConfigError(std::string("profile key ") + key + " is not a string");
    }
    const size_t j = s.find('"', i + 1);
    if (j == std::string::npos) {
        throw ConfigError(std::string("profile key ") + key + " has an unterminated string");
    }
    return s.substr(i + 1, j - i - 1);
}

SamplerProfile load_profile_json(const std::string & json_path) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        throw ConfigError("failed to open profile " + json_path);
    }
    const std::string s((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    SamplerProfile p;
    p.scheduler           = get_json_str(s, "scheduler", p.scheduler);
    p.steps               = get_json_number(s, "steps", p.steps);
    p.guidance_scale      = get_json_number(s, "guidance_scale", p.guidance_scale);
    p.seed                = get_json_number(s, "seed", p.seed);
    p.batch_size          = get_json_number(s, "batch_size", p.batch_size);
    p.width               = get_json_number(s, "width", p.width);
    p.height              = get_json_number(s, "height", p.height);
    p.num_train_timesteps = get_json_number(s, "num_train_timesteps", p.num_train_timesteps);
    p.beta_start          = get_json_number(s, "beta_start", p.beta_start);
    p.beta_end            = get_json_number(s, "beta_end", p.beta_end);
    p.beta_schedule       = get_json_str(s, "beta_schedule", p.beta_schedule);
    p.prediction_type     = get_json_str(s, "prediction_type", p.prediction_type);

    SDS_LOG_DEBUG("profile %s: %s, %d steps, %dx%d", json_path.c_str(), p.scheduler.c_str(), p.steps, p.width, p.height);
    return p;
}

void save_profile_json(const std::string & json_path, const SamplerProfile & p) {
    std::ofstream f(json_path);
    if (!f.is_open()) {
        throw ConfigError("failed to write profile " + json_path);
    }
    f.precision(9);
    f << "{\n";
    f << "  \"scheduler\": \"" << p.scheduler << "\",\n";
    f << "  \"steps\": " << p.steps << ",\n";
    f << "  \"guidance_scale\": " << p.guidance_scale << ",\n";
    f << "  \"seed\": " << p.seed << ",\n";
    f << "  \"batch_size\": " << p.batch_size << ",\n";
    f << "  \"width\": " << p.width << ",\n";
    f << "  \"height\": " << p.height << ",\n";
    f << "  \"num_train_timesteps\": " << p.num_train_timesteps << ",\n";
    f << "  \"beta_start\": " << p.beta_start << ",\n";
    f << "  \"beta_end\": " << p.beta_end << ",\n";
    f << "  \"beta_schedule\": \"" << p.beta_schedule << "\",\n";
    f << "  \"prediction_type\": \"" << p.prediction_type << "\"\n";
    f << "}\n";
}

SchedulerConfig scheduler_config(const SamplerProfile & p) {
    SchedulerConfig cfg;
    cfg.num_train_timesteps = p.num_train_timesteps;
    cfg.beta_start = p.beta_start;
    cfg.beta_end = p.beta_end;
    cfg.beta_schedule = parse_schedule_type(p.beta_schedule);
    cfg.prediction_type = p.prediction_type;
    return cfg;
}

SchedulerKind scheduler_kind(const SamplerProfile & p) {
    return parse_scheduler_kind(p.scheduler);
}

}
