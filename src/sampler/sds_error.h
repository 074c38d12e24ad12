#pragma once

#include <stdexcept>
#include <string>

namespace sds {

struct Error : std::runtime_error {
    explicit Error(const std::string & what) : std::runtime_error(what) {}
};

// invalid numeric ranges, step counts or configuration values
struct ConfigError : Error {
    explicit ConfigError(const std::string & what) : Error(what) {}
};

// tensor shape or rank mismatch
struct ShapeError : Error {
    explicit ShapeError(const std::string & what) : Error(what) {}
};

// scheduler used out of order or with an unknown timestep
struct StateError : Error {
    explicit StateError(const std::string & what) : Error(what) {}
};

}
