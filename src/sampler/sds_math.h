#pragma once

#include <functional>
#include <vector>

namespace sds {

// Evenly spaced values from start. Throws ConfigError if end <= start or num_steps <= 0.
std::vector<float> linspace(float start, float end, int num_steps, bool include_end);

// start, start + step, ... below end. Throws ConfigError if end <= start or step <= 1e-5.
std::vector<float> arange(float start, float end, float step);

// Piecewise-linear lookup of each query in sorted_range. Queries below the
// first range entry take values.front(), queries above the last take
// values.back().
std::vector<float> interpolate(const std::vector<float> & queries,
                               const std::vector<float> & sorted_range,
                               const std::vector<float> & values);

// Index of the last element equal to target, -1 if absent.
int find_index(const std::vector<int> & values, int target);

// Romberg quadrature of f over [lower, upper] using at most max_eval
// function evaluations. Throws ConfigError if it does not converge.
double integrate(const std::function<double(double)> & f, double lower, double upper, int max_eval = 50);

}
