#include "sds_math.h"

#include "sds_error.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace sds {

std::vector<float> linspace(float start, float end, int num_steps, bool include_end) {
    if (end <= start) {
        throw ConfigError("invalid range, end must be strictly greater than start");
    }
    if (num_steps <= 0) {
        throw ConfigError("invalid number of steps, " + std::to_string(num_steps));
    }
    if (include_end && num_steps == 1) {
        return {start};
    }
    const float step = (end - start) / (float)(include_end ? num_steps - 1 : num_steps);
    std::vector<float> out((size_t)num_steps);
    for (int i = 0; i < num_steps; ++i) {
        out[(size_t)i] = start + ((float)i * step);
    }
    return out;
}

std::vector<float> arange(float start, float end, float step) {
    if (end <= start) {
        throw ConfigError("invalid range, end must be strictly greater than start");
    }
    if (step <= 0.00001f) {
        throw ConfigError("invalid step size " + std::to_string(step) + ", must be positive");
    }
    const int n = (int)std::lround(std::ceil((end - start) / step));
    std::vector<float> out((size_t)n);
    for (int i = 0; i < n; ++i) {
        out[(size_t)i] = start + ((float)i * step);
    }
    return out;
}

std::vector<float> interpolate(const std::vector<float> & queries,
                               const std::vector<float> & sorted_range,
                               const std::vector<float> & values) {
    if (sorted_range.empty() || sorted_range.size() != values.size()) {
        throw ConfigError("interpolation range and values must be non-empty and of equal length");
    }
    std::vector<float> out(queries.size());
    for (size_t i = 0; i < queries.size(); ++i) {
        const float q = queries[i];
        auto it = std::lower_bound(sorted_range.begin(), sorted_range.end(), q);
        const size_t hi = (size_t)(it - sorted_range.begin());
        if (hi < sorted_range.size() && sorted_range[hi] == q) {
            out[i] = values[hi];
        } else if (hi == 0) {
            out[i] = values.front();
        } else if (hi == sorted_range.size()) {
            out[i] = values.back();
        } else {
            const size_t lo = hi - 1;
            const float t = (q - sorted_range[lo]) / (sorted_range[hi] - sorted_range[lo]);
            out[i] = values[lo] + t * (values[hi] - values[lo]);
        }
    }
    return out;
}

int find_index(const std::vector<int> & values, int target) {
    int idx = -1;
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] == target) idx = (int)i;
    }
    return idx;
}

double integrate(const std::function<double(double)> & f, double lower, double upper, int max_eval) {
    const int min_iterations = 3;
    const int max_iterations = 32;
    const double rel_accuracy = 1.0e-6;
    const double abs_accuracy = 1.0e-15;

    int evals = 0;
    auto eval = [&](double x) {
        if (++evals > max_eval) {
            throw ConfigError("integration did not converge within " + std::to_string(max_eval) + " evaluations");
        }
        return f(x);
    };

    // successive trapezoid refinements, stage n adds 2^(n-1) midpoints
    double trap = 0.0;
    auto trapezoid_stage = [&](int n) {
        const double width = upper - lower;
        if (n == 0) {
            trap = 0.5 * width * (eval(lower) + eval(upper));
            return trap;
        }
        const long n_points = 1L << (n - 1);
        const double spacing = width / (double)n_points;
        double x = lower + 0.5 * spacing;
        double sum = 0.0;
        for (long j = 0; j < n_points; ++j) {
            sum += eval(x);
            x += spacing;
        }
        trap = 0.5 * (trap + sum * spacing);
        return trap;
    };

    std::vector<double> prev_row(max_iterations + 1, 0.0);
    std::vector<double> cur_row(max_iterations + 1, 0.0);
    prev_row[0] = trapezoid_stage(0);
    double olds = prev_row[0];
    for (int i = 1; i <= max_iterations; ++i) {
        cur_row[0] = trapezoid_stage(i);
        double factor = 1.0;
        for (int j = 1; j <= i; ++j) {
            factor *= 4.0;
            cur_row[j] = cur_row[j - 1] + (cur_row[j - 1] - prev_row[j - 1]) / (factor - 1.0);
        }
        const double s = cur_row[i];
        if (i >= min_iterations) {
            const double delta = std::fabs(s - olds);
            const double rlimit = rel_accuracy * (std::fabs(olds) + std::fabs(s)) * 0.5;
            if (delta <= rlimit || delta <= abs_accuracy) {
                return s;
            }
        }
        olds = s;
        std::swap(prev_row, cur_row);
    }
    throw ConfigError("integration did not converge within " + std::to_string(max_iterations) + " iterations");
}

}
