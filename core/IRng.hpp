#pragma once

#include <cstdint>
#include <random>

namespace metersim {

class IRng {
public:
    virtual ~IRng() = default;

    /// Uniform value in [min, max]; min == max returns min
    virtual double uniform(double min, double max) = 0;
};

class StandardRng : public IRng {
private:
    std::mt19937_64 gen_;

public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(std::uint64_t seed) : gen_(seed) {}

    double uniform(double min, double max) override {
        if (!(max > min)) {
            return min;
        }
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }
};

} // namespace metersim
