#pragma once

#include <cstdint>
#include <random>

namespace fa {

// Per-episode random source. Every random draw of an episode goes through one
// instance so a seed fully determines the run.
class DeterministicRng {
  public:
    explicit DeterministicRng(uint64_t seed = 0) : eng_(seed) {}

    void reseed(uint64_t seed) { eng_.seed(seed); }

    float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(eng_);
    }

    // Heading in degrees, [-180, 180).
    float heading() { return uniform(-180.0f, 180.0f); }

  private:
    std::mt19937_64 eng_;
};

} // namespace fa
