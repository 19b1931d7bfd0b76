#pragma once

#include <stdint.h>
#include <memory>
#include <random>
#include <stdexcept>

#include "tinyformat/tinyformat.h"

namespace hamgen {

// From http://xoroshiro.di.unimi.it/splitmix64.c
class splitmix64 {
  public:
    splitmix64(uint64_t seed) : x(seed){};

    uint64_t next() {
        uint64_t z = (x += uint64_t(0x9E3779B97F4A7C15));
        z = (z ^ (z >> 30)) * uint64_t(0xBF58476D1CE4E5B9);
        z = (z ^ (z >> 27)) * uint64_t(0x94D049BB133111EB);
        return z ^ (z >> 31);
    }

  private:
    uint64_t x;
};

// Uniform integers in a half-open range [beg, end).
class random_source {
  public:
    virtual ~random_source() {}

    virtual uint64_t uniform(uint64_t beg, uint64_t end) = 0;

  protected:
    static void check_range(uint64_t beg, uint64_t end) {
        if (beg >= end) {
            throw std::invalid_argument(tfm::format("empty range [%d, %d)", beg, end));
        }
    }
};

// Output depends only on the seed, so lists are reproducible across platforms.
class splitmix_source : public random_source {
  private:
    splitmix64 m_engine;

  public:
    explicit splitmix_source(uint64_t seed) : m_engine(seed) {}

    uint64_t uniform(uint64_t beg, uint64_t end) override {
        check_range(beg, end);

        const uint64_t span = end - beg;
        // Values at or above limit would bias the low residues.
        const uint64_t limit = (UINT64_MAX / span) * span;

        uint64_t x = m_engine.next();
        while (x >= limit) {
            x = m_engine.next();
        }
        return beg + x % span;
    }
};

template <class Engine>
class engine_source : public random_source {
  private:
    Engine m_engine;

  public:
    explicit engine_source(uint64_t seed) : m_engine(static_cast<typename Engine::result_type>(seed)) {}

    uint64_t uniform(uint64_t beg, uint64_t end) override {
        check_range(beg, end);
        std::uniform_int_distribution<uint64_t> dist(beg, end - 1);
        return dist(m_engine);
    }
};

inline uint64_t make_entropy_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

inline std::unique_ptr<random_source> make_random_source(uint64_t seed) {
    return std::make_unique<splitmix_source>(seed);
}

}  // namespace hamgen
