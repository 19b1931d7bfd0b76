#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "tinyformat/tinyformat.h"

#include "code_array.hpp"
#include "code_tools.hpp"
#include "random_source.hpp"

namespace hamgen {

// Thrown by a bounded search that drew max_attempts candidates without finding one.
class exhausted_error : public std::runtime_error {
  private:
    uint64_t m_attempts = 0;

  public:
    explicit exhausted_error(const std::string& prefix, uint64_t attempts)
        : std::runtime_error(tfm::format("no acceptable code with prefix \"%s\" after %d attempts", prefix, attempts)),
          m_attempts(attempts) {}

    uint64_t get_attempts() const {
        return m_attempts;
    }
};

/*
 * Rejection sampling of fixed-width numeric codes.
 *
 * Every candidate is drawn uniformly from [0, 10^digits), zero padded and
 * prefixed, then compared against all used codes regardless of their prefix.
 * With max_attempts == 0 new_code() loops until a candidate is accepted, so an
 * infeasible distance never returns.
 */
class code_generator {
  public:
    using reject_callback = std::function<void(const std::string&)>;

  private:
    std::unique_ptr<random_source> m_rng;

    const int m_digits = 0;
    const uint64_t m_range_end = 0;

    code_array m_used;

    uint64_t m_max_attempts = 0;
    reject_callback m_on_reject;

    // statistics
    uint64_t m_candidates = 0;
    uint64_t m_rejections = 0;

  public:
    explicit code_generator(std::unique_ptr<random_source> rng, int digits, uint64_t max_attempts = 0)
        : m_rng(std::move(rng)), m_digits(digits), m_range_end(code_tools::get_range_end(digits)),
          m_max_attempts(max_attempts) {
        if (!m_rng) {
            throw std::invalid_argument("random source must not be null");
        }
    }

    std::string generate_candidate(const std::string& prefix) {
        m_candidates += 1;
        return code_tools::format_code(prefix, m_rng->uniform(0, m_range_end), m_digits);
    }

    bool is_acceptable(const std::string& candidate, int min_hamdist) const {
        const std::u32string chars = code_tools::to_chars(candidate);
        for (const std::u32string& used : m_used.get_chars()) {
            if (code_tools::get_hamdist(chars, used, min_hamdist) < min_hamdist) {
                return false;
            }
        }
        return true;
    }

    std::string new_code(const std::string& prefix, int min_hamdist) {
        for (uint64_t attempts = 1;; ++attempts) {
            std::string candidate = generate_candidate(prefix);
            if (is_acceptable(candidate, min_hamdist)) {
                m_used.append(candidate);
                return candidate;
            }

            m_rejections += 1;
            if (m_on_reject) {
                m_on_reject(candidate);
            }
            if (m_max_attempts != 0 && m_max_attempts <= attempts) {
                throw exhausted_error(prefix, attempts);
            }
        }
    }

    void set_reject_callback(reject_callback fn) {
        m_on_reject = std::move(fn);
    }
    void set_max_attempts(uint64_t max_attempts) {
        m_max_attempts = max_attempts;
    }

    code_array& get_used() {
        return m_used;
    }
    const code_array& get_used() const {
        return m_used;
    }

    int get_digits() const {
        return m_digits;
    }
    uint64_t get_range_end() const {
        return m_range_end;
    }
    uint64_t get_max_attempts() const {
        return m_max_attempts;
    }
    uint64_t get_candidates() const {
        return m_candidates;
    }
    uint64_t get_rejections() const {
        return m_rejections;
    }
};

}  // namespace hamgen
