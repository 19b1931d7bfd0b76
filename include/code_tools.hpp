#pragma once

#include <stdint.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/locale/encoding_utf.hpp>

#include "tinyformat/tinyformat.h"

namespace hamgen {

struct code_tools {
    // 10^19 is the largest power of ten below 2^64.
    static constexpr int MAX_DIGITS = 19;

    // Code points; invalid UTF-8 sequences are skipped.
    static std::u32string to_chars(const std::string& code) {
        return boost::locale::conv::utf_to_utf<char32_t>(code);
    }

    // Positions beyond the shorter code are not compared.
    static int get_hamdist(const std::u32string& x, const std::u32string& y) {
        return get_hamdist(x, y, std::numeric_limits<int>::max());
    }

    // Stops counting once the distance reaches limit.
    static int get_hamdist(const std::u32string& x, const std::u32string& y, int limit) {
        const size_t len = std::min(x.size(), y.size());
        int dist = 0;
        for (size_t i = 0; i < len && dist < limit; ++i) {
            if (x[i] != y[i]) {
                dist += 1;
            }
        }
        return dist;
    }

    static int get_hamdist(const std::string& x, const std::string& y) {
        return get_hamdist(to_chars(x), to_chars(y));
    }
    static int get_hamdist(const std::string& x, const std::string& y, int limit) {
        return get_hamdist(to_chars(x), to_chars(y), limit);
    }

    static uint64_t get_range_end(int digits) {
        if (digits < 1 || MAX_DIGITS < digits) {
            throw std::invalid_argument(tfm::format("digits must be in [1, %d], got %d", MAX_DIGITS, digits));
        }
        uint64_t end = 1;
        for (int i = 0; i < digits; ++i) {
            end *= 10;
        }
        return end;
    }

    static std::string format_code(const std::string& prefix, uint64_t value, int digits) {
        std::string numeric = std::to_string(value);
        if (digits < 0 || static_cast<size_t>(digits) < numeric.size()) {
            throw std::invalid_argument(tfm::format("value %d does not fit in %d digits", value, digits));
        }
        return prefix + std::string(digits - numeric.size(), '0') + numeric;
    }
};

}  // namespace hamgen
