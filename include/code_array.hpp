#pragma once

#include <stdint.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "tinyformat/tinyformat.h"

#include "code_tools.hpp"

namespace hamgen {

// Append-only list of codes that new codes must keep their distance from.
// Each code is also kept as code points for the distance checks.
class code_array {
  private:
    std::vector<std::string> m_codes;
    std::vector<std::u32string> m_chars;

  public:
    code_array() = default;
    explicit code_array(std::vector<std::string>&& codes) : m_codes(std::move(codes)) {
        m_chars.reserve(m_codes.size());
        for (const std::string& code : m_codes) {
            m_chars.push_back(code_tools::to_chars(code));
        }
    }

    uint32_t append(std::string code) {
        m_chars.push_back(code_tools::to_chars(code));
        m_codes.push_back(std::move(code));
        return static_cast<uint32_t>(m_codes.size() - 1);
    }

    const std::string& access(uint32_t id) const {
        if (m_codes.size() <= id) {
            throw std::out_of_range(tfm::format("code id %d is out of range (size %d)", id, m_codes.size()));
        }
        return m_codes[id];
    }

    uint32_t get_size() const {
        return static_cast<uint32_t>(m_codes.size());
    }

    const std::vector<std::string>& get_codes() const {
        return m_codes;
    }
    const std::vector<std::u32string>& get_chars() const {
        return m_chars;
    }
};

}  // namespace hamgen
