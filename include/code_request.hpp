#pragma once

#include <stdint.h>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>  // is_any_of, is_digit
#include <boost/algorithm/string/predicate.hpp>  // all
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

#include "tinyformat/tinyformat.h"

namespace hamgen {

// A batch of codes sharing one prefix.
struct code_request {
    std::string prefix;
    uint64_t count = 0;
};

// Decimal digits only, no sign or blanks.
inline uint64_t parse_uint(const std::string& str, const std::string& what) {
    if (str.empty() || !boost::algorithm::all(str, boost::algorithm::is_digit())) {
        throw std::invalid_argument(tfm::format("invalid %s \"%s\"", what, str));
    }
    try {
        return boost::lexical_cast<uint64_t>(str);
    } catch (const boost::bad_lexical_cast&) {
        throw std::invalid_argument(tfm::format("%s \"%s\" is too large", what, str));
    }
}

// "N" asks for N codes without prefix, "P:N" for N codes prefixed by P.
inline code_request parse_code_request(const std::string& str) {
    const size_t colon = str.find(':');
    if (colon == std::string::npos) {
        return code_request{"", parse_uint(str, "code count")};
    }
    return code_request{str.substr(0, colon), parse_uint(str.substr(colon + 1), "code count")};
}

inline std::vector<code_request> parse_code_requests(const std::string& str) {
    std::vector<std::string> items;
    boost::algorithm::split(items, str, boost::algorithm::is_any_of(","));

    std::vector<code_request> requests;
    requests.reserve(items.size());
    for (const std::string& item : items) {
        requests.push_back(parse_code_request(item));
    }
    return requests;
}

}  // namespace hamgen
