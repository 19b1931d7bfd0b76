#include <iostream>
#include <limits>

#include <boost/timer/timer.hpp>

#include <tinyformat/tinyformat.h>
#include <cmd_line_parser/parser.hpp>

#include <code_array.hpp>
#include <code_request.hpp>
#include <code_tools.hpp>
#include <io.hpp>

using namespace hamgen;

static constexpr uint32_t MAX_REPORTED_PAIRS = 10;

cmd_line_parser::parser make_parser(int argc, char** argv) {
    cmd_line_parser::parser p(argc, argv);
    p.add("input_paths", "input files of codes, comma separated");
    p.add("min_hamming_distance", "minimum number of characters any two codes must differ in", "-R", false);
    return p;
}

int run(const cmd_line_parser::parser& p) {
    const auto input_paths = split_list(p.get<std::string>("input_paths"));
    const auto min_hamdist = p.parsed("min_hamming_distance")
                                 ? parse_uint(p.get<std::string>("min_hamming_distance"), "min_hamming_distance")
                                 : 1;
    if (uint64_t(std::numeric_limits<int>::max()) < min_hamdist) {
        throw std::invalid_argument(tfm::format("min_hamming_distance %d is too large", min_hamdist));
    }

    code_array codes;
    for (const std::string& path : input_paths) {
        const uint32_t num = load_codes_from_txt(path, codes);
        tfm::printfln("Read file %s containing %d entries", path, num);
    }

    const uint32_t size = codes.get_size();
    tfm::printfln("num_codes: %d", size);
    tfm::printfln("min_hamming_distance: %d", min_hamdist);

    int min_found = std::numeric_limits<int>::max();
    uint64_t violations = 0;

    boost::timer::cpu_timer timer;
    for (uint32_t i = 0; i < size; i++) {
        const std::string& x = codes.access(i);
        for (uint32_t j = i + 1; j < size; j++) {
            const std::string& y = codes.access(j);
            const int hamdist = code_tools::get_hamdist(codes.get_chars()[i], codes.get_chars()[j]);
            if (hamdist < min_found) {
                min_found = hamdist;
            }
            if (uint64_t(hamdist) < min_hamdist) {
                if (violations < MAX_REPORTED_PAIRS) {
                    tfm::printfln("too close (%d): %s %s", hamdist, x, y);
                }
                violations += 1;
            }
        }
    }
    timer.stop();
    tfm::printfln("[verify] %s", timer.format(4));

    if (size < 2) {
        tfm::printfln("smallest distance: n/a");
    } else {
        tfm::printfln("smallest distance: %d", min_found);
    }
    tfm::printfln("violating pairs: %d", violations);

    return violations == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
#ifndef NDEBUG
    tfm::format(std::cerr, "warning: the code is running in debug mode.\n");
#endif

    auto p = make_parser(argc, argv);
    if (!p.parse()) {
        return 1;
    }

    try {
        return run(p);
    } catch (const std::exception& e) {
        tfm::format(std::cerr, "error: %s\n", e.what());
    }
    return 1;
}
