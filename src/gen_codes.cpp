#include <iostream>
#include <limits>

#include <tinyformat/tinyformat.h>
#include <cmd_line_parser/parser.hpp>

#include <code_driver.hpp>
#include <code_generator.hpp>
#include <code_request.hpp>
#include <io.hpp>
#include <run_report.hpp>

using namespace hamgen;

cmd_line_parser::parser make_parser(int argc, char** argv) {
    cmd_line_parser::parser p(argc, argv);
    p.add("min_hamming_distance", "minimum number of characters any two codes must differ in");
    p.add("digits", "number of digits in each code [1,19]");
    p.add("requests", "codes wanted, as N or PREFIX:N, comma separated (e.g. A:500,B:200)");
    p.add("seed", "64-bit random seed for a reproducible list", "-s", false);
    p.add("existing", "files of existing codes to avoid, comma separated", "-e", false);
    p.add("output_dir", "output directory of prefix_<PREFIX>.txt files", "-o", false);
    p.add("max_attempts", "give up after this many candidates for one code (0 means never)", "-M", false);
    p.add("report_path", "output file path of the JSON run report", "-j", false);
    return p;
}

int get_int_arg(const cmd_line_parser::parser& p, const std::string& name) {
    const uint64_t value = parse_uint(p.get<std::string>(name), name);
    if (uint64_t(std::numeric_limits<int>::max()) < value) {
        throw std::invalid_argument(tfm::format("%s %d is too large", name, value));
    }
    return static_cast<int>(value);
}

int run(const cmd_line_parser::parser& p) {
    const auto min_hamdist = get_int_arg(p, "min_hamming_distance");
    const auto digits = get_int_arg(p, "digits");
    const auto requests = parse_code_requests(p.get<std::string>("requests"));
    const auto existing_paths = split_list(p.parsed("existing") ? p.get<std::string>("existing") : "");
    const auto output_dir = p.parsed("output_dir") ? p.get<std::string>("output_dir") : std::string(".");
    const auto max_attempts =
        p.parsed("max_attempts") ? parse_uint(p.get<std::string>("max_attempts"), "max_attempts") : 0;

    uint64_t seed = 0;
    if (p.parsed("seed")) {
        seed = parse_uint(p.get<std::string>("seed"), "seed");
    } else {
        seed = make_entropy_seed();
        tfm::printfln("No seed given, using %d", seed);
    }

    tfm::printfln("min_hamming_distance: %d", min_hamdist);
    tfm::printfln("digits: %d", digits);
    tfm::printfln("max_attempts: %d", max_attempts);

    code_generator generator(make_random_source(seed), digits, max_attempts);
    generator.set_reject_callback([](const std::string&) {
        tfm::printf(".");
        std::cout.flush();
    });

    for (const std::string& path : existing_paths) {
        const uint32_t num = load_codes_from_txt(path, generator.get_used());
        tfm::printfln("Read file %s containing %d entries", path, num);
    }

    run_report::params_type params;
    params.min_hamdist = min_hamdist;
    params.digits = digits;
    params.seed = seed;
    params.max_attempts = max_attempts;
    params.existing_paths = existing_paths;
    params.num_existing = generator.get_used().get_size();
    run_report report(params);

    code_driver driver(generator, output_dir, min_hamdist);
    driver.set_found_callback([](const request_stats& stats) {
        tfm::printfln("Found %d of %d", stats.found, stats.count);
    });

    auto save_report = [&](const std::string& status) {
        report.update(driver, generator, status);
        if (p.parsed("report_path")) {
            const auto report_path = p.get<std::string>("report_path");
            report.save_json(report_path);
            tfm::printfln("wrote %s", report_path);
        }
    };

    try {
        for (const code_request& request : requests) {
            tfm::printfln("Processing prefix %s trying to find %d.", request.prefix, request.count);
            driver.run(request);
        }
    } catch (const exhausted_error& e) {
        tfm::format(std::cerr, "\nerror: %s\n", e.what());
        save_report("exhausted");
        return 1;
    }

    save_report("finished");
    tfm::printfln("All finished!");
    return 0;
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
