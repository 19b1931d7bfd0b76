#pragma once

#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <boost/timer/timer.hpp>

#include "tinyformat/tinyformat.h"

#include "code_generator.hpp"
#include "code_request.hpp"
#include "io.hpp"

namespace hamgen {

struct request_stats {
    std::string prefix;
    std::string path;
    uint64_t count = 0;
    uint64_t found = 0;
    uint64_t rejections = 0;
    double time_in_ms = 0.0;
};

/*
 * Runs code requests against one generator and writes prefix_<P>.txt files.
 *
 * Every accepted code is flushed before the next one is searched, so the file
 * keeps what was found if the search is interrupted or gives up. A prefix
 * requested again in the same run appends to its file.
 */
class code_driver {
  public:
    using found_callback = std::function<void(const request_stats&)>;

  private:
    code_generator& m_generator;
    const std::string m_output_dir;
    const int m_min_hamdist = 0;

    std::set<std::string> m_written_prefixes;
    std::vector<request_stats> m_stats;
    found_callback m_on_found;

  public:
    explicit code_driver(code_generator& generator, const std::string& output_dir, int min_hamdist)
        : m_generator(generator), m_output_dir(output_dir), m_min_hamdist(min_hamdist) {}

    // On exhausted_error the stats of the partial request are kept before rethrowing.
    const request_stats& run(const code_request& request) {
        make_directory(m_output_dir);

        m_stats.push_back(request_stats{request.prefix, code_file_path(m_output_dir, request.prefix), request.count});
        request_stats& stats = m_stats.back();

        std::ios::openmode mode = std::ios::out;
        if (!m_written_prefixes.insert(request.prefix).second) {
            mode |= std::ios::app;
        } else if (exists_path(stats.path)) {
            tfm::format(std::cerr, "warning: overwriting %s\n", stats.path);
        }
        auto ofs = make_ofstream(stats.path, mode);

        const uint64_t prev_rejections = m_generator.get_rejections();
        boost::timer::cpu_timer timer;
        auto update_stats = [&]() {
            stats.rejections = m_generator.get_rejections() - prev_rejections;
            stats.time_in_ms = timer.elapsed().wall / 1000000.0;
        };

        try {
            while (stats.found < request.count) {
                const std::string code = m_generator.new_code(request.prefix, m_min_hamdist);
                ofs << code << std::endl;
                if (!ofs) {
                    throw std::runtime_error(tfm::format("error while writing %s", stats.path));
                }
                stats.found += 1;
                if (m_on_found) {
                    m_on_found(stats);
                }
            }
        } catch (const exhausted_error&) {
            update_stats();
            throw;
        }
        update_stats();
        return stats;
    }

    void set_found_callback(found_callback fn) {
        m_on_found = std::move(fn);
    }

    const std::vector<request_stats>& get_stats() const {
        return m_stats;
    }
};

}  // namespace hamgen
