#pragma once

#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "code_driver.hpp"
#include "code_generator.hpp"

namespace hamgen {

// Parameters, per-request rows and totals of one gen_codes run, saved as JSON.
class run_report {
  public:
    struct params_type {
        int min_hamdist = 0;
        int digits = 0;
        uint64_t seed = 0;
        uint64_t max_attempts = 0;
        std::vector<std::string> existing_paths;
        uint32_t num_existing = 0;
    };

  private:
    boost::posix_time::ptime m_date;
    params_type m_params;
    std::string m_status = "running";

    std::vector<request_stats> m_requests;
    uint32_t m_num_used = 0;
    uint64_t m_num_candidates = 0;
    uint64_t m_num_rejections = 0;

  public:
    explicit run_report(const params_type& params)
        : m_date(boost::posix_time::second_clock::local_time()), m_params(params) {}

    // Copies the driver rows and generator totals; call again after each change.
    void update(const code_driver& driver, const code_generator& generator, const std::string& status) {
        m_requests = driver.get_stats();
        m_num_used = generator.get_used().get_size();
        m_num_candidates = generator.get_candidates();
        m_num_rejections = generator.get_rejections();
        m_status = status;
    }

    const std::string& get_status() const {
        return m_status;
    }
    const std::vector<request_stats>& get_requests() const {
        return m_requests;
    }

    boost::property_tree::ptree make_ptree() const {
        using boost::property_tree::ptree;

        ptree root;
        root.put("date", boost::posix_time::to_iso_extended_string(m_date));
        root.put("status", m_status);

        ptree params;
        params.put("min_hamming_distance", m_params.min_hamdist);
        params.put("digits", m_params.digits);
        params.put("seed", m_params.seed);
        params.put("max_attempts", m_params.max_attempts);
        params.put("num_existing", m_params.num_existing);
        ptree existing;
        for (const std::string& path : m_params.existing_paths) {
            ptree item;
            item.put("", path);
            existing.push_back(std::make_pair("", item));
        }
        params.add_child("existing", existing);
        root.add_child("params", params);

        ptree requests;
        for (const request_stats& stats : m_requests) {
            ptree row;
            row.put("prefix", stats.prefix);
            row.put("path", stats.path);
            row.put("count", stats.count);
            row.put("found", stats.found);
            row.put("rejections", stats.rejections);
            row.put("time_in_ms", stats.time_in_ms);
            requests.push_back(std::make_pair("", row));
        }
        root.add_child("requests", requests);

        root.put("totals.num_used", m_num_used);
        root.put("totals.num_candidates", m_num_candidates);
        root.put("totals.num_rejections", m_num_rejections);
        return root;
    }

    void save_json(const std::string& path) const {
        boost::property_tree::write_json(path, make_ptree());
    }
};

}  // namespace hamgen
