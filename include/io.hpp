#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>  // is_any_of
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem.hpp>

#include "tinyformat/tinyformat.h"

#include "code_array.hpp"

namespace hamgen {

inline std::ifstream make_ifstream(const std::string& filepath) {
    std::ifstream ifs(filepath);
    if (!ifs) {
        throw std::runtime_error(tfm::format("unable to open %s", filepath));
    }
    return ifs;
}
inline std::ofstream make_ofstream(const std::string& filepath, std::ios::openmode mode = std::ios::out) {
    std::ofstream ofs(filepath, mode);
    if (!ofs) {
        throw std::runtime_error(tfm::format("unable to create %s", filepath));
    }
    return ofs;
}

inline bool exists_path(const std::string& path) {
    boost::filesystem::path p(path);
    return boost::filesystem::exists(p);
}

inline void make_directory(const std::string& dir) {
    boost::filesystem::path path(dir);
    if (!boost::filesystem::exists(path)) {
        if (!boost::filesystem::create_directories(path)) {
            throw std::runtime_error(tfm::format("unable to create output directory %s", dir));
        }
    }
}

inline std::vector<std::string> split_list(const std::string& str) {
    std::vector<std::string> items;
    if (!str.empty()) {
        boost::algorithm::split(items, str, boost::algorithm::is_any_of(","));
    }
    return items;
}

// Output file of the codes generated for prefix, e.g. dir/prefix_AB.txt
inline std::string code_file_path(const std::string& dir, const std::string& prefix) {
    boost::filesystem::path path(dir);
    path /= tfm::format("prefix_%s.txt", prefix);
    return path.string();
}

// One code per line. Returns the number of codes appended to used.
inline uint32_t load_codes_from_txt(const std::string& path, code_array& used) {
    uint32_t num = 0;
    auto ifs = make_ifstream(path);
    for (std::string line; std::getline(ifs, line);) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        used.append(std::move(line));
        num += 1;
    }
    if (ifs.bad()) {
        throw std::runtime_error(tfm::format("error while reading %s", path));
    }
    return num;
}

inline void save_codes_to_txt(const std::string& path, const std::vector<std::string>& codes) {
    auto ofs = make_ofstream(path);
    for (const std::string& code : codes) {
        ofs << code << '\n';
    }
    if (!ofs) {
        throw std::runtime_error(tfm::format("error while writing %s", path));
    }
}

}  // namespace hamgen
