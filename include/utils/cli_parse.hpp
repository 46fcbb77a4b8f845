#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "depotpack/fixed.hpp"

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag + ".");
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s) {
    size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid double: " + s);
    }
    return v;
}

// Exact decimal, e.g. "150" or "12.5".
inline depotpack::Fixed parse_fixed(const std::string& s) {
    try {
        return depotpack::Fixed::parse(s);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid decimal: " + s);
    }
}

inline std::vector<std::string> parse_string_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        out.push_back(item);
    }
    return out;
}
