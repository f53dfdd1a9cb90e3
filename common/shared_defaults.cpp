#include "shared_defaults.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

SharedDefaults::SharedDefaults(std::string directory) : directory_(std::move(directory)) {}

bool SharedDefaults::valid_key(const std::string& key) {
    if (key.empty()) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::string SharedDefaults::path_for(const std::string& key) const {
    return directory_ + "/" + key;
}

bool SharedDefaults::set(const std::string& key, const std::string& value) {
    if (!valid_key(key)) return false;
    const std::string path = path_for(key);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[defaults] cannot write " << tmp << "\n";
            return false;
        }
        out.write(value.data(), (std::streamsize)value.size());
        if (!out) {
            std::cerr << "[defaults] short write to " << tmp << "\n";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::cerr << "[defaults] cannot replace " << path << "\n";
        return false;
    }
    return true;
}

bool SharedDefaults::get(const std::string& key, std::string& value) const {
    if (!valid_key(key)) return false;
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    value = ss.str();
    return true;
}

bool SharedDefaults::remove(const std::string& key) {
    if (!valid_key(key)) return false;
    return std::remove(path_for(key).c_str()) == 0;
}
