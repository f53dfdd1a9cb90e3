#include "config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

static std::string trim(const std::string& s) {
    const size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static bool parse_int(const std::string& key, const std::string& value, int min_value, int& out,
                      std::string& error) {
    try {
        size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        if (parsed < min_value) {
            error = key + " must be at least " + std::to_string(min_value);
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        error = key + ": not a number: '" + value + "'";
        return false;
    }
}

bool parse_config(const std::string& text, Config& out, std::string& error) {
    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            error = "line " + std::to_string(lineno) + ": expected key=value";
            return false;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        int n = 0;
        if (key == "role") {
            if (value != "handheld" && value != "companion") {
                error = "role must be handheld or companion";
                return false;
            }
            out.role = value;
        } else if (key == "listen") {
            out.listen = value;
        } else if (key == "peer") {
            out.peer = value;
        } else if (key == "data_dir") {
            out.data_dir = value;
        } else if (key == "shared_dir") {
            out.shared_dir = value;
        } else if (key == "send_deadline_ms") {
            if (!parse_int(key, value, 1, n, error)) return false;
            out.send_deadline = std::chrono::milliseconds(n);
        } else if (key == "ping_interval_ms") {
            if (!parse_int(key, value, 1, n, error)) return false;
            out.ping_interval = std::chrono::milliseconds(n);
        } else if (key == "tick_interval_ms") {
            if (!parse_int(key, value, 1, n, error)) return false;
            out.tick_interval = std::chrono::milliseconds(n);
        } else if (key == "haptic_interval_ms") {
            if (!parse_int(key, value, 1, n, error)) return false;
            out.haptic_interval = std::chrono::milliseconds(n);
        } else if (key == "grant_limit_seconds") {
            if (!parse_int(key, value, 0, n, error)) return false;
            out.grant_limit = std::chrono::seconds(n);
        } else if (key == "theme") {
            out.theme = value;
        } else if (key == "verbose") {
            if (value != "true" && value != "false") {
                error = "verbose must be true or false";
                return false;
            }
            out.verbose = value == "true";
        } else {
            error = "line " + std::to_string(lineno) + ": unknown key '" + key + "'";
            return false;
        }
    }
    return true;
}

bool load_config(const std::string& path, Config& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse_config(buf.str(), out, error);
}
