#pragma once
#include <chrono>
#include <string>

// Config carries every process setting. Defaults apply to keys the file
// leaves out.
struct Config {
    std::string role;
    std::string listen;
    std::string peer;
    std::string data_dir = ".";
    std::string shared_dir = "./shared";
    std::chrono::milliseconds send_deadline{200};
    std::chrono::milliseconds ping_interval{1000};
    std::chrono::milliseconds tick_interval{500};
    std::chrono::milliseconds haptic_interval{1500};
    std::chrono::seconds grant_limit{3600};
    std::string theme = "dark";
    bool verbose = false;
};

/*
 * load_config
 * Reads a plaintext "key=value" file. Blank lines and lines starting with '#'
 * are skipped, surrounding whitespace is trimmed. Unknown keys and malformed
 * numbers fail the load with a message in |error|.
 */
bool load_config(const std::string& path, Config& out, std::string& error);

// parse_config does the same for text already in memory.
bool parse_config(const std::string& text, Config& out, std::string& error);
