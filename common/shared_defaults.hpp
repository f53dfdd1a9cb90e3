#pragma once
#include <string>

// SharedDefaults is a key/value area in a directory that every local process
// of one device can read. Each key is one file; writes replace the file
// atomically so a reader sees either the old or the new value.
class SharedDefaults {
public:
    explicit SharedDefaults(std::string directory);

    // Keys are limited to [A-Za-z0-9._-].
    static bool valid_key(const std::string& key);

    bool set(const std::string& key, const std::string& value);
    // Returns false when the key has never been written.
    bool get(const std::string& key, std::string& value) const;
    bool remove(const std::string& key);

    const std::string& directory() const { return directory_; }

private:
    std::string path_for(const std::string& key) const;

    std::string directory_;
};
