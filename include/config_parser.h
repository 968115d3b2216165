#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace netspeed {

// key = value config files; '#' and ';' start comment lines
class ConfigParser {
public:
    ConfigParser();
    ~ConfigParser();

    bool load_from_file(const std::string& filepath);

    uint32_t get_uint32(const std::string& key, uint32_t default_value = 0) const;

    uint64_t get_uint64(const std::string& key, uint64_t default_value = 0) const;

    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Accepts 1/0, true/false, yes/no, on/off
    bool get_bool(const std::string& key, bool default_value = false) const;

    bool has_key(const std::string& key) const;

    // Overrides (or adds) a single entry, e.g. from the command line
    void set(const std::string& key, const std::string& value);

    void print_all() const;

private:
    std::map<std::string, std::string> config_map_;

    std::string trim(const std::string& str) const;

    bool parse_line(const std::string& line);
};

} // namespace netspeed
