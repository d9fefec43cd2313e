#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace utils {

// Key/value settings for extcheck.
// - load_env_file(): KEY=VALUE lines (.env style), '#' comments, optional quotes
// - load_json_file(): a flat JSON object, e.g. params.json
// - load_file(): picks one of the above by extension (".json" -> JSON)
// Keys are case-insensitive. EXTCHECK_<KEY> environment variables override
// values read from files.
class Config {
public:
    static constexpr const char* kEnvPrefix = "EXTCHECK_";

    // Return false if the file cannot be opened or parsed; *err gets the reason.
    bool load_file(const std::string& path, std::string* err = nullptr);
    bool load_env_file(const std::string& path, std::string* err = nullptr);
    bool load_json_file(const std::string& path, std::string* err = nullptr);

    void set(const std::string& key, const std::string& value);

    // env override -> file -> default
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::optional<std::string> get_string_opt(const std::string& key) const;

    int get_int(const std::string& key, int default_value) const;
    std::size_t get_size(const std::string& key, std::size_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    bool has(const std::string& key) const;

    static std::optional<bool> parse_bool(const std::string& s);

private:
    std::unordered_map<std::string, std::string> kv_;

    static std::string trim_(std::string s);
    static std::string upper_(std::string s);
    static std::optional<std::string> getenv_(const std::string& upper_key);
};

} // namespace utils
