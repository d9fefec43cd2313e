#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "json_min.h"

namespace utils {

std::string Config::trim_(std::string s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string Config::upper_(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::optional<std::string> Config::getenv_(const std::string& upper_key) {
    std::string name = std::string(kEnvPrefix) + upper_key;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

std::optional<bool> Config::parse_bool(const std::string& s) {
    std::string v = trim_(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });

    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

bool Config::load_file(const std::string& path, std::string* err) {
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return load_json_file(path, err);
    }
    return load_env_file(path, err);
}

bool Config::load_env_file(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim_(line.substr(0, eq));
        std::string val = trim_(line.substr(eq + 1));
        if (key.empty()) continue;

        if (val.size() >= 2) {
            if ((val.front() == '"' && val.back() == '"') ||
                (val.front() == '\'' && val.back() == '\'')) {
                val = val.substr(1, val.size() - 2);
            }
        }

        kv_[upper_(key)] = val;
    }

    return true;
}

bool Config::load_json_file(const std::string& path, std::string* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    json_min::Object obj;
    std::string perr;
    if (!json_min::parse_object(text, obj, &perr)) {
        if (err) *err = path + ": " + perr;
        return false;
    }

    for (const auto& [k, v] : obj.kv) {
        if (v == "null") continue;
        kv_[upper_(k)] = v;
    }
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    kv_[upper_(key)] = value;
}

bool Config::has(const std::string& key) const {
    return get_string_opt(key).has_value();
}

std::optional<std::string> Config::get_string_opt(const std::string& key) const {
    auto k = upper_(key);

    if (auto env = getenv_(k); env.has_value()) {
        return env;
    }
    auto it = kv_.find(k);
    if (it == kv_.end()) return std::nullopt;
    return it->second;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto opt = get_string_opt(key);
    return opt.has_value() ? *opt : default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return default_value;
    try {
        return std::stoi(*s);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

std::size_t Config::get_size(const std::string& key, std::size_t default_value) const {
    int v = get_int(key, -1);
    if (v < 0) return default_value;
    return (std::size_t)v;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return default_value;
    return parse_bool(*s).value_or(default_value);
}

} // namespace utils
