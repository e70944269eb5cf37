/*
 * sandterm C++ - Configuration Implementation
 */
#include <sandterm/core/config.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <fstream>
#include <sstream>
#include <cstdlib>

namespace sandterm {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_ERROR("[Config] Cannot open %s", path.c_str());
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return load_string(content.str());
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        LOG_ERROR("[Config] Parse error: %s", e.what());
        return false;
    }

    if (!parsed.is_object()) {
        LOG_ERROR("[Config] Top-level value must be an object");
        return false;
    }

    data_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* node = find(key);
    return node && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_string()) return node->get<std::string>();
    if (node->is_number_integer()) return std::to_string(node->get<int64_t>());
    if (node->is_number()) return std::to_string(node->get<double>());
    if (node->is_boolean()) return node->get<bool>() ? "true" : "false";
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_number_integer()) return node->get<int64_t>();
    if (node->is_number()) return static_cast<int64_t>(node->get<double>());
    if (node->is_string()) {
        const std::string s = node->get<std::string>();
        char* end = nullptr;
        long long v = strtoll(s.c_str(), &end, 10);
        if (end && *end == '\0' && !s.empty()) return static_cast<int64_t>(v);
        LOG_WARN("[Config] %s: '%s' is not an integer, using %lld",
                 key.c_str(), s.c_str(), static_cast<long long>(default_val));
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_boolean()) return node->get<bool>();
    if (node->is_number_integer()) return node->get<int64_t>() != 0;
    if (node->is_string()) {
        std::string v = to_lower(node->get<std::string>());
        if (v == "true" || v == "1" || v == "yes") return true;
        if (v == "false" || v == "0" || v == "no") return false;
    }
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find(key);
    if (!node || !node->is_array()) return out;
    for (const auto& item : *node) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

Json Config::get_json(const std::string& key) const {
    const Json* node = find(key);
    return node ? *node : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace sandterm
