/*
 * ctxkeep C++ - Configuration Implementation
 */
#include <ctxkeep/core/config.hpp>
#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace ctxkeep {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "cannot open config file '" + path + "'";
        LOG_ERROR("[Config] %s", last_error_.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!load_string(buffer.str())) {
        LOG_ERROR("[Config] Failed to parse '%s': %s", path.c_str(), last_error_.c_str());
        return false;
    }

    path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }

    if (!parsed.is_object()) {
        last_error_ = "top-level JSON value must be an object";
        return false;
    }

    root_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::ensure(const std::string& key) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (v && v->is_string()) return v->get<std::string>();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (v && v->is_number()) return v->get<double>();
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (v && v->is_boolean()) return v->get<bool>();
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    ensure(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    ensure(key) = value;
}

void Config::set_double(const std::string& key, double value) {
    ensure(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    ensure(key) = value;
}

std::vector<std::string> Config::child_keys(const std::string& key) const {
    std::vector<std::string> keys;
    const Json* v = find(key);
    if (!v || !v->is_object()) return keys;
    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

} // namespace ctxkeep
