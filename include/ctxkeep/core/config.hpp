/*
 * ctxkeep C++ - Configuration
 *
 * JSON-backed configuration (config.json). Keys are addressed with dotted
 * paths, e.g. "consumers.helper_ai.limit_tokens". Getters never throw: a
 * missing key or a value of the wrong type yields the supplied default.
 */
#ifndef ctxkeep_CORE_CONFIG_HPP
#define ctxkeep_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ctxkeep {

typedef nlohmann::json Json;

class Config {
public:
    Config();

    // Load from a file / string. On failure the previous contents are kept
    // and last_error() describes the problem.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_double(const std::string& key, double value);
    void set_bool(const std::string& key, bool value);

    // Member names of the object at `key` (empty if absent or not an object)
    std::vector<std::string> child_keys(const std::string& key) const;

    const Json& root() const { return root_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json root_;
    std::string path_;
    std::string last_error_;

    const Json* find(const std::string& key) const;
    Json& ensure(const std::string& key);
};

} // namespace ctxkeep

#endif // ctxkeep_CORE_CONFIG_HPP
