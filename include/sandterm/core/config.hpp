/*
 * sandterm C++ - Configuration
 *
 * JSON config file with dotted-key access ("docker.image", "terminal.exec_timeout_seconds").
 */
#ifndef sandterm_CORE_CONFIG_HPP
#define sandterm_CORE_CONFIG_HPP

#include <sandterm/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace sandterm {

class Config {
public:
    Config();

    // Returns false (and logs) when the file is missing or not a JSON object
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    // Raw sub-document (null Json when absent)
    Json get_json(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& data() const { return data_; }

private:
    Json data_;

    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace sandterm

#endif // sandterm_CORE_CONFIG_HPP
