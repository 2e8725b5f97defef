#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace vqhuff {

// Very small CLI parser:
//   --key value [value ...]
//   --flag (treated as "true")
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    // First value of `key`, or `def` when absent.
    std::string get(const std::string& key, const std::string& def = "") const;
    std::vector<std::string> get_all(const std::string& key) const;
    // Throws std::invalid_argument when the value is not an integer in
    // [lo, hi].
    int get_int(const std::string& key, int def, int lo, int hi) const;
    std::vector<int> get_int_list(const std::string& key, int lo, int hi) const;
private:
    std::unordered_map<std::string, std::vector<std::string>> kv_;
};

} // namespace vqhuff
