#include "cli/cli_parser.hpp"

#include <stdexcept>

namespace vqhuff {

namespace {

int to_int_in_range(const std::string& key, const std::string& text, int lo, int hi) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("--" + key + " must be an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("--" + key + " must be an integer, got '" + text + "'");
    }
    if (v < lo || v > hi) {
        throw std::invalid_argument("--" + key + " must be in " + std::to_string(lo) + ".." +
                                    std::to_string(hi) + ", got " + text);
    }
    return v;
}

} // namespace

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0) continue;
        std::vector<std::string>& vals = kv_[a.substr(2)];
        vals.clear();
        while (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) == 0) break;
            vals.push_back(next);
            ++i;
        }
        if (vals.empty()) vals.push_back("true");
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end() || it->second.empty()) return def;
    return it->second.front();
}

std::vector<std::string> CliParser::get_all(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return {};
    return it->second;
}

int CliParser::get_int(const std::string& key, int def, int lo, int hi) const {
    if (!has(key)) return def;
    return to_int_in_range(key, get(key), lo, hi);
}

std::vector<int> CliParser::get_int_list(const std::string& key, int lo, int hi) const {
    std::vector<int> out;
    for (const auto& v : get_all(key)) out.push_back(to_int_in_range(key, v, lo, hi));
    return out;
}

} // namespace vqhuff
