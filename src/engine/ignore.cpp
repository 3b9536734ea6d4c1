#include "ignore.hpp"
#include <fstream>
#include <algorithm>

namespace scry::engine {

    void Ignore::load(const std::filesystem::path& ignore_file) {
        if (!std::filesystem::exists(ignore_file)) return;

        std::ifstream file(ignore_file);
        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line);
        }
    }

    void Ignore::add(const std::string& pattern) {
        if (pattern.empty()) return;
        if (std::find(m_patterns.begin(), m_patterns.end(), pattern) != m_patterns.end()) return;
        m_patterns.push_back(pattern);
    }

    void Ignore::add_defaults() {
        static const std::vector<std::string> defaults = {
            "node_modules", ".git", "coverage", "build", "dist", ".env", ".rag-index"
        };
        for (const auto& p : defaults) add(p);
    }

    bool Ignore::check(const std::filesystem::path& relative_path) const {
        std::string path = relative_path.generic_string();
        for (const auto& p : m_patterns) {
            if (path.find(p) != std::string::npos) return true;
        }
        return false;
    }

}
