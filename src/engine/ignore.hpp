#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace scry::engine {

    class Ignore {
    public:
        /**
         * @brief Reads extra patterns from a .scryignore file, one per line.
         * @param ignore_file Path to the ignore file. Missing files are fine.
         */
        void load(const std::filesystem::path& ignore_file);

        /**
         * @brief Checks if a root-relative path should be skipped.
         * @param relative_path Path relative to the scan root.
         * @return true if any pattern occurs as a substring of the path.
         */
        bool check(const std::filesystem::path& relative_path) const;

        void add(const std::string& pattern);

        /**
         * @brief Adds the stock set of ignores (.git, node_modules, the index dir, ...).
         */
        void add_defaults();

        const std::vector<std::string>& patterns() const { return m_patterns; }

    private:
        std::vector<std::string> m_patterns;
    };

}
