#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <functional>
#include "ignore.hpp"
#include "config.hpp"
#include "scry/types.hpp"

namespace scry::engine {

    struct FileInfo {
        std::filesystem::path path;
        std::filesystem::path relative;
        std::uintmax_t size = 0;
    };

    class Scanner {
    public:
        using FileCallback = std::function<void(const FileInfo&)>;

        static constexpr int kMaxDepth = 10;

        explicit Scanner(const Config& config);

        /**
         * @brief Walks the root directory, at most kMaxDepth levels deep.
         * @param callback Called for every file that passes the ignore,
         *        extension and size filters, in name order per directory.
         */
        void scan(FileCallback callback);

        /**
         * @brief Loads every accepted file under the root.
         * Unreadable or non UTF-8 files are skipped with a warning.
         */
        std::vector<Document> load_codebase();

        /**
         * @brief Loads an explicit list of root-relative paths with the same filters.
         */
        std::vector<Document> load_files(const std::vector<std::filesystem::path>& relative_paths);

        /**
         * @brief Loads every `.md` file under root/doc_dir, tagged as documentation.
         *
         * Ignore rules, the extension list and the size limit do not apply.
         * A missing directory yields no documents.
         */
        std::vector<Document> load_documentation(const std::filesystem::path& doc_dir = "docs");

        /**
         * @brief Reads one file into a Document.
         * @throws LoadError if the file cannot be read or is not UTF-8.
         */
        Document read_document(const FileInfo& info) const;

        bool accepts_extension(const std::string& filename) const;

        const Ignore& ignore() const { return m_ignore; }

    private:
        void walk(const std::filesystem::path& dir, int depth, const FileCallback& callback);

        std::filesystem::path m_root;
        std::vector<std::string> m_extensions;
        std::uintmax_t m_max_file_size;
        Ignore m_ignore;
    };

}
