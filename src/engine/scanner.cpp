#include "scanner.hpp"
#include "text.hpp"
#include "scry/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>

namespace scry::engine {

    Scanner::Scanner(const Config& config)
        : m_root(config.root_dir),
          m_extensions(config.extensions),
          m_max_file_size(config.max_file_size) {
        for (const auto& p : config.ignore_patterns) m_ignore.add(p);
        if (config.ignore_patterns.empty()) m_ignore.add_defaults();
        m_ignore.load(m_root / ".scryignore");
    }

    bool Scanner::accepts_extension(const std::string& filename) const {
        for (const auto& ext : m_extensions) {
            if (filename.size() >= ext.size() &&
                filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0) {
                return true;
            }
        }
        return false;
    }

    void Scanner::scan(FileCallback callback) {
        if (!std::filesystem::exists(m_root) || !std::filesystem::is_directory(m_root)) {
            std::cerr << "[Scanner] Invalid root path: " << m_root << "\n";
            throw LoadError("root directory not found: " + m_root.string());
        }
        walk(m_root, 0, callback);
    }

    void Scanner::walk(const std::filesystem::path& dir, int depth, const FileCallback& callback) {
        if (depth > kMaxDepth) return;

        std::vector<std::filesystem::directory_entry> entries;
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[Scanner] Warning: cannot list " << dir << ": " << ec.message() << "\n";
            return;
        }
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "[Scanner] Warning: error while listing " << dir << ": " << ec.message() << "\n";
                break;
            }
            entries.push_back(*it);
        }
        std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

        for (const auto& entry : entries) {
            const auto& path = entry.path();
            auto relative = path.lexically_relative(m_root);

            if (m_ignore.check(relative)) continue;

            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                walk(path, depth + 1, callback);
                continue;
            }
            if (!entry.is_regular_file(type_ec)) continue;
            if (!accepts_extension(path.filename().string())) continue;

            FileInfo info;
            info.path = path;
            info.relative = relative;
            info.size = entry.file_size(type_ec);
            if (type_ec) {
                std::cerr << "[Scanner] Warning: cannot stat " << relative.generic_string() << ": " << type_ec.message() << "\n";
                continue;
            }
            if (info.size > m_max_file_size) {
                std::cout << "[Scanner] Skipping " << relative.generic_string() << " (" << info.size
                          << " bytes exceeds " << m_max_file_size << ")\n";
                continue;
            }

            if (callback) callback(info);
        }
    }

    Document Scanner::read_document(const FileInfo& info) const {
        std::ifstream file(info.path, std::ios::binary);
        if (!file.is_open()) {
            throw LoadError("cannot open " + info.relative.generic_string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw LoadError("read failed for " + info.relative.generic_string());
        }

        Document doc;
        doc.content = buffer.str();
        if (!text::is_valid_utf8(doc.content)) {
            throw LoadError(info.relative.generic_string() + " is not valid UTF-8");
        }
        doc.id = info.relative.generic_string();
        doc.source = doc.id;
        doc.type = info.path.extension().string();
        doc.size = doc.content.size();
        return doc;
    }

    std::vector<Document> Scanner::load_codebase() {
        std::cout << "[Scanner] Loading codebase from " << m_root << "...\n";

        std::vector<Document> documents;
        scan([&](const FileInfo& info) {
            try {
                documents.push_back(read_document(info));
            } catch (const LoadError& e) {
                std::cerr << "[Scanner] Warning: could not read " << info.relative.generic_string() << ": " << e.what() << "\n";
            }
        });

        std::cout << "[Scanner] Loaded " << documents.size() << " documents\n";
        return documents;
    }

    std::vector<Document> Scanner::load_files(const std::vector<std::filesystem::path>& relative_paths) {
        std::vector<Document> documents;
        for (const auto& rel : relative_paths) {
            FileInfo info;
            info.path = m_root / rel;
            info.relative = rel;

            std::error_code ec;
            if (!std::filesystem::is_regular_file(info.path, ec)) {
                std::cerr << "[Scanner] Warning: " << rel.generic_string() << " not found\n";
                continue;
            }
            if (!accepts_extension(info.path.filename().string())) continue;
            info.size = std::filesystem::file_size(info.path, ec);
            if (ec || info.size > m_max_file_size) continue;

            try {
                documents.push_back(read_document(info));
            } catch (const LoadError& e) {
                std::cerr << "[Scanner] Warning: could not read " << rel.generic_string() << ": " << e.what() << "\n";
            }
        }
        return documents;
    }

    std::vector<Document> Scanner::load_documentation(const std::filesystem::path& doc_dir) {
        std::vector<Document> documents;
        auto dir = m_root / doc_dir;

        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) return documents;

        std::vector<FileInfo> files;
        std::filesystem::recursive_directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            std::cerr << "[Scanner] Warning: cannot list " << dir << ": " << ec.message() << "\n";
            return documents;
        }
        for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                std::cerr << "[Scanner] Warning: error while listing " << dir << ": " << ec.message() << "\n";
                break;
            }
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec) || it->path().extension() != ".md") continue;

            FileInfo info;
            info.path = it->path();
            info.relative = it->path().lexically_relative(m_root);
            files.push_back(std::move(info));
        }
        std::sort(files.begin(), files.end(),
            [](const FileInfo& a, const FileInfo& b) { return a.relative < b.relative; });

        for (const auto& info : files) {
            try {
                Document doc = read_document(info);
                doc.type = ".md";
                doc.is_documentation = true;
                documents.push_back(std::move(doc));
            } catch (const LoadError& e) {
                std::cerr << "[Scanner] Warning: could not read " << info.relative.generic_string() << ": " << e.what() << "\n";
            }
        }

        std::cout << "[Scanner] Loaded " << documents.size() << " documentation files from " << dir << "\n";
        return documents;
    }

}
