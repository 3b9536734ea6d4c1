#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include "scry/errors.hpp"

namespace scry::engine {

    /**
     * @brief Lower-casing WordPiece tokenizer for BERT-style sentence models.
     */
    class Tokenizer {
    public:
        /**
         * @throws BackendInitError if the vocabulary cannot be read.
         */
        explicit Tokenizer(const std::string& vocab_path) {
            std::ifstream file(vocab_path);
            if (!file.is_open()) {
                throw BackendInitError("cannot open vocabulary " + vocab_path);
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
            if (m_vocab.empty()) throw BackendInitError("empty vocabulary " + vocab_path);

            m_cls = lookup("[CLS]", 101);
            m_sep = lookup("[SEP]", 102);
            m_unk = lookup("[UNK]", 100);
        }

        /**
         * @brief Encodes text as [CLS] pieces... [SEP], at most max_length ids.
         */
        std::vector<int64_t> encode(const std::string& text, size_t max_length = 512) const {
            std::vector<int64_t> ids;
            ids.push_back(m_cls);

            std::stringstream ss(to_lower(text));
            std::string word;
            while (ss >> word && ids.size() < max_length - 1) {
                word.erase(std::remove_if(word.begin(), word.end(),
                    [](unsigned char c){ return std::ispunct(c); }), word.end());
                if (word.empty()) continue;

                // Pathologically long words go straight to [UNK].
                if (word.size() > 100) {
                    ids.push_back(m_unk);
                    continue;
                }
                append_pieces(word, ids);
            }

            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(m_sep);
            return ids;
        }

        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 101;
        int64_t m_sep = 102;
        int64_t m_unk = 100;

        int64_t lookup(const std::string& token, int64_t fallback) const {
            auto it = m_vocab.find(token);
            return it == m_vocab.end() ? fallback : it->second;
        }

        // Greedy longest-match-first split; the whole word becomes [UNK] if any piece is missing.
        void append_pieces(const std::string& word, std::vector<int64_t>& ids) const {
            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.size()) {
                size_t end = word.size();
                int64_t found = -1;
                while (start < end) {
                    std::string piece = word.substr(start, end - start);
                    if (start > 0) piece = "##" + piece;
                    auto it = m_vocab.find(piece);
                    if (it != m_vocab.end()) {
                        found = it->second;
                        break;
                    }
                    --end;
                }
                if (found < 0) {
                    ids.push_back(m_unk);
                    return;
                }
                pieces.push_back(found);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }

        static std::string to_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return s;
        }
    };

}
