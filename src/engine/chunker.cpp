#include "chunker.hpp"
#include "text.hpp"
#include "scry/errors.hpp"
#include <iomanip>
#include <iostream>

namespace scry::engine {

    Chunker::Chunker(size_t chunk_size, size_t overlap)
        : m_chunk_size(chunk_size), m_overlap(overlap) {
        if (m_chunk_size == 0 || m_overlap >= m_chunk_size) {
            throw ConfigError("chunker needs 0 <= overlap < chunk_size (got " +
                              std::to_string(overlap) + " / " + std::to_string(chunk_size) + ")");
        }
    }

    std::vector<Chunk> Chunker::chunk_document(const Document& doc) const {
        std::vector<Chunk> chunks;
        auto lines = text::split_lines(doc.content);

        size_t n = 0;
        auto emit = [&](size_t begin, size_t end) {
            Chunk chunk;
            chunk.id = doc.id + "#chunk" + std::to_string(n);
            chunk.source = doc.source;
            chunk.type = doc.type;
            chunk.chunk_index = n;
            chunk.content = text::join_lines(lines, begin, end);
            chunk.start_line = static_cast<int>(begin) + 1;
            chunk.end_line = static_cast<int>(end);
            chunks.push_back(std::move(chunk));
            ++n;
        };

        // The buffer is the line range [begin, i].
        size_t begin = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i + 1 - begin >= m_chunk_size) {
                emit(begin, i + 1);
                begin = i + 1 - m_overlap;
            }
        }
        if (begin < lines.size()) emit(begin, lines.size());

        return chunks;
    }

    std::vector<Chunk> Chunker::chunk_documents(const std::vector<Document>& documents) const {
        std::cout << "[Chunker] Chunking " << documents.size() << " documents...\n";

        std::vector<Chunk> chunks;
        for (const auto& doc : documents) {
            auto doc_chunks = chunk_document(doc);
            chunks.insert(chunks.end(),
                          std::make_move_iterator(doc_chunks.begin()),
                          std::make_move_iterator(doc_chunks.end()));
        }

        double avg = documents.empty() ? 0.0 : static_cast<double>(chunks.size()) / documents.size();
        std::cout << "[Chunker] Created " << chunks.size() << " chunks (avg "
                  << std::fixed << std::setprecision(1) << avg << std::defaultfloat
                  << " per document)\n";
        return chunks;
    }

}
