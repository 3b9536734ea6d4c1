#include "librarian.hpp"
#include "embedder.hpp"
#include "scry/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <iostream>

namespace scry::engine {

    namespace {
        constexpr size_t kSearchEf = 128;
    }

    struct Librarian::Impl {
        hnswlib::InnerProductSpace space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_hnsw;

        Impl(size_t dim, size_t max_elements) : space(dim) {
            alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(&space, std::max<size_t>(1, max_elements));
            alg_hnsw->setEf(kSearchEf);
        }
    };

    Librarian::Librarian(size_t dim, size_t max_elements) : m_dim(dim) {
        m_impl = std::make_unique<Impl>(dim, max_elements);
    }

    Librarian::~Librarian() = default;

    void Librarian::add_item(size_t slot, const EmbeddingVector& vector) {
        if (vector.size() != m_dim) {
            throw DimensionMismatchError(m_dim, vector.size());
        }
        EmbeddingVector unit = vector;
        normalize(unit);
        m_impl->alg_hnsw->addPoint(unit.data(), slot);
    }

    std::vector<size_t> Librarian::search(const EmbeddingVector& query_vector, size_t k) const {
        std::vector<size_t> results;
        if (query_vector.size() != m_dim) {
            throw DimensionMismatchError(m_dim, query_vector.size());
        }
        if (count() == 0 || k == 0) return results;

        EmbeddingVector unit = query_vector;
        normalize(unit);

        // searchKnn returns a max-heap of <distance, label>
        auto pq = m_impl->alg_hnsw->searchKnn(unit.data(), std::min(k, count()));
        while (!pq.empty()) {
            results.push_back(static_cast<size_t>(pq.top().second));
            pq.pop();
        }
        // Furthest to nearest, so reverse it
        std::reverse(results.begin(), results.end());
        return results;
    }

    size_t Librarian::count() const {
        return m_impl->alg_hnsw->cur_element_count;
    }

}
