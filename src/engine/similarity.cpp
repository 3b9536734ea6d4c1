#include "similarity.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace scry::engine {

    double cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
        if (a.size() != b.size() || a.empty()) return 0.0;

        double dot = 0.0;
        double norm_a = 0.0;
        double norm_b = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            dot += static_cast<double>(a[i]) * b[i];
            norm_a += static_cast<double>(a[i]) * a[i];
            norm_b += static_cast<double>(b[i]) * b[i];
        }

        norm_a = std::sqrt(norm_a);
        norm_b = std::sqrt(norm_b);
        if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

        return std::clamp(dot / (norm_a * norm_b), -1.0, 1.0);
    }

    std::string sanitize_id(const std::string& id, size_t max_length) {
        std::string out;
        out.reserve(id.size());
        for (unsigned char c : id) {
            bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
            out += keep ? static_cast<char>(c) : '_';
        }
        if (out.size() <= max_length) return out;

        uint32_t hash = 2166136261u;
        for (unsigned char c : id) {
            hash ^= c;
            hash *= 16777619u;
        }
        static const char* hex = "0123456789abcdef";
        std::string suffix = "_";
        for (int shift = 28; shift >= 0; shift -= 4) suffix += hex[(hash >> shift) & 0xF];

        if (max_length <= suffix.size()) return suffix.substr(suffix.size() - max_length);
        return out.substr(0, max_length - suffix.size()) + suffix;
    }

}
