#include "index_codec.hpp"
#include "scry/errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace scry::engine {

    json encode_index(const std::vector<IndexEntry>& entries, const std::string& last_indexed) {
        json index = json::array();
        for (const auto& entry : entries) {
            json value = {
                {"embedding", entry.embedding},
                {"metadata", {
                    {"source", entry.metadata.source},
                    {"type", entry.metadata.type},
                    {"chunk_index", entry.metadata.chunk_index},
                    {"content", entry.metadata.content}
                }}
            };
            index.push_back(json::array({entry.id, std::move(value)}));
        }

        json j;
        j["index"] = std::move(index);
        j["count"] = entries.size();
        j["last_indexed"] = last_indexed.empty() ? json(nullptr) : json(last_indexed);
        return j;
    }

    IndexSnapshot decode_index(const json& j) {
        IndexSnapshot snapshot;
        try {
            for (const auto& pair : j.at("index")) {
                if (!pair.is_array() || pair.size() != 2) {
                    throw PersistenceError("index entry is not an [id, value] pair");
                }
                IndexEntry entry;
                entry.id = pair[0].get<std::string>();
                const auto& value = pair[1];
                entry.embedding = value.at("embedding").get<EmbeddingVector>();

                const auto& meta = value.at("metadata");
                entry.metadata.source = meta.value("source", "");
                entry.metadata.type = meta.value("type", "");
                entry.metadata.chunk_index = meta.value("chunk_index", size_t{0});
                entry.metadata.content = meta.value("content", "");
                snapshot.entries.push_back(std::move(entry));
            }
            if (j.contains("last_indexed") && j["last_indexed"].is_string()) {
                snapshot.last_indexed = j["last_indexed"].get<std::string>();
            }
        } catch (const json::exception& e) {
            throw PersistenceError(std::string("malformed index: ") + e.what());
        }
        return snapshot;
    }

    std::string iso_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis << 'Z';
        return out.str();
    }

}
