#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "scry/types.hpp"

namespace scry::engine {

    nlohmann::json manifest_to_json(const Manifest& manifest);

    /**
     * @brief Missing keys keep their defaults.
     * @throws nlohmann::json::type_error if a present key has the wrong type.
     */
    Manifest manifest_from_json(const nlohmann::json& j);

    /**
     * @brief Writes the manifest pretty-printed, replacing any previous one.
     * @param extra Merged into the top-level object (e.g. vector_store_stats).
     * @throws PersistenceError on I/O failure.
     */
    void write_manifest(const std::filesystem::path& path, const Manifest& manifest,
                        const nlohmann::json& extra = nlohmann::json::object());

    /**
     * @throws ManifestMissingError if the file does not exist.
     * @throws PersistenceError if it cannot be parsed.
     */
    Manifest read_manifest(const std::filesystem::path& path);

}
