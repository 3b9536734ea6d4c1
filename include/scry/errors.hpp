#pragma once
#include <stdexcept>
#include <string>

namespace scry {

    /**
     * @brief Base of every error raised by the engine.
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief A single file could not be loaded. Recovered by skipping the file.
     */
    class LoadError : public Error {
    public:
        explicit LoadError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief A backend (local model, remote index) could not be brought up.
     * Callers fall back instead of failing.
     */
    class BackendInitError : public Error {
    public:
        explicit BackendInitError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief A remote service returned an error payload, a non-success status,
     * or could not be reached.
     */
    class RemoteBackendError : public Error {
    public:
        RemoteBackendError(const std::string& what, long status = 0)
            : Error(what), m_status(status) {}

        /**
         * @brief HTTP status of the failed call, 0 for transport failures.
         */
        long status() const { return m_status; }

    private:
        long m_status;
    };

    /**
     * @brief Reading or writing the local index failed.
     */
    class PersistenceError : public Error {
    public:
        explicit PersistenceError(const std::string& what) : Error(what) {}
    };

    class ManifestMissingError : public Error {
    public:
        explicit ManifestMissingError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief Vectors of different length were mixed in one index.
     */
    class DimensionMismatchError : public Error {
    public:
        DimensionMismatchError(size_t expected, size_t actual)
            : Error("dimension mismatch: expected " + std::to_string(expected) +
                    ", got " + std::to_string(actual)),
              m_expected(expected), m_actual(actual) {}

        size_t expected() const { return m_expected; }
        size_t actual() const { return m_actual; }

    private:
        size_t m_expected;
        size_t m_actual;
    };

    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string& what) : Error(what) {}
    };

}
