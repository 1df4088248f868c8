/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the synchronization engine and its collaborators.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chatvault::domain {

/** @brief Base for problems with the local archive pair. */
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class DesynchronizedError
 * @brief The data file size differs from what the header recorded.
 */
class DesynchronizedError : public ArchiveError {
public:
    DesynchronizedError(const std::string& archiveName, std::uint64_t expected, std::optional<std::uint64_t> actual)
        : ArchiveError(BuildMessage(archiveName, expected, actual)),
          m_expected(expected), m_actual(actual) {}

    std::uint64_t expectedSize() const { return m_expected; }
    /** @brief Real size, std::nullopt if the data file could not be inspected. */
    std::optional<std::uint64_t> actualSize() const { return m_actual; }

private:
    static std::string BuildMessage(const std::string& archiveName, std::uint64_t expected, std::optional<std::uint64_t> actual) {
        std::string msg = "Archive '" + archiveName + "' is desynchronized: header records " +
                          std::to_string(expected) + " bytes, data file ";
        msg += actual ? "has " + std::to_string(*actual) + " bytes" : "is unreadable";
        return msg;
    }

    std::uint64_t m_expected;
    std::optional<std::uint64_t> m_actual;
};

/** @brief Header file exists but cannot be loaded. */
class CorruptHeaderError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief Another process holds the archive. */
class ArchiveLockedError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

/** @brief Retryable transport problem (connection, timeout, throttling, server error). */
class TransportFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Credentials rejected; fatal for the whole run. */
class AuthFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Non-retryable error response from the remote. */
class RemoteRequestError : public std::runtime_error {
public:
    RemoteRequestError(const std::string& message, int status)
        : std::runtime_error(message), m_status(status) {}
    int status() const { return m_status; }

private:
    int m_status;
};

/** @brief A remote record lacks a required field. */
class MalformedRecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Configuration missing, unparsable or invalid. */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace chatvault::domain
