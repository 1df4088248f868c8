/**
 * @file MattermostClient.hpp
 * @brief Low-level HTTP client for the Mattermost REST API (v4).
 */

#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/RemoteDirectory.hpp"

namespace chatvault::infrastructure {

/**
 * @class MattermostClient
 * @brief Issues authenticated requests below `<hostname>/api/v4/`.
 *
 * Response status mapping: 200 is success, 401/403 throw domain::AuthFailure,
 * 429/5xx and connection problems throw domain::TransportFailure, anything else
 * throws domain::RemoteRequestError.
 */
class MattermostClient {
public:
    using QueryParams = std::multimap<std::string, std::string>;

    /** @param hostname Server base URL, e.g. "https://chat.example.com". */
    explicit MattermostClient(std::string hostname);

    void setToken(const std::string& token) { m_token = token; }
    bool hasToken() const { return !m_token.empty(); }

    /** @brief POST users/login; stores and returns the session token. */
    std::string login(const std::string& username, const std::string& password);

    /** @brief GET returning a JSON object or array. */
    nlohmann::json getJson(const std::string& apiCommand, const QueryParams& params = {});

    /** @brief GET returning raw bytes (file, emoji image, avatar). */
    domain::RemoteAsset getRaw(const std::string& apiCommand);

    const std::string& hostname() const { return m_hostname; }

private:
    [[noreturn]] void onBadResponse(const std::string& request, int status, const std::string& body) const;

    std::string m_hostname;
    std::string m_token;
};

} // namespace chatvault::infrastructure
