/**
 * @file MattermostClient.cpp
 * @brief Implementation of MattermostClient.
 */

#include "infrastructure/MattermostClient.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <httplib.h>

namespace chatvault::infrastructure {

using json = nlohmann::json;

namespace {

constexpr const char* kApiPart = "/api/v4/";
constexpr time_t kConnectTimeoutSeconds = 30;
constexpr time_t kReadTimeoutSeconds = 120;

std::string StripTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

void ConfigureClient(httplib::Client& cli) {
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kReadTimeoutSeconds);
    cli.set_follow_location(true);
}

} // namespace

MattermostClient::MattermostClient(std::string hostname)
    : m_hostname(StripTrailingSlash(std::move(hostname))) {}

void MattermostClient::onBadResponse(const std::string& request, int status, const std::string& body) const {
    std::string message = "Request '" + request + "' failed with status code " + std::to_string(status);
    try {
        auto jsn = json::parse(body);
        if (jsn.is_object()) {
            if (jsn.contains("message") && jsn["message"].is_string()) {
                message += ": " + jsn["message"].get<std::string>();
            }
            if (jsn.contains("detailed_error") && jsn["detailed_error"].is_string() &&
                !jsn["detailed_error"].get<std::string>().empty()) {
                message += " (" + jsn["detailed_error"].get<std::string>() + ")";
            }
        }
    } catch (const json::parse_error&) {
        // Error bodies are not always JSON; the status is enough then.
    }

    if (status == 401 || status == 403) {
        throw domain::AuthFailure(message);
    }
    if (status == 429 || status >= 500) {
        throw domain::TransportFailure(message);
    }
    throw domain::RemoteRequestError(message, status);
}

std::string MattermostClient::login(const std::string& username, const std::string& password) {
    httplib::Client cli(m_hostname);
    ConfigureClient(cli);

    json requestData = {
        {"login_id", username},
        {"password", password}
    };

    const std::string path = std::string(kApiPart) + "users/login";
    auto res = cli.Post(path, requestData.dump(), "application/json");
    if (!res) {
        throw domain::TransportFailure("Connection to " + m_hostname +
                                       " failed: error " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        if (res->status == 400 || res->status == 401) {
            throw domain::AuthFailure("Login of user '" + username + "' rejected with status " + std::to_string(res->status));
        }
        onBadResponse("users/login", res->status, res->body);
    }
    std::string token = res->get_header_value("Token");
    if (token.empty()) {
        throw domain::AuthFailure("Login response carries no session token");
    }
    m_token = token;
    Logger::Debug("MattermostClient", "Logged in as " + username);
    return token;
}

json MattermostClient::getJson(const std::string& apiCommand, const QueryParams& params) {
    httplib::Client cli(m_hostname);
    ConfigureClient(cli);

    httplib::Headers headers;
    if (!m_token.empty()) {
        headers.emplace("Authorization", "Bearer " + m_token);
    }
    httplib::Params query(params.begin(), params.end());

    Logger::Debug("MattermostClient", "GET " + apiCommand);
    auto res = cli.Get(std::string(kApiPart) + apiCommand, query, headers);
    if (!res) {
        throw domain::TransportFailure("Request '" + apiCommand + "' failed: connection error " +
                                       std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        onBadResponse(apiCommand, res->status, res->body);
    }

    try {
        json body = json::parse(res->body);
        if (!body.is_object() && !body.is_array()) {
            throw domain::RemoteRequestError("Request '" + apiCommand + "' returned neither an object nor an array", res->status);
        }
        return body;
    } catch (const json::parse_error& e) {
        throw domain::TransportFailure("Request '" + apiCommand + "' returned unparsable JSON: " + e.what());
    }
}

domain::RemoteAsset MattermostClient::getRaw(const std::string& apiCommand) {
    httplib::Client cli(m_hostname);
    ConfigureClient(cli);

    httplib::Headers headers;
    if (!m_token.empty()) {
        headers.emplace("Authorization", "Bearer " + m_token);
    }

    Logger::Debug("MattermostClient", "GET " + apiCommand);
    auto res = cli.Get(std::string(kApiPart) + apiCommand, headers);
    if (!res) {
        throw domain::TransportFailure("Request '" + apiCommand + "' failed: connection error " +
                                       std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        onBadResponse(apiCommand, res->status, res->body);
    }

    domain::RemoteAsset asset;
    asset.content = std::move(res->body);
    asset.contentType = res->get_header_value("Content-Type");
    return asset;
}

} // namespace chatvault::infrastructure
