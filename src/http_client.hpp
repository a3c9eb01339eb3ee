#pragma once

#include <map>
#include <string>

namespace partition_query {

/// Low-level HTTP client built on Boost.Beast.
/// One connection per request; synchronous, with per-operation timeouts.
class HttpClient {
public:
    struct Response {
        unsigned int                       httpStatus = 0;
        std::map<std::string, std::string> headers;   // lower-cased names
        std::string                        body;
    };

    /// @param endpoint   Gateway base URL, e.g. "http://localhost:8081/"
    /// @param authToken  Optional value for the Authorization header
    /// @param timeoutMs  Per-operation timeout in milliseconds
    HttpClient(const std::string& endpoint,
               const std::string& authToken = "",
               int timeoutMs = 5000);

    /// Issue a request against @p path, relative to the endpoint's path.
    /// @throws std::runtime_error on network / timeout errors.
    Response request(const std::string& method,
                     const std::string& path,
                     const std::map<std::string, std::string>& headers,
                     const std::string& body = "");

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mAuthToken;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    std::string resolveTarget(const std::string& path) const;

    Response doHttpRequest(const std::string& method, const std::string& target,
                           const std::map<std::string, std::string>& headers,
                           const std::string& body);
    Response doHttpsRequest(const std::string& method, const std::string& target,
                            const std::map<std::string, std::string>& headers,
                            const std::string& body);
};

} // namespace partition_query
