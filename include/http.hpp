#ifndef HTTP_HPP
#define HTTP_HPP

#include <optional>
#include <string>

namespace Repodex {

/**
 * @brief Result of a conditional GET. `body` is empty when the server
 *        reported the resource as unchanged.
 */
struct HttpResponse
{
    std::optional<std::string> body;
    std::string etag;
};

/**
 * @class HttpClient
 * @brief Transport used by the trust verifier to download index files.
 */
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Downloads `url`. If `etag` is not empty the request is made
     *        conditional on it and an unchanged resource yields no body.
     *
     * @throws TransportError on network or HTTP errors.
     */
    virtual HttpResponse get(const std::string& url, const std::string& etag) = 0;
};

/**
 * @class CurlHttpClient
 * @brief HttpClient backed by libcurl's easy interface.
 */
class CurlHttpClient : public HttpClient
{
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    HttpResponse get(const std::string& url, const std::string& etag) override;
};

} // namespace Repodex

#endif // HTTP_HPP
