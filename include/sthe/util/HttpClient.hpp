#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace sthe::util {

class FetchError : public std::runtime_error {
public:
    enum class Type {
        invalid_url,
        too_many_redirects,
        transport,
    };

    FetchError(Type type, const std::string& message)
        : std::runtime_error(message)
        , type_(type) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

private:
    Type type_;
};

// Blocking HTTP/1.1 GET over plain TCP or TLS. One instance per thread;
// each call opens and closes its own connection. TLS peers are verified
// against the system trust store and the requested host name.
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::empty_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    struct Endpoint {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;
    };

    explicit HttpClient(boost::asio::io_context& io);

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     std::chrono::seconds timeout,
                     bool followRedirects = false,
                     unsigned int maxRedirects = 5,
                     std::string* effectiveUrl = nullptr);

    static Endpoint parseUrl(const std::string& url);

    // Resolves a redirect `Location` against the URL that produced it.
    static std::string combineLocation(const Endpoint& base, const std::string& location);

private:
    HttpResponse send(const HttpRequest& request, const Endpoint& endpoint, std::chrono::seconds timeout);

    boost::asio::io_context& io_;
    boost::asio::ssl::context sslContext_;
};

} // namespace sthe::util
