#include "sthe/util/HttpClient.hpp"
#include "sthe/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>

namespace sthe::util {
namespace {
constexpr unsigned kHttpVersion = 11;

bool isRedirect(boost::beast::http::status status) {
    switch (status) {
    case boost::beast::http::status::moved_permanently:
    case boost::beast::http::status::found:
    case boost::beast::http::status::see_other:
    case boost::beast::http::status::temporary_redirect:
    case boost::beast::http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

} // namespace

HttpClient::HttpClient(boost::asio::io_context& io)
    : io_(io)
    , sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::Endpoint HttpClient::parseUrl(const std::string& url) {
    Endpoint parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw FetchError(FetchError::Type::invalid_url, "URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw FetchError(FetchError::Type::invalid_url, "Unsupported URL scheme: " + url);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?#", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw FetchError(FetchError::Type::invalid_url, "URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.empty() || parsed.target.front() != '/') {
        parsed.target.insert(0, "/");
    }
    auto fragment = parsed.target.find('#');
    if (fragment != std::string::npos) {
        parsed.target.erase(fragment);
    }
    return parsed;
}

std::string HttpClient::combineLocation(const Endpoint& base, const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    if (location.rfind("//", 0) == 0) {
        return base.scheme + ":" + location;
    }
    std::string prefix = base.scheme + "://" + base.host;
    if ((base.scheme == "http" && base.port != "80") || (base.scheme == "https" && base.port != "443")) {
        prefix += ":" + base.port;
    }
    if (location.empty()) {
        return prefix + base.target;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    std::string path = base.target.substr(0, base.target.find('?'));
    if (location.front() == '?') {
        return prefix + path + location;
    }
    auto slashPos = path.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : path.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

HttpClient::HttpResponse HttpClient::send(const HttpRequest& request, const Endpoint& endpoint, std::chrono::seconds timeout) {
    boost::asio::ip::tcp::resolver resolver(io_);
    auto results = resolver.resolve(endpoint.host, endpoint.port);

    if (endpoint.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io_, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
            throw FetchError(FetchError::Type::transport, "Failed to set SNI host name");
        }
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint.host));
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        lowest.connect(results);
        stream.handshake(boost::asio::ssl::stream_base::client);

        boost::beast::http::write(stream, request);
        boost::beast::flat_buffer buffer;
        HttpResponse response;
        boost::beast::http::read(stream, buffer, response);

        boost::system::error_code ec;
        stream.shutdown(ec);
        if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
            ec = {};
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return response;
    }

    boost::beast::tcp_stream stream(io_);
    stream.expires_after(timeout);
    stream.connect(results);
    boost::beast::http::write(stream, request);
    boost::beast::flat_buffer buffer;
    HttpResponse response;
    boost::beast::http::read(stream, buffer, response);
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        throw boost::system::system_error(ec);
    }
    return response;
}

HttpClient::HttpResponse HttpClient::get(const std::string& url,
                                         const std::vector<Header>& headers,
                                         std::chrono::seconds timeout,
                                         bool followRedirects,
                                         unsigned int maxRedirects,
                                         std::string* effectiveUrl)
{
    std::string currentUrl = url;
    HttpResponse response;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        Endpoint endpoint = parseUrl(currentUrl);
        HttpRequest request{boost::beast::http::verb::get, endpoint.target, kHttpVersion};
        if (endpoint.port == "80" || endpoint.port == "443") {
            request.set(boost::beast::http::field::host, endpoint.host);
        } else {
            request.set(boost::beast::http::field::host, endpoint.host + ":" + endpoint.port);
        }
        request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);

        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        try {
            response = send(request, endpoint, timeout);
        } catch (const boost::system::system_error& ex) {
            throw FetchError(FetchError::Type::transport, currentUrl + ": " + ex.what());
        }

        if (effectiveUrl) {
            *effectiveUrl = currentUrl;
        }

        if (!followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(boost::beast::http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }

        currentUrl = combineLocation(endpoint, std::string(locationIt->value()));
        log(LogLevel::debug, "Following redirect to " + currentUrl);
    }

    throw FetchError(FetchError::Type::too_many_redirects, "Maximum redirect count exceeded: " + url);
}

} // namespace sthe::util
