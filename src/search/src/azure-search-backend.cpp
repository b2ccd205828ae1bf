#include "ixport/search/azure-search-backend.h"
#include "ixport/core/errors.h"
#include "ixport/core/logger.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/json.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace ixport::search {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

LogPartition http_log("HTTP");

constexpr int HTTP_VERSION = 11;

// Error bodies can be large HTML pages; keep messages readable
constexpr std::size_t ERROR_BODY_EXCERPT = 512;

bool
is_retryable(unsigned status)
{
    return status == 0 || status == 429 || status >= 500;
}

std::string
excerpt(const std::string& body)
{
    if (body.size() <= ERROR_BODY_EXCERPT)
        return body;
    return body.substr(0, ERROR_BODY_EXCERPT) + "...";
}

// Runs one asynchronous operation to completion on the request's private
// io_context. Only asynchronous operations observe the stream's deadline.
template <typename Initiate>
beast::error_code
run_step(asio::io_context& ioc, Initiate&& initiate)
{
    beast::error_code result = asio::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

template <typename Stream>
std::pair<unsigned, std::string>
exchange(
    asio::io_context& ioc,
    Stream& stream,
    http::request<http::string_body>& req)
{
    auto ec = run_step(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec)
        throw beast::system_error(ec);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // A page of a thousand documents easily exceeds the 8MB default
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    ec = run_step(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec)
        throw beast::system_error(ec);

    auto res = parser.release();
    return {res.result_int(), std::move(res.body())};
}

}  // namespace

ServiceEndpoint
parse_endpoint(const std::string& url)
{
    ServiceEndpoint ep;
    std::string rest;
    if (url.rfind("https://", 0) == 0)
    {
        ep.tls = true;
        ep.port = "443";
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0)
    {
        ep.tls = false;
        ep.port = "80";
        rest = url.substr(7);
    }
    else
    {
        throw std::invalid_argument(
            "Endpoint must start with https:// or http://: " + url);
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos)
    {
        ep.base_path = rest.substr(slash);
        while (!ep.base_path.empty() && ep.base_path.back() == '/')
        {
            ep.base_path.pop_back();
        }
    }

    auto colon = authority.find(':');
    if (colon != std::string::npos)
    {
        ep.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (ep.port.empty())
        {
            throw std::invalid_argument("Endpoint has an empty port: " + url);
        }
    }
    if (authority.empty())
    {
        throw std::invalid_argument("Endpoint has no host: " + url);
    }
    ep.host = authority;
    return ep;
}

std::string
to_odata_filter(const RangeFilter& filter)
{
    std::string expr;
    if (filter.lower)
    {
        expr = filter.field + " ge " + format_bound(*filter.lower);
    }
    if (filter.upper)
    {
        if (!expr.empty())
            expr += " and ";
        expr += filter.field + (filter.upper_inclusive ? " le " : " lt ") +
            format_bound(*filter.upper);
    }
    if (expr.empty() && filter.require_value)
    {
        expr = filter.field + " ne null";
    }
    return expr;
}

std::string
to_odata_orderby(const std::string& field, SortDirection direction)
{
    return field + (direction == SortDirection::Ascending ? " asc" : " desc");
}

AzureSearchBackend::AzureSearchBackend(AzureSearchOptions options)
    : options_(std::move(options))
    , endpoint_(parse_endpoint(options_.endpoint))
    , ssl_context_(asio::ssl::context::tls_client)
{
    if (options_.index_name.empty())
    {
        throw std::invalid_argument("Index name must not be empty");
    }
    if (options_.max_retries < 0)
    {
        throw std::invalid_argument("max_retries must not be negative");
    }
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

std::int64_t
AzureSearchBackend::count(const RangeFilter& filter)
{
    json::object body;
    body["search"] = "*";
    body["count"] = true;
    body["top"] = 0;
    auto expr = to_odata_filter(filter);
    if (!expr.empty())
    {
        body["filter"] = expr;
    }

    auto result = post_search(body);
    const auto* count = result.as_object().if_contains("@odata.count");
    if (!count || !count->is_number())
    {
        throw SearchRequestError(
            200, "Search response is missing @odata.count");
    }
    auto n = count->to_number<std::int64_t>();
    PLOGD(http_log, "count(", expr, ") = ", n);
    return n;
}

std::vector<Document>
AzureSearchBackend::query(const QueryRequest& request)
{
    if (request.skip > MAX_SKIP)
    {
        throw std::invalid_argument(
            "skip " + std::to_string(request.skip) +
            " exceeds the service limit of " + std::to_string(MAX_SKIP));
    }

    json::object body;
    body["search"] = "*";
    body["orderby"] = to_odata_orderby(request.sort_field, request.direction);
    body["skip"] = request.skip;
    body["top"] = request.top;
    auto expr = to_odata_filter(request.filter);
    if (!expr.empty())
    {
        body["filter"] = expr;
    }

    auto result = post_search(body);
    const auto* value = result.as_object().if_contains("value");
    if (!value || !value->is_array())
    {
        throw SearchRequestError(200, "Search response is missing value array");
    }

    std::vector<Document> documents;
    documents.reserve(value->as_array().size());
    for (const auto& item : value->as_array())
    {
        if (!item.is_object())
        {
            throw SearchRequestError(
                200, "Search response contains a non-object document");
        }
        Document doc;
        for (const auto& [key, field] : item.as_object())
        {
            // @search.score and friends describe the hit, not the document
            if (key.starts_with("@search."))
                continue;
            doc.emplace(key, field);
        }
        documents.push_back(std::move(doc));
    }
    PLOGD(
        http_log,
        "query(",
        expr,
        ", skip=",
        request.skip,
        ", top=",
        request.top,
        ") returned ",
        documents.size());
    return documents;
}

FieldInfo
AzureSearchBackend::describe_field(const std::string& name)
{
    std::string target = endpoint_.base_path + "/indexes/" +
        options_.index_name + "?api-version=" + options_.api_version;
    auto index = send(http::verb::get, target, "");
    if (!index.is_object())
    {
        throw SearchRequestError(200, "Index definition is not a JSON object");
    }

    const auto* fields = index.as_object().if_contains("fields");
    if (!fields || !fields->is_array())
    {
        throw SearchRequestError(200, "Index definition has no fields array");
    }

    for (const auto& entry : fields->as_array())
    {
        if (!entry.is_object())
            continue;
        const auto& obj = entry.as_object();
        const auto* field_name = obj.if_contains("name");
        if (!field_name || !field_name->is_string() ||
            field_name->as_string() != name)
        {
            continue;
        }

        FieldInfo info;
        info.name = name;
        if (const auto* type = obj.if_contains("type"); type && type->is_string())
        {
            info.type_name = std::string(type->as_string());
        }
        info.type = field_type_from_name(info.type_name);
        if (const auto* s = obj.if_contains("sortable"); s && s->is_bool())
        {
            info.sortable = s->as_bool();
        }
        if (const auto* f = obj.if_contains("filterable"); f && f->is_bool())
        {
            info.filterable = f->as_bool();
        }
        return info;
    }

    throw FieldValidationError(
        "Could not find " + name + " in " + options_.index_name);
}

json::value
AzureSearchBackend::post_search(const json::object& body)
{
    std::string target = endpoint_.base_path + "/indexes/" +
        options_.index_name + "/docs/search?api-version=" +
        options_.api_version;
    auto result = send(http::verb::post, target, json::serialize(body));
    if (!result.is_object())
    {
        throw SearchRequestError(200, "Search response is not a JSON object");
    }
    return result;
}

json::value
AzureSearchBackend::send(
    http::verb method,
    const std::string& target,
    const std::string& body)
{
    auto delay = options_.retry_delay;
    for (int attempt = 0;; ++attempt)
    {
        unsigned status = 0;
        std::string response;
        std::string failure;
        try
        {
            std::tie(status, response) = send_once(method, target, body);
        }
        catch (const beast::system_error& e)
        {
            failure = e.what();
        }

        if (status >= 200 && status < 300)
        {
            json::error_code ec;
            json::value parsed = json::parse(response, ec);
            if (ec)
            {
                throw SearchRequestError(
                    status, "Failed to parse response JSON: " + ec.message());
            }
            return parsed;
        }

        if (status != 0)
        {
            failure = "HTTP " + std::to_string(status) + ": " +
                excerpt(response);
        }

        if (!is_retryable(status) || attempt >= options_.max_retries)
        {
            throw SearchRequestError(
                status,
                std::string(http::to_string(method)) + " " + target +
                    " failed: " + failure);
        }

        LOGW(
            "Request to ",
            endpoint_.host,
            " failed (",
            failure,
            "), retrying in ",
            delay.count(),
            "ms (attempt ",
            attempt + 1,
            " of ",
            options_.max_retries,
            ")");
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

std::pair<unsigned, std::string>
AzureSearchBackend::send_once(
    http::verb method,
    const std::string& target,
    const std::string& body)
{
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port);

    http::request<http::string_body> req{method, target, HTTP_VERSION};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, "ixport");
    req.set(http::field::accept, "application/json");
    req.set("api-key", options_.api_key);
    if (method != http::verb::get)
    {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    PLOGD(http_log, http::to_string(method), " ", target);

    // One deadline covers the whole attempt, from connect to the last byte
    if (!endpoint_.tls)
    {
        beast::tcp_stream stream(ioc);
        stream.expires_after(options_.timeout);
        auto ec = run_step(ioc, [&](auto handler) {
            stream.async_connect(results, std::move(handler));
        });
        if (ec)
            throw beast::system_error(ec);
        auto result = exchange(ioc, stream, req);

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected)
        {
            PLOGD(http_log, "Socket shutdown: ", ec.message());
        }
        return result;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);
    if (!SSL_set_tlsext_host_name(
            stream.native_handle(), endpoint_.host.c_str()))
    {
        throw beast::system_error(
            beast::error_code(
                static_cast<int>(::ERR_get_error()),
                asio::error::get_ssl_category()));
    }
    stream.set_verify_callback(
        asio::ssl::host_name_verification(endpoint_.host));

    beast::get_lowest_layer(stream).expires_after(options_.timeout);
    auto ec = run_step(ioc, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(
            results, std::move(handler));
    });
    if (ec)
        throw beast::system_error(ec);
    ec = run_step(ioc, [&](auto handler) {
        stream.async_handshake(
            asio::ssl::stream_base::client, std::move(handler));
    });
    if (ec)
        throw beast::system_error(ec);

    auto result = exchange(ioc, stream, req);

    ec = run_step(
        ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    // Servers routinely close without close_notify
    if (ec && ec != asio::ssl::error::stream_truncated &&
        ec != asio::error::eof)
    {
        PLOGD(http_log, "TLS shutdown: ", ec.message());
    }
    return result;
}

}  // namespace ixport::search
