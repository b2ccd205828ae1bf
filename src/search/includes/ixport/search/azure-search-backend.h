#pragma once

#include "ixport/search/search-backend.h"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace ixport::search {

/**
 * Connection settings for an Azure Cognitive Search style service
 */
struct AzureSearchOptions
{
    /** Service URL, e.g. https://myservice.search.windows.net */
    std::string endpoint;

    /** Index (collection) to read from */
    std::string index_name;

    /** Admin or query key, sent as the api-key header */
    std::string api_key;

    /** REST API version query parameter */
    std::string api_version = "2023-11-01";

    /** Extra attempts after a transport failure, 429 or 5xx response */
    int max_retries = 3;

    /** First retry delay; doubled after every attempt */
    std::chrono::milliseconds retry_delay{500};

    /** Deadline for one attempt, from connect to the end of the response */
    std::chrono::milliseconds timeout = std::chrono::seconds(100);
};

/**
 * Parsed service URL
 */
struct ServiceEndpoint
{
    bool tls = true;
    std::string host;
    std::string port;

    /** Path prefix without trailing slash, usually empty */
    std::string base_path;
};

/**
 * Split a service URL into scheme, host, port and path
 *
 * @throws std::invalid_argument for anything but http:// or https:// URLs
 * with a non-empty host
 */
ServiceEndpoint
parse_endpoint(const std::string& url);

/**
 * Render a range filter as an OData $filter expression
 *
 * Returns an empty string when the filter does not restrict anything.
 * e.g. "ts ge 2021-01-01T00:00:00.000000Z and ts lt 2021-01-05T00:00:00.000000Z"
 */
std::string
to_odata_filter(const RangeFilter& filter);

/** "field asc" or "field desc" */
std::string
to_odata_orderby(const std::string& field, SortDirection direction);

/**
 * SearchBackend over the service's REST API
 *
 * Every request opens its own connection, so one instance can be shared by
 * any number of threads. The TLS context is configured once in the
 * constructor and only read afterwards.
 */
class AzureSearchBackend : public SearchBackend
{
public:
    /** The service rejects $skip values above this */
    static constexpr std::int64_t MAX_SKIP = 100000;

    /** Larger $top values are silently cut to this many results */
    static constexpr std::int64_t MAX_TOP = 1000;

    explicit AzureSearchBackend(AzureSearchOptions options);

    std::int64_t
    count(const RangeFilter& filter) override;

    std::vector<Document>
    query(const QueryRequest& request) override;

    FieldInfo
    describe_field(const std::string& name) override;

    std::int64_t
    max_skip() const override
    {
        return MAX_SKIP;
    }

    std::int64_t
    max_page_size() const override
    {
        return MAX_TOP;
    }

    const AzureSearchOptions&
    options() const
    {
        return options_;
    }

private:
    boost::json::value
    post_search(const boost::json::object& body);

    // Sends with bounded retries; throws SearchRequestError on final failure
    boost::json::value
    send(
        boost::beast::http::verb method,
        const std::string& target,
        const std::string& body);

    // Single attempt; returns HTTP status and body
    std::pair<unsigned, std::string>
    send_once(
        boost::beast::http::verb method,
        const std::string& target,
        const std::string& body);

    AzureSearchOptions options_;
    ServiceEndpoint endpoint_;
    boost::asio::ssl::context ssl_context_;
};

}  // namespace ixport::search
