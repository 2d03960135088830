#include "swiftstore/storage/listing.hpp"
#include "swiftstore/metrics.hpp"
#include "swiftstore/storage/errors.hpp"
#include "swiftstore/storage/naming.hpp"
#include "swiftstore/storage/response_parser.hpp"

namespace swiftstore {

namespace {

TransportResponse fetch_listing(Transport& transport, const std::string& path,
                                const std::string& marker) {
    TransportRequest request;
    request.method = net::HttpMethod::GET;
    request.path = path;
    if (!marker.empty()) {
        request.params["marker"] = marker;
    }
    return transport.request(request);
}

}  // namespace

ObjectPageSource::ObjectPageSource(Transport& transport, Container container,
                                   TransferMetrics* metrics)
    : transport_(transport)
    , container_(std::move(container))
    , path_("/" + clean_container_name(container_.name))
    , metrics_(metrics) {}

ListingPage<Object> ObjectPageSource::fetch(const std::string& marker) {
    auto response = fetch_listing(transport_, path_, marker);
    if (metrics_) metrics_->object_pages().Increment();

    ListingPage<Object> page;
    if (response.status == static_cast<int>(net::HttpStatus::NoContent)) {
        // Empty (or missing) container
        page.exhausted = true;
        return page;
    }
    if (response.status != static_cast<int>(net::HttpStatus::OK)) {
        throw UnexpectedStatusError(response.status);
    }

    page.entries = json_to_objects(parse_json_body(response), container_);
    if (page.entries.empty()) {
        page.exhausted = true;
    } else {
        page.marker = page.entries.back().name;
    }
    return page;
}

ContainerPageSource::ContainerPageSource(Transport& transport, TransferMetrics* metrics)
    : transport_(transport)
    , metrics_(metrics) {}

ListingPage<Container> ContainerPageSource::fetch(const std::string& marker) {
    auto response = fetch_listing(transport_, "", marker);
    if (metrics_) metrics_->container_pages().Increment();

    ListingPage<Container> page;
    if (response.status == static_cast<int>(net::HttpStatus::NoContent)) {
        page.exhausted = true;
        return page;
    }
    if (response.status != static_cast<int>(net::HttpStatus::OK)) {
        throw UnexpectedStatusError(response.status);
    }

    page.entries = json_to_containers(parse_json_body(response));
    if (page.entries.empty()) {
        page.exhausted = true;
    } else {
        page.marker = page.entries.back().name;
    }
    return page;
}

}  // namespace swiftstore
