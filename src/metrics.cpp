#include "metrics.hpp"

Metrics& Metrics::get()
{
    static auto& reg = cpprom::Registry::getDefault();
    static auto durationBuckets = cpprom::Histogram::defaultBuckets();
    static auto sizeBuckets = cpprom::Histogram::exponentialBuckets(256.0, 4.0, 7);
    static Metrics metrics {
        reg.counter("whacme_acme_requests_total", { "op" }, "Number of started ACME operations"),
        reg.counter("whacme_acme_errors_total", { "op", "kind" },
            "Number of failed ACME operations by error kind"),
        reg.histogram("whacme_acme_request_duration_seconds", { "op" }, durationBuckets,
            "Time from nonce request until the signed response is decoded"),
        reg.counter("whacme_nonces_total", {}, "Number of fetched replay nonces"),

        reg.counter("whacme_http_requests_total", { "method", "status" },
            "Number of finished HTTP client requests"),
        reg.histogram("whacme_http_response_size_bytes", { "method" }, sizeBuckets,
            "HTTP response body size in bytes"),

        reg.gauge("whacme_io_queued_total", {},
            "Number of operations currently queued in the IO queue"),
    };
    return metrics;
}
