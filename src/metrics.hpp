#pragma once

#include <cpprom/cpprom.hpp>

/* https://prometheus.io/docs/practices/instrumentation/#inner-loops
 * - Key metrics are performed queries, errors, latency
 * - Be consistent in whether you count queries when they start or when they end
 *   (we count ACME operations when they start, HTTP requests when they end)
 * - Every time there is a failure, a counter should be incremented.
 */
struct Metrics {
    cpprom::MetricFamily<cpprom::Counter>& acmeRequests;
    cpprom::MetricFamily<cpprom::Counter>& acmeErrors;
    cpprom::MetricFamily<cpprom::Histogram>& acmeRequestDuration;
    cpprom::MetricFamily<cpprom::Counter>& noncesFetched;

    cpprom::MetricFamily<cpprom::Counter>& httpRequests;
    cpprom::MetricFamily<cpprom::Histogram>& httpResponseSize;

    cpprom::MetricFamily<cpprom::Gauge>& ioQueueOpsQueued;

    static Metrics& get();
};
