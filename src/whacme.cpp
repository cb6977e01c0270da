#include <filesystem>

#include <clipp.hpp>
#include <cpprom/cpprom.hpp>

#include "config.hpp"
#include "httpclient.hpp"
#include "ioqueue.hpp"
#include "issuer.hpp"
#include "log.hpp"
#include "string.hpp"
#include "util.hpp"

struct Args : clipp::ArgsBase {
    bool debug = false;
    bool checkConfig = false;
    bool force = false;
    std::optional<std::string> metrics;
    std::string config;

    void args()
    {
        flag(debug, "debug").help("Enable debug logging");
        flag(checkConfig, "check-config").help("Check the configuration and exit");
        flag(force, "force", 'f').help("Issue certificates even if they are still valid");
        flag(metrics, "metrics", 'm')
            .valueNames("FILE")
            .help("Write Prometheus-compatible metrics to FILE on exit");
        positional(config, "config");
    }
};

namespace {
// Issues the certificates one after another, so they don't race to create the account key
void issueNext(IoQueue& io, Transport& transport, RequestSigner& signer,
    std::vector<Config::Acme> pending, bool force, int& exitCode)
{
    if (pending.empty()) {
        return;
    }
    auto acme = std::move(pending.front());
    pending.erase(pending.begin());

    const auto name = acme.name;
    slog::info("ACME: Processing '", name, "'");
    auto scheduler = [&io](uint64_t delayMs, Function<void()> fn) {
        auto shared = std::make_shared<Function<void()>>(std::move(fn));
        const auto queued = io.timeout(delayMs, [shared](std::error_code ec) {
            if (ec) {
                slog::error("Error in timeout: ", ec.message());
            }
            (*shared)();
        });
        if (!queued) {
            slog::error("Could not queue timeout");
            (*shared)();
        }
    };
    auto issuer = Issuer::create(std::move(acme), transport, signer, std::move(scheduler));
    issuer->run(force,
        [&io, &transport, &signer, pending = std::move(pending), force, &exitCode, name](
            Issuer::Outcome outcome) mutable {
            slog::info("ACME: '", name, "': ", toString(outcome));
            if (outcome == Issuer::Outcome::Failed) {
                exitCode = 2;
            }
            issueNext(io, transport, signer, std::move(pending), force, exitCode);
        });
}
}

int main(int argc, char** argv)
{
    auto parser = clipp::Parser(argv[0]);
    parser.version("0.1.0");
    const Args args = parser.parse<Args>(argc, argv).value();
    slog::init(args.debug ? slog::Severity::Debug : slog::Severity::Info);

    auto& config = Config::get();
    if (!std::filesystem::is_regular_file(args.config)) {
        slog::error("Invalid argument. Must be a config file");
        return 1;
    }
    if (!config.loadFromFile(args.config)) {
        return 1;
    }

    if (args.checkConfig) {
        for (const auto& [name, acme] : config.acme) {
            slog::info("'", name, "': ", join(acme.domains), " -> ", acme.certPath);
        }
        return 0;
    }

    IoQueue io(config.ioQueueSize);
    HttpTransport transport(io, config.requestTimeout.toMilliseconds());
    JwsSigner signer(transport);

    std::vector<Config::Acme> pending;
    for (const auto& [name, acme] : config.acme) {
        pending.push_back(acme);
    }

    int exitCode = 0;
    issueNext(io, transport, signer, std::move(pending), args.force, exitCode);
    io.run();

    if (args.metrics) {
        if (!writeFile(*args.metrics, cpprom::Registry::getDefault().serialize())) {
            slog::error("Could not write metrics to ", *args.metrics);
        }
    }

    return exitCode;
}
