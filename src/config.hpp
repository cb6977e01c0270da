#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto.hpp"
#include "time.hpp"

struct Config {
    struct Acme {
        std::string name; // the key of the object
        // directoryUrl would be more descriptive, but it might be confusing with "directory" below
        std::string url = "letsencrypt";
        // The first one is the CN of the certificate, all of them are in the SAN
        std::vector<std::string> domains;
        std::string directory; // $XDG_DATA_HOME/whacme, XDG_DATA_HOME=$HOME/.local/share
        std::string accountKeyPath; // <directory>/accountkey.pem
        std::string certKeyPath; // <directory>/<name>/privkey.pem
        std::string certPath; // <directory>/<name>/fullchain.pem
        KeyType keyType = KeyType::Ec;
        // certbot uses 2048 by default
        uint32_t rsaKeyLength = 2048;
        // http-01 challenge files go into <webroot>/.well-known/acme-challenge/
        std::string webroot;
        // Lets Encrypt certificates are valid for 90 days by default, so we give ourselves
        // 60 days to attempt renewal (same as certbot)
        Duration renewBeforeExpiry = Duration::fromDays(30);
        Duration pollInterval = Duration::fromSeconds(2);
        uint32_t pollAttempts = 30;
    };

    std::map<std::string, Acme> acme;

    uint32_t ioQueueSize = 256; // power of two, >= 1, <= 4096
    Duration requestTimeout = Duration::fromSeconds(30);

    bool loadFromFile(const std::string& path);
    // Environment variables are substituted as for files
    bool loadFromString(std::string_view source);

    static Config& get();
};

// RFC 1035 Section 2.3.1 (with digits allowed at the start of labels, RFC 1123)
bool isValidDomainName(std::string_view str);
