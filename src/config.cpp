#include "config.hpp"

#include <filesystem>
#include <limits>

#include <pwd.h>
#include <unistd.h>

#include <joml.hpp>

#include "log.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
template <typename T>
constexpr bool isPowerOfTwo(T v)
{
    return v != 0 && (v & (v - 1)) == 0;
}

std::optional<std::string> substituteEnvVars(std::string_view source)
{
    std::string ret;
    size_t cursor = 0;
    while (cursor < source.size()) {
        const auto start = source.find("${", cursor);
        ret.append(source.substr(cursor, start - cursor));
        if (start == std::string_view::npos) {
            break;
        }

        const auto end = source.find("}", start);
        if (end == std::string_view::npos) {
            slog::error("Unmatched environment variable expansion");
            return std::nullopt;
        }

        const auto arg = source.substr(start + 2, end - start - 2);
        const auto colon = arg.find(':');
        const auto var = std::string(arg.substr(0, colon));
        const auto envValue = ::getenv(var.c_str());
        if (envValue) {
            ret.append(envValue);
        } else if (colon != std::string_view::npos) {
            ret.append(arg.substr(colon + 1));
        } else {
            slog::error("Environment variable '", var, "' is not defined.");
            return std::nullopt;
        }

        cursor = end + 1;
    }
    return ret;
}

template <typename T>
bool loadSingle(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    if (!value) {
        return true;
    }
    if (!value.is<T>()) {
        slog::error("'", name, "' must be a ", typeName);
        return false;
    }
    dest = value.as<T>();
    return true;
}

template <typename T>
bool loadInteger(const joml::Node& value, std::string_view name, T& dest, int64_t min = 0,
    int64_t max = std::numeric_limits<T>::max())
{
    int64_t i = 0;
    if (!loadSingle(value, name, "integer", i)) {
        return false;
    }
    if (i < min || i > max) {
        slog::error("'", name, "' must be in [", min, ", ", max, "]");
        return false;
    }
    dest = static_cast<T>(i);
    return true;
}

bool load(const joml::Node& value, std::string_view name, std::string& dest)
{
    return loadSingle(value, name, "string", dest);
}

template <typename T>
bool loadParse(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    std::string str;
    if (!load(value, name, str)) {
        return false;
    }
    const auto parsed = T::parse(str);
    if (!parsed) {
        slog::error("'", name, "' must be a valid ", typeName);
        return false;
    }
    dest = *parsed;
    return true;
}

bool load(const joml::Node& value, std::string_view name, Duration& dest)
{
    return loadParse(value, name, "duration (XXd, XXh, XXm or XXs)", dest);
}

template <typename T>
bool load(const joml::Node& value, std::string_view name, std::vector<T>& dest)
{
    if (!value.isArray()) {
        slog::error("'", name, "' must be an array");
        return false;
    }
    const auto& arr = value.asArray();
    dest.clear();
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!load(arr[i], std::string(name) + "[" + std::to_string(i) + "]", dest.emplace_back())) {
            return false;
        }
    }
    return true;
}

#define CHECK_OR_NULLOPT(cond)                                                                     \
    if (!(cond)) {                                                                                 \
        return std::nullopt;                                                                       \
    }

std::optional<std::string> getEnv(const std::string& name)
{
    const auto val = ::getenv(name.c_str());
    if (!val) {
        return std::nullopt;
    }
    return std::string(val);
}

std::optional<fs::path> getHomeDirectory()
{
    const auto envHome = getEnv("HOME");
    if (envHome) {
        return fs::path(*envHome);
    }
    const auto pw = getpwuid(::geteuid());
    if (!pw) {
        slog::error("Could not get user directory");
        return std::nullopt;
    }
    return fs::path(pw->pw_dir);
}

std::optional<fs::path> getDataDirectory()
{
    const auto xdgData = getEnv("XDG_DATA_HOME");
    if (xdgData) {
        return fs::path(*xdgData) / "whacme";
    }
    const auto home = getHomeDirectory();
    if (!home) {
        return std::nullopt;
    }
    return *home / ".local/share/whacme";
}

std::optional<Config::Acme> loadAcme(const std::string& name, const joml::Node& node)
{
    if (!node.isDictionary()) {
        slog::error("acme entry '", name, "' must be a dictionary");
        return std::nullopt;
    }

    Config::Acme acme;
    acme.name = name;
    bool domainsFound = false;
    bool webrootFound = false;
    bool directoryFound = false;
    bool accountKeyPathFound = false;
    bool certKeyPathFound = false;
    bool certPathFound = false;
    for (const auto& [akey, avalue] : node.asDictionary()) {
        if (akey == "url") {
            CHECK_OR_NULLOPT(load(avalue, "url", acme.url));
        } else if (akey == "domains") {
            CHECK_OR_NULLOPT(load(avalue, "domains", acme.domains));
            for (const auto& domain : acme.domains) {
                if (!isValidDomainName(domain)) {
                    slog::error("'", domain, "' in 'domains' is not a valid domain name");
                    return std::nullopt;
                }
            }
            domainsFound = true;
        } else if (akey == "directory") {
            CHECK_OR_NULLOPT(load(avalue, "directory", acme.directory));
            directoryFound = true;
        } else if (akey == "account_key_path") {
            CHECK_OR_NULLOPT(load(avalue, "account_key_path", acme.accountKeyPath));
            accountKeyPathFound = true;
        } else if (akey == "cert_key_path") {
            CHECK_OR_NULLOPT(load(avalue, "cert_key_path", acme.certKeyPath));
            certKeyPathFound = true;
        } else if (akey == "cert_path") {
            CHECK_OR_NULLOPT(load(avalue, "cert_path", acme.certPath));
            certPathFound = true;
        } else if (akey == "key_type") {
            std::string str;
            CHECK_OR_NULLOPT(load(avalue, "key_type", str));
            const auto keyType = parseKeyType(str);
            if (!keyType) {
                slog::error("'key_type' must be 'ec' or 'rsa'");
                return std::nullopt;
            }
            acme.keyType = *keyType;
        } else if (akey == "rsa_key_length") {
            int64_t length = 0;
            CHECK_OR_NULLOPT(loadSingle(avalue, "rsa_key_length", "integer", length));
            if (length != 1024 && length != 2048 && length != 3072 && length != 4096) {
                // First three are valid FIPS options, 4096 is something people use as well.
                slog::error("'rsa_key_length' must be in {1024, 2048, 3072, 4096}");
                return std::nullopt;
            }
            acme.rsaKeyLength = static_cast<uint32_t>(length);
        } else if (akey == "webroot") {
            CHECK_OR_NULLOPT(load(avalue, "webroot", acme.webroot));
            webrootFound = true;
        } else if (akey == "renew_before_expiry") {
            CHECK_OR_NULLOPT(load(avalue, "renew_before_expiry", acme.renewBeforeExpiry));
        } else if (akey == "poll_interval") {
            CHECK_OR_NULLOPT(load(avalue, "poll_interval", acme.pollInterval));
            if (acme.pollInterval.toSeconds() == 0) {
                slog::error("'poll_interval' must not be zero");
                return std::nullopt;
            }
        } else if (akey == "poll_attempts") {
            CHECK_OR_NULLOPT(loadInteger(avalue, "poll_attempts", acme.pollAttempts, 1));
        } else {
            slog::error("Invalid key '", akey, "'");
            return std::nullopt;
        }
    }

    if (!domainsFound || acme.domains.empty()) {
        slog::error("'domains' is mandatory in acme entry '", name, "' and must not be empty");
        return std::nullopt;
    }
    if (!webrootFound || acme.webroot.empty()) {
        slog::error("'webroot' is mandatory in acme entry '", name, "'");
        return std::nullopt;
    }

    if (acme.url == "letsencrypt") {
        acme.url = "https://acme-v02.api.letsencrypt.org/directory";
    } else if (acme.url == "letsencrypt-staging") {
        acme.url = "https://acme-staging-v02.api.letsencrypt.org/directory";
    }

    // Only look up the home directory if we need it, so it can't fail when it's not used.
    if (!directoryFound) {
        const auto dataDir = getDataDirectory();
        CHECK_OR_NULLOPT(dataDir);
        acme.directory = *dataDir;
    }
    if (!accountKeyPathFound) {
        acme.accountKeyPath = fs::path(acme.directory) / "accountkey.pem";
    }
    if (!certKeyPathFound) {
        acme.certKeyPath = fs::path(acme.directory) / name / "privkey.pem";
    }
    if (!certPathFound) {
        acme.certPath = fs::path(acme.directory) / name / "fullchain.pem";
    }

    return acme;
}
}

bool isValidDomainName(std::string_view str)
{
    if (str.empty() || str.size() > 253) {
        return false;
    }
    size_t labelStart = 0;
    while (labelStart <= str.size()) {
        auto labelEnd = str.find('.', labelStart);
        if (labelEnd == std::string_view::npos) {
            labelEnd = str.size();
        }
        const auto label = str.substr(labelStart, labelEnd - labelStart);
        if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
            return false;
        }
        for (const auto c : label) {
            const auto alnum
                = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
            if (!alnum && c != '-') {
                return false;
            }
        }
        labelStart = labelEnd + 1;
    }
    return true;
}

bool Config::loadFromFile(const std::string& path)
{
    const auto source = readFile(path);
    if (!source) {
        slog::error("Could not read config file '", path, "'");
        return false;
    }
    return loadFromString(*source);
}

bool Config::loadFromString(std::string_view source)
{
    const auto substSource = substituteEnvVars(source);
    if (!substSource) {
        return false;
    }

    const auto joml = joml::parse(*substSource);
    if (!joml) {
        const auto err = joml.error();
        slog::error("Could not parse JOML config: ", err.string(), "\n",
            joml::getContextString(*substSource, err.position));
        return false;
    }

    auto copy = *this;
    copy.acme.clear();

    for (const auto& [key, value] : *joml) {
        if (key == "io_queue_size") {
            int64_t qs = 0;
            if (!loadSingle(value, "io_queue_size", "integer", qs)) {
                return false;
            }
            if (qs < 1 || qs > 4096 || !isPowerOfTwo(qs)) {
                slog::error("'io_queue_size' must be power of two in [1, 4096]");
                return false;
            }
            copy.ioQueueSize = static_cast<uint32_t>(qs);
        } else if (key == "request_timeout") {
            if (!load(value, "request_timeout", copy.requestTimeout)) {
                return false;
            }
        } else if (key == "acme") {
            if (!value.isDictionary()) {
                slog::error("'acme' must be a dictionary");
                return false;
            }
            for (const auto& [akey, avalue] : value.asDictionary()) {
                if (copy.acme.count(akey)) {
                    slog::error("Duplicate key '", akey, "' in 'acme'");
                    return false;
                }
                auto acme = loadAcme(akey, avalue);
                if (!acme) {
                    return false;
                }
                copy.acme.emplace(akey, std::move(*acme));
            }
        } else {
            slog::error("Invalid key '", key, "'");
            return false;
        }
    }

    if (copy.acme.empty()) {
        slog::error("'acme' is mandatory and must not be empty");
        return false;
    }

    *this = copy;

    return true;
}

Config& Config::get()
{
    static Config config;
    return config;
}
