#include "net/HttpClientFactory.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace {
std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<ProxySettings> parseProxy(const std::string& value) {
    // [scheme://][user[:password]@]host[:port][/]
    std::regex proxyRegex(R"(^(?:[a-zA-Z][a-zA-Z0-9+.-]*://)?(?:([^:@/]*)(?::([^@/]*))?@)?([^:/]+)(?::(\d+))?/?$)");
    std::smatch match;
    if (!std::regex_match(value, match, proxyRegex)) {
        return std::nullopt;
    }
    ProxySettings proxy;
    proxy.username = match[1];
    proxy.password = match[2];
    proxy.host = match[3];
    proxy.port = match[4].matched ? std::stoi(match[4]) : 80;
    return proxy;
}
} // namespace

void splitUrl(const std::string& url, std::string& scheme, std::string& host, int& port) {
    std::regex urlRegex(R"(^(http|https)://([^/:]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw std::invalid_argument("invalid URL: " + url);
    }
    scheme = match[1];
    host = match[2];
    if (match[3].matched) {
        port = std::stoi(match[3]);
    } else {
        port = scheme == "https" ? 443 : 80;
    }
}

HttpClientFactory::HttpClientFactory(EnvLookup env, std::chrono::seconds connectTimeout,
                                     std::chrono::seconds readTimeout)
    : env(std::move(env)), connectTimeout(connectTimeout), readTimeout(readTimeout) {
    if (!this->env) {
        this->env = [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value) return std::nullopt;
            return std::string(value);
        };
    }
}

std::optional<std::string> HttpClientFactory::lookup(const std::string& upper, const std::string& lower) const {
    auto value = env(upper);
    if (!value || value->empty()) {
        value = env(lower);
    }
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return value;
}

bool HttpClientFactory::bypassProxy(const std::string& host) const {
    auto noProxy = lookup("NO_PROXY", "no_proxy");
    if (!noProxy) return false;

    std::string target = toLower(host);
    std::stringstream ss(*noProxy);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        entry.erase(std::remove_if(entry.begin(), entry.end(), [](unsigned char c) { return std::isspace(c); }), entry.end());
        entry = toLower(entry);
        if (entry.empty()) continue;
        if (entry == "*") return true;

        auto colon = entry.find(':');
        if (colon != std::string::npos) {
            entry = entry.substr(0, colon);
        }
        if (entry.front() == '.') {
            entry = entry.substr(1);
        }
        if (target == entry) return true;
        if (target.size() > entry.size() &&
            target.compare(target.size() - entry.size(), entry.size(), entry) == 0 &&
            target[target.size() - entry.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

std::optional<ProxySettings> HttpClientFactory::proxyFor(const std::string& baseUrl) const {
    std::string scheme, host;
    int port = 0;
    splitUrl(baseUrl, scheme, host, port);

    if (bypassProxy(host)) {
        return std::nullopt;
    }

    auto value = scheme == "https" ? lookup("HTTPS_PROXY", "https_proxy") : lookup("HTTP_PROXY", "http_proxy");
    if (!value) {
        return std::nullopt;
    }
    return parseProxy(*value);
}

std::unique_ptr<httplib::Client> HttpClientFactory::create(const std::string& baseUrl) const {
    std::string scheme, host;
    int port = 0;
    splitUrl(baseUrl, scheme, host, port);

    auto client = std::make_unique<httplib::Client>(scheme + "://" + host + ":" + std::to_string(port));
    client->set_connection_timeout(connectTimeout);
    client->set_read_timeout(readTimeout);
    client->set_write_timeout(readTimeout);

    if (auto proxy = proxyFor(baseUrl)) {
        client->set_proxy(proxy->host, proxy->port);
        if (!proxy->username.empty()) {
            client->set_proxy_basic_auth(proxy->username, proxy->password);
        }
    }
    return client;
}
