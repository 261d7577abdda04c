#pragma once
#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <httplib.h>

/**
 * @brief 从环境变量解析出的代理设置
 */
struct ProxySettings {
    std::string host;
    int port = 0;
    std::string username;
    std::string password;
};

/**
 * @brief HTTP 客户端工厂
 *
 * 创建的客户端遵循环境中的代理设置:
 * https 使用 HTTPS_PROXY / https_proxy, http 使用 HTTP_PROXY / http_proxy,
 * NO_PROXY / no_proxy 中的主机 (后缀匹配, "*" 表示全部) 直连。
 */
class HttpClientFactory {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    explicit HttpClientFactory(EnvLookup env = nullptr,
                               std::chrono::seconds connectTimeout = std::chrono::seconds(5),
                               std::chrono::seconds readTimeout = std::chrono::seconds(10));

    /**
     * @param baseUrl scheme://host[:port], 例如 https://api.segment.io
     * @throws std::invalid_argument URL 不合法时
     */
    std::unique_ptr<httplib::Client> create(const std::string& baseUrl) const;

    /**
     * @brief 计算访问 baseUrl 时应使用的代理
     * @return 直连时返回 std::nullopt
     */
    std::optional<ProxySettings> proxyFor(const std::string& baseUrl) const;

private:
    EnvLookup env;
    std::chrono::seconds connectTimeout;
    std::chrono::seconds readTimeout;

    std::optional<std::string> lookup(const std::string& upper, const std::string& lower) const;
    bool bypassProxy(const std::string& host) const;
};

/**
 * @brief 拆分 URL
 * @throws std::invalid_argument URL 不合法时
 */
void splitUrl(const std::string& url, std::string& scheme, std::string& host, int& port);
