#pragma once
#include <string>

namespace Robocache {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;  // as written; empty when the URL relies on the scheme default
    std::string path;
    std::string query;

    // Explicit port, else the scheme's default, else -1.
    int effective_port() const;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_absolute(const std::string& url);
    static bool        same_host(const std::string& url1, const std::string& url2);

    // scheme://host[:port]/robots.txt for the origin of `url`.
    static std::string robots_url(const std::string& url);
};

}  // namespace Utils
}  // namespace Robocache
