#include "url.hpp"
#include <charconv>
#include <sstream>
#include <string_view>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../text/string_utils.hpp"

namespace Robocache {
namespace Utils {

namespace {

std::string authority_of(const UrlParsed& parsed) {
    std::string auth = parsed.host;
    if (!parsed.port.empty())
        auth += ":" + parsed.port;
    return auth;
}

void split_host_port(const std::string& host_port, UrlParsed& parsed) {
    if (!host_port.empty() && host_port[0] == '[') {
        size_t end_bracket = host_port.find(']');
        if (end_bracket == std::string::npos) {
            parsed.host = host_port;
            return;
        }
        parsed.host    = host_port.substr(0, end_bracket + 1);
        size_t p_colon = host_port.find(':', end_bracket + 1);
        if (p_colon != std::string::npos)
            parsed.port = host_port.substr(p_colon + 1);
        return;
    }

    size_t p_colon = host_port.find_last_of(':');
    if (p_colon != std::string::npos) {
        parsed.host = host_port.substr(0, p_colon);
        parsed.port = host_port.substr(p_colon + 1);
    }
    else {
        parsed.host = host_port;
    }
}

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

}  // namespace

int UrlParsed::effective_port() const {
    if (!port.empty()) {
        int value      = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec == std::errc() && ptr == port.data() + port.size())
            return value;
    }
    return Core::default_port(Text::to_lower(scheme));
}

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos)
            sv.remove_prefix(end_auth);
        else
            sv = "";

        // Userinfo never takes part in the origin.
        size_t at = authority.find_last_of('@');
        split_host_port((at != std::string::npos) ? authority.substr(at + 1) : authority, parsed);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos)
        sv = sv.substr(0, h_pos);

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

bool Url::is_absolute(const std::string& url) {
    UrlParsed parsed = parse(url);
    return !parsed.scheme.empty() && !parsed.host.empty();
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    // Absolute only when a scheme precedes the first '/', '?' or '#' and an authority follows.
    UrlParsed rel_parsed = parse(relative);
    if (!rel_parsed.scheme.empty() && !rel_parsed.host.empty())
        return relative;

    UrlParsed base_parsed = parse(base);

    if (relative.substr(0, 2) == "//")
        return base_parsed.scheme + ":" + relative;

    // Any other scheme-qualified reference (mailto:, javascript:) has no origin here.
    if (!rel_parsed.scheme.empty())
        return "";

    std::string prefix = base_parsed.scheme + "://" + authority_of(base_parsed);

    if (relative[0] == '?')
        return prefix + base_parsed.path + relative;

    std::string target;
    if (relative[0] == '/') {
        target = relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir    = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        target = dir + relative;
    }

    std::string query_frag;
    size_t      qf = target.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = target.substr(qf);
        target     = target.substr(0, qf);
    }

    return prefix + normalize_path(target) + query_frag;
}

bool Url::same_host(const std::string& url1, const std::string& url2) {
    return Text::to_lower(parse(url1).host) == Text::to_lower(parse(url2).host);
}

std::string Url::robots_url(const std::string& url) {
    UrlParsed parsed = parse(url);
    return parsed.scheme + "://" + authority_of(parsed) + Core::Constants::ROBOTS_PATH;
}

}  // namespace Utils
}  // namespace Robocache
