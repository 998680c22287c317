/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <optional>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../text/string_utils.hpp"
#include "../url/url.hpp"
#include "absl/strings/match.h"
#include "robots.h"

namespace Robocache {
namespace Utils {

namespace {

bool looks_like_html(const std::string& content_type, const std::string& content) {
    if (!Text::icontains(content_type, "text/html"))
        return false;
    std::string head = Text::to_lower(Text::trim(content.substr(0, 256)));
    return Text::starts_with(head, "<!doctype html") || Text::starts_with(head, "<html")
           || Text::starts_with(head, "<head") || Text::starts_with(head, "<body");
}

class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            try {
                double delay = std::stod(std::string(value));
                if (seen_specific_agent_)
                    specific_delay_ = delay;
                else if (seen_global_agent_)
                    global_delay_ = delay;
            } catch (const std::logic_error&) {
                // not a number: the directive is ignored
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};

}  // namespace

RobotsTxt RobotsTxt::allow_all() {
    return RobotsTxt();
}

RobotsTxt RobotsTxt::forbid_all() {
    RobotsTxt robots;
    robots.mode_ = Mode::AllowNone;
    return robots;
}

RobotsTxt RobotsTxt::parse(const std::string&              url,
                           const std::string&              content,
                           const std::string&              content_type,
                           const std::vector<std::string>& agent_names) {
    if (content.find('\0') != std::string::npos)
        throw ParseError("binary content in robots.txt for " + url);

    if (looks_like_html(content_type, content))
        return allow_all();

    RobotsTxt robots;
    robots.mode_        = Mode::AllowSome;
    robots.content_     = content.substr(0, Core::Constants::MAX_ROBOTS_TXT_BYTES);
    robots.agent_names_ = agent_names;
    return robots;
}

bool RobotsTxt::is_allowed(const std::string& url) const {
    if (Url::parse(url).path == Core::Constants::ROBOTS_PATH)
        return true;

    switch (mode_) {
        case Mode::AllowAll: return true;
        case Mode::AllowNone: return false;
        case Mode::AllowSome: break;
    }

    googlebot::RobotsMatcher matcher;
    return matcher.AllowedByRobots(content_, &agent_names_, url);
}

double RobotsTxt::get_crawl_delay() const {
    if (mode_ != Mode::AllowSome)
        return 0.0;
    CrawlDelayMatcher matcher(agent_names_);
    return matcher.GetDelay(content_);
}

}  // namespace Utils
}  // namespace Robocache
