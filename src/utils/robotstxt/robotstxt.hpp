/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Robocache {
namespace Utils {

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RobotsTxt {
public:
    enum class Mode { AllowAll, AllowNone, AllowSome };

    RobotsTxt() = default;

    static RobotsTxt allow_all();
    static RobotsTxt forbid_all();

    // Throws ParseError when `content` cannot be a robots.txt document.
    static RobotsTxt parse(const std::string&              url,
                           const std::string&              content,
                           const std::string&              content_type,
                           const std::vector<std::string>& agent_names);

    bool   is_allowed(const std::string& url) const;
    double get_crawl_delay() const;

    Mode                            mode() const { return mode_; }
    const std::string&              content() const { return content_; }

private:
    Mode                     mode_ = Mode::AllowAll;
    std::string              content_;
    std::vector<std::string> agent_names_;
};

}  // namespace Utils
}  // namespace Robocache
