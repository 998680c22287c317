#pragma once
#include <memory>
#include <string>

#include "../utils/robotstxt/robotstxt.hpp"

namespace Robocache {
namespace Robots {

using Utils::RobotsTxt;

// Resolved policy for one origin. Immutable; the policy is shared between
// the caller's copy and the cache entries.
class RuleSet {
public:
    RuleSet(std::shared_ptr<const RobotsTxt> policy, bool from_cache);

    static RuleSet parsed(RobotsTxt policy);
    // Permissive default used when no usable robots.txt exists.
    static RuleSet empty();
    static RuleSet forbid_all();

    RuleSet with_from_cache(bool from_cache) const;

    bool from_cache() const { return from_cache_; }
    bool same_policy(const RuleSet& other) const { return policy_ == other.policy_; }

    bool   is_allowed(const std::string& url) const { return policy_->is_allowed(url); }
    double crawl_delay() const { return policy_->get_crawl_delay(); }

private:
    std::shared_ptr<const RobotsTxt> policy_;
    bool                             from_cache_;
};

}  // namespace Robots
}  // namespace Robocache
