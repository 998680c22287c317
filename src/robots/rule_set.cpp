#include "rule_set.hpp"

namespace Robocache {
namespace Robots {

namespace {
const std::shared_ptr<const RobotsTxt>& empty_policy() {
    static const auto policy = std::make_shared<const RobotsTxt>(RobotsTxt::allow_all());
    return policy;
}

const std::shared_ptr<const RobotsTxt>& forbid_all_policy() {
    static const auto policy = std::make_shared<const RobotsTxt>(RobotsTxt::forbid_all());
    return policy;
}
}  // namespace

RuleSet::RuleSet(std::shared_ptr<const RobotsTxt> policy, bool from_cache)
    : policy_(policy ? std::move(policy) : empty_policy()), from_cache_(from_cache) {
}

RuleSet RuleSet::parsed(RobotsTxt policy) {
    return RuleSet(std::make_shared<const RobotsTxt>(std::move(policy)), false);
}

RuleSet RuleSet::empty() {
    return RuleSet(empty_policy(), false);
}

RuleSet RuleSet::forbid_all() {
    return RuleSet(forbid_all_policy(), false);
}

RuleSet RuleSet::with_from_cache(bool from_cache) const {
    return RuleSet(policy_, from_cache);
}

}  // namespace Robots
}  // namespace Robocache
