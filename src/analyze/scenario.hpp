#if !defined(HUPAI_ANALYZE_SCENARIO_HPP_INCLUDE_GUARD)
#define HUPAI_ANALYZE_SCENARIO_HPP_INCLUDE_GUARD

#include "core/interrupt.hpp"
#include "core/scoring.hpp"
#include "core/hand.hpp"
#include "common/scenario.pb.h"
#include <filesystem>
#include <iosfwd>
#include <vector>
#include <string_view>


namespace Hupai{

// Parses a scenario written in the protobuf text format.
hupai::Scenario parseScenario(std::string_view text);

hupai::Scenario loadScenario(std::filesystem::path const &path);

Hand makeHand(hupai::Scenario const &scenario);

RuleConfig makeRuleConfig(hupai::Scenario const &scenario);

// The reactions to `discard` in the order they arrived.
std::vector<ReactionCandidate> makeReactionCandidates(hupai::Discard const &discard);

// Analysis, score, waits and the outcome of the discard, if any.
void report(hupai::Scenario const &scenario, std::ostream &os);

} // namespace Hupai

#endif // !defined(HUPAI_ANALYZE_SCENARIO_HPP_INCLUDE_GUARD)
