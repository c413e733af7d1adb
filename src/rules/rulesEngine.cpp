#include "rules/rulesEngine.hpp"

#include <algorithm>

namespace banchess::rules {

bool LegalActions::contains(const Move& move) const {
	if (type == ActionType::Ban) {
		return std::ranges::any_of(actions, [&](const Move& m) { return m.sameSquares(move); });
	}
	return std::ranges::find(actions, move) != actions.end();
}

} // namespace banchess::rules
