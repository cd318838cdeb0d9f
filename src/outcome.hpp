#ifndef SIGIL_OUTCOME_HPP
#define SIGIL_OUTCOME_HPP

namespace sigil {

// Result of a primitive that can curse. When `cursed` is set, `value` already
// holds the policy value the caller should continue with.
template<typename T>
struct Outcome {
	T value;
	bool cursed {false};
};

} // namespace sigil

#endif
