#pragma once

#include <string>
#include <vector>

#include "types/replay_event.hpp"

namespace typing_proof {

/**
 * Replays events in order into the text they produce.
 * 
 * a-z append a letter, SPACE appends ' ', BACKSPACE drops the last character
 * (no-op on empty output), ENTER has no text effect. Any other code throws
 * InvalidKeyError; it is never skipped.
 */
std::string apply_events(const std::vector<ReplayEvent>& events);

} // namespace typing_proof
