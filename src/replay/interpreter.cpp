#include "replay/interpreter.hpp"
#include "common/errors.hpp"

namespace typing_proof {

std::string apply_events(const std::vector<ReplayEvent>& events) {
    std::string output;
    output.reserve(events.size());

    for (size_t i = 0; i < events.size(); ++i) {
        uint8_t key = events[i].key;
        if (key <= KEY_Z) {
            output.push_back(static_cast<char>('a' + key));
        } else if (key == KEY_SPACE) {
            output.push_back(' ');
        } else if (key == KEY_BACKSPACE) {
            if (!output.empty()) {
                output.pop_back();
            }
        } else if (key == KEY_ENTER) {
            // End marker only
        } else {
            throw InvalidKeyError(key, i);
        }
    }
    return output;
}

} // namespace typing_proof
