#include "frame_slots.h"

#include <algorithm>
#include <stdexcept>

namespace fm {

const char* to_string(SlotState state) {
    switch (state) {
        case SlotState::Idle: return "Idle";
        case SlotState::Acquired: return "Acquired";
        case SlotState::Submitted: return "Submitted";
        case SlotState::Broken: return "Broken";
    }
    return "Unknown";
}

FrameSlots::FrameSlots(std::size_t count) : states_(count, SlotState::Idle) {
    if (count == 0) {
        throw std::invalid_argument("FrameSlots needs at least one slot");
    }
}

bool FrameSlots::can_wait(std::size_t slot) const {
    const SlotState s = states_.at(slot);
    return s == SlotState::Idle || s == SlotState::Submitted;
}

bool FrameSlots::needs_rebuild() const {
    return std::find(states_.begin(), states_.end(), SlotState::Broken) != states_.end();
}

void FrameSlots::mark_acquired(std::size_t slot) {
    states_.at(slot) = SlotState::Acquired;
}

void FrameSlots::mark_submitted(std::size_t slot) {
    states_.at(slot) = SlotState::Submitted;
}

void FrameSlots::mark_broken(std::size_t slot) {
    states_.at(slot) = SlotState::Broken;
}

void FrameSlots::abandon(std::size_t slot) {
    if (states_.at(slot) == SlotState::Acquired) {
        states_[slot] = SlotState::Broken;
    }
}

void FrameSlots::advance() {
    current_ = (current_ + 1) % states_.size();
}

void FrameSlots::reset() {
    std::fill(states_.begin(), states_.end(), SlotState::Idle);
    current_ = 0;
}

} // namespace fm
