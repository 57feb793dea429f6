#pragma once

#include <cstddef>
#include <vector>

namespace fm {

enum class SlotState {
    Idle,      // fence signaled, semaphores unsignaled
    Acquired,  // image-available semaphore will signal; no submit yet
    Submitted, // fence will signal once the copy finishes
    Broken,    // fence or semaphore left in a state no later submit resolves
};

const char* to_string(SlotState state);

// Tracks the frames-in-flight ring so the swapchain never waits on a fence that was reset
// without a submit, or acquires with a semaphore that is still signaled.
class FrameSlots {
public:
    explicit FrameSlots(std::size_t count);

    std::size_t count() const { return states_.size(); }
    std::size_t current() const { return current_; }
    SlotState state(std::size_t slot) const { return states_.at(slot); }

    // Waiting on the slot's fence is bounded only for Idle and Submitted slots.
    bool can_wait(std::size_t slot) const;
    // True once any slot is Broken; sync objects must be recreated before the next frame.
    bool needs_rebuild() const;

    void mark_acquired(std::size_t slot);
    void mark_submitted(std::size_t slot);
    void mark_broken(std::size_t slot);
    // An acquired frame that never reaches submit leaves its semaphore signaled.
    void abandon(std::size_t slot);

    void advance();
    // Fresh sync objects: every slot Idle, ring back at slot 0.
    void reset();

private:
    std::vector<SlotState> states_;
    std::size_t current_ = 0;
};

} // namespace fm
