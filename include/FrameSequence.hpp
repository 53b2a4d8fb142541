#pragma once

#include <cstdint>
#include <unordered_map>

#include "RawFrame.hpp"

// Per-window frame counter. Numbers start at 0 and are never reused while the
// window is tracked.
class FrameSequence
{
  public:
    // Returns the number of the next frame for `window` and advances the counter.
    auto next(WindowId window) -> uint64_t;

    // Number of frames issued so far for `window`.
    [[nodiscard]]
    auto count(WindowId window) const -> uint64_t;

    // Stops tracking a closed window.
    auto forget(WindowId window) -> void;

  private:
    std::unordered_map<WindowId, uint64_t> issued;
};
