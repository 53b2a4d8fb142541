#include "FrameSequence.hpp"

auto FrameSequence::next(WindowId window) -> uint64_t
{
    return issued[window]++;
}

auto FrameSequence::count(WindowId window) const -> uint64_t
{
    const auto found = issued.find(window);
    return found == issued.end() ? 0u : found->second;
}

auto FrameSequence::forget(WindowId window) -> void
{
    issued.erase(window);
}
