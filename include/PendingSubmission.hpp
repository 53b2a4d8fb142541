#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

// Keeps the resources of a GPU submission alive until it has been waited on.
//
// A submission only becomes pending once the submit call returns. When it
// throws, nothing is pending and retire() has nothing to wait for.
template <typename Payload>
class PendingSubmission
{
  public:
    template <typename Submit>
    auto submit(
        Payload &&payload,
        Submit  &&submitFn) -> void
    {
        if (held) {
            throw std::logic_error{"previous submission was never retired"};
        }

        std::invoke(submitFn);
        held.emplace(std::move(payload));
    }

    // Runs `waitFn` if a submission is pending, then releases its payload.
    template <typename Wait>
    auto retire(Wait &&waitFn) -> void
    {
        if (!held) {
            return;
        }

        std::invoke(waitFn);
        held.reset();
    }

    [[nodiscard]]
    auto pending() const -> bool
    {
        return held.has_value();
    }

  private:
    std::optional<Payload> held;
};
