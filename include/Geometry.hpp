#pragma once

#include <glm/glm.hpp>

// Window-space rectangle. Origin is the top-left corner.
struct Rect {
    glm::vec2 position{0.0f};
    glm::vec2 size{0.0f};

    static auto fromSize(
        float width,
        float height) -> Rect
    {
        return Rect{{0.0f, 0.0f}, {width, height}};
    }

    [[nodiscard]]
    auto x() const -> float
    {
        return position.x;
    }
    [[nodiscard]]
    auto y() const -> float
    {
        return position.y;
    }
    [[nodiscard]]
    auto w() const -> float
    {
        return size.x;
    }
    [[nodiscard]]
    auto h() const -> float
    {
        return size.y;
    }

    auto left() const -> float
    {
        return position.x;
    }
    auto right() const -> float
    {
        return position.x + size.x;
    }
    auto top() const -> float
    {
        return position.y;
    }
    auto bottom() const -> float
    {
        return position.y + size.y;
    }

    // Half-open: the right and bottom edges are outside.
    auto contains(glm::vec2 point) const -> bool
    {
        return point.x >= left() && point.x < right() && point.y >= top()
            && point.y < bottom();
    }

    auto operator==(const Rect &other) const -> bool
    {
        return position == other.position && size == other.size;
    }
};
