#include "spatial_resolver.h"
#include <cmath>
#include <limits>

SpatialResolver::SpatialResolver(float tolerance)
    : m_tolerance(tolerance)
{
}

bool SpatialResolver::isInDirection(const Point& from, const Point& to, Direction direction, float tolerance)
{
    switch (direction)
    {
    case Direction::Up:
        return to.y < from.y - tolerance;
    case Direction::Down:
        return to.y > from.y + tolerance;
    case Direction::Left:
        return to.x < from.x - tolerance;
    case Direction::Right:
        return to.x > from.x + tolerance;
    }
    return false;
}

int SpatialResolver::resolve(const std::vector<Rect>& boxes, int currentIndex, Direction direction) const
{
    if (boxes.empty())
    {
        return -1;
    }

    // Nothing focused yet: start from the first element
    if (currentIndex < 0 || currentIndex >= static_cast<int>(boxes.size()))
    {
        return 0;
    }

    const Point origin = boxes[static_cast<size_t>(currentIndex)].center();

    int bestIndex = currentIndex;
    float bestDistance = std::numeric_limits<float>::infinity();

    for (size_t i = 0; i < boxes.size(); ++i)
    {
        if (static_cast<int>(i) == currentIndex)
        {
            continue;
        }

        const Point candidate = boxes[i].center();
        if (!isInDirection(origin, candidate, direction, m_tolerance))
        {
            continue;
        }

        const float dx = candidate.x - origin.x;
        const float dy = candidate.y - origin.y;
        const float distance = std::sqrt(dx * dx + dy * dy);

        if (distance < bestDistance)
        {
            bestDistance = distance;
            bestIndex = static_cast<int>(i);
        }
    }

    return bestIndex;
}

int SpatialResolver::resolve(const std::vector<FocusTarget*>& targets, int currentIndex, Direction direction) const
{
    std::vector<Rect> boxes;
    boxes.reserve(targets.size());
    for (const FocusTarget* target : targets)
    {
        // A missing target gets a box no direction can reach
        boxes.push_back(target ? target->boundingBox()
                               : Rect{std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f});
    }
    return resolve(boxes, currentIndex, direction);
}
