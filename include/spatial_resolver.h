#ifndef SPATIAL_RESOLVER_H
#define SPATIAL_RESOLVER_H

#include "focus_target.h"
#include "geometry.h"

#include <vector>

/**
 * @brief Picks the next focus target in a direction by center-to-center distance
 *
 * A candidate is eligible when its center lies strictly beyond the tolerance
 * band from the current center along the requested axis and sign. The nearest
 * eligible candidate (Euclidean distance between centers) wins; on equal
 * distance the first one in set order is kept. Overlap and alignment are not
 * scored beyond the tolerance gate.
 */
class SpatialResolver
{
public:
    static constexpr float DIRECTION_TOLERANCE = 10.0f;

    explicit SpatialResolver(float tolerance = DIRECTION_TOLERANCE);

    /**
     * @brief Resolve against precomputed boxes
     * @param boxes Bounding boxes in set order
     * @param currentIndex Index of the focused box
     * @return Index of the best candidate, currentIndex when none is eligible,
     *         0 when currentIndex is out of range, -1 for an empty set
     */
    int resolve(const std::vector<Rect>& boxes, int currentIndex, Direction direction) const;

    /**
     * @brief Resolve against live targets, reading every bounding box now
     */
    int resolve(const std::vector<FocusTarget*>& targets, int currentIndex, Direction direction) const;

    static bool isInDirection(const Point& from, const Point& to, Direction direction, float tolerance);

    void setTolerance(float tolerance)
    {
        m_tolerance = tolerance;
    }
    float getTolerance() const
    {
        return m_tolerance;
    }

private:
    float m_tolerance;
};

#endif // SPATIAL_RESOLVER_H
