#ifndef GEOMETRY_H
#define GEOMETRY_H

/**
 * @brief Point in screen coordinates
 */
struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * @brief Axis-aligned rectangle in screen coordinates (left, top, width, height)
 */
struct Rect
{
    float left = 0.0f;
    float top = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    float right() const
    {
        return left + width;
    }
    float bottom() const
    {
        return top + height;
    }
    Point center() const
    {
        return Point{left + width / 2.0f, top + height / 2.0f};
    }
    bool contains(float x, float y) const
    {
        return x >= left && x < right() && y >= top && y < bottom();
    }
};

/**
 * @brief Directional navigation request
 */
enum class Direction
{
    Up,
    Down,
    Left,
    Right
};

#endif // GEOMETRY_H
