#include "spatial_resolver.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace
{

Rect boxAt(float cx, float cy, float size = 20.0f)
{
    return Rect{cx - size / 2.0f, cy - size / 2.0f, size, size};
}

// Reference computation: nearest strictly-beyond-tolerance center, first on ties
int nearestInDirection(const std::vector<Rect>& boxes, int current, Direction direction, float tolerance)
{
    const Point origin = boxes[static_cast<size_t>(current)].center();
    int best = current;
    float bestDistance = std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < boxes.size(); ++i)
    {
        if (static_cast<int>(i) == current)
            continue;
        const Point c = boxes[i].center();
        bool eligible = false;
        switch (direction)
        {
        case Direction::Up:
            eligible = c.y < origin.y - tolerance;
            break;
        case Direction::Down:
            eligible = c.y > origin.y + tolerance;
            break;
        case Direction::Left:
            eligible = c.x < origin.x - tolerance;
            break;
        case Direction::Right:
            eligible = c.x > origin.x + tolerance;
            break;
        }
        if (!eligible)
            continue;
        const float dx = c.x - origin.x;
        const float dy = c.y - origin.y;
        const float d = std::sqrt(dx * dx + dy * dy);
        if (d < bestDistance)
        {
            bestDistance = d;
            best = static_cast<int>(i);
        }
    }
    return best;
}

} // namespace

TEST(SpatialResolverTest, PicksNearestEligibleCandidate)
{
    SpatialResolver resolver;
    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(300, 100), boxAt(180, 140), boxAt(400, 400)};

    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Right), 2);
    EXPECT_EQ(resolver.resolve(boxes, 1, Direction::Left), 2);
    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Down), 2);
    EXPECT_EQ(resolver.resolve(boxes, 3, Direction::Up), 1);
}

TEST(SpatialResolverTest, OffAxisOffsetIsNotWeighted)
{
    SpatialResolver resolver;
    // Straight ahead at 100px versus diagonal at ~86px: plain distance prefers the diagonal
    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(200, 100), boxAt(150, 170)};
    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Right), 2);

    // Mirrored candidates at equal distance resolve to the earlier index
    std::vector<Rect> tied = {boxAt(100, 100), boxAt(160, 60), boxAt(160, 140)};
    EXPECT_EQ(resolver.resolve(tied, 0, Direction::Right), 1);
}

TEST(SpatialResolverTest, ToleranceBandExcludesNearlyAlignedCandidates)
{
    SpatialResolver resolver(10.0f);
    // Exactly 10px to the right is inside the band; 11px is beyond it
    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(110, 300), boxAt(111, 500)};

    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Right), 2);
    EXPECT_FALSE(SpatialResolver::isInDirection(Point{100, 100}, Point{110, 100}, Direction::Right, 10.0f));
    EXPECT_TRUE(SpatialResolver::isInDirection(Point{100, 100}, Point{111, 100}, Direction::Right, 10.0f));
}

TEST(SpatialResolverTest, NeverReturnsCandidateFailingPredicate)
{
    SpatialResolver resolver;
    std::vector<Rect> boxes;
    // Deterministic scatter of 40 boxes
    unsigned seed = 12345u;
    for (int i = 0; i < 40; ++i)
    {
        seed = seed * 1103515245u + 12345u;
        float x = static_cast<float>((seed >> 8) % 1000);
        seed = seed * 1103515245u + 12345u;
        float y = static_cast<float>((seed >> 8) % 700);
        boxes.push_back(boxAt(x, y));
    }

    for (int current = 0; current < static_cast<int>(boxes.size()); ++current)
    {
        for (Direction direction : {Direction::Up, Direction::Down, Direction::Left, Direction::Right})
        {
            int next = resolver.resolve(boxes, current, direction);
            EXPECT_EQ(next, nearestInDirection(boxes, current, direction, resolver.getTolerance()));
            if (next != current)
            {
                EXPECT_TRUE(SpatialResolver::isInDirection(boxes[static_cast<size_t>(current)].center(),
                                                           boxes[static_cast<size_t>(next)].center(), direction,
                                                           resolver.getTolerance()));
            }
        }
    }
}

TEST(SpatialResolverTest, TieKeepsFirstInSetOrder)
{
    SpatialResolver resolver;
    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(60, 200), boxAt(140, 200)};
    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Down), 1);

    std::swap(boxes[1], boxes[2]);
    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Down), 1);
}

TEST(SpatialResolverTest, NothingEligibleKeepsCurrentIndex)
{
    SpatialResolver resolver;
    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(200, 100)};
    EXPECT_EQ(resolver.resolve(boxes, 1, Direction::Right), 1);
    EXPECT_EQ(resolver.resolve(boxes, 0, Direction::Up), 0);
}

TEST(SpatialResolverTest, EmptySetAndInvalidIndex)
{
    SpatialResolver resolver;
    EXPECT_EQ(resolver.resolve(std::vector<Rect>{}, 0, Direction::Down), -1);

    std::vector<Rect> boxes = {boxAt(100, 100), boxAt(100, 200)};
    EXPECT_EQ(resolver.resolve(boxes, -1, Direction::Down), 0);
    EXPECT_EQ(resolver.resolve(boxes, 7, Direction::Down), 0);
}

TEST(SpatialResolverTest, ReadsLiveBoundingBoxes)
{
    using testing_support::FakeTarget;

    FakeTarget a("a", boxAt(100, 100));
    FakeTarget b("b", boxAt(300, 100));
    FakeTarget c("c", boxAt(500, 100));
    std::vector<FocusTarget*> targets = {&a, &b, &c};

    SpatialResolver resolver;
    EXPECT_EQ(resolver.resolve(targets, 0, Direction::Right), 1);

    // Layout changed since the set was built
    b.box = boxAt(700, 100);
    EXPECT_EQ(resolver.resolve(targets, 0, Direction::Right), 2);
}
