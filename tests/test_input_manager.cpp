#include "input_manager.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <limits>

using testing_support::FakeInputSource;

namespace
{

RawControllerState idleState()
{
    RawControllerState raw;
    raw.axes.assign(STANDARD_AXIS_COUNT, 0.0f);
    raw.buttons.assign(STANDARD_BUTTON_COUNT, false);
    raw.buttonValues.assign(STANDARD_BUTTON_COUNT, 0.0f);
    return raw;
}

class InputManagerTest : public ::testing::Test
{
protected:
    InputManager input;
    ButtonMapper mapper;

    int indexOf(LogicalInput logical) const
    {
        return mapper.indexFor(logical);
    }
};

} // namespace

TEST_F(InputManagerTest, HeldButtonProducesOneEdge)
{
    RawControllerState raw = idleState();
    raw.buttons[static_cast<size_t>(indexOf(LogicalInput::A))] = true;

    InputFrame first = input.sample(raw);
    EXPECT_TRUE(first.wasPressed(LogicalInput::A));

    for (int i = 0; i < 5; ++i)
    {
        InputFrame held = input.sample(raw);
        EXPECT_FALSE(held.wasPressed(LogicalInput::A));
        EXPECT_TRUE(held.snapshot.isActive(LogicalInput::A));
    }

    input.sample(idleState());
    EXPECT_TRUE(input.sample(raw).wasPressed(LogicalInput::A));
}

TEST_F(InputManagerTest, EdgesFollowLogicalInputOrder)
{
    RawControllerState raw = idleState();
    raw.buttons[static_cast<size_t>(indexOf(LogicalInput::Start))] = true;
    raw.buttons[static_cast<size_t>(indexOf(LogicalInput::B))] = true;
    raw.buttons[STANDARD_BUTTON_DPAD_UP] = true;

    InputFrame frame = input.sample(raw);
    ASSERT_EQ(frame.pressed.size(), 3u);
    EXPECT_EQ(frame.pressed[0], LogicalInput::Up);
    EXPECT_EQ(frame.pressed[1], LogicalInput::B);
    EXPECT_EQ(frame.pressed[2], LogicalInput::Start);
}

TEST_F(InputManagerTest, StickDeadzoneBoundaryIsInactive)
{
    RawControllerState raw = idleState();
    raw.axes[STANDARD_AXIS_LEFT_X] = 0.3f;
    EXPECT_FALSE(input.derive(raw).isActive(LogicalInput::Right));

    raw.axes[STANDARD_AXIS_LEFT_X] = 0.31f;
    EXPECT_TRUE(input.derive(raw).isActive(LogicalInput::Right));

    raw.axes[STANDARD_AXIS_LEFT_X] = 0.0f;
    raw.axes[STANDARD_AXIS_LEFT_Y] = -0.3f;
    EXPECT_FALSE(input.derive(raw).isActive(LogicalInput::Up));

    raw.axes[STANDARD_AXIS_LEFT_Y] = -0.31f;
    EXPECT_TRUE(input.derive(raw).isActive(LogicalInput::Up));
}

TEST_F(InputManagerTest, TriggerDeadzoneBoundaryIsInactive)
{
    RawControllerState raw = idleState();
    raw.buttonValues[STANDARD_BUTTON_RT] = 0.1f;
    EXPECT_FALSE(input.derive(raw).isActive(LogicalInput::RT));

    raw.buttonValues[STANDARD_BUTTON_RT] = 0.11f;
    EXPECT_TRUE(input.derive(raw).isActive(LogicalInput::RT));

    raw.buttonValues[STANDARD_BUTTON_RT] = 0.0f;
    raw.buttons[STANDARD_BUTTON_LT] = true;
    EXPECT_TRUE(input.derive(raw).isActive(LogicalInput::LT));
}

TEST_F(InputManagerTest, PointerDeadzoneAppliesPerAxis)
{
    RawControllerState raw = idleState();
    raw.axes[STANDARD_AXIS_RIGHT_X] = 0.15f;
    raw.axes[STANDARD_AXIS_RIGHT_Y] = -0.5f;

    InputSnapshot snapshot = input.derive(raw);
    EXPECT_FLOAT_EQ(snapshot.rightStick.x, 0.0f);
    EXPECT_FLOAT_EQ(snapshot.rightStick.y, -0.5f);

    raw.axes[STANDARD_AXIS_RIGHT_X] = 0.16f;
    EXPECT_FLOAT_EQ(input.derive(raw).rightStick.x, 0.16f);
}

TEST_F(InputManagerTest, DpadAndStickShareDirections)
{
    RawControllerState raw = idleState();
    raw.buttons[STANDARD_BUTTON_DPAD_LEFT] = true;
    EXPECT_TRUE(input.sample(raw).wasPressed(LogicalInput::Left));

    // Switching from d-pad to stick while held is not a new edge
    raw.buttons[STANDARD_BUTTON_DPAD_LEFT] = false;
    raw.axes[STANDARD_AXIS_LEFT_X] = -0.9f;
    EXPECT_FALSE(input.sample(raw).wasPressed(LogicalInput::Left));
}

TEST_F(InputManagerTest, DpadOnlyTurnsLeftStickIntoScroll)
{
    input.setDpadOnlyNavigation(true);

    RawControllerState raw = idleState();
    raw.axes[STANDARD_AXIS_LEFT_Y] = 0.8f;
    raw.axes[STANDARD_AXIS_LEFT_X] = 0.2f;

    InputFrame frame = input.sample(raw);
    EXPECT_FALSE(frame.wasPressed(LogicalInput::Down));
    EXPECT_FLOAT_EQ(frame.snapshot.scroll.y, 0.8f);
    EXPECT_FLOAT_EQ(frame.snapshot.scroll.x, 0.0f);

    raw.buttons[STANDARD_BUTTON_DPAD_DOWN] = true;
    EXPECT_TRUE(input.sample(raw).wasPressed(LogicalInput::Down));
}

TEST_F(InputManagerTest, ScrollIsZeroOutsideDpadOnlyMode)
{
    RawControllerState raw = idleState();
    raw.axes[STANDARD_AXIS_LEFT_Y] = 0.8f;
    EXPECT_TRUE(input.derive(raw).scroll.isZero());
}

TEST_F(InputManagerTest, MissingAndInvalidValuesReadAsIdle)
{
    RawControllerState raw;
    raw.axes = {std::numeric_limits<float>::quiet_NaN()};
    InputSnapshot snapshot = input.derive(raw);
    for (size_t i = 0; i < LOGICAL_INPUT_COUNT; ++i)
    {
        EXPECT_FALSE(snapshot.active[i]);
    }
}

TEST_F(InputManagerTest, DisconnectYieldsEmptyFrames)
{
    FakeInputSource source;
    source.connected = false;

    InputFrame frame = input.update(source);
    EXPECT_FALSE(frame.connected);
    EXPECT_TRUE(frame.pressed.empty());
    EXPECT_FALSE(input.isConnected());
}

TEST_F(InputManagerTest, ReconnectResetsEdgeState)
{
    FakeInputSource source;
    source.setButton(indexOf(LogicalInput::A), true);

    EXPECT_TRUE(input.update(source).wasPressed(LogicalInput::A));
    EXPECT_FALSE(input.update(source).wasPressed(LogicalInput::A));

    source.connected = false;
    input.update(source);
    EXPECT_FALSE(input.isConnected());

    // Still held across the disconnect: reported again after reconnecting
    source.connected = true;
    InputFrame frame = input.update(source);
    EXPECT_TRUE(input.isConnected());
    EXPECT_TRUE(frame.wasPressed(LogicalInput::A));
}

TEST_F(InputManagerTest, ThrowingSourceCountsAsDisconnected)
{
    FakeInputSource source;
    input.update(source);
    ASSERT_TRUE(input.isConnected());

    source.throwOnSample = true;
    InputFrame frame = input.update(source);
    EXPECT_FALSE(frame.connected);
    EXPECT_FALSE(input.isConnected());
}

TEST(ButtonMapperTest, FaceButtonsRoundTrip)
{
    ButtonMapper mapper;
    for (LogicalInput logical : {LogicalInput::A, LogicalInput::B, LogicalInput::X, LogicalInput::Y})
    {
        int index = mapper.indexFor(logical);
        ASSERT_GE(index, 0);
        EXPECT_EQ(mapper.mapButton(index), logical);
    }
    EXPECT_EQ(mapper.mapButton(STANDARD_BUTTON_START), LogicalInput::Start);
    EXPECT_EQ(mapper.mapButton(STANDARD_BUTTON_DPAD_RIGHT), LogicalInput::Right);
    EXPECT_EQ(mapper.mapButton(99), LogicalInput::Count);
}

TEST(ButtonMapperTest, PlatformNameMatchesFaceButtonLayout)
{
    ButtonMapper mapper;
#ifdef BIGPICTURE_NINTENDO_LAYOUT
    EXPECT_STREQ(mapper.getPlatformName(), "Nintendo");
    EXPECT_EQ(mapper.mapButton(STANDARD_BUTTON_A), LogicalInput::B);
#else
    EXPECT_STREQ(mapper.getPlatformName(), "Standard");
    EXPECT_EQ(mapper.mapButton(STANDARD_BUTTON_A), LogicalInput::A);
#endif
}
