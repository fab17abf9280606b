#include "input_manager.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

bool InputFrame::wasPressed(LogicalInput input) const
{
    return std::find(pressed.begin(), pressed.end(), input) != pressed.end();
}

InputManager::InputManager()
{
}

InputManager::InputManager(const InputDeadzones& deadzones)
    : m_deadzones(deadzones)
{
}

InputFrame InputManager::update(InputSource& source)
{
    RawControllerState raw;
    bool ok = false;

    try
    {
        ok = source.sample(raw);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[InputManager] Could not read controller: " << e.what() << std::endl;
        ok = false;
    }

    if (!ok)
    {
        if (m_connected)
        {
            m_connected = false;
            std::cout << "[InputManager] Game controller disconnected." << std::endl;
        }
        return InputFrame{};
    }

    if (!m_connected)
    {
        m_connected = true;
        resetEdgeState();
        std::cout << "[InputManager] Game controller connected: " << source.name() << std::endl;
    }

    return sample(raw);
}

InputFrame InputManager::sample(const RawControllerState& raw)
{
    InputFrame frame;
    frame.connected = true;
    frame.snapshot = derive(raw);

    for (size_t i = 0; i < LOGICAL_INPUT_COUNT; ++i)
    {
        bool level = frame.snapshot.active[i];
        if (level && !m_lastActive[i])
        {
            frame.pressed.push_back(static_cast<LogicalInput>(i));
        }
        m_lastActive[i] = level;
    }

    return frame;
}

InputSnapshot InputManager::derive(const RawControllerState& raw) const
{
    InputSnapshot snapshot;

    const float leftX = axisValue(raw, STANDARD_AXIS_LEFT_X);
    const float leftY = axisValue(raw, STANDARD_AXIS_LEFT_Y);
    snapshot.leftStick = StickVector{leftX, leftY};

    const bool stickUp = leftY < -m_deadzones.stick;
    const bool stickDown = leftY > m_deadzones.stick;
    const bool stickLeft = leftX < -m_deadzones.stick;
    const bool stickRight = leftX > m_deadzones.stick;

    for (int index = 0; index < STANDARD_BUTTON_COUNT; ++index)
    {
        LogicalInput input = m_buttonMapper.mapButton(index);
        if (input == LogicalInput::Count)
        {
            continue;
        }

        bool pressed = buttonPressed(raw, index);
        if (input == LogicalInput::LT || input == LogicalInput::RT)
        {
            pressed = pressed || buttonValue(raw, index) > m_deadzones.trigger;
        }

        snapshot.active[static_cast<size_t>(input)] = pressed;
    }

    if (!m_dpadOnly)
    {
        auto merge = [&snapshot](LogicalInput input, bool stickActive)
        {
            snapshot.active[static_cast<size_t>(input)] = snapshot.active[static_cast<size_t>(input)] || stickActive;
        };
        merge(LogicalInput::Up, stickUp);
        merge(LogicalInput::Down, stickDown);
        merge(LogicalInput::Left, stickLeft);
        merge(LogicalInput::Right, stickRight);
    }
    else
    {
        snapshot.scroll.x = applyDeadzone(leftX, m_deadzones.scroll);
        snapshot.scroll.y = applyDeadzone(leftY, m_deadzones.scroll);
    }

    snapshot.rightStick.x = applyDeadzone(axisValue(raw, STANDARD_AXIS_RIGHT_X), m_deadzones.pointer);
    snapshot.rightStick.y = applyDeadzone(axisValue(raw, STANDARD_AXIS_RIGHT_Y), m_deadzones.pointer);

    return snapshot;
}

void InputManager::resetEdgeState()
{
    m_lastActive.fill(false);
}

float InputManager::applyDeadzone(float value, float deadzone)
{
    return std::fabs(value) > deadzone ? value : 0.0f;
}

float InputManager::axisValue(const RawControllerState& raw, int index)
{
    if (index < 0 || index >= static_cast<int>(raw.axes.size()))
    {
        return 0.0f;
    }
    float value = raw.axes[static_cast<size_t>(index)];
    if (std::isnan(value))
    {
        return 0.0f;
    }
    return std::clamp(value, -1.0f, 1.0f);
}

bool InputManager::buttonPressed(const RawControllerState& raw, int index)
{
    if (index < 0 || index >= static_cast<int>(raw.buttons.size()))
    {
        return false;
    }
    return raw.buttons[static_cast<size_t>(index)];
}

float InputManager::buttonValue(const RawControllerState& raw, int index)
{
    if (index < 0 || index >= static_cast<int>(raw.buttonValues.size()))
    {
        return 0.0f;
    }
    return raw.buttonValues[static_cast<size_t>(index)];
}
