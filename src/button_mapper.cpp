#include "button_mapper.h"
#include <iostream>

ButtonMapper::ButtonMapper()
{
    m_indexMap.fill(-1);
    initializePlatformMappings();
}

void ButtonMapper::initializePlatformMappings()
{
    // Common mappings (same across all layouts)
    m_buttonMap[STANDARD_BUTTON_DPAD_UP] = LogicalInput::Up;
    m_buttonMap[STANDARD_BUTTON_DPAD_DOWN] = LogicalInput::Down;
    m_buttonMap[STANDARD_BUTTON_DPAD_LEFT] = LogicalInput::Left;
    m_buttonMap[STANDARD_BUTTON_DPAD_RIGHT] = LogicalInput::Right;
    m_buttonMap[STANDARD_BUTTON_LB] = LogicalInput::LB;
    m_buttonMap[STANDARD_BUTTON_RB] = LogicalInput::RB;
    m_buttonMap[STANDARD_BUTTON_LT] = LogicalInput::LT;
    m_buttonMap[STANDARD_BUTTON_RT] = LogicalInput::RT;
    m_buttonMap[STANDARD_BUTTON_SELECT] = LogicalInput::Select;
    m_buttonMap[STANDARD_BUTTON_START] = LogicalInput::Start;
    m_buttonMap[STANDARD_BUTTON_LEFT_STICK] = LogicalInput::LeftStickClick;
    m_buttonMap[STANDARD_BUTTON_RIGHT_STICK] = LogicalInput::RightStickClick;

#ifdef BIGPICTURE_NINTENDO_LAYOUT
    // Bottom face button reports as B, right face button as A
    m_buttonMap[STANDARD_BUTTON_B] = LogicalInput::A;
    m_buttonMap[STANDARD_BUTTON_A] = LogicalInput::B;
    m_buttonMap[STANDARD_BUTTON_Y] = LogicalInput::X;
    m_buttonMap[STANDARD_BUTTON_X] = LogicalInput::Y;

    std::cout << "ButtonMapper: Initialized Nintendo layout mappings" << std::endl;
#else
    m_buttonMap[STANDARD_BUTTON_A] = LogicalInput::A; // A (bottom) -> Accept
    m_buttonMap[STANDARD_BUTTON_B] = LogicalInput::B; // B (right) -> Back
    m_buttonMap[STANDARD_BUTTON_X] = LogicalInput::X; // X (left)
    m_buttonMap[STANDARD_BUTTON_Y] = LogicalInput::Y; // Y (top)

    std::cout << "ButtonMapper: Initialized standard mappings" << std::endl;
#endif

    for (const auto& entry : m_buttonMap)
    {
        m_indexMap[static_cast<std::size_t>(entry.second)] = entry.first;
    }
}

LogicalInput ButtonMapper::mapButton(int standardIndex) const
{
    auto it = m_buttonMap.find(standardIndex);
    if (it != m_buttonMap.end())
    {
        return it->second;
    }

    return LogicalInput::Count;
}

int ButtonMapper::indexFor(LogicalInput input) const
{
    if (input == LogicalInput::Count)
    {
        return -1;
    }
    return m_indexMap[static_cast<std::size_t>(input)];
}

const char* ButtonMapper::getPlatformName() const
{
#ifdef BIGPICTURE_NINTENDO_LAYOUT
    return "Nintendo";
#else
    return "Standard";
#endif
}
