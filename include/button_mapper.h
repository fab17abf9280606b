#ifndef BUTTON_MAPPER_H
#define BUTTON_MAPPER_H

#include <array>
#include <cstddef>
#include <map>

/**
 * @brief Logical inputs tracked by the input sampler
 *
 * The four directions combine the d-pad with the left stick; everything else
 * is a single button.
 */
enum class LogicalInput
{
    Up,
    Down,
    Left,
    Right,
    A,               // Accept / activate
    B,               // Back
    X,               // Backspace while typing
    Y,               // Space while typing, otherwise open search
    LB,              // Back in page / clear keyboard buffer
    RB,              // Forward in page / submit keyboard buffer
    LT,              // Secondary (context menu) click
    RT,              // Primary click
    Select,          // Toggle sidebar while browsing
    Start,           // Settings / sidebar
    LeftStickClick,
    RightStickClick, // Cycle pointer speed
    Count
};

constexpr std::size_t LOGICAL_INPUT_COUNT = static_cast<std::size_t>(LogicalInput::Count);

/**
 * @brief Button indices of the standard gamepad layout
 */
enum StandardButton
{
    STANDARD_BUTTON_A = 0,
    STANDARD_BUTTON_B = 1,
    STANDARD_BUTTON_X = 2,
    STANDARD_BUTTON_Y = 3,
    STANDARD_BUTTON_LB = 4,
    STANDARD_BUTTON_RB = 5,
    STANDARD_BUTTON_LT = 6,
    STANDARD_BUTTON_RT = 7,
    STANDARD_BUTTON_SELECT = 8,
    STANDARD_BUTTON_START = 9,
    STANDARD_BUTTON_LEFT_STICK = 10,
    STANDARD_BUTTON_RIGHT_STICK = 11,
    STANDARD_BUTTON_DPAD_UP = 12,
    STANDARD_BUTTON_DPAD_DOWN = 13,
    STANDARD_BUTTON_DPAD_LEFT = 14,
    STANDARD_BUTTON_DPAD_RIGHT = 15,
    STANDARD_BUTTON_COUNT = 16
};

/**
 * @brief Axis indices of the standard gamepad layout
 */
enum StandardAxis
{
    STANDARD_AXIS_LEFT_X = 0,
    STANDARD_AXIS_LEFT_Y = 1,
    STANDARD_AXIS_RIGHT_X = 2,
    STANDARD_AXIS_RIGHT_Y = 3,
    STANDARD_AXIS_COUNT = 4
};

/**
 * @brief Maps standard-layout button indices to logical inputs
 *
 * Controllers with a Nintendo face-button layout report A/B and X/Y in swapped
 * physical positions; building with BIGPICTURE_NINTENDO_LAYOUT swaps them back
 * so that "accept" stays on the bottom button.
 */
class ButtonMapper
{
public:
    ButtonMapper();
    ~ButtonMapper() = default;

    /**
     * @brief Logical input for a physical button index
     * @return LogicalInput::Count when the index is not mapped
     */
    LogicalInput mapButton(int standardIndex) const;

    /**
     * @brief Physical button index feeding a logical input
     * @return -1 when no button feeds the input
     */
    int indexFor(LogicalInput input) const;


    const char* getPlatformName() const;

private:
    std::map<int, LogicalInput> m_buttonMap;
    std::array<int, LOGICAL_INPUT_COUNT> m_indexMap{};

    void initializePlatformMappings();
};

#endif // BUTTON_MAPPER_H
