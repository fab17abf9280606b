#ifndef INPUT_MANAGER_H
#define INPUT_MANAGER_H

#include "button_mapper.h"
#include "input_source.h"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Two-axis analog value in [-1, 1]
 */
struct StickVector
{
    float x = 0.0f;
    float y = 0.0f;

    bool isZero() const
    {
        return x == 0.0f && y == 0.0f;
    }
};

/**
 * @brief Deadzones applied while deriving a snapshot
 */
struct InputDeadzones
{
    float stick = 0.3f;   // Left stick as directional input
    float trigger = 0.1f; // Analog LT/RT
    float pointer = 0.15f; // Right stick, per axis
    float scroll = 0.25f;  // Left stick as scroll input
};

/**
 * @brief Level state of every logical input for one sample
 */
struct InputSnapshot
{
    std::array<bool, LOGICAL_INPUT_COUNT> active{};
    StickVector leftStick;  // Raw left stick
    StickVector rightStick; // Right stick with pointer deadzone applied
    StickVector scroll;     // Left stick with scroll deadzone applied

    bool isActive(LogicalInput input) const
    {
        return input != LogicalInput::Count && active[static_cast<size_t>(input)];
    }
};

/**
 * @brief Result of one sampler tick
 */
struct InputFrame
{
    bool connected = false;
    InputSnapshot snapshot;
    std::vector<LogicalInput> pressed; // false -> true edges, in LogicalInput order

    bool wasPressed(LogicalInput input) const;
};

/**
 * @brief Keys the physical keyboard can contribute
 */
enum class KeyCode
{
    None,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Space,
    Escape,
    Backspace,
    Tab,
    Character
};

/**
 * @brief A translated physical key press
 */
struct KeyPress
{
    KeyCode code = KeyCode::None;
    std::string text; // Printable text for KeyCode::Character
};

/**
 * @brief Input sampler: turns level-triggered controller state into edge events
 *
 * Holds no UI state. Each logical input keeps a "was active last sample" flag;
 * an edge is produced only on the sample where the input first reads active and
 * nothing more until it has read inactive again.
 */
class InputManager
{
public:
    InputManager();
    explicit InputManager(const InputDeadzones& deadzones);
    ~InputManager() = default;

    /**
     * @brief Poll the source once and derive the frame
     *
     * A disconnected or unreadable source yields an empty frame. The first
     * successful sample after a disconnect resets all edge state.
     */
    InputFrame update(InputSource& source);

    /**
     * @brief Derive snapshot and edges from an already-read state
     */
    InputFrame sample(const RawControllerState& raw);

    /**
     * @brief Derive the level snapshot without touching edge state
     */
    InputSnapshot derive(const RawControllerState& raw) const;

    /**
     * @brief Restrict directions to the d-pad (left stick is then used for scrolling)
     */
    void setDpadOnlyNavigation(bool dpadOnly)
    {
        m_dpadOnly = dpadOnly;
    }
    bool isDpadOnlyNavigation() const
    {
        return m_dpadOnly;
    }


    void resetEdgeState();

    bool isConnected() const
    {
        return m_connected;
    }

    const ButtonMapper& getButtonMapper() const
    {
        return m_buttonMapper;
    }

    /**
     * @brief value with |value| <= deadzone snapped to 0
     */
    static float applyDeadzone(float value, float deadzone);

private:
    ButtonMapper m_buttonMapper;
    InputDeadzones m_deadzones;

    std::array<bool, LOGICAL_INPUT_COUNT> m_lastActive{};
    bool m_connected = false;
    bool m_dpadOnly = false;

    static float axisValue(const RawControllerState& raw, int index);
    static bool buttonPressed(const RawControllerState& raw, int index);
    static float buttonValue(const RawControllerState& raw, int index);
};

#endif // INPUT_MANAGER_H
