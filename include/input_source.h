#ifndef INPUT_SOURCE_H
#define INPUT_SOURCE_H

#include <string>
#include <vector>

/**
 * @brief One poll of a controller in the standard gamepad layout
 *
 * Axes: 0/1 = left stick x/y, 2/3 = right stick x/y, range [-1, 1].
 * Buttons: 0-3 = A/B/X/Y, 4/5 = LB/RB, 6/7 = LT/RT, 8 = Select, 9 = Start,
 * 10/11 = left/right stick click, 12-15 = d-pad up/down/left/right.
 * buttonValues optionally carries analog values in [0, 1] for the same indices
 * (only the triggers are read).
 */
struct RawControllerState
{
    std::vector<float> axes;
    std::vector<bool> buttons;
    std::vector<float> buttonValues;
};

/**
 * @brief Controller-state provider polled once per frame
 */
class InputSource
{
public:
    virtual ~InputSource() = default;

    /**
     * @brief Read the current controller state
     * @param state Filled on success
     * @return false when no controller is connected or it could not be read
     */
    virtual bool sample(RawControllerState& state) = 0;

    /**
     * @brief Human readable controller name for logging
     */
    virtual std::string name() const
    {
        return "controller";
    }
};

#endif // INPUT_SOURCE_H
