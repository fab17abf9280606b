#ifndef FEEDBACK_H
#define FEEDBACK_H

#include <string>

/**
 * @brief User-facing feedback channel (toasts and navigation sounds)
 */
class Feedback
{
public:
    virtual ~Feedback() = default;

    /**
     * @brief Show a transient notification; a new toast replaces the previous one
     */
    virtual void showToast(const std::string& message) = 0;

    virtual void playNavSound() = 0;
    virtual void playSelectSound() = 0;
};

#endif // FEEDBACK_H
