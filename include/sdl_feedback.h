#ifndef SDL_FEEDBACK_H
#define SDL_FEEDBACK_H

#include "feedback.h"
#include "frame_scheduler.h"

#include <SDL.h>
#include <cstdint>
#include <string>

/**
 * @brief Toasts drawn by the scene and short beeps on an SDL audio device
 *
 * An unavailable audio device only disables sounds.
 */
class SdlFeedback : public Feedback
{
public:
    static constexpr uint32_t TOAST_DURATION_MS = 3000;

    explicit SdlFeedback(Scheduler& scheduler);
    ~SdlFeedback() override;

    SdlFeedback(const SdlFeedback&) = delete;
    SdlFeedback& operator=(const SdlFeedback&) = delete;

    void showToast(const std::string& message) override;
    void playNavSound() override;
    void playSelectSound() override;

    void setSoundEnabled(bool enabled)
    {
        m_soundEnabled = enabled;
    }
    bool isSoundEnabled() const
    {
        return m_soundEnabled;
    }

    bool hasToast() const
    {
        return !m_toast.empty();
    }
    const std::string& getToast() const
    {
        return m_toast;
    }

private:
    Scheduler& m_scheduler;
    SDL_AudioDeviceID m_audioDevice{0};
    int m_sampleRate{44100};
    bool m_soundEnabled{true};

    std::string m_toast;
    uint64_t m_toastGeneration{0};

    void beep(float frequency, uint32_t durationMs, float volume);
};

#endif // SDL_FEEDBACK_H
