#include "sdl_feedback.h"

#include <cmath>
#include <iostream>
#include <vector>

namespace
{
constexpr float PI = 3.14159265358979f;
} // namespace

SdlFeedback::SdlFeedback(Scheduler& scheduler)
    : m_scheduler(scheduler)
{
    SDL_AudioSpec desired;
    SDL_zero(desired);
    desired.freq = m_sampleRate;
    desired.format = AUDIO_F32SYS;
    desired.channels = 1;
    desired.samples = 512;
    desired.callback = nullptr; // Queued audio

    SDL_AudioSpec obtained;
    m_audioDevice = SDL_OpenAudioDevice(nullptr, 0, &desired, &obtained, 0);
    if (m_audioDevice == 0)
    {
        std::cerr << "[SdlFeedback] Could not open audio device, sounds disabled: " << SDL_GetError() << std::endl;
        return;
    }

    m_sampleRate = obtained.freq;
    SDL_PauseAudioDevice(m_audioDevice, 0);
}

SdlFeedback::~SdlFeedback()
{
    if (m_audioDevice != 0)
    {
        SDL_CloseAudioDevice(m_audioDevice);
    }
}

void SdlFeedback::showToast(const std::string& message)
{
    m_toast = message;
    uint64_t generation = ++m_toastGeneration;

    // Only the latest toast's timer clears it
    m_scheduler.defer(TOAST_DURATION_MS,
                      [this, generation]()
                      {
                          if (generation == m_toastGeneration)
                          {
                              m_toast.clear();
                          }
                      });
}

void SdlFeedback::playNavSound()
{
    beep(800.0f, 30, 0.1f);
}

void SdlFeedback::playSelectSound()
{
    beep(1200.0f, 50, 0.15f);
}

void SdlFeedback::beep(float frequency, uint32_t durationMs, float volume)
{
    if (!m_soundEnabled || m_audioDevice == 0)
    {
        return;
    }

    const size_t sampleCount = static_cast<size_t>(m_sampleRate) * durationMs / 1000;
    std::vector<float> samples(sampleCount);
    for (size_t i = 0; i < sampleCount; ++i)
    {
        // Linear fade out
        float envelope = 1.0f - static_cast<float>(i) / static_cast<float>(sampleCount);
        samples[i] = volume * envelope * std::sin(2.0f * PI * frequency * static_cast<float>(i) / m_sampleRate);
    }

    // A new beep replaces anything still queued
    SDL_ClearQueuedAudio(m_audioDevice);
    if (SDL_QueueAudio(m_audioDevice, samples.data(), static_cast<Uint32>(samples.size() * sizeof(float))) != 0)
    {
        std::cerr << "[SdlFeedback] Could not queue sound: " << SDL_GetError() << std::endl;
    }
}
