#pragma once
#include <juce_core/juce_core.h>

/**
 * A text-to-speech service.
 *
 * Implementations write encoded speech (MP3) for the given text to the
 * destination file. Any failure is reported through the returned Result and
 * the caller falls back to silence, so implementations never throw.
 */
class SpeechBackend
{
public:
    virtual ~SpeechBackend() = default;

    virtual juce::String getName() const = 0;

    virtual juce::Result synthesize(const juce::String& text,
                                    const juce::String& languageCode,
                                    const juce::File& destination) = 0;
};
