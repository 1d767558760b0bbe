#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

/**
 * Writes the silent narration used whenever speech is unavailable.
 *
 * The output is a 16-bit stereo WAV at 44.1 kHz with no metadata, so the
 * same duration always produces the same bytes.
 */
class SilentAudioWriter
{
public:
    static constexpr double sampleRate = 44100.0;
    static constexpr int numChannels = 2;
    static constexpr int bitsPerSample = 16;

    /**
     * Writes durationSeconds of silence to destination, replacing any existing file.
     * @return false if the file could not be written
     */
    static bool writeSilence(const juce::File& destination, double durationSeconds);

    /** Number of sample frames written for a given duration. */
    static juce::int64 numSamplesFor(double durationSeconds);
};
