#pragma once
#include "SpeechBackend.h"

/**
 * Speech from the Google Translate TTS endpoint.
 *
 * The endpoint accepts at most 100 characters per request, so longer text is
 * split at sentence and word boundaries and the MP3 payloads of the chunks
 * are concatenated. MP3 frames are self-delimiting, so the result plays as a
 * single stream.
 */
class GoogleSpeechBackend : public SpeechBackend
{
public:
    static constexpr int maxChunkLength = 100;

    explicit GoogleSpeechBackend(int timeoutMs = 15000);

    juce::String getName() const override { return "google"; }

    juce::Result synthesize(const juce::String& text,
                            const juce::String& languageCode,
                            const juce::File& destination) override;

    /** Splits text into request-sized pieces, preferring sentence, then word boundaries. */
    static juce::StringArray splitIntoChunks(const juce::String& text, int maxLength = maxChunkLength);

    static juce::URL buildRequestUrl(const juce::String& chunk, const juce::String& languageCode,
                                     int chunkIndex, int numChunks);

    /** True when the bytes start like an MP3 stream (ID3 tag or frame sync). */
    static bool looksLikeMp3(const juce::MemoryBlock& data);

private:
    juce::Result fetchChunk(const juce::URL& url, juce::MemoryBlock& destination) const;

    int timeoutMs;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(GoogleSpeechBackend)
};
