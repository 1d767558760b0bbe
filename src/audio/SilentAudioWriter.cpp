#include "SilentAudioWriter.h"

juce::int64 SilentAudioWriter::numSamplesFor(double durationSeconds)
{
    return (juce::int64) std::llround(durationSeconds * sampleRate);
}

bool SilentAudioWriter::writeSilence(const juce::File& destination, double durationSeconds)
{
    const juce::int64 totalSamples = numSamplesFor(durationSeconds);
    if (totalSamples <= 0)
        return false;

    // FileOutputStream appends, so start from an empty file
    if (destination.existsAsFile() && !destination.deleteFile())
        return false;

    auto stream = std::make_unique<juce::FileOutputStream>(destination);
    if (!stream->openedOk())
        return false;

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(wavFormat.createWriterFor(stream.get(),
                                                                              sampleRate,
                                                                              (unsigned int) numChannels,
                                                                              bitsPerSample,
                                                                              {},   // No metadata
                                                                              0));

    if (writer == nullptr)
        return false;

    // The writer owns the stream from here on
    stream.release();

    const int chunkSize = 8192;
    juce::AudioBuffer<float> silence(numChannels, chunkSize);
    silence.clear();

    for (juce::int64 written = 0; written < totalSamples; written += chunkSize)
    {
        const int count = (int) juce::jmin((juce::int64) chunkSize, totalSamples - written);
        if (!writer->writeFromAudioSampleBuffer(silence, 0, count))
            return false;
    }

    writer.reset();
    return destination.existsAsFile() && destination.getSize() > 0;
}
