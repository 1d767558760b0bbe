#include "GoogleSpeechBackend.h"

namespace
{
    const char* const endpoint = "https://translate.google.com/translate_tts";

    /** Index just past the last break point before limit, or -1. */
    int findBreak(const juce::String& window, const juce::String& breakCharacters, int limit)
    {
        for (int i = juce::jmin(limit, window.length()) - 1; i > 0; --i)
            if (breakCharacters.containsChar(window[i]) && (i + 1 >= window.length() || window[i + 1] == ' '))
                return i + 1;

        return -1;
    }
}

GoogleSpeechBackend::GoogleSpeechBackend(int timeoutMs)
    : timeoutMs(timeoutMs)
{
}

juce::StringArray GoogleSpeechBackend::splitIntoChunks(const juce::String& text, int maxLength)
{
    juce::StringArray words;
    words.addTokens(text, " \t\r\n", "");
    words.removeEmptyStrings();

    juce::String remaining = words.joinIntoString(" ");
    juce::StringArray chunks;

    while (remaining.length() > maxLength)
    {
        // Look one character past the limit so a break right at the limit is found
        const juce::String window = remaining.substring(0, maxLength + 1);

        int cut = findBreak(window, ".!?;:", maxLength);
        if (cut < 0)
            cut = findBreak(window, ",", maxLength);
        if (cut < 0)
            cut = window.lastIndexOfChar(' ');
        if (cut <= 0)
            cut = maxLength;

        chunks.add(remaining.substring(0, cut).trim());
        remaining = remaining.substring(cut).trim();
    }

    if (remaining.isNotEmpty())
        chunks.add(remaining);

    chunks.removeEmptyStrings();
    return chunks;
}

juce::URL GoogleSpeechBackend::buildRequestUrl(const juce::String& chunk, const juce::String& languageCode,
                                               int chunkIndex, int numChunks)
{
    return juce::URL(endpoint)
        .withParameter("ie", "UTF-8")
        .withParameter("q", chunk)
        .withParameter("tl", languageCode)
        .withParameter("client", "tw-ob")
        .withParameter("total", juce::String(numChunks))
        .withParameter("idx", juce::String(chunkIndex))
        .withParameter("textlen", juce::String(chunk.length()));
}

bool GoogleSpeechBackend::looksLikeMp3(const juce::MemoryBlock& data)
{
    if (data.getSize() < 3)
        return false;

    const auto* bytes = static_cast<const juce::uint8*>(data.getData());

    if (bytes[0] == 'I' && bytes[1] == 'D' && bytes[2] == '3')
        return true;

    return bytes[0] == 0xff && (bytes[1] & 0xe0) == 0xe0;
}

juce::Result GoogleSpeechBackend::fetchChunk(const juce::URL& url, juce::MemoryBlock& destination) const
{
    int statusCode = 0;

    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
                       .withConnectionTimeoutMs(timeoutMs)
                       .withStatusCode(&statusCode)
                       .withExtraHeaders("User-Agent: Mozilla/5.0\r\nReferer: https://translate.google.com/");

    std::unique_ptr<juce::InputStream> stream(url.createInputStream(options));

    if (stream == nullptr)
        return juce::Result::fail("No response from speech service");

    if (statusCode != 200)
        return juce::Result::fail("Speech service returned HTTP " + juce::String(statusCode));

    juce::MemoryBlock body;
    stream->readIntoMemoryBlock(body);

    if (body.getSize() == 0)
        return juce::Result::fail("Speech service returned an empty body");

    if (!looksLikeMp3(body))
        return juce::Result::fail("Speech service returned something other than audio");

    destination.append(body.getData(), body.getSize());
    return juce::Result::ok();
}

juce::Result GoogleSpeechBackend::synthesize(const juce::String& text,
                                             const juce::String& languageCode,
                                             const juce::File& destination)
{
    const juce::StringArray chunks = splitIntoChunks(text);
    if (chunks.isEmpty())
        return juce::Result::fail("Nothing to synthesize");

    juce::MemoryBlock audio;

    for (int i = 0; i < chunks.size(); ++i)
    {
        const juce::Result fetched = fetchChunk(buildRequestUrl(chunks[i], languageCode, i, chunks.size()), audio);
        if (fetched.failed())
            return juce::Result::fail("Chunk " + juce::String(i + 1) + "/" + juce::String(chunks.size())
                                      + ": " + fetched.getErrorMessage());
    }

    if (!destination.replaceWithData(audio.getData(), audio.getSize()))
        return juce::Result::fail("Cannot write " + destination.getFullPathName());

    return juce::Result::ok();
}
