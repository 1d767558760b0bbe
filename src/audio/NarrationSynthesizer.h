#pragma once
#include <juce_core/juce_core.h>
#include "SpeechBackend.h"
#include "../pipeline/PipelineTypes.h"
#include "../pipeline/WorkingArea.h"
#include "../rendering/ToolExecutor.h"

/**
 * Produces the narration audio for one page.
 *
 * Speech comes from the backend when one is configured; any failure (no
 * network, timeout, refused request, unusable audio) degrades to a fixed
 * length of silence instead of failing the page. synthesize() is called from
 * several page workers at once and only touches the files of its own page.
 */
class NarrationSynthesizer
{
public:
    /**
     * @param toolExecutor used to measure synthesized audio
     * @param backend      speech service, or nullptr to narrate every page with silence
     */
    NarrationSynthesizer(ToolExecutor* toolExecutor, SpeechBackend* backend, const WorkingArea& workingArea);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    void setSilentDuration(double seconds) { silentDurationSeconds = seconds; }
    double getSilentDuration() const { return silentDurationSeconds; }

    /** When false, pages without narration get silence instead of a spoken placeholder. */
    void setNarratePlaceholders(bool shouldNarrate) { narratePlaceholders = shouldNarrate; }

    /** Word used in the spoken placeholder, "Page" or "Slide". */
    void setPlaceholderWord(const juce::String& word) { placeholderWord = word; }

    /** The utterance for a page with no text, e.g. "Slide 3". */
    juce::String placeholderFor(int pageIndex) const;

    /**
     * Writes the page's audio asset.
     * @throws PipelineError SynthesisFailure when not even the silent fallback can be written
     */
    PipelineTypes::AudioAsset synthesize(const PipelineTypes::Page& page, const juce::String& languageCode);

    /** Writes the silent fallback for a page. */
    PipelineTypes::AudioAsset writeSilentAsset(int pageIndex);

private:
    void log(const juce::String& message) const;

    ToolExecutor* toolExecutor;
    SpeechBackend* backend;
    const WorkingArea& workingArea;

    double silentDurationSeconds = 3.0;
    bool narratePlaceholders = true;
    juce::String placeholderWord { "Page" };

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(NarrationSynthesizer)
};
