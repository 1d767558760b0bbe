#include "NarrationSynthesizer.h"
#include "SilentAudioWriter.h"
#include "../pipeline/PipelineError.h"

NarrationSynthesizer::NarrationSynthesizer(ToolExecutor* toolExecutor, SpeechBackend* backend, const WorkingArea& workingArea)
    : toolExecutor(toolExecutor),
      backend(backend),
      workingArea(workingArea)
{
}

void NarrationSynthesizer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void NarrationSynthesizer::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

juce::String NarrationSynthesizer::placeholderFor(int pageIndex) const
{
    return placeholderWord + " " + juce::String(pageIndex);
}

PipelineTypes::AudioAsset NarrationSynthesizer::synthesize(const PipelineTypes::Page& page, const juce::String& languageCode)
{
    juce::String text = page.narrationText.trim();

    if (text.isEmpty())
    {
        if (!narratePlaceholders)
        {
            log("Page " + juce::String(page.index) + ": no narration, using silence");
            return writeSilentAsset(page.index);
        }

        text = placeholderFor(page.index);
    }

    if (backend == nullptr)
        return writeSilentAsset(page.index);

    const juce::File target = workingArea.audioFile(page.index, PipelineTypes::AudioProvenance::Synthesized);
    const juce::File partial = WorkingArea::partialFileFor(target);
    partial.deleteFile();

    juce::Result result = backend->synthesize(text, languageCode, partial);
    double duration = 0.0;

    if (result.wasOk())
    {
        duration = toolExecutor->getFileDuration(partial);
        if (duration <= 0.0)
            result = juce::Result::fail("Synthesized audio has no measurable duration");
    }

    if (result.wasOk() && WorkingArea::commitPartial(partial, target))
    {
        // A fallback left by an earlier run would make the cache ambiguous
        workingArea.audioFile(page.index, PipelineTypes::AudioProvenance::SilentFallback).deleteFile();

        PipelineTypes::AudioAsset asset;
        asset.index = page.index;
        asset.filePath = target;
        asset.durationSeconds = duration;
        asset.provenance = PipelineTypes::AudioProvenance::Synthesized;

        log("Page " + juce::String(page.index) + ": synthesized " + juce::String(duration, 2) + "s of speech");
        return asset;
    }

    partial.deleteFile();

    const PipelineError failure(PipelineError::Kind::SynthesisFailure,
                                result.failed() ? result.getErrorMessage() : juce::String("Cannot store synthesized audio"),
                                page.index);
    log("WARNING: " + failure.describe() + "; using silence");

    return writeSilentAsset(page.index);
}

PipelineTypes::AudioAsset NarrationSynthesizer::writeSilentAsset(int pageIndex)
{
    const juce::File target = workingArea.audioFile(pageIndex, PipelineTypes::AudioProvenance::SilentFallback);
    const juce::File partial = WorkingArea::partialFileFor(target);

    if (!SilentAudioWriter::writeSilence(partial, silentDurationSeconds) || !WorkingArea::commitPartial(partial, target))
    {
        partial.deleteFile();
        throw PipelineError(PipelineError::Kind::SynthesisFailure,
                            "Cannot write silent audio to " + target.getFullPathName(), pageIndex);
    }

    workingArea.audioFile(pageIndex, PipelineTypes::AudioProvenance::Synthesized).deleteFile();

    PipelineTypes::AudioAsset asset;
    asset.index = pageIndex;
    asset.filePath = target;
    asset.durationSeconds = silentDurationSeconds;
    asset.provenance = PipelineTypes::AudioProvenance::SilentFallback;
    return asset;
}
