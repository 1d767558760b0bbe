#include "SequenceAssembler.h"
#include "../pipeline/PipelineError.h"
#include "../pipeline/WorkingArea.h"
#include <algorithm>

SequenceAssembler::SequenceAssembler(ToolExecutor* toolExecutor)
    : toolExecutor(toolExecutor)
{
}

SequenceAssembler::~SequenceAssembler()
{
}

void SequenceAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void SequenceAssembler::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

juce::String SequenceAssembler::buildConcatList(const std::vector<PipelineTypes::Scene>& orderedScenes)
{
    juce::String list;

    // Single quotes inside a quoted path are written as '\''
    for (const auto& scene : orderedScenes)
        list << "file '" << scene.videoPath.getFullPathName().replace("'", "'\\''") << "'\n";

    return list;
}

void SequenceAssembler::checkStreamParameters(const std::vector<PipelineTypes::Scene>& orderedScenes)
{
    PipelineTypes::StreamParameters reference;

    for (const auto& scene : orderedScenes)
    {
        const auto params = toolExecutor->getStreamParameters(scene.videoPath);

        if (!params.isValid())
            throw PipelineError(PipelineError::Kind::Assembly,
                                "Cannot read stream parameters of " + scene.videoPath.getFileName(), scene.index);

        if (!reference.isValid())
        {
            reference = params;
            log("Scene format: " + reference.toString());
            continue;
        }

        if (!params.matches(reference))
            throw PipelineError(PipelineError::Kind::Assembly,
                                "Scene " + scene.videoPath.getFileName() + " has " + params.toString()
                                    + ", expected " + reference.toString(),
                                scene.index);
    }
}

bool SequenceAssembler::executeConcatWithFallback(const juce::File& concatList, const juce::File& outputFile)
{
    const juce::StringArray base { "ffmpeg", "-nostdin", "-y",
                                   "-f", "concat", "-safe", "0",
                                   "-i", concatList.getFullPathName(),
                                   "-c", "copy",
                                   "-map_metadata", "-1", "-fflags", "+bitexact" };

    juce::StringArray primary(base);
    primary.addArray(juce::StringArray { "-movflags", "+faststart", outputFile.getFullPathName() });

    if (toolExecutor->executeCommand(primary))
        return true;

    log("WARNING: concatenation failed; retrying with shifted timestamps");
    outputFile.deleteFile();

    juce::StringArray fallback(base);
    fallback.addArray(juce::StringArray { "-avoid_negative_ts", "make_zero",
                                          "-movflags", "+faststart", outputFile.getFullPathName() });

    if (!toolExecutor->executeCommand(fallback))
    {
        log("ERROR: concatenation failed after retry");
        return false;
    }

    log("Retry succeeded for concatenation");
    return true;
}

void SequenceAssembler::assemble(std::vector<PipelineTypes::Scene> scenes,
                                 const juce::File& concatListFile,
                                 const juce::File& outputFile)
{
    using Kind = PipelineError::Kind;

    if (scenes.empty())
        throw PipelineError(Kind::Assembly, "No scenes to assemble");

    std::sort(scenes.begin(), scenes.end(),
              [](const PipelineTypes::Scene& a, const PipelineTypes::Scene& b) { return a.index < b.index; });

    for (size_t i = 0; i < scenes.size(); ++i)
    {
        if (i > 0 && scenes[i].index == scenes[i - 1].index)
            throw PipelineError(Kind::Assembly, "Page " + juce::String(scenes[i].index) + " has more than one scene", scenes[i].index);

        if (!scenes[i].videoPath.existsAsFile())
            throw PipelineError(Kind::Assembly, "Scene file missing: " + scenes[i].videoPath.getFullPathName(), scenes[i].index);
    }

    checkStreamParameters(scenes);

    if (!concatListFile.replaceWithText(buildConcatList(scenes)))
        throw PipelineError(Kind::Assembly, "Cannot write concat list " + concatListFile.getFullPathName());

    if (outputFile.getParentDirectory().createDirectory().failed())
        throw PipelineError(Kind::Assembly, "Cannot create output directory " + outputFile.getParentDirectory().getFullPathName());

    log("Concatenating " + juce::String((int) scenes.size()) + " scenes into " + outputFile.getFileName());

    const juce::File partial = WorkingArea::partialFileFor(outputFile);
    partial.deleteFile();

    if (!executeConcatWithFallback(concatListFile, partial) || !WorkingArea::commitPartial(partial, outputFile))
    {
        partial.deleteFile();
        throw PipelineError(Kind::Assembly, "ffmpeg could not concatenate the scenes into " + outputFile.getFullPathName());
    }

    log("Final video written: " + outputFile.getFullPathName());
}
