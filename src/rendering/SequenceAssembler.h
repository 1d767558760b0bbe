#pragma once
#include <juce_core/juce_core.h>
#include "../pipeline/PipelineTypes.h"
#include "ToolExecutor.h"

/**
 * Joins the rendered scenes into the final video with ffmpeg's concat
 * demuxer, copying streams without re-encoding.
 */
class SequenceAssembler
{
public:
    explicit SequenceAssembler(ToolExecutor* toolExecutor);
    ~SequenceAssembler();

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Concatenates scenes in page order.
     *
     * Scenes may be passed in any order; they are sorted by page index.
     * @throws PipelineError Assembly if there are no scenes, a page index is
     *         repeated, a scene file is missing, stream parameters differ
     *         between scenes, or ffmpeg fails
     */
    void assemble(std::vector<PipelineTypes::Scene> scenes,
                  const juce::File& concatListFile,
                  const juce::File& outputFile);

    /** Concat demuxer list referencing each scene by absolute path, in the given order. */
    static juce::String buildConcatList(const std::vector<PipelineTypes::Scene>& orderedScenes);

private:
    void checkStreamParameters(const std::vector<PipelineTypes::Scene>& orderedScenes);
    bool executeConcatWithFallback(const juce::File& concatList, const juce::File& outputFile);
    void log(const juce::String& message) const;

    ToolExecutor* toolExecutor;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SequenceAssembler)
};
