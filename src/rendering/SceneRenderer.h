#pragma once
#include <juce_core/juce_core.h>
#include "../pipeline/PipelineTypes.h"
#include "ToolExecutor.h"

/**
 * Encodes one page into a video scene: the page image, held for exactly the
 * length of the page's audio.
 *
 * Every scene is encoded with the same codecs, frame size, frame rate and
 * audio layout so the final concatenation can copy streams without
 * re-encoding.
 */
class SceneRenderer
{
public:
    explicit SceneRenderer(ToolExecutor* toolExecutor);
    ~SceneRenderer();

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Frame size (even numbers) and frame rate shared by every scene of a run. */
    void setOutputFormat(int width, int height, int fps);

    /**
     * Optional image the page is overlaid on, scaled to fill the frame.
     * Pass an empty File for plain black padding.
     */
    void setBackgroundImage(const juce::File& imageFile) { backgroundImage = imageFile; }

    /**
     * Renders a page's scene into sceneFile.
     *
     * @throws PipelineError PageExtraction if the page has no image,
     *                       SceneRender if the audio cannot be probed or encoding fails
     */
    PipelineTypes::Scene render(const PipelineTypes::Page& page,
                                const PipelineTypes::AudioAsset& audio,
                                const juce::File& sceneFile);

    /** The ffmpeg invocation for one scene. */
    juce::StringArray buildSceneCommand(const juce::File& image,
                                        const juce::File& audio,
                                        double durationSeconds,
                                        const juce::File& output) const;

    static constexpr int audioSampleRate = 44100;
    static constexpr int audioChannels = 2;

private:
    juce::String scaleFilter() const;
    void log(const juce::String& message) const;

    ToolExecutor* toolExecutor;
    int width = 1920;
    int height = 1080;
    int fps = 30;
    juce::File backgroundImage;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SceneRenderer)
};
