#include "SceneRenderer.h"
#include "../pipeline/PipelineError.h"
#include "../pipeline/WorkingArea.h"

namespace
{
    /** Last few lines of tool output, for error messages. */
    juce::String outputTail(const juce::String& output, int numLines = 5)
    {
        juce::StringArray lines;
        lines.addLines(output.trim());
        lines.removeEmptyStrings();

        juce::StringArray tail;
        for (int i = juce::jmax(0, lines.size() - numLines); i < lines.size(); ++i)
            tail.add(lines[i]);

        return tail.joinIntoString(" | ");
    }
}

SceneRenderer::SceneRenderer(ToolExecutor* toolExecutor)
    : toolExecutor(toolExecutor)
{
}

SceneRenderer::~SceneRenderer()
{
}

void SceneRenderer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void SceneRenderer::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void SceneRenderer::setOutputFormat(int newWidth, int newHeight, int newFps)
{
    width = newWidth;
    height = newHeight;
    fps = newFps;
}

juce::String SceneRenderer::scaleFilter() const
{
    const juce::String w(width), h(height);
    return "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease";
}

juce::StringArray SceneRenderer::buildSceneCommand(const juce::File& image,
                                                   const juce::File& audio,
                                                   double durationSeconds,
                                                   const juce::File& output) const
{
    const juce::String w(width), h(height), rate(fps);

    juce::StringArray args { "ffmpeg", "-nostdin", "-y" };

    if (backgroundImage != juce::File())
    {
        args.addArray({ "-loop", "1", "-framerate", rate, "-i", backgroundImage.getFullPathName(),
                        "-loop", "1", "-framerate", rate, "-i", image.getFullPathName(),
                        "-i", audio.getFullPathName(),
                        "-filter_complex",
                        "[0:v]scale=" + w + ":" + h + ":force_original_aspect_ratio=increase,crop=" + w + ":" + h + ",setsar=1[bg];"
                        "[1:v]" + scaleFilter() + "[fg];"
                        "[bg][fg]overlay=(W-w)/2:(H-h)/2,format=yuv420p[outv]",
                        "-map", "[outv]", "-map", "2:a" });
    }
    else
    {
        args.addArray({ "-loop", "1", "-framerate", rate, "-i", image.getFullPathName(),
                        "-i", audio.getFullPathName(),
                        "-vf", scaleFilter() + ",pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2,setsar=1,format=yuv420p",
                        "-map", "0:v", "-map", "1:a" });
    }

    args.addArray({ "-t", juce::String(durationSeconds, 6),
                    "-r", rate,
                    "-c:v", "libx264", "-tune", "stillimage", "-pix_fmt", "yuv420p",
                    "-c:a", "aac", "-b:a", "192k",
                    "-ar", juce::String(audioSampleRate), "-ac", juce::String(audioChannels),
                    // Identical inputs must give identical bytes
                    "-map_metadata", "-1", "-fflags", "+bitexact", "-flags:v", "+bitexact", "-flags:a", "+bitexact",
                    "-movflags", "+faststart",
                    output.getFullPathName() });

    return args;
}

PipelineTypes::Scene SceneRenderer::render(const PipelineTypes::Page& page,
                                           const PipelineTypes::AudioAsset& audio,
                                           const juce::File& sceneFile)
{
    using Kind = PipelineError::Kind;

    if (!page.imageAvailable || !page.imagePath.existsAsFile())
        throw PipelineError(Kind::PageExtraction, "No image for page " + juce::String(page.index), page.index);

    // The audio file is the source of truth for the length, whatever the asset claims
    const double duration = toolExecutor->getFileDuration(audio.filePath);
    if (duration <= 0.0)
        throw PipelineError(Kind::SceneRender, "Cannot probe the duration of " + audio.filePath.getFileName(), page.index);

    const juce::File partial = WorkingArea::partialFileFor(sceneFile);
    partial.deleteFile();

    log("Page " + juce::String(page.index) + ": rendering " + juce::String(duration, 2) + "s scene");

    const auto result = toolExecutor->run(buildSceneCommand(page.imagePath, audio.filePath, duration, partial));

    if (!result.succeeded() || !partial.existsAsFile() || partial.getSize() == 0)
    {
        partial.deleteFile();

        juce::String reason;
        if (result.cancelled)     reason = "cancelled";
        else if (result.timedOut) reason = "timed out";
        else                      reason = "ffmpeg exit code " + juce::String(result.exitCode) + ": " + outputTail(result.output);

        throw PipelineError(Kind::SceneRender, "Encoding failed (" + reason + ")", page.index);
    }

    if (!WorkingArea::commitPartial(partial, sceneFile))
        throw PipelineError(Kind::SceneRender, "Cannot move scene into " + sceneFile.getFullPathName(), page.index);

    PipelineTypes::Scene scene;
    scene.index = page.index;
    scene.videoPath = sceneFile;
    scene.durationSeconds = duration;
    return scene;
}
