#pragma once
#include <juce_core/juce_core.h>
#include "PipelineTypes.h"
#include "../rendering/ToolExecutor.h"

/**
 * Looks up every external tool once at the start of a run and decides, from
 * the result, how pages will be rasterized.
 *
 * Stages consult the Capabilities record instead of checking for tools
 * themselves.
 */
class CapabilityProbe
{
public:
    explicit CapabilityProbe(ToolExecutor* toolExecutor);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Locates ffmpeg, ffprobe, pdftoppm, pdftotext, pdfinfo and soffice. */
    PipelineTypes::Capabilities probe();

    /**
     * Chooses the rasterization strategy for a document.
     *
     * @throws PipelineError (MissingDependency) when a required tool is absent:
     *         the encoder always, the rasterizer for PDFs and converted decks,
     *         and the converter for decks unless composition is allowed.
     */
    static PipelineTypes::RasterStrategy selectStrategy(const PipelineTypes::Capabilities& capabilities,
                                                        PipelineTypes::DocumentKind kind,
                                                        bool allowCompositionFallback);

    /** Names tried, in order, for the deck converter. */
    static const juce::StringArray& converterNames();

private:
    ToolExecutor* toolExecutor;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CapabilityProbe)
};
