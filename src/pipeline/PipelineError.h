#pragma once
#include <juce_core/juce_core.h>
#include <stdexcept>

/**
 * Error raised by a pipeline stage.
 *
 * Stage components throw it; the orchestrator catches it at page and stage
 * boundaries and decides whether the page, or the whole run, has failed.
 */
class PipelineError : public std::runtime_error
{
public:
    enum class Kind
    {
        MissingDependency,  // required external tool absent, raised before any stage runs
        PageExtraction,     // raster or text extraction failed for a page
        SynthesisFailure,   // speech backend failed; always recovered by the silent fallback
        SceneRender,        // duration probe or encode failed for a page
        Assembly,           // final concatenation preconditions violated
        WorkingArea,        // working tree unusable, or another build holds the run lock
        Configuration       // settings rejected before the run starts
    };

    PipelineError(Kind kind, const juce::String& message, int pageIndex = 0)
        : std::runtime_error(message.toStdString()),
          kind(kind),
          pageIndex(pageIndex)
    {
    }

    Kind getKind() const noexcept { return kind; }

    /** 1-based page index, or 0 when the error is not tied to a page. */
    int getPageIndex() const noexcept { return pageIndex; }

    juce::String getMessage() const { return juce::String(what()); }

    static juce::String kindName(Kind kind)
    {
        switch (kind)
        {
            case Kind::MissingDependency: return "MissingDependency";
            case Kind::PageExtraction:    return "PageExtractionError";
            case Kind::SynthesisFailure:  return "SynthesisFailure";
            case Kind::SceneRender:       return "SceneRenderError";
            case Kind::Assembly:          return "AssemblyError";
            case Kind::WorkingArea:       return "WorkingAreaError";
            case Kind::Configuration:     return "ConfigurationError";
        }
        return "PipelineError";
    }

    juce::String describe() const
    {
        juce::String text = kindName(kind);
        if (pageIndex > 0)
            text << " (page " << pageIndex << ")";
        return text + ": " + getMessage();
    }

private:
    Kind kind;
    int pageIndex;
};
