#pragma once
#include <juce_core/juce_core.h>

/**
 * Common types used across the pipeline.
 * These types are shared by the stage components and the orchestrator so that
 * every stage agrees on what a page, an audio asset and a scene are.
 */
namespace PipelineTypes
{
    /** Kind of input document, detected from the file extension. */
    enum class DocumentKind
    {
        Unknown,
        Paginated,   // PDF, rasterized directly
        SlideDeck    // needs converting (or composing) first
    };

    /** One unit of output: a slide or a document page. */
    struct Page
    {
        int index = 0;                // 1-based, equals position + 1
        juce::File imagePath;
        juce::String narrationText;   // may be empty
        bool imageAvailable = false;  // false when the raster could not be produced
    };

    /** Where an audio asset came from. Diagnostic only. */
    enum class AudioProvenance
    {
        Synthesized,
        SilentFallback
    };

    struct AudioAsset
    {
        int index = 0;
        juce::File filePath;
        double durationSeconds = 0.0;
        AudioProvenance provenance = AudioProvenance::SilentFallback;
        bool reused = false;          // taken from the cache of a previous run
    };

    struct Scene
    {
        int index = 0;
        juce::File videoPath;
        double durationSeconds = 0.0;
        bool reused = false;
    };

    /** Stream parameters that must agree across scenes for a stream-copy concat. */
    struct StreamParameters
    {
        juce::String videoCodec;
        int width = 0;
        int height = 0;
        double fps = 0.0;
        juce::String pixelFormat;
        juce::String audioCodec;
        int sampleRate = 0;
        int channels = 0;

        bool isValid() const { return videoCodec.isNotEmpty() && width > 0 && height > 0 && fps > 0.0; }

        bool matches(const StreamParameters& other) const
        {
            return videoCodec == other.videoCodec
                && width == other.width
                && height == other.height
                && std::abs(fps - other.fps) < 0.001
                && pixelFormat == other.pixelFormat
                && audioCodec == other.audioCodec
                && sampleRate == other.sampleRate
                && channels == other.channels;
        }

        juce::String toString() const
        {
            return videoCodec + " " + juce::String(width) + "x" + juce::String(height)
                 + " @" + juce::String(fps, 3) + "fps " + pixelFormat
                 + " / " + audioCodec + " " + juce::String(sampleRate) + "Hz "
                 + juce::String(channels) + "ch";
        }
    };

    /** Availability of every external tool, probed once per run. */
    struct Capabilities
    {
        juce::File ffmpeg;
        juce::File ffprobe;
        juce::File rasterizer;     // pdftoppm
        juce::File textExtractor;  // pdftotext
        juce::File pageCounter;    // pdfinfo (optional)
        juce::File converter;      // soffice (optional unless a deck is converted)
        juce::String converterName; // name the converter was found under

        bool hasEncoder() const        { return ffmpeg != juce::File() && ffprobe != juce::File(); }
        bool hasRasterizer() const     { return rasterizer != juce::File(); }
        bool hasTextExtractor() const  { return textExtractor != juce::File(); }
        bool hasPageCounter() const    { return pageCounter != juce::File(); }
        bool hasConverter() const      { return converter != juce::File(); }
    };

    /**
     * How pages become raster images for this run. Selected once from the
     * capability record, never re-decided per page.
     */
    enum class RasterStrategy
    {
        DirectRasterize,     // input is already a PDF
        ConvertThenRasterize,
        ComposeInProcess     // degraded fallback for decks without a converter
    };

    /** How a text list of the wrong length is fitted to the page count. */
    enum class TextAlignment
    {
        Truncate,       // drop surplus texts, pad missing ones with empty text
        MergeOverflow   // append surplus texts to the last page instead of dropping them
    };

    /** State of a pipeline run. Failed is absorbing. */
    enum class RunState
    {
        Init,
        Sourced,
        Narrated,
        Rendered,
        Assembled,
        Done,
        Failed
    };

    inline juce::String toString(RunState state)
    {
        switch (state)
        {
            case RunState::Init:      return "INIT";
            case RunState::Sourced:   return "SOURCED";
            case RunState::Narrated:  return "NARRATED";
            case RunState::Rendered:  return "RENDERED";
            case RunState::Assembled: return "ASSEMBLED";
            case RunState::Done:      return "DONE";
            case RunState::Failed:    return "FAILED";
        }
        return "UNKNOWN";
    }

    inline juce::String toString(RasterStrategy strategy)
    {
        switch (strategy)
        {
            case RasterStrategy::DirectRasterize:      return "rasterize document";
            case RasterStrategy::ConvertThenRasterize: return "convert deck, then rasterize";
            case RasterStrategy::ComposeInProcess:     return "compose slides in-process";
        }
        return "unknown";
    }
}
