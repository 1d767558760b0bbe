#pragma once
#include <juce_core/juce_core.h>
#include "../pipeline/PipelineTypes.h"
#include "../pipeline/WorkingArea.h"
#include "../rendering/ToolExecutor.h"

/**
 * Turns the input document into an ordered list of pages: one raster image
 * and one narration text per page.
 *
 * Images and texts are produced independently. The image count is the page
 * count; the text list is then fitted to it with the configured alignment
 * policy. A page whose image could not be produced still gets an entry, with
 * imageAvailable set to false.
 */
class PageSource
{
public:
    struct Options
    {
        int dpi = 300;
        PipelineTypes::TextAlignment textAlignment = PipelineTypes::TextAlignment::Truncate;
        juce::File scriptFile;           // optional; one line per page overrides extracted text
        int composeWidth = 1920;
        int composeHeight = 1080;
        bool allowCompositionFallback = false;
        bool reuseCachedImages = true;
        PipelineTypes::Capabilities capabilities;   // tools found by the run's capability probe
    };

    PageSource(ToolExecutor* toolExecutor, const WorkingArea& workingArea);
    ~PageSource();

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Produces the pages of a document.
     *
     * @throws PipelineError PageExtraction when the document cannot be read at all
     */
    std::vector<PipelineTypes::Page> loadPages(const juce::File& input,
                                               PipelineTypes::RasterStrategy strategy,
                                               const Options& options);

    /** Warnings raised by the last loadPages() call (page-count mismatch and the like). */
    const juce::StringArray& getWarnings() const { return warnings; }

    //==========================================================================
    static PipelineTypes::DocumentKind detectKind(const juce::File& input);

    /** Placeholder word used when a page has no narration: "Slide" for decks, "Page" otherwise. */
    static juce::String placeholderWord(PipelineTypes::DocumentKind kind);

    /**
     * Fits a text list to the page count.
     * @param mismatch set to true when the counts differed
     */
    static juce::StringArray alignTexts(const juce::StringArray& texts, int pageCount,
                                        PipelineTypes::TextAlignment alignment, bool& mismatch);

    /** Splits pdftotext output into per-page texts, whitespace collapsed. */
    static juce::StringArray splitExtractedText(const juce::String& extracted);

    /** Reads a narration script: each non-empty line, trimmed, narrates one page. */
    static juce::StringArray readScript(const juce::File& scriptFile);

private:
    juce::File convertDeck(const juce::File& deck, const PipelineTypes::Capabilities& capabilities, bool reuse);
    juce::Array<juce::File> rasterize(const juce::File& pdf, int dpi, bool reuse);
    juce::Array<juce::File> compose(const juce::StringArray& slideTexts, const Options& options);
    juce::StringArray extractPdfText(const juce::File& pdf, const PipelineTypes::Capabilities& capabilities);
    int queryPageCount(const juce::File& pdf, const PipelineTypes::Capabilities& capabilities);

    juce::File getRasterMarkerFile() const;
    juce::Array<juce::File> findCachedImages() const;
    void clearPageImages() const;

    void log(const juce::String& message) const;
    void warn(const juce::String& message);

    ToolExecutor* toolExecutor;
    const WorkingArea& workingArea;
    std::function<void(const juce::String&)> logCallback;
    juce::StringArray warnings;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PageSource)
};
