#include "PageSource.h"
#include "DeckReader.h"
#include "SlideComposer.h"
#include "../pipeline/PipelineError.h"
#include <algorithm>

namespace
{
    const char* const rasterMarkerName = "rasterized.ok";

    /** Ordinal pdftoppm appended to an image name, e.g. 7 for "page-07.png". */
    int rasterOrdinal(const juce::File& image)
    {
        return image.getFileNameWithoutExtension().fromLastOccurrenceOf("-", false, false).getIntValue();
    }

    juce::String collapseWhitespace(const juce::String& text)
    {
        juce::StringArray words;
        words.addTokens(text, " \t\r\n\v", "");
        words.removeEmptyStrings();
        return words.joinIntoString(" ");
    }
}

//==============================================================================
PageSource::PageSource(ToolExecutor* toolExecutor, const WorkingArea& workingArea)
    : toolExecutor(toolExecutor),
      workingArea(workingArea)
{
}

PageSource::~PageSource()
{
}

void PageSource::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void PageSource::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void PageSource::warn(const juce::String& message)
{
    warnings.add(message);
    log("WARNING: " + message);
}

//==============================================================================
PipelineTypes::DocumentKind PageSource::detectKind(const juce::File& input)
{
    if (input.hasFileExtension("pdf"))
        return PipelineTypes::DocumentKind::Paginated;

    if (input.hasFileExtension("pptx;ppt;odp;key;pps;ppsx"))
        return PipelineTypes::DocumentKind::SlideDeck;

    return PipelineTypes::DocumentKind::Unknown;
}

juce::String PageSource::placeholderWord(PipelineTypes::DocumentKind kind)
{
    return kind == PipelineTypes::DocumentKind::SlideDeck ? "Slide" : "Page";
}

juce::StringArray PageSource::alignTexts(const juce::StringArray& texts, int pageCount,
                                         PipelineTypes::TextAlignment alignment, bool& mismatch)
{
    mismatch = (texts.size() != pageCount);

    juce::StringArray aligned;
    for (int i = 0; i < pageCount; ++i)
        aligned.add(i < texts.size() ? texts[i] : juce::String());

    if (alignment == PipelineTypes::TextAlignment::MergeOverflow && texts.size() > pageCount && pageCount > 0)
    {
        juce::StringArray tail;
        tail.add(aligned[pageCount - 1]);

        for (int i = pageCount; i < texts.size(); ++i)
            tail.add(texts[i]);

        tail.trim();
        tail.removeEmptyStrings();
        aligned.set(pageCount - 1, tail.joinIntoString(" "));
    }

    return aligned;
}

juce::StringArray PageSource::splitExtractedText(const juce::String& extracted)
{
    juce::StringArray pages;

    int start = 0;
    for (;;)
    {
        const int formFeed = extracted.indexOfChar(start, '\f');
        if (formFeed < 0)
        {
            // pdftotext terminates every page, the last one included
            const juce::String rest = extracted.substring(start);
            if (rest.trim().isNotEmpty())
                pages.add(collapseWhitespace(rest));
            break;
        }

        pages.add(collapseWhitespace(extracted.substring(start, formFeed)));
        start = formFeed + 1;
    }

    return pages;
}

juce::StringArray PageSource::readScript(const juce::File& scriptFile)
{
    juce::StringArray lines;
    lines.addLines(scriptFile.loadFileAsString());
    lines.trim();
    lines.removeEmptyStrings();
    return lines;
}

//==============================================================================
std::vector<PipelineTypes::Page> PageSource::loadPages(const juce::File& input,
                                                       PipelineTypes::RasterStrategy strategy,
                                                       const Options& options)
{
    using Kind = PipelineError::Kind;
    using Strategy = PipelineTypes::RasterStrategy;

    warnings.clear();

    const auto kind = detectKind(input);
    if (kind == PipelineTypes::DocumentKind::Unknown)
        throw PipelineError(Kind::PageExtraction, "Unsupported input document type: " + input.getFileName());

    if (!input.existsAsFile())
        throw PipelineError(Kind::PageExtraction, "Input document not found: " + input.getFullPathName());

    log("Loading pages from " + input.getFileName() + " (" + PipelineTypes::toString(strategy) + ")");

    juce::Array<juce::File> images;   // an empty File marks a page whose image failed
    juce::StringArray texts;
    int expectedPages = 0;

    Strategy effectiveStrategy = strategy;
    juce::File pdf;

    if (strategy == Strategy::ConvertThenRasterize)
    {
        pdf = convertDeck(input, options.capabilities, options.reuseCachedImages);

        if (pdf == juce::File())
        {
            if (!options.allowCompositionFallback)
                throw PipelineError(Kind::PageExtraction, "Could not convert " + input.getFileName() + " to PDF");

            warn("Deck conversion failed; composing slides in-process instead");
            effectiveStrategy = Strategy::ComposeInProcess;
        }
    }
    else if (strategy == Strategy::DirectRasterize)
    {
        pdf = input;
    }

    if (effectiveStrategy == Strategy::ComposeInProcess)
    {
        DeckReader reader(input);
        const juce::Result opened = reader.open();
        if (opened.failed())
            throw PipelineError(Kind::PageExtraction, opened.getErrorMessage());

        texts = reader.getSlideTexts();
        if (reader.getNumHiddenSlides() > 0)
            log("Leaving out " + juce::String(reader.getNumHiddenSlides()) + " hidden slides");

        images = compose(texts, options);
    }
    else
    {
        expectedPages = queryPageCount(pdf, options.capabilities);
        images = rasterize(pdf, options.dpi, options.reuseCachedImages);

        if (kind == PipelineTypes::DocumentKind::SlideDeck && DeckReader::canRead(input))
        {
            DeckReader reader(input);
            const juce::Result opened = reader.open();

            if (opened.wasOk())
            {
                texts = reader.getSlideTexts();
                if (reader.getNumHiddenSlides() > 0)
                    log("Leaving out " + juce::String(reader.getNumHiddenSlides()) + " hidden slides");
            }
            else
                warn("Could not read slide text from the deck (" + opened.getErrorMessage() + "); using the converted PDF");
        }

        if (texts.isEmpty())
            texts = extractPdfText(pdf, options.capabilities);
    }

    int pageCount = images.size();
    if (expectedPages > 0)
    {
        if (expectedPages != images.size())
            warn("Rasterizer produced " + juce::String(images.size()) + " images for "
                 + juce::String(expectedPages) + " pages");
        pageCount = expectedPages;
    }

    if (pageCount == 0)
        throw PipelineError(Kind::PageExtraction, "No pages could be extracted from " + input.getFileName());

    if (options.scriptFile != juce::File())
    {
        const juce::StringArray scriptLines = readScript(options.scriptFile);

        if (scriptLines.isEmpty())
        {
            warn("Narration script " + options.scriptFile.getFileName() + " is empty; using extracted text");
        }
        else
        {
            log("Narration taken from script " + options.scriptFile.getFileName());
            texts = scriptLines;
        }
    }

    bool mismatch = false;
    const juce::StringArray aligned = alignTexts(texts, pageCount, options.textAlignment, mismatch);

    if (mismatch)
        warn("Page count mismatch: " + juce::String(pageCount) + " pages, " + juce::String(texts.size())
             + " narration texts (" + (options.textAlignment == PipelineTypes::TextAlignment::MergeOverflow
                                           ? "surplus merged into the last page" : "surplus dropped")
             + ", missing texts left empty)");

    std::vector<PipelineTypes::Page> pages;
    pages.reserve((size_t) pageCount);

    for (int i = 0; i < pageCount; ++i)
    {
        PipelineTypes::Page page;
        page.index = i + 1;
        page.imagePath = workingArea.pageImageFile(page.index);
        page.imageAvailable = i < images.size() && images[i] != juce::File() && images[i].existsAsFile();
        page.narrationText = aligned[i];

        if (!page.imageAvailable)
            warn("PageExtractionError (page " + juce::String(page.index) + "): no image was produced");

        pages.push_back(page);
    }

    log("Loaded " + juce::String(pageCount) + " pages");
    return pages;
}

//==============================================================================
juce::File PageSource::convertDeck(const juce::File& deck, const PipelineTypes::Capabilities& capabilities, bool reuse)
{
    const juce::File documentDir = workingArea.getDocumentDirectory();
    const juce::File pdf = documentDir.getChildFile(deck.getFileNameWithoutExtension() + ".pdf");

    if (reuse && pdf.existsAsFile() && pdf.getSize() > 0)
    {
        log("Reusing converted document " + pdf.getFileName());
        return pdf;
    }

    pdf.deleteFile();

    if (!capabilities.hasConverter())
    {
        warn("No deck converter available");
        return {};
    }

    const juce::String& converterName = capabilities.converterName;

    log("Converting " + deck.getFileName() + " to PDF");

    // A private profile keeps a running office instance from swallowing the request
    const juce::File profile = documentDir.getChildFile("office_profile");
    const auto result = toolExecutor->run({ converterName,
                                            "-env:UserInstallation=" + juce::URL(profile).toString(false),
                                            "--headless",
                                            "--convert-to", "pdf",
                                            "--outdir", documentDir.getFullPathName(),
                                            deck.getFullPathName() });

    if (!result.succeeded() || !pdf.existsAsFile() || pdf.getSize() == 0)
    {
        warn(converterName + " could not convert " + deck.getFileName());
        return {};
    }

    return pdf;
}

juce::File PageSource::getRasterMarkerFile() const
{
    return workingArea.getPagesDirectory().getChildFile(rasterMarkerName);
}

juce::Array<juce::File> PageSource::findCachedImages() const
{
    const juce::File marker = getRasterMarkerFile();
    if (!marker.existsAsFile())
        return {};

    const int count = marker.loadFileAsString().getIntValue();
    juce::Array<juce::File> images;

    for (int index = 1; index <= count; ++index)
    {
        const juce::File image = workingArea.pageImageFile(index);
        if (!image.existsAsFile() || image.getSize() == 0)
            return {};
        images.add(image);
    }

    return images;
}

void PageSource::clearPageImages() const
{
    getRasterMarkerFile().deleteFile();

    for (const auto& file : workingArea.getPagesDirectory().findChildFiles(juce::File::findFiles, false, "*.png"))
        file.deleteFile();
}

juce::Array<juce::File> PageSource::rasterize(const juce::File& pdf, int dpi, bool reuse)
{
    if (reuse)
    {
        const auto cached = findCachedImages();
        if (!cached.isEmpty())
        {
            log("Reusing " + juce::String(cached.size()) + " rasterized pages");
            return cached;
        }
    }

    clearPageImages();

    const juce::File pagesDir = workingArea.getPagesDirectory();
    log("Rasterizing " + pdf.getFileName() + " at " + juce::String(dpi) + " dpi");

    const auto result = toolExecutor->run({ "pdftoppm", "-png", "-r", juce::String(dpi),
                                            pdf.getFullPathName(),
                                            pagesDir.getChildFile("page").getFullPathName() });

    if (!result.succeeded())
        warn("pdftoppm did not finish cleanly; keeping the pages it produced");

    auto produced = pagesDir.findChildFiles(juce::File::findFiles, false, "page-*.png");
    std::sort(produced.begin(), produced.end(),
              [](const juce::File& a, const juce::File& b) { return rasterOrdinal(a) < rasterOrdinal(b); });

    juce::Array<juce::File> images;
    for (int i = 0; i < produced.size(); ++i)
    {
        const juce::File target = workingArea.pageImageFile(i + 1);
        if (!produced.getReference(i).moveFileTo(target))
        {
            warn("Could not rename " + produced[i].getFileName());
            break;
        }
        images.add(target);
    }

    const bool complete = result.succeeded() && images.size() == produced.size() && !images.isEmpty();

    if (complete && !getRasterMarkerFile().replaceWithText(juce::String(images.size())))
        log("WARNING: could not write the rasterization marker");

    return images;
}

juce::Array<juce::File> PageSource::compose(const juce::StringArray& slideTexts, const Options& options)
{
    clearPageImages();

    log("Composing " + juce::String(slideTexts.size()) + " slides at "
        + juce::String(options.composeWidth) + "x" + juce::String(options.composeHeight));

    const SlideComposer composer(options.composeWidth, options.composeHeight);
    juce::Array<juce::File> images;

    for (int i = 0; i < slideTexts.size(); ++i)
    {
        const juce::File target = workingArea.pageImageFile(i + 1);
        const juce::File partial = WorkingArea::partialFileFor(target);

        if (composer.writeSlide(slideTexts[i], partial) && WorkingArea::commitPartial(partial, target))
        {
            images.add(target);
        }
        else
        {
            partial.deleteFile();
            images.add(juce::File());
        }
    }

    return images;
}

juce::StringArray PageSource::extractPdfText(const juce::File& pdf, const PipelineTypes::Capabilities& capabilities)
{
    if (!capabilities.hasTextExtractor())
    {
        warn("pdftotext is not available; pages have no extracted narration");
        return {};
    }

    const juce::File textFile = workingArea.getDocumentDirectory().getChildFile(pdf.getFileNameWithoutExtension() + ".txt");
    textFile.deleteFile();

    const auto result = toolExecutor->run({ "pdftotext", "-enc", "UTF-8",
                                            pdf.getFullPathName(),
                                            textFile.getFullPathName() });

    if (!result.succeeded() || !textFile.existsAsFile())
    {
        warn("PageExtractionError: text extraction failed for " + pdf.getFileName());
        return {};
    }

    return splitExtractedText(textFile.loadFileAsString());
}

int PageSource::queryPageCount(const juce::File& pdf, const PipelineTypes::Capabilities& capabilities)
{
    if (!capabilities.hasPageCounter())
        return 0;

    juce::StringArray lines;
    lines.addLines(toolExecutor->executeCommandAndGetOutput({ "pdfinfo", pdf.getFullPathName() }));

    for (const auto& line : lines)
        if (line.startsWith("Pages:"))
            return line.fromFirstOccurrenceOf(":", false, false).trim().getIntValue();

    return 0;
}
