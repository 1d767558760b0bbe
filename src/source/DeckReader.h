#pragma once
#include <juce_core/juce_core.h>

/**
 * Reads slide decks stored as Office Open XML packages (.pptx, .ppsx).
 *
 * The package is a zip archive; slide order comes from ppt/presentation.xml
 * (its slide id list, resolved through the presentation relationships) and
 * falls back to the numeric order of the slide files when that list is
 * unusable.
 */
class DeckReader
{
public:
    explicit DeckReader(const juce::File& deckFile);
    ~DeckReader();

    /** True for extensions this reader understands. Other deck formats need the converter. */
    static bool canRead(const juce::File& deckFile);

    /**
     * Opens the archive and resolves the slide order.
     *
     * Hidden slides (show="0") are left out, as the converter leaves them out
     * of the exported document.
     */
    juce::Result open();

    int getNumSlides() const { return slidePaths.size(); }
    int getNumHiddenSlides() const { return numHiddenSlides; }

    /**
     * Text of every shape on a slide, in document order, joined with a space.
     * @param slideIndex 0-based position in presentation order
     */
    juce::String getSlideText(int slideIndex) const;

    /** Text of every slide, in presentation order. */
    juce::StringArray getSlideTexts() const;

    /** Slide size in pixels at 96 dpi, or 0x0 when the deck does not declare one. */
    int getSlideWidthPixels() const  { return slideWidthPixels; }
    int getSlideHeightPixels() const { return slideHeightPixels; }

    /** Archive paths of the slide parts, e.g. "ppt/slides/slide1.xml", in presentation order. */
    const juce::StringArray& getSlidePaths() const { return slidePaths; }

private:
    std::unique_ptr<juce::XmlElement> readXmlEntry(const juce::String& entryPath) const;
    juce::StringArray resolveOrderFromPresentation(const juce::XmlElement& presentation) const;
    juce::StringArray orderByFileNumber() const;
    bool isHidden(const juce::String& slidePath) const;

    juce::File deckFile;
    std::unique_ptr<juce::ZipFile> zip;
    juce::StringArray slidePaths;
    int slideWidthPixels = 0;
    int slideHeightPixels = 0;
    int numHiddenSlides = 0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DeckReader)
};
