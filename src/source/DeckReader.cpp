#include "DeckReader.h"

namespace
{
    // EMU per pixel at 96 dpi
    constexpr int emuPerPixel = 9525;

    int slideNumberOf(const juce::String& path)
    {
        return path.fromLastOccurrenceOf("slide", false, true).upToFirstOccurrenceOf(".", false, false).getIntValue();
    }

    /** Resolves a relationship target relative to the ppt/ folder. */
    juce::String resolveTarget(const juce::String& target)
    {
        if (target.startsWithChar('/'))
            return target.substring(1);

        juce::String path = "ppt/" + target;
        while (path.contains("/../"))
        {
            const int up = path.indexOf("/../");
            const int parentStart = path.substring(0, up).lastIndexOfChar('/');
            path = path.substring(0, parentStart + 1) + path.substring(up + 4);
        }
        return path;
    }

    /** Collects the runs of every text body (one per shape or table cell), in document order. */
    void collectTextBodies(const juce::XmlElement& element, juce::StringArray& bodies)
    {
        if (element.getTagNameWithoutNamespace() == "txBody")
        {
            juce::StringArray paragraphs;

            for (auto* paragraph : element.getChildIterator())
            {
                if (paragraph->getTagNameWithoutNamespace() != "p")
                    continue;

                juce::String text;
                for (auto* run : paragraph->getChildIterator())
                {
                    const juce::String tag = run->getTagNameWithoutNamespace();
                    if (tag == "r" || tag == "fld")
                    {
                        if (auto* t = run->getChildByName("a:t"))
                            text << t->getAllSubText();
                    }
                    else if (tag == "br")
                    {
                        text << " ";
                    }
                }

                if (text.trim().isNotEmpty())
                    paragraphs.add(text.trim());
            }

            const juce::String body = paragraphs.joinIntoString(" ");
            if (body.isNotEmpty())
                bodies.add(body);
            return;
        }

        for (auto* child : element.getChildIterator())
            collectTextBodies(*child, bodies);
    }
}

//==============================================================================
DeckReader::DeckReader(const juce::File& deckFile)
    : deckFile(deckFile)
{
}

DeckReader::~DeckReader()
{
}

bool DeckReader::canRead(const juce::File& file)
{
    return file.hasFileExtension("pptx;ppsx");
}

juce::Result DeckReader::open()
{
    slidePaths.clear();
    numHiddenSlides = 0;

    if (!deckFile.existsAsFile())
        return juce::Result::fail("Deck not found: " + deckFile.getFullPathName());

    zip = std::make_unique<juce::ZipFile>(deckFile);
    if (zip->getNumEntries() == 0)
        return juce::Result::fail("Not a readable deck archive: " + deckFile.getFileName());

    if (auto presentation = readXmlEntry("ppt/presentation.xml"))
    {
        if (auto* size = presentation->getChildByName("p:sldSz"))
        {
            slideWidthPixels = (int) (size->getStringAttribute("cx").getLargeIntValue() / emuPerPixel);
            slideHeightPixels = (int) (size->getStringAttribute("cy").getLargeIntValue() / emuPerPixel);
        }

        slidePaths = resolveOrderFromPresentation(*presentation);
    }

    if (slidePaths.isEmpty())
        slidePaths = orderByFileNumber();

    for (int i = slidePaths.size(); --i >= 0;)
    {
        if (isHidden(slidePaths[i]))
        {
            slidePaths.remove(i);
            ++numHiddenSlides;
        }
    }

    if (slidePaths.isEmpty())
        return juce::Result::fail("Deck contains no visible slides: " + deckFile.getFileName());

    return juce::Result::ok();
}

std::unique_ptr<juce::XmlElement> DeckReader::readXmlEntry(const juce::String& entryPath) const
{
    if (zip == nullptr)
        return nullptr;

    const int index = zip->getIndexOfFileName(entryPath);
    if (index < 0)
        return nullptr;

    std::unique_ptr<juce::InputStream> stream(zip->createStreamForEntry(index));
    if (stream == nullptr)
        return nullptr;

    return juce::parseXML(stream->readEntireStreamAsString());
}

juce::StringArray DeckReader::resolveOrderFromPresentation(const juce::XmlElement& presentation) const
{
    juce::StringArray ordered;

    auto rels = readXmlEntry("ppt/_rels/presentation.xml.rels");
    auto* idList = presentation.getChildByName("p:sldIdLst");

    if (rels == nullptr || idList == nullptr)
        return ordered;

    juce::StringPairArray targets;
    for (auto* rel : rels->getChildIterator())
        targets.set(rel->getStringAttribute("Id"), rel->getStringAttribute("Target"));

    for (auto* slideId : idList->getChildIterator())
    {
        const juce::String relId = slideId->getStringAttribute("r:id");
        const juce::String target = targets[relId];

        if (target.isEmpty())
            return {};

        const juce::String path = resolveTarget(target);
        if (zip->getIndexOfFileName(path) < 0)
            return {};

        ordered.add(path);
    }

    return ordered;
}

juce::StringArray DeckReader::orderByFileNumber() const
{
    juce::Array<int> numbers;
    juce::StringArray result;

    for (int i = 0; i < zip->getNumEntries(); ++i)
    {
        const juce::String name = zip->getEntry(i)->filename;
        if (name.startsWith("ppt/slides/slide") && name.endsWith(".xml") && slideNumberOf(name) > 0)
            numbers.addUsingDefaultSort(slideNumberOf(name));
    }

    for (int number : numbers)
        result.add("ppt/slides/slide" + juce::String(number) + ".xml");

    return result;
}

bool DeckReader::isHidden(const juce::String& slidePath) const
{
    auto slide = readXmlEntry(slidePath);
    return slide != nullptr && slide->getStringAttribute("show") == "0";
}

juce::String DeckReader::getSlideText(int slideIndex) const
{
    if (!juce::isPositiveAndBelow(slideIndex, slidePaths.size()))
        return {};

    auto slide = readXmlEntry(slidePaths[slideIndex]);
    if (slide == nullptr)
        return {};

    juce::StringArray bodies;
    collectTextBodies(*slide, bodies);
    return bodies.joinIntoString(" ");
}

juce::StringArray DeckReader::getSlideTexts() const
{
    juce::StringArray texts;
    for (int i = 0; i < slidePaths.size(); ++i)
        texts.add(getSlideText(i));
    return texts;
}
