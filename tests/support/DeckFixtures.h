#pragma once
#include <juce_core/juce_core.h>

/** Builders for minimal Office Open XML decks. */
namespace DeckFixtures
{
    inline juce::String slideXml(const juce::String& text, bool hidden = false)
    {
        juce::String paragraphs;

        // One paragraph per line; an empty text gives a slide with no text body
        juce::StringArray lines;
        lines.addLines(text);
        lines.removeEmptyStrings();

        for (const auto& line : lines)
            paragraphs << "<a:p><a:r><a:rPr lang=\"en-US\"/><a:t>" << line.replace("&", "&amp;").replace("<", "&lt;").replace(">", "&gt;")
                       << "</a:t></a:r></a:p>";

        juce::String xml;
        xml << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
            << "<p:sld xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
            << " xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\""
            << (hidden ? " show=\"0\">" : ">")
            << "<p:cSld><p:spTree>";

        if (paragraphs.isNotEmpty())
            xml << "<p:sp><p:txBody><a:bodyPr/>" << paragraphs << "</p:txBody></p:sp>";

        xml << "</p:spTree></p:cSld></p:sld>";
        return xml;
    }

    /**
     * Writes a .pptx whose slide files slide1.xml..slideN.xml hold the given texts.
     *
     * @param presentationOrder slide file numbers in presentation order; empty
     *                          means 1..N. Pass {0} to omit the presentation part.
     * @param hiddenSlides      slide file numbers marked show="0"
     */
    inline bool writeDeck(const juce::File& destination,
                          const juce::StringArray& slideTexts,
                          juce::Array<int> presentationOrder = {},
                          const juce::Array<int>& hiddenSlides = {})
    {
        juce::ZipFile::Builder builder;

        auto addText = [&builder](const juce::String& path, const juce::String& contents)
        {
            builder.addEntry(new juce::MemoryInputStream(contents.toRawUTF8(), contents.getNumBytesAsUTF8(), true),
                             9, path, juce::Time(2024, 0, 1, 0, 0));
        };

        for (int i = 0; i < slideTexts.size(); ++i)
            addText("ppt/slides/slide" + juce::String(i + 1) + ".xml", slideXml(slideTexts[i], hiddenSlides.contains(i + 1)));

        if (presentationOrder.isEmpty())
            for (int i = 1; i <= slideTexts.size(); ++i)
                presentationOrder.add(i);

        if (presentationOrder != juce::Array<int> { 0 })
        {
            juce::String ids, rels;

            for (int position = 0; position < presentationOrder.size(); ++position)
            {
                const juce::String relId = "rId" + juce::String(position + 10);
                ids << "<p:sldId id=\"" << (256 + position) << "\" r:id=\"" << relId << "\"/>";
                rels << "<Relationship Id=\"" << relId << "\""
                     << " Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide\""
                     << " Target=\"slides/slide" << presentationOrder[position] << ".xml\"/>";
            }

            addText("ppt/presentation.xml",
                    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                    "<p:presentation xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\""
                    " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
                    "<p:sldIdLst>" + ids + "</p:sldIdLst>"
                    "<p:sldSz cx=\"12192000\" cy=\"6858000\"/>"
                    "</p:presentation>");

            addText("ppt/_rels/presentation.xml.rels",
                    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
                    + rels + "</Relationships>");
        }

        destination.getParentDirectory().createDirectory();
        destination.deleteFile();

        juce::FileOutputStream out(destination);
        return out.openedOk() && builder.writeToStream(out, nullptr);
    }
}
