#include "Manifest.h"
#include "PipelineError.h"

namespace
{
    juce::ValueTree entryToTree(const ManifestEntry& entry)
    {
        auto pathOf = [](const juce::File& f) { return f == juce::File() ? juce::String() : f.getFullPathName(); };

        juce::ValueTree page("Page");
        page.setProperty("index", entry.index, nullptr);
        page.setProperty("image", pathOf(entry.imagePath), nullptr);
        page.setProperty("audio", pathOf(entry.audioPath), nullptr);
        page.setProperty("scene", pathOf(entry.scenePath), nullptr);
        return page;
    }
}

juce::ValueTree Manifest::toValueTree() const
{
    juce::ValueTree tree("Manifest");
    tree.setProperty("concatList", concatListFile.getFullPathName(), nullptr);
    tree.setProperty("output", outputFile.getFullPathName(), nullptr);

    for (const auto& entry : entries)
        tree.appendChild(entryToTree(entry), nullptr);

    return tree;
}

//==============================================================================
void ManifestBuilder::reset(int numPages)
{
    const juce::ScopedLock sl(lock);
    entries.clear();
    expectedPages = numPages;
}

int ManifestBuilder::getExpectedPageCount() const
{
    const juce::ScopedLock sl(lock);
    return expectedPages;
}

ManifestEntry& ManifestBuilder::entryFor(int pageIndex)
{
    auto& entry = entries[pageIndex];
    entry.index = pageIndex;
    return entry;
}

void ManifestBuilder::setImage(int pageIndex, const juce::File& imagePath)
{
    const juce::ScopedLock sl(lock);
    entryFor(pageIndex).imagePath = imagePath;
}

void ManifestBuilder::setAudio(int pageIndex, const juce::File& audioPath)
{
    const juce::ScopedLock sl(lock);
    entryFor(pageIndex).audioPath = audioPath;
}

void ManifestBuilder::setScene(int pageIndex, const juce::File& scenePath)
{
    const juce::ScopedLock sl(lock);
    entryFor(pageIndex).scenePath = scenePath;
}

juce::String ManifestBuilder::findGap() const
{
    const juce::ScopedLock sl(lock);

    if (expectedPages <= 0)
        return "Manifest has no pages";

    if (!entries.empty() && (entries.begin()->first < 1 || entries.rbegin()->first > expectedPages))
        return "Manifest has entries outside pages 1.." + juce::String(expectedPages);

    for (int index = 1; index <= expectedPages; ++index)
    {
        const auto it = entries.find(index);
        if (it == entries.end())
            return "Page " + juce::String(index) + " is missing from the manifest";

        const ManifestEntry& entry = it->second;
        if (entry.imagePath == juce::File())
            return "Page " + juce::String(index) + " has no image";
        if (entry.audioPath == juce::File())
            return "Page " + juce::String(index) + " has no audio";
        if (entry.scenePath == juce::File())
            return "Page " + juce::String(index) + " has no scene";
    }

    return {};
}

Manifest ManifestBuilder::materialize(const juce::File& concatListFile, const juce::File& outputFile) const
{
    const juce::String gap = findGap();
    if (gap.isNotEmpty())
        throw PipelineError(PipelineError::Kind::Assembly, gap);

    Manifest manifest;
    manifest.concatListFile = concatListFile;
    manifest.outputFile = outputFile;

    const juce::ScopedLock sl(lock);
    for (const auto& item : entries)
        manifest.entries.push_back(item.second);

    return manifest;
}

juce::Result ManifestBuilder::save(const juce::File& destination) const
{
    juce::ValueTree tree("Manifest");

    {
        const juce::ScopedLock sl(lock);
        tree.setProperty("pages", expectedPages, nullptr);
        for (const auto& item : entries)
            tree.appendChild(entryToTree(item.second), nullptr);
    }

    std::unique_ptr<juce::XmlElement> xml(tree.createXml());
    if (xml == nullptr || !xml->writeTo(destination))
        return juce::Result::fail("Cannot write manifest " + destination.getFullPathName());

    return juce::Result::ok();
}
