#pragma once
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include <map>

/** Artifact paths for one page. */
struct ManifestEntry
{
    int index = 0;
    juce::File imagePath;
    juce::File audioPath;
    juce::File scenePath;
};

/** Ordered record of every page's artifacts, plus the concat list and output. */
struct Manifest
{
    std::vector<ManifestEntry> entries;   // ascending page index, no gaps
    juce::File concatListFile;
    juce::File outputFile;

    juce::ValueTree toValueTree() const;
};

/**
 * Collects manifest entries while page workers run.
 *
 * Workers finish in any order, so entries are keyed by page index and the
 * ordered manifest is only built once every page has reported in. All
 * mutation happens under one lock.
 */
class ManifestBuilder
{
public:
    ManifestBuilder() = default;

    /** Forgets every entry and expects pages 1..numPages. */
    void reset(int numPages);

    int getExpectedPageCount() const;

    void setImage(int pageIndex, const juce::File& imagePath);
    void setAudio(int pageIndex, const juce::File& audioPath);
    void setScene(int pageIndex, const juce::File& scenePath);

    /**
     * Checks that pages 1..N all have an image, audio and scene.
     * @return an empty string when complete, otherwise the first problem found
     */
    juce::String findGap() const;

    /**
     * Produces the ordered manifest.
     * @throws PipelineError (Assembly) when findGap() reports a problem
     */
    Manifest materialize(const juce::File& concatListFile, const juce::File& outputFile) const;

    /** Writes whatever has been collected so far, complete or not. */
    juce::Result save(const juce::File& destination) const;

private:
    ManifestEntry& entryFor(int pageIndex);

    std::map<int, ManifestEntry> entries;
    int expectedPages = 0;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManifestBuilder)
};
