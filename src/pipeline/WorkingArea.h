#pragma once
#include <juce_core/juce_core.h>
#include "PipelineTypes.h"

/**
 * Directory tree holding every intermediate artifact of a run.
 *
 * Layout under <root>/<runKey>/:
 *   document/         converted PDF (decks only)
 *   pages/            page001.png ...
 *   audio/            page001.mp3 (synthesized) or page001.wav (silent fallback)
 *   scenes/           page001.mp4 ...
 *   logs/             session.log and per-command tool logs
 *   concat_list.txt   input of the final concatenation
 *   manifest.xml      the materialized manifest
 *
 * Every per-page path is a pure function of the page index, which is what
 * makes the cache check possible.
 */
class WorkingArea
{
public:
    WorkingArea(const juce::File& root, const juce::File& inputFile);

    /** Stable key for an input document: its name plus a hash of its absolute path. */
    static juce::String runKeyFor(const juce::File& inputFile);

    const juce::String& getRunKey() const { return runKey; }

    juce::File getRunDirectory() const      { return runDirectory; }
    juce::File getDocumentDirectory() const { return runDirectory.getChildFile("document"); }
    juce::File getPagesDirectory() const    { return runDirectory.getChildFile("pages"); }
    juce::File getAudioDirectory() const    { return runDirectory.getChildFile("audio"); }
    juce::File getScenesDirectory() const   { return runDirectory.getChildFile("scenes"); }
    juce::File getLogsDirectory() const     { return runDirectory.getChildFile("logs"); }
    juce::File getConcatListFile() const    { return runDirectory.getChildFile("concat_list.txt"); }
    juce::File getManifestFile() const      { return runDirectory.getChildFile("manifest.xml"); }
    juce::File getConfigSnapshotFile() const { return runDirectory.getChildFile("config.xml"); }

    /** Creates the run directory and every stage subdirectory. */
    juce::Result create() const;

    /** Deletes the whole run directory. */
    juce::Result clean() const;

    static juce::String pageFileStem(int pageIndex);

    juce::File pageImageFile(int pageIndex) const;
    juce::File audioFile(int pageIndex, PipelineTypes::AudioProvenance provenance) const;
    juce::File sceneFile(int pageIndex) const;

    /**
     * Audio left by an earlier run for this page, synthesized or fallback.
     * @return the file, or an empty File when there is none
     */
    juce::File findExistingAudio(int pageIndex, PipelineTypes::AudioProvenance& provenance) const;

    /**
     * Sibling path an artifact is written to before being committed, e.g.
     * scenes/page001.partial.mp4. The extension is kept so tools infer the format.
     */
    static juce::File partialFileFor(const juce::File& target);

    /** Moves a finished partial file over its target. */
    static bool commitPartial(const juce::File& partial, const juce::File& target);

private:
    juce::File runDirectory;
    juce::String runKey;
};

//==============================================================================
/**
 * Guarantees at most one build per input document at a time, both inside this
 * process and across processes.
 */
class RunLock
{
public:
    explicit RunLock(const juce::String& runKey);
    ~RunLock();

    /** @return true if the lock was free and is now held by this object */
    bool tryAcquire();
    void release();
    bool isHeld() const { return held; }

private:
    juce::String runKey;
    std::unique_ptr<juce::InterProcessLock> interProcessLock;
    bool held = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RunLock)
};
