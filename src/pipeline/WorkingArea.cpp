#include "WorkingArea.h"

namespace
{
    // Run keys locked by this process. InterProcessLock is per process on
    // POSIX, so it cannot stop two builds of the same input in one process.
    juce::CriticalSection& heldKeysLock()
    {
        static juce::CriticalSection lock;
        return lock;
    }

    juce::StringArray& heldKeys()
    {
        static juce::StringArray keys;
        return keys;
    }
}

//==============================================================================
WorkingArea::WorkingArea(const juce::File& root, const juce::File& inputFile)
    : runKey(runKeyFor(inputFile))
{
    runDirectory = root.getChildFile(runKey);
}

juce::String WorkingArea::runKeyFor(const juce::File& inputFile)
{
    const juce::String path = inputFile.getFullPathName();
    const juce::String stem = juce::File::createLegalFileName(inputFile.getFileNameWithoutExtension())
                                  .replaceCharacter(' ', '_');

    return stem + "_" + juce::String::toHexString(path.hashCode64()).paddedLeft('0', 16);
}

juce::Result WorkingArea::create() const
{
    const juce::File directories[] = { runDirectory,
                                       getDocumentDirectory(),
                                       getPagesDirectory(),
                                       getAudioDirectory(),
                                       getScenesDirectory(),
                                       getLogsDirectory() };

    for (const auto& dir : directories)
    {
        const juce::Result result = dir.createDirectory();
        if (result.failed())
            return juce::Result::fail("Cannot create " + dir.getFullPathName() + ": " + result.getErrorMessage());
    }

    return juce::Result::ok();
}

juce::Result WorkingArea::clean() const
{
    if (!runDirectory.exists())
        return juce::Result::ok();

    if (!runDirectory.deleteRecursively())
        return juce::Result::fail("Cannot delete " + runDirectory.getFullPathName());

    return juce::Result::ok();
}

juce::String WorkingArea::pageFileStem(int pageIndex)
{
    return juce::String::formatted("page%03d", pageIndex);
}

juce::File WorkingArea::pageImageFile(int pageIndex) const
{
    return getPagesDirectory().getChildFile(pageFileStem(pageIndex) + ".png");
}

juce::File WorkingArea::audioFile(int pageIndex, PipelineTypes::AudioProvenance provenance) const
{
    const juce::String extension = (provenance == PipelineTypes::AudioProvenance::Synthesized) ? ".mp3" : ".wav";
    return getAudioDirectory().getChildFile(pageFileStem(pageIndex) + extension);
}

juce::File WorkingArea::sceneFile(int pageIndex) const
{
    return getScenesDirectory().getChildFile(pageFileStem(pageIndex) + ".mp4");
}

juce::File WorkingArea::findExistingAudio(int pageIndex, PipelineTypes::AudioProvenance& provenance) const
{
    for (auto candidate : { PipelineTypes::AudioProvenance::Synthesized, PipelineTypes::AudioProvenance::SilentFallback })
    {
        const juce::File file = audioFile(pageIndex, candidate);
        if (file.existsAsFile() && file.getSize() > 0)
        {
            provenance = candidate;
            return file;
        }
    }

    return juce::File();
}

juce::File WorkingArea::partialFileFor(const juce::File& target)
{
    return target.getSiblingFile(target.getFileNameWithoutExtension() + ".partial" + target.getFileExtension());
}

bool WorkingArea::commitPartial(const juce::File& partial, const juce::File& target)
{
    if (!partial.existsAsFile() || partial.getSize() == 0)
        return false;

    return partial.moveFileTo(target);
}

//==============================================================================
RunLock::RunLock(const juce::String& runKey)
    : runKey(runKey)
{
}

RunLock::~RunLock()
{
    release();
}

bool RunLock::tryAcquire()
{
    if (held)
        return true;

    {
        const juce::ScopedLock sl(heldKeysLock());
        if (heldKeys().contains(runKey))
            return false;
        heldKeys().add(runKey);
    }

    interProcessLock = std::make_unique<juce::InterProcessLock>("SlideReel_" + runKey);

    if (!interProcessLock->enter(0))
    {
        interProcessLock.reset();
        const juce::ScopedLock sl(heldKeysLock());
        heldKeys().removeString(runKey);
        return false;
    }

    held = true;
    return true;
}

void RunLock::release()
{
    if (!held)
        return;

    interProcessLock->exit();
    interProcessLock.reset();

    const juce::ScopedLock sl(heldKeysLock());
    heldKeys().removeString(runKey);
    held = false;
}
