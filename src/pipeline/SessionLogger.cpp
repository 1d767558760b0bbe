#include "SessionLogger.h"

SessionLogger::~SessionLogger()
{
    close();
}

bool SessionLogger::open(const juce::File& destination)
{
    const juce::ScopedLock lock(writeLock);

    if (fileStream != nullptr)
        fileStream->flush();

    // Appends, so that a resumed run keeps the history of the earlier attempts
    logFile = destination;
    logFile.getParentDirectory().createDirectory();
    fileStream = std::make_unique<juce::FileOutputStream>(logFile);

    if (!fileStream->openedOk())
    {
        fileStream.reset();
        return false;
    }

    const juce::String header = "Session log started at " + juce::Time::getCurrentTime().toString(true, true) + "\n";
    fileStream->writeText(header, false, false, nullptr);
    fileStream->flush();
    return true;
}

void SessionLogger::close()
{
    const juce::ScopedLock lock(writeLock);

    if (fileStream != nullptr)
        fileStream->flush();

    fileStream.reset();
}

bool SessionLogger::isWriting() const
{
    const juce::ScopedLock lock(writeLock);
    return fileStream != nullptr;
}

juce::File SessionLogger::getLogFile() const
{
    const juce::ScopedLock lock(writeLock);
    return logFile;
}

void SessionLogger::logMessage(const juce::String& message)
{
    const juce::ScopedLock lock(writeLock);

    if (fileStream == nullptr)
        return;

    const juce::String line = juce::Time::getCurrentTime().toString(true, true, true, true) + " | " + message + "\n";
    fileStream->writeText(line, false, false, nullptr);
    fileStream->flush();
}
