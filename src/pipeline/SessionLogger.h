#pragma once
#include <juce_core/juce_core.h>

/**
 * The log of one pipeline run, kept in the run's working area.
 *
 * It is never installed as the process-wide juce::Logger: the orchestrator's
 * log function writes each line here and to juce::Logger::writeToLog, so the
 * process log keeps receiving everything while page workers log concurrently.
 *
 * Messages arriving while no session is open are dropped.
 */
class SessionLogger : public juce::Logger
{
public:
    SessionLogger() = default;
    ~SessionLogger() override;

    /** Starts appending to a log file, closing any session that was open. */
    bool open(const juce::File& destination);

    /** Flushes and closes the current session, if any. */
    void close();

    bool isWriting() const;
    juce::File getLogFile() const;

    /** Writes one timestamped line. Safe to call from any thread. */
    void logMessage(const juce::String& message) override;

private:
    juce::File logFile;
    std::unique_ptr<juce::FileOutputStream> fileStream;
    juce::CriticalSection writeLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionLogger)
};
