#pragma once
#include <juce_core/juce_core.h>
#include "../pipeline/PipelineTypes.h"

//==============================================================================
/**
 * @file ToolExecutor.h
 *
 * Declares the ToolExecutor class, the only place where SlideReel launches
 * external programs (ffmpeg, ffprobe, pdftoppm, pdftotext, pdfinfo, soffice).
 *
 * The class handles:
 * - Locating tools (explicit override, next to the executable, then PATH)
 * - Running a tool as a child process with a timeout
 * - Cooperative cancellation of every process it started
 * - One log file per command plus an aggregate log for the session
 * - Querying durations and stream parameters via ffprobe
 */

/**
 * The ToolExecutor runs external commands and reports their results.
 *
 * Unlike a single-job executor it is re-entrant: page workers call run()
 * concurrently, and each call owns its own child process.
 *
 * @note run() and findTool() are virtual so that tests can substitute a fake
 *       that simulates the tools without launching anything.
 */
class ToolExecutor
{
public:
    /** Outcome of one command. */
    struct CommandResult
    {
        bool started = false;
        bool timedOut = false;
        bool cancelled = false;
        int exitCode = -1;
        juce::String output;

        bool succeeded() const { return started && !timedOut && !cancelled && exitCode == 0; }
    };

    ToolExecutor();
    virtual ~ToolExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     * Must be set before work starts; it is read from worker threads.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Sets the directory where command output should be recorded.
     * A per-command log file plus an aggregate log are created in this directory.
     * Pass an empty File to disable command logging.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /** Timeout applied when run() is called without one. */
    void setDefaultTimeout(int timeoutMs) { defaultTimeoutMs = timeoutMs; }

    /** Forces a tool name to resolve to a specific executable. */
    void setToolOverride(const juce::String& toolName, const juce::File& executable);

    /**
     * Locates an executable.
     *
     * @param toolName Bare program name, e.g. "ffmpeg"
     * @return         The executable, or an empty File when the tool is unavailable
     */
    virtual juce::File findTool(const juce::String& toolName);

    /**
     * Runs a command and waits for it.
     *
     * @param arguments     Program name (resolved through findTool) followed by its arguments
     * @param timeoutMs     Kill the process after this long; -1 uses the default timeout
     * @param includeStdErr Whether stderr is merged into the captured output
     */
    virtual CommandResult run(const juce::StringArray& arguments, int timeoutMs = -1, bool includeStdErr = true);

    /** Convenience wrapper: true when the command ran and exited with 0. */
    bool executeCommand(const juce::StringArray& arguments, int timeoutMs = -1);

    /** Runs a command and returns its stdout, or an empty string on failure. */
    juce::String executeCommandAndGetOutput(const juce::StringArray& arguments, int timeoutMs = -1);

    /**
     * Kills every process this executor has running and makes further run()
     * calls fail until resetCancellation() is called.
     */
    void cancelExecution();
    void resetCancellation();
    bool isCancelled() const { return shouldCancel.load(); }

    /**
     * Gets the duration of a media file in seconds using ffprobe.
     *
     * @return The duration, or 0.0 if the file is missing or cannot be probed
     */
    double getFileDuration(const juce::File& file);

    /**
     * Probes the first video and first audio stream of a file.
     * Fields stay empty/zero when a value is unavailable.
     */
    PipelineTypes::StreamParameters getStreamParameters(const juce::File& file);

    /** Number of commands started since construction. */
    int getNumCommandsRun() const { return commandsRun.load(); }

protected:
    /** Records a command and its outcome in the session logs (used by fakes too). */
    void recordCommand(const juce::StringArray& arguments, const CommandResult& result);

    void log(const juce::String& message) const;

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);

    // Processes currently running, so that cancelExecution() can kill them
    juce::Array<juce::ChildProcess*> activeProcesses;
    juce::CriticalSection processLock;

    std::atomic<bool> shouldCancel { false };
    std::atomic<int> commandsRun { 0 };
    int defaultTimeoutMs = 10 * 60 * 1000;

    juce::HashMap<juce::String, juce::File> toolOverrides;
    juce::CriticalSection toolLock;

    std::function<void(const juce::String&)> logCallback;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ToolExecutor)
};
