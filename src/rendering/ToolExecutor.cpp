//==============================================================================
/**
 * @file ToolExecutor.cpp
 *
 * Implementation of the ToolExecutor. Each command runs in its own
 * ManagedChildProcess; a small watchdog thread enforces the timeout because
 * reading the process output blocks until the tool closes its pipe.
 */

#include "ToolExecutor.h"
#include "../core/ProcessManager.h"

namespace
{
    double parseFractionString(const juce::String& fraction)
    {
        auto value = fraction.trim();
        if (value.isEmpty())
            return 0.0;

        const int slashIndex = value.indexOfChar('/');
        if (slashIndex > 0)
        {
            const double numerator = value.substring(0, slashIndex).getDoubleValue();
            const double denominator = value.substring(slashIndex + 1).getDoubleValue();
            if (denominator != 0.0)
                return numerator / denominator;
            return 0.0;
        }

        return value.getDoubleValue();
    }

    /** Quotes an argument for display in the logs only; it is never re-parsed. */
    juce::String describeCommand(const juce::StringArray& arguments)
    {
        juce::StringArray quoted;
        for (const auto& arg : arguments)
            quoted.add(arg.containsAnyOf(" '\"") ? arg.quoted() : arg);
        return quoted.joinIntoString(" ");
    }

    /** Kills the process if the command has not finished within the timeout. */
    class ProcessWatchdog : private juce::Thread
    {
    public:
        ProcessWatchdog(juce::ChildProcess& processToWatch, int timeoutMs)
            : juce::Thread("ToolWatchdog"),
              process(processToWatch),
              timeout(timeoutMs)
        {
            if (timeout > 0)
                startThread();
        }

        ~ProcessWatchdog() override
        {
            finished.signal();
            stopThread(2000);
        }

        void commandFinished() { finished.signal(); }
        bool hasTimedOut() const { return timedOut.load(); }

    private:
        void run() override
        {
            if (!finished.wait(timeout))
            {
                timedOut = true;
                process.kill();
            }
        }

        juce::ChildProcess& process;
        const int timeout;
        juce::WaitableEvent finished;
        std::atomic<bool> timedOut { false };
    };
}

//==============================================================================
ToolExecutor::ToolExecutor()
{
}

ToolExecutor::~ToolExecutor()
{
    cancelExecution();
}

//==============================================================================
void ToolExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void ToolExecutor::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void ToolExecutor::setToolOverride(const juce::String& toolName, const juce::File& executable)
{
    const juce::ScopedLock sl(toolLock);
    toolOverrides.set(toolName, executable);
}

//==============================================================================
void ToolExecutor::setSessionLogDirectory(const juce::File& directory)
{
    const juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && !directory.createDirectory().wasOk())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("tools.log");
    sessionLoggingEnabled = true;
}

//==============================================================================
juce::File ToolExecutor::getNextCommandLogFile(int& outIndex)
{
    const juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("tool_%03d.log", sessionCommandIndex));
}

//==============================================================================
void ToolExecutor::writeToAggregateLog(const juce::String& message)
{
    const juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
void ToolExecutor::recordCommand(const juce::StringArray& arguments, const CommandResult& result)
{
    int commandLogIndex = -1;
    const juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    const juce::String finishTime = juce::Time::getCurrentTime().toString(true, true);
    const juce::String commandLine = describeCommand(arguments);

    juce::String outcome;
    if (!result.started)        outcome = "START_FAILED";
    else if (result.timedOut)   outcome = "TIMED_OUT";
    else if (result.cancelled)  outcome = "CANCELLED";
    else                        outcome = "END exitCode=" + juce::String(result.exitCode);

    if (commandLogFile != juce::File())
    {
        juce::String text;
        text << "Command: " << commandLine << "\n"
             << "------------------------------------------------------------\n"
             << result.output.replace("\r", "\n")
             << "\n------------------------------------------------------------\n"
             << "Finished: " << finishTime << "\n"
             << "Outcome: " << outcome << "\n";

        if (!commandLogFile.replaceWithText(text))
            log("WARNING: could not write " + commandLogFile.getFullPathName());
    }

    const juce::String label = (commandLogIndex > 0) ? juce::String::formatted("#%03d", commandLogIndex)
                                                     : juce::String("#---");
    writeToAggregateLog(label + " [" + finishTime + "] " + outcome + " " + commandLine);
}

//==============================================================================
juce::File ToolExecutor::findTool(const juce::String& toolName)
{
    {
        const juce::ScopedLock sl(toolLock);
        if (toolOverrides.contains(toolName))
        {
            const juce::File overridden = toolOverrides[toolName];
            return overridden.existsAsFile() ? overridden : juce::File();
        }
    }

    // A copy shipped next to the executable wins over the system one
    const juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
    const juce::File local = appDir.getChildFile(toolName);
    if (local.existsAsFile())
        return local;

    juce::StringArray searchPath;
    searchPath.addTokens(juce::SystemStats::getEnvironmentVariable("PATH", {}), ":", "");
    searchPath.removeEmptyStrings();

    for (const auto& dir : searchPath)
    {
        const juce::File candidate = juce::File(dir).getChildFile(toolName);
        if (candidate.existsAsFile())
            return candidate;
    }

    return juce::File();
}

//==============================================================================
ToolExecutor::CommandResult ToolExecutor::run(const juce::StringArray& arguments, int timeoutMs, bool includeStdErr)
{
    CommandResult result;
    ++commandsRun;

    if (arguments.isEmpty())
        return result;

    if (shouldCancel.load())
    {
        result.cancelled = true;
        recordCommand(arguments, result);
        return result;
    }

    juce::StringArray resolved(arguments);
    const juce::File executable = findTool(arguments[0]);
    if (executable == juce::File())
    {
        result.output = "Tool not found: " + arguments[0];
        recordCommand(arguments, result);
        log("ERROR: " + result.output);
        return result;
    }
    resolved.set(0, executable.getFullPathName());

    ManagedChildProcess process(arguments[0]);
    const int streamFlags = includeStdErr ? (juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr)
                                          : juce::ChildProcess::wantStdOut;

    if (!process.start(resolved, streamFlags))
    {
        result.output = "Failed to start " + executable.getFullPathName();
        recordCommand(arguments, result);
        log("ERROR: " + result.output);
        return result;
    }

    result.started = true;

    {
        const juce::ScopedLock sl(processLock);
        activeProcesses.add(&process);
    }

    {
        ProcessWatchdog watchdog(process, timeoutMs < 0 ? defaultTimeoutMs : timeoutMs);

        // Drain output until the tool closes its pipe; a full pipe would stall it
        juce::MemoryOutputStream captured;
        char buffer[4096];

        for (;;)
        {
            const int bytesRead = process.readProcessOutput(buffer, sizeof(buffer));
            if (bytesRead <= 0)
                break;
            captured.write(buffer, (size_t) bytesRead);
        }

        process.waitForProcessToFinish(5000);
        watchdog.commandFinished();

        result.output = juce::String::fromUTF8(static_cast<const char*>(captured.getData()),
                                               (int) captured.getDataSize());
        result.timedOut = watchdog.hasTimedOut();
    }

    {
        const juce::ScopedLock sl(processLock);
        activeProcesses.removeFirstMatchingValue(&process);
    }

    result.cancelled = shouldCancel.load();

    if (!result.timedOut && !result.cancelled)
        result.exitCode = (int) process.getExitCode();

    recordCommand(arguments, result);

    if (result.timedOut)
        log("ERROR: " + arguments[0] + " timed out");
    else if (!result.cancelled && result.exitCode != 0)
        log(arguments[0] + " failed (exit code: " + juce::String(result.exitCode) + ")");

    return result;
}

//==============================================================================
bool ToolExecutor::executeCommand(const juce::StringArray& arguments, int timeoutMs)
{
    return run(arguments, timeoutMs, true).succeeded();
}

juce::String ToolExecutor::executeCommandAndGetOutput(const juce::StringArray& arguments, int timeoutMs)
{
    const CommandResult result = run(arguments, timeoutMs, false);
    return result.succeeded() ? result.output : juce::String();
}

//==============================================================================
void ToolExecutor::cancelExecution()
{
    shouldCancel.store(true);

    const juce::ScopedLock sl(processLock);
    for (auto* process : activeProcesses)
        if (process != nullptr && process->isRunning())
            process->kill();
}

void ToolExecutor::resetCancellation()
{
    shouldCancel.store(false);
}

//==============================================================================
double ToolExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        return 0.0;

    const juce::String output = executeCommandAndGetOutput({ "ffprobe", "-v", "error",
                                                             "-show_entries", "format=duration",
                                                             "-of", "default=noprint_wrappers=1:nokey=1",
                                                             file.getFullPathName() },
                                                           30000).trim();

    const double duration = output.getDoubleValue();
    return (std::isfinite(duration) && duration > 0.0) ? duration : 0.0;
}

//==============================================================================
PipelineTypes::StreamParameters ToolExecutor::getStreamParameters(const juce::File& file)
{
    PipelineTypes::StreamParameters params;

    if (!file.existsAsFile())
        return params;

    // compact output: one line per stream, "key=value|key=value|..."
    const juce::String output = executeCommandAndGetOutput({ "ffprobe", "-v", "error",
                                                             "-show_entries",
                                                             "stream=codec_type,codec_name,width,height,r_frame_rate,pix_fmt,sample_rate,channels",
                                                             "-of", "compact=p=0",
                                                             file.getFullPathName() },
                                                           30000);

    juce::StringArray lines;
    lines.addLines(output);

    bool haveVideo = false;
    bool haveAudio = false;

    for (const auto& line : lines)
    {
        juce::StringPairArray fields;
        juce::StringArray tokens;
        tokens.addTokens(line.trim(), "|", "");

        for (const auto& token : tokens)
            fields.set(token.upToFirstOccurrenceOf("=", false, false).trim(),
                       token.fromFirstOccurrenceOf("=", false, false).trim());

        const juce::String type = fields["codec_type"];

        if (type == "video" && !haveVideo)
        {
            haveVideo = true;
            params.videoCodec = fields["codec_name"];
            params.width = fields["width"].getIntValue();
            params.height = fields["height"].getIntValue();
            params.fps = parseFractionString(fields["r_frame_rate"]);
            params.pixelFormat = fields["pix_fmt"];
        }
        else if (type == "audio" && !haveAudio)
        {
            haveAudio = true;
            params.audioCodec = fields["codec_name"];
            params.sampleRate = fields["sample_rate"].getIntValue();
            params.channels = fields["channels"].getIntValue();
        }
    }

    return params;
}
