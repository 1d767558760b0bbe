#pragma once
#include <juce_core/juce_core.h>

/**
 * Registry of every external tool process SlideReel has running.
 *
 * Page workers start rasterizer, probe and encoder processes concurrently;
 * the registry lets the CLI terminate all of them on shutdown, no matter which
 * worker started them.
 */
class ProcessManager
{
public:
    static ProcessManager& getInstance()
    {
        static ProcessManager instance;
        return instance;
    }

    void registerProcess(juce::ChildProcess* process, const juce::String& toolName)
    {
        const juce::ScopedLock sl(registryLock);
        if (!entries.contains(process))
            entries.set(process, toolName);
    }

    void unregisterProcess(juce::ChildProcess* process)
    {
        const juce::ScopedLock sl(registryLock);
        entries.remove(process);
    }

    int getNumActiveProcesses() const
    {
        const juce::ScopedLock sl(registryLock);
        return entries.size();
    }

    /** Names of the tools currently registered, sorted, one entry per process. */
    juce::StringArray getActiveToolNames() const
    {
        const juce::ScopedLock sl(registryLock);
        juce::StringArray names;

        for (juce::HashMap<juce::ChildProcess*, juce::String>::Iterator it(entries); it.next();)
            names.add(it.getValue());

        names.sort(false);
        return names;
    }

    /**
     * Kills every registered process that is still running. Entries stay
     * registered until their ManagedChildProcess goes out of scope.
     *
     * @return the number of processes that were killed
     */
    int terminateAllProcesses()
    {
        const juce::ScopedLock sl(registryLock);
        int killed = 0;

        for (juce::HashMap<juce::ChildProcess*, juce::String>::Iterator it(entries); it.next();)
        {
            auto* process = it.getKey();

            if (process->isRunning())
            {
                juce::Logger::writeToLog("Killing " + it.getValue());
                process->kill();
                ++killed;
            }
        }

        if (killed > 0)
            juce::Logger::writeToLog("Killed " + juce::String(killed) + " tool processes on shutdown");

        return killed;
    }

private:
    ProcessManager() = default;

    juce::HashMap<juce::ChildProcess*, juce::String> entries;
    juce::CriticalSection registryLock;

    JUCE_DECLARE_NON_COPYABLE(ProcessManager)
};

/**
 * ChildProcess that is registered with the ProcessManager for its lifetime
 * and is killed if it is still running when it goes out of scope.
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    explicit ManagedChildProcess(const juce::String& toolName)
    {
        ProcessManager::getInstance().registerProcess(this, toolName);
    }

    ~ManagedChildProcess()
    {
        if (isRunning())
            kill();

        ProcessManager::getInstance().unregisterProcess(this);
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManagedChildProcess)
};
