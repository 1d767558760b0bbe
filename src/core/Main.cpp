/*
  ==============================================================================
    Main.cpp - Command line entry point
  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <iostream>
#include "PipelineConfig.h"
#include "ProcessManager.h"
#include "../pipeline/PipelineOrchestrator.h"

namespace
{
    const char* const applicationName = "SlideReel";
    const char* const applicationVersion = SLIDEREEL_VERSION;

    void printUsage()
    {
        std::cout << applicationName << " " << applicationVersion << "\n"
                  << "Turns a PDF or slide deck into a narrated video.\n\n"
                  << "Usage: SlideReel [options]\n\n"
                  << "  --input-dir <dir>          directory holding the input document (default: input)\n"
                  << "  --input <file>             input document, relative to --input-dir (default: slides.pptx)\n"
                  << "  --output-dir <dir>         where the video is written (default: output)\n"
                  << "  --output-name <file>       name of the video (default: output.mp4)\n"
                  << "  --work-dir <dir>           intermediate artifacts (default: temp)\n"
                  << "  --language <code>          narration language (default: en)\n"
                  << "  --config <file>            SlideReelConfig XML file applied before other flags\n"
                  << "  --background <image>       image placed behind every page\n"
                  << "  --script <file>            narration script, one line per page\n"
                  << "  --jobs <n>                 pages processed concurrently (default: 4)\n"
                  << "  --clean                    discard artifacts from earlier runs\n"
                  << "  --offline                  narrate every page with silence\n"
                  << "  --allow-fallback-render    compose slides in-process when no converter is installed\n"
                  << "  --stop-on-error            skip remaining pages after the first page failure\n"
                  << "  --help                     show this message\n";
    }

    /** Resolves a path argument against the current directory. */
    juce::File resolvePath(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path.unquoted());
    }

    /** Applies command line flags over the config; returns an error message or an empty string. */
    juce::String applyArguments(const juce::ArgumentList& args, PipelineConfig& config)
    {
        if (args.containsOption("--config"))
        {
            const juce::File configFile = resolvePath(args.getValueForOption("--config"));
            const juce::String error = config.loadFromFile(configFile);
            if (error.isNotEmpty())
                return error;
        }

        juce::File inputDirectory = resolvePath("input");
        juce::String inputName = config.inputFile != juce::File() ? config.inputFile.getFullPathName()
                                                                  : juce::String("slides.pptx");

        if (args.containsOption("--input-dir"))
            inputDirectory = resolvePath(args.getValueForOption("--input-dir"));
        if (args.containsOption("--input"))
            inputName = args.getValueForOption("--input").unquoted();

        config.inputFile = inputDirectory.getChildFile(inputName);

        if (args.containsOption("--output-dir"))
            config.outputDirectory = resolvePath(args.getValueForOption("--output-dir"));
        else if (config.outputDirectory == juce::File())
            config.outputDirectory = resolvePath("output");

        if (args.containsOption("--work-dir"))
            config.workingDirectory = resolvePath(args.getValueForOption("--work-dir"));
        else if (config.workingDirectory == juce::File())
            config.workingDirectory = resolvePath("temp");

        if (args.containsOption("--output-name"))
            config.outputFileName = args.getValueForOption("--output-name").unquoted();

        if (args.containsOption("--language"))
            config.language = args.getValueForOption("--language").trim();

        if (args.containsOption("--background"))
            config.backgroundImage = resolvePath(args.getValueForOption("--background"));

        if (args.containsOption("--script"))
            config.scriptFile = resolvePath(args.getValueForOption("--script"));

        if (args.containsOption("--jobs"))
        {
            const juce::String jobs = args.getValueForOption("--jobs").trim();
            if (!jobs.containsOnly("0123456789") || jobs.isEmpty())
                return "--jobs expects a positive number, got '" + jobs + "'";
            config.maxConcurrentPages = jobs.getIntValue();
        }

        if (args.containsOption("--clean"))
            config.clean = true;
        if (args.containsOption("--offline"))
            config.speechBackend = "none";
        if (args.containsOption("--allow-fallback-render"))
            config.allowCompositionFallback = true;
        if (args.containsOption("--stop-on-error"))
            config.keepGoing = false;

        return {};
    }

    std::unique_ptr<juce::FileLogger> createSessionFileLogger(const juce::File& outputDirectory)
    {
        juce::File logsDirectory = outputDirectory.getChildFile("logs");
        if (logsDirectory.createDirectory().failed())
            logsDirectory = juce::File::getSpecialLocation(juce::File::tempDirectory);

        const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
        const juce::File logFile = logsDirectory.getChildFile(juce::String(applicationName) + "_" + sessionStamp + ".log");

        return std::make_unique<juce::FileLogger>(logFile, juce::String(applicationName) + " Session Log", 0);
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInitialiser;
    const juce::ArgumentList args(argc, argv);

    if (args.containsOption("--help|-h"))
    {
        printUsage();
        return 0;
    }

    PipelineConfig config;
    const juce::String argumentError = applyArguments(args, config);

    if (argumentError.isNotEmpty())
    {
        std::cerr << "ERROR: " << argumentError << "\n";
        return 1;
    }

    std::unique_ptr<juce::FileLogger> fileLogger = createSessionFileLogger(config.outputDirectory);
    juce::Logger::setCurrentLogger(fileLogger.get());

    juce::Logger::writeToLog("----------------------------------------------------");
    juce::Logger::writeToLog("Build started: " + juce::Time::getCurrentTime().toString(true, true));
    juce::Logger::writeToLog("Version: " + juce::String(applicationVersion));
    juce::Logger::writeToLog("----------------------------------------------------");

    RunReport report;

    {
        PipelineOrchestrator orchestrator(config);

        orchestrator.setStatusCallback([](const juce::String& status)
        {
            std::cout << status << std::endl;
        });

        report = orchestrator.build();
    }

    ProcessManager::getInstance().terminateAllProcesses();

    std::cout << report.toString();

    juce::Logger::writeToLog(report.toString());
    juce::Logger::writeToLog("Build finished: " + juce::Time::getCurrentTime().toString(true, true));

    juce::Logger::setCurrentLogger(nullptr);
    fileLogger = nullptr;

    return report.succeeded() ? 0 : 1;
}
