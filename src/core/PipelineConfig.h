#pragma once
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include "../pipeline/PipelineTypes.h"

/**
 * Settings for one pipeline run.
 *
 * Defaults are defined here; a config file (a single <SlideReelConfig/> XML
 * element whose attributes use the member names below) may override them, and
 * command-line flags override both.
 */
struct PipelineConfig
{
    // Run inputs
    juce::File inputFile;
    juce::File outputDirectory;
    juce::File workingDirectory;
    juce::String outputFileName { "output.mp4" };
    juce::String language { "en" };
    bool clean = false;

    // Page source
    int dpi = 300;
    PipelineTypes::TextAlignment textAlignment = PipelineTypes::TextAlignment::Truncate;
    bool allowCompositionFallback = false;
    juce::File scriptFile;        // optional narration script, one line per page

    // Narration
    juce::String speechBackend { "google" };   // "google" or "none"
    int speechTimeoutMs = 15000;
    double silentDurationSeconds = 3.0;
    bool narratePlaceholders = true;

    // Scenes
    int width = 1920;
    int height = 1080;
    int fps = 30;
    juce::File backgroundImage;

    // Orchestration
    int maxConcurrentPages = 4;
    bool keepGoing = true;
    int commandTimeoutMs = 10 * 60 * 1000;

    /** Explicit executable per tool name, e.g. "ffmpeg" -> /opt/ffmpeg/bin/ffmpeg. */
    juce::StringPairArray toolPaths;

    juce::File getOutputFile() const { return outputDirectory.getChildFile(outputFileName); }

    /**
     * Applies the attributes of a <SlideReelConfig/> tree on top of this config.
     * Relative paths are resolved against baseDirectory.
     */
    void applyValueTree(const juce::ValueTree& tree, const juce::File& baseDirectory);

    /**
     * Loads a config file and applies it.
     * @return an error message, or an empty string on success
     */
    juce::String loadFromFile(const juce::File& configFile);

    /** The effective settings, as written next to the manifest for diagnosis. */
    juce::ValueTree toValueTree() const;

    /** @return one message per invalid setting; empty when the config is usable */
    juce::StringArray validate() const;

    static juce::String textAlignmentName(PipelineTypes::TextAlignment alignment);
    static bool parseTextAlignment(const juce::String& name, PipelineTypes::TextAlignment& result);
};
