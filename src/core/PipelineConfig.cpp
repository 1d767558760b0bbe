#include "PipelineConfig.h"

namespace
{
    const juce::Identifier configType ("SlideReelConfig");
    const juce::Identifier toolsType ("Tools");

    juce::File resolvePath(const juce::String& path, const juce::File& baseDirectory)
    {
        if (path.isEmpty())
            return juce::File();

        if (juce::File::isAbsolutePath(path))
            return juce::File(path);

        return baseDirectory.getChildFile(path);
    }

    juce::String pathOrEmpty(const juce::File& file)
    {
        return file == juce::File() ? juce::String() : file.getFullPathName();
    }
}

juce::String PipelineConfig::textAlignmentName(PipelineTypes::TextAlignment alignment)
{
    return alignment == PipelineTypes::TextAlignment::MergeOverflow ? "mergeOverflow" : "truncate";
}

bool PipelineConfig::parseTextAlignment(const juce::String& name, PipelineTypes::TextAlignment& result)
{
    if (name.equalsIgnoreCase("truncate"))
    {
        result = PipelineTypes::TextAlignment::Truncate;
        return true;
    }

    if (name.equalsIgnoreCase("mergeOverflow") || name.equalsIgnoreCase("merge"))
    {
        result = PipelineTypes::TextAlignment::MergeOverflow;
        return true;
    }

    return false;
}

void PipelineConfig::applyValueTree(const juce::ValueTree& tree, const juce::File& baseDirectory)
{
    auto has = [&tree](const char* name) { return tree.hasProperty(juce::Identifier(name)); };
    auto get = [&tree](const char* name) { return tree.getProperty(juce::Identifier(name)); };

    if (has("inputFile"))         inputFile = resolvePath(get("inputFile").toString(), baseDirectory);
    if (has("outputDirectory"))   outputDirectory = resolvePath(get("outputDirectory").toString(), baseDirectory);
    if (has("workingDirectory"))  workingDirectory = resolvePath(get("workingDirectory").toString(), baseDirectory);
    if (has("outputFileName"))    outputFileName = get("outputFileName").toString();
    if (has("language"))          language = get("language").toString();
    if (has("clean"))             clean = (bool) get("clean");

    if (has("dpi"))               dpi = (int) get("dpi");
    if (has("allowCompositionFallback")) allowCompositionFallback = (bool) get("allowCompositionFallback");
    if (has("script"))            scriptFile = resolvePath(get("script").toString(), baseDirectory);

    if (has("textAlignment"))
    {
        PipelineTypes::TextAlignment parsed;
        if (parseTextAlignment(get("textAlignment").toString(), parsed))
            textAlignment = parsed;
        else
            juce::Logger::writeToLog("WARNING: unknown textAlignment '" + get("textAlignment").toString() + "', keeping "
                                     + textAlignmentName(textAlignment));
    }

    if (has("speechBackend"))     speechBackend = get("speechBackend").toString();
    if (has("speechTimeoutMs"))   speechTimeoutMs = (int) get("speechTimeoutMs");
    if (has("silentDurationSeconds")) silentDurationSeconds = (double) get("silentDurationSeconds");
    if (has("narratePlaceholders")) narratePlaceholders = (bool) get("narratePlaceholders");

    if (has("width"))             width = (int) get("width");
    if (has("height"))            height = (int) get("height");
    if (has("fps"))               fps = (int) get("fps");
    if (has("backgroundImage"))   backgroundImage = resolvePath(get("backgroundImage").toString(), baseDirectory);

    if (has("maxConcurrentPages")) maxConcurrentPages = (int) get("maxConcurrentPages");
    if (has("keepGoing"))         keepGoing = (bool) get("keepGoing");
    if (has("commandTimeoutMs"))  commandTimeoutMs = (int) get("commandTimeoutMs");

    // <Tools ffmpeg="/opt/bin/ffmpeg" pdftoppm="..."/>
    const juce::ValueTree tools = tree.getChildWithName(toolsType);
    for (int i = 0; i < tools.getNumProperties(); ++i)
    {
        const juce::Identifier name = tools.getPropertyName(i);
        toolPaths.set(name.toString(), resolvePath(tools.getProperty(name).toString(), baseDirectory).getFullPathName());
    }
}

juce::String PipelineConfig::loadFromFile(const juce::File& configFile)
{
    if (!configFile.existsAsFile())
        return "Config file not found: " + configFile.getFullPathName();

    const juce::ValueTree tree = juce::ValueTree::fromXml(configFile.loadFileAsString());

    if (!tree.isValid())
        return "Config file is not valid XML: " + configFile.getFullPathName();

    if (!tree.hasType(configType))
        return "Config file root element must be <" + configType.toString() + ">";

    applyValueTree(tree, configFile.getParentDirectory());
    return {};
}

juce::ValueTree PipelineConfig::toValueTree() const
{
    juce::ValueTree tree(configType);

    tree.setProperty("inputFile", pathOrEmpty(inputFile), nullptr);
    tree.setProperty("outputDirectory", pathOrEmpty(outputDirectory), nullptr);
    tree.setProperty("workingDirectory", pathOrEmpty(workingDirectory), nullptr);
    tree.setProperty("outputFileName", outputFileName, nullptr);
    tree.setProperty("language", language, nullptr);
    tree.setProperty("clean", clean, nullptr);
    tree.setProperty("dpi", dpi, nullptr);
    tree.setProperty("textAlignment", textAlignmentName(textAlignment), nullptr);
    tree.setProperty("allowCompositionFallback", allowCompositionFallback, nullptr);
    tree.setProperty("script", pathOrEmpty(scriptFile), nullptr);
    tree.setProperty("speechBackend", speechBackend, nullptr);
    tree.setProperty("speechTimeoutMs", speechTimeoutMs, nullptr);
    tree.setProperty("silentDurationSeconds", silentDurationSeconds, nullptr);
    tree.setProperty("narratePlaceholders", narratePlaceholders, nullptr);
    tree.setProperty("width", width, nullptr);
    tree.setProperty("height", height, nullptr);
    tree.setProperty("fps", fps, nullptr);
    tree.setProperty("backgroundImage", pathOrEmpty(backgroundImage), nullptr);
    tree.setProperty("maxConcurrentPages", maxConcurrentPages, nullptr);
    tree.setProperty("keepGoing", keepGoing, nullptr);
    tree.setProperty("commandTimeoutMs", commandTimeoutMs, nullptr);

    if (toolPaths.size() > 0)
    {
        juce::ValueTree tools(toolsType);
        for (const auto& key : toolPaths.getAllKeys())
            tools.setProperty(juce::Identifier(key), toolPaths[key], nullptr);
        tree.appendChild(tools, nullptr);
    }

    return tree;
}

juce::StringArray PipelineConfig::validate() const
{
    juce::StringArray problems;

    if (inputFile == juce::File())
        problems.add("No input document given");
    else if (!inputFile.existsAsFile())
        problems.add("Input document not found: " + inputFile.getFullPathName());

    if (outputDirectory == juce::File())
        problems.add("No output directory given");

    if (workingDirectory == juce::File())
        problems.add("No working directory given");

    if (outputFileName.isEmpty() || outputFileName.containsAnyOf("/\\"))
        problems.add("Output file name must be a plain file name: '" + outputFileName + "'");

    if (language.trim().isEmpty())
        problems.add("Language code must not be empty");

    if (dpi < 36 || dpi > 1200)
        problems.add("dpi must be between 36 and 1200 (got " + juce::String(dpi) + ")");

    // libx264 with yuv420p needs even dimensions
    if (width <= 0 || height <= 0 || (width % 2) != 0 || (height % 2) != 0)
        problems.add("Scene size must be positive and even (got " + juce::String(width) + "x" + juce::String(height) + ")");

    if (fps <= 0 || fps > 120)
        problems.add("fps must be between 1 and 120 (got " + juce::String(fps) + ")");

    if (silentDurationSeconds <= 0.0)
        problems.add("silentDurationSeconds must be positive");

    if (speechBackend != "google" && speechBackend != "none")
        problems.add("speechBackend must be 'google' or 'none' (got '" + speechBackend + "')");

    if (speechTimeoutMs <= 0)
        problems.add("speechTimeoutMs must be positive");

    if (maxConcurrentPages < 1)
        problems.add("maxConcurrentPages must be at least 1");

    if (scriptFile != juce::File() && !scriptFile.existsAsFile())
        problems.add("Narration script not found: " + scriptFile.getFullPathName());

    return problems;
}
