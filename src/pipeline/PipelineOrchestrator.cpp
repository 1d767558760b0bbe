#include "PipelineOrchestrator.h"
#include "CapabilityProbe.h"
#include "../audio/GoogleSpeechBackend.h"

namespace
{
    juce::String statusName(PageOutcome::Status status)
    {
        switch (status)
        {
            case PageOutcome::Status::Pending:   return "pending";
            case PageOutcome::Status::Completed: return "ok";
            case PageOutcome::Status::Failed:    return "FAILED";
            case PageOutcome::Status::Skipped:   return "skipped";
        }
        return "unknown";
    }

    juce::String formatElapsed(double seconds)
    {
        const int total = (int) seconds;
        return juce::String::formatted("%02d:%02d:%02d", total / 3600, (total / 60) % 60, total % 60);
    }
}

//==============================================================================
juce::String RunFailure::describe() const
{
    juce::String text = PipelineError::kindName(kind) + " during " + stage;
    if (pageIndex > 0)
        text << " (page " << pageIndex << ")";
    return text + ": " + message;
}

juce::String RunReport::toString() const
{
    juce::String text;
    text << "Result: " << PipelineTypes::toString(finalState) << "\n"
         << "Elapsed: " << formatElapsed(elapsedSeconds) << "\n"
         << "Working area: " << workingDirectory.getFullPathName() << "\n";

    if (succeeded())
        text << "Output: " << outputFile.getFullPathName() << "\n";

    for (const auto& page : pages)
    {
        text << "  page " << juce::String(page.index).paddedLeft('0', 3) << ": " << statusName(page.status);

        if (page.status == PageOutcome::Status::Completed)
            text << ", " << juce::String(page.durationSeconds, 2) << "s, "
                 << (page.provenance == PipelineTypes::AudioProvenance::Synthesized ? "speech" : "silence")
                 << (page.audioReused ? ", audio cached" : "")
                 << (page.sceneReused ? ", scene cached" : "");

        text << "\n";
    }

    for (const auto& warning : warnings)
        text << "WARNING: " << warning << "\n";

    for (const auto& failure : failures)
        text << "FAILED: " << failure.describe() << "\n";

    return text;
}

//==============================================================================
class PipelineOrchestrator::PageJob : public juce::ThreadPoolJob
{
public:
    PageJob(PipelineOrchestrator& owner, Phase phase, int position)
        : juce::ThreadPoolJob("Page " + juce::String(position + 1)),
          owner(owner), phase(phase), position(position)
    {
    }

    JobStatus runJob() override
    {
        if (shouldExit() || owner.shouldSkipPages())
        {
            owner.markSkipped(position);
            owner.pageFinished();
            return jobHasFinished;
        }

        if (phase == Phase::Narrate)
            owner.narratePage(position);
        else
            owner.renderPage(position);

        owner.pageFinished();
        return jobHasFinished;
    }

private:
    PipelineOrchestrator& owner;
    const Phase phase;
    const int position;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PageJob)
};

//==============================================================================
PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& configToUse,
                                           std::unique_ptr<ToolExecutor> executor,
                                           std::unique_ptr<SpeechBackend> backend)
    : config(configToUse),
      workingArea(configToUse.workingDirectory, configToUse.inputFile),
      toolExecutor(std::move(executor)),
      speechBackend(std::move(backend))
{
    if (toolExecutor == nullptr)
        toolExecutor = std::make_unique<ToolExecutor>();

    if (config.speechBackend == "none")
        speechBackend.reset();
    else if (speechBackend == nullptr)
        speechBackend = std::make_unique<GoogleSpeechBackend>(config.speechTimeoutMs);

    pageSource = std::make_unique<PageSource>(toolExecutor.get(), workingArea);
    narrationSynthesizer = std::make_unique<NarrationSynthesizer>(toolExecutor.get(), speechBackend.get(), workingArea);
    sceneRenderer = std::make_unique<SceneRenderer>(toolExecutor.get());
    sequenceAssembler = std::make_unique<SequenceAssembler>(toolExecutor.get());

    logFunction = [this](const juce::String& message)
    {
        const juce::String line = "[PIPELINE] " + message;
        sessionLog.logMessage(line);
        juce::Logger::writeToLog(line);
    };

    toolExecutor->setLogCallback(logFunction);
    pageSource->setLogCallback(logFunction);
    narrationSynthesizer->setLogCallback(logFunction);
    sceneRenderer->setLogCallback(logFunction);
    sequenceAssembler->setLogCallback(logFunction);
}

PipelineOrchestrator::~PipelineOrchestrator()
{
    cancel();
}

void PipelineOrchestrator::setStatusCallback(std::function<void(const juce::String&)> callback)
{
    statusCallback = callback;
}

void PipelineOrchestrator::setProgressCallback(std::function<void(double)> callback)
{
    progressCallback = callback;
}

void PipelineOrchestrator::log(const juce::String& message) const
{
    if (logFunction)
        logFunction(message);
}

void PipelineOrchestrator::cancel()
{
    shouldCancel = true;
    toolExecutor->cancelExecution();
}

//==============================================================================
void PipelineOrchestrator::setState(PipelineTypes::RunState newState, const juce::String& message)
{
    // FAILED is absorbing
    if (state.load() == PipelineTypes::RunState::Failed)
        return;

    state = newState;
    log("State " + PipelineTypes::toString(newState) + ": " + message);

    if (statusCallback)
        statusCallback(PipelineTypes::toString(newState) + ": " + message);
}

void PipelineOrchestrator::recordFailure(const PipelineError& error, const juce::String& stage)
{
    RunFailure failure { error.getKind(), stage, error.getPageIndex(), error.getMessage() };

    {
        const juce::ScopedLock sl(reportLock);
        report.failures.push_back(failure);

        if (juce::isPositiveAndNotGreaterThan(failure.pageIndex, (int) report.pages.size()))
            report.pages[(size_t) failure.pageIndex - 1].status = PageOutcome::Status::Failed;
    }

    if (failure.pageIndex > 0)
        pageFailed = true;

    log("ERROR: " + failure.describe());
    setState(PipelineTypes::RunState::Failed, failure.describe());
}

void PipelineOrchestrator::addWarning(const juce::String& message)
{
    const juce::ScopedLock sl(reportLock);
    report.warnings.addIfNotAlreadyThere(message);
}

void PipelineOrchestrator::markSkipped(int position)
{
    const juce::ScopedLock sl(reportLock);
    auto& outcome = report.pages[(size_t) position];

    if (outcome.status == PageOutcome::Status::Pending)
        outcome.status = PageOutcome::Status::Skipped;
}

void PipelineOrchestrator::pageFinished()
{
    const int done = ++finishedUnits;

    if (progressCallback)
        progressCallback(juce::jlimit(0.0, 1.0, (double) done / (double) totalUnits));
}

bool PipelineOrchestrator::shouldSkipPages() const
{
    return shouldCancel.load() || (pageFailed.load() && !config.keepGoing);
}

//==============================================================================
RunReport PipelineOrchestrator::build()
{
    const juce::Time startTime = juce::Time::getCurrentTime();

    report = RunReport();
    report.outputFile = config.getOutputFile();
    report.workingDirectory = workingArea.getRunDirectory();
    state = PipelineTypes::RunState::Init;
    pageFailed = false;
    finishedUnits = 0;
    totalUnits = 1;
    shouldCancel = false;
    toolExecutor->resetCancellation();

    const juce::StringArray problems = config.validate();
    if (!problems.isEmpty())
    {
        for (const auto& problem : problems)
            recordFailure(PipelineError(PipelineError::Kind::Configuration, problem), "startup");

        report.finalState = state.load();
        return report;
    }

    RunLock runLock(workingArea.getRunKey());
    if (!runLock.tryAcquire())
    {
        recordFailure(PipelineError(PipelineError::Kind::WorkingArea,
                                    "Another build of " + config.inputFile.getFileName() + " is in progress"),
                      "startup");
        report.finalState = state.load();
        return report;
    }

    if (config.clean)
    {
        const juce::Result cleaned = workingArea.clean();
        if (cleaned.failed())
        {
            recordFailure(PipelineError(PipelineError::Kind::WorkingArea, cleaned.getErrorMessage()), "startup");
            report.finalState = state.load();
            return report;
        }
    }

    const juce::Result created = workingArea.create();
    if (created.failed())
    {
        recordFailure(PipelineError(PipelineError::Kind::WorkingArea, created.getErrorMessage()), "startup");
        report.finalState = state.load();
        return report;
    }

    {
        const juce::File sessionLogFile = workingArea.getLogsDirectory().getChildFile("session.log");
        if (!sessionLog.open(sessionLogFile))
            addWarning("Could not open " + sessionLogFile.getFullPathName());

        toolExecutor->setSessionLogDirectory(workingArea.getLogsDirectory());
        toolExecutor->setDefaultTimeout(config.commandTimeoutMs);

        for (const auto& tool : config.toolPaths.getAllKeys())
            toolExecutor->setToolOverride(tool, juce::File(config.toolPaths[tool]));

        log("=== SlideReel build ===");
        log("Input: " + config.inputFile.getFullPathName());
        log("Working area: " + workingArea.getRunDirectory().getFullPathName() + (config.clean ? " (cleaned)" : ""));
        log("Output: " + report.outputFile.getFullPathName());

        std::unique_ptr<juce::XmlElement> snapshot(config.toValueTree().createXml());
        if (snapshot == nullptr || !snapshot->writeTo(workingArea.getConfigSnapshotFile()))
            addWarning("Could not write " + workingArea.getConfigSnapshotFile().getFileName());

        runStages();

        // Units of stages that never ran count as finished once the run is over
        if (finishedUnits.exchange(totalUnits) < totalUnits && progressCallback)
            progressCallback(1.0);

        const juce::Result saved = manifestBuilder.save(workingArea.getManifestFile());
        if (saved.failed())
            addWarning(saved.getErrorMessage());

        report.elapsedSeconds = (juce::Time::getCurrentTime() - startTime).inSeconds();
        report.finalState = state.load();

        log("Build finished in " + formatElapsed(report.elapsedSeconds) + " with state " + PipelineTypes::toString(report.finalState));
        toolExecutor->setSessionLogDirectory(juce::File());
        sessionLog.close();
    }

    return report;
}

void PipelineOrchestrator::runStages()
{
    using RunState = PipelineTypes::RunState;
    juce::String stage = "startup";

    try
    {
        // INIT: capabilities and strategy are decided once, before any page work
        CapabilityProbe probe(toolExecutor.get());
        probe.setLogCallback(logFunction);

        const auto capabilities = probe.probe();
        const auto kind = PageSource::detectKind(config.inputFile);
        const auto strategy = CapabilityProbe::selectStrategy(capabilities, kind, config.allowCompositionFallback);

        log("Rasterization: " + PipelineTypes::toString(strategy));

        sceneRenderer->setOutputFormat(config.width, config.height, config.fps);
        sceneRenderer->setBackgroundImage(juce::File());

        if (config.backgroundImage != juce::File())
        {
            if (config.backgroundImage.existsAsFile())
            {
                log("Using background image: " + config.backgroundImage.getFullPathName());
                sceneRenderer->setBackgroundImage(config.backgroundImage);
            }
            else
            {
                addWarning("Background image not found: " + config.backgroundImage.getFullPathName()
                           + "; proceeding without background");
            }
        }

        narrationSynthesizer->setSilentDuration(config.silentDurationSeconds);
        narrationSynthesizer->setNarratePlaceholders(config.narratePlaceholders);
        narrationSynthesizer->setPlaceholderWord(PageSource::placeholderWord(kind));

        if (speechBackend == nullptr)
            log("Speech synthesis disabled; every page is narrated with silence");

        // SOURCED
        stage = "page extraction";

        PageSource::Options options;
        options.dpi = config.dpi;
        options.textAlignment = config.textAlignment;
        options.scriptFile = config.scriptFile;
        options.composeWidth = config.width;
        options.composeHeight = config.height;
        options.allowCompositionFallback = config.allowCompositionFallback;
        options.reuseCachedImages = !config.clean;
        options.capabilities = capabilities;

        pages = pageSource->loadPages(config.inputFile, strategy, options);

        for (const auto& warning : pageSource->getWarnings())
            addWarning(warning);

        const int numPages = (int) pages.size();
        manifestBuilder.reset(numPages);
        audioAssets.assign((size_t) numPages, {});
        scenes.assign((size_t) numPages, {});
        totalUnits = numPages * 2 + 1;

        {
            const juce::ScopedLock sl(reportLock);
            report.pages.assign((size_t) numPages, {});
            for (int i = 0; i < numPages; ++i)
                report.pages[(size_t) i].index = i + 1;
        }

        for (const auto& page : pages)
            if (page.imageAvailable)
                manifestBuilder.setImage(page.index, page.imagePath);

        setState(RunState::Sourced, juce::String(numPages) + " pages");

        // NARRATED
        stage = "narration";
        runPagePhase(Phase::Narrate);

        if (shouldCancel.load())
            throw PipelineError(PipelineError::Kind::WorkingArea, "Build cancelled");

        if (!pageFailed.load())
            setState(RunState::Narrated, "audio ready for every page");
        else if (!config.keepGoing)
            return;

        // RENDERED
        stage = "scene rendering";
        runPagePhase(Phase::Render);

        if (shouldCancel.load())
            throw PipelineError(PipelineError::Kind::WorkingArea, "Build cancelled");

        if (pageFailed.load())
        {
            log("Assembly skipped: at least one page failed; intermediate artifacts kept in "
                + workingArea.getRunDirectory().getFullPathName());
            return;
        }

        setState(RunState::Rendered, "scene ready for every page");

        // ASSEMBLED
        stage = "assembly";
        const Manifest manifest = manifestBuilder.materialize(workingArea.getConcatListFile(), config.getOutputFile());

        std::vector<PipelineTypes::Scene> ordered;
        for (const auto& entry : manifest.entries)
            ordered.push_back(scenes[(size_t) entry.index - 1]);

        sequenceAssembler->assemble(ordered, manifest.concatListFile, manifest.outputFile);
        pageFinished();

        setState(RunState::Assembled, "final video written");

        double totalDuration = 0.0;
        for (const auto& scene : scenes)
            totalDuration += scene.durationSeconds;

        setState(RunState::Done, manifest.outputFile.getFullPathName() + " (" + juce::String(totalDuration, 2) + "s)");
    }
    catch (const PipelineError& error)
    {
        recordFailure(error, stage);
    }
}

//==============================================================================
void PipelineOrchestrator::runPagePhase(Phase phase)
{
    juce::OwnedArray<PageJob> jobs;
    juce::ThreadPool pool(juce::jmax(1, juce::jmin(config.maxConcurrentPages, (int) pages.size())));

    for (int position = 0; position < (int) pages.size(); ++position)
    {
        // A page whose narration failed has nothing to render
        if (phase == Phase::Render && audioAssets[(size_t) position].filePath == juce::File())
            continue;

        auto* job = jobs.add(new PageJob(*this, phase, position));
        pool.addJob(job, false);
    }

    // Barrier: the next phase starts only when every page of this one is done
    for (auto* job : jobs)
        pool.waitForJobToFinish(job, -1);
}

void PipelineOrchestrator::narratePage(int position)
{
    const PipelineTypes::Page& page = pages[(size_t) position];

    try
    {
        PipelineTypes::AudioAsset asset;
        PipelineTypes::AudioProvenance cachedProvenance = PipelineTypes::AudioProvenance::SilentFallback;
        const juce::File cached = config.clean ? juce::File() : workingArea.findExistingAudio(page.index, cachedProvenance);

        if (cached != juce::File())
        {
            const double duration = toolExecutor->getFileDuration(cached);

            if (duration > 0.0)
            {
                asset.index = page.index;
                asset.filePath = cached;
                asset.durationSeconds = duration;
                asset.provenance = cachedProvenance;
                asset.reused = true;
                log("Page " + juce::String(page.index) + ": reusing " + cached.getFileName());
            }
            else
            {
                log("Page " + juce::String(page.index) + ": cached " + cached.getFileName() + " is unreadable, regenerating");
                cached.deleteFile();
            }
        }

        if (!asset.reused)
            asset = narrationSynthesizer->synthesize(page, config.language);

        audioAssets[(size_t) position] = asset;
        manifestBuilder.setAudio(page.index, asset.filePath);

        const juce::ScopedLock sl(reportLock);
        auto& outcome = report.pages[(size_t) position];
        outcome.provenance = asset.provenance;
        outcome.audioReused = asset.reused;
        outcome.durationSeconds = asset.durationSeconds;
    }
    catch (const PipelineError& error)
    {
        recordFailure(error, "narration");
    }
}

void PipelineOrchestrator::renderPage(int position)
{
    const PipelineTypes::Page& page = pages[(size_t) position];
    const PipelineTypes::AudioAsset& audio = audioAssets[(size_t) position];
    const juce::File sceneFile = workingArea.sceneFile(page.index);

    try
    {
        PipelineTypes::Scene scene;

        // A scene is only as fresh as the audio it was muxed with
        if (page.imageAvailable && audio.reused && !config.clean && sceneFile.existsAsFile() && sceneFile.getSize() > 0)
        {
            scene.index = page.index;
            scene.videoPath = sceneFile;
            scene.durationSeconds = audio.durationSeconds;
            scene.reused = true;
            log("Page " + juce::String(page.index) + ": reusing " + sceneFile.getFileName());
        }
        else
        {
            sceneFile.deleteFile();
            scene = sceneRenderer->render(page, audio, sceneFile);
        }

        scenes[(size_t) position] = scene;
        manifestBuilder.setScene(page.index, scene.videoPath);

        const juce::ScopedLock sl(reportLock);
        auto& outcome = report.pages[(size_t) position];
        outcome.sceneReused = scene.reused;
        outcome.durationSeconds = scene.durationSeconds;
        outcome.status = PageOutcome::Status::Completed;
    }
    catch (const PipelineError& error)
    {
        recordFailure(error, "scene rendering");
    }
}
