#pragma once
#include <juce_core/juce_core.h>
#include "PipelineTypes.h"
#include "PipelineError.h"
#include "WorkingArea.h"
#include "Manifest.h"
#include "SessionLogger.h"
#include "../core/PipelineConfig.h"
#include "../rendering/ToolExecutor.h"
#include "../rendering/SceneRenderer.h"
#include "../rendering/SequenceAssembler.h"
#include "../audio/SpeechBackend.h"
#include "../audio/NarrationSynthesizer.h"
#include "../source/PageSource.h"

/** What happened to one page during a run. */
struct PageOutcome
{
    enum class Status
    {
        Pending,
        Completed,
        Failed,
        Skipped
    };

    int index = 0;
    Status status = Status::Pending;
    PipelineTypes::AudioProvenance provenance = PipelineTypes::AudioProvenance::SilentFallback;
    bool audioReused = false;
    bool sceneReused = false;
    double durationSeconds = 0.0;
};

/** A failure recorded during a run. */
struct RunFailure
{
    PipelineError::Kind kind;
    juce::String stage;
    int pageIndex = 0;
    juce::String message;

    juce::String describe() const;
};

/** Summary of a finished run. */
struct RunReport
{
    PipelineTypes::RunState finalState = PipelineTypes::RunState::Init;
    juce::File outputFile;
    juce::File workingDirectory;
    std::vector<PageOutcome> pages;
    juce::StringArray warnings;
    std::vector<RunFailure> failures;
    double elapsedSeconds = 0.0;

    bool succeeded() const { return finalState == PipelineTypes::RunState::Done; }

    /** Multi-line human readable summary, as printed by the command line tool. */
    juce::String toString() const;
};

//==============================================================================
/**
 * Drives a document through the pipeline:
 * INIT -> SOURCED -> NARRATED -> RENDERED -> ASSEMBLED -> DONE, or FAILED.
 *
 * Narration and scene rendering run per page on a bounded thread pool, one
 * phase after the other; assembly waits for every page. Each page's audio
 * and scene live at a path derived from the page index, and artifacts left
 * by an earlier run of the same input are reused unless a clean run was
 * requested.
 *
 * A build holds a lock on its input for its whole duration, so a second
 * build of the same document fails immediately.
 */
class PipelineOrchestrator
{
public:
    /**
     * @param config       settings for the run (validated again by build())
     * @param toolExecutor executor to launch tools with; a default one is created when null
     * @param speechBackend speech service; when null one is created from config.speechBackend.
     *                      Ignored when config.speechBackend is "none".
     */
    PipelineOrchestrator(const PipelineConfig& config,
                         std::unique_ptr<ToolExecutor> toolExecutor = nullptr,
                         std::unique_ptr<SpeechBackend> speechBackend = nullptr);
    ~PipelineOrchestrator();

    /** Called with each state change and major step. May be called from worker threads. */
    void setStatusCallback(std::function<void(const juce::String&)> callback);

    /** Called with overall progress in [0, 1]. May be called from worker threads. */
    void setProgressCallback(std::function<void(double)> callback);

    /** Runs the whole pipeline on the calling thread and reports the outcome. */
    RunReport build();

    /** Stops the run: pages not yet started are skipped and running tools are killed. */
    void cancel();

    PipelineTypes::RunState getState() const { return state.load(); }
    const WorkingArea& getWorkingArea() const { return workingArea; }
    ToolExecutor& getToolExecutor() { return *toolExecutor; }

private:
    class PageJob;
    enum class Phase { Narrate, Render };

    void runStages();
    void runPagePhase(Phase phase);
    void narratePage(int position);
    void renderPage(int position);
    bool shouldSkipPages() const;

    void setState(PipelineTypes::RunState newState, const juce::String& message);
    void recordFailure(const PipelineError& error, const juce::String& stage);
    void addWarning(const juce::String& message);
    void markSkipped(int position);
    void pageFinished();
    void log(const juce::String& message) const;

    PipelineConfig config;
    WorkingArea workingArea;
    SessionLogger sessionLog;

    std::unique_ptr<ToolExecutor> toolExecutor;
    std::unique_ptr<SpeechBackend> speechBackend;
    std::unique_ptr<PageSource> pageSource;
    std::unique_ptr<NarrationSynthesizer> narrationSynthesizer;
    std::unique_ptr<SceneRenderer> sceneRenderer;
    std::unique_ptr<SequenceAssembler> sequenceAssembler;
    ManifestBuilder manifestBuilder;

    // Per-run data. Page workers only touch the slot of their own page.
    std::vector<PipelineTypes::Page> pages;
    std::vector<PipelineTypes::AudioAsset> audioAssets;
    std::vector<PipelineTypes::Scene> scenes;
    RunReport report;
    juce::CriticalSection reportLock;

    std::atomic<PipelineTypes::RunState> state { PipelineTypes::RunState::Init };
    std::atomic<bool> shouldCancel { false };
    std::atomic<bool> pageFailed { false };
    std::atomic<int> finishedUnits { 0 };
    int totalUnits = 1;

    std::function<void(const juce::String&)> statusCallback;
    std::function<void(double)> progressCallback;
    std::function<void(const juce::String&)> logFunction;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PipelineOrchestrator)
};
