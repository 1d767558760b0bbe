#include <gtest/gtest.h>
#include "pipeline/PipelineOrchestrator.h"
#include "support/DeckFixtures.h"
#include "support/FakeSpeechBackend.h"
#include "support/FakeToolExecutor.h"
#include "support/TestWorkspace.h"

namespace
{

using RunState = PipelineTypes::RunState;
using Provenance = PipelineTypes::AudioProvenance;

/** Runs builds against simulated tools; each build gets fresh fakes that stay inspectable. */
class OrchestratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        input = workspace.writeInput("talk.pdf");
        config = workspace.makeConfig(input);
        pageTexts = { "Welcome", "Agenda", "Thanks" };
    }

    RunReport build(std::function<void(FakeToolExecutor&)> prepareTools = nullptr)
    {
        auto tools = std::make_unique<FakeToolExecutor>();
        tools->setDocumentPages(pageTexts);

        if (prepareTools)
            prepareTools(*tools);

        lastTools = tools.get();

        std::unique_ptr<SpeechBackend> backend;
        if (config.speechBackend != "none")
        {
            auto fake = std::make_unique<FakeSpeechBackend>(2.5);
            if (failingSpeechText.isNotEmpty())
                fake->setFailingText(failingSpeechText);
            lastSpeech = fake.get();
            backend = std::move(fake);
        }

        orchestrator = std::make_unique<PipelineOrchestrator>(config, std::move(tools), std::move(backend));
        orchestrator->setStatusCallback([this](const juce::String& status)
        {
            {
                const juce::ScopedLock sl(statusLock);
                statuses.add(status);
            }

            // Status callbacks run on the building thread
            if (cancelWhenSourced && status.startsWith("SOURCED"))
                orchestrator->cancel();
        });
        orchestrator->setProgressCallback([this](double progress)
        {
            const juce::ScopedLock sl(statusLock);
            highestProgress = juce::jmax(highestProgress, progress);
        });

        highestProgress = 0.0;
        return orchestrator->build();
    }

    const WorkingArea& area() const { return orchestrator->getWorkingArea(); }

    TestWorkspace workspace;
    juce::File input;
    PipelineConfig config;
    juce::StringArray pageTexts;
    juce::String failingSpeechText;

    std::unique_ptr<PipelineOrchestrator> orchestrator;
    FakeToolExecutor* lastTools = nullptr;
    FakeSpeechBackend* lastSpeech = nullptr;

    juce::CriticalSection statusLock;
    juce::StringArray statuses;
    double highestProgress = 0.0;
    bool cancelWhenSourced = false;
};

/** Process logger standing in for the CLI's file logger. */
class RecordingLogger : public juce::Logger
{
public:
    juce::StringArray getLines() const
    {
        const juce::ScopedLock sl(lock);
        return lines;
    }

protected:
    void logMessage(const juce::String& message) override
    {
        const juce::ScopedLock sl(lock);
        lines.add(message);
    }

private:
    juce::CriticalSection lock;
    juce::StringArray lines;
};

/** Position of the first finished ffmpeg command mentioning the text, or -1. */
int finishedPosition(const juce::StringArray& completed, const juce::String& text)
{
    for (int i = 0; i < completed.size(); ++i)
        if (completed[i].startsWith("ffmpeg ") && completed[i].contains(text))
            return i;

    return -1;
}

//==============================================================================
TEST_F(OrchestratorTest, OfflineBuildProducesTheVideo)
{
    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(report.finalState, RunState::Done);
    EXPECT_EQ(report.outputFile, workspace.file("output/output.mp4"));
    EXPECT_TRUE(report.outputFile.existsAsFile());
    EXPECT_TRUE(report.failures.empty());

    // Every page is narrated with 3 seconds of silence
    EXPECT_NEAR(lastTools->getFileDuration(report.outputFile), 9.0, 0.01);
    EXPECT_EQ(lastTools->getLastConcatOrder(), juce::StringArray({ "page001.mp4", "page002.mp4", "page003.mp4" }));

    ASSERT_EQ(report.pages.size(), 3u);
    for (const auto& page : report.pages)
    {
        EXPECT_EQ(page.status, PageOutcome::Status::Completed);
        EXPECT_EQ(page.provenance, Provenance::SilentFallback);
        EXPECT_FALSE(page.audioReused);
    }

    EXPECT_TRUE(area().audioFile(2, Provenance::SilentFallback).existsAsFile());
    EXPECT_TRUE(area().sceneFile(3).existsAsFile());
    EXPECT_TRUE(area().getManifestFile().existsAsFile());
    EXPECT_TRUE(area().getConfigSnapshotFile().existsAsFile());
    EXPECT_TRUE(area().getLogsDirectory().getChildFile("session.log").existsAsFile());
    EXPECT_TRUE(area().getLogsDirectory().getChildFile("tools.log").existsAsFile());
}

TEST_F(OrchestratorTest, StatesAdvanceInOrder)
{
    double lastProgress = 0.0;
    auto tools = std::make_unique<FakeToolExecutor>();
    tools->setDocumentPages(pageTexts);

    PipelineOrchestrator pipeline(config, std::move(tools));
    juce::StringArray states;
    juce::CriticalSection progressLock;

    pipeline.setStatusCallback([&states](const juce::String& status)
    {
        states.add(status.upToFirstOccurrenceOf(":", false, false));
    });
    pipeline.setProgressCallback([&lastProgress, &progressLock](double progress)
    {
        const juce::ScopedLock sl(progressLock);
        lastProgress = juce::jmax(lastProgress, progress);
    });

    const RunReport report = pipeline.build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(states, juce::StringArray({ "SOURCED", "NARRATED", "RENDERED", "ASSEMBLED", "DONE" }));
    EXPECT_DOUBLE_EQ(lastProgress, 1.0);
    EXPECT_EQ(pipeline.getState(), RunState::Done);
}

TEST_F(OrchestratorTest, EmptyPagesAreNarratedWithPlaceholders)
{
    config.speechBackend = "google";
    pageTexts = { "", "Hello world", "" };

    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();

    juce::StringArray requests = lastSpeech->getRequests();
    requests.sort(false);
    EXPECT_EQ(requests, juce::StringArray({ "Hello world", "Page 1", "Page 3" }));
    EXPECT_NEAR(lastTools->getFileDuration(report.outputFile), 7.5, 0.01);
}

TEST_F(OrchestratorTest, EmptyPagesAreSilentWithoutPlaceholders)
{
    config.speechBackend = "google";
    config.narratePlaceholders = false;
    pageTexts = { "", "Hello world", "" };

    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(lastSpeech->getRequests(), juce::StringArray({ "Hello world" }));

    EXPECT_EQ(report.pages[0].provenance, Provenance::SilentFallback);
    EXPECT_EQ(report.pages[1].provenance, Provenance::Synthesized);
    EXPECT_EQ(report.pages[2].provenance, Provenance::SilentFallback);

    // 3.0 + 2.5 + 3.0 seconds, in page order
    EXPECT_NEAR(lastTools->getFileDuration(report.outputFile), 8.5, 0.01);
    EXPECT_EQ(lastTools->getLastConcatOrder(), juce::StringArray({ "page001.mp4", "page002.mp4", "page003.mp4" }));
}

TEST_F(OrchestratorTest, SpeechFailureFallsBackWithoutFailingTheRun)
{
    config.speechBackend = "google";
    failingSpeechText = "Agenda";

    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(report.pages[0].provenance, Provenance::Synthesized);
    EXPECT_EQ(report.pages[1].provenance, Provenance::SilentFallback);
    EXPECT_EQ(report.pages[2].provenance, Provenance::Synthesized);
}

TEST_F(OrchestratorTest, MoreImagesThanTextsStillBuilds)
{
    pageTexts = { "One", "Two", "Three" };

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.setToolAvailable("pdfinfo", false);
        tools.setRasterizedImageCount(4);
    });

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(report.pages.size(), 4u);
    EXPECT_EQ(lastTools->getLastConcatOrder().size(), 4);
    EXPECT_TRUE(report.warnings.joinIntoString("\n").contains("Page count mismatch"));
}

TEST_F(OrchestratorTest, SecondRunReusesEveryArtifact)
{
    const RunReport first = build();
    ASSERT_TRUE(first.succeeded()) << first.toString();

    const juce::File firstOutput = workspace.file("first.mp4");
    ASSERT_TRUE(first.outputFile.copyFileTo(firstOutput));

    const RunReport second = build();
    ASSERT_TRUE(second.succeeded()) << second.toString();

    for (const auto& page : second.pages)
    {
        EXPECT_TRUE(page.audioReused);
        EXPECT_TRUE(page.sceneReused);
    }

    EXPECT_EQ(lastTools->getNumRuns("pdftoppm"), 0);
    EXPECT_EQ(lastTools->getNumRuns("ffmpeg"), 1);   // the concatenation only
    EXPECT_TRUE(firstOutput.hasIdenticalContentTo(second.outputFile));
}

TEST_F(OrchestratorTest, SceneIsRebuiltWhenItsAudioIsNot)
{
    ASSERT_TRUE(build().succeeded());
    ASSERT_TRUE(area().audioFile(2, Provenance::SilentFallback).deleteFile());

    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_TRUE(report.pages[0].sceneReused);
    EXPECT_FALSE(report.pages[1].audioReused);
    EXPECT_FALSE(report.pages[1].sceneReused);
    EXPECT_TRUE(report.pages[2].sceneReused);
    EXPECT_EQ(lastTools->getNumRuns("ffmpeg"), 2);
}

TEST_F(OrchestratorTest, CleanRunRegeneratesEverything)
{
    ASSERT_TRUE(build().succeeded());

    config.clean = true;
    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    for (const auto& page : report.pages)
        EXPECT_FALSE(page.audioReused);

    EXPECT_EQ(lastTools->getNumRuns("pdftoppm"), 1);
    EXPECT_EQ(lastTools->getNumRuns("ffmpeg"), 4);
}

TEST_F(OrchestratorTest, DeckWithoutConverterFailsBeforePageWork)
{
    const juce::File deck = workspace.file("input/slides.pptx");
    ASSERT_TRUE(DeckFixtures::writeDeck(deck, { "Intro", "Outro" }));
    config.inputFile = deck;

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.setToolAvailable("soffice", false);
        tools.setToolAvailable("libreoffice", false);
    });

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::MissingDependency);
    EXPECT_TRUE(report.pages.empty());
    EXPECT_EQ(lastTools->getNumRuns("pdftoppm"), 0);
    EXPECT_EQ(lastTools->getNumRuns("ffmpeg"), 0);
    EXPECT_FALSE(report.outputFile.exists());
}

TEST_F(OrchestratorTest, DeckIsComposedWhenFallbackIsAllowed)
{
    const juce::File deck = workspace.file("input/slides.pptx");
    ASSERT_TRUE(DeckFixtures::writeDeck(deck, { "Intro", "", "Outro" }));
    config.inputFile = deck;
    config.allowCompositionFallback = true;
    config.width = 640;
    config.height = 360;

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.setToolAvailable("soffice", false);
        tools.setToolAvailable("libreoffice", false);
    });

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_EQ(report.pages.size(), 3u);
    EXPECT_EQ(lastTools->getNumRuns("pdftoppm"), 0);
    EXPECT_EQ(lastTools->getStreamParameters(report.outputFile).width, 640);
}

TEST_F(OrchestratorTest, PageFailureKeepsArtifactsAndSkipsAssembly)
{
    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.failCommandsMatching("ffmpeg", "page002");
    });

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::SceneRender);
    EXPECT_EQ(report.failures[0].pageIndex, 2);

    EXPECT_EQ(report.pages[0].status, PageOutcome::Status::Completed);
    EXPECT_EQ(report.pages[1].status, PageOutcome::Status::Failed);
    EXPECT_EQ(report.pages[2].status, PageOutcome::Status::Completed);

    EXPECT_TRUE(area().sceneFile(1).existsAsFile());
    EXPECT_FALSE(area().sceneFile(2).exists());
    EXPECT_TRUE(area().sceneFile(3).existsAsFile());
    EXPECT_TRUE(area().getManifestFile().existsAsFile());
    EXPECT_FALSE(report.outputFile.exists());
    EXPECT_TRUE(lastTools->getLastConcatOrder().isEmpty());
}

TEST_F(OrchestratorTest, StopOnErrorSkipsRemainingPages)
{
    config.keepGoing = false;
    config.maxConcurrentPages = 1;

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.failCommandsMatching("ffmpeg", "page002");
    });

    EXPECT_EQ(report.finalState, RunState::Failed);
    EXPECT_EQ(report.pages[1].status, PageOutcome::Status::Failed);
    EXPECT_EQ(report.pages[2].status, PageOutcome::Status::Skipped);
    EXPECT_FALSE(area().sceneFile(3).exists());
    EXPECT_DOUBLE_EQ(highestProgress, 1.0);
}

TEST_F(OrchestratorTest, CancelledBuildFailsAndSkipsPages)
{
    cancelWhenSourced = true;

    const RunReport report = build();

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_FALSE(report.failures.empty());
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::WorkingArea);

    for (const auto& page : report.pages)
        EXPECT_EQ(page.status, PageOutcome::Status::Skipped);

    EXPECT_EQ(lastTools->getNumRuns("ffmpeg"), 0);
    EXPECT_DOUBLE_EQ(highestProgress, 1.0);
}

TEST_F(OrchestratorTest, ConcatOrderIgnoresCompletionOrder)
{
    config.maxConcurrentPages = 3;

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.delayCommandsMatching("ffmpeg", "page001", 300);
    });

    ASSERT_TRUE(report.succeeded()) << report.toString();

    const juce::StringArray completed = lastTools->getCompletedCommands();
    const int firstPage = finishedPosition(completed, "page001");
    const int lastPage = finishedPosition(completed, "page003");
    ASSERT_GE(firstPage, 0);
    ASSERT_GE(lastPage, 0);
    EXPECT_LT(lastPage, firstPage);

    EXPECT_EQ(lastTools->getLastConcatOrder(), juce::StringArray({ "page001.mp4", "page002.mp4", "page003.mp4" }));
}

TEST_F(OrchestratorTest, SessionLogKeepsEveryLineFromConcurrentPages)
{
    config.maxConcurrentPages = 4;
    pageTexts.clear();
    for (int i = 1; i <= 8; ++i)
        pageTexts.add("Page text " + juce::String(i));

    juce::Logger* const processLogger = juce::Logger::getCurrentLogger();
    RecordingLogger recorder;
    juce::Logger::setCurrentLogger(&recorder);

    const RunReport report = build();
    juce::Logger::setCurrentLogger(processLogger);

    ASSERT_TRUE(report.succeeded()) << report.toString();

    const juce::String session = area().getLogsDirectory().getChildFile("session.log").loadFileAsString();
    int pipelineLines = 0;

    for (const auto& line : recorder.getLines())
    {
        if (!line.startsWith("[PIPELINE] "))
            continue;

        ++pipelineLines;
        EXPECT_TRUE(session.contains(" | " + line + "\n")) << line;
    }

    EXPECT_GT(pipelineLines, 16);
    EXPECT_EQ(juce::Logger::getCurrentLogger(), processLogger);
}

TEST_F(OrchestratorTest, CachedSceneIsNotReusedWithoutItsImage)
{
    ASSERT_TRUE(build().succeeded());
    ASSERT_TRUE(area().pageImageFile(3).deleteFile());

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.setRasterizedImageCount(2);
    });

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::PageExtraction);
    EXPECT_EQ(report.failures[0].pageIndex, 3);
    EXPECT_EQ(report.pages[2].status, PageOutcome::Status::Failed);
    EXPECT_TRUE(report.pages[0].sceneReused);
}

TEST_F(OrchestratorTest, MissingImageFailsItsPage)
{
    pageTexts = { "One", "Two", "Three" };

    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.setRasterizedImageCount(2);
    });

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::PageExtraction);
    EXPECT_EQ(report.failures[0].pageIndex, 3);
    EXPECT_TRUE(area().sceneFile(2).existsAsFile());
}

TEST_F(OrchestratorTest, MissingBackgroundIsOnlyAWarning)
{
    config.backgroundImage = workspace.file("nowhere.png");

    const RunReport report = build();

    ASSERT_TRUE(report.succeeded()) << report.toString();
    EXPECT_TRUE(report.warnings.joinIntoString("\n").contains("Background image not found"));
}

TEST_F(OrchestratorTest, InvalidConfigurationFailsImmediately)
{
    config.fps = 0;

    const RunReport report = build();

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::Configuration);
    EXPECT_TRUE(lastTools->getCommandHistory().isEmpty());
}

TEST_F(OrchestratorTest, ConcurrentBuildOfSameInputIsRefused)
{
    RunLock held(WorkingArea::runKeyFor(input));
    ASSERT_TRUE(held.tryAcquire());

    const RunReport report = build();

    EXPECT_EQ(report.finalState, RunState::Failed);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].kind, PipelineError::Kind::WorkingArea);
    EXPECT_TRUE(lastTools->getCommandHistory().isEmpty());

    held.release();
    EXPECT_TRUE(build().succeeded());
}

TEST_F(OrchestratorTest, ReportSummarisesTheRun)
{
    const RunReport report = build([](FakeToolExecutor& tools)
    {
        tools.failCommandsMatching("ffmpeg", "page002");
    });

    const juce::String text = report.toString();

    EXPECT_TRUE(text.contains("Result: FAILED"));
    EXPECT_TRUE(text.contains("page 002: FAILED"));
    EXPECT_TRUE(text.contains("FAILED: SceneRenderError during scene rendering (page 2)"));
}

} // namespace
