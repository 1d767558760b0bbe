#include <gtest/gtest.h>
#include "pipeline/WorkingArea.h"
#include "support/TestWorkspace.h"

namespace
{

TEST(WorkingAreaTest, RunKeyIsStablePerPath)
{
    const juce::File a("/decks/Quarterly Review.pptx");
    const juce::File b("/other/Quarterly Review.pptx");

    EXPECT_EQ(WorkingArea::runKeyFor(a), WorkingArea::runKeyFor(a));
    EXPECT_NE(WorkingArea::runKeyFor(a), WorkingArea::runKeyFor(b));
    EXPECT_TRUE(WorkingArea::runKeyFor(a).startsWith("Quarterly_Review_"));
    EXPECT_FALSE(WorkingArea::runKeyFor(a).containsChar(' '));
}

TEST(WorkingAreaTest, PerPagePathsDependOnlyOnIndex)
{
    TestWorkspace workspace;
    const WorkingArea area(workspace.file("work"), workspace.file("talk.pdf"));

    EXPECT_EQ(WorkingArea::pageFileStem(7), "page007");
    EXPECT_EQ(area.pageImageFile(3), area.getPagesDirectory().getChildFile("page003.png"));
    EXPECT_EQ(area.audioFile(3, PipelineTypes::AudioProvenance::Synthesized).getFileName(), "page003.mp3");
    EXPECT_EQ(area.audioFile(3, PipelineTypes::AudioProvenance::SilentFallback).getFileName(), "page003.wav");
    EXPECT_EQ(area.sceneFile(12), area.getScenesDirectory().getChildFile("page012.mp4"));
    EXPECT_TRUE(area.getRunDirectory().isAChildOf(workspace.file("work")));
}

TEST(WorkingAreaTest, CreateAndClean)
{
    TestWorkspace workspace;
    const WorkingArea area(workspace.file("work"), workspace.file("talk.pdf"));

    ASSERT_TRUE(area.create().wasOk());
    EXPECT_TRUE(area.getAudioDirectory().isDirectory());
    EXPECT_TRUE(area.getLogsDirectory().isDirectory());

    ASSERT_TRUE(area.sceneFile(1).replaceWithText("scene"));
    ASSERT_TRUE(area.clean().wasOk());
    EXPECT_FALSE(area.getRunDirectory().exists());

    // Cleaning a missing tree is not an error
    EXPECT_TRUE(area.clean().wasOk());
}

TEST(WorkingAreaTest, FindExistingAudioPrefersSynthesizedSpeech)
{
    TestWorkspace workspace;
    const WorkingArea area(workspace.file("work"), workspace.file("talk.pdf"));
    ASSERT_TRUE(area.create().wasOk());

    PipelineTypes::AudioProvenance provenance = PipelineTypes::AudioProvenance::Synthesized;
    EXPECT_EQ(area.findExistingAudio(1, provenance), juce::File());

    ASSERT_TRUE(area.audioFile(1, PipelineTypes::AudioProvenance::SilentFallback).replaceWithText("RIFF"));
    EXPECT_EQ(area.findExistingAudio(1, provenance).getFileName(), "page001.wav");
    EXPECT_EQ(provenance, PipelineTypes::AudioProvenance::SilentFallback);

    ASSERT_TRUE(area.audioFile(1, PipelineTypes::AudioProvenance::Synthesized).replaceWithText("ID3"));
    EXPECT_EQ(area.findExistingAudio(1, provenance).getFileName(), "page001.mp3");
    EXPECT_EQ(provenance, PipelineTypes::AudioProvenance::Synthesized);

    // An empty file left by an interrupted write does not count
    ASSERT_TRUE(area.audioFile(2, PipelineTypes::AudioProvenance::Synthesized).create().wasOk());
    EXPECT_EQ(area.findExistingAudio(2, provenance), juce::File());
}

TEST(WorkingAreaTest, PartialFilesKeepTheirExtension)
{
    const juce::File target("/work/scenes/page001.mp4");
    const juce::File partial = WorkingArea::partialFileFor(target);

    EXPECT_EQ(partial.getFileName(), "page001.partial.mp4");
    EXPECT_EQ(partial.getParentDirectory(), target.getParentDirectory());
}

TEST(WorkingAreaTest, CommitPartialRequiresContent)
{
    TestWorkspace workspace;
    const juce::File target = workspace.file("page001.mp4");
    const juce::File partial = WorkingArea::partialFileFor(target);

    ASSERT_TRUE(partial.create().wasOk());
    EXPECT_FALSE(WorkingArea::commitPartial(partial, target));
    EXPECT_FALSE(target.exists());

    ASSERT_TRUE(partial.replaceWithText("video"));
    EXPECT_TRUE(WorkingArea::commitPartial(partial, target));
    EXPECT_FALSE(partial.exists());
    EXPECT_EQ(target.loadFileAsString(), "video");
}

TEST(RunLockTest, SecondLockOnSameKeyFails)
{
    const juce::String key = WorkingArea::runKeyFor(juce::File("/decks/locked.pdf"));

    RunLock first(key);
    ASSERT_TRUE(first.tryAcquire());

    {
        RunLock second(key);
        EXPECT_FALSE(second.tryAcquire());
        EXPECT_FALSE(second.isHeld());
    }

    RunLock other(WorkingArea::runKeyFor(juce::File("/decks/other.pdf")));
    EXPECT_TRUE(other.tryAcquire());

    first.release();

    RunLock third(key);
    EXPECT_TRUE(third.tryAcquire());
}

} // namespace
