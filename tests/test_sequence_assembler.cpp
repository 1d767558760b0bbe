#include <gtest/gtest.h>
#include "rendering/SequenceAssembler.h"
#include "pipeline/PipelineError.h"
#include "pipeline/WorkingArea.h"
#include "support/FakeToolExecutor.h"
#include "support/TestWorkspace.h"

namespace
{

class SequenceAssemblerTest : public ::testing::Test
{
protected:
    PipelineTypes::Scene writeScene(int index, double duration, int width = 1920)
    {
        juce::StringPairArray properties;
        properties.set("duration", juce::String(duration, 6));
        properties.set("video", "h264");
        properties.set("width", juce::String(width));
        properties.set("height", "1080");
        properties.set("fps", "30");
        properties.set("pix_fmt", "yuv420p");
        properties.set("audio", "aac");
        properties.set("sample_rate", "44100");
        properties.set("channels", "2");

        PipelineTypes::Scene scene;
        scene.index = index;
        scene.videoPath = workspace.file("scenes").getChildFile(juce::String::formatted("page%03d.mp4", index));
        scene.durationSeconds = duration;
        EXPECT_TRUE(FakeToolExecutor::writeFakeMedia(scene.videoPath, properties));
        return scene;
    }

    juce::File concatList() const { return workspace.file("concat_list.txt"); }
    juce::File output() const     { return workspace.file("out/output.mp4"); }

    TestWorkspace workspace;
    FakeToolExecutor tools;
    SequenceAssembler assembler { &tools };
};

TEST_F(SequenceAssemblerTest, ConcatenatesInPageOrder)
{
    assembler.assemble({ writeScene(3, 1.0), writeScene(1, 2.0), writeScene(2, 3.0) }, concatList(), output());

    EXPECT_EQ(tools.getLastConcatOrder(), juce::StringArray({ "page001.mp4", "page002.mp4", "page003.mp4" }));
    EXPECT_NEAR(tools.getFileDuration(output()), 6.0, 0.001);
    EXPECT_FALSE(WorkingArea::partialFileFor(output()).exists());

    juce::StringArray lines;
    lines.addLines(concatList().loadFileAsString().trim());
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], "file '" + workspace.file("scenes/page001.mp4").getFullPathName() + "'");
}

TEST_F(SequenceAssemblerTest, ConcatListEscapesQuotes)
{
    PipelineTypes::Scene scene;
    scene.videoPath = juce::File("/work/it's here/page001.mp4");

    EXPECT_EQ(SequenceAssembler::buildConcatList({ scene }), "file '/work/it'\\''s here/page001.mp4'\n");
}

TEST_F(SequenceAssemblerTest, RetriesWithShiftedTimestamps)
{
    tools.failFirstConcatAttempt();

    assembler.assemble({ writeScene(1, 2.0), writeScene(2, 2.0) }, concatList(), output());

    EXPECT_TRUE(output().existsAsFile());
    EXPECT_EQ(tools.getNumRuns("ffmpeg"), 2);
    EXPECT_TRUE(tools.getCommandHistory()[tools.getCommandHistory().size() - 1].contains("-avoid_negative_ts make_zero"));
}

TEST_F(SequenceAssemblerTest, MismatchedScenesAreRejected)
{
    try
    {
        assembler.assemble({ writeScene(1, 2.0), writeScene(2, 2.0, 1280) }, concatList(), output());
        FAIL() << "assemble accepted scenes of different sizes";
    }
    catch (const PipelineError& error)
    {
        EXPECT_EQ(error.getKind(), PipelineError::Kind::Assembly);
        EXPECT_EQ(error.getPageIndex(), 2);
    }

    EXPECT_EQ(tools.getNumRuns("ffmpeg"), 0);
    EXPECT_FALSE(output().exists());
}

TEST_F(SequenceAssemblerTest, PreconditionsAreChecked)
{
    EXPECT_THROW(assembler.assemble({}, concatList(), output()), PipelineError);
    EXPECT_THROW(assembler.assemble({ writeScene(1, 1.0), writeScene(1, 1.0) }, concatList(), output()), PipelineError);

    PipelineTypes::Scene missing;
    missing.index = 2;
    missing.videoPath = workspace.file("scenes/page002.mp4");
    EXPECT_THROW(assembler.assemble({ writeScene(1, 1.0), missing }, concatList(), output()), PipelineError);

    EXPECT_EQ(tools.getNumRuns("ffmpeg"), 0);
}

TEST_F(SequenceAssemblerTest, FailureLeavesNoOutput)
{
    tools.failCommandsMatching("ffmpeg", "concat");

    EXPECT_THROW(assembler.assemble({ writeScene(1, 1.0) }, concatList(), output()), PipelineError);
    EXPECT_FALSE(output().exists());
    EXPECT_FALSE(WorkingArea::partialFileFor(output()).exists());
}

} // namespace
