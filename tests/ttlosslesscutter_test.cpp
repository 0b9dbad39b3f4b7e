#include <gtest/gtest.h>

#include "ttfakes.h"

#include "../common/ttexception.h"
#include "../common/ttlosslesssettings.h"
#include "../extern/ttlosslesscutter.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

class TTLosslessCutterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        source = tempDir.filePath("source.mp4");
        output = tempDir.filePath("clip.mp4");

        QFile file(source);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("source media payload");
    }

    TTExtractionOutcome extract(double start, double end, bool smartCut = true)
    {
        TTCutRequest      request(source, start, end, output, false, smartCut);
        TTAlignmentResult alignment = TTCutAlignment::evaluate(request, keyframes);
        TTLosslessCutter  cutter(settings, runner, probe);
        return cutter.extract(request, keyframes, alignment);
    }

    // Handler that lets every ffmpeg call succeed unless reject matches
    void acceptFFmpegExcept(const std::function<bool(const QStringList&)>& reject)
    {
        runner.handler = [reject](const QString& program, const QStringList& args) {
            if (program != "ffmpeg" || reject(args))
                return TTFakeProcessRunner::failure(1);
            return TTFakeProcessRunner::writeOutput(args);
        };
    }

    static bool containsArgs(const QStringList& args, const QString& sequence)
    {
        return args.join(' ').contains(sequence);
    }

    bool leftoverTempDirs() const
    {
        return !QDir(tempDir.path()).entryList(QStringList() << ".ttlossless-*",
                    QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot).isEmpty();
    }

    QTemporaryDir       tempDir;
    QString             source;
    QString             output;
    TTKeyframeList      keyframes = TTKeyframeList() << 0.0 << 2.0 << 4.0 << 6.0 << 8.0;
    TTLosslessSettings  settings;
    TTFakeProcessRunner runner;
    TTFakeMediaProbe    probe;
};

TEST_F(TTLosslessCutterTest, AlignedCutUsesStreamCopy)
{
    acceptFFmpegExcept([](const QStringList&) { return false; });

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_STREAM_COPY);
    EXPECT_TRUE(outcome.qualityPreserved());
    EXPECT_TRUE(outcome.keyframeAligned());
    EXPECT_TRUE(outcome.warnings().isEmpty());
    EXPECT_GT(outcome.processingTime(), 0.0);
    EXPECT_GT(outcome.outputFileSize(), 0);
    EXPECT_EQ(outcome.outputFileSize(), QFileInfo(output).size());
    EXPECT_FALSE(leftoverTempDirs());

    ASSERT_EQ(runner.ffmpegCalls().size(), 1);
    const TTFakeProcessRunner::Call& call = runner.ffmpegCalls().first();
    EXPECT_TRUE(containsArgs(call.args, "-ss 2.000000 -i " + source + " -t 2.000000"));
    EXPECT_TRUE(containsArgs(call.args, "-c copy -map 0 -avoid_negative_ts make_zero"));
    EXPECT_TRUE(containsArgs(call.args, "-movflags +faststart"));
    EXPECT_EQ(call.timeoutMs, settings.streamCopyTimeoutMs);
}

TEST_F(TTLosslessCutterTest, UnalignedCutUsesSmartCut)
{
    acceptFFmpegExcept([](const QStringList&) { return false; });

    TTExtractionOutcome outcome = extract(1.5, 3.5);

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_SMART_CUT);
    EXPECT_TRUE(outcome.qualityPreserved());
    EXPECT_FALSE(outcome.keyframeAligned());
    EXPECT_FALSE(outcome.warnings().isEmpty());
    EXPECT_TRUE(QFileInfo(output).size() > 0);

    ASSERT_EQ(runner.ffmpegCalls().size(), 1);
    const TTFakeProcessRunner::Call& call = runner.ffmpegCalls().first();
    EXPECT_TRUE(containsArgs(call.args, "-ss 0.000000 -i " + source + " -t 4.000000"));
    EXPECT_TRUE(containsArgs(call.args,
        "[0:v:0]trim=start=1.500000:end=3.500000,setpts=PTS-STARTPTS[v];"
        "[0:a:0]atrim=start=1.500000:end=3.500000,asetpts=PTS-STARTPTS[a]"));
    EXPECT_TRUE(containsArgs(call.args, "-c:v libx264"));
    EXPECT_TRUE(containsArgs(call.args, "-crf 18"));
    EXPECT_TRUE(containsArgs(call.args, "-c:a aac"));
    EXPECT_EQ(call.timeoutMs, settings.smartCutTimeoutMs);
}

TEST_F(TTLosslessCutterTest, SmartCutDisabledFallsThroughToReencode)
{
    acceptFFmpegExcept([](const QStringList&) { return false; });

    TTExtractionOutcome outcome = extract(1.5, 3.5, false);

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_RE_ENCODED);
    EXPECT_FALSE(outcome.qualityPreserved());
    EXPECT_FALSE(outcome.warnings().isEmpty());

    ASSERT_EQ(runner.ffmpegCalls().size(), 1);
    const TTFakeProcessRunner::Call& call = runner.ffmpegCalls().first();
    EXPECT_FALSE(call.args.contains("-filter_complex"));
    EXPECT_TRUE(containsArgs(call.args, "-ss 1.500000 -i " + source + " -t 2.000000"));
    EXPECT_TRUE(containsArgs(call.args, "-c:v libx264 -preset medium -crf 18"));
    EXPECT_TRUE(containsArgs(call.args, "-c:a aac -b:a 192k"));
    EXPECT_EQ(call.timeoutMs, settings.reencodeTimeoutMs);
}

TEST_F(TTLosslessCutterTest, FailedStreamCopyFallsThroughToSmartCut)
{
    acceptFFmpegExcept([](const QStringList& args) { return args.contains("copy"); });

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_EQ(outcome.methodUsed(), METHOD_SMART_CUT);
    EXPECT_TRUE(outcome.keyframeAligned());
    EXPECT_TRUE(outcome.warnings().filter("Stream copy failed").size() == 1);
    EXPECT_EQ(runner.ffmpegCalls().size(), 2);
}

TEST_F(TTLosslessCutterTest, SmartCutRetriesWithDirectSeek)
{
    acceptFFmpegExcept([](const QStringList& args) { return args.contains("-filter_complex"); });

    TTExtractionOutcome outcome = extract(1.5, 3.5);

    EXPECT_EQ(outcome.methodUsed(), METHOD_SMART_CUT);
    ASSERT_EQ(runner.ffmpegCalls().size(), 2);

    const TTFakeProcessRunner::Call& retry = runner.ffmpegCalls().at(1);
    EXPECT_TRUE(containsArgs(retry.args, "-ss 1.500000 -i " + source + " -t 2.000000"));
    EXPECT_TRUE(containsArgs(retry.args, "-crf 18"));
    EXPECT_EQ(retry.timeoutMs, settings.smartCutTimeoutMs);
}

TEST_F(TTLosslessCutterTest, NoKeyframesSkipsSmartCut)
{
    keyframes.clear();
    acceptFFmpegExcept([](const QStringList&) { return false; });

    TTExtractionOutcome outcome = extract(1.5, 3.5);

    EXPECT_EQ(outcome.methodUsed(), METHOD_RE_ENCODED);
    EXPECT_FALSE(outcome.keyframeAligned());
}

TEST_F(TTLosslessCutterTest, FallbackEncoderAfterReencodeFails)
{
    acceptFFmpegExcept([](const QStringList& args) { return !containsArgs(args, "-c:v mpeg4 -q:v 2"); });

    TTExtractionOutcome outcome = extract(1.5, 3.5);

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_FALLBACK_ENCODED);
    EXPECT_FALSE(outcome.qualityPreserved());
    EXPECT_FALSE(outcome.warnings().filter("quality loss possible").isEmpty());
    EXPECT_EQ(runner.ffmpegCalls().last().timeoutMs, settings.fallbackTimeoutMs);
}

TEST_F(TTLosslessCutterTest, FallbackWithoutCodecSelection)
{
    acceptFFmpegExcept([](const QStringList& args) {
        return args.contains("-c") || args.contains("-c:v") || args.contains("-c:a");
    });

    TTExtractionOutcome outcome = extract(1.5, 3.5);

    EXPECT_EQ(outcome.methodUsed(), METHOD_FALLBACK_ENCODED);
    EXPECT_TRUE(QFileInfo(output).size() > 0);
}

TEST_F(TTLosslessCutterTest, TotalFailureLeavesNoOutput)
{
    QFile stale(output);
    ASSERT_TRUE(stale.open(QIODevice::WriteOnly));
    stale.write("stale clip");
    stale.close();

    runner.handler = [](const QString&, const QStringList&) {
        return TTFakeProcessRunner::failure(1);
    };

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_FALSE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_FAILED);
    EXPECT_FALSE(outcome.qualityPreserved());
    EXPECT_TRUE(outcome.keyframeAligned());
    EXPECT_EQ(outcome.outputFileSize(), 0);
    EXPECT_GT(outcome.processingTime(), 0.0);
    EXPECT_FALSE(QFileInfo::exists(output));
    EXPECT_FALSE(leftoverTempDirs());
    EXPECT_FALSE(outcome.warnings().filter("All extraction methods failed").isEmpty());
}

TEST_F(TTLosslessCutterTest, EmptyOutputCountsAsFailure)
{
    runner.handler = [](const QString&, const QStringList& args) {
        if (args.contains("copy"))
            return TTFakeProcessRunner::writeOutput(args, QByteArray());
        return TTFakeProcessRunner::writeOutput(args);
    };

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_EQ(outcome.methodUsed(), METHOD_SMART_CUT);
    EXPECT_FALSE(outcome.warnings().filter("no output produced").isEmpty());
}

TEST_F(TTLosslessCutterTest, TimeoutCountsAsFailure)
{
    runner.handler = [](const QString&, const QStringList& args) {
        if (args.contains("copy"))
            return TTFakeProcessRunner::timeout();
        return TTFakeProcessRunner::writeOutput(args);
    };

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_EQ(outcome.methodUsed(), METHOD_SMART_CUT);
    EXPECT_FALSE(outcome.warnings().filter("timed out").isEmpty());
}

TEST_F(TTLosslessCutterTest, SourceWithoutAudio)
{
    probe.mediaInfo.audioCodec.clear();
    acceptFFmpegExcept([](const QStringList&) { return false; });

    extract(1.5, 3.5);

    ASSERT_EQ(runner.ffmpegCalls().size(), 1);
    const QStringList& args = runner.ffmpegCalls().first().args;
    EXPECT_FALSE(containsArgs(args, "atrim"));
    EXPECT_FALSE(args.contains("[a]"));
    EXPECT_TRUE(args.contains("-an"));
}

TEST_F(TTLosslessCutterTest, MissingSourceFails)
{
    source = tempDir.filePath("missing.mp4");

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(runner.calls.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(output));
}

TEST_F(TTLosslessCutterTest, MissingSourceRemovesStaleOutput)
{
    source = tempDir.filePath("missing.mp4");
    QFile stale(output);
    ASSERT_TRUE(stale.open(QIODevice::WriteOnly));
    stale.write("left over from an earlier run");
    stale.close();

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(runner.calls.isEmpty());
    EXPECT_FALSE(QFileInfo::exists(output));
}

TEST_F(TTLosslessCutterTest, InvalidRequestThrowsBeforeAnyTool)
{
    TTLosslessCutter cutter(settings, runner, probe);

    EXPECT_THROW(cutter.cut(TTCutRequest(source, 4.0, 2.0, output)), TTInvalidArgumentException);
    EXPECT_THROW(cutter.cut(TTCutRequest(source, -1.0, 2.0, output)), TTInvalidArgumentException);
    EXPECT_TRUE(runner.calls.isEmpty());
}

TEST_F(TTLosslessCutterTest, CutEndToEndOnAlignedSource)
{
    runner.handler = [](const QString& program, const QStringList& args) {
        if (program == "ffprobe")
            return TTFakeProcessRunner::success("0.000000\n2.000000\n4.000000\n6.000000\n8.000000\n");
        return TTFakeProcessRunner::writeOutput(args);
    };

    TTLosslessCutter    cutter(settings, runner, probe);
    TTExtractionOutcome outcome = cutter.cut(TTCutRequest(source, 0.0, 2.0, output));

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.methodUsed(), METHOD_STREAM_COPY);
    EXPECT_TRUE(outcome.qualityPreserved());
    EXPECT_TRUE(outcome.keyframeAligned());
    EXPECT_TRUE(outcome.warnings().isEmpty());
    EXPECT_TRUE(QFileInfo(output).size() > 0);
}

TEST_F(TTLosslessCutterTest, CutWithSnapUsesStreamCopy)
{
    runner.handler = [](const QString& program, const QStringList& args) {
        if (program == "ffprobe")
            return TTFakeProcessRunner::success("0.0\n2.0\n4.0\n6.0\n");
        return TTFakeProcessRunner::writeOutput(args);
    };

    TTLosslessCutter    cutter(settings, runner, probe);
    TTExtractionOutcome outcome = cutter.cut(TTCutRequest(source, 1.6, 4.3, output, true));

    EXPECT_EQ(outcome.methodUsed(), METHOD_STREAM_COPY);
    ASSERT_FALSE(runner.ffmpegCalls().isEmpty());
    EXPECT_TRUE(containsArgs(runner.ffmpegCalls().first().args,
                             "-ss 2.000000 -i " + source + " -t 2.000000"));
}

TEST_F(TTLosslessCutterTest, SyntheticKeyframesAddWarning)
{
    probe.mediaInfo.duration = 10.0;
    runner.handler = [](const QString& program, const QStringList& args) {
        if (program == "ffprobe")
            return TTFakeProcessRunner::failure(1);
        return TTFakeProcessRunner::writeOutput(args);
    };

    TTLosslessCutter    cutter(settings, runner, probe);
    TTExtractionOutcome outcome = cutter.cut(TTCutRequest(source, 2.0, 4.0, output));

    EXPECT_EQ(outcome.methodUsed(), METHOD_STREAM_COPY);
    EXPECT_FALSE(outcome.warnings().filter("estimated").isEmpty());
}

TEST_F(TTLosslessCutterTest, ConfiguredTempDirIsCleanedUp)
{
    QTemporaryDir workDir;
    ASSERT_TRUE(workDir.isValid());
    settings.tempDirPath = workDir.path();
    acceptFFmpegExcept([](const QStringList&) { return false; });

    TTExtractionOutcome outcome = extract(2.0, 4.0);

    EXPECT_TRUE(outcome.success());
    EXPECT_TRUE(QDir(workDir.path()).entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot).isEmpty());
    EXPECT_TRUE(QFileInfo(output).size() > 0);
}
