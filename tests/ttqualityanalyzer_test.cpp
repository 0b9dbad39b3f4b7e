#include <gtest/gtest.h>

#include "ttfakes.h"

#include "../common/ttlosslesssettings.h"
#include "../extern/ttqualityanalyzer.h"

#include <QFile>
#include <QTemporaryDir>

#include <cmath>

static const QByteArray sSsimIdentical =
    "[Parsed_ssim_0 @ 0x55d1] SSIM Y:1.000000 (inf) U:1.000000 (inf) V:1.000000 (inf) All:1.000000 (inf)\n";
static const QByteArray sPsnrIdentical =
    "[Parsed_psnr_0 @ 0x55d1] PSNR y:inf u:inf v:inf average:inf min:inf max:inf\n";

class TTQualityAnalyzerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        original  = writeFile("original.mp4", QByteArray(1000, 'o'));
        processed = writeFile("processed.mp4", QByteArray(500, 'p'));
    }

    QString writeFile(const QString& name, const QByteArray& data)
    {
        QString path = tempDir.filePath(name);
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(data);
        return path;
    }

    void answer(const QByteArray& ssim, const QByteArray& psnr,
                const QByteArray& filters = " T.. ssim  VV->V  Calculate the SSIM\n"
                                            " T.. psnr  VV->V  Calculate the PSNR\n")
    {
        runner.handler = [=](const QString&, const QStringList& args) {
            if (args.contains("-filters")) return TTFakeProcessRunner::success(filters);
            if (args.contains("ssim"))     return TTFakeProcessRunner::success(QByteArray(), ssim);
            if (args.contains("psnr"))     return TTFakeProcessRunner::success(QByteArray(), psnr);
            if (args.contains("libvmaf"))
                return TTFakeProcessRunner::success(QByteArray(), "[libvmaf @ 0x1] VMAF score: 96.5\n");
            return TTFakeProcessRunner::failure(1);
        };
    }

    QTemporaryDir       tempDir;
    QString             original;
    QString             processed;
    TTLosslessSettings  settings;
    TTFakeProcessRunner runner;
};

TEST_F(TTQualityAnalyzerTest, IdenticalFilesArePerfect)
{
    answer(sSsimIdentical, sPsnrIdentical);
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(original, original);

    ASSERT_TRUE(metrics.success) << metrics.error.toStdString();
    EXPECT_EQ(metrics.ssim, 1.0);
    EXPECT_TRUE(std::isinf(metrics.psnr));
    EXPECT_EQ(metrics.fileSizeRatio, 1.0);
    EXPECT_FALSE(metrics.hasVmaf);
    EXPECT_EQ(metrics.assessment.ssimGrade, GRADE_EXCELLENT);
    EXPECT_EQ(metrics.assessment.psnrGrade, GRADE_EXCELLENT);
    EXPECT_EQ(metrics.assessment.overall, VERDICT_LOSSLESS_QUALITY);
    EXPECT_LT(metrics.processingTime, 60.0);
}

TEST_F(TTQualityAnalyzerTest, ProcessedFileMetrics)
{
    answer("SSIM Y:0.970 U:0.980 V:0.980 All:0.975123 (16.0)\n",
           "PSNR y:39.1 u:41.2 v:41.0 average:39.870000 min:35.0 max:44.0\n");
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(original, processed);

    ASSERT_TRUE(metrics.success);
    EXPECT_NEAR(metrics.ssim, 0.975123, 1e-9);
    EXPECT_NEAR(metrics.psnr, 39.87, 1e-9);
    EXPECT_DOUBLE_EQ(metrics.fileSizeRatio, 0.5);
    EXPECT_EQ(metrics.assessment.overall, VERDICT_NEAR_LOSSLESS);
}

TEST_F(TTQualityAnalyzerTest, ComparisonArgumentOrder)
{
    answer(sSsimIdentical, sPsnrIdentical);
    TTQualityAnalyzer analyzer(settings, runner);
    analyzer.analyzeQuality(original, processed);

    ASSERT_FALSE(runner.calls.isEmpty());
    QString cmd = runner.calls.first().args.join(' ');
    EXPECT_TRUE(cmd.contains("-i " + processed + " -i " + original + " -lavfi ssim -f null -"));
    EXPECT_EQ(runner.calls.first().timeoutMs, settings.qualityTimeoutMs);
}

TEST_F(TTQualityAnalyzerTest, VmafWhenAvailable)
{
    answer(sSsimIdentical, sPsnrIdentical,
           " T.. ssim    VV->V  SSIM\n T.. psnr    VV->V  PSNR\n ... libvmaf VV->V  VMAF\n");
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(original, processed);

    ASSERT_TRUE(metrics.success);
    EXPECT_TRUE(metrics.hasVmaf);
    EXPECT_DOUBLE_EQ(metrics.vmaf, 96.5);
    EXPECT_TRUE(metrics.assessment.hasVmafGrade);
    EXPECT_EQ(metrics.assessment.vmafGrade, GRADE_EXCELLENT);
}

TEST_F(TTQualityAnalyzerTest, VmafDisabledBySettings)
{
    settings.enableVmaf = false;
    answer(sSsimIdentical, sPsnrIdentical, " ... libvmaf VV->V  VMAF\n");
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(original, processed);

    EXPECT_FALSE(metrics.hasVmaf);
    EXPECT_EQ(runner.countCalls("ffmpeg"), 2);
}

TEST_F(TTQualityAnalyzerTest, MissingFilesReportNotFound)
{
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality("nonexistent1.mp4", "nonexistent2.mp4");

    EXPECT_FALSE(metrics.success);
    EXPECT_TRUE(metrics.error.contains("not found"));
    EXPECT_TRUE(runner.calls.isEmpty());
}

TEST_F(TTQualityAnalyzerTest, FfmpegFailure)
{
    runner.handler = [](const QString&, const QStringList&) {
        return TTFakeProcessRunner::failure(1);
    };
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(original, processed);

    EXPECT_FALSE(metrics.success);
    EXPECT_FALSE(metrics.error.isEmpty());
}

TEST_F(TTQualityAnalyzerTest, UnparsableOutputFails)
{
    answer("nothing useful\n", sPsnrIdentical);
    TTQualityAnalyzer analyzer(settings, runner);

    EXPECT_FALSE(analyzer.analyzeQuality(original, processed).success);
}

TEST(TTQualityGradingTest, ExcellentMetrics)
{
    TTQualityAssessment assessment = TTQualityAnalyzer::assessQuality(0.99, 50.0);

    EXPECT_EQ(assessment.ssimGrade, GRADE_EXCELLENT);
    EXPECT_EQ(assessment.psnrGrade, GRADE_EXCELLENT);
    EXPECT_EQ(assessment.overall, VERDICT_LOSSLESS_QUALITY);
    EXPECT_FALSE(assessment.hasVmafGrade);
}

TEST(TTQualityGradingTest, PoorMetrics)
{
    TTQualityAssessment assessment = TTQualityAnalyzer::assessQuality(0.85, 20.0);

    EXPECT_EQ(assessment.ssimGrade, GRADE_POOR);
    EXPECT_EQ(assessment.psnrGrade, GRADE_POOR);
    EXPECT_EQ(assessment.overall, VERDICT_LOSSY);
}

TEST(TTQualityGradingTest, Thresholds)
{
    EXPECT_EQ(TTQualityAnalyzer::gradeSsim(0.95), GRADE_GOOD);
    EXPECT_EQ(TTQualityAnalyzer::gradeSsim(0.90), GRADE_FAIR);
    EXPECT_EQ(TTQualityAnalyzer::gradePsnr(45.0), GRADE_EXCELLENT);
    EXPECT_EQ(TTQualityAnalyzer::gradePsnr(35.0), GRADE_GOOD);
    EXPECT_EQ(TTQualityAnalyzer::gradePsnr(25.0), GRADE_FAIR);
    EXPECT_EQ(TTQualityAnalyzer::gradeVmaf(95.0), GRADE_EXCELLENT);
    EXPECT_EQ(TTQualityAnalyzer::gradeVmaf(80.0), GRADE_GOOD);
    EXPECT_EQ(TTQualityAnalyzer::gradeVmaf(60.0), GRADE_FAIR);
    EXPECT_EQ(TTQualityAnalyzer::gradeVmaf(59.9), GRADE_POOR);
}

TEST(TTQualityGradingTest, FairGradeMakesLossy)
{
    EXPECT_EQ(TTQualityAnalyzer::assessQuality(0.99, 30.0).overall, VERDICT_LOSSY);
    EXPECT_EQ(TTQualityAnalyzer::assessQuality(0.96, 50.0).overall, VERDICT_NEAR_LOSSLESS);
}

TEST(TTQualityGradingTest, VmafJoinsVerdict)
{
    TTQualityMetrics metrics;
    metrics.ssim    = 0.995;
    metrics.psnr    = 48.0;
    metrics.hasVmaf = true;
    metrics.vmaf    = 85.0;

    TTQualityAssessment assessment = TTQualityAnalyzer::assessQuality(metrics);

    EXPECT_EQ(assessment.vmafGrade, GRADE_GOOD);
    EXPECT_EQ(assessment.overall, VERDICT_NEAR_LOSSLESS);
}

TEST(TTQualityParserTest, SsimIsClamped)
{
    double ssim = 0.0;
    ASSERT_TRUE(TTQualityAnalyzer::parseSsim("All:1.000002 (inf)", ssim));
    EXPECT_EQ(ssim, 1.0);
    EXPECT_FALSE(TTQualityAnalyzer::parseSsim("no ssim here", ssim));
}

TEST(TTQualityParserTest, LastSummaryLineWins)
{
    double psnr = 0.0;
    ASSERT_TRUE(TTQualityAnalyzer::parsePsnr("average:30.0\naverage:42.5 min:40\n", psnr));
    EXPECT_DOUBLE_EQ(psnr, 42.5);
}

TEST(TTQualityParserTest, FilterList)
{
    QStringList filters = TTQualityAnalyzer::parseFilterList(
        "Filters:\n T.. ssim  VV->V  SSIM\n ... scale  V->V  Scale\n T.. psnr  VV->V  PSNR\n");

    EXPECT_EQ(filters, QStringList() << "ssim" << "psnr");
}

TEST_F(TTQualityAnalyzerTest, ReportForIdentityStep)
{
    answer(sSsimIdentical, sPsnrIdentical);
    TTQualityAnalyzer analyzer(settings, runner);

    QList<TTProcessingStep> chain;
    chain << TTProcessingStep{original, original, "identity_test"};

    TTQualityReport report = analyzer.generateQualityReport(chain);

    ASSERT_TRUE(report.success);
    EXPECT_EQ(report.processingSteps(), 1);
    EXPECT_EQ(report.losslessSteps, 1);
    EXPECT_EQ(report.lossySteps, 0);
    EXPECT_DOUBLE_EQ(report.averageSsim, 1.0);
    EXPECT_FALSE(report.recommendations.isEmpty());
    EXPECT_EQ(report.stepAnalysis.first().step.operation, QString("identity_test"));
}

TEST_F(TTQualityAnalyzerTest, ReportCountsLossyAndFailedSteps)
{
    answer("All:0.80\n", "average:20.0\n");
    TTQualityAnalyzer analyzer(settings, runner);

    QList<TTProcessingStep> chain;
    chain << TTProcessingStep{original, processed, "re_encode"}
          << TTProcessingStep{original, tempDir.filePath("gone.mp4"), "missing"};

    TTQualityReport report = analyzer.generateQualityReport(chain);

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.processingSteps(), 2);
    EXPECT_EQ(report.lossySteps, 1);
    EXPECT_EQ(report.failedSteps, 1);
    EXPECT_EQ(report.recommendations.size(), 2);
}

TEST_F(TTQualityAnalyzerTest, ReportForEmptyChain)
{
    TTQualityAnalyzer analyzer(settings, runner);
    EXPECT_FALSE(analyzer.generateQualityReport(QList<TTProcessingStep>()).success);
}
