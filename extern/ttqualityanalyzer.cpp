/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttqualityanalyzer.cpp                                            */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTQUALITYANALYZER
// ----------------------------------------------------------------------------

/*----------------------------------------------------------------------------*/
/* This program is free software; you can redistribute it and/or modify it    */
/* under the terms of the GNU General Public License as published by the Free */
/* Software Foundation;                                                       */
/* either version 3 of the License, or (at your option) any later version.    */
/*                                                                            */
/* This program is distributed in the hope that it will be useful, but WITHOUT*/
/* ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or      */
/* FITNESS FOR A PARTICULAR PURPOSE.                                          */
/* See the GNU General Public License for more details.                       */
/*                                                                            */
/* You should have received a copy of the GNU General Public License along    */
/* with this program; if not, write to the Free Software Foundation,          */
/* Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307, USA.              */
/*----------------------------------------------------------------------------*/

#include "ttqualityanalyzer.h"
#include "ttprocessrunner.h"

#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QRegularExpression>

#include <limits>

// ffmpeg -filters only prints a table
static const int sFilterListTimeoutMs = 10000;

// ----------------------------------------------------------------------------
// Constructor
// ----------------------------------------------------------------------------
TTQualityAnalyzer::TTQualityAnalyzer(const TTLosslessSettings& settings, TTProcessRunner& runner)
    : mSettings(settings)
    , mRunner(runner)
{
}

// ----------------------------------------------------------------------------
// Compare processed against original
// ----------------------------------------------------------------------------
TTQualityMetrics TTQualityAnalyzer::analyzeQuality(const QString& original, const QString& processed)
{
    TTMessageLogger* log = TTMessageLogger::getInstance();
    TTQualityMetrics metrics;
    QElapsedTimer    timer;

    timer.start();

    if (!QFileInfo::exists(original)) {
        metrics.error = QString("Original file not found: %1").arg(original);
        log->warningMsg(__FILE__, __LINE__, metrics.error);
        return metrics;
    }
    if (!QFileInfo::exists(processed)) {
        metrics.error = QString("Processed file not found: %1").arg(processed);
        log->warningMsg(__FILE__, __LINE__, metrics.error);
        return metrics;
    }

    QByteArray output;
    QString    reason;

    if (!runComparison("ssim", original, processed, output, reason)) {
        metrics.error = QString("SSIM analysis failed: %1").arg(reason);
        return metrics;
    }
    if (!parseSsim(output, metrics.ssim)) {
        metrics.error = "SSIM analysis failed: no result in ffmpeg output";
        log->warningMsg(__FILE__, __LINE__, metrics.error);
        return metrics;
    }

    if (!runComparison("psnr", original, processed, output, reason)) {
        metrics.error = QString("PSNR analysis failed: %1").arg(reason);
        return metrics;
    }
    if (!parsePsnr(output, metrics.psnr)) {
        metrics.error = "PSNR analysis failed: no result in ffmpeg output";
        log->warningMsg(__FILE__, __LINE__, metrics.error);
        return metrics;
    }

    // VMAF is optional, a failure only costs the score
    if (mSettings.enableVmaf && availableFilters().contains("libvmaf")) {
        if (runComparison("libvmaf", original, processed, output, reason) &&
            parseVmaf(output, metrics.vmaf)) {
            metrics.hasVmaf = true;
        } else {
            log->warningMsg(__FILE__, __LINE__, "VMAF analysis failed, score omitted");
        }
    }

    qint64 originalSize  = QFileInfo(original).size();
    qint64 processedSize = QFileInfo(processed).size();

    metrics.fileSizeRatio  = (originalSize > 0) ? double(processedSize) / double(originalSize) : 0.0;
    metrics.assessment     = assessQuality(metrics);
    metrics.processingTime = timer.nsecsElapsed() / 1.0e9;
    metrics.success        = true;

    log->infoMsg(__FILE__, __LINE__, QString("Quality %1: SSIM %2 PSNR %3 -> %4")
            .arg(QFileInfo(processed).fileName())
            .arg(metrics.ssim, 0, 'f', 4)
            .arg(metrics.psnr, 0, 'f', 2)
            .arg(verdictToString(metrics.assessment.overall)));

    return metrics;
}

// ----------------------------------------------------------------------------
// Analyze every step of a processing chain
// ----------------------------------------------------------------------------
TTQualityReport TTQualityAnalyzer::generateQualityReport(const QList<TTProcessingStep>& chain)
{
    TTQualityReport report;

    if (chain.isEmpty()) {
        report.error = "Empty processing chain";
        return report;
    }

    double ssimSum   = 0.0;
    double psnrSum   = 0.0;
    int    analyzed  = 0;

    for (const TTProcessingStep& step : chain) {
        TTQualityStepAnalysis analysis;
        analysis.step    = step;
        analysis.metrics = analyzeQuality(step.original, step.processed);

        if (!analysis.metrics.success) {
            report.failedSteps++;
        } else {
            analyzed++;
            ssimSum += analysis.metrics.ssim;
            psnrSum += analysis.metrics.psnr;

            switch (analysis.metrics.assessment.overall) {
                case VERDICT_LOSSLESS_QUALITY: report.losslessSteps++;     break;
                case VERDICT_NEAR_LOSSLESS:    report.nearLosslessSteps++; break;
                case VERDICT_LOSSY:            report.lossySteps++;        break;
            }
        }

        report.stepAnalysis << analysis;
    }

    if (analyzed > 0) {
        report.averageSsim = ssimSum / analyzed;
        report.averagePsnr = psnrSum / analyzed;
    }

    if (report.lossySteps > 0)
        report.recommendations << "Prefer stream copy with keyframe-aligned cut points to avoid generation loss";
    if (report.nearLosslessSteps > 0)
        report.recommendations << "Align cut points to keyframes so smart cut re-encoding is not needed";
    if (report.failedSteps > 0)
        report.recommendations << "Some steps could not be analyzed; check that both files exist and decode";
    if (report.recommendations.isEmpty())
        report.recommendations << "All steps preserve the source quality";

    report.success = true;
    return report;
}

// ----------------------------------------------------------------------------
// Metric filters known to the installed ffmpeg
// ----------------------------------------------------------------------------
QStringList TTQualityAnalyzer::availableFilters()
{
    TTProcessResult result = mRunner.run(mSettings.ffmpegPath,
                                         QStringList() << "-hide_banner" << "-filters",
                                         sFilterListTimeoutMs);
    if (!result.succeeded()) {
        TTMessageLogger::getInstance()->warningMsg(__FILE__, __LINE__,
            QString("ffmpeg -filters: %1").arg(result.failureReason()));
        return QStringList();
    }

    return parseFilterList(result.stdOut);
}

// ----------------------------------------------------------------------------
// Grading
// ----------------------------------------------------------------------------
TTQualityAssessment TTQualityAnalyzer::assessQuality(double ssim, double psnr)
{
    TTQualityAssessment assessment;

    assessment.ssimGrade = gradeSsim(ssim);
    assessment.psnrGrade = gradePsnr(psnr);
    assessment.overall   = verdict(QList<TTQualityGrade>() << assessment.ssimGrade
                                                           << assessment.psnrGrade);
    return assessment;
}

TTQualityAssessment TTQualityAnalyzer::assessQuality(const TTQualityMetrics& metrics)
{
    TTQualityAssessment assessment = assessQuality(metrics.ssim, metrics.psnr);

    if (metrics.hasVmaf) {
        assessment.hasVmafGrade = true;
        assessment.vmafGrade    = gradeVmaf(metrics.vmaf);
        assessment.overall      = verdict(QList<TTQualityGrade>() << assessment.ssimGrade
                                                                  << assessment.psnrGrade
                                                                  << assessment.vmafGrade);
    }
    return assessment;
}

TTQualityGrade TTQualityAnalyzer::gradeSsim(double ssim)
{
    if (ssim >= 0.99) return GRADE_EXCELLENT;
    if (ssim >= 0.95) return GRADE_GOOD;
    if (ssim >= 0.90) return GRADE_FAIR;
    return GRADE_POOR;
}

TTQualityGrade TTQualityAnalyzer::gradePsnr(double psnr)
{
    if (psnr >= 45.0) return GRADE_EXCELLENT;
    if (psnr >= 35.0) return GRADE_GOOD;
    if (psnr >= 25.0) return GRADE_FAIR;
    return GRADE_POOR;
}

TTQualityGrade TTQualityAnalyzer::gradeVmaf(double vmaf)
{
    if (vmaf >= 95.0) return GRADE_EXCELLENT;
    if (vmaf >= 80.0) return GRADE_GOOD;
    if (vmaf >= 60.0) return GRADE_FAIR;
    return GRADE_POOR;
}

TTQualityVerdict TTQualityAnalyzer::verdict(const QList<TTQualityGrade>& grades)
{
    bool allExcellent = true;
    bool allGood      = true;

    for (TTQualityGrade grade : grades) {
        if (grade != GRADE_EXCELLENT) allExcellent = false;
        if (grade != GRADE_EXCELLENT && grade != GRADE_GOOD) allGood = false;
    }

    if (allExcellent) return VERDICT_LOSSLESS_QUALITY;
    if (allGood)      return VERDICT_NEAR_LOSSLESS;
    return VERDICT_LOSSY;
}

QString TTQualityAnalyzer::gradeToString(TTQualityGrade grade)
{
    switch (grade) {
        case GRADE_EXCELLENT: return "excellent";
        case GRADE_GOOD:      return "good";
        case GRADE_FAIR:      return "fair";
        case GRADE_POOR:      return "poor";
    }
    return "poor";
}

QString TTQualityAnalyzer::verdictToString(TTQualityVerdict verdict)
{
    switch (verdict) {
        case VERDICT_LOSSLESS_QUALITY: return "lossless_quality";
        case VERDICT_NEAR_LOSSLESS:    return "near_lossless";
        case VERDICT_LOSSY:            return "lossy";
    }
    return "lossy";
}

// ----------------------------------------------------------------------------
// ffmpeg output parsing; the summary line is the last match
// ----------------------------------------------------------------------------
bool TTQualityAnalyzer::parseSsim(const QByteArray& output, double& ssim)
{
    static const QRegularExpression re("All:\\s*([0-9.]+)");

    QRegularExpressionMatchIterator it = re.globalMatch(QString::fromUtf8(output));
    QString value;
    while (it.hasNext())
        value = it.next().captured(1);

    bool ok = false;
    double result = value.toDouble(&ok);
    if (!ok) return false;

    ssim = qBound(0.0, result, 1.0);
    return true;
}

bool TTQualityAnalyzer::parsePsnr(const QByteArray& output, double& psnr)
{
    static const QRegularExpression re("average:\\s*(inf|[0-9.]+)");

    QRegularExpressionMatchIterator it = re.globalMatch(QString::fromUtf8(output));
    QString value;
    while (it.hasNext())
        value = it.next().captured(1);

    if (value == "inf") {
        psnr = std::numeric_limits<double>::infinity();
        return true;
    }

    bool ok = false;
    double result = value.toDouble(&ok);
    if (!ok) return false;

    psnr = result;
    return true;
}

bool TTQualityAnalyzer::parseVmaf(const QByteArray& output, double& vmaf)
{
    static const QRegularExpression re("VMAF score[:=]\\s*([0-9.]+)");

    QRegularExpressionMatch match = re.match(QString::fromUtf8(output));
    if (!match.hasMatch()) return false;

    bool ok = false;
    double result = match.captured(1).toDouble(&ok);
    if (!ok) return false;

    vmaf = qBound(0.0, result, 100.0);
    return true;
}

// " T.. ssim              VV->V      Calculate the SSIM between two video streams."
QStringList TTQualityAnalyzer::parseFilterList(const QByteArray& output)
{
    static const QStringList wanted = QStringList() << "ssim" << "psnr" << "libvmaf";

    QStringList found;
    const QStringList lines = QString::fromUtf8(output).split('\n', Qt::SkipEmptyParts);

    for (const QString& line : lines) {
        QStringList fields = line.simplified().split(' ');
        if (fields.size() < 2) continue;

        if (wanted.contains(fields[1]) && !found.contains(fields[1]))
            found << fields[1];
    }
    return found;
}

// ----------------------------------------------------------------------------
// Run one comparison filter; the filter reports on stderr
// ----------------------------------------------------------------------------
bool TTQualityAnalyzer::runComparison(const QString& filter, const QString& original,
                                      const QString& processed, QByteArray& output, QString& reason)
{
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-nostats"
         << "-i" << processed
         << "-i" << original
         << "-lavfi" << filter
         << "-f" << "null" << "-";

    TTProcessResult result = mRunner.run(mSettings.ffmpegPath, args, mSettings.qualityTimeoutMs);

    if (!result.succeeded()) {
        reason = result.failureReason();
        TTMessageLogger* log = TTMessageLogger::getInstance();
        log->warningMsg(__FILE__, __LINE__, QString("%1 comparison: ffmpeg %2").arg(filter).arg(reason));
        QString tail = result.stdErrTail();
        if (!tail.isEmpty())
            log->warningMsg(__FILE__, __LINE__, tail);
        return false;
    }

    output = result.stdErr;
    return true;
}
