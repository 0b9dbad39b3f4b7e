/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttqualityanalyzer.h                                              */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTQUALITYANALYZER
// Objective quality comparison of an original and a processed file
// SSIM and PSNR through the ffmpeg filters, VMAF when libvmaf is available
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

#ifndef TTQUALITYANALYZER_H
#define TTQUALITYANALYZER_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QList>

struct TTLosslessSettings;
class  TTProcessRunner;

enum TTQualityGrade {
    GRADE_EXCELLENT = 0,
    GRADE_GOOD,
    GRADE_FAIR,
    GRADE_POOR
};

enum TTQualityVerdict {
    VERDICT_LOSSLESS_QUALITY = 0,
    VERDICT_NEAR_LOSSLESS,
    VERDICT_LOSSY
};

struct TTQualityAssessment
{
    TTQualityGrade   ssimGrade    = GRADE_POOR;
    TTQualityGrade   psnrGrade    = GRADE_POOR;
    bool             hasVmafGrade = false;
    TTQualityGrade   vmafGrade    = GRADE_POOR;
    TTQualityVerdict overall      = VERDICT_LOSSY;
};

struct TTQualityMetrics
{
    bool                success        = false;
    QString             error;
    double              ssim           = 0.0;     // 0..1
    double              psnr           = 0.0;     // dB, +inf for identical input
    bool                hasVmaf        = false;
    double              vmaf           = 0.0;     // 0..100
    double              fileSizeRatio  = 0.0;     // processed / original
    double              processingTime = 0.0;     // seconds
    TTQualityAssessment assessment;
};

struct TTProcessingStep
{
    QString original;
    QString processed;
    QString operation;
};

struct TTQualityStepAnalysis
{
    TTProcessingStep step;
    TTQualityMetrics metrics;
};

struct TTQualityReport
{
    bool                         success           = false;
    QString                      error;
    QList<TTQualityStepAnalysis> stepAnalysis;
    int                          losslessSteps     = 0;
    int                          nearLosslessSteps = 0;
    int                          lossySteps        = 0;
    int                          failedSteps       = 0;
    double                       averageSsim       = 0.0;
    double                       averagePsnr       = 0.0;
    QStringList                  recommendations;

    int processingSteps() const { return stepAnalysis.size(); }
};

// ----------------------------------------------------------------------------
// TTQualityAnalyzer class
// ----------------------------------------------------------------------------
class TTQualityAnalyzer
{
public:
    TTQualityAnalyzer(const TTLosslessSettings& settings, TTProcessRunner& runner);

    TTQualityMetrics analyzeQuality(const QString& original, const QString& processed);
    TTQualityReport  generateQualityReport(const QList<TTProcessingStep>& chain);

    // Subset of ssim, psnr and libvmaf listed by "ffmpeg -filters"
    QStringList availableFilters();

    static TTQualityAssessment assessQuality(double ssim, double psnr);
    static TTQualityAssessment assessQuality(const TTQualityMetrics& metrics);

    static TTQualityGrade gradeSsim(double ssim);
    static TTQualityGrade gradePsnr(double psnr);
    static TTQualityGrade gradeVmaf(double vmaf);

    static QString gradeToString(TTQualityGrade grade);
    static QString verdictToString(TTQualityVerdict verdict);

    static bool parseSsim(const QByteArray& output, double& ssim);
    static bool parsePsnr(const QByteArray& output, double& psnr);
    static bool parseVmaf(const QByteArray& output, double& vmaf);
    static QStringList parseFilterList(const QByteArray& output);

private:
    bool runComparison(const QString& filter, const QString& original,
                       const QString& processed, QByteArray& output, QString& reason);

    static TTQualityVerdict verdict(const QList<TTQualityGrade>& grades);

    const TTLosslessSettings& mSettings;
    TTProcessRunner&          mRunner;
};

#endif // TTQUALITYANALYZER_H
