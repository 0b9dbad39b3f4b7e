/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesscutter.cpp                                             */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSCUTTER
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

#include "ttlosslesscutter.h"
#include "ttprocessrunner.h"

#include "../common/ttexception.h"
#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

// ----------------------------------------------------------------------------
// Constructor
// ----------------------------------------------------------------------------
TTLosslessCutter::TTLosslessCutter(const TTLosslessSettings& settings,
                                   TTProcessRunner& runner,
                                   TTMediaProbe& probe)
    : mSettings(settings)
    , mRunner(runner)
    , mProbe(probe)
{
}

TTLosslessCutter::~TTLosslessCutter()
{
}

// ----------------------------------------------------------------------------
// Full cut: keyframe detection, alignment evaluation and extraction
// ----------------------------------------------------------------------------
TTExtractionOutcome TTLosslessCutter::cut(const TTCutRequest& request)
{
    request.validate();

    QElapsedTimer timer;
    timer.start();

    TTMessageLogger*  log = TTMessageLogger::getInstance();
    TTKeyframeLocator locator(mSettings, mRunner, mProbe);
    TTKeyframeList    keyframes = locator.locateKeyframes(request.sourcePath);
    QStringList       notes;

    if (locator.isApproximation()) {
        notes << "Keyframe positions are estimated from a synthetic GOP interval; "
                 "alignment may be inaccurate";
    } else if (keyframes.isEmpty()) {
        notes << "No keyframe information available; cut points treated as not keyframe-aligned";
    }

    TTAlignmentResult alignment = TTCutAlignment::evaluate(
            request, keyframes, mSettings.alignTolerance, mSettings.snapWindow);

    if (alignment.startSnapped || alignment.endSnapped) {
        log->infoMsg(__FILE__, __LINE__, QString("Cut points snapped to keyframes: %1 - %2")
                .arg(formatTime(alignment.effectiveStart))
                .arg(formatTime(alignment.effectiveEnd)));
    }

    return runTiers(request, keyframes, alignment, notes, timer);
}

// ----------------------------------------------------------------------------
// Extraction with precomputed keyframes and alignment
// ----------------------------------------------------------------------------
TTExtractionOutcome TTLosslessCutter::extract(const TTCutRequest& request,
                                              const TTKeyframeList& keyframes,
                                              const TTAlignmentResult& alignment,
                                              const QStringList& notes)
{
    request.validate();

    QElapsedTimer timer;
    timer.start();

    return runTiers(request, keyframes, alignment, notes, timer);
}

// ----------------------------------------------------------------------------
// Ordered tier list
// ----------------------------------------------------------------------------
QList<TTLosslessCutter::Tier> TTLosslessCutter::tiers()
{
    QList<Tier> list;

    list << Tier{METHOD_STREAM_COPY,      "stream_copy",
                 [this](TierContext& ctx) { return streamCopy(ctx); }};
    list << Tier{METHOD_SMART_CUT,        "smart_cut",
                 [this](TierContext& ctx) { return smartCut(ctx); }};
    list << Tier{METHOD_RE_ENCODED,       "re_encode",
                 [this](TierContext& ctx) { return qualityReencode(ctx); }};
    list << Tier{METHOD_FALLBACK_ENCODED, "fallback",
                 [this](TierContext& ctx) { return fallbackEncode(ctx); }};

    return list;
}

// ----------------------------------------------------------------------------
// Run the tiers in order inside a scoped temporary directory
// ----------------------------------------------------------------------------
TTExtractionOutcome TTLosslessCutter::runTiers(const TTCutRequest& request,
                                               const TTKeyframeList& keyframes,
                                               const TTAlignmentResult& alignment,
                                               const QStringList& notes,
                                               const QElapsedTimer& timer)
{
    TTMessageLogger* log = TTMessageLogger::getInstance();
    QStringList warnings = notes;
    bool        aligned  = alignment.keyframeAligned();

    if (alignment.duration() <= 0.0) {
        throw TTInvalidArgumentException(__FILE__, __LINE__,
            QString("Effective cut range is empty: %1 - %2")
                .arg(alignment.effectiveStart).arg(alignment.effectiveEnd));
    }

    if (!QFileInfo::exists(request.sourcePath)) {
        log->errorMsg(__FILE__, __LINE__,
            QString("Source file not found: %1").arg(request.sourcePath));
        warnings << QString("Source file not found: %1").arg(request.sourcePath);
        return failedOutcome(request, aligned, timer, warnings);
    }

    QTemporaryDir tempDir(temporaryDirTemplate(request.outputPath));
    if (!tempDir.isValid()) {
        log->errorMsg(__FILE__, __LINE__,
            QString("Cannot create temporary directory: %1").arg(tempDir.errorString()));
        warnings << "Cannot create temporary working directory";
        return failedOutcome(request, aligned, timer, warnings);
    }

    TTMediaInfo mediaInfo;
    bool        hasMediaInfo = mProbe.probe(request.sourcePath, mediaInfo);
    if (!hasMediaInfo) {
        log->debugMsg(__FILE__, __LINE__,
            QString("Probe failed, assuming audio present: %1").arg(mProbe.lastError()));
    }

    QString suffix = QFileInfo(request.outputPath).suffix();
    if (suffix.isEmpty()) suffix = "mp4";

    log->infoMsg(__FILE__, __LINE__, QString("Extract %1 [%2 - %3] -> %4 (keyframe aligned: %5)")
            .arg(request.sourcePath)
            .arg(formatTime(alignment.effectiveStart))
            .arg(formatTime(alignment.effectiveEnd))
            .arg(request.outputPath)
            .arg(aligned ? "yes" : "no"));

    TierContext ctx = { request, keyframes, alignment, mediaInfo, hasMediaInfo, QString(), warnings };

    for (const Tier& tier : tiers()) {
        ctx.outputFile = tempDir.filePath(QString("%1.%2").arg(tier.name).arg(suffix));

        TierStatus status = tier.run(ctx);
        if (status == TIER_SKIPPED) {
            log->debugMsg(__FILE__, __LINE__, QString("Tier %1 skipped").arg(tier.name));
            continue;
        }
        if (status == TIER_FAILED) {
            log->warningMsg(__FILE__, __LINE__, QString("Tier %1 failed").arg(tier.name));
            continue;
        }

        if (!moveIntoPlace(ctx.outputFile, request.outputPath)) {
            log->errorMsg(__FILE__, __LINE__,
                QString("Cannot write output file: %1").arg(request.outputPath));
            warnings << QString("Cannot write output file: %1").arg(request.outputPath);
            return failedOutcome(request, aligned, timer, warnings);
        }

        qint64 fileSize = QFileInfo(request.outputPath).size();
        double seconds  = elapsedSeconds(timer);

        log->infoMsg(__FILE__, __LINE__, QString("Extraction done: %1, %2 bytes, %3 s")
                .arg(TTExtractionOutcome::methodLabel(tier.method))
                .arg(fileSize)
                .arg(seconds, 0, 'f', 2));

        return TTExtractionOutcome(tier.method, aligned, seconds, fileSize, warnings);
    }

    log->errorMsg(__FILE__, __LINE__,
        QString("All extraction methods failed for %1").arg(request.sourcePath));
    warnings << "All extraction methods failed";

    return failedOutcome(request, aligned, timer, warnings);
}

// ----------------------------------------------------------------------------
// Failed outcome; like ffmpeg -y nothing stale may stay at the output path
// ----------------------------------------------------------------------------
TTExtractionOutcome TTLosslessCutter::failedOutcome(const TTCutRequest& request,
                                                    bool keyframeAligned,
                                                    const QElapsedTimer& timer,
                                                    const QStringList& warnings)
{
    QFileInfo outputInfo(request.outputPath);

    if (outputInfo.exists() &&
        outputInfo.canonicalFilePath() != QFileInfo(request.sourcePath).canonicalFilePath()) {
        if (!QFile::remove(request.outputPath)) {
            TTMessageLogger::getInstance()->warningMsg(__FILE__, __LINE__,
                QString("Cannot remove stale output file: %1").arg(request.outputPath));
        }
    }

    return TTExtractionOutcome::failed(keyframeAligned, elapsedSeconds(timer), warnings);
}

// ----------------------------------------------------------------------------
// Tier 1: stream copy, only for keyframe aligned cut points
// ----------------------------------------------------------------------------
TTLosslessCutter::TierStatus TTLosslessCutter::streamCopy(TierContext& ctx)
{
    if (!ctx.alignment.keyframeAligned()) {
        ctx.warnings << "Stream copy skipped: cut points are not keyframe-aligned";
        return TIER_SKIPPED;
    }

    QStringList args = commonArgs();
    args << inputArgs(ctx.alignment.effectiveStart, ctx.request.sourcePath, ctx.alignment.duration());
    args << "-c" << "copy"
         << "-map" << "0"
         << "-avoid_negative_ts" << "make_zero";
    args << containerArgs(ctx.outputFile);
    args << ctx.outputFile;

    QString reason;
    if (!runFFmpeg("stream_copy", args, ctx.outputFile, mSettings.streamCopyTimeoutMs, reason)) {
        ctx.warnings << QString("Stream copy failed: %1").arg(reason);
        return TIER_FAILED;
    }

    return TIER_SUCCEEDED;
}

// ----------------------------------------------------------------------------
// Tier 2: smart cut
// Decode from the keyframe at or before the start up to the keyframe at or
// after the end, trim to the exact cut points and re-encode that span.
// ----------------------------------------------------------------------------
TTLosslessCutter::TierStatus TTLosslessCutter::smartCut(TierContext& ctx)
{
    if (!ctx.request.allowSmartCut) {
        ctx.warnings << "Smart cut disabled for this request";
        return TIER_SKIPPED;
    }
    if (ctx.keyframes.isEmpty()) {
        ctx.warnings << "Smart cut skipped: no keyframe information";
        return TIER_SKIPPED;
    }

    double start = ctx.alignment.effectiveStart;
    double end   = ctx.alignment.effectiveEnd;
    double preKeyframe;
    double postKeyframe;

    TTCutAlignment::findNearestKeyframe(start, ctx.keyframes, true,  preKeyframe);
    TTCutAlignment::findNearestKeyframe(end,   ctx.keyframes, false, postKeyframe);

    // nearest keyframe is clamped to the list bounds
    preKeyframe  = qMin(preKeyframe, start);
    postKeyframe = qMax(postKeyframe, end);

    double trimStart = start - preKeyframe;
    double trimEnd   = end   - preKeyframe;
    bool   withAudio = expectsAudio(ctx);

    QString filter = QString("[0:v:0]trim=start=%1:end=%2,setpts=PTS-STARTPTS[v]")
            .arg(formatTime(trimStart)).arg(formatTime(trimEnd));
    if (withAudio) {
        filter += QString(";[0:a:0]atrim=start=%1:end=%2,asetpts=PTS-STARTPTS[a]")
                .arg(formatTime(trimStart)).arg(formatTime(trimEnd));
    }

    QStringList args = commonArgs();
    args << inputArgs(preKeyframe, ctx.request.sourcePath, postKeyframe - preKeyframe);
    args << "-filter_complex" << filter
         << "-map" << "[v]";
    if (withAudio)
        args << "-map" << "[a]";
    args << videoEncodeArgs(mSettings.smartCutCrf);
    args << audioEncodeArgs(ctx);
    args << containerArgs(ctx.outputFile);
    args << ctx.outputFile;

    QString successNote = QString("Smart cut re-encoded the span between keyframes %1 and %2; "
                                  "minimal quality loss")
            .arg(formatTime(preKeyframe)).arg(formatTime(postKeyframe));

    QString reason;
    if (runFFmpeg("smart_cut", args, ctx.outputFile, mSettings.smartCutTimeoutMs, reason)) {
        ctx.warnings << successNote;
        return TIER_SUCCEEDED;
    }

    ctx.warnings << QString("Smart cut precise trim failed (%1); retrying with direct seek").arg(reason);

    // Second attempt: plain seek and re-encode at smart cut quality
    args = commonArgs();
    args << inputArgs(start, ctx.request.sourcePath, ctx.alignment.duration());
    args << videoEncodeArgs(mSettings.smartCutCrf);
    args << audioEncodeArgs(ctx);
    args << "-avoid_negative_ts" << "make_zero";
    args << containerArgs(ctx.outputFile);
    args << ctx.outputFile;

    if (runFFmpeg("smart_cut", args, ctx.outputFile, mSettings.smartCutTimeoutMs, reason)) {
        ctx.warnings << successNote;
        return TIER_SUCCEEDED;
    }

    ctx.warnings << QString("Smart cut failed: %1").arg(reason);
    return TIER_FAILED;
}

// ----------------------------------------------------------------------------
// Tier 3: full re-encode with the quality preset
// ----------------------------------------------------------------------------
TTLosslessCutter::TierStatus TTLosslessCutter::qualityReencode(TierContext& ctx)
{
    QStringList args = commonArgs();
    args << inputArgs(ctx.alignment.effectiveStart, ctx.request.sourcePath, ctx.alignment.duration());
    args << videoEncodeArgs(mSettings.reencodeCrf);
    args << audioEncodeArgs(ctx);
    args << "-avoid_negative_ts" << "make_zero";
    args << containerArgs(ctx.outputFile);
    args << ctx.outputFile;

    QString reason;
    if (!runFFmpeg("re_encode", args, ctx.outputFile, mSettings.reencodeTimeoutMs, reason)) {
        ctx.warnings << QString("Re-encode failed: %1").arg(reason);
        return TIER_FAILED;
    }

    ctx.warnings << QString("Clip was re-encoded with %1 (crf %2); quality loss")
            .arg(mSettings.videoCodec).arg(mSettings.reencodeCrf);
    return TIER_SUCCEEDED;
}

// ----------------------------------------------------------------------------
// Tier 4: fallback encoder, then ffmpeg defaults
// ----------------------------------------------------------------------------
TTLosslessCutter::TierStatus TTLosslessCutter::fallbackEncode(TierContext& ctx)
{
    QStringList input = inputArgs(ctx.alignment.effectiveStart,
                                  ctx.request.sourcePath, ctx.alignment.duration());

    QStringList args = commonArgs();
    args << input;
    args << "-c:v" << mSettings.fallbackVideoCodec
         << "-q:v" << QString::number(mSettings.fallbackQScale);
    if (expectsAudio(ctx))
        args << "-c:a" << mSettings.audioCodec;
    else
        args << "-an";
    args << containerArgs(ctx.outputFile);
    args << ctx.outputFile;

    QString reason;
    if (runFFmpeg("fallback", args, ctx.outputFile, mSettings.fallbackTimeoutMs, reason)) {
        ctx.warnings << QString("Fallback encoder %1 used; quality loss possible")
                .arg(mSettings.fallbackVideoCodec);
        return TIER_SUCCEEDED;
    }

    args = commonArgs();
    args << input;
    args << ctx.outputFile;

    if (runFFmpeg("fallback", args, ctx.outputFile, mSettings.fallbackTimeoutMs, reason)) {
        ctx.warnings << "Fallback with default encoder settings used; quality loss possible";
        return TIER_SUCCEEDED;
    }

    ctx.warnings << QString("Fallback encoding failed: %1").arg(reason);
    return TIER_FAILED;
}

// ----------------------------------------------------------------------------
// Run one ffmpeg invocation; the output must exist and be non-empty
// ----------------------------------------------------------------------------
bool TTLosslessCutter::runFFmpeg(const QString& tierName, const QStringList& args,
                                 const QString& outputFile, int timeoutMs, QString& reason)
{
    TTMessageLogger* log = TTMessageLogger::getInstance();

    QFile::remove(outputFile);

    log->debugMsg(__FILE__, __LINE__,
        QString("%1: %2 %3").arg(tierName).arg(mSettings.ffmpegPath).arg(args.join(" ")));

    TTProcessResult result = mRunner.run(mSettings.ffmpegPath, args, timeoutMs);

    if (!result.succeeded()) {
        reason = result.failureReason();
        log->warningMsg(__FILE__, __LINE__, QString("%1: ffmpeg %2").arg(tierName).arg(reason));

        QString tail = result.stdErrTail();
        if (!tail.isEmpty())
            log->warningMsg(__FILE__, __LINE__, QString("%1: %2").arg(tierName).arg(tail));

        QFile::remove(outputFile);
        return false;
    }

    QFileInfo info(outputFile);
    if (!info.exists() || info.size() <= 0) {
        reason = "no output produced";
        log->warningMsg(__FILE__, __LINE__, QString("%1: %2").arg(tierName).arg(reason));
        QFile::remove(outputFile);
        return false;
    }

    return true;
}

// ----------------------------------------------------------------------------
// Command line building blocks
// ----------------------------------------------------------------------------
QStringList TTLosslessCutter::commonArgs() const
{
    return QStringList() << "-y" << "-hide_banner" << "-nostdin"
                         << "-loglevel" << "error";
}

QStringList TTLosslessCutter::inputArgs(double seek, const QString& source, double duration) const
{
    return QStringList() << "-ss" << formatTime(seek)
                         << "-i"  << source
                         << "-t"  << formatTime(duration);
}

QStringList TTLosslessCutter::videoEncodeArgs(int crf) const
{
    return QStringList() << "-c:v"    << mSettings.videoCodec
                         << "-preset" << mSettings.encoderPreset
                         << "-crf"    << QString::number(crf)
                         << "-pix_fmt" << "yuv420p";
}

QStringList TTLosslessCutter::audioEncodeArgs(const TierContext& ctx) const
{
    if (!expectsAudio(ctx))
        return QStringList() << "-an";

    return QStringList() << "-c:a" << mSettings.audioCodec
                         << "-b:a" << mSettings.audioBitrate;
}

QStringList TTLosslessCutter::containerArgs(const QString& outputFile) const
{
    QString suffix = QFileInfo(outputFile).suffix().toLower();

    if (suffix == "mp4" || suffix == "mov" || suffix == "m4v")
        return QStringList() << "-movflags" << "+faststart";

    return QStringList();
}

// ----------------------------------------------------------------------------
// Temporary directory beside the output unless configured otherwise
// ----------------------------------------------------------------------------
QString TTLosslessCutter::temporaryDirTemplate(const QString& outputPath) const
{
    QString dir = mSettings.tempDirPath;

    if (dir.isEmpty() || !QFileInfo(dir).isDir())
        dir = QFileInfo(outputPath).absolutePath();
    if (!QFileInfo(dir).isDir())
        dir = QDir::tempPath();

    return QDir(dir).filePath(".ttlossless-XXXXXX");
}

// ----------------------------------------------------------------------------
// Move the winning tier output to the caller's path
// ----------------------------------------------------------------------------
bool TTLosslessCutter::moveIntoPlace(const QString& tempFile, const QString& outputPath)
{
    if (QFileInfo::exists(outputPath) && !QFile::remove(outputPath))
        return false;

    if (QFile::rename(tempFile, outputPath))
        return true;

    // rename fails across file systems
    if (!QFile::copy(tempFile, outputPath))
        return false;

    QFile::remove(tempFile);
    return true;
}

// Without probe information assume audio is present
bool TTLosslessCutter::expectsAudio(const TierContext& ctx)
{
    return !ctx.hasMediaInfo || ctx.mediaInfo.hasAudio();
}

QString TTLosslessCutter::formatTime(double seconds)
{
    return QString::number(seconds, 'f', 6);
}

double TTLosslessCutter::elapsedSeconds(const QElapsedTimer& timer)
{
    return qMax(timer.nsecsElapsed() / 1.0e9, 1.0e-6);
}
