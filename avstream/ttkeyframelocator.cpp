/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttkeyframelocator.cpp                                            */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTKEYFRAMELOCATOR
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

#include "ttkeyframelocator.h"
#include "ttmediainfo.h"

#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"
#include "../extern/ttprocessrunner.h"

#include <QFileInfo>
#include <QStringList>

#include <algorithm>
#include <cmath>

// Timestamps closer than this are the same frame
static const double sDuplicateEpsilon = 1e-6;

// ----------------------------------------------------------------------------
// Constructor
// ----------------------------------------------------------------------------
TTKeyframeLocator::TTKeyframeLocator(const TTLosslessSettings& settings,
                                     TTProcessRunner& runner,
                                     TTMediaProbe& probe)
    : mSettings(settings)
    , mRunner(runner)
    , mProbe(probe)
    , mLastStrategy(KEYFRAME_NONE)
{
}

// ----------------------------------------------------------------------------
// Locate keyframes; first successful strategy wins
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::locateKeyframes(const QString& filePath)
{
    TTMessageLogger* log = TTMessageLogger::getInstance();
    TTKeyframeList keyframes;

    mLastStrategy = KEYFRAME_NONE;

    if (!QFileInfo::exists(filePath)) {
        log->warningMsg(__FILE__, __LINE__,
            QString("Keyframe detection: file not found: %1").arg(filePath));
        return keyframes;
    }

    TTMediaInfo info;
    double duration = -1.0;
    if (mProbe.probe(filePath, info) && info.hasDuration())
        duration = info.duration;
    else
        log->debugMsg(__FILE__, __LINE__,
            QString("Keyframe detection: duration unknown: %1").arg(mProbe.lastError()));

    if (exactScan(filePath, duration, keyframes)) {
        mLastStrategy = KEYFRAME_EXACT_SCAN;
    } else if (frameTypeScan(filePath, duration, keyframes)) {
        mLastStrategy = KEYFRAME_FRAME_TYPE_SCAN;
    } else if (syntheticEstimate(duration, keyframes)) {
        mLastStrategy = KEYFRAME_SYNTHETIC;
        log->warningMsg(__FILE__, __LINE__,
            QString("Keyframe detection: using synthetic keyframes every %1 s for %2; "
                    "positions are estimated, not read from the stream")
                .arg(mSettings.syntheticGopInterval).arg(filePath));
    } else {
        log->warningMsg(__FILE__, __LINE__,
            QString("Keyframe detection: all strategies exhausted for %1").arg(filePath));
        return TTKeyframeList();
    }

    log->infoMsg(__FILE__, __LINE__,
        QString("Keyframe detection: %1 keyframes via %2")
            .arg(keyframes.size()).arg(strategyToString(mLastStrategy)));

    return keyframes;
}

// ----------------------------------------------------------------------------
// Strategy 1: let the decoder skip everything but keyframes
// ----------------------------------------------------------------------------
bool TTKeyframeLocator::exactScan(const QString& filePath, double duration, TTKeyframeList& keyframes)
{
    QStringList args;
    args << "-v" << "error"
         << "-select_streams" << "v:0"
         << "-skip_frame" << "nokey"
         << "-show_entries" << "frame=pts_time"
         << "-of" << "csv=p=0"
         << filePath;

    TTProcessResult result = mRunner.run(mSettings.ffprobePath, args, mSettings.exactScanTimeoutMs);

    if (!result.succeeded()) {
        TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
            QString("Keyframe scan failed (%1): %2")
                .arg(result.failureReason()).arg(result.stdErrTail()));
        return false;
    }

    keyframes = clipToDuration(parseKeyframeScan(result.stdOut), duration);
    return !keyframes.isEmpty();
}

// ----------------------------------------------------------------------------
// Strategy 2: read the picture type of every frame
// ----------------------------------------------------------------------------
bool TTKeyframeLocator::frameTypeScan(const QString& filePath, double duration, TTKeyframeList& keyframes)
{
    QStringList args;
    args << "-v" << "error"
         << "-select_streams" << "v:0"
         << "-show_entries" << "frame=pts_time,pict_type"
         << "-of" << "csv=p=0"
         << filePath;

    TTProcessResult result = mRunner.run(mSettings.ffprobePath, args, mSettings.frameTypeScanTimeoutMs);

    if (!result.succeeded()) {
        TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
            QString("Frame type scan failed (%1): %2")
                .arg(result.failureReason()).arg(result.stdErrTail()));
        return false;
    }

    keyframes = clipToDuration(parseFrameTypeScan(result.stdOut), duration);
    return !keyframes.isEmpty();
}

// ----------------------------------------------------------------------------
// Strategy 3: assume a fixed GOP length over the probed duration
// ----------------------------------------------------------------------------
bool TTKeyframeLocator::syntheticEstimate(double duration, TTKeyframeList& keyframes)
{
    if (duration <= 0.0)
        return false;

    keyframes = syntheticKeyframes(duration, mSettings.syntheticGopInterval);
    return !keyframes.isEmpty();
}

// ----------------------------------------------------------------------------
// Parse "pts_time" rows; N/A and garbage lines are skipped
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::parseKeyframeScan(const QByteArray& output)
{
    QList<double> timestamps;
    QStringList lines = QString::fromUtf8(output).split('\n', Qt::SkipEmptyParts);

    for (const QString& line : lines) {
        QString field = line.section(',', 0, 0).trimmed();

        bool ok = false;
        double pts = field.toDouble(&ok);
        if (ok && std::isfinite(pts))
            timestamps.append(pts);
    }

    return normalize(timestamps);
}

// ----------------------------------------------------------------------------
// Parse "pts_time,pict_type" rows and keep the intra coded frames
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::parseFrameTypeScan(const QByteArray& output)
{
    QList<double> timestamps;
    QStringList lines = QString::fromUtf8(output).split('\n', Qt::SkipEmptyParts);

    for (const QString& line : lines) {
        QStringList parts = line.trimmed().split(',');
        if (parts.size() < 2) continue;

        bool isIntra = false;
        bool hasPts  = false;
        double pts   = 0.0;

        for (const QString& part : parts) {
            QString field = part.trimmed();
            if (field == "I") {
                isIntra = true;
                continue;
            }
            bool ok = false;
            double value = field.toDouble(&ok);
            if (ok && !hasPts && std::isfinite(value)) {
                pts = value;
                hasPts = true;
            }
        }

        if (isIntra && hasPts)
            timestamps.append(pts);
    }

    return normalize(timestamps);
}

// ----------------------------------------------------------------------------
// Keyframe every interval seconds, starting at 0.0, below duration
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::syntheticKeyframes(double duration, double interval)
{
    TTKeyframeList keyframes;

    if (duration <= 0.0 || !std::isfinite(duration) || interval < MinGopInterval)
        return keyframes;

    qint64 count = qint64(std::ceil(duration / interval));
    for (qint64 i = 0; i < count; ++i)
        keyframes.append(i * interval);

    return keyframes;
}

// ----------------------------------------------------------------------------
// Drop timestamps past a known duration
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::clipToDuration(const TTKeyframeList& keyframes, double duration)
{
    if (duration <= 0.0)
        return keyframes;

    TTKeyframeList clipped;
    for (double ts : keyframes) {
        if (ts <= duration + sDuplicateEpsilon)
            clipped.append(ts);
    }
    return clipped;
}

// ----------------------------------------------------------------------------
// Sort ascending, drop negative timestamps and duplicates
// ----------------------------------------------------------------------------
TTKeyframeList TTKeyframeLocator::normalize(const QList<double>& timestamps)
{
    TTKeyframeList sorted;
    for (double ts : timestamps) {
        if (ts >= 0.0)
            sorted.append(ts);
    }

    std::sort(sorted.begin(), sorted.end());

    TTKeyframeList keyframes;
    for (double ts : sorted) {
        if (keyframes.isEmpty() || std::fabs(ts - keyframes.last()) > sDuplicateEpsilon)
            keyframes.append(ts);
    }

    return keyframes;
}

// ----------------------------------------------------------------------------
// Strategy name for log messages
// ----------------------------------------------------------------------------
QString TTKeyframeLocator::strategyToString(TTKeyframeStrategy strategy)
{
    switch (strategy) {
        case KEYFRAME_EXACT_SCAN:      return "keyframe scan";
        case KEYFRAME_FRAME_TYPE_SCAN: return "frame type scan";
        case KEYFRAME_SYNTHETIC:       return "synthetic GOP estimate";
        case KEYFRAME_NONE:            break;
    }
    return "none";
}
