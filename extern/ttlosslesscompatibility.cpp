/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesscompatibility.cpp                                      */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSCOMPATIBILITY
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

#include "ttlosslesscompatibility.h"

#include "../common/ttmessagelogger.h"

#include <QFileInfo>

// ----------------------------------------------------------------------------
// Constructor
// ----------------------------------------------------------------------------
TTLosslessCompatibility::TTLosslessCompatibility(TTMediaProbe& probe)
    : mProbe(probe)
{
}

// ----------------------------------------------------------------------------
// Probe the file and evaluate the result
// ----------------------------------------------------------------------------
TTCompatibilityReport TTLosslessCompatibility::check(const QString& filePath)
{
    TTMessageLogger* log = TTMessageLogger::getInstance();
    TTMediaInfo      mediaInfo;

    if (!QFileInfo::exists(filePath)) {
        TTCompatibilityReport report;
        report.warnings << QString("File not found: %1").arg(filePath);
        log->warningMsg(__FILE__, __LINE__, report.warnings.last());
        return report;
    }

    if (!mProbe.probe(filePath, mediaInfo)) {
        TTCompatibilityReport report;
        report.warnings << QString("Media probe failed: %1").arg(mProbe.lastError());
        log->warningMsg(__FILE__, __LINE__, report.warnings.last());
        return report;
    }

    TTCompatibilityReport report = evaluate(mediaInfo);

    log->infoMsg(__FILE__, __LINE__, QString("Compatibility %1: %2/%3 in %4 -> %5")
            .arg(QFileInfo(filePath).fileName())
            .arg(report.videoCodec)
            .arg(report.audioCodec.isEmpty() ? QString("-") : report.audioCodec)
            .arg(report.containerFormat)
            .arg(report.compatible ? "stream copy possible" : "re-encode required"));

    return report;
}

// ----------------------------------------------------------------------------
// Evaluate probed metadata; B-frames only warn
// ----------------------------------------------------------------------------
TTCompatibilityReport TTLosslessCompatibility::evaluate(const TTMediaInfo& mediaInfo)
{
    TTCompatibilityReport report;

    report.videoCodec      = mediaInfo.videoCodec;
    report.audioCodec      = mediaInfo.audioCodec;
    report.containerFormat = mediaInfo.containerFormat;
    report.hasBFrames      = mediaInfo.hasBFrames;
    report.compatible      = true;

    if (!mediaInfo.hasVideo()) {
        report.compatible = false;
        report.warnings << "No video stream found";
    } else if (!isSupportedVideoCodec(mediaInfo.videoCodec)) {
        report.compatible = false;
        report.warnings << QString("Video codec %1 is not supported for stream copy")
                .arg(mediaInfo.videoCodec);
    }

    if (mediaInfo.hasAudio() && !isSupportedAudioCodec(mediaInfo.audioCodec)) {
        report.compatible = false;
        report.warnings << QString("Audio codec %1 is not supported for stream copy")
                .arg(mediaInfo.audioCodec);
    }

    if (!isSupportedContainer(mediaInfo.containerFormat)) {
        report.compatible = false;
        report.warnings << QString("Container format %1 is not supported for stream copy")
                .arg(mediaInfo.containerFormat.isEmpty() ? QString("(unknown)")
                                                         : mediaInfo.containerFormat);
    }

    if (mediaInfo.hasBFrames) {
        report.warnings << "Video uses B-frames; cuts may need keyframe alignment";
    }

    return report;
}

bool TTLosslessCompatibility::isSupportedVideoCodec(const QString& codec)
{
    return supportedVideoCodecs().contains(codec.trimmed().toLower());
}

bool TTLosslessCompatibility::isSupportedAudioCodec(const QString& codec)
{
    return supportedAudioCodecs().contains(codec.trimmed().toLower());
}

bool TTLosslessCompatibility::isSupportedContainer(const QString& formatName)
{
    const QStringList names = formatName.split(',', Qt::SkipEmptyParts);

    for (const QString& name : names) {
        if (supportedContainers().contains(name.trimmed().toLower()))
            return true;
    }
    return false;
}

const QStringList& TTLosslessCompatibility::supportedVideoCodecs()
{
    static const QStringList codecs = QStringList()
            << "h264" << "hevc" << "h265" << "mpeg2video" << "mpeg4"
            << "vp8" << "vp9" << "av1" << "prores" << "mjpeg";
    return codecs;
}

const QStringList& TTLosslessCompatibility::supportedAudioCodecs()
{
    static const QStringList codecs = QStringList()
            << "aac" << "mp3" << "ac3" << "eac3" << "opus" << "vorbis"
            << "flac" << "pcm_s16le" << "pcm_s24le" << "mp2";
    return codecs;
}

const QStringList& TTLosslessCompatibility::supportedContainers()
{
    static const QStringList formats = QStringList()
            << "mp4" << "mov" << "matroska" << "webm" << "mpegts" << "avi" << "m4a";
    return formats;
}
