/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlibavmediaprobe.cpp                                            */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLIBAVMEDIAPROBE
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

#include "ttlibavmediaprobe.h"

#include "../common/ttmessagelogger.h"

#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>

// Include libav headers (C libraries)
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

// Static initialization flag
static bool   sFFmpegInitialized = false;
static QMutex sInitMutex;

// ----------------------------------------------------------------------------
// Constructor
// ----------------------------------------------------------------------------
TTLibavMediaProbe::TTLibavMediaProbe()
{
    initializeFFmpeg();
}

// ----------------------------------------------------------------------------
// Destructor
// ----------------------------------------------------------------------------
TTLibavMediaProbe::~TTLibavMediaProbe()
{
}

// ----------------------------------------------------------------------------
// Initialize FFmpeg libraries
// ----------------------------------------------------------------------------
void TTLibavMediaProbe::initializeFFmpeg()
{
    QMutexLocker locker(&sInitMutex);

    if (!sFFmpegInitialized) {
        // av_register_all() is deprecated and not needed for FFmpeg 4.0+
#if LIBAVFORMAT_VERSION_INT < AV_VERSION_INT(58, 9, 100)
        av_register_all();
#endif
        av_log_set_level(AV_LOG_ERROR);
        sFFmpegInitialized = true;
        TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
            QString("FFmpeg initialized, version: %1").arg(av_version_info()));
    }
}

// ----------------------------------------------------------------------------
// Probe container and best video/audio stream
// ----------------------------------------------------------------------------
bool TTLibavMediaProbe::probe(const QString& filePath, TTMediaInfo& info)
{
    info = TTMediaInfo();
    mLastError.clear();

    if (!QFileInfo::exists(filePath)) {
        setError(QString("File not found: %1").arg(filePath));
        return false;
    }

    AVFormatContext* formatCtx = nullptr;

    int ret = avformat_open_input(&formatCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        setError(QString("Could not open file: %1").arg(avErrorToString(ret)));
        return false;
    }

    ret = avformat_find_stream_info(formatCtx, nullptr);
    if (ret < 0) {
        setError(QString("Could not find stream info: %1").arg(avErrorToString(ret)));
        avformat_close_input(&formatCtx);
        return false;
    }

    info.containerFormat = QString::fromUtf8(formatCtx->iformat->name);
    info.bitRate         = formatCtx->bit_rate;

    int videoStreamIndex = av_find_best_stream(formatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    int audioStreamIndex = av_find_best_stream(formatCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

    if (videoStreamIndex >= 0) {
        AVStream* videoStream = formatCtx->streams[videoStreamIndex];
        AVCodecParameters* par = videoStream->codecpar;

        info.videoCodec = QString::fromUtf8(avcodec_get_name(par->codec_id));
        info.width      = par->width;
        info.height     = par->height;

        // video_delay is the number of reordered frames (has_b_frames in ffprobe)
        info.hasBFrames = (par->video_delay > 0);

        if (videoStream->avg_frame_rate.num > 0 && videoStream->avg_frame_rate.den > 0)
            info.frameRate = av_q2d(videoStream->avg_frame_rate);
        else if (videoStream->r_frame_rate.num > 0 && videoStream->r_frame_rate.den > 0)
            info.frameRate = av_q2d(videoStream->r_frame_rate);
    }

    if (audioStreamIndex >= 0) {
        AVStream* audioStream = formatCtx->streams[audioStreamIndex];
        info.audioCodec = QString::fromUtf8(avcodec_get_name(audioStream->codecpar->codec_id));
    }

    info.duration = formatDuration(formatCtx, videoStreamIndex);

    avformat_close_input(&formatCtx);

    TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
        QString("Probed %1: %2, video %3 %4x%5 (B-frames: %6), audio %7, %8 s")
            .arg(filePath)
            .arg(info.containerFormat)
            .arg(info.videoCodec).arg(info.width).arg(info.height)
            .arg(info.hasBFrames ? "yes" : "no")
            .arg(info.audioCodec.isEmpty() ? QString("-") : info.audioCodec)
            .arg(info.duration));

    return true;
}

// ----------------------------------------------------------------------------
// Duration in seconds: container duration, else video stream duration
// ----------------------------------------------------------------------------
double TTLibavMediaProbe::formatDuration(AVFormatContext* formatCtx, int videoStreamIndex)
{
    if (formatCtx->duration != AV_NOPTS_VALUE && formatCtx->duration > 0)
        return static_cast<double>(formatCtx->duration) / AV_TIME_BASE;

    if (videoStreamIndex >= 0) {
        AVStream* stream = formatCtx->streams[videoStreamIndex];
        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
            return stream->duration * av_q2d(stream->time_base);
    }

    return -1.0;
}

// ----------------------------------------------------------------------------
// Set error message
// ----------------------------------------------------------------------------
void TTLibavMediaProbe::setError(const QString& error)
{
    mLastError = error;
    TTMessageLogger::getInstance()->warningMsg(__FILE__, __LINE__,
        QString("TTLibavMediaProbe: %1").arg(error));
}

// ----------------------------------------------------------------------------
// Convert libav error code to string
// ----------------------------------------------------------------------------
QString TTLibavMediaProbe::avErrorToString(int errnum)
{
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    return QString::fromUtf8(errbuf);
}
