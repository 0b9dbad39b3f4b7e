/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttmediainfo.h                                                    */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTMEDIAINFO
// Container/stream metadata of a media file and the probe interface
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

#ifndef TTMEDIAINFO_H
#define TTMEDIAINFO_H

#include <QString>
#include <QtGlobal>

// ----------------------------------------------------------------------------
// Media information from one probe of a file
// ----------------------------------------------------------------------------
struct TTMediaInfo {
    QString containerFormat;   // demuxer name(s), e.g. "mov,mp4,m4a,3gp,3g2,mj2"
    QString videoCodec;        // "h264", "hevc", ... (empty: no video stream)
    QString audioCodec;        // "aac", "ac3", ... (empty: no audio stream)
    bool    hasBFrames = false;

    double  duration   = -1.0; // seconds, <= 0 if unknown
    int     width      = 0;
    int     height     = 0;
    double  frameRate  = 0.0;
    qint64  bitRate    = 0;

    bool hasVideo() const { return !videoCodec.isEmpty(); }
    bool hasAudio() const { return !audioCodec.isEmpty(); }
    bool hasDuration() const { return duration > 0.0; }
};

// ----------------------------------------------------------------------------
// TTMediaProbe
// ----------------------------------------------------------------------------
class TTMediaProbe
{
public:
    virtual ~TTMediaProbe() {}

    // Fill info from filePath; returns false if the file cannot be probed
    virtual bool probe(const QString& filePath, TTMediaInfo& info) = 0;

    virtual QString lastError() const = 0;
};

#endif // TTMEDIAINFO_H
