/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttkeyframelocator.h                                              */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTKEYFRAMELOCATOR
// Keyframe timestamps of a media file, three strategies of decreasing
// precision: keyframe scan, frame type scan, synthetic GOP estimate
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

#ifndef TTKEYFRAMELOCATOR_H
#define TTKEYFRAMELOCATOR_H

#include <QString>
#include <QList>
#include <QByteArray>

struct TTLosslessSettings;
class  TTProcessRunner;
class  TTMediaProbe;

// Keyframe timestamps in seconds, ascending, no duplicates
typedef QList<double> TTKeyframeList;

// ----------------------------------------------------------------------------
// Detection strategy that produced a keyframe list
// ----------------------------------------------------------------------------
enum TTKeyframeStrategy {
    KEYFRAME_NONE = 0,          // nothing found
    KEYFRAME_EXACT_SCAN,        // ffprobe -skip_frame nokey
    KEYFRAME_FRAME_TYPE_SCAN,   // ffprobe pict_type == I
    KEYFRAME_SYNTHETIC          // duration / assumed GOP length
};

// ----------------------------------------------------------------------------
// TTKeyframeLocator class
// ----------------------------------------------------------------------------
class TTKeyframeLocator
{
public:
    TTKeyframeLocator(const TTLosslessSettings& settings,
                      TTProcessRunner& runner,
                      TTMediaProbe& probe);

    // Never throws; returns an empty list if every strategy failed
    TTKeyframeList locateKeyframes(const QString& filePath);

    // Strategy used by the last locateKeyframes() call
    TTKeyframeStrategy lastStrategy() const { return mLastStrategy; }
    bool isApproximation() const { return mLastStrategy == KEYFRAME_SYNTHETIC; }

    static QString strategyToString(TTKeyframeStrategy strategy);

    // Output parsers (one "pts_time[,...]" row per line)
    static TTKeyframeList parseKeyframeScan(const QByteArray& output);
    static TTKeyframeList parseFrameTypeScan(const QByteArray& output);

    // Shortest accepted synthetic GOP interval in seconds
    static constexpr double MinGopInterval = 0.1;

    // Keyframe every interval seconds in [0, duration); empty for intervals
    // below MinGopInterval
    static TTKeyframeList syntheticKeyframes(double duration, double interval);

    // Drop timestamps beyond duration; a duration <= 0 means unknown
    static TTKeyframeList clipToDuration(const TTKeyframeList& keyframes, double duration);

    // Sort, drop negative values and duplicates
    static TTKeyframeList normalize(const QList<double>& timestamps);

private:
    bool exactScan(const QString& filePath, double duration, TTKeyframeList& keyframes);
    bool frameTypeScan(const QString& filePath, double duration, TTKeyframeList& keyframes);
    bool syntheticEstimate(double duration, TTKeyframeList& keyframes);

    const TTLosslessSettings& mSettings;
    TTProcessRunner&          mRunner;
    TTMediaProbe&             mProbe;
    TTKeyframeStrategy        mLastStrategy;
};

#endif // TTKEYFRAMELOCATOR_H
