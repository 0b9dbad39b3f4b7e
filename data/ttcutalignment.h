/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttcutalignment.h                                                 */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTCUTALIGNMENT
// Cut request and keyframe alignment of its bounds
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

#ifndef TTCUTALIGNMENT_H
#define TTCUTALIGNMENT_H

#include "../avstream/ttkeyframelocator.h"

#include <QString>

// ----------------------------------------------------------------------------
// Cut request: extract [start, end) of sourcePath into outputPath
// ----------------------------------------------------------------------------
struct TTCutRequest
{
    QString sourcePath;
    double  start             = 0.0;
    double  end               = 0.0;
    QString outputPath;
    bool    forceKeyframeSnap = false;
    bool    allowSmartCut     = true;

    TTCutRequest() {}
    TTCutRequest(const QString& source, double startTime, double endTime,
                 const QString& output, bool snap = false, bool smartCut = true)
        : sourcePath(source), start(startTime), end(endTime), outputPath(output),
          forceKeyframeSnap(snap), allowSmartCut(smartCut) {}

    double duration() const { return end - start; }

    // Throws TTInvalidArgumentException if a precondition is violated
    void validate() const;
};

// ----------------------------------------------------------------------------
// Alignment of a cut against a keyframe list
// ----------------------------------------------------------------------------
struct TTAlignmentResult
{
    double effectiveStart = 0.0;
    double effectiveEnd   = 0.0;
    bool   startAligned   = false;
    bool   endAligned     = false;
    bool   startSnapped   = false;
    bool   endSnapped     = false;

    bool   keyframeAligned() const { return startAligned && endAligned; }
    double duration() const { return effectiveEnd - effectiveStart; }
};

// ----------------------------------------------------------------------------
// TTCutAlignment
// ----------------------------------------------------------------------------
class TTCutAlignment
{
public:
    static constexpr double DefaultTolerance  = 0.1;
    static constexpr double DefaultSnapWindow = 1.0;

    // preferBefore: greatest keyframe <= timestamp, else the first keyframe
    // otherwise:    smallest keyframe >= timestamp, else the last keyframe
    // Returns false only if keyframes is empty.
    static bool findNearestKeyframe(double timestamp,
                                    const TTKeyframeList& keyframes,
                                    bool preferBefore,
                                    double& keyframe);

    // Keyframe with the smallest distance in either direction
    static bool findClosestKeyframe(double timestamp,
                                    const TTKeyframeList& keyframes,
                                    bool preferBefore,
                                    double& keyframe);

    static TTAlignmentResult evaluate(double start, double end,
                                      const TTKeyframeList& keyframes,
                                      double tolerance  = DefaultTolerance,
                                      bool   forceSnap  = false,
                                      double snapWindow = DefaultSnapWindow);

    static TTAlignmentResult evaluate(const TTCutRequest& request,
                                      const TTKeyframeList& keyframes,
                                      double tolerance  = DefaultTolerance,
                                      double snapWindow = DefaultSnapWindow);

private:
    static void classify(TTAlignmentResult& result,
                         const TTKeyframeList& keyframes,
                         double tolerance);
};

#endif // TTCUTALIGNMENT_H
