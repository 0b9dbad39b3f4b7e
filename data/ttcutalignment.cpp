/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttcutalignment.cpp                                               */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTCUTALIGNMENT
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

#include "ttcutalignment.h"

#include "../common/ttexception.h"
#include "../common/ttmessagelogger.h"


#include <cmath>

// Floating point slack for the window comparisons
static const double sCompareEpsilon = 1e-9;

// ----------------------------------------------------------------------------
// Request preconditions
// ----------------------------------------------------------------------------
void TTCutRequest::validate() const
{
    if (sourcePath.isEmpty())
        throw TTInvalidArgumentException(__FILE__, __LINE__, "Cut request without source file");

    if (outputPath.isEmpty())
        throw TTInvalidArgumentException(__FILE__, __LINE__, "Cut request without output file");

    if (!std::isfinite(start) || !std::isfinite(end) || start < 0.0 || end < 0.0)
        throw TTInvalidArgumentException(__FILE__, __LINE__,
            QString("Cut bounds must be finite and >= 0 (start=%1, end=%2)").arg(start).arg(end));

    if (end <= start)
        throw TTInvalidArgumentException(__FILE__, __LINE__,
            QString("Cut end must be after start (start=%1, end=%2)").arg(start).arg(end));
}

// ----------------------------------------------------------------------------
// Nearest keyframe in the preferred direction, clamped to the list ends
// ----------------------------------------------------------------------------
bool TTCutAlignment::findNearestKeyframe(double timestamp,
                                         const TTKeyframeList& keyframes,
                                         bool preferBefore,
                                         double& keyframe)
{
    if (keyframes.isEmpty())
        return false;

    bool found = false;
    double first = keyframes.first();
    double last  = keyframes.first();

    for (double kf : keyframes) {
        if (kf < first) first = kf;
        if (kf > last)  last  = kf;

        if (preferBefore && kf <= timestamp && (!found || kf > keyframe)) {
            keyframe = kf;
            found = true;
        } else if (!preferBefore && kf >= timestamp && (!found || kf < keyframe)) {
            keyframe = kf;
            found = true;
        }
    }

    if (!found)
        keyframe = preferBefore ? first : last;

    return true;
}

// ----------------------------------------------------------------------------
// Closest keyframe, ties resolved in the preferred direction
// ----------------------------------------------------------------------------
bool TTCutAlignment::findClosestKeyframe(double timestamp,
                                         const TTKeyframeList& keyframes,
                                         bool preferBefore,
                                         double& keyframe)
{
    double before = 0.0;
    double after  = 0.0;

    if (!findNearestKeyframe(timestamp, keyframes, true, before) ||
        !findNearestKeyframe(timestamp, keyframes, false, after))
        return false;

    double distBefore = std::fabs(timestamp - before);
    double distAfter  = std::fabs(after - timestamp);

    if (distBefore < distAfter)
        keyframe = before;
    else if (distAfter < distBefore)
        keyframe = after;
    else
        keyframe = preferBefore ? before : after;

    return true;
}

// ----------------------------------------------------------------------------
// Evaluate alignment; with forceSnap, edges within snapWindow of a keyframe
// are moved onto it
// ----------------------------------------------------------------------------
TTAlignmentResult TTCutAlignment::evaluate(double start, double end,
                                           const TTKeyframeList& keyframes,
                                           double tolerance,
                                           bool forceSnap,
                                           double snapWindow)
{
    TTAlignmentResult result;
    result.effectiveStart = start;
    result.effectiveEnd   = end;

    classify(result, keyframes, tolerance);

    if (!forceSnap || keyframes.isEmpty())
        return result;

    double snapStart = 0.0;
    if (findClosestKeyframe(start, keyframes, true, snapStart) &&
        std::fabs(start - snapStart) <= snapWindow + sCompareEpsilon &&
        snapStart < result.effectiveEnd) {
        result.startSnapped   = (snapStart != start);
        result.effectiveStart = snapStart;
    }

    double snapEnd = 0.0;
    if (findClosestKeyframe(end, keyframes, false, snapEnd) &&
        std::fabs(end - snapEnd) <= snapWindow + sCompareEpsilon &&
        snapEnd > result.effectiveStart) {
        result.endSnapped   = (snapEnd != end);
        result.effectiveEnd = snapEnd;
    }

    classify(result, keyframes, tolerance);

    if (result.startSnapped || result.endSnapped) {
        TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
            QString("Keyframe snap: %1 - %2 -> %3 - %4")
                .arg(start).arg(end)
                .arg(result.effectiveStart).arg(result.effectiveEnd));
    }

    return result;
}

TTAlignmentResult TTCutAlignment::evaluate(const TTCutRequest& request,
                                           const TTKeyframeList& keyframes,
                                           double tolerance,
                                           double snapWindow)
{
    return evaluate(request.start, request.end, keyframes,
                    tolerance, request.forceKeyframeSnap, snapWindow);
}

// ----------------------------------------------------------------------------
// Aligned flags for the current effective bounds
// ----------------------------------------------------------------------------
void TTCutAlignment::classify(TTAlignmentResult& result,
                              const TTKeyframeList& keyframes,
                              double tolerance)
{
    double kfBefore = 0.0;
    double kfAfter  = 0.0;

    result.startAligned = findNearestKeyframe(result.effectiveStart, keyframes, true, kfBefore) &&
                          std::fabs(result.effectiveStart - kfBefore) <= tolerance + sCompareEpsilon;

    result.endAligned   = findNearestKeyframe(result.effectiveEnd, keyframes, false, kfAfter) &&
                          std::fabs(result.effectiveEnd - kfAfter) <= tolerance + sCompareEpsilon;
}
