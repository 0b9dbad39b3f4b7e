/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttextractionoutcome.cpp                                          */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTEXTRACTIONOUTCOME
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

#include "ttextractionoutcome.h"

TTExtractionOutcome::TTExtractionOutcome(TTExtractionMethod method,
                                         bool keyframeAligned,
                                         double processingTime,
                                         qint64 outputFileSize,
                                         const QStringList& warnings)
    : mMethod(method)
    , mKeyframeAligned(keyframeAligned)
    , mProcessingTime(processingTime)
    , mOutputFileSize(outputFileSize)
    , mWarnings(warnings)
{
}

TTExtractionOutcome TTExtractionOutcome::failed(bool keyframeAligned,
                                                double processingTime,
                                                const QStringList& warnings)
{
    return TTExtractionOutcome(METHOD_FAILED, keyframeAligned, processingTime, 0, warnings);
}

bool TTExtractionOutcome::qualityPreserved() const
{
    return methodPreservesQuality(mMethod);
}

// ----------------------------------------------------------------------------
// Stream copy is lossless, smart cut counts as near lossless
// ----------------------------------------------------------------------------
bool TTExtractionOutcome::methodPreservesQuality(TTExtractionMethod method)
{
    switch (method) {
        case METHOD_STREAM_COPY:
        case METHOD_SMART_CUT:
            return true;
        case METHOD_RE_ENCODED:
        case METHOD_FALLBACK_ENCODED:
        case METHOD_FAILED:
            return false;
    }
    return false;
}

QString TTExtractionOutcome::methodToString(TTExtractionMethod method)
{
    switch (method) {
        case METHOD_STREAM_COPY:      return "stream_copy";
        case METHOD_SMART_CUT:        return "smart_cut";
        case METHOD_RE_ENCODED:       return "re_encoded";
        case METHOD_FALLBACK_ENCODED: return "fallback_encoded";
        case METHOD_FAILED:           return "failed";
    }
    return "failed";
}

QString TTExtractionOutcome::methodLabel(TTExtractionMethod method)
{
    switch (method) {
        case METHOD_STREAM_COPY:      return "Lossless (Stream Copy)";
        case METHOD_SMART_CUT:        return "Near-Lossless (Smart Cut)";
        case METHOD_RE_ENCODED:       return "Re-encoded (Quality Loss)";
        case METHOD_FALLBACK_ENCODED: return "Fallback Encoded (Quality Loss)";
        case METHOD_FAILED:           return "Failed";
    }
    return "Failed";
}
