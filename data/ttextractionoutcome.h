/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttextractionoutcome.h                                            */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTEXTRACTIONOUTCOME
// Immutable result of one clip extraction
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

#ifndef TTEXTRACTIONOUTCOME_H
#define TTEXTRACTIONOUTCOME_H

#include <QString>
#include <QStringList>
#include <QtGlobal>

// ----------------------------------------------------------------------------
// Extraction method that produced the output
// ----------------------------------------------------------------------------
enum TTExtractionMethod {
    METHOD_STREAM_COPY = 0,     // no re-encoding
    METHOD_SMART_CUT,           // re-encode between bracketing keyframes
    METHOD_RE_ENCODED,          // full re-encode at high quality
    METHOD_FALLBACK_ENCODED,    // alternate or default encoder
    METHOD_FAILED
};

// ----------------------------------------------------------------------------
// TTExtractionOutcome class
// ----------------------------------------------------------------------------
class TTExtractionOutcome
{
public:
    TTExtractionOutcome(TTExtractionMethod method,
                        bool keyframeAligned,
                        double processingTime,
                        qint64 outputFileSize,
                        const QStringList& warnings);

    static TTExtractionOutcome failed(bool keyframeAligned,
                                      double processingTime,
                                      const QStringList& warnings);

    bool               success() const { return mMethod != METHOD_FAILED; }
    TTExtractionMethod methodUsed() const { return mMethod; }
    bool               qualityPreserved() const;
    bool               keyframeAligned() const { return mKeyframeAligned; }
    double             processingTime() const { return mProcessingTime; }
    qint64             outputFileSize() const { return mOutputFileSize; }
    const QStringList& warnings() const { return mWarnings; }

    // "stream_copy", "smart_cut", ...
    static QString methodToString(TTExtractionMethod method);
    // "Lossless (Stream Copy)", ...
    static QString methodLabel(TTExtractionMethod method);
    static bool    methodPreservesQuality(TTExtractionMethod method);

private:
    TTExtractionMethod mMethod;
    bool               mKeyframeAligned;
    double             mProcessingTime;
    qint64             mOutputFileSize;
    QStringList        mWarnings;
};

#endif // TTEXTRACTIONOUTCOME_H
