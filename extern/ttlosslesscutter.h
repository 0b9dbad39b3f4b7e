/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesscutter.h                                               */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSCUTTER
// Clip extraction with a fixed fallback chain:
// stream copy -> smart cut -> quality re-encode -> fallback encode
// The first tier producing an output file wins
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

#ifndef TTLOSSLESSCUTTER_H
#define TTLOSSLESSCUTTER_H

#include "../avstream/ttkeyframelocator.h"
#include "../avstream/ttmediainfo.h"
#include "../data/ttcutalignment.h"
#include "../data/ttextractionoutcome.h"

#include <QString>
#include <QStringList>
#include <QList>

#include <functional>

struct TTLosslessSettings;
class  TTProcessRunner;
class  QElapsedTimer;

// ----------------------------------------------------------------------------
// TTLosslessCutter class
// Holds no state between calls; one instance may serve many requests as long
// as the runner and probe it was given do the same.
// ----------------------------------------------------------------------------
class TTLosslessCutter
{
public:
    TTLosslessCutter(const TTLosslessSettings& settings,
                     TTProcessRunner& runner,
                     TTMediaProbe& probe);
    ~TTLosslessCutter();

    // Locate keyframes, evaluate alignment and extract
    TTExtractionOutcome cut(const TTCutRequest& request);

    // Extract with a given keyframe list and alignment; notes are prepended
    // to the outcome warnings
    TTExtractionOutcome extract(const TTCutRequest& request,
                                const TTKeyframeList& keyframes,
                                const TTAlignmentResult& alignment,
                                const QStringList& notes = QStringList());

private:
    enum TierStatus {
        TIER_SKIPPED = 0,
        TIER_FAILED,
        TIER_SUCCEEDED
    };

    // Everything a tier needs; outputFile lies inside the scoped temp dir
    struct TierContext {
        const TTCutRequest&      request;
        const TTKeyframeList&    keyframes;
        const TTAlignmentResult& alignment;
        const TTMediaInfo&       mediaInfo;
        bool                     hasMediaInfo;
        QString                  outputFile;
        QStringList&             warnings;
    };

    typedef std::function<TierStatus(TierContext&)> TierFunction;

    struct Tier {
        TTExtractionMethod method;
        QString            name;
        TierFunction       run;
    };

    QList<Tier> tiers();

    TierStatus streamCopy(TierContext& ctx);
    TierStatus smartCut(TierContext& ctx);
    TierStatus qualityReencode(TierContext& ctx);
    TierStatus fallbackEncode(TierContext& ctx);

    TTExtractionOutcome runTiers(const TTCutRequest& request,
                                 const TTKeyframeList& keyframes,
                                 const TTAlignmentResult& alignment,
                                 const QStringList& notes,
                                 const QElapsedTimer& timer);

    TTExtractionOutcome failedOutcome(const TTCutRequest& request,
                                      bool keyframeAligned,
                                      const QElapsedTimer& timer,
                                      const QStringList& warnings);

    bool runFFmpeg(const QString& tierName, const QStringList& args,
                   const QString& outputFile, int timeoutMs, QString& reason);

    // Command line building blocks
    QStringList commonArgs() const;
    QStringList inputArgs(double seek, const QString& source, double duration) const;
    QStringList videoEncodeArgs(int crf) const;
    QStringList audioEncodeArgs(const TierContext& ctx) const;
    QStringList containerArgs(const QString& outputFile) const;

    QString temporaryDirTemplate(const QString& outputPath) const;

    static bool    moveIntoPlace(const QString& tempFile, const QString& outputPath);
    static bool    expectsAudio(const TierContext& ctx);
    static QString formatTime(double seconds);
    static double  elapsedSeconds(const QElapsedTimer& timer);

    const TTLosslessSettings& mSettings;
    TTProcessRunner&          mRunner;
    TTMediaProbe&             mProbe;
};

#endif // TTLOSSLESSCUTTER_H
