/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesscompatibility.h                                        */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSCOMPATIBILITY
// Predicts whether a file can be cut by stream copy
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

#ifndef TTLOSSLESSCOMPATIBILITY_H
#define TTLOSSLESSCOMPATIBILITY_H

#include "../avstream/ttmediainfo.h"

#include <QString>
#include <QStringList>

struct TTCompatibilityReport
{
    bool        compatible = false;
    QString     videoCodec;
    QString     audioCodec;
    QString     containerFormat;
    bool        hasBFrames = false;
    QStringList warnings;
};

class TTLosslessCompatibility
{
public:
    explicit TTLosslessCompatibility(TTMediaProbe& probe);

    TTCompatibilityReport check(const QString& filePath);

    static TTCompatibilityReport evaluate(const TTMediaInfo& mediaInfo);

    static bool isSupportedVideoCodec(const QString& codec);
    static bool isSupportedAudioCodec(const QString& codec);
    // format names may be a comma separated list ("mov,mp4,m4a,3gp,3g2,mj2")
    static bool isSupportedContainer(const QString& formatName);

    static const QStringList& supportedVideoCodecs();
    static const QStringList& supportedAudioCodecs();
    static const QStringList& supportedContainers();

private:
    TTMediaProbe& mProbe;
};

#endif // TTLOSSLESSCOMPATIBILITY_H
