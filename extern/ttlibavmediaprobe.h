/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlibavmediaprobe.h                                              */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLIBAVMEDIAPROBE
// Media probe on top of libavformat (in-process, no external tool)
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

#ifndef TTLIBAVMEDIAPROBE_H
#define TTLIBAVMEDIAPROBE_H

#include "../avstream/ttmediainfo.h"

#include <QString>

// Forward declarations for libav types (avoid including C headers in .h)
struct AVFormatContext;

// ----------------------------------------------------------------------------
// TTLibavMediaProbe class
// ----------------------------------------------------------------------------
class TTLibavMediaProbe : public TTMediaProbe
{
public:
    TTLibavMediaProbe();
    ~TTLibavMediaProbe();

    // Initialize libav (call once at startup, safe to call again)
    static void initializeFFmpeg();

    bool probe(const QString& filePath, TTMediaInfo& info) override;

    QString lastError() const override { return mLastError; }

private:
    QString mLastError;
    void setError(const QString& error);

    static double   formatDuration(AVFormatContext* formatCtx, int videoStreamIndex);
    static QString  avErrorToString(int errnum);
};

#endif // TTLIBAVMEDIAPROBE_H
