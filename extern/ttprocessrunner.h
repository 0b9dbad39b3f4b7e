/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttprocessrunner.h                                                */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTPROCESSRUNNER
// Runs external tools (ffmpeg/ffprobe) with a hard timeout
// TTProcessRunner is the seam the engine is tested through
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

#ifndef TTPROCESSRUNNER_H
#define TTPROCESSRUNNER_H

#include <QString>
#include <QStringList>
#include <QByteArray>

// -----------------------------------------------------------------------------
// Result of one external process invocation
// -----------------------------------------------------------------------------
struct TTProcessResult
{
    bool       started  = false;   // process could be launched
    bool       timedOut = false;   // killed after the timeout expired
    bool       crashed  = false;
    int        exitCode = -1;
    QByteArray stdOut;
    QByteArray stdErr;

    bool succeeded() const { return started && !timedOut && !crashed && exitCode == 0; }

    // Last lines of stderr, for log messages only
    QString stdErrTail(int maxLines = 8) const;

    // Short human readable failure reason
    QString failureReason() const;
};

// -----------------------------------------------------------------------------
// TTProcessRunner
// -----------------------------------------------------------------------------
class TTProcessRunner
{
  public:
    virtual ~TTProcessRunner() {}

    virtual TTProcessResult run(const QString& program,
                                const QStringList& args,
                                int timeoutMs) = 0;
};

// -----------------------------------------------------------------------------
// TTQProcessRunner
// Blocking QProcess based implementation; usable from any worker thread
// -----------------------------------------------------------------------------
class TTQProcessRunner : public TTProcessRunner
{
  public:
    TTQProcessRunner();
    ~TTQProcessRunner();

    TTProcessResult run(const QString& program,
                        const QStringList& args,
                        int timeoutMs) override;

    QString lastError() const { return mLastError; }

  private:
    QString mLastError;
    void setError(const QString& error);
};

#endif // TTPROCESSRUNNER_H
