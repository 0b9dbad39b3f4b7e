/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttprocessrunner.cpp                                              */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTPROCESSRUNNER
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

#include "ttprocessrunner.h"

#include "../common/ttmessagelogger.h"

#include <QProcess>

// Time allowed for the executable to come up
static const int sStartTimeoutMs = 5000;

// Time allowed for a killed process to go away
static const int sKillTimeoutMs  = 3000;

// -----------------------------------------------------------------------------
// Last lines of stderr
// -----------------------------------------------------------------------------
QString TTProcessResult::stdErrTail(int maxLines) const
{
  QStringList lines = QString::fromUtf8(stdErr).split('\n', Qt::SkipEmptyParts);

  if (lines.size() > maxLines)
    lines = lines.mid(lines.size() - maxLines);

  return lines.join("\n").trimmed();
}

// -----------------------------------------------------------------------------
// Failure reason for warnings (never contains raw stderr)
// -----------------------------------------------------------------------------
QString TTProcessResult::failureReason() const
{
  if (!started)  return "tool could not be started";
  if (timedOut)  return "timed out";
  if (crashed)   return "tool crashed";
  if (exitCode != 0)
    return QString("exit code %1").arg(exitCode);
  return QString();
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TTQProcessRunner::TTQProcessRunner()
{
}

// -----------------------------------------------------------------------------
// Destructor
// -----------------------------------------------------------------------------
TTQProcessRunner::~TTQProcessRunner()
{
}

// -----------------------------------------------------------------------------
// Run program with arguments and wait until it finishes or the timeout
// expires. A process exceeding the timeout is killed.
// -----------------------------------------------------------------------------
TTProcessResult TTQProcessRunner::run(const QString& program,
                                      const QStringList& args,
                                      int timeoutMs)
{
  TTProcessResult result;
  mLastError.clear();

  TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__,
      QString("TTQProcessRunner: %1 %2").arg(program).arg(args.join(" ")));

  QProcess proc;
  proc.start(program, args);

  if (!proc.waitForStarted(sStartTimeoutMs)) {
    setError(QString("%1 failed to start: %2").arg(program).arg(proc.errorString()));
    return result;
  }
  result.started = true;

  if (!proc.waitForFinished(timeoutMs)) {
    setError(QString("%1 timed out after %2 ms").arg(program).arg(timeoutMs));
    result.timedOut = true;
    proc.kill();
    proc.waitForFinished(sKillTimeoutMs);
    result.stdErr = proc.readAllStandardError();
    return result;
  }

  result.stdOut   = proc.readAllStandardOutput();
  result.stdErr   = proc.readAllStandardError();
  result.crashed  = (proc.exitStatus() == QProcess::CrashExit);
  result.exitCode = proc.exitCode();

  if (!result.succeeded())
    setError(QString("%1 failed: %2").arg(program).arg(result.failureReason()));

  return result;
}

// -----------------------------------------------------------------------------
// Set error message
// -----------------------------------------------------------------------------
void TTQProcessRunner::setError(const QString& error)
{
  mLastError = error;
  TTMessageLogger::getInstance()->debugMsg(__FILE__, __LINE__, error);
}
