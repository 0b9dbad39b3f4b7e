/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttmessagelogger.cpp                                              */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTMESSAGELOGGER
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

#include "ttmessagelogger.h"
#include "ttlosslesssettings.h"

#include <QDebug>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTextStream>

/* /////////////////////////////////////////////////////////////////////////////
 * Returns the logger instance; created on first use
 */
TTMessageLogger* TTMessageLogger::getInstance()
{
  static TTMessageLogger instance;
  return &instance;
}

/* /////////////////////////////////////////////////////////////////////////////
 * Constructor; console logging only until configure() is called
 */
TTMessageLogger::TTMessageLogger()
{
  mLogConsole  = true;
  mLogExtended = false;
  mLogToFile   = false;
}

/* /////////////////////////////////////////////////////////////////////////////
 * Apply log settings
 */
void TTMessageLogger::configure(const TTLosslessSettings& settings)
{
  QMutexLocker locker(&mMutex);

  mLogConsole  = settings.logModeConsole;
  mLogExtended = settings.logModeExtended;
  mLogToFile   = settings.createLogFile;

  mLogFileName = settings.logFilePath;
  if (mLogToFile && mLogFileName.isEmpty())
    mLogFileName = QDir(QDir::tempPath()).filePath("ttlossless.log");
}

void TTMessageLogger::infoMsg(const QString& caller, int line, const QString& msgString)
{
  writeMsg(INFO, caller, line, msgString);
}

void TTMessageLogger::warningMsg(const QString& caller, int line, const QString& msgString)
{
  writeMsg(WARNING, caller, line, msgString);
}

void TTMessageLogger::errorMsg(const QString& caller, int line, const QString& msgString)
{
  writeMsg(ERROR, caller, line, msgString);
}

void TTMessageLogger::fatalMsg(const QString& caller, int line, const QString& msgString)
{
  writeMsg(FATAL, caller, line, msgString);
}

void TTMessageLogger::debugMsg(const QString& caller, int line, const QString& msgString)
{
  writeMsg(DEBUG, caller, line, msgString);
}

/* /////////////////////////////////////////////////////////////////////////////
 * Write message to console and/or log file
 * Debug messages are only written in extended mode
 */
void TTMessageLogger::writeMsg(MsgType type, const QString& caller, int line, const QString& msgString)
{
  QMutexLocker locker(&mMutex);

  if (type == DEBUG && !mLogExtended)
    return;

  QString msg = (mLogExtended)
      ? QString("%1 [%2:%3] %4").arg(typeToString(type))
                                .arg(QFileInfo(caller).fileName())
                                .arg(line)
                                .arg(msgString)
      : QString("%1 %2").arg(typeToString(type)).arg(msgString);

  if (mLogConsole) {
    if (type == ERROR || type == FATAL || type == WARNING)
      qWarning().noquote() << msg;
    else
      qDebug().noquote() << msg;
  }

  if (!mLogToFile)
    return;

  QFile logFile(mLogFileName);
  if (!logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
    qWarning() << "Cannot open log file" << mLogFileName << "- file logging disabled";
    mLogToFile = false;
    return;
  }

  QTextStream out(&logFile);
  out << QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz")
      << " " << msg << "\n";
}

QString TTMessageLogger::typeToString(MsgType type)
{
  switch (type) {
    case INFO:    return "INFO";
    case WARNING: return "WARN";
    case ERROR:   return "ERROR";
    case FATAL:   return "FATAL";
    case DEBUG:   return "DEBUG";
  }
  return "INFO";
}
