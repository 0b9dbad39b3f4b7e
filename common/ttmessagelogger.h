/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttmessagelogger.h                                                */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTMESSAGELOGGER
// Process wide message logger (console and optional log file)
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

#ifndef TTMESSAGELOGGER_H
#define TTMESSAGELOGGER_H

#include <QString>
#include <QMutex>

struct TTLosslessSettings;

class TTMessageLogger
{
  public:
    enum MsgType
    {
      INFO,
      WARNING,
      ERROR,
      FATAL,
      DEBUG
    };

    static TTMessageLogger* getInstance();

    void configure(const TTLosslessSettings& settings);

    void infoMsg(const QString& caller, int line, const QString& msgString);
    void warningMsg(const QString& caller, int line, const QString& msgString);
    void errorMsg(const QString& caller, int line, const QString& msgString);
    void fatalMsg(const QString& caller, int line, const QString& msgString);
    void debugMsg(const QString& caller, int line, const QString& msgString);

  private:
    TTMessageLogger();
    TTMessageLogger(const TTMessageLogger&);
    TTMessageLogger& operator=(const TTMessageLogger&);

    void writeMsg(MsgType type, const QString& caller, int line, const QString& msgString);
    static QString typeToString(MsgType type);

    QMutex  mMutex;
    bool    mLogConsole;
    bool    mLogExtended;
    bool    mLogToFile;
    QString mLogFileName;
};

#endif //TTMESSAGELOGGER_H
