/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttexception.cpp                                                  */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTEXCEPTION
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

#include "ttexception.h"

#include <QFileInfo>

/* /////////////////////////////////////////////////////////////////////////////
 * Constructor without source location
 */
TTException::TTException(const QString& msg)
  : mLine(0)
  , mMessage(msg)
{
  mWhat = mMessage.toUtf8();
}

/* /////////////////////////////////////////////////////////////////////////////
 * Constructor with source location (use __FILE__, __LINE__)
 */
TTException::TTException(const QString& fileName, int line, const QString& msg)
  : mFileName(QFileInfo(fileName).fileName())
  , mLine(line)
  , mMessage(msg)
{
  mWhat = getMessage().toUtf8();
}

/* /////////////////////////////////////////////////////////////////////////////
 * Message text, prefixed with the source location if known
 */
QString TTException::getMessage() const
{
  if (mFileName.isEmpty())
    return mMessage;

  return QString("%1 (%2:%3)").arg(mMessage).arg(mFileName).arg(mLine);
}

const char* TTException::what() const throw()
{
  return mWhat.constData();
}
