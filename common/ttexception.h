/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttexception.h                                                    */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTEXCEPTION
// Exception classes for precondition and programming errors
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

#ifndef TTEXCEPTION_H
#define TTEXCEPTION_H

#include <QString>
#include <QByteArray>

#include <exception>

// -----------------------------------------------------------------------------
// TTException
// Base class; carries the source location where the exception was raised
// -----------------------------------------------------------------------------
class TTException : public std::exception
{
  public:
    explicit TTException(const QString& msg);
    TTException(const QString& fileName, int line, const QString& msg);
    virtual ~TTException() throw() {}

    QString getMessage() const;
    QString fileName() const { return mFileName; }
    int     line() const { return mLine; }

    virtual QString exceptionName() const { return "TTException"; }
    const char* what() const throw() override;

  protected:
    QString    mFileName;
    int        mLine;
    QString    mMessage;
    QByteArray mWhat;
};

// -----------------------------------------------------------------------------
// Invalid argument: a caller violated a documented precondition
// -----------------------------------------------------------------------------
class TTInvalidArgumentException : public TTException
{
  public:
    explicit TTInvalidArgumentException(const QString& msg)
      : TTException(msg) {}
    TTInvalidArgumentException(const QString& fileName, int line, const QString& msg)
      : TTException(fileName, line, msg) {}

    QString exceptionName() const override { return "TTInvalidArgumentException"; }
};

// -----------------------------------------------------------------------------
// File not found
// -----------------------------------------------------------------------------
class TTFileNotFoundException : public TTException
{
  public:
    explicit TTFileNotFoundException(const QString& msg)
      : TTException(msg) {}
    TTFileNotFoundException(const QString& fileName, int line, const QString& msg)
      : TTException(fileName, line, msg) {}

    QString exceptionName() const override { return "TTFileNotFoundException"; }
};

#endif //TTEXCEPTION_H
