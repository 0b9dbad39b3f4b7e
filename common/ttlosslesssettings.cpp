/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesssettings.cpp                                           */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSSETTINGS
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

#include "ttlosslesssettings.h"
#include "../avstream/ttkeyframelocator.h"

#include <QDir>

// /////////////////////////////////////////////////////////////////////////////
// -----------------------------------------------------------------------------
// TTLossless settings object
// -----------------------------------------------------------------------------
// /////////////////////////////////////////////////////////////////////////////
TTLosslessSettingsReader::TTLosslessSettingsReader()
  : QSettings("TTCut-ng", "TTLossless")
{
}

TTLosslessSettingsReader::TTLosslessSettingsReader(const QString& iniFile)
  : QSettings(iniFile, QSettings::IniFormat)
{
}

TTLosslessSettingsReader::~TTLosslessSettingsReader()
{
}

TTLosslessSettings TTLosslessSettingsReader::readSettings()
{
  TTLosslessSettings s;

  beginGroup( "/Settings" );

  // External tools
  // ---------------------------------------------------------------------------
  beginGroup( "/Tools" );
  s.ffmpegPath  = value( "FFmpegPath",  s.ffmpegPath ).toString();
  s.ffprobePath = value( "FFprobePath", s.ffprobePath ).toString();
  endGroup();

  // Keyframe detection
  // ---------------------------------------------------------------------------
  beginGroup( "/Keyframes" );
  s.exactScanTimeoutMs     = value( "ExactScanTimeout",     s.exactScanTimeoutMs ).toInt();
  s.frameTypeScanTimeoutMs = value( "FrameTypeScanTimeout", s.frameTypeScanTimeoutMs ).toInt();
  s.syntheticGopInterval   = value( "SyntheticGopInterval", s.syntheticGopInterval ).toDouble();
  endGroup();

  // Alignment
  // ---------------------------------------------------------------------------
  beginGroup( "/Alignment" );
  s.alignTolerance = value( "Tolerance",  s.alignTolerance ).toDouble();
  s.snapWindow     = value( "SnapWindow", s.snapWindow ).toDouble();
  endGroup();

  // Encoder
  // ---------------------------------------------------------------------------
  beginGroup( "/Encoder" );
  s.smartCutCrf        = value( "SmartCutCrf",        s.smartCutCrf ).toInt();
  s.reencodeCrf        = value( "ReencodeCrf",        s.reencodeCrf ).toInt();
  s.encoderPreset      = value( "Preset",             s.encoderPreset ).toString();
  s.videoCodec         = value( "VideoCodec",         s.videoCodec ).toString();
  s.audioCodec         = value( "AudioCodec",         s.audioCodec ).toString();
  s.audioBitrate       = value( "AudioBitrate",       s.audioBitrate ).toString();
  s.fallbackVideoCodec = value( "FallbackVideoCodec", s.fallbackVideoCodec ).toString();
  s.fallbackQScale     = value( "FallbackQScale",     s.fallbackQScale ).toInt();
  endGroup();

  // Timeouts
  // ---------------------------------------------------------------------------
  beginGroup( "/Timeouts" );
  s.streamCopyTimeoutMs = value( "StreamCopy", s.streamCopyTimeoutMs ).toInt();
  s.smartCutTimeoutMs   = value( "SmartCut",   s.smartCutTimeoutMs ).toInt();
  s.reencodeTimeoutMs   = value( "Reencode",   s.reencodeTimeoutMs ).toInt();
  s.fallbackTimeoutMs   = value( "Fallback",   s.fallbackTimeoutMs ).toInt();
  endGroup();

  // Quality analysis
  // ---------------------------------------------------------------------------
  beginGroup( "/Quality" );
  s.qualityTimeoutMs = value( "Timeout",    s.qualityTimeoutMs ).toInt();
  s.enableVmaf       = value( "EnableVmaf", s.enableVmaf ).toBool();
  endGroup();

  // Common options
  // ---------------------------------------------------------------------------
  beginGroup( "/Common" );
  s.tempDirPath = value( "TempDirPath", s.tempDirPath ).toString();
  endGroup();

  // Log file
  // --------------------------------------------------------------------------
  beginGroup( "/LogFile" );
  s.createLogFile   = value( "CreateLogFile",   s.createLogFile ).toBool();
  s.logModeConsole  = value( "LogModeConsole",  s.logModeConsole ).toBool();
  s.logModeExtended = value( "LogModeExtended", s.logModeExtended ).toBool();
  s.logFilePath     = value( "LogFilePath",     s.logFilePath ).toString();
  endGroup();

  endGroup(); // settings

  // too short a GOP interval would flood the synthetic keyframe list
  if (!(s.syntheticGopInterval >= TTKeyframeLocator::MinGopInterval))
    s.syntheticGopInterval = TTLosslessSettings().syntheticGopInterval;

  // a configured temporary directory must exist, otherwise we write next
  // to the output file
  if (!s.tempDirPath.isEmpty() && !QDir(s.tempDirPath).exists())
    s.tempDirPath.clear();

  return s;
}

void TTLosslessSettingsReader::writeSettings(const TTLosslessSettings& s)
{
  beginGroup( "/Settings" );

  beginGroup( "/Tools" );
  setValue( "FFmpegPath",  s.ffmpegPath );
  setValue( "FFprobePath", s.ffprobePath );
  endGroup();

  beginGroup( "/Keyframes" );
  setValue( "ExactScanTimeout",     s.exactScanTimeoutMs );
  setValue( "FrameTypeScanTimeout", s.frameTypeScanTimeoutMs );
  setValue( "SyntheticGopInterval", s.syntheticGopInterval );
  endGroup();

  beginGroup( "/Alignment" );
  setValue( "Tolerance",  s.alignTolerance );
  setValue( "SnapWindow", s.snapWindow );
  endGroup();

  beginGroup( "/Encoder" );
  setValue( "SmartCutCrf",        s.smartCutCrf );
  setValue( "ReencodeCrf",        s.reencodeCrf );
  setValue( "Preset",             s.encoderPreset );
  setValue( "VideoCodec",         s.videoCodec );
  setValue( "AudioCodec",         s.audioCodec );
  setValue( "AudioBitrate",       s.audioBitrate );
  setValue( "FallbackVideoCodec", s.fallbackVideoCodec );
  setValue( "FallbackQScale",     s.fallbackQScale );
  endGroup();

  beginGroup( "/Timeouts" );
  setValue( "StreamCopy", s.streamCopyTimeoutMs );
  setValue( "SmartCut",   s.smartCutTimeoutMs );
  setValue( "Reencode",   s.reencodeTimeoutMs );
  setValue( "Fallback",   s.fallbackTimeoutMs );
  endGroup();

  beginGroup( "/Quality" );
  setValue( "Timeout",    s.qualityTimeoutMs );
  setValue( "EnableVmaf", s.enableVmaf );
  endGroup();

  beginGroup( "/Common" );
  setValue( "TempDirPath", s.tempDirPath );
  endGroup();

  beginGroup( "/LogFile" );
  setValue( "CreateLogFile",   s.createLogFile );
  setValue( "LogModeConsole",  s.logModeConsole );
  setValue( "LogModeExtended", s.logModeExtended );
  setValue( "LogFilePath",     s.logFilePath );
  endGroup();

  endGroup(); // settings

  sync();
}
