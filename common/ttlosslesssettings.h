/*----------------------------------------------------------------------------*/
/* COPYRIGHT: MINIXJR (c) 2024-2026 / TTCut-ng                               */
/*----------------------------------------------------------------------------*/
/* PROJEKT  : TTLOSSLESS 2026                                                 */
/* FILE     : ttlosslesssettings.h                                             */
/*----------------------------------------------------------------------------*/
/* AUTHOR  : MINIXJR                                           DATE: 10/2026  */
/*----------------------------------------------------------------------------*/

// ----------------------------------------------------------------------------
// TTLOSSLESSSETTINGS
// Tool paths, timeouts and encoder presets for the extraction engine
// Built once at startup and handed to every component by const reference
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

#ifndef TTLOSSLESSSETTINGS_H
#define TTLOSSLESSSETTINGS_H

#include <QSettings>
#include <QString>

// -----------------------------------------------------------------------------
// Engine settings (value type, defaults match the tuned production values)
// -----------------------------------------------------------------------------
struct TTLosslessSettings
{
    // External tools
    QString ffmpegPath             = "ffmpeg";
    QString ffprobePath            = "ffprobe";

    // Keyframe detection
    int     exactScanTimeoutMs     = 10000;
    int     frameTypeScanTimeoutMs = 60000;
    double  syntheticGopInterval   = 2.0;     // assumed GOP length in seconds

    // Alignment
    double  alignTolerance         = 0.1;     // "already aligned" window
    double  snapWindow             = 1.0;     // window for forced snapping

    // Encoder presets
    int     smartCutCrf            = 18;
    int     reencodeCrf            = 18;
    QString encoderPreset          = "medium";
    QString videoCodec             = "libx264";
    QString audioCodec             = "aac";
    QString audioBitrate           = "192k";
    QString fallbackVideoCodec     = "mpeg4";
    int     fallbackQScale         = 2;

    // Per tier timeouts
    int     streamCopyTimeoutMs    = 60000;
    int     smartCutTimeoutMs      = 180000;
    int     reencodeTimeoutMs      = 300000;
    int     fallbackTimeoutMs      = 300000;

    // Quality analysis
    int     qualityTimeoutMs       = 300000;
    bool    enableVmaf             = true;

    // Temporary files (empty: directory of the output file)
    QString tempDirPath;

    // Logfile
    bool    createLogFile          = false;
    bool    logModeConsole         = true;
    bool    logModeExtended        = false;
    QString logFilePath;
};

// -----------------------------------------------------------------------------
// TTLosslessSettingsReader
// Reads/writes TTLosslessSettings from an ini file or the user settings store
// -----------------------------------------------------------------------------
class TTLosslessSettingsReader : public QSettings
{
  public:
    TTLosslessSettingsReader();
    explicit TTLosslessSettingsReader(const QString& iniFile);
    ~TTLosslessSettingsReader();

    TTLosslessSettings readSettings();
    void writeSettings(const TTLosslessSettings& settings);
};

#endif //TTLOSSLESSSETTINGS_H
