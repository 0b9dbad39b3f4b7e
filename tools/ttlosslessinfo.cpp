/*
 * ttlosslessinfo - keyframes and stream copy compatibility of a file
 * Usage: ttlosslessinfo <input>
 */

#include "../avstream/ttkeyframelocator.h"
#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"
#include "../extern/ttlibavmediaprobe.h"
#include "../extern/ttlosslesscompatibility.h"
#include "../extern/ttprocessrunner.h"

#include <QCoreApplication>
#include <iostream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    if (argc < 2) {
        std::cerr << "Usage: ttlosslessinfo <input>" << std::endl;
        return 1;
    }

    QString input = QString::fromLocal8Bit(argv[1]);

    TTLosslessSettings settings = TTLosslessSettingsReader().readSettings();
    TTMessageLogger::getInstance()->configure(settings);

    TTQProcessRunner  runner;
    TTLibavMediaProbe probe;

    TTMediaInfo info;
    if (probe.probe(input, info)) {
        std::cout << "Container: " << info.containerFormat.toStdString() << std::endl;
        std::cout << "Video:     " << info.videoCodec.toStdString()
                  << " " << info.width << "x" << info.height
                  << " @ " << info.frameRate << " fps" << std::endl;
        std::cout << "Audio:     " << (info.hasAudio() ? info.audioCodec.toStdString() : "-") << std::endl;
        std::cout << "Duration:  " << info.duration << " s" << std::endl;
    } else {
        std::cerr << "Probe failed: " << probe.lastError().toStdString() << std::endl;
    }

    TTKeyframeLocator locator(settings, runner, probe);
    TTKeyframeList    keyframes = locator.locateKeyframes(input);

    std::cout << "\nKeyframes (" << keyframes.size() << ", "
              << TTKeyframeLocator::strategyToString(locator.lastStrategy()).toStdString() << "):" << std::endl;
    int shown = 0;
    for (double keyframe : keyframes) {
        if (shown++ == 20) {
            std::cout << "  ..." << std::endl;
            break;
        }
        std::cout << "  " << keyframe << std::endl;
    }

    TTLosslessCompatibility compatibility(probe);
    TTCompatibilityReport   report = compatibility.check(input);

    std::cout << "\nStream copy compatible: " << (report.compatible ? "yes" : "no") << std::endl;
    std::cout << "B-frames:               " << (report.hasBFrames ? "yes" : "no") << std::endl;
    for (const QString& warning : report.warnings)
        std::cout << "Warning: " << warning.toStdString() << std::endl;

    return report.compatible ? 0 : 2;
}
