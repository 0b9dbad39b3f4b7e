/*
 * ttlosslesscut - cut a clip with the lossless extraction engine
 * Usage: ttlosslesscut [--snap] [--no-smart-cut] [--config file.ini] <input> <start> <end> <output>
 */

#include "../common/ttexception.h"
#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"
#include "../data/ttcutalignment.h"
#include "../data/ttextractionoutcome.h"
#include "../extern/ttlibavmediaprobe.h"
#include "../extern/ttlosslesscutter.h"
#include "../extern/ttprocessrunner.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QStringList>
#include <iostream>

static void printUsage()
{
    std::cerr << "Usage: ttlosslesscut [--snap] [--no-smart-cut] [--config file.ini]"
                 " <input> <start> <end> <output>" << std::endl;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    QStringList args = app.arguments().mid(1);
    QStringList positional;
    QString     configFile;
    bool        snap     = false;
    bool        smartCut = true;

    for (int i = 0; i < args.size(); i++) {
        if (args[i] == "--snap") {
            snap = true;
        } else if (args[i] == "--no-smart-cut") {
            smartCut = false;
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            configFile = args[++i];
        } else if (args[i].startsWith("--")) {
            std::cerr << "Unknown option: " << args[i].toStdString() << std::endl;
            printUsage();
            return 1;
        } else {
            positional << args[i];
        }
    }

    if (positional.size() != 4) {
        printUsage();
        return 1;
    }

    bool startOk = false;
    bool endOk   = false;
    double start = positional[1].toDouble(&startOk);
    double end   = positional[2].toDouble(&endOk);
    if (!startOk || !endOk) {
        std::cerr << "Start and end must be numbers in seconds" << std::endl;
        return 1;
    }

    try {
        if (!configFile.isEmpty() && !QFileInfo::exists(configFile))
            throw TTFileNotFoundException(__FILE__, __LINE__,
                QString("Config file not found: %1").arg(configFile));

        TTLosslessSettings settings = configFile.isEmpty()
                ? TTLosslessSettingsReader().readSettings()
                : TTLosslessSettingsReader(configFile).readSettings();
        TTMessageLogger::getInstance()->configure(settings);

        TTQProcessRunner  runner;
        TTLibavMediaProbe probe;
        TTLosslessCutter  cutter(settings, runner, probe);

        TTCutRequest        request(positional[0], start, end, positional[3], snap, smartCut);
        TTExtractionOutcome outcome = cutter.cut(request);

        std::cout << "Success:           " << (outcome.success() ? "yes" : "no") << std::endl;
        std::cout << "Method:            " << TTExtractionOutcome::methodLabel(outcome.methodUsed()).toStdString()
                  << " (" << TTExtractionOutcome::methodToString(outcome.methodUsed()).toStdString() << ")" << std::endl;
        std::cout << "Quality preserved: " << (outcome.qualityPreserved() ? "yes" : "no") << std::endl;
        std::cout << "Keyframe aligned:  " << (outcome.keyframeAligned() ? "yes" : "no") << std::endl;
        std::cout << "Processing time:   " << outcome.processingTime() << " s" << std::endl;
        std::cout << "Output size:       " << outcome.outputFileSize() << " bytes" << std::endl;

        for (const QString& warning : outcome.warnings())
            std::cout << "Warning: " << warning.toStdString() << std::endl;

        return outcome.success() ? 0 : 2;
    } catch (const TTException& ex) {
        std::cerr << ex.exceptionName().toStdString() << ": "
                  << ex.getMessage().toStdString() << std::endl;
        return 1;
    }
}
