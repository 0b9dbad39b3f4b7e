/*
 * ttqualitycheck - objective quality of a processed file against its original
 * Usage: ttqualitycheck <original> <processed>
 */

#include "../common/ttlosslesssettings.h"
#include "../common/ttmessagelogger.h"
#include "../extern/ttprocessrunner.h"
#include "../extern/ttqualityanalyzer.h"

#include <QCoreApplication>
#include <iostream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    if (argc < 3) {
        std::cerr << "Usage: ttqualitycheck <original> <processed>" << std::endl;
        return 1;
    }

    TTLosslessSettings settings = TTLosslessSettingsReader().readSettings();
    TTMessageLogger::getInstance()->configure(settings);

    TTQProcessRunner  runner;
    TTQualityAnalyzer analyzer(settings, runner);

    TTQualityMetrics metrics = analyzer.analyzeQuality(QString::fromLocal8Bit(argv[1]),
                                                       QString::fromLocal8Bit(argv[2]));
    if (!metrics.success) {
        std::cerr << "Analysis failed: " << metrics.error.toStdString() << std::endl;
        return 2;
    }

    const TTQualityAssessment& a = metrics.assessment;

    std::cout << "SSIM:            " << metrics.ssim << " ("
              << TTQualityAnalyzer::gradeToString(a.ssimGrade).toStdString() << ")" << std::endl;
    std::cout << "PSNR:            " << metrics.psnr << " dB ("
              << TTQualityAnalyzer::gradeToString(a.psnrGrade).toStdString() << ")" << std::endl;
    if (metrics.hasVmaf) {
        std::cout << "VMAF:            " << metrics.vmaf << " ("
                  << TTQualityAnalyzer::gradeToString(a.vmafGrade).toStdString() << ")" << std::endl;
    }
    std::cout << "Size ratio:      " << metrics.fileSizeRatio << std::endl;
    std::cout << "Processing time: " << metrics.processingTime << " s" << std::endl;
    std::cout << "Overall:         " << TTQualityAnalyzer::verdictToString(a.overall).toStdString() << std::endl;

    return 0;
}
