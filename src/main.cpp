#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QException>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTextStream>

#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "Config.h"
#include "Errors.h"
#include "GraphExtractor.h"
#include "ImageLoader.h"
#include "Logger.h"
#include "ResultSerializer.h"

#ifdef GRAPHSCAN_HAS_TESSERACT
#include "TesseractOcrEngine.h"
#endif

namespace {

struct Job {
    QString path;
    QFuture<graphscan::DetectionResultPtr> future;
};

std::vector<QString> collectInputs(const QStringList &arguments, bool &ok)
{
    graphscan::ImageLoader loader;
    std::vector<QString> inputs;
    ok = true;
    for (const QString &argument : arguments) {
        const QFileInfo info(argument);
        if (info.isDir()) {
            for (const auto &file : loader.gatherImageFiles(argument.toStdString())) {
                inputs.push_back(QString::fromStdString(file));
            }
        } else if (info.isFile()) {
            inputs.push_back(info.filePath());
        } else {
            QTextStream(stderr) << "Input does not exist: " << argument << Qt::endl;
            ok = false;
        }
    }
    return inputs;
}

bool writeResult(const QString &outputDir, const QString &inputPath, const QByteArray &json)
{
    const QString target = QDir(outputDir).filePath(QFileInfo(inputPath).completeBaseName() + QStringLiteral(".graph.json"));
    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        QTextStream(stderr) << "Cannot write " << target << ": " << file.errorString() << Qt::endl;
        return false;
    }
    if (file.write(json) != json.size()) {
        file.cancelWriting();
        QTextStream(stderr) << "Short write to " << target << Qt::endl;
        return false;
    }
    return file.commit();
}

std::shared_ptr<graphscan::OcrEngine> makeOcrEngine(const graphscan::TextConfig &text)
{
    if (!text.enabled) {
        return nullptr;
    }
#ifdef GRAPHSCAN_HAS_TESSERACT
    return std::make_shared<graphscan::TesseractOcrEngine>(text.tessdataPath);
#else
    graphscan::Logger::warning(QStringLiteral("Built without Tesseract; labels will be reported as unavailable"));
    return nullptr;
#endif
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("graphscan"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Extract nodes, edges and labels from diagram images"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("inputs"), QStringLiteral("Image files or directories."),
                                 QStringLiteral("<image|dir>..."));

    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                    QStringLiteral("Directory for <name>.graph.json files. Defaults to stdout."),
                                    QStringLiteral("dir"));
    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("Pipeline configuration JSON."), QStringLiteral("file"));
    QCommandLineOption cacheDirOption(QStringLiteral("cache-dir"),
                                      QStringLiteral("Directory of the durable result cache."), QStringLiteral("dir"));
    QCommandLineOption noCacheOption(QStringLiteral("no-cache"), QStringLiteral("Disable the result cache."));
    QCommandLineOption noOcrOption(QStringLiteral("no-ocr"), QStringLiteral("Skip text recognition."));
    QCommandLineOption tessdataOption(QStringLiteral("tessdata"),
                                      QStringLiteral("Tesseract language data directory."), QStringLiteral("dir"));
    QCommandLineOption langOption({QStringLiteral("l"), QStringLiteral("lang")},
                                  QStringLiteral("OCR language, repeatable (e.g. eng)."), QStringLiteral("code"));
    QCommandLineOption compactOption(QStringLiteral("compact"), QStringLiteral("Write single-line JSON."));
    QCommandLineOption dumpConfigOption(QStringLiteral("dump-config"),
                                        QStringLiteral("Print the effective configuration and exit."));
    QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                     QStringLiteral("Log per-stage debug output."));

    parser.addOption(outputOption);
    parser.addOption(configOption);
    parser.addOption(cacheDirOption);
    parser.addOption(noCacheOption);
    parser.addOption(noOcrOption);
    parser.addOption(tessdataOption);
    parser.addOption(langOption);
    parser.addOption(compactOption);
    parser.addOption(dumpConfigOption);
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        graphscan::Logger::setMinimumLevel(QtDebugMsg);
    }

    graphscan::PipelineConfig config;
    if (parser.isSet(configOption)) {
        QString error;
        if (!graphscan::loadPipelineConfig(parser.value(configOption), config, &error)) {
            QTextStream(stderr) << "Cannot load configuration: " << error << Qt::endl;
            return 1;
        }
    }
    if (parser.isSet(cacheDirOption)) {
        config.cache.directory = parser.value(cacheDirOption);
    }
    if (parser.isSet(noCacheOption)) {
        config.cache.enabled = false;
    }
    if (parser.isSet(noOcrOption)) {
        config.text.enabled = false;
    }
    if (parser.isSet(tessdataOption)) {
        config.text.tessdataPath = parser.value(tessdataOption);
    }
    if (parser.isSet(langOption)) {
        config.text.languages = parser.values(langOption);
    }
    config = graphscan::sanitizeConfig(config);

    if (parser.isSet(dumpConfigOption)) {
        QTextStream(stdout) << QJsonDocument(graphscan::pipelineConfigToJson(config)).toJson(QJsonDocument::Indented);
        return 0;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        QTextStream(stderr) << "Error: at least one input image or directory is required." << Qt::endl;
        parser.showHelp(1);
    }

    const QString outputDir = parser.value(outputOption);
    if (!outputDir.isEmpty() && !QDir().mkpath(outputDir)) {
        QTextStream(stderr) << "Cannot create output directory: " << outputDir << Qt::endl;
        return 1;
    }

    std::vector<QString> inputs;
    bool inputsOk = false;
    try {
        inputs = collectInputs(positional, inputsOk);
    } catch (const graphscan::GraphScanError &ex) {
        QTextStream(stderr) << ex.what() << Qt::endl;
        return 1;
    }
    if (inputs.empty()) {
        QTextStream(stderr) << "No supported images found." << Qt::endl;
        return 1;
    }

    int failures = inputsOk ? 0 : 1;
    const auto format = parser.isSet(compactOption) ? QJsonDocument::Compact : QJsonDocument::Indented;
    try {
        graphscan::GraphExtractor extractor(config, makeOcrEngine(config.text));
        graphscan::ImageLoader loader;

        const auto finish = [&](Job &job) {
            graphscan::DetectionResultPtr result;
            try {
                result = job.future.result();
            } catch (const QUnhandledException &ex) {
                QString reason = QStringLiteral("unknown error");
                try {
                    if (ex.exception()) {
                        std::rethrow_exception(ex.exception());
                    }
                } catch (const std::exception &inner) {
                    reason = QString::fromUtf8(inner.what());
                } catch (...) {
                    reason = QStringLiteral("non-standard exception");
                }
                QTextStream(stderr) << job.path << ": " << reason << Qt::endl;
                ++failures;
                return;
            }

            const QByteArray json = QJsonDocument(graphscan::ResultSerializer::toJson(*result)).toJson(format);
            if (outputDir.isEmpty()) {
                QTextStream(stdout) << json;
            } else if (!writeResult(outputDir, job.path, json)) {
                ++failures;
            }
        };

        // Decoded images stay in memory until their job finishes, so only as many
        // jobs as there are workers are in flight. Results keep input order.
        const size_t maxInFlight = static_cast<size_t>(std::max(1, extractor.workerCount()));
        std::deque<Job> jobs;
        for (const QString &path : inputs) {
            if (jobs.size() >= maxInFlight) {
                finish(jobs.front());
                jobs.pop_front();
            }
            try {
                jobs.push_back({path, extractor.extractAsync(loader.loadImage(path.toStdString()))});
            } catch (const graphscan::InvalidImage &ex) {
                QTextStream(stderr) << path << ": " << ex.what() << Qt::endl;
                ++failures;
            }
        }
        while (!jobs.empty()) {
            finish(jobs.front());
            jobs.pop_front();
        }
    } catch (const graphscan::GraphScanError &ex) {
        QTextStream(stderr) << "graphscan: " << ex.what() << Qt::endl;
        return 2;
    }

    return failures == 0 ? 0 : 2;
}
