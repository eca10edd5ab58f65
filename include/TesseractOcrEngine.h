#pragma once

#include <QString>

#include <memory>
#include <mutex>

#include "OcrEngine.h"

namespace tesseract {
class TessBaseAPI;
}

namespace graphscan {

// Word-level recognition through libtesseract. The API handle is re-initialised
// when the requested language set changes and is serialised by a mutex.
class TesseractOcrEngine : public OcrEngine {
public:
    explicit TesseractOcrEngine(const QString &tessdataPath = QString());
    ~TesseractOcrEngine() override;

    TesseractOcrEngine(const TesseractOcrEngine &) = delete;
    TesseractOcrEngine &operator=(const TesseractOcrEngine &) = delete;

    std::vector<TextRegion> recognize(const cv::Mat &region, const QStringList &languages) override;

private:
    void ensureInitialised(const QString &languageKey);

    QString m_tessdataPath;
    QString m_loadedLanguages;
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
    std::mutex m_mutex;
};

} // namespace graphscan
