#include "TesseractOcrEngine.h"

#include <algorithm>

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <opencv2/imgproc.hpp>

#include "Errors.h"
#include "ImageUtils.h"
#include "Logger.h"

namespace graphscan {

TesseractOcrEngine::TesseractOcrEngine(const QString &tessdataPath) : m_tessdataPath(tessdataPath) {}

TesseractOcrEngine::~TesseractOcrEngine()
{
    if (m_api) {
        m_api->End();
    }
}

void TesseractOcrEngine::ensureInitialised(const QString &languageKey)
{
    if (m_api && languageKey == m_loadedLanguages) {
        return;
    }
    if (m_api) {
        m_api->End();
        m_api.reset();
    }

    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const QByteArray dataPath = m_tessdataPath.toUtf8();
    const QByteArray language = languageKey.toUtf8();
    if (api->Init(m_tessdataPath.isEmpty() ? nullptr : dataPath.constData(), language.constData(),
                  tesseract::OEM_DEFAULT) != 0) {
        throw EngineUnavailable("Tesseract could not load language data '" + languageKey.toStdString() + "'");
    }
    api->SetPageSegMode(tesseract::PSM_SPARSE_TEXT);
    m_api = std::move(api);
    m_loadedLanguages = languageKey;
    Logger::info(QStringLiteral("Tesseract %1 initialised for %2")
                     .arg(QString::fromUtf8(tesseract::TessBaseAPI::Version()))
                     .arg(languageKey));
}

std::vector<TextRegion> TesseractOcrEngine::recognize(const cv::Mat &region, const QStringList &languages)
{
    if (region.empty()) {
        return {};
    }
    const cv::Mat gray = ensureGray(region);
    const QString languageKey = languages.isEmpty() ? QStringLiteral("eng") : languages.join(QLatin1Char('+'));

    std::lock_guard<std::mutex> lock(m_mutex);
    ensureInitialised(languageKey);

    m_api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    if (m_api->Recognize(nullptr) != 0) {
        m_api->Clear();
        throw EngineUnavailable("Tesseract recognition failed");
    }

    std::vector<TextRegion> regions;
    std::unique_ptr<tesseract::ResultIterator> it(m_api->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    if (it) {
        do {
            std::unique_ptr<char[]> word(it->GetUTF8Text(level));
            if (!word || *word.get() == '\0') {
                continue;
            }
            int x1 = 0;
            int y1 = 0;
            int x2 = 0;
            int y2 = 0;
            if (!it->BoundingBox(level, &x1, &y1, &x2, &y2)) {
                continue;
            }
            TextRegion text;
            text.text = word.get();
            text.confidence = std::clamp(static_cast<double>(it->Confidence(level)) / 100.0, 0.0, 1.0);
            text.box = cv::Rect2f(static_cast<float>(x1), static_cast<float>(y1), static_cast<float>(x2 - x1),
                                  static_cast<float>(y2 - y1));
            regions.push_back(std::move(text));
        } while (it->Next(level));
    }
    m_api->Clear();
    return regions;
}

} // namespace graphscan
