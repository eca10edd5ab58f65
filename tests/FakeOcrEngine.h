#pragma once

#include <QThread>

#include <atomic>
#include <mutex>
#include <vector>

#include "Errors.h"
#include "OcrEngine.h"

// Scripted recogniser. Returns the same regions for every crop, offset back so
// that after the localizer re-bases them they land at their scripted positions.
class FakeOcrEngine : public graphscan::OcrEngine {
public:
    explicit FakeOcrEngine(std::vector<graphscan::TextRegion> regions = {})
        : m_regions(std::move(regions))
    {
    }

    std::vector<graphscan::TextRegion> recognize(const cv::Mat &region, const QStringList &languages) override
    {
        ++m_calls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastLanguages = languages;
        }
        if (m_delayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_delayMs));
        }
        if (m_fail) {
            throw graphscan::EngineUnavailable("fake engine offline");
        }
        cv::Size whole;
        cv::Point offset;
        region.locateROI(whole, offset);
        std::vector<graphscan::TextRegion> out;
        for (auto text : m_regions) {
            text.box.x -= static_cast<float>(offset.x);
            text.box.y -= static_cast<float>(offset.y);
            out.push_back(text);
        }
        return out;
    }

    void setFailing(bool fail) { m_fail = fail; }
    void setDelayMs(int delayMs) { m_delayMs = delayMs; }
    [[nodiscard]] int calls() const { return m_calls.load(); }

    QStringList lastLanguages()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastLanguages;
    }

private:
    std::vector<graphscan::TextRegion> m_regions;
    std::atomic_bool m_fail {false};
    std::atomic_int m_delayMs {0};
    std::atomic_int m_calls {0};
    std::mutex m_mutex;
    QStringList m_lastLanguages;
};
