#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "DetectionResult.h"

namespace graphscan {

// JSON form of a DetectionResult. Used for durable cache entries and CLI output.
class ResultSerializer {
public:
    static QJsonObject toJson(const DetectionResult &result);
    static bool fromJson(const QJsonObject &obj, DetectionResult &result, QString *errorMessage = nullptr);

    static QByteArray toBytes(const DetectionResult &result, bool indented = false);
    static bool fromBytes(const QByteArray &bytes, DetectionResult &result, QString *errorMessage = nullptr);
};

} // namespace graphscan
