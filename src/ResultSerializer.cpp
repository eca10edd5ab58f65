#include "ResultSerializer.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace graphscan {

namespace {

QJsonArray pointToJson(const cv::Point2f &p)
{
    return QJsonArray {static_cast<double>(p.x), static_cast<double>(p.y)};
}

cv::Point2f pointFromJson(const QJsonValue &value)
{
    const QJsonArray array = value.toArray();
    if (array.size() != 2) {
        return {0.0F, 0.0F};
    }
    return {static_cast<float>(array.at(0).toDouble()), static_cast<float>(array.at(1).toDouble())};
}

QJsonArray rectToJson(const cv::Rect2f &r)
{
    return QJsonArray {static_cast<double>(r.x), static_cast<double>(r.y), static_cast<double>(r.width),
                       static_cast<double>(r.height)};
}

cv::Rect2f rectFromJson(const QJsonValue &value)
{
    const QJsonArray array = value.toArray();
    if (array.size() != 4) {
        return {};
    }
    return {static_cast<float>(array.at(0).toDouble()), static_cast<float>(array.at(1).toDouble()),
            static_cast<float>(array.at(2).toDouble()), static_cast<float>(array.at(3).toDouble())};
}

QJsonValue labelToJson(const std::optional<TextLabel> &label)
{
    if (!label) {
        return QJsonValue(QJsonValue::Null);
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("text"), QString::fromStdString(label->text));
    obj.insert(QStringLiteral("confidence"), label->confidence);
    obj.insert(QStringLiteral("distance"), label->distance);
    return obj;
}

std::optional<TextLabel> labelFromJson(const QJsonValue &value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject obj = value.toObject();
    TextLabel label;
    label.text = obj.value(QStringLiteral("text")).toString().toStdString();
    label.confidence = obj.value(QStringLiteral("confidence")).toDouble();
    label.distance = obj.value(QStringLiteral("distance")).toDouble();
    return label;
}

QJsonObject shapeToJson(const Shape &shape)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("kind"), QString::fromStdString(toString(shape.kind)));
    obj.insert(QStringLiteral("center"), pointToJson(shape.center));
    obj.insert(QStringLiteral("radius"), static_cast<double>(shape.radius));
    obj.insert(QStringLiteral("bounds"), rectToJson(shape.bounds));
    QJsonArray vertices;
    for (const auto &v : shape.vertices) {
        vertices.append(pointToJson(v));
    }
    obj.insert(QStringLiteral("vertices"), vertices);
    return obj;
}

Shape shapeFromJson(const QJsonObject &obj)
{
    Shape shape;
    shape.kind = shapeKindFromString(obj.value(QStringLiteral("kind")).toString().toStdString());
    shape.center = pointFromJson(obj.value(QStringLiteral("center")));
    shape.radius = static_cast<float>(obj.value(QStringLiteral("radius")).toDouble());
    shape.bounds = rectFromJson(obj.value(QStringLiteral("bounds")));
    for (const QJsonValue &v : obj.value(QStringLiteral("vertices")).toArray()) {
        shape.vertices.push_back(pointFromJson(v));
    }
    return shape;
}

QJsonObject qualityToJson(const QualityReport &quality)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("level"), QString::fromStdString(toString(quality.level)));
    obj.insert(QStringLiteral("contrast"), quality.contrast);
    obj.insert(QStringLiteral("noise"), quality.noise);
    obj.insert(QStringLiteral("sharpness"), quality.sharpness);
    obj.insert(QStringLiteral("brightness"), quality.brightness);
    obj.insert(QStringLiteral("edge_density"), quality.edgeDensity);
    obj.insert(QStringLiteral("composite_score"), quality.compositeScore);
    return obj;
}

QualityReport qualityFromJson(const QJsonObject &obj)
{
    QualityReport quality;
    quality.level = qualityLevelFromString(obj.value(QStringLiteral("level")).toString().toStdString());
    quality.contrast = obj.value(QStringLiteral("contrast")).toDouble();
    quality.noise = obj.value(QStringLiteral("noise")).toDouble();
    quality.sharpness = obj.value(QStringLiteral("sharpness")).toDouble();
    quality.brightness = obj.value(QStringLiteral("brightness")).toDouble();
    quality.edgeDensity = obj.value(QStringLiteral("edge_density")).toDouble();
    quality.compositeScore = obj.value(QStringLiteral("composite_score")).toDouble();
    return quality;
}

QJsonObject diagnosticsToJson(const DetectionDiagnostics &diagnostics)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("image_hash"), QString::fromStdString(diagnostics.imageHash));
    obj.insert(QStringLiteral("resolution"), QJsonArray {diagnostics.resolution.width, diagnostics.resolution.height});
    obj.insert(QStringLiteral("elapsed_ms"), static_cast<qint64>(diagnostics.elapsed.count()));
    QJsonArray timings;
    for (const auto &timing : diagnostics.timings) {
        QJsonObject entry;
        entry.insert(QStringLiteral("stage"), QString::fromStdString(timing.stage));
        entry.insert(QStringLiteral("elapsed_ms"), static_cast<qint64>(timing.elapsed.count()));
        timings.append(entry);
    }
    obj.insert(QStringLiteral("timings"), timings);
    obj.insert(QStringLiteral("cache_hit"), diagnostics.cacheHit);
    obj.insert(QStringLiteral("labels_unavailable"), diagnostics.labelsUnavailable);
    obj.insert(QStringLiteral("text_region_count"), diagnostics.textRegionCount);
    obj.insert(QStringLiteral("unclaimed_text_regions"), diagnostics.unclaimedTextRegions);
    QJsonArray notes;
    for (const auto &note : diagnostics.notes) {
        notes.append(QString::fromStdString(note));
    }
    obj.insert(QStringLiteral("notes"), notes);
    return obj;
}

DetectionDiagnostics diagnosticsFromJson(const QJsonObject &obj)
{
    DetectionDiagnostics diagnostics;
    diagnostics.imageHash = obj.value(QStringLiteral("image_hash")).toString().toStdString();
    const QJsonArray resolution = obj.value(QStringLiteral("resolution")).toArray();
    if (resolution.size() == 2) {
        diagnostics.resolution = cv::Size(resolution.at(0).toInt(), resolution.at(1).toInt());
    }
    diagnostics.elapsed = std::chrono::milliseconds(obj.value(QStringLiteral("elapsed_ms")).toInteger());
    for (const QJsonValue &value : obj.value(QStringLiteral("timings")).toArray()) {
        const QJsonObject entry = value.toObject();
        StageTiming timing;
        timing.stage = entry.value(QStringLiteral("stage")).toString().toStdString();
        timing.elapsed = std::chrono::milliseconds(entry.value(QStringLiteral("elapsed_ms")).toInteger());
        diagnostics.timings.push_back(std::move(timing));
    }
    diagnostics.cacheHit = obj.value(QStringLiteral("cache_hit")).toBool();
    diagnostics.labelsUnavailable = obj.value(QStringLiteral("labels_unavailable")).toBool();
    diagnostics.textRegionCount = obj.value(QStringLiteral("text_region_count")).toInt();
    diagnostics.unclaimedTextRegions = obj.value(QStringLiteral("unclaimed_text_regions")).toInt();
    for (const QJsonValue &value : obj.value(QStringLiteral("notes")).toArray()) {
        diagnostics.notes.push_back(value.toString().toStdString());
    }
    return diagnostics;
}

} // namespace

QJsonObject ResultSerializer::toJson(const DetectionResult &result)
{
    QJsonArray nodes;
    for (const auto &node : result.nodes) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), node.id);
        obj.insert(QStringLiteral("shape"), shapeToJson(node.shape));
        obj.insert(QStringLiteral("confidence"), node.confidence);
        obj.insert(QStringLiteral("label"), labelToJson(node.label));
        nodes.append(obj);
    }

    QJsonArray edges;
    for (const auto &edge : result.edges) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), edge.id);
        obj.insert(QStringLiteral("source"), edge.source);
        obj.insert(QStringLiteral("target"), edge.target);
        obj.insert(QStringLiteral("directed"), edge.directed);
        obj.insert(QStringLiteral("style"), QString::fromStdString(toString(edge.style)));
        obj.insert(QStringLiteral("confidence"), edge.confidence);
        obj.insert(QStringLiteral("source_point"), pointToJson(edge.sourcePoint));
        obj.insert(QStringLiteral("target_point"), pointToJson(edge.targetPoint));
        obj.insert(QStringLiteral("length"), edge.length());
        obj.insert(QStringLiteral("label"), labelToJson(edge.label));
        edges.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("nodes"), nodes);
    root.insert(QStringLiteral("edges"), edges);
    root.insert(QStringLiteral("quality"), qualityToJson(result.quality));
    root.insert(QStringLiteral("diagnostics"), diagnosticsToJson(result.diagnostics));
    return root;
}

bool ResultSerializer::fromJson(const QJsonObject &obj, DetectionResult &result, QString *errorMessage)
{
    if (!obj.value(QStringLiteral("nodes")).isArray() || !obj.value(QStringLiteral("edges")).isArray()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Result JSON lacks nodes or edges arrays");
        }
        return false;
    }

    DetectionResult parsed;
    for (const QJsonValue &value : obj.value(QStringLiteral("nodes")).toArray()) {
        const QJsonObject entry = value.toObject();
        if (!entry.value(QStringLiteral("id")).isDouble() || !entry.value(QStringLiteral("shape")).isObject()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Malformed node entry");
            }
            return false;
        }
        Node node;
        node.id = entry.value(QStringLiteral("id")).toInt();
        node.shape = shapeFromJson(entry.value(QStringLiteral("shape")).toObject());
        node.confidence = entry.value(QStringLiteral("confidence")).toDouble();
        node.label = labelFromJson(entry.value(QStringLiteral("label")));
        parsed.nodes.push_back(std::move(node));
    }

    for (const QJsonValue &value : obj.value(QStringLiteral("edges")).toArray()) {
        const QJsonObject entry = value.toObject();
        if (!entry.value(QStringLiteral("source")).isDouble() || !entry.value(QStringLiteral("target")).isDouble()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Malformed edge entry");
            }
            return false;
        }
        Edge edge;
        edge.id = entry.value(QStringLiteral("id")).toInt();
        edge.source = entry.value(QStringLiteral("source")).toInt();
        edge.target = entry.value(QStringLiteral("target")).toInt();
        edge.directed = entry.value(QStringLiteral("directed")).toBool();
        edge.style = edgeStyleFromString(entry.value(QStringLiteral("style")).toString().toStdString());
        edge.confidence = entry.value(QStringLiteral("confidence")).toDouble();
        edge.sourcePoint = pointFromJson(entry.value(QStringLiteral("source_point")));
        edge.targetPoint = pointFromJson(entry.value(QStringLiteral("target_point")));
        edge.label = labelFromJson(entry.value(QStringLiteral("label")));
        parsed.edges.push_back(std::move(edge));
    }

    parsed.quality = qualityFromJson(obj.value(QStringLiteral("quality")).toObject());
    parsed.diagnostics = diagnosticsFromJson(obj.value(QStringLiteral("diagnostics")).toObject());
    result = std::move(parsed);
    return true;
}

QByteArray ResultSerializer::toBytes(const DetectionResult &result, bool indented)
{
    return QJsonDocument(toJson(result)).toJson(indented ? QJsonDocument::Indented : QJsonDocument::Compact);
}

bool ResultSerializer::fromBytes(const QByteArray &bytes, DetectionResult &result, QString *errorMessage)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid result JSON: %1").arg(parseError.errorString());
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Result JSON is not an object");
        }
        return false;
    }
    return fromJson(doc.object(), result, errorMessage);
}

} // namespace graphscan
