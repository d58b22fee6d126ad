// =====================================================================
//  src/libtakeoff/measure/dimensions.cpp — Real-world dimensions
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/measure/dimensions.h>
#include <takeoff/geometry/utils.h>

#include <cmath>

namespace takeoff {
namespace measure {

// =====================================================================
//  Categories
// =====================================================================

Category categoryFromLabel(const QString& label)
{
    QString name = label.trimmed().toLower();

    if (name.contains(QLatin1String("room"))) return Category::Room;
    if (name.contains(QLatin1String("wall"))) return Category::Wall;
    if (name.contains(QLatin1String("door")) ||
        name.contains(QLatin1String("window"))) {
        return Category::Opening;
    }
    return Category::Other;
}

QString categoryToString(Category category)
{
    switch (category) {
    case Category::Room:    return QStringLiteral("room");
    case Category::Wall:    return QStringLiteral("wall");
    case Category::Opening: return QStringLiteral("opening");
    case Category::Other:   return QStringLiteral("other");
    }
    return QString();
}

std::optional<Category> categoryFromString(const QString& text)
{
    QString name = text.trimmed().toLower();
    if (name == QLatin1String("room"))    return Category::Room;
    if (name == QLatin1String("wall"))    return Category::Wall;
    if (name == QLatin1String("opening")) return Category::Opening;
    if (name == QLatin1String("other"))   return Category::Other;
    return std::nullopt;
}

// =====================================================================
//  DisplayMetrics
// =====================================================================

bool DisplayMetrics::isEmpty() const
{
    return !areaSqft && !perimeterFt && !widthFt && !heightFt;
}

bool DisplayMetrics::operator==(const DisplayMetrics& other) const
{
    return areaSqft == other.areaSqft &&
           perimeterFt == other.perimeterFt &&
           widthFt == other.widthFt &&
           heightFt == other.heightFt;
}

DisplayMetrics mergeMetrics(const DisplayMetrics& base, const DisplayMetrics& update)
{
    DisplayMetrics result = base;
    if (update.areaSqft)    result.areaSqft = update.areaSqft;
    if (update.perimeterFt) result.perimeterFt = update.perimeterFt;
    if (update.widthFt)     result.widthFt = update.widthFt;
    if (update.heightFt)    result.heightFt = update.heightFt;
    return result;
}

QJsonObject metricsToJson(const DisplayMetrics& metrics)
{
    QJsonObject obj;
    if (metrics.areaSqft)    obj["area_sqft"] = *metrics.areaSqft;
    if (metrics.perimeterFt) obj["perimeter_ft"] = *metrics.perimeterFt;
    if (metrics.widthFt)     obj["width_ft"] = *metrics.widthFt;
    if (metrics.heightFt)    obj["height_ft"] = *metrics.heightFt;
    return obj;
}

DisplayMetrics metricsFromJson(const QJsonObject& obj)
{
    DisplayMetrics metrics;
    auto read = [&obj](const char* key, std::optional<double>& field) {
        QJsonValue value = obj.value(QLatin1String(key));
        if (value.isDouble()) field = value.toDouble();
    };
    read("area_sqft", metrics.areaSqft);
    read("perimeter_ft", metrics.perimeterFt);
    read("width_ft", metrics.widthFt);
    read("height_ft", metrics.heightFt);
    return metrics;
}

// =====================================================================
//  Recalculation
// =====================================================================

PixelMetrics pixelMetrics(const geometry::VertexSequence& points)
{
    PixelMetrics metrics;
    metrics.areaPx = geometry::polygonArea(points);
    metrics.perimeterPx = geometry::perimeter(points, true);
    return metrics;
}

DisplayMetrics recalcDimensions(
    const geometry::VertexSequence& points,
    double pixelsPerFoot,
    Category category,
    const DisplayMetrics& current)
{
    if (category == Category::Opening) {
        return current;
    }
    if (!(pixelsPerFoot > 0.0) || !std::isfinite(pixelsPerFoot)) {
        return current;
    }

    DisplayMetrics update;

    if (category == Category::Wall) {
        update.perimeterFt = geometry::perimeter(points, false) / pixelsPerFoot;
    } else {
        update.areaSqft = geometry::polygonArea(points) / (pixelsPerFoot * pixelsPerFoot);
        update.perimeterFt = geometry::perimeter(points, true) / pixelsPerFoot;
    }

    return mergeMetrics(current, update);
}

DisplayMetrics boxDimensions(const geometry::BoundingBox& box, double pixelsPerFoot)
{
    DisplayMetrics metrics;
    if (!box.valid || !(pixelsPerFoot > 0.0) || !std::isfinite(pixelsPerFoot)) {
        return metrics;
    }
    metrics.widthFt = box.width() / pixelsPerFoot;
    metrics.heightFt = box.height() / pixelsPerFoot;
    return metrics;
}

}  // namespace measure
}  // namespace takeoff
