// =====================================================================
//  src/libtakeoff/settings.cpp — Engine settings
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/settings.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cmath>

namespace takeoff {

namespace {

const QString KEY_IOU = QStringLiteral("iou_threshold");
const QString KEY_MIN_CONFIDENCE = QStringLiteral("min_confidence");
const QString KEY_CLASSES = QStringLiteral("classes");
const QString KEY_UNIT = QStringLiteral("default_unit");
const QString KEY_DPI = QStringLiteral("dpi");

bool fail(QString* errorMsg, const QString& message)
{
    if (errorMsg) *errorMsg = message;
    return false;
}

bool validIou(double v)           { return std::isfinite(v) && v > 0.0 && v <= 1.0; }
bool validConfidence(double v)    { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }
bool validDpi(double v)           { return std::isfinite(v) && v > 0.0; }

}  // anonymous namespace

detection::ReconcileOptions EngineSettings::reconcileOptions() const
{
    detection::ReconcileOptions options;
    options.iouThreshold = iouThreshold;
    return options;
}

QStringList settingKeys()
{
    return { KEY_IOU, KEY_MIN_CONFIDENCE, KEY_CLASSES, KEY_UNIT, KEY_DPI };
}

QJsonObject settingsToJson(const EngineSettings& settings)
{
    QJsonObject obj;
    obj[KEY_IOU] = settings.iouThreshold;
    obj[KEY_MIN_CONFIDENCE] = settings.minConfidence;
    obj[KEY_CLASSES] = QJsonArray::fromStringList(settings.classFilter);
    obj[KEY_UNIT] = measure::distanceUnitToString(settings.defaultUnit);
    obj[KEY_DPI] = settings.dpi;
    return obj;
}

bool settingsFromJson(const QJsonObject& obj, EngineSettings& settings, QString* errorMsg)
{
    EngineSettings s = settings;

    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!settingKeys().contains(it.key())) {
            return fail(errorMsg, QStringLiteral("Unknown setting \"%1\"").arg(it.key()));
        }
    }

    if (obj.contains(KEY_IOU)) {
        double v = obj[KEY_IOU].toDouble(-1.0);
        if (!obj[KEY_IOU].isDouble() || !validIou(v)) {
            return fail(errorMsg, QStringLiteral("%1 must be in (0, 1]").arg(KEY_IOU));
        }
        s.iouThreshold = v;
    }

    if (obj.contains(KEY_MIN_CONFIDENCE)) {
        double v = obj[KEY_MIN_CONFIDENCE].toDouble(-1.0);
        if (!obj[KEY_MIN_CONFIDENCE].isDouble() || !validConfidence(v)) {
            return fail(errorMsg, QStringLiteral("%1 must be in [0, 1]").arg(KEY_MIN_CONFIDENCE));
        }
        s.minConfidence = v;
    }

    if (obj.contains(KEY_CLASSES)) {
        if (!obj[KEY_CLASSES].isArray()) {
            return fail(errorMsg, QStringLiteral("%1 must be an array of strings").arg(KEY_CLASSES));
        }
        QStringList classes;
        const QJsonArray array = obj[KEY_CLASSES].toArray();
        for (const QJsonValue& v : array) {
            if (!v.isString()) {
                return fail(errorMsg, QStringLiteral("%1 must be an array of strings").arg(KEY_CLASSES));
            }
            classes.append(v.toString());
        }
        s.classFilter = classes;
    }

    if (obj.contains(KEY_UNIT)) {
        auto unit = measure::distanceUnitFromString(obj[KEY_UNIT].toString());
        if (!unit) {
            return fail(errorMsg, QStringLiteral("%1 must be \"ft\" or \"in\"").arg(KEY_UNIT));
        }
        s.defaultUnit = *unit;
    }

    if (obj.contains(KEY_DPI)) {
        double v = obj[KEY_DPI].toDouble(-1.0);
        if (!obj[KEY_DPI].isDouble() || !validDpi(v)) {
            return fail(errorMsg, QStringLiteral("%1 must be positive").arg(KEY_DPI));
        }
        s.dpi = v;
    }

    settings = s;
    return true;
}

bool setSetting(
    EngineSettings& settings,
    const QString& key,
    const QString& value,
    QString* errorMsg)
{
    QJsonObject obj;

    if (key == KEY_CLASSES) {
        QJsonArray classes;
        const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString& part : parts) {
            classes.append(part.trimmed());
        }
        obj[key] = classes;
    } else if (key == KEY_UNIT) {
        obj[key] = value;
    } else if (settingKeys().contains(key)) {
        bool ok = false;
        double number = value.toDouble(&ok);
        if (!ok) {
            return fail(errorMsg, QStringLiteral("%1 expects a number").arg(key));
        }
        obj[key] = number;
    } else {
        return fail(errorMsg, QStringLiteral("Unknown setting \"%1\"").arg(key));
    }

    return settingsFromJson(obj, settings, errorMsg);
}

bool loadSettings(const QString& path, EngineSettings& settings, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return fail(errorMsg, QStringLiteral("Failed to read settings: %1").arg(file.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(errorMsg, QStringLiteral("Invalid settings JSON: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return fail(errorMsg, QStringLiteral("Settings file must hold a JSON object"));
    }

    return settingsFromJson(doc.object(), settings, errorMsg);
}

bool saveSettings(const QString& path, const EngineSettings& settings, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return fail(errorMsg, QStringLiteral("Failed to save settings: %1").arg(file.errorString()));
    }

    QJsonDocument doc(settingsToJson(settings));
    file.write(doc.toJson(QJsonDocument::Indented));
    return true;
}

}  // namespace takeoff
