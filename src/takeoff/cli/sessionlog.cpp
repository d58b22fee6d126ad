// =====================================================================
//  src/takeoff/cli/sessionlog.cpp — Takeoff session log
// =====================================================================

#include "sessionlog.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>
#include <QStringList>

namespace takeoff {

namespace {

const char* SessionFileName = "session.json";
const char* AppDirName      = "takeoff";

bool fail(QString* errorMsg, const QString& text)
{
    if (errorMsg) *errorMsg = text;
    return false;
}

}  // anonymous namespace

SessionLog::SessionLog(const QString& filePath, int maxEntries)
    : m_filePath(filePath)
    , m_maxEntries(maxEntries < 1 ? DefaultMaxEntries : maxEntries)
{
}

void SessionLog::setMaxEntries(int maxEntries)
{
    m_maxEntries = qMax(1, maxEntries);
    trim();
}

void SessionLog::record(const SessionEntry& entry)
{
    if (entry.command.trimmed().isEmpty()) return;

    SessionEntry stored = entry;
    stored.command = entry.command.trimmed();
    m_entries.append(stored);
    trim();
}

QString SessionLog::replayScript() const
{
    QStringList lines;
    lines << QStringLiteral("# takeoff session replay");

    for (const SessionEntry& entry : m_entries) {
        if (!entry.ok) continue;
        lines << entry.command;
        if (!entry.result.isEmpty()) {
            lines << QStringLiteral("#   ") + entry.result;
        }
    }

    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

// ---- JSON -----------------------------------------------------------

QJsonArray SessionLog::toJson() const
{
    QJsonArray array;
    for (const SessionEntry& entry : m_entries) {
        QJsonObject obj;
        obj[QStringLiteral("command")] = entry.command;
        obj[QStringLiteral("ok")] = entry.ok;
        if (!entry.result.isEmpty()) {
            obj[QStringLiteral("result")] = entry.result;
        }
        if (entry.pixelsPerFoot) {
            obj[QStringLiteral("pixels_per_foot")] = *entry.pixelsPerFoot;
        }
        array.append(obj);
    }
    return array;
}

bool SessionLog::fromJson(const QJsonArray& array, QString* errorMsg)
{
    QVector<SessionEntry> loaded;
    loaded.reserve(array.size());

    for (int i = 0; i < array.size(); ++i) {
        QJsonObject obj = array[i].toObject();
        QString command = obj[QStringLiteral("command")].toString().trimmed();
        if (command.isEmpty()) {
            return fail(errorMsg, QStringLiteral("Session entry %1 has no command").arg(i));
        }

        SessionEntry entry;
        entry.command = command;
        entry.ok = obj[QStringLiteral("ok")].toBool(true);
        entry.result = obj[QStringLiteral("result")].toString();

        QJsonValue scale = obj[QStringLiteral("pixels_per_foot")];
        if (!scale.isUndefined()) {
            if (!scale.isDouble() || !(scale.toDouble() > 0.0)) {
                return fail(errorMsg,
                            QStringLiteral("Session entry %1 has an invalid scale").arg(i));
            }
            entry.pixelsPerFoot = scale.toDouble();
        }

        loaded.append(entry);
    }

    m_entries = loaded;
    trim();
    return true;
}

// ---- Files ----------------------------------------------------------

QString SessionLog::filePath() const
{
    if (!m_filePath.isEmpty()) {
        return m_filePath;
    }

    QString overridePath = qEnvironmentVariable("TAKEOFF_SESSION_FILE");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }

    QDir config(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation));
    return config.filePath(QLatin1String(AppDirName) + QLatin1Char('/') +
                           QLatin1String(SessionFileName));
}

bool SessionLog::load(QString* errorMsg)
{
    QString path = filePath();
    QFile file(path);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(errorMsg, QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(errorMsg, QStringLiteral("%1: %2").arg(path, parseError.errorString()));
    }
    if (!doc.isArray()) {
        return fail(errorMsg, QStringLiteral("%1: expected a JSON array").arg(path));
    }

    return fromJson(doc.array(), errorMsg);
}

bool SessionLog::save(QString* errorMsg) const
{
    QString path = filePath();
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return fail(errorMsg, QStringLiteral("Cannot create directory for %1").arg(path));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(errorMsg, QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));

    if (!file.commit()) {
        return fail(errorMsg, QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }
    return true;
}

void SessionLog::trim()
{
    if (m_entries.size() > m_maxEntries) {
        m_entries = m_entries.mid(m_entries.size() - m_maxEntries);
    }
}

}  // namespace takeoff
