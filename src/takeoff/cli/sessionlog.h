// =====================================================================
//  src/takeoff/cli/sessionlog.h — Takeoff session log
// =====================================================================
//
//  Record of the commands run against a drawing: each entry keeps the
//  command, whether it succeeded, its first result line and the scale
//  in effect afterwards.  The log persists across sessions as JSON
//  (~/.config/takeoff/session.json on Linux, or TAKEOFF_SESSION_FILE)
//  and the successful commands can be exported as a script that
//  "takeoff --script" replays.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_SESSIONLOG_H
#define TAKEOFF_SESSIONLOG_H

#include <QJsonArray>
#include <QString>
#include <QVector>

#include <optional>

namespace takeoff {

struct SessionEntry {
    QString command;
    bool    ok = true;
    QString result;                       ///< First line of output or error
    std::optional<double> pixelsPerFoot;  ///< Scale after the command ran
};

class SessionLog {
public:
    static constexpr int DefaultMaxEntries = 500;

    /// An empty path uses the default location
    explicit SessionLog(const QString& filePath = QString(),
                        int maxEntries = DefaultMaxEntries);

    int maxEntries() const { return m_maxEntries; }

    /// Oldest entries beyond the new limit are dropped
    void setMaxEntries(int maxEntries);

    /// Oldest first
    const QVector<SessionEntry>& entries() const { return m_entries; }
    int count() const { return m_entries.size(); }

    void record(const SessionEntry& entry);
    void clear() { m_entries.clear(); }

    /// Commands that succeeded, in order, one per line.  Each is
    /// followed by its result as a '#' comment so the script documents
    /// the session it came from.
    QString replayScript() const;

    QJsonArray toJson() const;

    /// Replaces the entries.  Fails without changes on a malformed
    /// entry.
    bool fromJson(const QJsonArray& array, QString* errorMsg = nullptr);

    /// Missing file is not an error
    bool load(QString* errorMsg = nullptr);
    bool save(QString* errorMsg = nullptr) const;

    QString filePath() const;

private:
    void trim();

    QVector<SessionEntry> m_entries;
    QString m_filePath;
    int     m_maxEntries;
};

}  // namespace takeoff

#endif  // TAKEOFF_SESSIONLOG_H
