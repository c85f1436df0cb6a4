#pragma once
#include "core.h"
#include <QObject>
#include <QString>

namespace vrt {

// ── SessionStore ──
//
// Owns the persisted SessionState (pinned entries + theme). Every mutation
// is followed by a full, atomic rewrite of the session file. A failed write
// keeps the mutation in memory and marks the store dirty; the next save
// trigger writes everything.
class SessionStore : public QObject {
    Q_OBJECT
public:
    explicit SessionStore(const QString& path, QObject* parent = nullptr);

    const QString& path() const { return m_path; }

    // Missing file: empty default. Malformed file: empty default plus a
    // PersistenceCorrupt diagnostic. Never fails.
    SessionState load();

    // Replaces the in-memory state and writes it. False if the write failed.
    bool save(const SessionState& state);
    // Retries a failed write. No-op when nothing is pending.
    bool flush();

    const SessionState& state() const { return m_state; }

    bool pin(const QString& url, const QString& title);
    bool unpin(const QString& url);
    bool reorderPinned(int fromIndex, int toIndex);
    bool setTheme(const QString& themeId);

    bool isPinned(const QString& url) const { return m_state.indexOfUrl(url) >= 0; }
    bool isDirty() const { return m_dirty; }

    ShellError     lastError() const       { return m_lastError; }
    const QString& lastErrorString() const { return m_lastErrorString; }

signals:
    void stateChanged();
    void errorOccurred(vrt::ShellError error, const QString& message);

private:
    QString      m_path;
    SessionState m_state;
    bool         m_dirty = false;
    ShellError   m_lastError = ShellError::None;
    QString      m_lastErrorString;

    bool writeState();
    void reportError(ShellError error, const QString& message);
};

} // namespace vrt
