#include "sessionstore.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace vrt {

SessionStore::SessionStore(const QString& path, QObject* parent)
    : QObject(parent), m_path(path) {}

// ── Load ──

SessionState SessionStore::load() {
    m_state = SessionState();
    m_dirty = false;
    m_lastError = ShellError::None;
    m_lastErrorString.clear();

    QFile file(m_path);
    if (!file.exists()) {
        qDebug() << "SessionStore: no session file at" << m_path << "- using defaults";
        emit stateChanged();
        return m_state;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(ShellError::PersistenceCorrupt,
                    QStringLiteral("cannot open %1: %2").arg(m_path, file.errorString()));
        emit stateChanged();
        return m_state;
    }

    QJsonParseError parseError;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    QString why;
    if (parseError.error != QJsonParseError::NoError)
        why = parseError.errorString();
    else if (!jdoc.isObject())
        why = QStringLiteral("root is not an object");
    else
        why = SessionState::schemaError(jdoc.object());

    if (!why.isEmpty()) {
        reportError(ShellError::PersistenceCorrupt,
                    QStringLiteral("malformed session file %1: %2").arg(m_path, why));

        // Keep the unreadable file around for inspection; the next save
        // replaces the damaged file.
        const QString backup = m_path + QStringLiteral(".corrupt");
        QFile::remove(backup);
        if (!QFile::copy(m_path, backup))
            qWarning() << "SessionStore: could not back up corrupt file to" << backup;

        emit stateChanged();
        return m_state;
    }

    m_state = SessionState::fromJson(jdoc.object());
    if (m_state.version > kSessionSchemaVersion)
        qDebug() << "SessionStore: session file version" << m_state.version
                 << "is newer than" << kSessionSchemaVersion << "- unknown fields kept";
    qDebug() << "SessionStore: loaded" << m_state.pinned.size() << "pinned entries, theme"
             << m_state.themeId;
    emit stateChanged();
    return m_state;
}

// ── Save ──

bool SessionStore::save(const SessionState& state) {
    m_state = state;
    m_state.renumber();
    m_dirty = true;
    emit stateChanged();
    return writeState();
}

bool SessionStore::flush() {
    if (!m_dirty) return true;
    return writeState();
}

bool SessionStore::writeState() {
    QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        reportError(ShellError::PersistenceWriteFailed,
                    QStringLiteral("cannot create directory %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        reportError(ShellError::PersistenceWriteFailed,
                    QStringLiteral("cannot write %1: %2").arg(m_path, file.errorString()));
        return false;
    }
    QByteArray bytes = QJsonDocument(m_state.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        reportError(ShellError::PersistenceWriteFailed,
                    QStringLiteral("short write to %1: %2").arg(m_path, file.errorString()));
        return false;
    }
    if (!file.commit()) {
        reportError(ShellError::PersistenceWriteFailed,
                    QStringLiteral("cannot commit %1: %2").arg(m_path, file.errorString()));
        return false;
    }

    m_dirty = false;
    m_lastError = ShellError::None;
    m_lastErrorString.clear();
    return true;
}

void SessionStore::reportError(ShellError error, const QString& message) {
    m_lastError = error;
    m_lastErrorString = message;
    qWarning() << "SessionStore:" << shellErrorToString(error) << message;
    emit errorOccurred(error, message);
}

// ── Mutations ──

bool SessionStore::pin(const QString& url, const QString& title) {
    if (url.isEmpty()) {
        qWarning() << "SessionStore: refusing to pin an empty url";
        return false;
    }
    int idx = m_state.indexOfUrl(url);
    if (idx >= 0) {
        if (m_state.pinned[idx].title == title && !m_dirty)
            return true;
        m_state.pinned[idx].title = title;
    } else {
        PinnedEntry e;
        e.url   = url;
        e.title = title;
        e.order = m_state.pinned.size();
        m_state.pinned.append(e);
    }
    m_dirty = true;
    emit stateChanged();
    writeState();
    return true;
}

bool SessionStore::unpin(const QString& url) {
    int idx = m_state.indexOfUrl(url);
    if (idx < 0) return false;
    m_state.pinned.remove(idx);
    m_state.renumber();
    m_dirty = true;
    emit stateChanged();
    writeState();
    return true;
}

bool SessionStore::reorderPinned(int fromIndex, int toIndex) {
    const int n = m_state.pinned.size();
    if (fromIndex < 0 || fromIndex >= n || toIndex < 0 || toIndex >= n) {
        qWarning() << "SessionStore: reorderPinned out of range" << fromIndex << toIndex
                   << "size" << n;
        return false;
    }
    if (fromIndex == toIndex) return true;
    m_state.pinned.move(fromIndex, toIndex);
    m_state.renumber();
    m_dirty = true;
    emit stateChanged();
    writeState();
    return true;
}

bool SessionStore::setTheme(const QString& themeId) {
    if (themeId.isEmpty()) return false;
    if (themeId == m_state.themeId && !m_dirty) return true;
    m_state.themeId = themeId;
    m_dirty = true;
    emit stateChanged();
    writeState();
    return true;
}

} // namespace vrt
