#include "themeengine.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

namespace vrt {

ThemeEngine::ThemeEngine(QObject* parent)
    : QObject(parent)
{
    m_themes.append(Theme::dusk());
    m_themes.append(Theme::daylight());
    m_themes.append(Theme::warm());
    m_builtinCount = m_themes.size();
    m_current = defaultTheme();
}

Theme ThemeEngine::defaultTheme() {
    return Theme::dusk();
}

int ThemeEngine::indexOf(const QString& themeId) const {
    for (int i = 0; i < m_themes.size(); i++)
        if (m_themes[i].id == themeId) return i;
    return -1;
}

Theme ThemeEngine::resolve(const QString& themeId) const {
    int idx = indexOf(themeId);
    if (idx < 0) {
        if (!themeId.isEmpty())
            qDebug() << "ThemeEngine: unknown theme" << themeId << "- using default";
        return defaultTheme();
    }
    return m_themes[idx];
}

QString ThemeEngine::setCurrent(const QString& themeId) {
    Theme next = resolve(themeId);
    if (next.id != m_current.id) {
        m_current = next;
        emit themeChanged(m_current);
    }
    return m_current.id;
}

int ThemeEngine::loadUserThemes(const QString& dir) {
    QDir d(dir);
    if (!d.exists()) return 0;

    int added = 0;
    const QFileInfoList files = d.entryInfoList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QFileInfo& fi : files) {
        QFile f(fi.absoluteFilePath());
        if (!f.open(QIODevice::ReadOnly)) {
            qWarning() << "ThemeEngine: cannot read" << fi.absoluteFilePath();
            continue;
        }
        QJsonDocument jdoc = QJsonDocument::fromJson(f.readAll());
        if (!jdoc.isObject()) {
            qWarning() << "ThemeEngine: skipping malformed theme file" << fi.fileName();
            continue;
        }
        Theme t = Theme::fromJson(jdoc.object(), defaultTheme());
        if (t.id.isEmpty())
            t.id = fi.completeBaseName();

        int existing = indexOf(t.id);
        if (existing >= 0 && existing < m_builtinCount) {
            qWarning() << "ThemeEngine: theme file" << fi.fileName()
                       << "reuses built-in id" << t.id << "- skipped";
            continue;
        }
        if (existing >= 0)
            m_themes[existing] = t;
        else
            m_themes.append(t);
        added++;
    }
    qDebug() << "ThemeEngine: loaded" << added << "user theme(s) from" << dir;
    return added;
}

} // namespace vrt
