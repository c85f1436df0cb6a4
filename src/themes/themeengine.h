#pragma once
#include "theme.h"
#include <QObject>
#include <QVector>

namespace vrt {

// ── ThemeEngine ──
//
// Resolves theme ids to descriptors. Built-ins are immutable and listed
// first; user themes loaded from disk follow. Unknown ids resolve to the
// default theme: theming never blocks startup or tab operation.
class ThemeEngine : public QObject {
    Q_OBJECT
public:
    explicit ThemeEngine(QObject* parent = nullptr);

    static Theme defaultTheme();

    const QVector<Theme>& themes() const { return m_themes; }
    bool  contains(const QString& themeId) const { return indexOf(themeId) >= 0; }
    Theme resolve(const QString& themeId) const;

    const Theme& current() const { return m_current; }
    QString      currentId() const { return m_current.id; }

    // Returns the id actually applied (the default theme's id on fallback).
    QString setCurrent(const QString& themeId);

    // Loads *.json theme files from `dir`. Files that do not parse, lack an
    // id, or reuse a built-in id are skipped. Returns the number added.
    int loadUserThemes(const QString& dir);

signals:
    void themeChanged(const vrt::Theme& theme);

private:
    QVector<Theme> m_themes;
    int            m_builtinCount = 0;
    Theme          m_current;

    int indexOf(const QString& themeId) const;
};

} // namespace vrt
