#pragma once
#include <QColor>
#include <QString>
#include <QJsonObject>
#include <QMetaType>

namespace vrt {

struct Theme {
    QString id;             // stable key stored in the session file
    QString name;           // display name

    // ── Chrome ──
    QColor background;      // window, toolbar, new-tab page
    QColor backgroundAlt;   // tab list panel, tooltips
    QColor surface;         // url field, pinned tiles
    QColor border;          // separators
    QColor button;          // toolbar buttons

    // ── Text ──
    QColor text;            // primary text
    QColor textDim;         // status bar, urls under titles
    QColor textMuted;       // inactive tab labels, disabled actions

    // ── Tabs ──
    QColor tabActive;       // active tab row
    QColor tabHover;        // hovered tab row
    QColor tabPinned;       // pinned-group marker

    // ── Indicators ──
    QColor accent;          // focus ring, selection
    QColor link;            // hyperlinks on the new-tab page
    QColor progress;        // load progress bar
    QColor error;           // failed tab label, warning text

    QJsonObject toJson() const;
    // Missing keys are taken from `base`, so partial user themes are usable.
    static Theme fromJson(const QJsonObject& obj, const Theme& base);

    static Theme dusk();
    static Theme daylight();
    static Theme warm();
};

// ── Shared field metadata (serialization) ──

struct ThemeFieldMeta {
    const char*    key;
    const char*    label;
    const char*    group;
    QColor Theme::*ptr;
};

extern const ThemeFieldMeta kThemeFields[];
extern const int kThemeFieldCount;

} // namespace vrt

Q_DECLARE_METATYPE(vrt::Theme)
