#include "theme.h"
#include <type_traits>

namespace vrt {

// ── Shared field metadata (serialization + theme files) ──

const ThemeFieldMeta kThemeFields[] = {
    {"background",    "Background",     "Chrome",     &Theme::background},
    {"backgroundAlt", "Background Alt", "Chrome",     &Theme::backgroundAlt},
    {"surface",       "Surface",        "Chrome",     &Theme::surface},
    {"border",        "Border",         "Chrome",     &Theme::border},
    {"button",        "Button",         "Chrome",     &Theme::button},
    {"text",          "Text",           "Text",       &Theme::text},
    {"textDim",       "Text Dim",       "Text",       &Theme::textDim},
    {"textMuted",     "Text Muted",     "Text",       &Theme::textMuted},
    {"tabActive",     "Active Tab",     "Tabs",       &Theme::tabActive},
    {"tabHover",      "Hovered Tab",    "Tabs",       &Theme::tabHover},
    {"tabPinned",     "Pinned Marker",  "Tabs",       &Theme::tabPinned},
    {"accent",        "Accent",         "Indicators", &Theme::accent},
    {"link",          "Link",           "Indicators", &Theme::link},
    {"progress",      "Progress",       "Indicators", &Theme::progress},
    {"error",         "Error",          "Indicators", &Theme::error},
};
const int kThemeFieldCount = static_cast<int>(std::extent_v<decltype(kThemeFields)>);

QJsonObject Theme::toJson() const {
    QJsonObject o;
    o["id"]   = id;
    o["name"] = name;
    for (int i = 0; i < kThemeFieldCount; i++)
        o[kThemeFields[i].key] = (this->*kThemeFields[i].ptr).name();
    return o;
}

Theme Theme::fromJson(const QJsonObject& o, const Theme& base) {
    Theme t = base;
    t.id   = o["id"].toString();
    t.name = o["name"].toString(t.id.isEmpty() ? QStringLiteral("Untitled") : t.id);
    for (int i = 0; i < kThemeFieldCount; i++) {
        if (!o.contains(kThemeFields[i].key)) continue;
        QColor c(o[kThemeFields[i].key].toString());
        if (c.isValid())
            t.*kThemeFields[i].ptr = c;
    }
    return t;
}

// ── Built-ins ──

Theme Theme::dusk() {
    Theme t;
    t.id            = QStringLiteral("dusk");
    t.name          = QStringLiteral("Dusk");
    t.background    = QColor("#1e1f22");
    t.backgroundAlt = QColor("#2b2d30");
    t.surface       = QColor("#313338");
    t.border        = QColor("#3c3f44");
    t.button        = QColor("#35373c");
    t.text          = QColor("#dfe1e5");
    t.textDim       = QColor("#a0a4ab");
    t.textMuted     = QColor("#6f737a");
    t.tabActive     = QColor("#3d4250");
    t.tabHover      = QColor("#34373e");
    t.tabPinned     = QColor("#d4a945");
    t.accent        = QColor("#4c8dff");
    t.link          = QColor("#7aa7ff");
    t.progress      = QColor("#4c8dff");
    t.error         = QColor("#e5534b");
    return t;
}

Theme Theme::daylight() {
    Theme t;
    t.id            = QStringLiteral("daylight");
    t.name          = QStringLiteral("Daylight");
    t.background    = QColor("#ffffff");
    t.backgroundAlt = QColor("#f3f3f5");
    t.surface       = QColor("#ebedf0");
    t.border        = QColor("#d0d3d8");
    t.button        = QColor("#e4e6ea");
    t.text          = QColor("#1f2328");
    t.textDim       = QColor("#57606a");
    t.textMuted     = QColor("#8c959f");
    t.tabActive     = QColor("#dbe6fb");
    t.tabHover      = QColor("#e8ebef");
    t.tabPinned     = QColor("#bf8700");
    t.accent        = QColor("#0969da");
    t.link          = QColor("#0969da");
    t.progress      = QColor("#0969da");
    t.error         = QColor("#cf222e");
    return t;
}

Theme Theme::warm() {
    Theme t;
    t.id            = QStringLiteral("warm");
    t.name          = QStringLiteral("Warm");
    t.background    = QColor("#212121");
    t.backgroundAlt = QColor("#2a2622");
    t.surface       = QColor("#302b26");
    t.border        = QColor("#45403a");
    t.button        = QColor("#3a342e");
    t.text          = QColor("#e6ddd1");
    t.textDim       = QColor("#b0a596");
    t.textMuted     = QColor("#7d7366");
    t.tabActive     = QColor("#4a3f33");
    t.tabHover      = QColor("#3a322a");
    t.tabPinned     = QColor("#e0a458");
    t.accent        = QColor("#d98e48");
    t.link          = QColor("#e6b673");
    t.progress      = QColor("#d98e48");
    t.error         = QColor("#d9534f");
    return t;
}

} // namespace vrt
