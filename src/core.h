#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <QLatin1String>
#include <QMetaType>
#include <algorithm>
#include <cstdint>
#include <variant>

namespace vrt {

// ── Identifiers ──

using TabId = uint64_t;          // 0 = no tab
using Generation = uint64_t;     // per-tab navigation counter

inline constexpr char kNewTabUrl[] = "verta:newtab";
inline constexpr int  kSessionSchemaVersion = 1;
inline constexpr char kDefaultThemeId[] = "dusk";

inline bool isNewTabUrl(const QString& url) {
    return url == QLatin1String(kNewTabUrl);
}

// ── Load state ──

enum class LoadState : uint8_t {
    Idle, Loading, Loaded, Failed
};

struct LoadStateMeta {
    LoadState   state;
    const char* name;
};

inline constexpr LoadStateMeta kLoadStateMeta[] = {
    {LoadState::Idle,    "Idle"},
    {LoadState::Loading, "Loading"},
    {LoadState::Loaded,  "Loaded"},
    {LoadState::Failed,  "Failed"},
};

inline const char* loadStateToString(LoadState s) {
    for (const auto& m : kLoadStateMeta)
        if (m.state == s) return m.name;
    return "Unknown";
}

// ── Error taxonomy ──

enum class ShellError : uint8_t {
    None,
    EngineUnavailable,      // binding could not be created, tab is inert
    NavigationFailed,       // per navigation, recoverable
    PersistenceCorrupt,     // session file unreadable, defaults used
    PersistenceWriteFailed  // save did not land, prior file intact
};

inline const char* shellErrorToString(ShellError e) {
    switch (e) {
    case ShellError::None:                   return "None";
    case ShellError::EngineUnavailable:      return "EngineUnavailable";
    case ShellError::NavigationFailed:       return "NavigationFailed";
    case ShellError::PersistenceCorrupt:     return "PersistenceCorrupt";
    case ShellError::PersistenceWriteFailed: return "PersistenceWriteFailed";
    }
    return "Unknown";
}

// ── Pinned entry ──

struct PinnedEntry {
    QString url;
    QString title;
    int     order = 0;

    bool operator==(const PinnedEntry& o) const {
        return url == o.url && title == o.title && order == o.order;
    }
    bool operator!=(const PinnedEntry& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject o;
        o["url"]   = url;
        o["title"] = title;
        o["order"] = order;
        return o;
    }
    static PinnedEntry fromJson(const QJsonObject& o) {
        PinnedEntry e;
        e.url   = o["url"].toString();
        e.title = o["title"].toString();
        e.order = o["order"].toInt(-1);
        return e;
    }
};

// ── SessionState ──
// The only unit of persistence. `extra` keeps top-level keys this version
// does not understand so a rewrite does not drop them.

struct SessionState {
    QVector<PinnedEntry> pinned;
    QString              themeId = QString::fromLatin1(kDefaultThemeId);
    int                  version = kSessionSchemaVersion;
    QJsonObject          extra;

    bool operator==(const SessionState& o) const {
        return pinned == o.pinned && themeId == o.themeId;
    }
    bool operator!=(const SessionState& o) const { return !(*this == o); }

    int indexOfUrl(const QString& url) const {
        for (int i = 0; i < pinned.size(); i++)
            if (pinned[i].url == url) return i;
        return -1;
    }

    void renumber() {
        for (int i = 0; i < pinned.size(); i++)
            pinned[i].order = i;
    }

    bool ordersAreContiguous() const {
        for (int i = 0; i < pinned.size(); i++)
            if (pinned[i].order != i) return false;
        return true;
    }

    QJsonObject toJson() const {
        QJsonObject o = extra;
        o["version"] = kSessionSchemaVersion;
        o["theme"]   = themeId;
        QJsonArray arr;
        for (const auto& e : pinned) arr.append(e.toJson());
        o["pinned"] = arr;
        return o;
    }

    // Describes the first known key holding the wrong JSON type; empty when
    // the object is a usable session. Missing keys take their defaults.
    static QString schemaError(const QJsonObject& o) {
        if (o.contains("version") && !o["version"].isDouble())
            return QStringLiteral("\"version\" is not a number");
        if (o.contains("theme") && !o["theme"].isString())
            return QStringLiteral("\"theme\" is not a string");
        if (o.contains("pinned") && !o["pinned"].isArray())
            return QStringLiteral("\"pinned\" is not an array");
        const QJsonArray arr = o["pinned"].toArray();
        for (int i = 0; i < arr.size(); i++) {
            if (!arr.at(i).isObject())
                return QStringLiteral("pinned entry %1 is not an object").arg(i);
            const QJsonObject e = arr.at(i).toObject();
            if (e.contains("url") && !e["url"].isString())
                return QStringLiteral("pinned entry %1 has a non-string url").arg(i);
            if (e.contains("title") && !e["title"].isString())
                return QStringLiteral("pinned entry %1 has a non-string title").arg(i);
        }
        return {};
    }

    // Entries are sorted by their stored order and renumbered, so a file
    // with gaps or duplicate ranks still loads as a dense sequence.
    static SessionState fromJson(const QJsonObject& o) {
        SessionState s;
        s.version = o["version"].toInt(kSessionSchemaVersion);
        s.themeId = o["theme"].toString(QString::fromLatin1(kDefaultThemeId));
        QVector<PinnedEntry> entries;
        for (const auto& v : o["pinned"].toArray()) {
            PinnedEntry e = PinnedEntry::fromJson(v.toObject());
            if (e.url.isEmpty()) continue;
            if (e.order < 0) e.order = entries.size();
            bool dup = false;
            for (const auto& seen : entries)
                if (seen.url == e.url) { dup = true; break; }
            if (!dup) entries.append(e);
        }
        std::stable_sort(entries.begin(), entries.end(),
                         [](const PinnedEntry& a, const PinnedEntry& b) { return a.order < b.order; });
        s.pinned = entries;
        s.renumber();
        for (auto it = o.begin(); it != o.end(); ++it) {
            if (it.key() != "version" && it.key() != "theme" && it.key() != "pinned")
                s.extra.insert(it.key(), it.value());
        }
        return s;
    }
};

// ── UI intents ──

namespace intent {
    struct NewTab        { QString url; bool pinned = false; };
    struct CloseTab      { TabId id; };
    struct ActivateTab   { TabId id; };
    struct MoveTab       { TabId id; int newPosition; };
    struct Pin           { TabId id; };
    struct Unpin         { TabId id; };
    struct Navigate      { TabId id; QString url; };
    struct Reload        { TabId id; };
    struct Stop          { TabId id; };
    struct GoBack        { TabId id; };
    struct GoForward     { TabId id; };
    struct SetTheme      { QString themeId; };
    struct PinUrl        { QString url; QString title; };
    struct UnpinUrl      { QString url; };
    struct ReorderPinned { int from, to; };
}

using Intent = std::variant<
    intent::NewTab, intent::CloseTab, intent::ActivateTab, intent::MoveTab,
    intent::Pin, intent::Unpin, intent::Navigate, intent::Reload,
    intent::Stop, intent::GoBack, intent::GoForward, intent::SetTheme,
    intent::PinUrl, intent::UnpinUrl, intent::ReorderPinned
>;

} // namespace vrt

Q_DECLARE_METATYPE(vrt::ShellError)
Q_DECLARE_METATYPE(vrt::LoadState)
