#pragma once
#include "../core.h"
#include <QString>
#include <functional>
#include <memory>

class QWidget;

namespace vrt {

// ── Engine events ──

enum class EngineEventKind : uint8_t {
    Started,         // engine-initiated navigation committed (link, reload, history step)
    UrlChanged,      // same-document change or redirect, no load-state change
    Progress,
    TitleChanged,
    FaviconChanged,
    HistoryChanged,
    Loaded,
    Failed
};

struct EngineEvent {
    TabId           tab        = 0;
    Generation      generation = 0;
    EngineEventKind kind       = EngineEventKind::Progress;
    QString         text;      // url (Started), title, favicon url, or failure reason
    int             progress   = 0;
    bool            canGoBack    = false;
    bool            canGoForward = false;
};

// Bindings hand every event to this sink. It may be called from any thread.
using EngineEventSink = std::function<void(const EngineEvent&)>;

// ── Engine binding ──
//
// One rendering-engine instance, scoped to a single tab. All calls are
// fire-and-forget: completion arrives later through the sink, tagged with
// the generation passed to the most recent navigate, reload or history step.
class EngineBinding {
public:
    virtual ~EngineBinding() = default;

    // --- Subclasses MUST implement these ---
    virtual void navigate(const QString& url, Generation generation) = 0;
    virtual void stop() = 0;
    virtual void reload(Generation generation) = 0;
    virtual void goBack(Generation generation) = 0;
    virtual void goForward(Generation generation) = 0;

    // --- Optional overrides ---

    // Widget the window stacks for this tab. Headless engines return nullptr.
    virtual QWidget* view() const { return nullptr; }

    // Human-readable backend label, e.g. "QtWebEngine".
    virtual QString kind() const { return {}; }
};

// Returns nullptr when no engine instance could be created (EngineUnavailable).
using EngineFactory =
    std::function<std::unique_ptr<EngineBinding>(TabId tab, EngineEventSink sink)>;

} // namespace vrt
