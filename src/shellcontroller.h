#pragma once
#include "core.h"
#include "tabregistry.h"
#include "sessionstore.h"
#include "preferences.h"
#include "themes/themeengine.h"
#include <QHash>
#include <QObject>
#include <QMutex>
#include <QQueue>
#include <QVector>
#include <variant>

namespace vrt {

// ── View model ──

struct TabSummary {
    TabId     id = 0;
    int       position = 0;
    QString   label;
    QString   url;
    QString   favicon;
    LoadState loadState = LoadState::Idle;
    QString   failureReason;
    int       progress = 0;
    bool      pinned = false;
    bool      active = false;
    bool      canGoBack = false;
    bool      canGoForward = false;
    bool      isNewTabPage = false;
    bool      engineAvailable = true;
};

struct ViewModel {
    QVector<TabSummary>  tabs;            // in position order
    TabId                activeTabId = 0;
    QVector<PinnedEntry> pinnedEntries;   // new-tab page content
    Theme                theme;
    uint64_t             revision = 0;

    const TabSummary* find(TabId id) const {
        for (const auto& t : tabs)
            if (t.id == id) return &t;
        return nullptr;
    }
};

// ── ShellController ──
//
// Single point of state mutation. UI intents and engine events share one
// FIFO queue drained on the controller's thread; each item runs to
// completion (persistence included) before the next one starts, and the
// view model is republished only between items.
class ShellController : public QObject {
    Q_OBJECT
public:
    ShellController(EngineFactory engineFactory, SessionStore* session,
                    ThemeEngine* themes, QObject* parent = nullptr);
    ~ShellController() override;

    void setPreferences(const ShellPreferences& prefs) { m_prefs = prefs; }
    const ShellPreferences& preferences() const { return m_prefs; }

    // Applies the persisted theme and opens the first tab (`initialUrl`,
    // or the homepage when empty).
    void start(const QString& initialUrl = {});
    // Writes any session state a failed save left behind, closes all tabs.
    void shutdown();

    // ── Queue ──
    // Both may be called from any thread.
    void post(const Intent& intent);
    void postEngineEvent(const EngineEvent& event);
    EngineEventSink eventSink();

    // Drains the queue on the calling (controller) thread.
    void processPending();
    int  pendingCount() const;

    // ── Read side ──
    const ViewModel& viewModel() const { return m_viewModel; }
    QVector<PinnedEntry> newTabPageEntries() const { return m_session->state().pinned; }

    TabRegistry*  registry() const { return m_registry; }
    SessionStore* session() const  { return m_session; }
    ThemeEngine*  themes() const   { return m_themes; }

signals:
    void tabOpened(vrt::TabId id);
    void tabRemoved(vrt::TabId id);
    void tabActivated(vrt::TabId current, vrt::TabId previous);
    void viewModelChanged(const vrt::ViewModel& viewModel);
    void errorReported(vrt::ShellError error, const QString& message);

private:
    using QueueItem = std::variant<Intent, EngineEvent>;

    TabRegistry*     m_registry;
    SessionStore*    m_session;
    ThemeEngine*     m_themes;
    ShellPreferences m_prefs = ShellPreferences::defaults();
    ViewModel        m_viewModel;

    mutable QMutex    m_mutex;
    QQueue<QueueItem> m_queue;
    bool              m_drainScheduled = false;
    bool              m_draining = false;

    // Registry notifications collected while an item runs, relayed after it.
    QVector<TabId> m_opened;
    QVector<TabId> m_removed;
    bool           m_activationPending = false;
    TabId          m_activationPrevious = 0;
    bool           m_dirty = false;

    // Session URL stored by Pin(id), per tab. Absent when the entry was
    // already saved before the tab was pinned.
    QHash<TabId, QString> m_pinnedUrls;

    void enqueue(QueueItem item);
    bool dispatch(const QueueItem& item);
    bool applyIntent(const Intent& in);
    bool applyEngineEvent(const EngineEvent& ev);
    bool openTab(const QString& text, bool pinned);
    Tab* requireTab(TabId id, const char* what);
    QString resolveInput(const QString& text, bool* ok);
    void publish();
    void rebuildViewModel();
    void report(ShellError error, const QString& message);
};

} // namespace vrt

Q_DECLARE_METATYPE(vrt::ViewModel)
