#include "shellcontroller.h"
#include "urlfixup.h"
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <type_traits>

namespace vrt {

ShellController::ShellController(EngineFactory engineFactory, SessionStore* session,
                                 ThemeEngine* themes, QObject* parent)
    : QObject(parent)
    , m_registry(new TabRegistry(std::move(engineFactory), this))
    , m_session(session)
    , m_themes(themes)
{
    m_registry->setEventSink(eventSink());

    connect(m_registry, &TabRegistry::tabCreated, this, [this](TabId id) {
        m_opened.append(id);
        m_dirty = true;
    });
    connect(m_registry, &TabRegistry::tabClosed, this, [this](TabId id) {
        m_opened.removeAll(id);
        m_removed.append(id);
        m_pinnedUrls.remove(id);
        m_dirty = true;
    });
    connect(m_registry, &TabRegistry::activeTabChanged, this, [this](TabId, TabId previous) {
        if (!m_activationPending) {
            m_activationPending  = true;
            m_activationPrevious = previous;
        }
        m_dirty = true;
    });
    connect(m_session, &SessionStore::errorOccurred, this, &ShellController::report);
    connect(m_session, &SessionStore::stateChanged, this, [this]() { m_dirty = true; });
    connect(m_themes, &ThemeEngine::themeChanged, this, [this](const Theme&) { m_dirty = true; });

    rebuildViewModel();
}

ShellController::~ShellController() {
    // Bindings hold sinks pointing back here; they must go while this
    // object is still whole.
    delete m_registry;
    m_registry = nullptr;
}

// ── Lifecycle ──

void ShellController::start(const QString& initialUrl) {
    const QString wanted = m_session->state().themeId;
    const QString applied = m_themes->setCurrent(wanted);
    if (applied != wanted)
        qDebug() << "ShellController: session theme" << wanted << "unavailable, showing" << applied;

    post(intent::NewTab{initialUrl.isEmpty() ? m_prefs.homepage : initialUrl, false});
    m_dirty = true;
    processPending();
}

void ShellController::shutdown() {
    processPending();
    if (m_session->isDirty() && !m_session->flush())
        qWarning() << "ShellController: session could not be written at shutdown";
    m_registry->clear();
    m_pinnedUrls.clear();
    m_opened.clear();
    m_removed.clear();
    m_activationPending = false;
    rebuildViewModel();
}

// ── Queue ──

EngineEventSink ShellController::eventSink() {
    return [this](const EngineEvent& ev) { postEngineEvent(ev); };
}

void ShellController::post(const Intent& intent) {
    enqueue(QueueItem(intent));
}

void ShellController::postEngineEvent(const EngineEvent& event) {
    enqueue(QueueItem(event));
}

void ShellController::enqueue(QueueItem item) {
    QMutexLocker lock(&m_mutex);
    m_queue.enqueue(std::move(item));
    if (m_drainScheduled) return;
    m_drainScheduled = true;
    QMetaObject::invokeMethod(this, [this]() { processPending(); }, Qt::QueuedConnection);
}

int ShellController::pendingCount() const {
    QMutexLocker lock(&m_mutex);
    return m_queue.size();
}

void ShellController::processPending() {
    if (m_draining) return;
    m_draining = true;
    for (;;) {
        QueueItem item;
        {
            QMutexLocker lock(&m_mutex);
            if (m_queue.isEmpty()) {
                m_drainScheduled = false;
                break;
            }
            item = m_queue.dequeue();
        }
        if (dispatch(item))
            m_dirty = true;
        if (m_dirty)
            publish();
    }
    m_draining = false;
}

bool ShellController::dispatch(const QueueItem& item) {
    if (const auto* ev = std::get_if<EngineEvent>(&item))
        return applyEngineEvent(*ev);
    return applyIntent(std::get<Intent>(item));
}

// ── Intents ──

Tab* ShellController::requireTab(TabId id, const char* what) {
    Tab* t = m_registry->tab(id);
    if (!t)
        qWarning() << "ShellController:" << what << "for unknown tab" << id;
    return t;
}

QString ShellController::resolveInput(const QString& text, bool* ok) {
    UrlFixupResult r = UrlFixup::fromUserInput(text, m_prefs.searchPage);
    *ok = r.ok;
    if (!r.ok)
        report(ShellError::NavigationFailed, r.error);
    return r.url;
}

bool ShellController::openTab(const QString& text, bool pinned) {
    QString url = m_prefs.homepage;
    if (!text.trimmed().isEmpty()) {
        bool ok = false;
        url = resolveInput(text, &ok);
        if (!ok) return false;
    }
    TabCreateResult r = m_registry->createTab(url, pinned);
    if (!r.ok())
        report(r.error, QStringLiteral("No rendering engine available for %1").arg(url));
    m_registry->setActive(r.id);
    return true;
}

bool ShellController::applyIntent(const Intent& in) {
    return std::visit([&](auto&& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, intent::NewTab>) {
            return openTab(c.url, c.pinned);
        } else if constexpr (std::is_same_v<T, intent::CloseTab>) {
            return m_registry->closeTab(c.id);
        } else if constexpr (std::is_same_v<T, intent::ActivateTab>) {
            return m_registry->setActive(c.id);
        } else if constexpr (std::is_same_v<T, intent::MoveTab>) {
            return m_registry->moveTab(c.id, c.newPosition);
        } else if constexpr (std::is_same_v<T, intent::Pin>) {
            Tab* t = requireTab(c.id, "Pin");
            if (!t) return false;
            const bool wasPinned = t->pinned();
            m_registry->setPinned(c.id, true);
            if (wasPinned || t->isNewTabPage() || t->url().isEmpty())
                return true;
            const QString url = t->url();
            const bool saved = m_session->isPinned(url);
            if (m_session->pin(url, t->label()) && !saved)
                m_pinnedUrls.insert(c.id, url);
            return true;
        } else if constexpr (std::is_same_v<T, intent::Unpin>) {
            Tab* t = requireTab(c.id, "Unpin");
            if (!t) return false;
            if (!t->pinned()) return false;
            m_registry->setPinned(c.id, false);
            const QString url = m_pinnedUrls.take(c.id);
            if (!url.isEmpty())
                m_session->unpin(url);
            return true;
        } else if constexpr (std::is_same_v<T, intent::Navigate>) {
            Tab* t = requireTab(c.id, "Navigate");
            if (!t) return false;
            bool ok = false;
            QString url = resolveInput(c.url, &ok);
            if (!ok) return false;
            t->navigate(url);
            return true;
        } else if constexpr (std::is_same_v<T, intent::Reload>) {
            Tab* t = requireTab(c.id, "Reload");
            return t && t->reload();
        } else if constexpr (std::is_same_v<T, intent::Stop>) {
            Tab* t = requireTab(c.id, "Stop");
            return t && t->stop();
        } else if constexpr (std::is_same_v<T, intent::GoBack>) {
            Tab* t = requireTab(c.id, "GoBack");
            return t && t->goBack();
        } else if constexpr (std::is_same_v<T, intent::GoForward>) {
            Tab* t = requireTab(c.id, "GoForward");
            return t && t->goForward();
        } else if constexpr (std::is_same_v<T, intent::SetTheme>) {
            const QString applied = m_themes->setCurrent(c.themeId);
            m_session->setTheme(applied);
            return true;
        } else if constexpr (std::is_same_v<T, intent::PinUrl>) {
            return m_session->pin(c.url, c.title.isEmpty() ? c.url : c.title);
        } else if constexpr (std::is_same_v<T, intent::UnpinUrl>) {
            return m_session->unpin(c.url);
        } else if constexpr (std::is_same_v<T, intent::ReorderPinned>) {
            return m_session->reorderPinned(c.from, c.to);
        }
        return false;
    }, in);
}

// ── Engine events ──

bool ShellController::applyEngineEvent(const EngineEvent& ev) {
    Tab* t = m_registry->tab(ev.tab);
    if (!t) return false;   // tab closed while the event was in flight
    if (!t->applyEvent(ev)) return false;
    if (ev.kind == EngineEventKind::Failed)
        report(ShellError::NavigationFailed,
               QStringLiteral("%1: %2").arg(t->url(), t->failureReason()));
    return true;
}

// ── View model ──

void ShellController::rebuildViewModel() {
    ViewModel vm;
    vm.revision    = m_viewModel.revision + 1;
    vm.activeTabId = m_registry ? m_registry->activeTabId() : 0;
    if (m_registry) {
        vm.tabs.reserve(m_registry->count());
        for (const auto& t : m_registry->tabs()) {
            TabSummary s;
            s.id              = t->id();
            s.position        = t->position();
            s.label           = t->label();
            s.url             = t->url();
            s.favicon         = t->favicon();
            s.loadState       = t->loadState();
            s.failureReason   = t->failureReason();
            s.progress        = t->progress();
            s.pinned          = t->pinned();
            s.active          = t->id() == vm.activeTabId;
            s.canGoBack       = t->canGoBack();
            s.canGoForward    = t->canGoForward();
            s.isNewTabPage    = t->isNewTabPage();
            s.engineAvailable = t->engineAvailable();
            vm.tabs.append(s);
        }
    }
    vm.pinnedEntries = m_session->state().pinned;
    vm.theme         = m_themes->current();
    m_viewModel = vm;
}

void ShellController::publish() {
    rebuildViewModel();
    m_dirty = false;

    const QVector<TabId> opened  = m_opened;
    const QVector<TabId> removed = m_removed;
    m_opened.clear();
    m_removed.clear();
    for (TabId id : opened)  emit tabOpened(id);
    for (TabId id : removed) emit tabRemoved(id);

    if (m_activationPending) {
        m_activationPending = false;
        const TabId current = m_registry->activeTabId();
        if (current != m_activationPrevious)
            emit tabActivated(current, m_activationPrevious);
    }
    emit viewModelChanged(m_viewModel);
}

void ShellController::report(ShellError error, const QString& message) {
    qWarning() << "ShellController:" << shellErrorToString(error) << message;
    emit errorReported(error, message);
}

} // namespace vrt
