#include "tab.h"
#include <QDebug>

namespace vrt {

static const char* const kEngineUnavailableReason = "engine unavailable";
static const char* const kNewTabTitle = "New Tab";

QString elideLabel(const QString& label, int maxChars) {
    if (maxChars < 1 || label.size() <= maxChars)
        return label;
    return label.left(maxChars - 1) + QChar(0x2026);
}

Tab::Tab(TabId id, const QString& url)
    : m_id(id), m_url(url) {}

Tab::~Tab() {
    releaseEngine();
}

QString Tab::label() const {
    if (isNewTabPage())
        return QString::fromLatin1(kNewTabTitle);
    if (!m_title.isEmpty())
        return m_title;
    if (!m_url.isEmpty())
        return m_url;
    return QString::fromLatin1(kNewTabTitle);
}

// ── Engine ownership ──

void Tab::attachEngine(std::unique_ptr<EngineBinding> engine) {
    m_engine = std::move(engine);
}

void Tab::markEngineUnavailable() {
    m_engine.reset();
    m_loadState     = LoadState::Failed;
    m_failureReason = QString::fromLatin1(kEngineUnavailableReason);
    m_progress      = 0;
}

void Tab::releaseEngine() {
    if (!m_engine) return;
    m_engine->stop();
    m_engine.reset();
}

// ── Navigation ──

void Tab::enterLoading() {
    m_loadState = LoadState::Loading;
    m_failureReason.clear();
    m_progress = 0;
}

Generation Tab::navigate(const QString& url) {
    m_generation++;
    m_url = url;
    m_title.clear();
    m_favicon.clear();

    if (!m_engine) {
        // Inert tab: keeps its Failed state whatever the URL.
        qDebug() << "Tab:" << m_id << "navigate without engine, url" << url;
        return m_generation;
    }

    if (isNewTabUrl(url)) {
        m_engine->stop();
        m_loadState = LoadState::Loaded;
        m_failureReason.clear();
        m_progress = 100;
        return m_generation;
    }

    enterLoading();
    m_engine->navigate(url, m_generation);
    return m_generation;
}

bool Tab::reload() {
    if (!m_engine || isNewTabPage()) return false;
    m_generation++;
    enterLoading();
    m_engine->reload(m_generation);
    return true;
}

bool Tab::stop() {
    if (!m_engine) return false;
    m_engine->stop();
    if (m_loadState != LoadState::Loading) return false;
    m_loadState = LoadState::Loaded;
    m_progress = 0;
    return true;
}

bool Tab::goBack() {
    if (!m_engine || !m_canGoBack) return false;
    m_generation++;
    enterLoading();
    m_engine->goBack(m_generation);
    return true;
}

bool Tab::goForward() {
    if (!m_engine || !m_canGoForward) return false;
    m_generation++;
    enterLoading();
    m_engine->goForward(m_generation);
    return true;
}

bool Tab::applyEvent(const EngineEvent& ev) {
    if (!m_engine) return false;
    if (ev.generation != m_generation) {
        qDebug() << "Tab:" << m_id << "dropping stale event, generation"
                 << ev.generation << "current" << m_generation;
        return false;
    }

    switch (ev.kind) {
    case EngineEventKind::Started:
        if (!ev.text.isEmpty()) m_url = ev.text;
        enterLoading();
        return true;
    case EngineEventKind::UrlChanged:
        if (ev.text.isEmpty() || ev.text == m_url) return false;
        m_url = ev.text;
        return true;
    case EngineEventKind::Progress: {
        if (m_loadState != LoadState::Loading) return false;
        int p = qBound(0, ev.progress, 100);
        if (p == m_progress) return false;
        m_progress = p;
        return true;
    }
    case EngineEventKind::TitleChanged:
        if (ev.text == m_title) return false;
        m_title = ev.text;
        return true;
    case EngineEventKind::FaviconChanged:
        if (ev.text == m_favicon) return false;
        m_favicon = ev.text;
        return true;
    case EngineEventKind::HistoryChanged:
        if (ev.canGoBack == m_canGoBack && ev.canGoForward == m_canGoForward)
            return false;
        m_canGoBack    = ev.canGoBack;
        m_canGoForward = ev.canGoForward;
        return true;
    case EngineEventKind::Loaded:
        if (m_loadState == LoadState::Loaded) return false;
        m_loadState = LoadState::Loaded;
        m_failureReason.clear();
        m_progress = 100;
        return true;
    case EngineEventKind::Failed:
        m_loadState     = LoadState::Failed;
        m_failureReason = ev.text.isEmpty() ? QStringLiteral("Navigation failed") : ev.text;
        m_progress      = 0;
        return true;
    }
    return false;
}

} // namespace vrt
