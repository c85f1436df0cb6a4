#include "webengine_binding.h"
#include <QDebug>
#include <QUrl>
#include <QWebEngineHistory>
#include <QWebEnginePage>
#include <QWebEngineView>

namespace vrt {

WebEngineBinding::WebEngineBinding(TabId tab, EngineEventSink sink, QObject* parent)
    : QObject(parent)
    , m_tab(tab)
    , m_sink(std::move(sink))
    , m_view(new QWebEngineView)
{
    connect(m_view, &QWebEngineView::loadStarted,  this, &WebEngineBinding::onLoadStarted);
    connect(m_view, &QWebEngineView::loadProgress, this, &WebEngineBinding::onLoadProgress);
    connect(m_view, &QWebEngineView::loadFinished, this, &WebEngineBinding::onLoadFinished);
    connect(m_view, &QWebEngineView::urlChanged,   this, &WebEngineBinding::onUrlChanged);
    connect(m_view, &QWebEngineView::titleChanged, this, [this](const QString& title) {
        send(EngineEventKind::TitleChanged, title);
    });
    connect(m_view, &QWebEngineView::iconUrlChanged, this, [this](const QUrl& url) {
        send(EngineEventKind::FaviconChanged, url.toString(QUrl::FullyEncoded));
    });
}

WebEngineBinding::~WebEngineBinding() {
    if (m_view) {
        m_view->disconnect(this);
        delete m_view;
    }
}

QWidget* WebEngineBinding::view() const {
    return m_view;
}

EngineFactory WebEngineBinding::factory() {
    return [](TabId tab, EngineEventSink sink) -> std::unique_ptr<EngineBinding> {
        return std::make_unique<WebEngineBinding>(tab, std::move(sink));
    };
}

// ── Commands ──

void WebEngineBinding::navigate(const QString& url, Generation generation) {
    if (!m_view) return;
    m_generation    = generation;
    m_awaitingStart = true;
    m_stopped       = false;
    qDebug() << "WebEngineBinding: tab" << m_tab << "gen" << generation << "load" << url;
    m_view->setUrl(QUrl(url));
}

void WebEngineBinding::stop() {
    if (!m_view) return;
    m_stopped = true;
    m_view->stop();
}

void WebEngineBinding::restart(Generation generation) {
    m_generation = generation;
    // A running load is replaced; its finish must not reach the new generation.
    m_awaitingStart = m_loading;
    m_stopped       = false;
}

void WebEngineBinding::reload(Generation generation) {
    if (!m_view) return;
    restart(generation);
    m_view->reload();
}

void WebEngineBinding::goBack(Generation generation) {
    if (!m_view) return;
    restart(generation);
    m_view->back();
}

void WebEngineBinding::goForward(Generation generation) {
    if (!m_view) return;
    restart(generation);
    m_view->forward();
}

// ── Signals → events ──

void WebEngineBinding::send(EngineEventKind kind, const QString& text, int progress) {
    if (!m_sink) return;
    EngineEvent ev;
    ev.tab        = m_tab;
    ev.generation = m_generation;
    ev.kind       = kind;
    ev.text       = text;
    ev.progress   = progress;
    m_sink(ev);
}

void WebEngineBinding::sendHistory() {
    if (!m_sink || !m_view) return;
    EngineEvent ev;
    ev.tab          = m_tab;
    ev.generation   = m_generation;
    ev.kind         = EngineEventKind::HistoryChanged;
    ev.canGoBack    = m_view->history()->canGoBack();
    ev.canGoForward = m_view->history()->canGoForward();
    m_sink(ev);
}

void WebEngineBinding::onLoadStarted() {
    m_awaitingStart = false;
    m_stopped       = false;
    m_loading       = true;
    send(EngineEventKind::Started, m_view->url().toString(QUrl::FullyEncoded));
}

void WebEngineBinding::onLoadProgress(int progress) {
    if (m_awaitingStart) return;
    send(EngineEventKind::Progress, {}, progress);
}

void WebEngineBinding::onLoadFinished(bool ok) {
    m_loading = false;
    if (m_awaitingStart) {
        qDebug() << "WebEngineBinding: tab" << m_tab << "ignoring finish of a replaced load";
        return;
    }
    sendHistory();
    if (ok || m_stopped) {
        send(EngineEventKind::Loaded);
        return;
    }
    send(EngineEventKind::Failed,
         QStringLiteral("Could not load %1").arg(m_view->url().toString()));
}

void WebEngineBinding::onUrlChanged(const QUrl& url) {
    send(EngineEventKind::UrlChanged, url.toString(QUrl::FullyEncoded));
    sendHistory();
}

} // namespace vrt
