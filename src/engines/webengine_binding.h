#pragma once
#include "engine.h"
#include <QObject>
#include <QPointer>

class QWebEngineView;
class QUrl;

namespace vrt {

// ── QtWebEngine backend ──
//
// Owns one QWebEngineView per tab and translates its signals into engine
// events tagged with the generation of the last navigate() call.
class WebEngineBinding : public QObject, public EngineBinding {
    Q_OBJECT
public:
    WebEngineBinding(TabId tab, EngineEventSink sink, QObject* parent = nullptr);
    ~WebEngineBinding() override;

    void navigate(const QString& url, Generation generation) override;
    void stop() override;
    void reload(Generation generation) override;
    void goBack(Generation generation) override;
    void goForward(Generation generation) override;

    QWidget* view() const override;
    QString  kind() const override { return QStringLiteral("QtWebEngine"); }

    // Factory suitable for EngineRegistry::registerEngine.
    static EngineFactory factory();

private:
    TabId                   m_tab;
    EngineEventSink         m_sink;
    QPointer<QWebEngineView> m_view;
    Generation              m_generation = 0;
    // A load replaced by a newer one or cut short by stop() still reports
    // loadFinished(false); those are not failures.
    bool                    m_awaitingStart = false;
    bool                    m_stopped = false;
    bool                    m_loading = false;

    void send(EngineEventKind kind, const QString& text = {}, int progress = 0);
    void sendHistory();
    void restart(Generation generation);

    void onLoadStarted();
    void onLoadProgress(int progress);
    void onLoadFinished(bool ok);
    void onUrlChanged(const QUrl& url);
};

} // namespace vrt
