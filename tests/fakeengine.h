#pragma once
#include "engines/engine.h"
#include <QHash>
#include <QStringList>
#include <QThread>
#include <memory>

// Scriptable engine for tests. A FakeEngineHub hands out bindings, keeps
// their sinks so a test can play the engine's part, and records every
// command the shell issues.
namespace vrt {

class FakeEngineHub;

class FakeEngine : public EngineBinding {
public:
    FakeEngine(FakeEngineHub* hub, TabId tab, EngineEventSink sink)
        : m_hub(hub), m_tab(tab), m_sink(std::move(sink)) {}
    ~FakeEngine() override;

    void navigate(const QString& url, Generation generation) override {
        m_generation = generation;
        m_lastUrl = url;
        log(QStringLiteral("navigate %1 %2").arg(url).arg(generation));
    }
    void stop() override      { log(QStringLiteral("stop")); }
    void reload(Generation generation) override {
        m_generation = generation;
        log(QStringLiteral("reload"));
    }
    void goBack(Generation generation) override {
        m_generation = generation;
        log(QStringLiteral("back"));
    }
    void goForward(Generation generation) override {
        m_generation = generation;
        log(QStringLiteral("forward"));
    }
    QString kind() const override { return QStringLiteral("fake"); }

    void emitEvent(EngineEventKind kind, const QString& text = {}, int progress = 0) {
        emitEvent(kind, m_generation, text, progress);
    }
    void emitEvent(EngineEventKind kind, Generation generation,
                   const QString& text = {}, int progress = 0) {
        EngineEvent ev;
        ev.tab        = m_tab;
        ev.generation = generation;
        ev.kind       = kind;
        ev.text       = text;
        ev.progress   = progress;
        if (m_sink) m_sink(ev);
    }
    void emitHistory(bool back, bool forward) {
        EngineEvent ev;
        ev.tab          = m_tab;
        ev.generation   = m_generation;
        ev.kind         = EngineEventKind::HistoryChanged;
        ev.canGoBack    = back;
        ev.canGoForward = forward;
        if (m_sink) m_sink(ev);
    }

    TabId           tab() const        { return m_tab; }
    Generation      generation() const { return m_generation; }
    const QString&  lastUrl() const    { return m_lastUrl; }
    EngineEventSink sink() const       { return m_sink; }
    QStringList     calls;

private:
    FakeEngineHub*  m_hub;
    TabId           m_tab;
    EngineEventSink m_sink;
    Generation      m_generation = 0;
    QString         m_lastUrl;

    void log(const QString& call) { calls.append(call); }
};

class FakeEngineHub {
public:
    // When false the factory returns nullptr (EngineUnavailable).
    bool available = true;
    int  created   = 0;
    int  released  = 0;

    EngineFactory factory() {
        return [this](TabId tab, EngineEventSink sink) -> std::unique_ptr<EngineBinding> {
            if (!available) return nullptr;
            auto engine = std::make_unique<FakeEngine>(this, tab, std::move(sink));
            m_live.insert(tab, engine.get());
            created++;
            return engine;
        };
    }

    FakeEngine* engine(TabId tab) const { return m_live.value(tab, nullptr); }
    int liveCount() const { return int(m_live.size()); }

    void forget(TabId tab) {
        m_live.remove(tab);
        released++;
    }

private:
    QHash<TabId, FakeEngine*> m_live;
};

inline FakeEngine::~FakeEngine() {
    if (m_hub) m_hub->forget(m_tab);
}

// Emits a batch of events from a worker thread, as a real engine might.
class EngineEventThread : public QThread {
public:
    EngineEventThread(EngineEventSink sink, QVector<EngineEvent> events)
        : m_sink(std::move(sink)), m_events(std::move(events)) {}
protected:
    void run() override {
        for (const auto& ev : m_events)
            m_sink(ev);
    }
private:
    EngineEventSink      m_sink;
    QVector<EngineEvent> m_events;
};

} // namespace vrt
