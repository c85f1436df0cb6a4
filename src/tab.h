#pragma once
#include "core.h"
#include "engines/engine.h"
#include <QString>
#include <memory>

namespace vrt {

class TabRegistry;

inline constexpr int kTabLabelMaxChars = 24;

// Shortens `label` to `maxChars`, the last one an ellipsis.
QString elideLabel(const QString& label, int maxChars = kTabLabelMaxChars);

// ── Tab ──
//
// One browser tab. Owns its engine binding exclusively; position and pin
// flag are only written by TabRegistry so the ordering invariants stay in
// one place.
class Tab {
public:
    Tab(TabId id, const QString& url);
    ~Tab();

    Tab(const Tab&) = delete;
    Tab& operator=(const Tab&) = delete;

    TabId          id() const            { return m_id; }
    const QString& url() const           { return m_url; }
    const QString& title() const         { return m_title; }
    const QString& favicon() const       { return m_favicon; }
    LoadState      loadState() const     { return m_loadState; }
    const QString& failureReason() const { return m_failureReason; }
    bool           pinned() const        { return m_pinned; }
    int            position() const      { return m_position; }
    Generation     generation() const    { return m_generation; }
    int            progress() const      { return m_progress; }
    bool           canGoBack() const     { return m_canGoBack; }
    bool           canGoForward() const  { return m_canGoForward; }
    bool           isNewTabPage() const  { return isNewTabUrl(m_url); }

    bool           engineAvailable() const { return m_engine != nullptr; }
    EngineBinding* engine() const          { return m_engine.get(); }

    // Title, else URL, else "New Tab".
    QString label() const;

    // ── Navigation ──

    // Starts a new generation. Events tagged with an older generation are
    // dropped from here on. The new-tab page is rendered by the shell and
    // never reaches the engine.
    Generation navigate(const QString& url);
    // Reload and history steps also start a new generation, so the finish
    // of a load they interrupt is dropped.
    bool reload();
    bool stop();
    bool goBack();
    bool goForward();

    // Applies an engine event. Returns true if anything visible changed.
    bool applyEvent(const EngineEvent& ev);

private:
    friend class TabRegistry;

    void attachEngine(std::unique_ptr<EngineBinding> engine);
    void markEngineUnavailable();
    void releaseEngine();
    void enterLoading();

    TabId      m_id;
    QString    m_url;
    QString    m_title;
    QString    m_favicon;
    LoadState  m_loadState = LoadState::Idle;
    QString    m_failureReason;
    bool       m_pinned = false;
    int        m_position = -1;
    Generation m_generation = 0;
    int        m_progress = 0;
    bool       m_canGoBack = false;
    bool       m_canGoForward = false;

    // Index among unpinned tabs at the time of pinning; -1 when unset.
    int        m_unpinnedSlot = -1;

    std::unique_ptr<EngineBinding> m_engine;
};

} // namespace vrt
