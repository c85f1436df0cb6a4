#pragma once
#include "tab.h"
#include <QObject>
#include <QVector>
#include <memory>
#include <vector>

namespace vrt {

struct TabCreateResult {
    TabId      id    = 0;
    ShellError error = ShellError::None;
    bool ok() const { return error == ShellError::None; }
};

// ── TabRegistry ──
//
// Ordered collection of tabs backing the vertical tab list. Every mutating
// call leaves positions as 0..N-1 with pinned tabs first, and activeTabId
// non-zero exactly when the registry is non-empty.
class TabRegistry : public QObject {
    Q_OBJECT
public:
    explicit TabRegistry(EngineFactory factory, QObject* parent = nullptr);
    ~TabRegistry() override;

    // Sink handed (wrapped with the tab id) to every binding created after
    // this call.
    void setEventSink(EngineEventSink sink) { m_sink = std::move(sink); }

    TabCreateResult createTab(const QString& url, bool pinned = false);
    bool closeTab(TabId id);
    bool moveTab(TabId id, int newPosition);
    bool setActive(TabId id);
    bool setPinned(TabId id, bool pinned);
    void clear();

    Tab*  tab(TabId id) const;
    Tab*  tabAt(int position) const;
    Tab*  activeTab() const { return tab(m_activeId); }
    int   positionOf(TabId id) const { return indexOf(id); }
    int   count() const { return static_cast<int>(m_tabs.size()); }
    bool  isEmpty() const { return m_tabs.empty(); }
    int   pinnedCount() const;
    TabId activeTabId() const { return m_activeId; }
    QVector<TabId> order() const;
    const std::vector<std::unique_ptr<Tab>>& tabs() const { return m_tabs; }

    bool positionsAreContiguous() const;

signals:
    void tabCreated(vrt::TabId id);
    void tabClosed(vrt::TabId id);
    void activeTabChanged(vrt::TabId current, vrt::TabId previous);

private:
    EngineFactory                     m_factory;
    EngineEventSink                   m_sink;
    std::vector<std::unique_ptr<Tab>> m_tabs;
    TabId                             m_activeId = 0;
    TabId                             m_nextId   = 1;

    int  indexOf(TabId id) const;
    void relocate(int from, int to);
    void renumber();
    void activate(TabId id);
};

} // namespace vrt
