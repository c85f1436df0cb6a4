#include "tabregistry.h"
#include <QDebug>
#include <algorithm>
#include <exception>

namespace vrt {

TabRegistry::TabRegistry(EngineFactory factory, QObject* parent)
    : QObject(parent), m_factory(std::move(factory)) {}

TabRegistry::~TabRegistry() {
    // Bindings go first, while the tabs (and anything their views point at)
    // are still alive.
    for (auto& t : m_tabs)
        t->releaseEngine();
    m_tabs.clear();
}

// ── Creation / destruction ──

TabCreateResult TabRegistry::createTab(const QString& url, bool pinned) {
    TabCreateResult result;
    const TabId id = m_nextId++;
    auto tab = std::make_unique<Tab>(id, url);
    tab->m_pinned = pinned;

    std::unique_ptr<EngineBinding> engine;
    if (m_factory) {
        EngineEventSink sink;
        if (m_sink) {
            sink = [forward = m_sink, id](const EngineEvent& ev) {
                EngineEvent tagged = ev;
                tagged.tab = id;
                forward(tagged);
            };
        }
        try {
            engine = m_factory(id, std::move(sink));
        } catch (const std::exception& e) {
            qWarning() << "TabRegistry: engine factory threw:" << e.what();
            engine.reset();
        }
    }

    Tab* raw = tab.get();
    const int insertAt = pinned ? pinnedCount() : count();
    m_tabs.insert(m_tabs.begin() + insertAt, std::move(tab));
    renumber();

    if (engine) {
        raw->attachEngine(std::move(engine));
        raw->navigate(url);
    } else {
        qWarning() << "TabRegistry: engine unavailable for tab" << id << url;
        raw->markEngineUnavailable();
        result.error = ShellError::EngineUnavailable;
    }
    result.id = id;

    qDebug() << "TabRegistry: created tab" << id << "at" << insertAt
             << (pinned ? "(pinned)" : "") << url;
    emit tabCreated(id);

    if (m_activeId == 0)
        activate(id);
    return result;
}

bool TabRegistry::closeTab(TabId id) {
    int idx = indexOf(id);
    if (idx < 0) {
        qWarning() << "TabRegistry: closeTab: unknown tab" << id;
        return false;
    }

    // Release the binding before the slot disappears.
    m_tabs[idx]->releaseEngine();
    m_tabs.erase(m_tabs.begin() + idx);
    renumber();
    qDebug() << "TabRegistry: closed tab" << id;
    emit tabClosed(id);

    if (m_activeId == id) {
        if (m_tabs.empty()) {
            activate(0);
        } else {
            int next = std::min(idx, count() - 1);
            activate(m_tabs[next]->id());
        }
    }
    return true;
}

void TabRegistry::clear() {
    while (!m_tabs.empty())
        closeTab(m_tabs.back()->id());
}

// ── Ordering ──

bool TabRegistry::moveTab(TabId id, int newPosition) {
    int idx = indexOf(id);
    if (idx < 0) {
        qWarning() << "TabRegistry: moveTab: unknown tab" << id;
        return false;
    }

    // Clamp to the whole list, then to the tab's own pin group so pinned
    // tabs stay in front.
    int target = qBound(0, newPosition, count() - 1);
    const int pinned = pinnedCount();
    if (m_tabs[idx]->pinned())
        target = qBound(0, target, pinned - 1);
    else
        target = qBound(pinned, target, count() - 1);

    if (target != idx) {
        relocate(idx, target);
        renumber();
    }
    return true;
}

bool TabRegistry::setPinned(TabId id, bool pinned) {
    int idx = indexOf(id);
    if (idx < 0) {
        qWarning() << "TabRegistry: setPinned: unknown tab" << id;
        return false;
    }
    Tab* t = m_tabs[idx].get();
    if (t->pinned() == pinned) return true;

    const int pinnedBefore = pinnedCount();
    if (pinned) {
        t->m_unpinnedSlot = idx - pinnedBefore;
        t->m_pinned = true;
        relocate(idx, pinnedBefore);
    } else {
        const int unpinnedAfter = count() - pinnedBefore + 1;   // includes this tab
        int slot = t->m_unpinnedSlot >= 0 ? t->m_unpinnedSlot : 0;
        slot = qBound(0, slot, unpinnedAfter - 1);
        t->m_unpinnedSlot = -1;
        t->m_pinned = false;
        relocate(idx, (pinnedBefore - 1) + slot);
    }
    renumber();
    return true;
}

void TabRegistry::relocate(int from, int to) {
    if (from == to) return;
    auto first = m_tabs.begin();
    if (from < to)
        std::rotate(first + from, first + from + 1, first + to + 1);
    else
        std::rotate(first + to, first + from, first + from + 1);
}

void TabRegistry::renumber() {
    for (int i = 0; i < count(); i++)
        m_tabs[i]->m_position = i;
}

// ── Activation ──

bool TabRegistry::setActive(TabId id) {
    if (indexOf(id) < 0) {
        qWarning() << "TabRegistry: setActive: unknown tab" << id;
        return false;
    }
    if (id != m_activeId)
        activate(id);
    return true;
}

void TabRegistry::activate(TabId id) {
    TabId previous = m_activeId;
    m_activeId = id;
    emit activeTabChanged(id, previous);
}

// ── Queries ──

int TabRegistry::indexOf(TabId id) const {
    if (id == 0) return -1;
    for (int i = 0; i < count(); i++)
        if (m_tabs[i]->id() == id) return i;
    return -1;
}

Tab* TabRegistry::tab(TabId id) const {
    int idx = indexOf(id);
    return idx >= 0 ? m_tabs[idx].get() : nullptr;
}

Tab* TabRegistry::tabAt(int position) const {
    if (position < 0 || position >= count()) return nullptr;
    return m_tabs[position].get();
}

int TabRegistry::pinnedCount() const {
    int n = 0;
    for (const auto& t : m_tabs)
        if (t->pinned()) n++;
    return n;
}

QVector<TabId> TabRegistry::order() const {
    QVector<TabId> ids;
    ids.reserve(count());
    for (const auto& t : m_tabs) ids.append(t->id());
    return ids;
}

bool TabRegistry::positionsAreContiguous() const {
    bool seenUnpinned = false;
    for (int i = 0; i < count(); i++) {
        if (m_tabs[i]->position() != i) return false;
        if (m_tabs[i]->pinned() && seenUnpinned) return false;
        if (!m_tabs[i]->pinned()) seenUnpinned = true;
    }
    return true;
}

} // namespace vrt
