#pragma once
#include "engines/engine.h"
#include <QList>
#include <QString>

namespace vrt {

/**
 * Global registry of rendering-engine backends
 *
 * Backends register a factory under a unique identifier; the shell picks one
 * by the "engine" preference at startup.
 */
class EngineRegistry {
public:
    struct EngineInfo {
        QString       name;          // Display name (e.g., "QtWebEngine")
        QString       identifier;    // Unique ID (e.g., "webengine")
        EngineFactory factory;

        EngineInfo(const QString& n, const QString& id, EngineFactory f)
            : name(n), identifier(id), factory(std::move(f)) {}
    };

    static EngineRegistry& instance();

    // Register a backend. Returns false if the identifier is taken.
    bool registerEngine(const QString& name, const QString& identifier, EngineFactory factory);

    // Unregister a backend
    void unregisterEngine(const QString& identifier);

    // Get all registered backends
    const QList<EngineInfo>& engines() const { return m_engines; }

    // Find backend by identifier
    const EngineInfo* findEngine(const QString& identifier) const;

    // Factory for `identifier`, or an empty factory if none is registered.
    // An empty factory makes every tab inert (EngineUnavailable).
    EngineFactory factoryFor(const QString& identifier) const;

    // Clear all backends
    void clear();

private:
    EngineRegistry() = default;
    QList<EngineInfo> m_engines;
};

} // namespace vrt
