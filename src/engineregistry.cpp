#include "engineregistry.h"
#include <QDebug>

namespace vrt {

EngineRegistry& EngineRegistry::instance() {
    static EngineRegistry s_instance;
    return s_instance;
}

bool EngineRegistry::registerEngine(const QString& name, const QString& identifier, EngineFactory factory) {
    if (!factory) {
        qWarning() << "EngineRegistry: Refusing engine without factory:" << identifier;
        return false;
    }
    // Check if already registered
    for (const auto& info : m_engines) {
        if (info.identifier == identifier) {
            qWarning() << "EngineRegistry: Engine already registered:" << identifier;
            return false;
        }
    }

    m_engines.append(EngineInfo(name, identifier, std::move(factory)));
    qDebug() << "EngineRegistry: Registered engine:" << name << "(" << identifier << ")";
    return true;
}

void EngineRegistry::unregisterEngine(const QString& identifier) {
    for (int i = 0; i < m_engines.size(); ++i) {
        if (m_engines[i].identifier == identifier) {
            qDebug() << "EngineRegistry: Unregistered engine:" << identifier;
            m_engines.removeAt(i);
            return;
        }
    }
    qWarning() << "EngineRegistry: Engine not found:" << identifier;
}

const EngineRegistry::EngineInfo* EngineRegistry::findEngine(const QString& identifier) const {
    for (const auto& info : m_engines) {
        if (info.identifier == identifier) {
            return &info;
        }
    }
    return nullptr;
}

EngineFactory EngineRegistry::factoryFor(const QString& identifier) const {
    const EngineInfo* info = findEngine(identifier);
    if (!info) {
        qWarning() << "EngineRegistry: No engine for identifier:" << identifier;
        return {};
    }
    return info->factory;
}

void EngineRegistry::clear() {
    m_engines.clear();
}

} // namespace vrt
