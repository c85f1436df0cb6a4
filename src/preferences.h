#pragma once
#include <QString>
#include <QStringList>

class QSettings;

namespace vrt {

struct ShellPreferences {
    QString homepage;       // url for new tabs; the new-tab page by default
    QString searchPage;     // '%s' stands in for the search term
    QString engine;         // EngineRegistry identifier
    QString sessionFile;
    QString themeDir;
    QString startupUrl;     // from the command line, empty if none

    static ShellPreferences defaults();
    static ShellPreferences fromSettings(const QSettings& settings);
    void writeTo(QSettings& settings) const;

    // Applies "--session", "--engine" and a positional URL on top of the
    // stored values. Returns false (with `error` set) on bad arguments.
    bool applyArguments(const QStringList& arguments, QString* error = nullptr);
};

} // namespace vrt
