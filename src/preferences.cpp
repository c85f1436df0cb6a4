#include "preferences.h"
#include "core.h"
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace vrt {

static QString configDir() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + QStringLiteral("/.config/verta");
    return dir;
}

ShellPreferences ShellPreferences::defaults() {
    ShellPreferences p;
    p.homepage    = QString::fromLatin1(kNewTabUrl);
    p.searchPage  = QStringLiteral("https://duckduckgo.com/html/?q=%s");
    p.engine      = QStringLiteral("webengine");
    p.sessionFile = configDir() + QStringLiteral("/session.json");
    p.themeDir    = configDir() + QStringLiteral("/themes");
    return p;
}

ShellPreferences ShellPreferences::fromSettings(const QSettings& s) {
    ShellPreferences d = defaults();
    ShellPreferences p;
    p.homepage    = s.value("homepage",    d.homepage).toString();
    p.searchPage  = s.value("searchPage",  d.searchPage).toString();
    p.engine      = s.value("engine",      d.engine).toString();
    p.sessionFile = s.value("sessionFile", d.sessionFile).toString();
    p.themeDir    = s.value("themeDir",    d.themeDir).toString();
    if (!p.searchPage.contains(QStringLiteral("%s")))
        p.searchPage = d.searchPage;
    return p;
}

void ShellPreferences::writeTo(QSettings& s) const {
    s.setValue("homepage",    homepage);
    s.setValue("searchPage",  searchPage);
    s.setValue("engine",      engine);
    s.setValue("sessionFile", sessionFile);
    s.setValue("themeDir",    themeDir);
}

bool ShellPreferences::applyArguments(const QStringList& arguments, QString* error) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Verta browser shell"));
    QCommandLineOption sessionOpt(QStringLiteral("session"),
                                  QStringLiteral("Session file to load and save."),
                                  QStringLiteral("file"));
    QCommandLineOption engineOpt(QStringLiteral("engine"),
                                 QStringLiteral("Rendering engine backend."),
                                 QStringLiteral("id"));
    parser.addOption(sessionOpt);
    parser.addOption(engineOpt);
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("Page to open."), QStringLiteral("[url]"));

    if (!parser.parse(arguments)) {
        if (error) *error = parser.errorText();
        return false;
    }
    if (parser.isSet(sessionOpt)) sessionFile = parser.value(sessionOpt);
    if (parser.isSet(engineOpt))  engine      = parser.value(engineOpt);
    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        if (error) *error = QStringLiteral("expected at most one url");
        return false;
    }
    if (!positional.isEmpty())
        startupUrl = positional.first();
    return true;
}

} // namespace vrt
