#include "mainwindow.h"
#include "engineregistry.h"
#include "engines/webengine_binding.h"
#include "preferences.h"
#include "sessionstore.h"
#include "shellcontroller.h"
#include "themes/themeengine.h"
#include <QApplication>
#include <QDebug>
#include <QSettings>
#include <QStyleFactory>
#include <cstdio>

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Verta");
    app.setOrganizationName("Verta");
    app.setStyle(QStyleFactory::create("Fusion"));

    vrt::ShellPreferences prefs;
    {
        QSettings settings("Verta", "Verta");
        prefs = vrt::ShellPreferences::fromSettings(settings);
    }
    QString argError;
    if (!prefs.applyArguments(app.arguments(), &argError)) {
        std::fprintf(stderr, "verta: %s\n", qPrintable(argError));
        return 2;
    }

    auto& engines = vrt::EngineRegistry::instance();
    engines.registerEngine("QtWebEngine", "webengine", vrt::WebEngineBinding::factory());
    vrt::EngineFactory factory = engines.factoryFor(prefs.engine);
    if (!factory)
        qWarning() << "main: no engine" << prefs.engine << "- tabs will be inert";

    vrt::SessionStore session(prefs.sessionFile);
    session.load();

    vrt::ThemeEngine themes;
    int userThemes = themes.loadUserThemes(prefs.themeDir);
    if (userThemes > 0)
        qDebug() << "main: loaded" << userThemes << "user themes from" << prefs.themeDir;

    vrt::ShellController controller(factory, &session, &themes);
    controller.setPreferences(prefs);

    int rc = 0;
    {
        vrt::MainWindow window(&controller);
        controller.start(prefs.startupUrl);
        window.show();

        QObject::connect(&app, &QApplication::aboutToQuit, &controller, [&controller]() {
            controller.shutdown();
        });
        rc = app.exec();
    }
    return rc;
}
