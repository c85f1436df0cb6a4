#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>
#include "themes/themeengine.h"

using namespace vrt;

static void writeTheme(const QString& path, const QByteArray& bytes) {
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(bytes);
}

class TestThemeEngine : public QObject {
    Q_OBJECT
private slots:
    void initTestCase() {
        qRegisterMetaType<vrt::Theme>("vrt::Theme");
    }

    void testBuiltinsListedFirst() {
        ThemeEngine engine;
        QVERIFY(engine.themes().size() >= 3);
        QCOMPARE(engine.themes()[0].id, QString("dusk"));
        QVERIFY(engine.contains("daylight"));
        QVERIFY(engine.contains("warm"));
        QCOMPARE(engine.currentId(), QString::fromLatin1(kDefaultThemeId));
    }

    void testBuiltinsHaveEveryColor() {
        ThemeEngine engine;
        for (const Theme& t : engine.themes()) {
            QVERIFY(!t.name.isEmpty());
            for (int i = 0; i < kThemeFieldCount; i++)
                QVERIFY2((t.*kThemeFields[i].ptr).isValid(),
                         qPrintable(t.id + "." + kThemeFields[i].key));
        }
    }

    void testUnknownIdResolvesToDefault() {
        ThemeEngine engine;
        QCOMPARE(engine.resolve("no-such-theme").id, ThemeEngine::defaultTheme().id);
        QCOMPARE(engine.resolve(QString()).id, ThemeEngine::defaultTheme().id);
    }

    void testSetCurrentEmitsOnlyOnChange() {
        ThemeEngine engine;
        QSignalSpy spy(&engine, &ThemeEngine::themeChanged);
        QCOMPARE(engine.setCurrent("daylight"), QString("daylight"));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(engine.setCurrent("daylight"), QString("daylight"));
        QCOMPARE(spy.count(), 1);

        // Fallback reports what was applied.
        QCOMPARE(engine.setCurrent("missing"), QString("dusk"));
        QCOMPARE(spy.count(), 2);
        QCOMPARE(engine.current().id, QString("dusk"));
    }

    void testJsonRoundTrip() {
        const Theme warm = Theme::warm();
        Theme back = Theme::fromJson(warm.toJson(), Theme::dusk());
        QCOMPARE(back.id, warm.id);
        QCOMPARE(back.name, warm.name);
        for (int i = 0; i < kThemeFieldCount; i++)
            QCOMPARE(back.*kThemeFields[i].ptr, warm.*kThemeFields[i].ptr);
    }

    void testPartialJsonKeepsBase() {
        QJsonObject o;
        o["id"] = "mint";
        o["accent"] = "#00ff99";
        o["text"] = "not a color";
        Theme t = Theme::fromJson(o, Theme::dusk());
        QCOMPARE(t.accent, QColor("#00ff99"));
        QCOMPARE(t.text, Theme::dusk().text);
        QCOMPARE(t.background, Theme::dusk().background);
    }

    void testLoadUserThemes() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        writeTheme(dir.filePath("mint.json"), R"({"name":"Mint","accent":"#00ff99"})");
        writeTheme(dir.filePath("ocean.json"), R"({"id":"ocean","name":"Ocean"})");
        writeTheme(dir.filePath("broken.json"), "{ nope");
        writeTheme(dir.filePath("impostor.json"), R"({"id":"dusk","name":"Fake Dusk"})");
        writeTheme(dir.filePath("notes.txt"), "ignored");

        ThemeEngine engine;
        const int builtins = int(engine.themes().size());
        QCOMPARE(engine.loadUserThemes(dir.path()), 2);
        QCOMPARE(int(engine.themes().size()), builtins + 2);
        QVERIFY(engine.contains("mint"));     // id from the file name
        QVERIFY(engine.contains("ocean"));
        QCOMPARE(engine.resolve("dusk").name, QString("Dusk"));
        QCOMPARE(engine.resolve("mint").accent, QColor("#00ff99"));

        QCOMPARE(engine.setCurrent("ocean"), QString("ocean"));
    }

    void testMissingThemeDir() {
        ThemeEngine engine;
        QCOMPARE(engine.loadUserThemes("/nonexistent/verta/themes"), 0);
    }
};

QTEST_GUILESS_MAIN(TestThemeEngine)
#include "test_themeengine.moc"
