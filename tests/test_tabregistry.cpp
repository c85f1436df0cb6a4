#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QRandomGenerator>
#include <stdexcept>
#include "tabregistry.h"
#include "fakeengine.h"

using namespace vrt;

class TestTabRegistry : public QObject {
    Q_OBJECT
private:
    FakeEngineHub* m_hub = nullptr;
    TabRegistry*   m_reg = nullptr;

    TabId open(const QString& url, bool pinned = false) {
        return m_reg->createTab(url, pinned).id;
    }

    bool activeInvariantHolds() const {
        if (m_reg->isEmpty()) return m_reg->activeTabId() == 0;
        return m_reg->tab(m_reg->activeTabId()) != nullptr;
    }

private slots:
    void init() {
        m_hub = new FakeEngineHub;
        m_reg = new TabRegistry(m_hub->factory());
    }
    void cleanup() {
        delete m_reg;
        delete m_hub;
        m_reg = nullptr;
        m_hub = nullptr;
    }

    // ── Creation ──

    void testCreateAppendsAndActivatesFirst() {
        QSignalSpy created(m_reg, &TabRegistry::tabCreated);
        QSignalSpy activated(m_reg, &TabRegistry::activeTabChanged);

        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        QCOMPARE(m_reg->order(), (QVector<TabId>{a, b}));
        QCOMPARE(m_reg->activeTabId(), a);
        QCOMPARE(created.count(), 2);
        QCOMPARE(activated.count(), 1);
        QVERIFY(a != b);
        QVERIFY(m_reg->positionsAreContiguous());
    }

    void testPinnedCreateGoesToPinnedGroup() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId p = open("https://p.example/", true);
        QCOMPARE(m_reg->order(), (QVector<TabId>{p, a, b}));
        QCOMPARE(m_reg->pinnedCount(), 1);
        QVERIFY(m_reg->positionsAreContiguous());
    }

    void testIdsNeverReused() {
        TabId a = open("https://a.example/");
        m_reg->closeTab(a);
        TabId b = open("https://b.example/");
        QVERIFY(b != a);
    }

    // ── Close ──

    void testCloseActiveActivatesNeighbour() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId c = open("https://c.example/");
        m_reg->setActive(b);

        QVERIFY(m_reg->closeTab(b));
        QCOMPARE(m_reg->activeTabId(), c);   // the tab that slid into its slot
        QCOMPARE(m_reg->order(), (QVector<TabId>{a, c}));

        QVERIFY(m_reg->closeTab(c));
        QCOMPARE(m_reg->activeTabId(), a);   // closed the last one: previous neighbour

        QVERIFY(m_reg->closeTab(a));
        QCOMPARE(m_reg->activeTabId(), TabId(0));
        QVERIFY(m_reg->isEmpty());
    }

    void testCloseInactiveKeepsActive() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        QVERIFY(m_reg->closeTab(b));
        QCOMPARE(m_reg->activeTabId(), a);
    }

    void testCloseReleasesBinding() {
        TabId a = open("https://a.example/");
        QCOMPARE(m_hub->liveCount(), 1);
        FakeEngine* e = m_hub->engine(a);
        QVERIFY(e);
        QVERIFY(m_reg->closeTab(a));
        QCOMPARE(m_hub->liveCount(), 0);
        QCOMPARE(m_hub->released, 1);
    }

    void testCloseUnknownFails() {
        open("https://a.example/");
        QVERIFY(!m_reg->closeTab(9999));
        QCOMPARE(m_reg->count(), 1);
    }

    // ── Move ──

    void testMoveClampsToList() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId c = open("https://c.example/");
        QVERIFY(m_reg->moveTab(a, 100));
        QCOMPARE(m_reg->order(), (QVector<TabId>{b, c, a}));
        QVERIFY(m_reg->moveTab(a, -5));
        QCOMPARE(m_reg->order(), (QVector<TabId>{a, b, c}));
        QVERIFY(m_reg->positionsAreContiguous());
    }

    void testMoveLastToFront() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId c = open("https://c.example/");
        QVERIFY(m_reg->moveTab(c, 0));
        QCOMPARE(m_reg->order(), (QVector<TabId>{c, a, b}));
        QCOMPARE(m_reg->tab(c)->position(), 0);
        QCOMPARE(m_reg->tab(b)->position(), 2);
    }

    void testMoveStaysInPinGroup() {
        TabId p = open("https://p.example/", true);
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");

        QVERIFY(m_reg->moveTab(b, 0));
        QCOMPARE(m_reg->order(), (QVector<TabId>{p, b, a}));

        QVERIFY(m_reg->moveTab(p, 2));
        QCOMPARE(m_reg->order(), (QVector<TabId>{p, b, a}));
    }

    // ── Pin ──

    void testPinFirstOfTwo() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        QVERIFY(m_reg->setPinned(a, true));
        QCOMPARE(m_reg->order(), (QVector<TabId>{a, b}));
        QVERIFY(m_reg->tab(a)->pinned());
        QCOMPARE(m_reg->tab(a)->position(), 0);
        QCOMPARE(m_reg->tab(b)->position(), 1);
    }

    void testPinUnpinRoundTrip() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId c = open("https://c.example/");
        m_reg->setActive(c);

        QVERIFY(m_reg->setPinned(c, true));
        QCOMPARE(m_reg->order(), (QVector<TabId>{c, a, b}));
        QCOMPARE(m_reg->activeTabId(), c);

        QVERIFY(m_reg->setPinned(c, false));
        QCOMPARE(m_reg->order(), (QVector<TabId>{a, b, c}));
        QCOMPARE(m_reg->activeTabId(), c);
        QVERIFY(m_reg->positionsAreContiguous());
    }

    void testUnpinAfterClosesClampsSlot() {
        TabId a = open("https://a.example/");
        TabId b = open("https://b.example/");
        TabId c = open("https://c.example/");
        m_reg->setPinned(c, true);
        m_reg->closeTab(a);
        m_reg->closeTab(b);
        QVERIFY(m_reg->setPinned(c, false));
        QCOMPARE(m_reg->order(), (QVector<TabId>{c}));
        QVERIFY(m_reg->positionsAreContiguous());
    }

    void testPinIsIdempotent() {
        TabId a = open("https://a.example/");
        QVERIFY(m_reg->setPinned(a, true));
        QVERIFY(m_reg->setPinned(a, true));
        QCOMPARE(m_reg->pinnedCount(), 1);
    }

    // ── Engine ──

    void testInertTabStillListed() {
        m_hub->available = false;
        TabCreateResult r = m_reg->createTab("https://a.example/");
        QVERIFY(!r.ok());
        QCOMPARE(r.error, ShellError::EngineUnavailable);
        QCOMPARE(m_reg->count(), 1);
        QCOMPARE(m_reg->activeTabId(), r.id);
    }

    void testFactoryThrowIsEngineUnavailable() {
        TabRegistry reg([](TabId, EngineEventSink) -> std::unique_ptr<EngineBinding> {
            throw std::runtime_error("no gpu");
        });
        TabCreateResult r = reg.createTab("https://a.example/");
        QCOMPARE(r.error, ShellError::EngineUnavailable);
        QVERIFY(reg.tab(r.id));
    }

    void testSinkTagsTabId() {
        QVector<EngineEvent> seen;
        m_reg->setEventSink([&seen](const EngineEvent& ev) { seen.append(ev); });
        TabId a = open("https://a.example/");
        FakeEngine* e = m_hub->engine(a);
        EngineEvent ev;
        ev.tab = 777;   // the binding does not get to choose
        ev.kind = EngineEventKind::Loaded;
        e->sink()(ev);
        QCOMPARE(int(seen.size()), 1);
        QCOMPARE(seen.first().tab, a);
    }

    void testDestructorReleasesAll() {
        open("https://a.example/");
        open("https://b.example/");
        QCOMPARE(m_hub->liveCount(), 2);
        delete m_reg;
        m_reg = nullptr;
        QCOMPARE(m_hub->liveCount(), 0);
    }

    // ── Randomized sequences ──

    void testRandomOperationsKeepInvariants() {
        QRandomGenerator rng(20240611);
        QVector<TabId> known;
        for (int step = 0; step < 2000; step++) {
            const int op = rng.bounded(6);
            const TabId pick = known.isEmpty() ? 0
                : known[rng.bounded(int(known.size()))];
            switch (op) {
            case 0:
                known.append(open(QStringLiteral("https://t%1.example/").arg(step),
                                  rng.bounded(4) == 0));
                break;
            case 1:
                if (pick && m_reg->closeTab(pick))
                    known.removeAll(pick);
                break;
            case 2:
                if (pick) m_reg->moveTab(pick, rng.bounded(-2, m_reg->count() + 2));
                break;
            case 3:
                if (pick) m_reg->setPinned(pick, rng.bounded(2) == 0);
                break;
            case 4:
                if (pick) m_reg->setActive(pick);
                break;
            case 5:
                if (known.size() > 12 && pick && m_reg->closeTab(pick))
                    known.removeAll(pick);
                break;
            }
            QVERIFY2(m_reg->positionsAreContiguous(), qPrintable(QString("step %1").arg(step)));
            QVERIFY2(activeInvariantHolds(), qPrintable(QString("step %1").arg(step)));
            QCOMPARE(m_reg->count(), int(known.size()));
            QCOMPARE(m_hub->liveCount(), int(known.size()));
        }
    }
};

QTEST_MAIN(TestTabRegistry)
#include "test_tabregistry.moc"
