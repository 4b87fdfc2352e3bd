#include <QtTest>

#include "ingest/IngestEventTypes.h"

using CaseTree::IngestEvent;
using CaseTree::IngestModuleEvent;
using CaseTree::IngestModuleEvents;

class tst_IngestEventTypes : public QObject
{
    Q_OBJECT

private slots:
    void testEventNames_data();
    void testEventNames();
    void testUnknownNameIsRejected();
    void testAllEventsCoversEveryKind();
    void testKindsAreDistinctFlags();
    void testDefaultEvent();
    void testEventInVariant();
    void testDebugOutput();
};

void tst_IngestEventTypes::testEventNames_data()
{
    QTest::addColumn<int>("kind");
    QTest::addColumn<QString>("name");

    QTest::newRow("data added") << static_cast<int>(IngestModuleEvent::DataAdded) << QStringLiteral("DATA_ADDED");
    QTest::newRow("content changed") << static_cast<int>(IngestModuleEvent::ContentChanged) << QStringLiteral("CONTENT_CHANGED");
    QTest::newRow("file done") << static_cast<int>(IngestModuleEvent::FileDone) << QStringLiteral("FILE_DONE");
}

void tst_IngestEventTypes::testEventNames()
{
    QFETCH(int, kind);
    QFETCH(QString, name);

    const auto event = static_cast<IngestModuleEvent>(kind);
    QCOMPARE(CaseTree::ingestModuleEventName(event), name);

    bool ok = false;
    QVERIFY(CaseTree::ingestModuleEventFromName(name, &ok) == event);
    QVERIFY(ok);
}

void tst_IngestEventTypes::testUnknownNameIsRejected()
{
    bool ok = true;
    CaseTree::ingestModuleEventFromName(QStringLiteral("data_added"), &ok);
    QVERIFY(!ok);

    ok = true;
    CaseTree::ingestModuleEventFromName(QString(), &ok);
    QVERIFY(!ok);

    // ok is optional
    QVERIFY(CaseTree::ingestModuleEventFromName(QStringLiteral("BOGUS")) == IngestModuleEvent::DataAdded);
}

void tst_IngestEventTypes::testAllEventsCoversEveryKind()
{
    const IngestModuleEvents all = CaseTree::allIngestModuleEvents();

    QVERIFY(all.testFlag(IngestModuleEvent::DataAdded));
    QVERIFY(all.testFlag(IngestModuleEvent::ContentChanged));
    QVERIFY(all.testFlag(IngestModuleEvent::FileDone));
    QCOMPARE(all.toInt(), 0x7);
}

void tst_IngestEventTypes::testKindsAreDistinctFlags()
{
    const IngestModuleEvents dataOnly(IngestModuleEvent::DataAdded);

    QVERIFY(dataOnly.testFlag(IngestModuleEvent::DataAdded));
    QVERIFY(!dataOnly.testFlag(IngestModuleEvent::ContentChanged));
    QVERIFY(!dataOnly.testFlag(IngestModuleEvent::FileDone));
    QVERIFY(!IngestModuleEvents());
}

void tst_IngestEventTypes::testDefaultEvent()
{
    const IngestEvent event;
    QVERIFY(event.kind == IngestModuleEvent::DataAdded);
    QVERIFY(!event.payload.isValid());
}

void tst_IngestEventTypes::testEventInVariant()
{
    IngestEvent event;
    event.kind = IngestModuleEvent::FileDone;
    event.payload = QStringLiteral("report.pdf");

    const QVariant variant = QVariant::fromValue(event);
    QVERIFY(variant.canConvert<IngestEvent>());

    const IngestEvent copy = variant.value<IngestEvent>();
    QVERIFY(copy.kind == IngestModuleEvent::FileDone);
    QCOMPARE(copy.payload.toString(), QStringLiteral("report.pdf"));
}

void tst_IngestEventTypes::testDebugOutput()
{
    IngestEvent event;
    event.kind = IngestModuleEvent::ContentChanged;
    event.payload = 5;

    QString text;
    QDebug(&text) << event;
    QVERIFY2(text.startsWith(QStringLiteral("IngestEvent(CONTENT_CHANGED, ")), qPrintable(text));
}

QTEST_MAIN(tst_IngestEventTypes)
#include "tst_IngestEventTypes.moc"
