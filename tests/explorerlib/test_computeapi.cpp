#include <QtTest>
#include "explorerlib/computeapi/computeapi.h"
#include "explorerlib/locator.h"
#include "test_helpers.h"
#include <QJsonDocument>

class ComputeApiTests : public QObject
{
    Q_OBJECT

private slots:
    void loadInstancesFromResource()
    {
        const QList<ComputeAPI::Instance> instances = LoadInstancesFromJson(":/testdata/instances.json");
        QCOMPARE(instances.size(), 3);

        const ComputeAPI::Instance& windows = instances.at(0);
        QCOMPARE(windows.name, QString("windows-1"));
        QCOMPARE(windows.id, Q_UINT64_C(4611686018427387903));
        QCOMPARE(windows.status, QString("RUNNING"));
        QCOMPARE(windows.ZoneName(), QString("us-central1-a"));
        QVERIFY(windows.IsWindows());

        QVERIFY(!instances.at(1).IsWindows());
        QCOMPARE(instances.at(2).status, QString("TERMINATED"));
        QVERIFY(!instances.at(2).IsWindows());
        QCOMPARE(instances.at(2).ZoneName(), QString("europe-west1-b"));
    }

    void fromJson_shortZoneAndNumericId()
    {
        const QJsonObject json = QJsonDocument::fromJson(
            R"({"id": 42, "name": "vm", "zone": "zone-1", "status": "STOPPING"})").object();

        const ComputeAPI::Instance instance = ComputeAPI::Instance::FromJson(json);
        QCOMPARE(instance.id, Q_UINT64_C(42));
        QCOMPARE(instance.ZoneName(), QString("zone-1"));
        QVERIFY(instance.disks.isEmpty());
        QVERIFY(!instance.IsWindows());
    }

    void locators()
    {
        const InstanceLocator instance("project-1", "zone-1", "vm-1");
        QCOMPARE(instance.ToString(), QString("projects/project-1/zones/zone-1/instances/vm-1"));
        QCOMPARE(instance.Zone().ToString(), QString("projects/project-1/zones/zone-1"));
        QCOMPARE(instance.Project().ToString(), QString("projects/project-1"));
        QVERIFY(instance.Zone() == ZoneLocator("project-1", "zone-1"));
        QVERIFY(instance != InstanceLocator("project-1", "zone-2", "vm-1"));
        QVERIFY(InstanceLocator().IsNull());
        QVERIFY(!instance.IsNull());
    }
};

QTEST_APPLESS_MAIN(ComputeApiTests)
#include "test_computeapi.moc"
