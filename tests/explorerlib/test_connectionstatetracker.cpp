#include <QtTest>
#include "explorerlib/connectionstatetracker.h"
#include "explorerlib/sessioneventbus.h"
#include "test_helpers.h"

class ConnectionStateTrackerTests : public QObject
{
    Q_OBJECT

private slots:
    void seed_usesBrokerState()
    {
        SessionEventBus bus;
        ConnectionStateTracker tracker(&bus);
        const InstanceLocator connected("project-1", "zone-1", "vm-1");
        const InstanceLocator disconnected("project-1", "zone-1", "vm-2");

        tracker.Seed(connected, true);
        tracker.Seed(disconnected, false);

        QVERIFY(tracker.IsTracked(connected));
        QVERIFY(tracker.IsConnected(connected));
        QVERIFY(tracker.IsTracked(disconnected));
        QVERIFY(!tracker.IsConnected(disconnected));
        QCOMPARE(tracker.GetConnectedInstances(), QList<InstanceLocator>() << connected);
    }

    void sessionStarted_connectsLoadedInstance()
    {
        SessionEventBus bus;
        ConnectionStateTracker tracker(&bus);
        const InstanceLocator instance("project-1", "zone-1", "vm-1");
        tracker.Seed(instance, false);
        QSignalSpy changedSpy(&tracker, &ConnectionStateTracker::connectionStateChanged);

        bus.PublishSessionStarted(instance);
        QVERIFY(tracker.IsConnected(instance));
        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(changedSpy.at(0).at(1).toBool(), true);

        // Redelivered event
        bus.PublishSessionStarted(instance);
        QCOMPARE(changedSpy.count(), 1);

        bus.PublishSessionEnded(instance);
        QVERIFY(!tracker.IsConnected(instance));
        QCOMPARE(changedSpy.count(), 2);
        QCOMPARE(changedSpy.at(1).at(1).toBool(), false);

        bus.PublishSessionEnded(instance);
        QCOMPARE(changedSpy.count(), 2);
    }

    void sessionStarted_unknownInstance_isIgnored()
    {
        SessionEventBus bus;
        ConnectionStateTracker tracker(&bus);
        const InstanceLocator instance("project-1", "zone-1", "vm-1");
        QSignalSpy changedSpy(&tracker, &ConnectionStateTracker::connectionStateChanged);

        bus.PublishSessionStarted(instance);

        QVERIFY(!tracker.IsConnected(instance));
        QVERIFY(!tracker.IsTracked(instance));
        QCOMPARE(changedSpy.count(), 0);
    }

    void release_isReferenceCounted()
    {
        SessionEventBus bus;
        ConnectionStateTracker tracker(&bus);
        const InstanceLocator instance("project-1", "zone-1", "vm-1");

        // Reload: replacement node registers before the old one is dropped
        tracker.Seed(instance, true);
        tracker.Seed(instance, true);
        tracker.Release(instance);
        QVERIFY(tracker.IsTracked(instance));
        QVERIFY(tracker.IsConnected(instance));

        tracker.Release(instance);
        QVERIFY(!tracker.IsTracked(instance));
        QVERIFY(!tracker.IsConnected(instance));

        // Once dropped, sessions no longer count
        bus.PublishSessionStarted(instance);
        QVERIFY(!tracker.IsConnected(instance));
    }

    void instanceNode_readsStateThroughTracker()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        const InstanceLocator linuxVm("project-1", "us-central1-a", "linux-zone-1");
        const InstanceLocator windowsVm("project-1", "us-central1-a", "windows-1");
        fixture.sessionBroker.connected.insert(linuxVm);

        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");
        QSharedPointer<ExplorerNode> zone = fixture.FindChild(project, "us-central1-a");
        QSharedPointer<ExplorerNode> linuxNode = fixture.FindChild(zone, "linux-zone-1");
        QSharedPointer<ExplorerNode> windowsNode = fixture.FindChild(zone, "windows-1");

        QVERIFY(linuxNode->IsConnected());
        QCOMPARE(linuxNode->GetImageVariant(), ExplorerNode::ImageVariant::LinuxConnected);
        QVERIFY(!windowsNode->IsConnected());
        QCOMPARE(windowsNode->GetImageVariant(), ExplorerNode::ImageVariant::WindowsDisconnected);

        fixture.eventBus.PublishSessionStarted(windowsVm);
        QVERIFY(windowsNode->IsConnected());
        QCOMPARE(windowsNode->GetImageVariant(), ExplorerNode::ImageVariant::WindowsConnected);

        fixture.eventBus.PublishSessionEnded(linuxVm);
        QVERIFY(!linuxNode->IsConnected());
        QCOMPARE(linuxNode->GetImageVariant(), ExplorerNode::ImageVariant::LinuxDisconnected);

        // Event for an instance of a zone that is not in the tree
        fixture.eventBus.PublishSessionStarted(InstanceLocator("project-1", "asia-east1-a", "linux-zone-1"));
        QCOMPARE(fixture.tracker.GetConnectedInstances(), QList<InstanceLocator>() << windowsVm);
    }

    void reload_keepsConnectionState()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        const InstanceLocator windowsVm("project-1", "us-central1-a", "windows-1");

        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");
        fixture.cache.GetFilteredChildren(project, false);
        fixture.eventBus.PublishSessionStarted(windowsVm);

        // The broker reports the session as well once it is open
        fixture.sessionBroker.connected.insert(windowsVm);
        fixture.cache.Refresh(false);

        QSharedPointer<ExplorerNode> zone = fixture.FindChild(project, "us-central1-a");
        QSharedPointer<ExplorerNode> windowsNode = fixture.FindChild(zone, "windows-1");
        QVERIFY(fixture.tracker.IsTracked(windowsVm));
        QVERIFY(windowsNode->IsConnected());
    }
};

QTEST_APPLESS_MAIN(ConnectionStateTrackerTests)
#include "test_connectionstatetracker.moc"
