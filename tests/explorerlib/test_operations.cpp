#include <QtTest>
#include "explorerlib/operations/expandnodeoperation.h"
#include "explorerlib/operations/refreshoperation.h"
#include "explorerlib/selectioncontroller.h"
#include "test_helpers.h"
#include <QSemaphore>
#include <QThread>

class OperationsTests : public QObject
{
    Q_OBJECT

private slots:
    void runSync_expandsNode()
    {
        ExplorerFixture fixture(QStringList() << "project-1" << "project-2");
        ExpandNodeOperation operation(&fixture.cache, fixture.cache.GetRoot(), false);
        QSignalSpy startedSpy(&operation, &ExplorerOperation::started);
        QSignalSpy completedSpy(&operation, &ExplorerOperation::completed);
        QSignalSpy stateSpy(&operation, &ExplorerOperation::stateChanged);

        QCOMPARE(operation.state(), ExplorerOperation::NotStarted);
        QCOMPARE(operation.title(), QString("Loading Google Cloud"));
        operation.runSync();

        QVERIFY(operation.isCompleted());
        QCOMPARE(startedSpy.count(), 1);
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(stateSpy.count(), 2);
        QCOMPARE(operation.children().size(), 2);
        QCOMPARE(operation.children().at(0)->GetDisplayText(), QString("project-1"));
    }

    void runAsync_completesOnThreadPool()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");

        ExpandNodeOperation operation(&fixture.cache, project, false);
        QSignalSpy completedSpy(&operation, &ExplorerOperation::completed);

        operation.runAsync();
        operation.waitForCompletion();

        QVERIFY(operation.isCompleted());
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(operation.children().size(), 2);
        QVERIFY(fixture.cache.IsLoaded(project));
    }

    void failure_isReportedNotThrown()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");
        fixture.computeEngine.failing.storeRelease(1);

        ExpandNodeOperation operation(&fixture.cache, project, false);
        QSignalSpy failedSpy(&operation, &ExplorerOperation::failed);

        operation.runAsync();
        operation.waitForCompletion();

        QVERIFY(operation.isFailed());
        QVERIFY(operation.errorMessage().contains("project-1"));
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(0).toString(), operation.errorMessage());
        QVERIFY(operation.children().isEmpty());
    }

    void cancel_whileRunning()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");

        QSemaphore gate;
        fixture.computeEngine.SetGate(&gate);

        ExpandNodeOperation operation(&fixture.cache, project, false);
        QSignalSpy cancelledSpy(&operation, &ExplorerOperation::cancelled);

        operation.runAsync();
        QVERIFY(WaitFor([&fixture]() { return fixture.computeEngine.calls.loadAcquire() == 1; }));

        operation.cancel();
        gate.release();
        operation.waitForCompletion();

        QVERIFY(operation.isCancelled());
        QCOMPARE(cancelledSpy.count(), 1);
        QVERIFY(!fixture.cache.IsLoaded(project));
        QCOMPARE(project->GetChildren()->Count(), 0);
    }

    void cancel_beforeStart()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        ExpandNodeOperation operation(&fixture.cache, fixture.cache.GetRoot(), false);
        QSignalSpy cancelledSpy(&operation, &ExplorerOperation::cancelled);

        operation.cancel();
        QVERIFY(operation.isCancelled());
        QCOMPARE(cancelledSpy.count(), 1);

        // A cancelled operation cannot be started any more
        operation.runSync();
        QVERIFY(operation.isCancelled());
        QCOMPARE(fixture.resourceManager.calls.loadAcquire(), 0);
    }

    void runTwice_isRejected()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        ExpandNodeOperation operation(&fixture.cache, fixture.cache.GetRoot(), true);
        QSignalSpy completedSpy(&operation, &ExplorerOperation::completed);

        operation.runSync();
        operation.runSync();

        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(fixture.resourceManager.calls.loadAcquire(), 1);
    }

    void concurrentExpand_sharesOneFetch()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");

        QSemaphore gate;
        fixture.computeEngine.SetGate(&gate);

        ExpandNodeOperation first(&fixture.cache, project, false);
        ExpandNodeOperation second(&fixture.cache, project, false);

        first.runAsync();
        QVERIFY(WaitFor([&fixture]() { return fixture.computeEngine.calls.loadAcquire() == 1; }));
        second.runAsync();
        QThread::msleep(50);

        // Enough permits for a second listing, which must not happen
        gate.release(2);
        first.waitForCompletion();
        second.waitForCompletion();

        QVERIFY(first.isCompleted());
        QVERIFY(second.isCompleted());
        QCOMPARE(fixture.computeEngine.calls.loadAcquire(), 1);
        QCOMPARE(first.children(), second.children());
        QCOMPARE(first.children().size(), 2);
    }

    void refresh_reloadsProjects()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.cache.GetFilteredChildren(fixture.cache.GetRoot(), false);
        fixture.repository.AddProject("project-2");

        RefreshOperation operation(&fixture.cache, true);
        operation.runAsync();
        operation.waitForCompletion();

        QVERIFY(operation.isCompleted());
        QCOMPARE(fixture.cache.GetRoot()->GetChildren()->Count(), 2);
    }

    void refresh_followsSelection()
    {
        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");
        QSharedPointer<ExplorerNode> zone = fixture.FindChild(project, "europe-west1-b");

        FakeCloudConsole console;
        SelectionController selection(&fixture.cache, &console);
        selection.SetSelectedNode(zone);

        RefreshOperation operation(&selection);
        operation.runSync();

        QVERIFY(operation.isCompleted());
        QCOMPARE(fixture.resourceManager.calls.loadAcquire(), 1);
        QCOMPARE(fixture.computeEngine.calls.loadAcquire(), 2);
    }
};

QTEST_APPLESS_MAIN(OperationsTests)
#include "test_operations.moc"
