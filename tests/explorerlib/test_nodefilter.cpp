#include <QtTest>
#include "explorerlib/computeapi/computeapi.h"
#include "explorerlib/connectionstatetracker.h"
#include "explorerlib/nodefilter.h"

class NodeFilterTests : public QObject
{
    Q_OBJECT

private:
    QList<QSharedPointer<ExplorerNode>> makeInstances(ConnectionStateTracker* tracker)
    {
        QList<QSharedPointer<ExplorerNode>> nodes;
        nodes << ExplorerNode::CreateInstance(InstanceLocator("p", "z", "windows-1"), OperatingSystem::Windows, "RUNNING", tracker, false)
              << ExplorerNode::CreateInstance(InstanceLocator("p", "z", "linux-1"), OperatingSystem::Linux, "RUNNING", tracker, false)
              << ExplorerNode::CreateInstance(InstanceLocator("p", "z", "Linux-Windows-bridge"), OperatingSystem::Linux, "TERMINATED", tracker, false);
        return nodes;
    }

    static QStringList names(const QList<QSharedPointer<ExplorerNode>>& nodes)
    {
        QStringList result;
        for (const QSharedPointer<ExplorerNode>& node : nodes)
            result.append(node->GetDisplayText());
        return result;
    }

private slots:
    void defaultFilter_includesEverything()
    {
        ConnectionStateTracker tracker(nullptr);
        const QList<QSharedPointer<ExplorerNode>> nodes = this->makeInstances(&tracker);

        QCOMPARE(names(NodeFilter::Apply(nodes, FilterState())),
                 QStringList() << "windows-1" << "linux-1" << "Linux-Windows-bridge");
    }

    void operatingSystemFilter()
    {
        ConnectionStateTracker tracker(nullptr);
        const QList<QSharedPointer<ExplorerNode>> nodes = this->makeInstances(&tracker);

        FilterState filter;
        filter.operatingSystems = OperatingSystem::Linux;
        QCOMPARE(names(NodeFilter::Apply(nodes, filter)), QStringList() << "linux-1" << "Linux-Windows-bridge");

        filter.operatingSystems = OperatingSystem::Windows;
        QCOMPARE(names(NodeFilter::Apply(nodes, filter)), QStringList() << "windows-1");

        filter.operatingSystems = OperatingSystems();
        QVERIFY(NodeFilter::Apply(nodes, filter).isEmpty());
    }

    void namePattern_caseInsensitiveSubstring()
    {
        ConnectionStateTracker tracker(nullptr);
        const QList<QSharedPointer<ExplorerNode>> nodes = this->makeInstances(&tracker);

        FilterState filter;
        filter.instanceNamePattern = "windows";
        QCOMPARE(names(NodeFilter::Apply(nodes, filter)), QStringList() << "windows-1" << "Linux-Windows-bridge");

        filter.operatingSystems = OperatingSystem::Linux;
        QCOMPARE(names(NodeFilter::Apply(nodes, filter)), QStringList() << "Linux-Windows-bridge");

        filter.instanceNamePattern = "no-such-vm";
        QVERIFY(NodeFilter::Apply(nodes, filter).isEmpty());
    }

    void projectsAndZones_alwaysPass()
    {
        ComputeAPI::Project project;
        project.projectId = "project-1";
        project.name = "Project One";

        QList<QSharedPointer<ExplorerNode>> nodes;
        nodes << ExplorerNode::CreateProject(project)
              << ExplorerNode::CreateInaccessibleProject("project-2")
              << ExplorerNode::CreateZone(ZoneLocator("project-1", "zone-1"));

        FilterState filter;
        filter.operatingSystems = OperatingSystems();
        filter.instanceNamePattern = "nothing matches this";

        QCOMPARE(NodeFilter::Apply(nodes, filter), nodes);
        QCOMPARE(names(nodes), QStringList() << "Project One (project-1)"
                                             << "inaccessible project (project-2)"
                                             << "zone-1");
    }
};

QTEST_APPLESS_MAIN(NodeFilterTests)
#include "test_nodefilter.moc"
