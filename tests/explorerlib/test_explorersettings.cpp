#include <QtTest>
#include "explorerlib/settings/explorersettings.h"
#include "explorerlib/settings/settingsprojectrepository.h"
#include "test_helpers.h"
#include <QTemporaryDir>

class ExplorerSettingsTests : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString settingsPath() const
    {
        return this->m_dir.filePath(QString("%1.ini").arg(QTest::currentTestFunction()));
    }

private slots:
    void initTestCase()
    {
        QVERIFY(this->m_dir.isValid());
    }

    void defaults()
    {
        QSettings store(this->settingsPath(), QSettings::IniFormat);
        ExplorerSettings settings(&store);

        QVERIFY(settings.IsWindowsIncluded());
        QVERIFY(settings.IsLinuxIncluded());
        QCOMPARE(settings.GetIncludedOperatingSystems(), AllOperatingSystems());
        QVERIFY(settings.GetInstanceFilter().isEmpty());
        QVERIFY(settings.GetFilterState() == FilterState());
    }

    void setWindowsIncluded_onFreshStore_notifiesOnce()
    {
        QSettings store(this->settingsPath(), QSettings::IniFormat);
        ExplorerSettings settings(&store);
        QSignalSpy changedSpy(&settings, &ExplorerSettings::settingsChanged);

        settings.SetWindowsIncluded(true);
        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(changedSpy.at(0).at(0).toString(), QString("Explorer/includeWindows"));

        settings.SetWindowsIncluded(true);
        QCOMPARE(changedSpy.count(), 1);

        settings.SetWindowsIncluded(false);
        QCOMPARE(changedSpy.count(), 2);
    }

    void filterState_isPersisted()
    {
        {
            QSettings store(this->settingsPath(), QSettings::IniFormat);
            ExplorerSettings settings(&store);
            settings.SetLinuxIncluded(false);
            settings.SetInstanceFilter("web");
            settings.Sync();
        }

        QSettings store(this->settingsPath(), QSettings::IniFormat);
        ExplorerSettings settings(&store);
        QVERIFY(settings.IsWindowsIncluded());
        QVERIFY(!settings.IsLinuxIncluded());
        QCOMPARE(settings.GetInstanceFilter(), QString("web"));

        const FilterState state = settings.GetFilterState();
        QCOMPARE(state.operatingSystems, OperatingSystems(OperatingSystem::Windows));
        QCOMPARE(state.instanceNamePattern, QString("web"));

        // Unchanged after reload, no notification
        QSignalSpy changedSpy(&settings, &ExplorerSettings::settingsChanged);
        settings.SetLinuxIncluded(false);
        settings.SetInstanceFilter("web");
        QCOMPARE(changedSpy.count(), 0);
    }

    void setIncludedOperatingSystems()
    {
        QSettings store(this->settingsPath(), QSettings::IniFormat);
        ExplorerSettings settings(&store);

        settings.SetIncludedOperatingSystems(OperatingSystem::Linux);
        QVERIFY(!settings.IsWindowsIncluded());
        QVERIFY(settings.IsLinuxIncluded());

        settings.SetIncludedOperatingSystems(OperatingSystems());
        QCOMPARE(settings.GetIncludedOperatingSystems(), OperatingSystems());
    }

    void boundCache_followsSettings()
    {
        QSettings store(this->settingsPath(), QSettings::IniFormat);
        ExplorerSettings settings(&store);
        settings.SetInstanceFilter("linux");

        ExplorerFixture fixture(QStringList() << "project-1");
        fixture.computeEngine.SetInstances("project-1", LoadInstancesFromJson(":/testdata/instances.json"));
        fixture.cache.BindSettings(&settings);
        QCOMPARE(fixture.cache.GetFilter().instanceNamePattern, QString("linux"));

        QSharedPointer<ExplorerNode> project = fixture.FindChild(fixture.cache.GetRoot(), "project-1");
        QSharedPointer<ExplorerNode> zone = fixture.FindChild(project, "us-central1-a");
        QCOMPARE(fixture.ChildTexts(zone), QStringList() << "linux-zone-1");

        settings.SetInstanceFilter(QString());
        settings.SetLinuxIncluded(false);
        QCOMPARE(fixture.ChildTexts(zone), QStringList() << "windows-1");
        QCOMPARE(fixture.computeEngine.calls.loadAcquire(), 1);
    }

    void projectRepository_persistsTrackedProjects()
    {
        {
            QSettings store(this->settingsPath(), QSettings::IniFormat);
            SettingsProjectRepository repository(&store);
            QVERIFY(repository.ListProjects().isEmpty());

            repository.AddProject("project-1");
            repository.AddProject("project-2");
            repository.AddProject("project-1");
            repository.AddProject(QString());
            QCOMPARE(repository.ListProjects(), QStringList() << "project-1" << "project-2");
        }

        QSettings store(this->settingsPath(), QSettings::IniFormat);
        SettingsProjectRepository repository(&store);
        QCOMPARE(repository.ListProjects(), QStringList() << "project-1" << "project-2");

        repository.RemoveProject("project-1");
        repository.RemoveProject("project-9");
        QCOMPARE(repository.ListProjects(), QStringList() << "project-2");
    }

    void projectRepository_drivesCache()
    {
        QSettings store(this->settingsPath(), QSettings::IniFormat);
        SettingsProjectRepository repository(&store);
        FakeResourceManager resourceManager;
        FakeComputeEngine computeEngine;
        ResourceCache cache(&repository, &resourceManager, &computeEngine, nullptr, nullptr);

        cache.AddTrackedProject("project-b");
        cache.AddTrackedProject("project-a");

        NodeList* projects = cache.GetFilteredChildren(cache.GetRoot(), false);
        QCOMPARE(projects->Count(), 2);
        QCOMPARE(projects->At(0)->GetDisplayText(), QString("project-a"));
        QCOMPARE(repository.ListProjects(), QStringList() << "project-b" << "project-a");
    }
};

QTEST_APPLESS_MAIN(ExplorerSettingsTests)
#include "test_explorersettings.moc"
