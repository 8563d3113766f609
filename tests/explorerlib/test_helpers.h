/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef EXPLORERLIB_TEST_HELPERS_H
#define EXPLORERLIB_TEST_HELPERS_H

#include "explorerlib/cloudconsole.h"
#include "explorerlib/computeapi/computeapi.h"
#include "explorerlib/connectionstatetracker.h"
#include "explorerlib/projectrepository.h"
#include "explorerlib/resourcecache.h"
#include "explorerlib/sessionbroker.h"
#include "explorerlib/sessioneventbus.h"
#include <QAtomicInt>
#include <QHash>
#include <QMutex>
#include <QSemaphore>
#include <QSet>
#include <QString>
#include <QStringList>
#include <functional>

QList<ComputeAPI::Instance> LoadInstancesFromJson(const QString& resourcePath);

/**
 * @brief Poll a condition until it holds or the timeout expires
 */
bool WaitFor(const std::function<bool()>& condition, int timeoutMs = 5000);

ComputeAPI::Instance MakeInstance(const QString& name,
                                  const QString& zone,
                                  bool windows,
                                  const QString& status = "RUNNING");

class FakeProjectRepository : public ProjectRepository
{
    public:
        explicit FakeProjectRepository(const QStringList& projects = QStringList());

        QStringList ListProjects() const override;
        void AddProject(const QString& projectId) override;
        void RemoveProject(const QString& projectId) override;

        int addCalls = 0;
        int removeCalls = 0;

    private:
        mutable QMutex m_mutex;
        QStringList m_projects;
};

// Projects without an explicit name are reported with name == id
class FakeResourceManager : public ComputeAPI::ResourceManagerAdapter
{
    public:
        ComputeAPI::Project GetProject(const QString& projectId, const CancellationToken& token) override;

        QHash<QString, QString> names;
        QSet<QString> deniedProjects;
        QSet<QString> failingProjects;
        QAtomicInt calls;
};

class FakeComputeEngine : public ComputeAPI::ComputeEngineAdapter
{
    public:
        QList<ComputeAPI::Instance> ListInstances(const QString& projectId, const CancellationToken& token) override;

        void SetInstances(const QString& projectId, const QList<ComputeAPI::Instance>& instances);

        /**
         * @brief Block every listing until the test releases the semaphore
         */
        void SetGate(QSemaphore* gate)
        {
            this->m_gate = gate;
        }

        int CallsFor(const QString& projectId) const;

        QAtomicInt calls;
        QAtomicInt failing;

    private:
        mutable QMutex m_mutex;
        QHash<QString, QList<ComputeAPI::Instance>> m_instances;
        QHash<QString, int> m_callsPerProject;
        QSemaphore* m_gate = nullptr;
};

class FakeSessionBroker : public SessionBroker
{
    public:
        bool IsConnected(const InstanceLocator& instance) const override
        {
            return this->connected.contains(instance);
        }

        QSet<InstanceLocator> connected;
};

// Records every call as "<method> <argument>"
class FakeCloudConsole : public CloudConsole
{
    public:
        void OpenInstanceList(const ProjectLocator& project) override;
        void OpenInstanceList(const ZoneLocator& zone) override;
        void OpenInstanceDetails(const InstanceLocator& instance) override;
        void OpenAccessConfig(const QString& projectId) override;

        QStringList calls;
};

/**
 * @brief Cache wired to fake backends, tracker and event bus
 *
 * Declare it before any node pointers so nodes are released first.
 */
class ExplorerFixture
{
    public:
        explicit ExplorerFixture(const QStringList& projects = QStringList())
            : repository(projects)
            , tracker(&eventBus)
            , cache(&repository, &resourceManager, &computeEngine, &sessionBroker, &tracker)
        {
        }

        // Loads the children of parent if needed, null if no child has that text
        QSharedPointer<ExplorerNode> FindChild(const QSharedPointer<ExplorerNode>& parent, const QString& text);

        QStringList ChildTexts(const QSharedPointer<ExplorerNode>& parent);

        FakeProjectRepository repository;
        FakeResourceManager resourceManager;
        FakeComputeEngine computeEngine;
        FakeSessionBroker sessionBroker;
        SessionEventBus eventBus;
        ConnectionStateTracker tracker;
        ResourceCache cache;
};

#endif // EXPLORERLIB_TEST_HELPERS_H
