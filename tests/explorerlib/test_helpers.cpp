/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#include "test_helpers.h"
#include "explorerlib/explorererror.h"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QThread>

QList<ComputeAPI::Instance> LoadInstancesFromJson(const QString& resourcePath)
{
    QList<ComputeAPI::Instance> instances;

    QFile file(resourcePath);
    if (!file.open(QIODevice::ReadOnly))
    {
        qWarning() << "LoadInstancesFromJson: failed to open resource" << resourcePath;
        const QStringList fallbacks = {
            QDir::current().filePath("../tests/testdata/instances.json"),
            QDir::current().filePath("../../tests/testdata/instances.json"),
            QDir::current().filePath("../../../tests/testdata/instances.json")
        };

        for (const QString& fallback : fallbacks)
        {
            qWarning() << "LoadInstancesFromJson: trying" << fallback << "exists?" << QFileInfo::exists(fallback);
            file.setFileName(fallback);
            if (file.open(QIODevice::ReadOnly))
                break;
        }
    }

    if (!file.isOpen())
    {
        qWarning() << "LoadInstancesFromJson: failed to open any path";
        return instances;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        qWarning() << "LoadInstancesFromJson: parse error" << parseError.errorString();
        return instances;
    }

    const QJsonArray items = doc.object().value("items").toArray();
    for (const QJsonValue& item : items)
        instances.append(ComputeAPI::Instance::FromJson(item.toObject()));

    return instances;
}

bool WaitFor(const std::function<bool()>& condition, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (!condition())
    {
        if (timer.elapsed() > timeoutMs)
            return false;
        QThread::msleep(5);
    }
    return true;
}

ComputeAPI::Instance MakeInstance(const QString& name, const QString& zone, bool windows, const QString& status)
{
    ComputeAPI::Instance instance;
    instance.name = name;
    instance.zone = zone;
    instance.status = status;

    ComputeAPI::AttachedDisk disk;
    if (windows)
        disk.guestOsFeatures.append(ComputeAPI::Instance::GUEST_OS_FEATURE_WINDOWS);
    instance.disks.append(disk);
    return instance;
}

FakeProjectRepository::FakeProjectRepository(const QStringList& projects)
    : m_projects(projects)
{
}

QStringList FakeProjectRepository::ListProjects() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_projects;
}

void FakeProjectRepository::AddProject(const QString& projectId)
{
    QMutexLocker locker(&this->m_mutex);
    this->addCalls++;
    if (!this->m_projects.contains(projectId))
        this->m_projects.append(projectId);
}

void FakeProjectRepository::RemoveProject(const QString& projectId)
{
    QMutexLocker locker(&this->m_mutex);
    this->removeCalls++;
    this->m_projects.removeAll(projectId);
}

ComputeAPI::Project FakeResourceManager::GetProject(const QString& projectId, const CancellationToken& token)
{
    token.ThrowIfCancellationRequested();
    this->calls.ref();

    if (this->deniedProjects.contains(projectId))
        throw AccessDeniedError(projectId, QString("Permission denied on project %1").arg(projectId));
    if (this->failingProjects.contains(projectId))
        throw FetchFailedError(QString("Backend error reading project %1").arg(projectId));

    ComputeAPI::Project project;
    project.projectId = projectId;
    project.name = this->names.value(projectId, projectId);
    return project;
}

QList<ComputeAPI::Instance> FakeComputeEngine::ListInstances(const QString& projectId, const CancellationToken& token)
{
    token.ThrowIfCancellationRequested();
    this->calls.ref();
    {
        QMutexLocker locker(&this->m_mutex);
        this->m_callsPerProject[projectId]++;
    }

    if (this->m_gate)
        this->m_gate->acquire();

    if (this->failing.loadRelaxed())
        throw FetchFailedError(QString("Backend error listing instances of %1").arg(projectId));

    QMutexLocker locker(&this->m_mutex);
    return this->m_instances.value(projectId);
}

void FakeComputeEngine::SetInstances(const QString& projectId, const QList<ComputeAPI::Instance>& instances)
{
    QMutexLocker locker(&this->m_mutex);
    this->m_instances.insert(projectId, instances);
}

int FakeComputeEngine::CallsFor(const QString& projectId) const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_callsPerProject.value(projectId);
}

void FakeCloudConsole::OpenInstanceList(const ProjectLocator& project)
{
    this->calls.append("OpenInstanceList " + project.ToString());
}

void FakeCloudConsole::OpenInstanceList(const ZoneLocator& zone)
{
    this->calls.append("OpenInstanceList " + zone.ToString());
}

void FakeCloudConsole::OpenInstanceDetails(const InstanceLocator& instance)
{
    this->calls.append("OpenInstanceDetails " + instance.ToString());
}

void FakeCloudConsole::OpenAccessConfig(const QString& projectId)
{
    this->calls.append("OpenAccessConfig " + projectId);
}

QSharedPointer<ExplorerNode> ExplorerFixture::FindChild(const QSharedPointer<ExplorerNode>& parent, const QString& text)
{
    const QList<QSharedPointer<ExplorerNode>> children = this->cache.GetFilteredChildren(parent, false)->ToList();
    for (const QSharedPointer<ExplorerNode>& child : children)
    {
        if (child->GetDisplayText() == text)
            return child;
    }
    return QSharedPointer<ExplorerNode>();
}

QStringList ExplorerFixture::ChildTexts(const QSharedPointer<ExplorerNode>& parent)
{
    QStringList texts;
    const QList<QSharedPointer<ExplorerNode>> children = this->cache.GetFilteredChildren(parent, false)->ToList();
    for (const QSharedPointer<ExplorerNode>& child : children)
        texts.append(child->GetDisplayText());
    return texts;
}
