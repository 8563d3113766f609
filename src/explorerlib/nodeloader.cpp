/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include "nodeloader.h"
#include "connectionstatetracker.h"
#include "explorererror.h"
#include "projectrepository.h"
#include "sessionbroker.h"
#include <QDebug>
#include <QMap>
#include <algorithm>

NodeLoader::NodeLoader(ProjectRepository* projectRepository,
                       ComputeAPI::ResourceManagerAdapter* resourceManager,
                       ComputeAPI::ComputeEngineAdapter* computeEngine,
                       SessionBroker* sessionBroker,
                       ConnectionStateTracker* tracker)
    : m_projectRepository(projectRepository)
    , m_resourceManager(resourceManager)
    , m_computeEngine(computeEngine)
    , m_sessionBroker(sessionBroker)
    , m_tracker(tracker)
{
}

QList<QSharedPointer<ExplorerNode>> NodeLoader::LoadChildren(const ExplorerNode& node, const CancellationToken& token)
{
    switch (node.GetKind())
    {
        case NodeKind::Root:
            return this->loadProjects(token);

        case NodeKind::Project:
            if (!node.IsAccessible())
                return QList<QSharedPointer<ExplorerNode>>();
            return this->loadZones(node.GetProjectLocator(), token);

        case NodeKind::Zone:
            return this->loadInstances(node.GetZoneLocator(), token);

        case NodeKind::Instance:
            break;
    }

    throw UnknownIdentityError(node.GetInstanceLocator().ToString());
}

QList<QSharedPointer<ExplorerNode>> NodeLoader::loadProjects(const CancellationToken& token)
{
    const QStringList projectIds = this->m_projectRepository->ListProjects();
    qDebug() << "NodeLoader: Loading" << projectIds.size() << "tracked projects";

    QList<QSharedPointer<ExplorerNode>> projects;
    for (const QString& projectId : projectIds)
    {
        token.ThrowIfCancellationRequested();

        try
        {
            const ComputeAPI::Project project = this->m_resourceManager->GetProject(projectId, token);
            projects.append(ExplorerNode::CreateProject(project));
        } catch (const AccessDeniedError& e)
        {
            qWarning() << "NodeLoader: Project" << projectId << "is inaccessible:" << e.message();
            projects.append(ExplorerNode::CreateInaccessibleProject(projectId));
        }
    }

    std::sort(projects.begin(), projects.end(),
              [](const QSharedPointer<ExplorerNode>& a, const QSharedPointer<ExplorerNode>& b) {
                  const QString textA = a->GetDisplayText();
                  const QString textB = b->GetDisplayText();
                  if (textA != textB)
                      return textA < textB;
                  return a->GetProjectLocator().GetProjectId() < b->GetProjectLocator().GetProjectId();
              });

    return projects;
}

QList<QSharedPointer<ExplorerNode>> NodeLoader::loadZones(const ProjectLocator& project, const CancellationToken& token)
{
    const QString projectId = project.GetProjectId();
    const QList<ComputeAPI::Instance> instances = this->listInstances(projectId, token);

    // QMap keeps zones ordered by name
    QMap<QString, QList<ComputeAPI::Instance>> instancesByZone;
    for (const ComputeAPI::Instance& instance : instances)
        instancesByZone[instance.ZoneName()].append(instance);

    QList<QSharedPointer<ExplorerNode>> zones;
    for (auto it = instancesByZone.constBegin(); it != instancesByZone.constEnd(); ++it)
    {
        QSharedPointer<ExplorerNode> zone = ExplorerNode::CreateZone(ZoneLocator(projectId, it.key()));
        zone->setRawChildren(this->createInstanceNodes(projectId, it.value()));
        zones.append(zone);
    }

    qDebug() << "NodeLoader: Project" << projectId << "has" << instances.size()
             << "instances in" << zones.size() << "zones";
    return zones;
}

QList<QSharedPointer<ExplorerNode>> NodeLoader::loadInstances(const ZoneLocator& zone, const CancellationToken& token)
{
    const QList<ComputeAPI::Instance> instances = this->listInstances(zone.GetProjectId(), token);

    QList<ComputeAPI::Instance> instancesInZone;
    for (const ComputeAPI::Instance& instance : instances)
    {
        if (instance.ZoneName() == zone.GetName())
            instancesInZone.append(instance);
    }

    return this->createInstanceNodes(zone.GetProjectId(), instancesInZone);
}

QList<ComputeAPI::Instance> NodeLoader::listInstances(const QString& projectId, const CancellationToken& token)
{
    token.ThrowIfCancellationRequested();
    QList<ComputeAPI::Instance> instances = this->m_computeEngine->ListInstances(projectId, token);
    token.ThrowIfCancellationRequested();
    return instances;
}

QList<QSharedPointer<ExplorerNode>> NodeLoader::createInstanceNodes(const QString& projectId,
                                                                    const QList<ComputeAPI::Instance>& instances)
{
    QList<QSharedPointer<ExplorerNode>> nodes;
    for (const ComputeAPI::Instance& instance : instances)
    {
        const InstanceLocator locator(projectId, instance.ZoneName(), instance.name);
        const bool connected = this->m_sessionBroker && this->m_sessionBroker->IsConnected(locator);

        nodes.append(ExplorerNode::CreateInstance(locator,
                                                  instance.IsWindows() ? OperatingSystem::Windows : OperatingSystem::Linux,
                                                  instance.status,
                                                  this->m_tracker,
                                                  connected));
    }

    std::sort(nodes.begin(), nodes.end(),
              [](const QSharedPointer<ExplorerNode>& a, const QSharedPointer<ExplorerNode>& b) {
                  return a->GetDisplayText() < b->GetDisplayText();
              });

    return nodes;
}
