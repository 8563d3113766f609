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

#ifndef NODELOADER_H
#define NODELOADER_H

#include "explorerlib_global.h"
#include "cancellationtoken.h"
#include "explorernode.h"
#include "computeapi/computeapi.h"
#include <QList>
#include <QSharedPointer>

class ConnectionStateTracker;
class ProjectRepository;
class SessionBroker;

/**
 * @brief Turns backend listings into child nodes, one strategy per node kind
 *
 * - Root: one project node per tracked project id. A project whose metadata
 *   cannot be read because access is denied becomes an inaccessible project
 *   node; any other error aborts the whole listing.
 * - Project: zones are derived from the project's instance listing, there is
 *   no separate zone listing, so empty zones never show up. The zone nodes come
 *   back with their instances already loaded from the same listing.
 * - Zone: instances of the project filtered to the zone.
 *
 * Backend calls run on the calling thread and honour the cancellation token.
 */
class EXPLORERLIB_EXPORT NodeLoader
{
    public:
        NodeLoader(ProjectRepository* projectRepository,
                   ComputeAPI::ResourceManagerAdapter* resourceManager,
                   ComputeAPI::ComputeEngineAdapter* computeEngine,
                   SessionBroker* sessionBroker,
                   ConnectionStateTracker* tracker);

        /**
         * @brief Fetch the children of a node
         * @throws UnknownIdentityError for instance nodes, which have no children
         * @throws OperationCancelledError if the token got cancelled
         * @throws FetchFailedError (or any adapter error) if the listing failed
         */
        QList<QSharedPointer<ExplorerNode>> LoadChildren(const ExplorerNode& node, const CancellationToken& token);

    private:
        QList<QSharedPointer<ExplorerNode>> loadProjects(const CancellationToken& token);
        QList<QSharedPointer<ExplorerNode>> loadZones(const ProjectLocator& project, const CancellationToken& token);
        QList<QSharedPointer<ExplorerNode>> loadInstances(const ZoneLocator& zone, const CancellationToken& token);

        QList<ComputeAPI::Instance> listInstances(const QString& projectId, const CancellationToken& token);
        QList<QSharedPointer<ExplorerNode>> createInstanceNodes(const QString& projectId,
                                                                const QList<ComputeAPI::Instance>& instances);

        ProjectRepository* m_projectRepository;
        ComputeAPI::ResourceManagerAdapter* m_resourceManager;
        ComputeAPI::ComputeEngineAdapter* m_computeEngine;
        SessionBroker* m_sessionBroker;
        ConnectionStateTracker* m_tracker;
};

#endif // NODELOADER_H
