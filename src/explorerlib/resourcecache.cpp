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

#include "resourcecache.h"
#include "explorererror.h"
#include "nodefilter.h"
#include "projectrepository.h"
#include "settings/explorersettings.h"
#include <QDebug>
#include <QMutexLocker>
#include <QThread>
#include <QWaitCondition>

/**
 * @brief In-flight fetch of one node's children, shared by all requesters
 */
struct PendingFetch
{
    QMutex mutex;
    QWaitCondition done;
    bool finished = false;
    std::exception_ptr error;
    QThread* ownerThread = nullptr;
};

namespace
{
    // How often a waiting requester re-checks its own cancellation token
    const unsigned long CANCELLATION_POLL_MS = 50;
}

ResourceCache::ResourceCache(ProjectRepository* projectRepository,
                             ComputeAPI::ResourceManagerAdapter* resourceManager,
                             ComputeAPI::ComputeEngineAdapter* computeEngine,
                             SessionBroker* sessionBroker,
                             ConnectionStateTracker* tracker,
                             QObject* parent)
    : QObject(parent)
    , m_loader(projectRepository, resourceManager, computeEngine, sessionBroker, tracker)
    , m_projectRepository(projectRepository)
    , m_root(ExplorerNode::CreateRoot())
{
    this->m_root->m_cache = this;
    qDebug() << "ResourceCache: Created";
}

ResourceCache::~ResourceCache()
{
    // Nodes may outlive the cache, make sure they don't point back at it
    QMutexLocker locker(&this->m_mutex);
    this->m_root->m_cache = nullptr;
    this->setOwner(this->m_root->m_rawChildren, nullptr, nullptr);
}

NodeList* ResourceCache::GetFilteredChildren(const QSharedPointer<ExplorerNode>& node,
                                             bool forceReload,
                                             const CancellationToken& token)
{
    QSharedPointer<PendingFetch> pending;
    bool owner = false;
    {
        QMutexLocker locker(&this->m_mutex);
        this->checkNode(node);

        if (node->GetKind() == NodeKind::Instance)
            throw UnknownIdentityError(node->GetInstanceLocator().ToString());

        if (!forceReload && node->m_loaded)
            return node->GetChildren();

        if (node->m_pendingFetch)
        {
            pending = node->m_pendingFetch;
        } else
        {
            pending = QSharedPointer<PendingFetch>::create();
            pending->ownerThread = QThread::currentThread();
            node->m_pendingFetch = pending;
            owner = true;
        }
    }

    if (!owner)
    {
        // Observer of this node's view reloading it while the view is being published
        if (pending->ownerThread == QThread::currentThread())
            return node->GetChildren();

        qDebug() << "ResourceCache: Joining fetch in progress for" << node->GetDisplayText();
        this->waitForFetch(pending, token);
        return node->GetChildren();
    }

    qDebug() << "ResourceCache: Loading children of" << node->GetDisplayText() << (forceReload ? "(forced)" : "");

    QList<QSharedPointer<ExplorerNode>> children;
    try
    {
        children = this->m_loader.LoadChildren(*node, token);
    } catch (const OperationCancelledError&)
    {
        qDebug() << "ResourceCache: Loading children of" << node->GetDisplayText() << "was cancelled";
        this->abandonFetch(node, pending, std::current_exception());
        throw;
    } catch (const std::exception& e)
    {
        const QString message = QString::fromUtf8(e.what());
        qWarning() << "ResourceCache: Loading children of" << node->GetDisplayText() << "failed:" << message;
        this->abandonFetch(node, pending, std::current_exception());
        emit this->fetchFailed(node.data(), message);
        throw;
    } catch (...)
    {
        qCritical() << "ResourceCache: Loading children of" << node->GetDisplayText() << "failed with unknown error";
        this->abandonFetch(node, pending, std::current_exception());
        throw;
    }

    QList<QSharedPointer<ExplorerNode>> previous;
    QList<QSharedPointer<ExplorerNode>> droppedInstances;
    {
        QMutexLocker locker(&this->m_mutex);
        previous = node->m_rawChildren;
        node->setRawChildren(children);

        // The node itself may have been dropped while we were fetching
        this->setOwner(children, node->m_cache, nullptr);
        this->setOwner(previous, nullptr, &droppedInstances);
    }

    for (const QSharedPointer<ExplorerNode>& instance : droppedInstances)
        instance->releaseTracker();

    // The fetch slot stays taken until the view is published, so a second
    // reload of this node can't start before it
    this->publishChildren(node);
    {
        QMutexLocker locker(&this->m_mutex);
        node->m_pendingFetch.reset();
    }
    this->completeFetch(pending, nullptr);

    emit this->nodeChildrenReloaded(node.data());
    return node->GetChildren();
}

void ResourceCache::Invalidate(const QSharedPointer<ExplorerNode>& node)
{
    QMutexLocker locker(&this->m_mutex);
    this->checkNode(node);

    if (node->GetKind() == NodeKind::Instance)
        return;

    node->m_loaded = false;
}

bool ResourceCache::IsLoaded(const QSharedPointer<ExplorerNode>& node) const
{
    QMutexLocker locker(&this->m_mutex);
    return node && node->m_loaded;
}

void ResourceCache::AddTrackedProject(const QString& projectId, const CancellationToken& token)
{
    if (this->m_projectRepository->ListProjects().contains(projectId))
    {
        qWarning() << "ResourceCache: Project" << projectId << "is already tracked";
        return;
    }

    qDebug() << "ResourceCache: Adding project" << projectId;
    this->m_projectRepository->AddProject(projectId);
    this->GetFilteredChildren(this->m_root, true, token);
}

void ResourceCache::RemoveTrackedProject(const QString& projectId, const CancellationToken& token)
{
    if (!this->m_projectRepository->ListProjects().contains(projectId))
    {
        qWarning() << "ResourceCache: Project" << projectId << "is not tracked";
        return;
    }

    qDebug() << "ResourceCache: Removing project" << projectId;
    this->m_projectRepository->RemoveProject(projectId);
    this->GetFilteredChildren(this->m_root, true, token);
}

void ResourceCache::Refresh(bool reloadProjects, const CancellationToken& token)
{
    if (reloadProjects)
    {
        this->GetFilteredChildren(this->m_root, true, token);
        return;
    }

    QList<QSharedPointer<ExplorerNode>> projects;
    {
        QMutexLocker locker(&this->m_mutex);
        if (!this->m_root->m_loaded)
        {
            qDebug() << "ResourceCache: Nothing to refresh, projects not loaded yet";
            return;
        }

        for (const QSharedPointer<ExplorerNode>& project : this->m_root->m_rawChildren)
        {
            if (project->m_loaded && project->IsAccessible())
                projects.append(project);
        }
    }

    // One failing project must not keep the others from refreshing
    std::exception_ptr firstError;
    for (const QSharedPointer<ExplorerNode>& project : projects)
    {
        try
        {
            this->GetFilteredChildren(project, true, token);
        } catch (const OperationCancelledError&)
        {
            throw;
        } catch (const std::exception&)
        {
            if (!firstError)
                firstError = std::current_exception();
        }
    }

    if (firstError)
        std::rethrow_exception(firstError);
}

FilterState ResourceCache::GetFilter() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_filter;
}

void ResourceCache::SetFilter(const FilterState& filter)
{
    QList<QSharedPointer<ExplorerNode>> loaded;
    {
        QMutexLocker locker(&this->m_mutex);
        if (this->m_filter == filter)
            return;

        this->m_filter = filter;
        this->collectLoaded(this->m_root, loaded);
    }

    qDebug() << "ResourceCache: Filter changed, rebuilding" << loaded.size() << "views";

    for (const QSharedPointer<ExplorerNode>& node : loaded)
        this->applyView(node);

    emit this->filterChanged();
}

void ResourceCache::BindSettings(ExplorerSettings* settings)
{
    if (!settings)
        return;

    this->SetFilter(settings->GetFilterState());
    connect(settings, &ExplorerSettings::settingsChanged, this, [this, settings](const QString&) {
        this->SetFilter(settings->GetFilterState());
    });
}

// Caller holds m_mutex
void ResourceCache::checkNode(const QSharedPointer<ExplorerNode>& node) const
{
    if (!node)
        throw UnknownIdentityError("(null)");

    if (node->m_cache != this)
        throw UnknownIdentityError(node->GetDisplayText());
}

void ResourceCache::waitForFetch(const QSharedPointer<PendingFetch>& pending, const CancellationToken& token) const
{
    QMutexLocker locker(&pending->mutex);
    while (!pending->finished)
    {
        if (token.IsCancellationRequested())
            throw OperationCancelledError();

        pending->done.wait(&pending->mutex, CANCELLATION_POLL_MS);
    }

    if (pending->error)
        std::rethrow_exception(pending->error);
}

void ResourceCache::abandonFetch(const QSharedPointer<ExplorerNode>& node,
                                 const QSharedPointer<PendingFetch>& pending,
                                 std::exception_ptr error)
{
    {
        QMutexLocker locker(&this->m_mutex);
        node->m_pendingFetch.reset();
    }

    this->completeFetch(pending, error);
}

void ResourceCache::completeFetch(const QSharedPointer<PendingFetch>& pending, std::exception_ptr error) const
{
    QMutexLocker locker(&pending->mutex);
    pending->finished = true;
    pending->error = error;
    pending->done.wakeAll();
}

void ResourceCache::publishChildren(const QSharedPointer<ExplorerNode>& node)
{
    QList<QSharedPointer<ExplorerNode>> primed;
    {
        QMutexLocker locker(&this->m_mutex);

        // Zones come back with their instances already loaded
        for (const QSharedPointer<ExplorerNode>& child : node->m_rawChildren)
        {
            if (child->GetKind() != NodeKind::Instance && child->m_loaded)
                primed.append(child);
        }
    }

    for (const QSharedPointer<ExplorerNode>& child : primed)
        this->applyView(child);

    this->applyView(node);
}

void ResourceCache::applyView(const QSharedPointer<ExplorerNode>& node)
{
    // View writes are serialized and each one reads the current raw children
    // and filter, so the last write to finish reflects the newest state
    QMutexLocker viewLocker(&this->m_viewMutex);

    QList<QSharedPointer<ExplorerNode>> rawChildren;
    FilterState filter;
    {
        QMutexLocker locker(&this->m_mutex);
        rawChildren = node->m_rawChildren;
        filter = this->m_filter;
    }

    node->GetChildren()->Replace(NodeFilter::Apply(rawChildren, filter));
}

// Caller holds m_mutex
void ResourceCache::setOwner(const QList<QSharedPointer<ExplorerNode>>& nodes,
                             ResourceCache* owner,
                             QList<QSharedPointer<ExplorerNode>>* droppedInstances)
{
    for (const QSharedPointer<ExplorerNode>& node : nodes)
    {
        node->m_cache = owner;
        if (droppedInstances && node->GetKind() == NodeKind::Instance)
            droppedInstances->append(node);

        this->setOwner(node->m_rawChildren, owner, droppedInstances);
    }
}

// Caller holds m_mutex
void ResourceCache::collectLoaded(const QSharedPointer<ExplorerNode>& node,
                                  QList<QSharedPointer<ExplorerNode>>& loaded) const
{
    if (node->GetKind() == NodeKind::Instance || !node->m_loaded)
        return;

    loaded.append(node);
    for (const QSharedPointer<ExplorerNode>& child : node->m_rawChildren)
        this->collectLoaded(child, loaded);
}
