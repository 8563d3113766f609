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

#ifndef RESOURCECACHE_H
#define RESOURCECACHE_H

#include "explorerlib_global.h"
#include "cancellationtoken.h"
#include "explorernode.h"
#include "filterstate.h"
#include "nodeloader.h"
#include <QMutex>
#include <QObject>
#include <QRecursiveMutex>
#include <QSharedPointer>
#include <exception>

class ExplorerSettings;

/**
 * @brief Lazily populated, in-memory tree of projects, zones and instances
 *
 * The cache owns the root node and is the only writer of any node's raw
 * children. Children are fetched on first access and kept until a node is
 * invalidated, reloaded or dropped together with its parent.
 *
 * Fetches are deduplicated per node: while a fetch for a node is in flight,
 * further requests for the same node wait for that fetch and share its
 * result (or its error) instead of calling the backend again. Fetches of
 * different nodes are independent and may run in parallel on different
 * threads. The cache mutex is never held across a backend call.
 *
 * Child collections publish reset notifications only. Replacing the content
 * of a collection clears it (one Reset) and adds the new range (a second
 * Reset), there are no incremental add/remove notifications.
 *
 * A fetch that fails as a whole (backend error, cancellation) leaves the
 * previous children in place.
 */
class EXPLORERLIB_EXPORT ResourceCache : public QObject
{
    Q_OBJECT

    public:
        ResourceCache(ProjectRepository* projectRepository,
                      ComputeAPI::ResourceManagerAdapter* resourceManager,
                      ComputeAPI::ComputeEngineAdapter* computeEngine,
                      SessionBroker* sessionBroker,
                      ConnectionStateTracker* tracker,
                      QObject* parent = nullptr);
        ~ResourceCache() override;

        QSharedPointer<ExplorerNode> GetRoot() const
        {
            return this->m_root;
        }

        /**
         * @brief Get the filtered children of a node, loading them if needed
         *
         * Returns without any backend call if the children are loaded and
         * forceReload is false.
         *
         * @param node Root, project or zone node owned by this cache
         * @param forceReload Fetch again even if the children are loaded
         * @param token Cancels the fetch, or stops waiting for a shared fetch
         * @return Filtered child list of the node, owned by the node
         * @throws UnknownIdentityError if node is not part of this tree or is an instance
         * @throws OperationCancelledError, FetchFailedError when the fetch failed
         */
        NodeList* GetFilteredChildren(const QSharedPointer<ExplorerNode>& node,
                                      bool forceReload,
                                      const CancellationToken& token = CancellationToken());

        /**
         * @brief Mark the children of a node as not loaded, without fetching
         */
        void Invalidate(const QSharedPointer<ExplorerNode>& node);

        bool IsLoaded(const QSharedPointer<ExplorerNode>& node) const;

        /**
         * @brief Start tracking a project and reload the project list
         */
        void AddTrackedProject(const QString& projectId, const CancellationToken& token = CancellationToken());

        /**
         * @brief Stop tracking a project and reload the project list
         */
        void RemoveTrackedProject(const QString& projectId, const CancellationToken& token = CancellationToken());

        /**
         * @brief Reload the tree
         *
         * @param reloadProjects true to re-list all tracked projects; false to
         *        reload the zone lists of projects that are expanded, leaving
         *        the project list itself untouched
         */
        void Refresh(bool reloadProjects, const CancellationToken& token = CancellationToken());

        FilterState GetFilter() const;

        /**
         * @brief Change the view filter and rebuild every loaded child view
         *
         * Never calls the backend.
         */
        void SetFilter(const FilterState& filter);

        /**
         * @brief Take the filter from settings and follow later changes
         */
        void BindSettings(ExplorerSettings* settings);

    signals:
        void nodeChildrenReloaded(ExplorerNode* node);
        void fetchFailed(ExplorerNode* node, const QString& message);
        void filterChanged();

    private:
        void checkNode(const QSharedPointer<ExplorerNode>& node) const;
        void waitForFetch(const QSharedPointer<PendingFetch>& pending, const CancellationToken& token) const;
        void abandonFetch(const QSharedPointer<ExplorerNode>& node,
                          const QSharedPointer<PendingFetch>& pending,
                          std::exception_ptr error);
        void completeFetch(const QSharedPointer<PendingFetch>& pending, std::exception_ptr error) const;
        void publishChildren(const QSharedPointer<ExplorerNode>& node);
        void applyView(const QSharedPointer<ExplorerNode>& node);
        void setOwner(const QList<QSharedPointer<ExplorerNode>>& nodes,
                      ResourceCache* owner,
                      QList<QSharedPointer<ExplorerNode>>* droppedInstances);
        void collectLoaded(const QSharedPointer<ExplorerNode>& node, QList<QSharedPointer<ExplorerNode>>& loaded) const;

        mutable QMutex m_mutex;
        // Taken before m_mutex, never while holding it; recursive because
        // observers may reload from a collectionChanged slot
        QRecursiveMutex m_viewMutex;
        NodeLoader m_loader;
        ProjectRepository* m_projectRepository;
        QSharedPointer<ExplorerNode> m_root;
        FilterState m_filter;
};

#endif // RESOURCECACHE_H
