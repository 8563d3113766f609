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

#ifndef EXPLORERNODE_H
#define EXPLORERNODE_H

#include "explorerlib_global.h"
#include "filterstate.h"
#include "locator.h"
#include "collections/observablelist.h"
#include <QList>
#include <QPointer>
#include <QSharedPointer>
#include <QString>

namespace ComputeAPI
{
    struct Project;
}

class ConnectionStateTracker;
class ExplorerNode;
class ResourceCache;
struct PendingFetch;

typedef ObservableList<QSharedPointer<ExplorerNode>> NodeList;

enum class NodeKind
{
    Root,
    Project,
    Zone,
    Instance
};

/**
 * @brief A node of the resource tree (root, project, zone or instance)
 *
 * The node kind is a closed set fixed at construction; kind specific data is
 * stored inline and accessors that do not apply to a kind return empty values.
 *
 * Each node owns two child collections:
 * - raw children: everything the loader returned the last time, or "not yet
 *   loaded"
 * - filtered children (GetChildren()): the observable view shown to callers,
 *   rebuilt from the raw children whenever they or the filter change
 *
 * Raw children are only ever written by ResourceCache. The NodeList returned
 * by GetChildren() is the same object for the lifetime of the node, so
 * observers survive reloads.
 */
class EXPLORERLIB_EXPORT ExplorerNode
{
    public:
        enum class ImageVariant
        {
            Cloud,
            Project,
            Zone,
            WindowsConnected,
            WindowsDisconnected,
            LinuxConnected,
            LinuxDisconnected
        };

        static QSharedPointer<ExplorerNode> CreateRoot();
        static QSharedPointer<ExplorerNode> CreateProject(const ComputeAPI::Project& project);
        static QSharedPointer<ExplorerNode> CreateInaccessibleProject(const QString& projectId);
        static QSharedPointer<ExplorerNode> CreateZone(const ZoneLocator& zone);

        /**
         * @brief Create an instance node and register it with the tracker
         * @param connected Connection state reported by the session broker
         */
        static QSharedPointer<ExplorerNode> CreateInstance(const InstanceLocator& instance,
                                                           OperatingSystem operatingSystem,
                                                           const QString& status,
                                                           ConnectionStateTracker* tracker,
                                                           bool connected);

        ~ExplorerNode();

        ExplorerNode(const ExplorerNode&) = delete;
        ExplorerNode& operator=(const ExplorerNode&) = delete;

        NodeKind GetKind() const
        {
            return this->m_kind;
        }

        /**
         * @brief Owning node, nullptr for root and for nodes not attached yet
         */
        ExplorerNode* GetParent() const;

        QString GetDisplayText() const;

        // Owning project (project, zone and instance nodes)
        ProjectLocator GetProjectLocator() const;

        // Owning zone (zone and instance nodes)
        ZoneLocator GetZoneLocator() const;

        // Instance nodes only
        InstanceLocator GetInstanceLocator() const;

        /**
         * @brief False if project metadata could not be read (access denied)
         */
        bool IsAccessible() const
        {
            return this->m_accessible;
        }

        OperatingSystem GetOperatingSystem() const
        {
            return this->m_operatingSystem;
        }

        QString GetStatus() const
        {
            return this->m_status;
        }

        bool IsRunning() const;

        /**
         * @brief Live connection state, read from the tracker on every call
         */
        bool IsConnected() const;

        ImageVariant GetImageVariant() const;

        /**
         * @brief Filtered, ordered child view
         */
        NodeList* GetChildren() const
        {
            return this->m_children;
        }

    private:
        friend class ResourceCache;
        friend class NodeLoader;

        explicit ExplorerNode(NodeKind kind);

        // Replace raw children and take ownership of them (parent pointers),
        // the outgoing children are left without a parent
        void setRawChildren(const QList<QSharedPointer<ExplorerNode>>& children);
        void releaseTracker();

        const NodeKind m_kind;
        ExplorerNode* m_parent = nullptr;
        ResourceCache* m_cache = nullptr;

        // Kind specific payload
        ProjectLocator m_project;
        ZoneLocator m_zone;
        InstanceLocator m_instance;
        QString m_projectName;
        bool m_accessible = true;
        OperatingSystem m_operatingSystem = OperatingSystem::Linux;
        QString m_status;
        QPointer<ConnectionStateTracker> m_tracker;
        bool m_trackerRegistered = false;

        // Guarded by ResourceCache::m_mutex
        QList<QSharedPointer<ExplorerNode>> m_rawChildren;
        bool m_loaded = false;
        QSharedPointer<PendingFetch> m_pendingFetch;

        NodeList* m_children;
};

Q_DECLARE_METATYPE(ExplorerNode*)

#endif // EXPLORERNODE_H
