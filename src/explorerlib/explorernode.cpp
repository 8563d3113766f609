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

#include "explorernode.h"
#include "connectionstatetracker.h"
#include "computeapi/computeapi.h"

ExplorerNode::ExplorerNode(NodeKind kind) : m_kind(kind), m_children(new NodeList())
{
}

ExplorerNode::~ExplorerNode()
{
    // Children held elsewhere outlive us, don't leave them a dangling parent
    for (const QSharedPointer<ExplorerNode>& child : this->m_rawChildren)
        child->m_parent = nullptr;

    this->releaseTracker();
    delete this->m_children;
}

QSharedPointer<ExplorerNode> ExplorerNode::CreateRoot()
{
    return QSharedPointer<ExplorerNode>(new ExplorerNode(NodeKind::Root));
}

QSharedPointer<ExplorerNode> ExplorerNode::CreateProject(const ComputeAPI::Project& project)
{
    QSharedPointer<ExplorerNode> node(new ExplorerNode(NodeKind::Project));
    node->m_project = ProjectLocator(project.projectId);
    node->m_projectName = project.name;
    return node;
}

QSharedPointer<ExplorerNode> ExplorerNode::CreateInaccessibleProject(const QString& projectId)
{
    QSharedPointer<ExplorerNode> node(new ExplorerNode(NodeKind::Project));
    node->m_project = ProjectLocator(projectId);
    node->m_accessible = false;

    // Nothing can be listed in a project we cannot read
    node->m_loaded = true;
    return node;
}

QSharedPointer<ExplorerNode> ExplorerNode::CreateZone(const ZoneLocator& zone)
{
    QSharedPointer<ExplorerNode> node(new ExplorerNode(NodeKind::Zone));
    node->m_project = zone.Project();
    node->m_zone = zone;
    return node;
}

QSharedPointer<ExplorerNode> ExplorerNode::CreateInstance(const InstanceLocator& instance,
                                                          OperatingSystem operatingSystem,
                                                          const QString& status,
                                                          ConnectionStateTracker* tracker,
                                                          bool connected)
{
    QSharedPointer<ExplorerNode> node(new ExplorerNode(NodeKind::Instance));
    node->m_project = instance.Project();
    node->m_zone = instance.Zone();
    node->m_instance = instance;
    node->m_operatingSystem = operatingSystem;
    node->m_status = status;

    // Instances never have children
    node->m_loaded = true;

    node->m_tracker = tracker;
    if (tracker)
    {
        tracker->Seed(instance, connected);
        node->m_trackerRegistered = true;
    }
    return node;
}

ExplorerNode* ExplorerNode::GetParent() const
{
    return this->m_parent;
}

QString ExplorerNode::GetDisplayText() const
{
    switch (this->m_kind)
    {
        case NodeKind::Root:
            return "Google Cloud";

        case NodeKind::Project:
            if (!this->m_accessible)
                return QString("inaccessible project (%1)").arg(this->m_project.GetProjectId());
            if (this->m_projectName.isEmpty() || this->m_projectName == this->m_project.GetProjectId())
                return this->m_project.GetProjectId();
            return QString("%1 (%2)").arg(this->m_projectName, this->m_project.GetProjectId());

        case NodeKind::Zone:
            return this->m_zone.GetName();

        case NodeKind::Instance:
            return this->m_instance.GetName();
    }

    return QString();
}

ProjectLocator ExplorerNode::GetProjectLocator() const
{
    return this->m_project;
}

ZoneLocator ExplorerNode::GetZoneLocator() const
{
    return this->m_zone;
}

InstanceLocator ExplorerNode::GetInstanceLocator() const
{
    return this->m_instance;
}

bool ExplorerNode::IsRunning() const
{
    return this->m_status == ComputeAPI::Instance::STATUS_RUNNING;
}

bool ExplorerNode::IsConnected() const
{
    if (this->m_kind != NodeKind::Instance || !this->m_tracker)
        return false;

    return this->m_tracker->IsConnected(this->m_instance);
}

ExplorerNode::ImageVariant ExplorerNode::GetImageVariant() const
{
    switch (this->m_kind)
    {
        case NodeKind::Root:
            return ImageVariant::Cloud;

        case NodeKind::Project:
            return ImageVariant::Project;

        case NodeKind::Zone:
            return ImageVariant::Zone;

        case NodeKind::Instance:
            break;
    }

    const bool connected = this->IsConnected();
    if (this->m_operatingSystem == OperatingSystem::Windows)
        return connected ? ImageVariant::WindowsConnected : ImageVariant::WindowsDisconnected;

    return connected ? ImageVariant::LinuxConnected : ImageVariant::LinuxDisconnected;
}

void ExplorerNode::setRawChildren(const QList<QSharedPointer<ExplorerNode>>& children)
{
    // Replaced children may be kept alive by callers, detach them from us
    for (const QSharedPointer<ExplorerNode>& previous : this->m_rawChildren)
    {
        if (previous->m_parent == this)
            previous->m_parent = nullptr;
    }

    this->m_rawChildren = children;
    this->m_loaded = true;

    for (const QSharedPointer<ExplorerNode>& child : children)
        child->m_parent = this;
}

void ExplorerNode::releaseTracker()
{
    if (!this->m_trackerRegistered)
        return;

    this->m_trackerRegistered = false;
    if (this->m_tracker)
        this->m_tracker->Release(this->m_instance);
}
