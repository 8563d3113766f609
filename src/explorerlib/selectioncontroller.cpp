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

#include "selectioncontroller.h"
#include "cloudconsole.h"
#include "resourcecache.h"
#include <QDebug>

bool SelectionController::CommandVisibility::operator==(const CommandVisibility& other) const
{
    return this->unloadProject == other.unloadProject
           && this->refreshSubtree == other.refreshSubtree
           && this->refreshAllProjects == other.refreshAllProjects
           && this->openInConsole == other.openInConsole
           && this->configureAccess == other.configureAccess;
}

bool SelectionController::CommandVisibility::operator!=(const CommandVisibility& other) const
{
    return !(*this == other);
}

SelectionController::SelectionController(ResourceCache* cache, CloudConsole* cloudConsole, QObject* parent)
    : QObject(parent)
    , m_cache(cache)
    , m_cloudConsole(cloudConsole)
{
}

void SelectionController::SetSelectedNode(const QSharedPointer<ExplorerNode>& node)
{
    const CommandVisibility previousVisibility = this->GetCommandVisibility();
    const bool changed = this->m_selectedNode != node;

    this->m_selectedNode = node;
    this->m_state = StateFor(node.data());

    if (changed)
        emit this->selectionChanged();

    if (previousVisibility != this->GetCommandVisibility())
        emit this->commandVisibilityChanged();
}

SelectionController::SelectionState SelectionController::StateFor(const ExplorerNode* node)
{
    if (!node)
        return SelectionState::NoSelection;

    switch (node->GetKind())
    {
        case NodeKind::Root:
            return SelectionState::RootSelected;
        case NodeKind::Project:
            return SelectionState::ProjectSelected;
        case NodeKind::Zone:
            return SelectionState::ZoneSelected;
        case NodeKind::Instance:
            return SelectionState::InstanceSelected;
    }

    return SelectionState::NoSelection;
}

SelectionController::CommandVisibility SelectionController::VisibilityFor(SelectionState state)
{
    CommandVisibility visibility;

    switch (state)
    {
        case SelectionState::NoSelection:
        case SelectionState::RootSelected:
            visibility.refreshAllProjects = true;
            break;

        case SelectionState::ProjectSelected:
            visibility.unloadProject = true;
            visibility.refreshSubtree = true;
            visibility.openInConsole = true;
            visibility.configureAccess = true;
            break;

        case SelectionState::ZoneSelected:
        case SelectionState::InstanceSelected:
            visibility.refreshSubtree = true;
            visibility.openInConsole = true;
            visibility.configureAccess = true;
            break;
    }

    return visibility;
}

bool SelectionController::IsUnloadProjectCommandVisible() const
{
    return this->GetCommandVisibility().unloadProject;
}

bool SelectionController::IsRefreshProjectsCommandVisible() const
{
    return this->GetCommandVisibility().refreshSubtree;
}

bool SelectionController::IsRefreshAllProjectsCommandVisible() const
{
    return this->GetCommandVisibility().refreshAllProjects;
}

bool SelectionController::IsCloudConsoleCommandVisible() const
{
    return this->GetCommandVisibility().openInConsole;
}

bool SelectionController::IsConfigureAccessCommandVisible() const
{
    return this->GetCommandVisibility().configureAccess;
}

void SelectionController::RefreshSelectedNode(const CancellationToken& token)
{
    switch (this->m_state)
    {
        case SelectionState::NoSelection:
        case SelectionState::RootSelected:
            this->m_cache->Refresh(true, token);
            break;

        // Instances are re-listed together with their zones
        case SelectionState::ProjectSelected:
        case SelectionState::ZoneSelected:
        case SelectionState::InstanceSelected:
            this->m_cache->Refresh(false, token);
            break;
    }
}

void SelectionController::UnloadSelectedProject(const CancellationToken& token)
{
    if (this->m_state != SelectionState::ProjectSelected)
    {
        qDebug() << "SelectionController: Selected node is not a project, nothing to unload";
        return;
    }

    this->m_cache->RemoveTrackedProject(this->m_selectedNode->GetProjectLocator().GetProjectId(), token);
}

void SelectionController::OpenInConsole()
{
    if (!this->m_cloudConsole)
        return;

    switch (this->m_state)
    {
        case SelectionState::ProjectSelected:
            this->m_cloudConsole->OpenInstanceList(this->m_selectedNode->GetProjectLocator());
            break;

        case SelectionState::ZoneSelected:
            this->m_cloudConsole->OpenInstanceList(this->m_selectedNode->GetZoneLocator());
            break;

        case SelectionState::InstanceSelected:
            this->m_cloudConsole->OpenInstanceDetails(this->m_selectedNode->GetInstanceLocator());
            break;

        case SelectionState::NoSelection:
        case SelectionState::RootSelected:
            break;
    }
}

void SelectionController::ConfigureAccess()
{
    if (!this->m_cloudConsole)
        return;

    switch (this->m_state)
    {
        case SelectionState::ProjectSelected:
        case SelectionState::ZoneSelected:
        case SelectionState::InstanceSelected:
            this->m_cloudConsole->OpenAccessConfig(this->m_selectedNode->GetProjectLocator().GetProjectId());
            break;

        case SelectionState::NoSelection:
        case SelectionState::RootSelected:
            break;
    }
}
