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

#ifndef SELECTIONCONTROLLER_H
#define SELECTIONCONTROLLER_H

#include "explorerlib_global.h"
#include "cancellationtoken.h"
#include "explorernode.h"
#include <QObject>
#include <QSharedPointer>

class CloudConsole;
class ResourceCache;

/**
 * @brief Tracks the selected node and what can be done with it
 *
 * The selection state only changes through SetSelectedNode(), never because
 * the tree changed. Selecting a node that has since been dropped from the
 * tree is not detected here.
 */
class EXPLORERLIB_EXPORT SelectionController : public QObject
{
    Q_OBJECT

    public:
        enum class SelectionState
        {
            NoSelection,
            RootSelected,
            ProjectSelected,
            ZoneSelected,
            InstanceSelected
        };

        struct CommandVisibility
        {
            bool unloadProject = false;
            bool refreshSubtree = false;
            bool refreshAllProjects = false;
            bool openInConsole = false;
            bool configureAccess = false;

            bool operator==(const CommandVisibility& other) const;
            bool operator!=(const CommandVisibility& other) const;
        };

        SelectionController(ResourceCache* cache, CloudConsole* cloudConsole, QObject* parent = nullptr);

        QSharedPointer<ExplorerNode> GetSelectedNode() const
        {
            return this->m_selectedNode;
        }

        void SetSelectedNode(const QSharedPointer<ExplorerNode>& node);

        SelectionState GetState() const
        {
            return this->m_state;
        }

        static SelectionState StateFor(const ExplorerNode* node);
        static CommandVisibility VisibilityFor(SelectionState state);

        CommandVisibility GetCommandVisibility() const
        {
            return VisibilityFor(this->m_state);
        }

        bool IsUnloadProjectCommandVisible() const;
        bool IsRefreshProjectsCommandVisible() const;
        bool IsRefreshAllProjectsCommandVisible() const;
        bool IsCloudConsoleCommandVisible() const;
        bool IsConfigureAccessCommandVisible() const;

        /**
         * @brief Refresh the part of the tree the selection belongs to
         *
         * Nothing or root selected reloads all projects (Refresh(true)).
         * A project, zone or instance selected reloads the zone lists of every
         * loaded project (Refresh(false)), not just the selected zone: zones
         * and their instances come from one listing per project, so the
         * smallest reloadable unit is the project's zone level.
         */
        void RefreshSelectedNode(const CancellationToken& token = CancellationToken());

        /**
         * @brief Stop tracking the selected project, no-op unless a project is selected
         */
        void UnloadSelectedProject(const CancellationToken& token = CancellationToken());

        void OpenInConsole();
        void ConfigureAccess();

    signals:
        void selectionChanged();
        void commandVisibilityChanged();

    private:
        ResourceCache* m_cache;
        CloudConsole* m_cloudConsole;
        QSharedPointer<ExplorerNode> m_selectedNode;
        SelectionState m_state = SelectionState::NoSelection;
};

#endif // SELECTIONCONTROLLER_H
