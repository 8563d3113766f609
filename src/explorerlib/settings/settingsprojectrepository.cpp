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

#include "settingsprojectrepository.h"
#include <QDebug>
#include <QMutexLocker>
#include <QSettings>

namespace
{
    const char* const KEY_TRACKED_PROJECTS = "Projects/tracked";
}

SettingsProjectRepository::SettingsProjectRepository(QSettings* settings) : m_settings(settings)
{
}

QStringList SettingsProjectRepository::ListProjects() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_settings->value(KEY_TRACKED_PROJECTS).toStringList();
}

void SettingsProjectRepository::AddProject(const QString& projectId)
{
    if (projectId.isEmpty())
        return;

    QMutexLocker locker(&this->m_mutex);
    QStringList projects = this->m_settings->value(KEY_TRACKED_PROJECTS).toStringList();
    if (projects.contains(projectId))
        return;

    projects.append(projectId);
    this->m_settings->setValue(KEY_TRACKED_PROJECTS, projects);
    this->m_settings->sync();
}

void SettingsProjectRepository::RemoveProject(const QString& projectId)
{
    QMutexLocker locker(&this->m_mutex);
    QStringList projects = this->m_settings->value(KEY_TRACKED_PROJECTS).toStringList();
    if (projects.removeAll(projectId) == 0)
    {
        qWarning() << "SettingsProjectRepository: Project" << projectId << "was not tracked";
        return;
    }

    this->m_settings->setValue(KEY_TRACKED_PROJECTS, projects);
    this->m_settings->sync();
}
