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

#include "explorersettings.h"
#include <QDebug>

namespace
{
    const char* const KEY_INCLUDE_WINDOWS = "Explorer/includeWindows";
    const char* const KEY_INCLUDE_LINUX = "Explorer/includeLinux";
    const char* const KEY_INSTANCE_FILTER = "Explorer/instanceFilter";
}

ExplorerSettings::ExplorerSettings(QObject* parent)
    : QObject(parent)
    , m_settings(new QSettings(QSettings::IniFormat, QSettings::UserScope, "ComputeExplorer", "ComputeExplorerQt"))
    , m_ownsSettings(true)
{
    qDebug() << "Settings file location:" << this->m_settings->fileName();
}

ExplorerSettings::ExplorerSettings(QSettings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_ownsSettings(false)
{
}

ExplorerSettings::~ExplorerSettings()
{
    this->m_settings->sync();
    if (this->m_ownsSettings)
        delete this->m_settings;
}

bool ExplorerSettings::IsWindowsIncluded() const
{
    return this->m_settings->value(KEY_INCLUDE_WINDOWS, true).toBool();
}

void ExplorerSettings::SetWindowsIncluded(bool included)
{
    if (this->m_settings->contains(KEY_INCLUDE_WINDOWS) && this->IsWindowsIncluded() == included)
        return;

    this->m_settings->setValue(KEY_INCLUDE_WINDOWS, included);
    emit settingsChanged(KEY_INCLUDE_WINDOWS);
}

bool ExplorerSettings::IsLinuxIncluded() const
{
    return this->m_settings->value(KEY_INCLUDE_LINUX, true).toBool();
}

void ExplorerSettings::SetLinuxIncluded(bool included)
{
    if (this->m_settings->contains(KEY_INCLUDE_LINUX) && this->IsLinuxIncluded() == included)
        return;

    this->m_settings->setValue(KEY_INCLUDE_LINUX, included);
    emit settingsChanged(KEY_INCLUDE_LINUX);
}

OperatingSystems ExplorerSettings::GetIncludedOperatingSystems() const
{
    OperatingSystems operatingSystems;
    if (this->IsWindowsIncluded())
        operatingSystems |= OperatingSystem::Windows;
    if (this->IsLinuxIncluded())
        operatingSystems |= OperatingSystem::Linux;
    return operatingSystems;
}

void ExplorerSettings::SetIncludedOperatingSystems(OperatingSystems operatingSystems)
{
    this->SetWindowsIncluded(operatingSystems.testFlag(OperatingSystem::Windows));
    this->SetLinuxIncluded(operatingSystems.testFlag(OperatingSystem::Linux));
}

QString ExplorerSettings::GetInstanceFilter() const
{
    return this->m_settings->value(KEY_INSTANCE_FILTER).toString();
}

void ExplorerSettings::SetInstanceFilter(const QString& filter)
{
    if (this->m_settings->contains(KEY_INSTANCE_FILTER) && this->GetInstanceFilter() == filter)
        return;

    this->m_settings->setValue(KEY_INSTANCE_FILTER, filter);
    emit settingsChanged(KEY_INSTANCE_FILTER);
}

FilterState ExplorerSettings::GetFilterState() const
{
    FilterState state;
    state.operatingSystems = this->GetIncludedOperatingSystems();
    state.instanceNamePattern = this->GetInstanceFilter();
    return state;
}

void ExplorerSettings::Sync()
{
    this->m_settings->sync();
}

QString ExplorerSettings::GetFileName() const
{
    return this->m_settings->fileName();
}
