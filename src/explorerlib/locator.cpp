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

#include "locator.h"

ProjectLocator::ProjectLocator(const QString& projectId) : m_projectId(projectId)
{
}

QString ProjectLocator::ToString() const
{
    return QString("projects/%1").arg(this->m_projectId);
}

bool ProjectLocator::operator==(const ProjectLocator& other) const
{
    return this->m_projectId == other.m_projectId;
}

bool ProjectLocator::operator!=(const ProjectLocator& other) const
{
    return !(*this == other);
}

ZoneLocator::ZoneLocator(const QString& projectId, const QString& zone) : m_projectId(projectId), m_zone(zone)
{
}

ProjectLocator ZoneLocator::Project() const
{
    return ProjectLocator(this->m_projectId);
}

bool ZoneLocator::IsNull() const
{
    return this->m_projectId.isEmpty() || this->m_zone.isEmpty();
}

QString ZoneLocator::ToString() const
{
    return QString("projects/%1/zones/%2").arg(this->m_projectId, this->m_zone);
}

bool ZoneLocator::operator==(const ZoneLocator& other) const
{
    return this->m_projectId == other.m_projectId && this->m_zone == other.m_zone;
}

bool ZoneLocator::operator!=(const ZoneLocator& other) const
{
    return !(*this == other);
}

InstanceLocator::InstanceLocator(const QString& projectId, const QString& zone, const QString& name)
    : m_projectId(projectId), m_zone(zone), m_name(name)
{
}

ProjectLocator InstanceLocator::Project() const
{
    return ProjectLocator(this->m_projectId);
}

ZoneLocator InstanceLocator::Zone() const
{
    return ZoneLocator(this->m_projectId, this->m_zone);
}

bool InstanceLocator::IsNull() const
{
    return this->m_projectId.isEmpty() || this->m_zone.isEmpty() || this->m_name.isEmpty();
}

QString InstanceLocator::ToString() const
{
    return QString("projects/%1/zones/%2/instances/%3").arg(this->m_projectId, this->m_zone, this->m_name);
}

bool InstanceLocator::operator==(const InstanceLocator& other) const
{
    return this->m_projectId == other.m_projectId
           && this->m_zone == other.m_zone
           && this->m_name == other.m_name;
}

bool InstanceLocator::operator!=(const InstanceLocator& other) const
{
    return !(*this == other);
}
