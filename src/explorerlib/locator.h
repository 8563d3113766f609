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

#ifndef LOCATOR_H
#define LOCATOR_H

#include "explorerlib_global.h"
#include <QString>
#include <QHash>
#include <QMetaType>

/**
 * @brief Identifies a cloud project by its project id
 */
class EXPLORERLIB_EXPORT ProjectLocator
{
    public:
        ProjectLocator() = default;
        explicit ProjectLocator(const QString& projectId);

        QString GetProjectId() const
        {
            return this->m_projectId;
        }

        bool IsNull() const
        {
            return this->m_projectId.isEmpty();
        }

        /**
         * @brief Resource path form, e.g. "projects/my-project"
         */
        QString ToString() const;

        bool operator==(const ProjectLocator& other) const;
        bool operator!=(const ProjectLocator& other) const;

    private:
        QString m_projectId;
};

/**
 * @brief Identifies a zone within a project
 */
class EXPLORERLIB_EXPORT ZoneLocator
{
    public:
        ZoneLocator() = default;
        ZoneLocator(const QString& projectId, const QString& zone);

        QString GetProjectId() const
        {
            return this->m_projectId;
        }

        QString GetName() const
        {
            return this->m_zone;
        }

        ProjectLocator Project() const;
        bool IsNull() const;

        // "projects/my-project/zones/us-central1-a"
        QString ToString() const;

        bool operator==(const ZoneLocator& other) const;
        bool operator!=(const ZoneLocator& other) const;

    private:
        QString m_projectId;
        QString m_zone;
};

/**
 * @brief Identifies a VM instance (project + zone + instance name)
 *
 * Instance identity is used as a weak reference throughout the explorer:
 * connection state, console links and session events all refer to instances
 * by locator instead of holding node pointers.
 */
class EXPLORERLIB_EXPORT InstanceLocator
{
    public:
        InstanceLocator() = default;
        InstanceLocator(const QString& projectId, const QString& zone, const QString& name);

        QString GetProjectId() const
        {
            return this->m_projectId;
        }

        QString GetZone() const
        {
            return this->m_zone;
        }

        QString GetName() const
        {
            return this->m_name;
        }

        ProjectLocator Project() const;
        ZoneLocator Zone() const;
        bool IsNull() const;

        // "projects/my-project/zones/us-central1-a/instances/vm-1"
        QString ToString() const;

        bool operator==(const InstanceLocator& other) const;
        bool operator!=(const InstanceLocator& other) const;

    private:
        QString m_projectId;
        QString m_zone;
        QString m_name;
};

inline size_t qHash(const ProjectLocator& key, size_t seed = 0) noexcept
{
    return ::qHash(key.GetProjectId(), seed);
}

inline size_t qHash(const ZoneLocator& key, size_t seed = 0) noexcept
{
    return ::qHash(key.ToString(), seed);
}

inline size_t qHash(const InstanceLocator& key, size_t seed = 0) noexcept
{
    return ::qHash(key.ToString(), seed);
}

Q_DECLARE_METATYPE(ProjectLocator)
Q_DECLARE_METATYPE(ZoneLocator)
Q_DECLARE_METATYPE(InstanceLocator)

#endif // LOCATOR_H
