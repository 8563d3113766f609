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

#ifndef COMPUTEAPI_H
#define COMPUTEAPI_H

#include "../explorerlib_global.h"
#include "../cancellationtoken.h"
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief Records and adapters of the remote inventory API
 *
 * Only the fields the explorer consumes are modelled. Adapters are abstract:
 * the REST transport lives outside of this library and tests provide fakes.
 */
namespace ComputeAPI
{
    /**
     * @brief Project metadata as returned by the resource manager
     */
    struct EXPLORERLIB_EXPORT Project
    {
        QString projectId;
        QString name;
    };

    struct EXPLORERLIB_EXPORT AttachedDisk
    {
        QStringList guestOsFeatures;
    };

    /**
     * @brief Compute Engine instance record
     */
    struct EXPLORERLIB_EXPORT Instance
    {
        static const char* const STATUS_RUNNING;
        static const char* const GUEST_OS_FEATURE_WINDOWS;

        quint64 id = 0;
        QString name;
        QString zone;   // short name or full resource URL
        QString status;
        QList<AttachedDisk> disks;

        /**
         * @brief Parse the Compute Engine JSON representation of an instance
         *
         * Reads id (string encoded uint64), name, zone, status and
         * disks[].guestOsFeatures[].type; everything else is ignored.
         */
        static Instance FromJson(const QJsonObject& json);

        /**
         * @brief Zone name, i.e. the last path segment of the zone URL
         */
        QString ZoneName() const;

        /**
         * @brief True if any attached disk reports the WINDOWS guest OS feature
         */
        bool IsWindows() const;
    };

    class EXPLORERLIB_EXPORT ResourceManagerAdapter
    {
        public:
            virtual ~ResourceManagerAdapter() = default;

            /**
             * @brief Resolve project metadata
             * @throws AccessDeniedError if the caller may not view the project
             * @throws FetchFailedError on transport or backend errors
             */
            virtual Project GetProject(const QString& projectId, const CancellationToken& token) = 0;
    };

    class EXPLORERLIB_EXPORT ComputeEngineAdapter
    {
        public:
            virtual ~ComputeEngineAdapter() = default;

            /**
             * @brief List all instances of a project, across all zones
             * @throws FetchFailedError on transport or backend errors
             */
            virtual QList<Instance> ListInstances(const QString& projectId, const CancellationToken& token) = 0;
    };
}

#endif // COMPUTEAPI_H
