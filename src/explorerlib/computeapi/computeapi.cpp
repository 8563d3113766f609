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

#include "computeapi.h"
#include <QJsonArray>

namespace ComputeAPI
{
    const char* const Instance::STATUS_RUNNING = "RUNNING";
    const char* const Instance::GUEST_OS_FEATURE_WINDOWS = "WINDOWS";

    Instance Instance::FromJson(const QJsonObject& json)
    {
        Instance instance;

        // int64 values are string encoded in the REST representation
        const QJsonValue id = json.value("id");
        if (id.isString())
            instance.id = id.toString().toULongLong();
        else
            instance.id = static_cast<quint64>(id.toDouble());

        instance.name = json.value("name").toString();
        instance.zone = json.value("zone").toString();
        instance.status = json.value("status").toString();

        const QJsonArray disks = json.value("disks").toArray();
        for (const QJsonValue& diskValue : disks)
        {
            AttachedDisk disk;
            const QJsonArray features = diskValue.toObject().value("guestOsFeatures").toArray();
            for (const QJsonValue& feature : features)
                disk.guestOsFeatures.append(feature.toObject().value("type").toString());
            instance.disks.append(disk);
        }

        return instance;
    }

    QString Instance::ZoneName() const
    {
        const int slash = this->zone.lastIndexOf('/');
        return slash < 0 ? this->zone : this->zone.mid(slash + 1);
    }

    bool Instance::IsWindows() const
    {
        for (const AttachedDisk& disk : this->disks)
        {
            if (disk.guestOsFeatures.contains(GUEST_OS_FEATURE_WINDOWS))
                return true;
        }
        return false;
    }
}
