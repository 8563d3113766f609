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

#include "connectionstatetracker.h"
#include "sessioneventbus.h"
#include <QDebug>
#include <QMutexLocker>

ConnectionStateTracker::ConnectionStateTracker(SessionEventBus* eventBus, QObject* parent) : QObject(parent)
{
    if (eventBus)
    {
        connect(eventBus, &SessionEventBus::sessionStarted, this, &ConnectionStateTracker::onSessionStarted);
        connect(eventBus, &SessionEventBus::sessionEnded, this, &ConnectionStateTracker::onSessionEnded);
    } else
    {
        qWarning() << "ConnectionStateTracker: No event bus, connection state will not follow sessions";
    }
}

void ConnectionStateTracker::Seed(const InstanceLocator& instance, bool connected)
{
    bool changed = false;
    {
        QMutexLocker locker(&this->m_mutex);
        this->m_loaded[instance]++;
        changed = this->setConnected(instance, connected);
    }

    if (changed)
        emit this->connectionStateChanged(instance, connected);
}

void ConnectionStateTracker::Release(const InstanceLocator& instance)
{
    bool changed = false;
    {
        QMutexLocker locker(&this->m_mutex);
        auto it = this->m_loaded.find(instance);
        if (it == this->m_loaded.end())
            return;

        if (--it.value() > 0)
            return;

        this->m_loaded.erase(it);
        changed = this->setConnected(instance, false);
    }

    if (changed)
        emit this->connectionStateChanged(instance, false);
}

bool ConnectionStateTracker::IsConnected(const InstanceLocator& instance) const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_connected.contains(instance);
}

bool ConnectionStateTracker::IsTracked(const InstanceLocator& instance) const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_loaded.contains(instance);
}

QList<InstanceLocator> ConnectionStateTracker::GetConnectedInstances() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_connected.values();
}

void ConnectionStateTracker::onSessionStarted(const InstanceLocator& instance)
{
    bool changed = false;
    {
        QMutexLocker locker(&this->m_mutex);
        if (!this->m_loaded.contains(instance))
        {
            qDebug() << "ConnectionStateTracker: Ignoring session for instance that is not loaded:" << instance.ToString();
            return;
        }
        changed = this->setConnected(instance, true);
    }

    if (changed)
        emit this->connectionStateChanged(instance, true);
}

void ConnectionStateTracker::onSessionEnded(const InstanceLocator& instance)
{
    bool changed = false;
    {
        QMutexLocker locker(&this->m_mutex);
        changed = this->setConnected(instance, false);
    }

    if (changed)
        emit this->connectionStateChanged(instance, false);
}

// Caller holds m_mutex
bool ConnectionStateTracker::setConnected(const InstanceLocator& instance, bool connected)
{
    if (connected)
    {
        if (this->m_connected.contains(instance))
            return false;
        this->m_connected.insert(instance);
        return true;
    }

    return this->m_connected.remove(instance);
}
