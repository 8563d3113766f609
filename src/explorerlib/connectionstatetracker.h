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

#ifndef CONNECTIONSTATETRACKER_H
#define CONNECTIONSTATETRACKER_H

#include "explorerlib_global.h"
#include "locator.h"
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QSet>

class SessionEventBus;

/**
 * @brief Tracks which loaded instances currently have an open session
 *
 * Instance nodes register themselves (Seed) when created and are released
 * when dropped from the tree. Registration is reference counted because a
 * reload creates the replacement node before the old one is dropped.
 *
 * Session events only affect registered instances: a session-started event
 * for an instance that is not loaded is ignored, no node is created for it.
 */
class EXPLORERLIB_EXPORT ConnectionStateTracker : public QObject
{
    Q_OBJECT

    public:
        explicit ConnectionStateTracker(SessionEventBus* eventBus, QObject* parent = nullptr);

        /**
         * @brief Register a loaded instance with its broker reported state
         */
        void Seed(const InstanceLocator& instance, bool connected);

        /**
         * @brief Drop one registration of an instance
         */
        void Release(const InstanceLocator& instance);

        bool IsConnected(const InstanceLocator& instance) const;
        bool IsTracked(const InstanceLocator& instance) const;

        QList<InstanceLocator> GetConnectedInstances() const;

    signals:
        void connectionStateChanged(const InstanceLocator& instance, bool connected);

    private slots:
        void onSessionStarted(const InstanceLocator& instance);
        void onSessionEnded(const InstanceLocator& instance);

    private:
        bool setConnected(const InstanceLocator& instance, bool connected);

        mutable QMutex m_mutex;
        QHash<InstanceLocator, int> m_loaded;
        QSet<InstanceLocator> m_connected;
};

#endif // CONNECTIONSTATETRACKER_H
