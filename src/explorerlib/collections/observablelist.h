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

#ifndef OBSERVABLELIST_H
#define OBSERVABLELIST_H

#include "../explorerlib_global.h"
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QObject>
#include <QRecursiveMutex>

/**
 * @brief Signal carrier for ObservableList, templates can't have Q_OBJECT
 */
class EXPLORERLIB_EXPORT NotifyingCollection : public QObject
{
    Q_OBJECT

    public:
        // Observers are never told what changed, only that they must re-read
        enum ChangeAction
        {
            Reset
        };
        Q_ENUM(ChangeAction)

    signals:
        void collectionChanged(NotifyingCollection::ChangeAction action);

    protected:
        explicit NotifyingCollection(QObject* parent) : QObject(parent)
        {
        }

        void notifyReset()
        {
            emit this->collectionChanged(Reset);
        }
};

/**
 * @brief Thread-safe list that publishes whole-collection resets
 *
 * Clear() and AddRange() publish one Reset each, also when nothing was
 * removed or added. Replace() does both, so a replacement is always seen as
 * two resets, and two replacements never interleave.
 */
template <typename T>
class ObservableList : public NotifyingCollection
{
    public:
        explicit ObservableList(QObject* parent = nullptr) : NotifyingCollection(parent)
        {
        }

        void Clear()
        {
            {
                QMutexLocker locker(&this->m_mutex);
                this->m_items.clear();
            }
            this->notifyReset();
        }

        void AddRange(const QList<T>& items)
        {
            {
                QMutexLocker locker(&this->m_mutex);
                this->m_items.append(items);
            }
            this->notifyReset();
        }

        void Replace(const QList<T>& items)
        {
            QMutexLocker writer(&this->m_writeMutex);
            this->Clear();
            this->AddRange(items);
        }

        int Count() const
        {
            QMutexLocker locker(&this->m_mutex);
            return this->m_items.size();
        }

        bool IsEmpty() const
        {
            return this->Count() == 0;
        }

        T At(int index) const
        {
            QMutexLocker locker(&this->m_mutex);
            return this->m_items.at(index);
        }

        bool Contains(const T& item) const
        {
            QMutexLocker locker(&this->m_mutex);
            return this->m_items.contains(item);
        }

        // Snapshot, later changes are not reflected
        QList<T> ToList() const
        {
            QMutexLocker locker(&this->m_mutex);
            return this->m_items;
        }

    private:
        mutable QMutex m_mutex;
        // Held across Clear + AddRange of one Replace, recursive so an
        // observer may read or replace from its slot
        QRecursiveMutex m_writeMutex;
        QList<T> m_items;
};

#endif // OBSERVABLELIST_H
