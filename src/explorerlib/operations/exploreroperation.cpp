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

#include "exploreroperation.h"
#include "../explorererror.h"
#include <QDebug>
#include <QMutexLocker>
#include <QThreadPool>

ExplorerOperation::ExplorerOperation(const QString& title, QObject* parent)
    : QObject(parent)
    , m_title(title)
    , m_state(NotStarted)
    , m_finished(false)
{
}

ExplorerOperation::~ExplorerOperation()
{
    QMutexLocker locker(&this->m_mutex);
    if (this->m_state == Running)
        qWarning() << "ExplorerOperation: Destroying operation that is still running:" << this->m_title;
}

QString ExplorerOperation::title() const
{
    return this->m_title;
}

ExplorerOperation::OperationState ExplorerOperation::state() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_state;
}

bool ExplorerOperation::isRunning() const
{
    return this->state() == Running;
}

bool ExplorerOperation::isCompleted() const
{
    return this->state() == Completed;
}

bool ExplorerOperation::isCancelled() const
{
    return this->state() == Cancelled;
}

bool ExplorerOperation::isFailed() const
{
    return this->state() == Failed;
}

QString ExplorerOperation::errorMessage() const
{
    QMutexLocker locker(&this->m_mutex);
    return this->m_errorMessage;
}

void ExplorerOperation::waitForCompletion()
{
    QMutexLocker locker(&this->m_mutex);
    if (this->m_state == NotStarted)
        return;

    while (!this->m_finished)
        this->m_finishedCondition.wait(&this->m_mutex);
}

void ExplorerOperation::runAsync()
{
    if (!this->begin())
        return;

    QThreadPool::globalInstance()->start([this]() {
        this->execute();
    });
}

void ExplorerOperation::runSync()
{
    if (!this->begin())
        return;

    this->execute();
}

void ExplorerOperation::cancel()
{
    this->m_cancellation.Cancel();

    QMutexLocker locker(&this->m_mutex);
    if (this->m_state != NotStarted)
        return;
    locker.unlock();

    // Never started, nothing to interrupt
    this->setState(Cancelled);
    this->finish();
}

bool ExplorerOperation::begin()
{
    {
        QMutexLocker locker(&this->m_mutex);
        if (this->m_state != NotStarted)
        {
            qWarning() << "ExplorerOperation: Cannot start operation that is already running or completed:" << this->m_title;
            return false;
        }
    }

    this->setState(Running);
    return true;
}

void ExplorerOperation::execute()
{
    qDebug() << "ExplorerOperation: Running" << this->m_title;

    try
    {
        this->run(this->m_cancellation.Token());
        this->setState(Completed);
    } catch (const OperationCancelledError&)
    {
        qDebug() << "ExplorerOperation: Cancelled" << this->m_title;
        this->setState(Cancelled);
    } catch (const std::exception& e)
    {
        qWarning() << "ExplorerOperation: Failed" << this->m_title << ":" << e.what();
        {
            QMutexLocker locker(&this->m_mutex);
            this->m_errorMessage = QString::fromUtf8(e.what());
        }
        this->setState(Failed);
    }

    this->finish();
}

void ExplorerOperation::finish()
{
    // Woken only after the final state signal went out
    QMutexLocker locker(&this->m_mutex);
    this->m_finished = true;
    this->m_finishedCondition.wakeAll();
}

void ExplorerOperation::setState(OperationState newState)
{
    QMutexLocker locker(&this->m_mutex);
    if (this->m_state == newState)
        return;

    this->m_state = newState;
    const QString errorMessage = this->m_errorMessage;
    locker.unlock();

    emit this->stateChanged(newState);

    switch (newState)
    {
        case Running:
            emit this->started();
            break;
        case Completed:
            emit this->completed();
            break;
        case Cancelled:
            emit this->cancelled();
            break;
        case Failed:
            emit this->failed(errorMessage);
            break;
        case NotStarted:
            break;
    }
}
