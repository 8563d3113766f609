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

#ifndef EXPLOREROPERATION_H
#define EXPLOREROPERATION_H

#include "../explorerlib_global.h"
#include "../cancellationtoken.h"
#include <QMutex>
#include <QObject>
#include <QString>
#include <QWaitCondition>

/**
 * @brief Base class for explorer work that may run on a worker thread
 *
 * The caller decides where the work executes: runSync() runs it on the
 * calling thread, runAsync() queues it on QThreadPool::globalInstance().
 * Exceptions thrown by run() are turned into the Failed or Cancelled state;
 * they never escape to the thread pool.
 *
 * Signals are emitted from the thread that executes the operation.
 */
class EXPLORERLIB_EXPORT ExplorerOperation : public QObject
{
    Q_OBJECT

    public:
        enum OperationState
        {
            NotStarted,
            Running,
            Completed,
            Cancelled,
            Failed
        };
        Q_ENUM(OperationState)

        explicit ExplorerOperation(const QString& title, QObject* parent = nullptr);
        ~ExplorerOperation() override;

        QString title() const;

        OperationState state() const;
        bool isRunning() const;
        bool isCompleted() const;
        bool isCancelled() const;
        bool isFailed() const;

        QString errorMessage() const;

        /**
         * @brief Block until the operation finished and emitted its final signal
         *
         * Returns immediately if the operation was never started.
         */
        void waitForCompletion();

    public slots:
        void runAsync();
        void runSync();
        void cancel();

    signals:
        void started();
        void completed();
        void cancelled();
        void failed(const QString& error);
        void stateChanged(ExplorerOperation::OperationState state);

    protected:
        virtual void run(const CancellationToken& token) = 0;

    private:
        bool begin();
        void execute();
        void setState(OperationState newState);
        void finish();

        QString m_title;
        OperationState m_state;
        QString m_errorMessage;
        bool m_finished;
        CancellationTokenSource m_cancellation;

        mutable QMutex m_mutex;
        QWaitCondition m_finishedCondition;
};

#endif // EXPLOREROPERATION_H
