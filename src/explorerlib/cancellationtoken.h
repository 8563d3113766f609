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

#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include "explorerlib_global.h"
#include <QAtomicInt>
#include <QSharedPointer>

/**
 * @brief Read side of a cancellation flag, passed through every fetch
 *
 * Copies share the same flag. A default constructed token can never be
 * cancelled.
 */
class EXPLORERLIB_EXPORT CancellationToken
{
    public:
        CancellationToken() = default;

        bool IsCancellationRequested() const;

        /**
         * @brief Throw OperationCancelledError if cancellation was requested
         */
        void ThrowIfCancellationRequested() const;

    private:
        friend class CancellationTokenSource;
        explicit CancellationToken(const QSharedPointer<QAtomicInt>& flag);

        QSharedPointer<QAtomicInt> m_flag;
};

/**
 * @brief Owner of a cancellation flag
 */
class EXPLORERLIB_EXPORT CancellationTokenSource
{
    public:
        CancellationTokenSource();

        CancellationToken Token() const;
        void Cancel();
        bool IsCancellationRequested() const;

    private:
        QSharedPointer<QAtomicInt> m_flag;
};

#endif // CANCELLATIONTOKEN_H
