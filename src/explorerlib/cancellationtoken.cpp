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

#include "cancellationtoken.h"
#include "explorererror.h"

CancellationToken::CancellationToken(const QSharedPointer<QAtomicInt>& flag) : m_flag(flag)
{
}

bool CancellationToken::IsCancellationRequested() const
{
    return this->m_flag && this->m_flag->loadAcquire() != 0;
}

void CancellationToken::ThrowIfCancellationRequested() const
{
    if (this->IsCancellationRequested())
        throw OperationCancelledError();
}

CancellationTokenSource::CancellationTokenSource() : m_flag(new QAtomicInt(0))
{
}

CancellationToken CancellationTokenSource::Token() const
{
    return CancellationToken(this->m_flag);
}

void CancellationTokenSource::Cancel()
{
    this->m_flag->storeRelease(1);
}

bool CancellationTokenSource::IsCancellationRequested() const
{
    return this->m_flag->loadAcquire() != 0;
}
