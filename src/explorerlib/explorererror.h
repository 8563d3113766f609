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

#ifndef EXPLORERERROR_H
#define EXPLORERERROR_H

#include "explorerlib_global.h"
#include <QByteArray>
#include <QString>
#include <stdexcept>

/*!
 * \brief Base class of all errors raised by the resource explorer
 *
 * Carries a human readable message. Subclasses classify the failure so that
 * callers can decide whether to recover locally (AccessDeniedError) or to
 * propagate (everything else).
 */
class EXPLORERLIB_EXPORT ExplorerError : public std::runtime_error
{
    public:
        explicit ExplorerError(const QString& message);

        QString message() const { return this->m_message; }

        const char* what() const noexcept override { return this->m_what.constData(); }

    private:
        QString m_message;
        QByteArray m_what;
};

/*!
 * \brief The backend denied access to a single resource (typically a project)
 */
class EXPLORERLIB_EXPORT AccessDeniedError : public ExplorerError
{
    public:
        AccessDeniedError(const QString& resource, const QString& message);

        QString resource() const { return this->m_resource; }

    private:
        QString m_resource;
};

/*!
 * \brief Network or backend failure that aborted a whole fetch
 */
class EXPLORERLIB_EXPORT FetchFailedError : public ExplorerError
{
    public:
        explicit FetchFailedError(const QString& message);
};

/*!
 * \brief The caller cancelled the operation
 */
class EXPLORERLIB_EXPORT OperationCancelledError : public ExplorerError
{
    public:
        OperationCancelledError();
};

/*!
 * \brief Operation referred to a node or identity that is not part of the tree
 */
class EXPLORERLIB_EXPORT UnknownIdentityError : public ExplorerError
{
    public:
        explicit UnknownIdentityError(const QString& identity);

        QString identity() const { return this->m_identity; }

    private:
        QString m_identity;
};

#endif // EXPLORERERROR_H
