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

#ifndef EXPANDNODEOPERATION_H
#define EXPANDNODEOPERATION_H

#include "exploreroperation.h"
#include "../explorernode.h"
#include <QList>
#include <QSharedPointer>

class ResourceCache;

/**
 * @brief Load the filtered children of one node
 */
class EXPLORERLIB_EXPORT ExpandNodeOperation : public ExplorerOperation
{
    Q_OBJECT

    public:
        ExpandNodeOperation(ResourceCache* cache,
                            const QSharedPointer<ExplorerNode>& node,
                            bool forceReload,
                            QObject* parent = nullptr);

        QSharedPointer<ExplorerNode> node() const
        {
            return this->m_node;
        }

        /**
         * @brief Snapshot of the filtered children, valid once completed
         */
        QList<QSharedPointer<ExplorerNode>> children() const;

    protected:
        void run(const CancellationToken& token) override;

    private:
        ResourceCache* m_cache;
        QSharedPointer<ExplorerNode> m_node;
        bool m_forceReload;

        mutable QMutex m_resultMutex;
        QList<QSharedPointer<ExplorerNode>> m_children;
};

#endif // EXPANDNODEOPERATION_H
