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

#include "expandnodeoperation.h"
#include "../resourcecache.h"
#include <QMutexLocker>

ExpandNodeOperation::ExpandNodeOperation(ResourceCache* cache,
                                         const QSharedPointer<ExplorerNode>& node,
                                         bool forceReload,
                                         QObject* parent)
    : ExplorerOperation(QString("Loading %1").arg(node ? node->GetDisplayText() : QString()), parent)
    , m_cache(cache)
    , m_node(node)
    , m_forceReload(forceReload)
{
}

QList<QSharedPointer<ExplorerNode>> ExpandNodeOperation::children() const
{
    QMutexLocker locker(&this->m_resultMutex);
    return this->m_children;
}

void ExpandNodeOperation::run(const CancellationToken& token)
{
    NodeList* children = this->m_cache->GetFilteredChildren(this->m_node, this->m_forceReload, token);

    QMutexLocker locker(&this->m_resultMutex);
    this->m_children = children->ToList();
}
