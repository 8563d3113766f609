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

#include "refreshoperation.h"
#include "../resourcecache.h"
#include "../selectioncontroller.h"

RefreshOperation::RefreshOperation(ResourceCache* cache, bool reloadProjects, QObject* parent)
    : ExplorerOperation(reloadProjects ? "Reloading projects" : "Reloading zones", parent)
    , m_cache(cache)
    , m_selection(nullptr)
    , m_reloadProjects(reloadProjects)
{
}

RefreshOperation::RefreshOperation(SelectionController* selection, QObject* parent)
    : ExplorerOperation("Refreshing selection", parent)
    , m_cache(nullptr)
    , m_selection(selection)
    , m_reloadProjects(false)
{
}

void RefreshOperation::run(const CancellationToken& token)
{
    if (this->m_selection)
        this->m_selection->RefreshSelectedNode(token);
    else
        this->m_cache->Refresh(this->m_reloadProjects, token);
}
