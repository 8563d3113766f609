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

#include "nodefilter.h"

QList<QSharedPointer<ExplorerNode>> NodeFilter::Apply(const QList<QSharedPointer<ExplorerNode>>& rawChildren,
                                                      const FilterState& filter)
{
    QList<QSharedPointer<ExplorerNode>> filtered;
    filtered.reserve(rawChildren.size());

    for (const QSharedPointer<ExplorerNode>& node : rawChildren)
    {
        if (node && IsIncluded(*node, filter))
            filtered.append(node);
    }

    return filtered;
}

bool NodeFilter::IsIncluded(const ExplorerNode& node, const FilterState& filter)
{
    if (node.GetKind() != NodeKind::Instance)
        return true;

    if (!filter.operatingSystems.testFlag(node.GetOperatingSystem()))
        return false;

    if (filter.instanceNamePattern.isEmpty())
        return true;

    return node.GetDisplayText().contains(filter.instanceNamePattern, Qt::CaseInsensitive);
}
