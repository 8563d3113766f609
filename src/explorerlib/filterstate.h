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

#ifndef FILTERSTATE_H
#define FILTERSTATE_H

#include "explorerlib_global.h"
#include <QFlags>
#include <QString>

enum class OperatingSystem
{
    Windows = 0x1,
    Linux = 0x2
};

Q_DECLARE_FLAGS(OperatingSystems, OperatingSystem)
Q_DECLARE_OPERATORS_FOR_FLAGS(OperatingSystems)

inline OperatingSystems AllOperatingSystems()
{
    return OperatingSystem::Windows | OperatingSystem::Linux;
}

/**
 * @brief View filter applied to instance nodes
 */
struct EXPLORERLIB_EXPORT FilterState
{
    OperatingSystems operatingSystems = AllOperatingSystems();

    // Case-insensitive substring of the instance name, empty matches all
    QString instanceNamePattern;

    bool operator==(const FilterState& other) const
    {
        return this->operatingSystems == other.operatingSystems
               && this->instanceNamePattern == other.instanceNamePattern;
    }

    bool operator!=(const FilterState& other) const
    {
        return !(*this == other);
    }
};

#endif // FILTERSTATE_H
