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

#ifndef EXPLORERSETTINGS_H
#define EXPLORERSETTINGS_H

#include "../explorerlib_global.h"
#include "../filterstate.h"
#include <QObject>
#include <QSettings>
#include <QString>

/**
 * @brief Persistent explorer preferences
 *
 * Stores the view filter using QSettings. By default the platform specific
 * user scope INI file is used; tests pass their own QSettings instance.
 */
class EXPLORERLIB_EXPORT ExplorerSettings : public QObject
{
    Q_OBJECT

    public:
        explicit ExplorerSettings(QObject* parent = nullptr);

        /**
         * @brief Use an existing settings store, the caller keeps ownership
         */
        explicit ExplorerSettings(QSettings* settings, QObject* parent = nullptr);
        ~ExplorerSettings() override;

        bool IsWindowsIncluded() const;
        void SetWindowsIncluded(bool included);

        bool IsLinuxIncluded() const;
        void SetLinuxIncluded(bool included);

        OperatingSystems GetIncludedOperatingSystems() const;
        void SetIncludedOperatingSystems(OperatingSystems operatingSystems);

        QString GetInstanceFilter() const;
        void SetInstanceFilter(const QString& filter);

        FilterState GetFilterState() const;

        void Sync();
        QString GetFileName() const;

        QSettings* GetSettings() const
        {
            return this->m_settings;
        }

    signals:
        void settingsChanged(const QString& key);

    private:
        QSettings* m_settings;
        bool m_ownsSettings;
};

#endif // EXPLORERSETTINGS_H
