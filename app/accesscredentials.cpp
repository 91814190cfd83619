/*
 * This file is part of the SPICarousel project
 *
 * MIT License
 *
 * Copyright (c) 2026 SPICarousel contributors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <QFile>
#include <QLoggingCategory>

#include "accesscredentials.h"

Q_LOGGING_CATEGORY(accessCredentials, "AccessCredentials", QtInfoMsg)

bool AccessCredentials::loadFromFile(const QString &fileName)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        qCCritical(accessCredentials) << "Unable to open credentials file" << fileName << ":" << file.errorString();
        return false;
    }
    loadFromData(file.readAll());
    qCInfo(accessCredentials) << "Loaded" << m_credentials.size() << "credentials from" << fileName;
    return true;
}

void AccessCredentials::loadFromData(const QByteArray &csv)
{
    int lineNum = 0;
    for (const QByteArray & rawLine : csv.split('\n'))
    {
        ++lineNum;
        QByteArray line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith('#'))
        {
            continue;
        }

        int sep = line.indexOf(',');
        if (sep <= 0)
        {
            qCWarning(accessCredentials) << "Ignoring invalid line" << lineNum;
            continue;
        }

        QString fqdn = QString::fromUtf8(line.left(sep).trimmed());
        QByteArray credential = line.mid(sep + 1).trimmed();
        if (fqdn.isEmpty() || credential.isEmpty())
        {
            qCWarning(accessCredentials) << "Ignoring incomplete line" << lineNum;
            continue;
        }
        insert(fqdn, credential);
    }
}

void AccessCredentials::insert(const QString &fqdn, const QByteArray &credential)
{
    m_credentials.insert(fqdn.trimmed().toLower(), credential);
}

QByteArray AccessCredentials::credentialFor(const QUrl &url) const
{
    return m_credentials.value(url.host().toLower());
}
