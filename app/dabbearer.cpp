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

#include <QRegularExpression>
#include "dabbearer.h"

DabBearer DabBearer::fromUri(const QString &bearerUri)
{
    static const QRegularExpression re("^dab:([0-9a-f])([0-9a-f]{2})\\.([0-9a-f]{4})\\.([0-9a-f]{8}|[0-9a-f]{4})\\.([0-9a-f])(\\..*)?$",
                                       QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatch match = re.match(bearerUri.trimmed());
    if (match.hasMatch())
    {
        uint8_t ecc = match.captured(2).toUInt(nullptr, 16);
        uint16_t eid = match.captured(3).toUInt(nullptr, 16);
        uint32_t sid = match.captured(4).toUInt(nullptr, 16);
        uint8_t scids = match.captured(5).toUInt(nullptr, 16);
        return DabBearer(ecc, eid, sid, scids);
    }
    return DabBearer();
}

uint16_t DabBearer::gcc() const
{   // country ID is the first nibble of the SId, ECC follows
    uint8_t countryId = isLongSId() ? ((m_sid >> 20) & 0x0F) : ((m_sid >> 12) & 0x0F);
    return (uint16_t(countryId) << 8) | m_ecc;
}

QString DabBearer::sidString() const
{
    return QString("%1").arg(m_sid, isLongSId() ? 8 : 4, 16, QChar('0'));
}

QString DabBearer::toUri() const
{
    return QString("dab:%1.%2.%3.%4")
        .arg(gcc(), 3, 16, QChar('0'))
        .arg(m_eid, 4, 16, QChar('0'))
        .arg(sidString())
        .arg(m_scids, 1, 16);
}

QString DabBearer::radioDNSFqdn() const
{
    return QString("%1.%2.%3.%4.dab.radiodns.org")
        .arg(m_scids, 1, 16)
        .arg(sidString())
        .arg(m_eid, 4, 16, QChar('0'))
        .arg(gcc(), 3, 16, QChar('0'));
}

QString DabBearer::pathSegment() const
{
    return QString("dab/%1/%2/%3/%4")
        .arg(gcc(), 3, 16, QChar('0'))
        .arg(m_eid, 4, 16, QChar('0'))
        .arg(sidString())
        .arg(m_scids, 1, 16);
}

QString DabBearer::objectIdentifier() const
{
    return QString("%1.%2.%3.%4")
        .arg(gcc(), 3, 16, QChar('0'))
        .arg(m_eid, 4, 16, QChar('0'))
        .arg(sidString())
        .arg(m_scids, 1, 16);
}

QByteArray DabBearer::toBinary() const
{
    QByteArray data;
    data.append(char((isLongSId() ? 0x10 : 0x00) | (m_scids & 0x0F)));
    data.append(char(m_ecc));
    data.append(char((m_eid >> 8) & 0xFF));
    data.append(char(m_eid & 0xFF));
    if (isLongSId())
    {
        data.append(char((m_sid >> 24) & 0xFF));
        data.append(char((m_sid >> 16) & 0xFF));
    }
    else { /* short SId */ }
    data.append(char((m_sid >> 8) & 0xFF));
    data.append(char(m_sid & 0xFF));

    return data;
}

QByteArray DabBearer::scopeId() const
{
    QByteArray data = ensembleScopeId(m_ecc, m_eid);
    if (isLongSId())
    {
        data.append(char((m_sid >> 24) & 0xFF));
        data.append(char((m_sid >> 16) & 0xFF));
    }
    else { /* short SId */ }
    data.append(char((m_sid >> 8) & 0xFF));
    data.append(char(m_sid & 0xFF));
    data.append(char(m_scids & 0x0F));

    return data;
}

QByteArray DabBearer::ensembleScopeId(uint8_t ecc, uint16_t eid)
{
    QByteArray data;
    data.append(char(ecc));
    data.append(char((eid >> 8) & 0xFF));
    data.append(char(eid & 0xFF));
    return data;
}
