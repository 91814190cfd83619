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

#ifndef DABBEARER_H
#define DABBEARER_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <stdint.h>

// DAB bearer: ensemble (ECC, EId) + service (SId) + component (SCIdS)
class DabBearer
{
public:
    DabBearer() : m_ecc(0), m_eid(0), m_sid(0), m_scids(0) {}
    DabBearer(uint8_t ecc, uint16_t eid, uint32_t sid, uint8_t scids)
        : m_ecc(ecc), m_eid(eid), m_sid(sid), m_scids(scids & 0x0F) {}

    // ETSI TS 103 270 V1.4.1 (2022-05) [5.1.2.4 Construction of bearerURI]
    // dab:<gcc>.<eid>.<sid>.<scids>[.<uatype>]
    static DabBearer fromUri(const QString & bearerUri);

    bool isValid() const { return (0 != m_sid) && (0 != m_eid); }
    uint8_t ecc() const { return m_ecc; }
    uint16_t eid() const { return m_eid; }
    uint32_t sid() const { return m_sid; }
    uint8_t scids() const { return m_scids; }
    bool isLongSId() const { return m_sid > 0xFFFF; }
    uint16_t gcc() const;
    bool isSameMultiplex(const DabBearer & other) const { return (m_ecc == other.m_ecc) && (m_eid == other.m_eid); }
    bool isSameMultiplex(uint8_t ecc, uint16_t eid) const { return (m_ecc == ecc) && (m_eid == eid); }

    QString toUri() const;
    QString radioDNSFqdn() const;
    QString pathSegment() const;
    QString objectIdentifier() const;
    // 4 or 8 hex digits
    QString sidString() const;

    // ETSI TS 102 371 V3.2.1 [4.7.6] bearerURI encoding
    QByteArray toBinary() const;
    QByteArray scopeId() const;
    static QByteArray ensembleScopeId(uint8_t ecc, uint16_t eid);

    bool operator==(const DabBearer & other) const
    {
        return (m_ecc == other.m_ecc) && (m_eid == other.m_eid) && (m_sid == other.m_sid) && (m_scids == other.m_scids);
    }
    bool operator!=(const DabBearer & other) const { return !(*this == other); }

private:
    uint8_t m_ecc;
    uint16_t m_eid;
    uint32_t m_sid;
    uint8_t m_scids;
};

inline size_t qHash(const DabBearer & bearer, size_t seed = 0)
{
    return qHash((uint64_t(bearer.ecc()) << 56) | (uint64_t(bearer.eid()) << 40) | (uint64_t(bearer.sid()) << 4) | bearer.scids(), seed);
}

#endif // DABBEARER_H
