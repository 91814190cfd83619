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

#ifndef RADIODNSRESOLVER_H
#define RADIODNSRESOLVER_H

#include <QDnsLookup>
#include <QList>
#include <QObject>
#include <functional>

#include "discovery.h"
#include "spidocument.h"

class MuxConfig;

// ETSI TS 103 270 RadioDNS service discovery
class RadioDNSResolver : public QObject
{
    Q_OBJECT
public:
    explicit RadioDNSResolver(QObject *parent = nullptr);

    static bool parseEnsembleIdentity(const QString & muxConfigPath, SPIEnsembleContext & ensemble);
    bool resolve(const QString & muxConfigPath, QList<DiscoveryResponse> & responses);
    QList<DiscoveryResponse> resolve(const QList<DabBearer> & bearers);

    // Groups bearers by CNAME, servers from _radiospi with _radioepg fallback.
    // Bearers without CNAME or without any server are skipped.
    static QList<DiscoveryResponse> groupByCName(const QList<DabBearer> & bearers,
                                                 const std::function<QString (const QString &)> & lookupCName,
                                                 const std::function<QList<DiscoveryServer> (const QString &)> & lookupServers);

private:
    bool lookup(QDnsLookup::Type type, const QString & name, QDnsLookup & dnsLookup);
    QString lookupCName(const QString & fqdn);
    QList<DiscoveryServer> lookupServers(const QString & name);
};

#endif // RADIODNSRESOLVER_H
