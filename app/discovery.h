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

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <QList>
#include <QString>
#include <QUrl>

#include "dabbearer.h"

// one SRV record
struct DiscoveryServer
{
    uint16_t priority = 0;
    uint16_t weight = 0;
    QString target;
    uint16_t port = 0;
};

// RadioDNS answer for one authoritative FQDN
struct DiscoveryResponse
{
    enum class Protocol
    {
        RadioSPI,   // _radiospi._tcp, https
        RadioEPG,   // _radioepg._tcp, http
    };

    QString fqdn;
    QList<DabBearer> bearers;
    QList<DiscoveryServer> servers;
    Protocol protocol = Protocol::RadioSPI;

    QString scheme() const { return (Protocol::RadioSPI == protocol) ? QString("https") : QString("http"); }

    // <scheme>://<host>[:port], port only when it differs from scheme default
    QUrl baseUrl(const DiscoveryServer & server) const
    {
        QUrl url;
        url.setScheme(scheme());
        url.setHost(server.target);
        int defaultPort = (Protocol::RadioSPI == protocol) ? 443 : 80;
        if ((0 != server.port) && (defaultPort != server.port))
        {
            url.setPort(server.port);
        }
        return url;
    }
};

#endif // DISCOVERY_H
