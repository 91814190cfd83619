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

#include <QEventLoop>
#include <QLoggingCategory>

#include "radiodnsresolver.h"
#include "muxconfig.h"

Q_LOGGING_CATEGORY(radioDNS, "RadioDNS", QtInfoMsg)

namespace
{
QString stripDot(QString name)
{
    if (name.endsWith('.'))
    {
        name.chop(1);
    }
    return name;
}
}

RadioDNSResolver::RadioDNSResolver(QObject *parent) : QObject(parent)
{}

bool RadioDNSResolver::parseEnsembleIdentity(const QString &muxConfigPath, SPIEnsembleContext &ensemble)
{
    MuxConfig config;
    if (!config.load(muxConfigPath))
    {
        return false;
    }
    ensemble = config.ensembleContext();
    return true;
}

bool RadioDNSResolver::resolve(const QString &muxConfigPath, QList<DiscoveryResponse> &responses)
{
    MuxConfig config;
    if (!config.load(muxConfigPath))
    {
        return false;
    }
    responses = resolve(config.bearers());
    return true;
}

QList<DiscoveryResponse> RadioDNSResolver::resolve(const QList<DabBearer> &bearers)
{
    return groupByCName(bearers,
                        [this](const QString & fqdn) { return lookupCName(fqdn); },
                        [this](const QString & name) { return lookupServers(name); });
}

QList<DiscoveryResponse> RadioDNSResolver::groupByCName(const QList<DabBearer> &bearers,
                                                        const std::function<QString (const QString &)> &lookupCName,
                                                        const std::function<QList<DiscoveryServer> (const QString &)> &lookupServers)
{
    QList<DiscoveryResponse> responses;
    for (const DabBearer & bearer : bearers)
    {
        QString fqdn = bearer.radioDNSFqdn();
        QString cname = lookupCName(fqdn);
        if (cname.isEmpty())
        {
            qCInfo(radioDNS) << "No RadioDNS CNAME for" << bearer.toUri();
            continue;
        }

        bool grouped = false;
        for (DiscoveryResponse & response : responses)
        {
            if (0 == response.fqdn.compare(cname, Qt::CaseInsensitive))
            {
                response.bearers.append(bearer);
                grouped = true;
                break;
            }
        }
        if (grouped)
        {
            continue;
        }

        DiscoveryResponse response;
        response.fqdn = cname;
        response.bearers.append(bearer);
        response.protocol = DiscoveryResponse::Protocol::RadioSPI;
        response.servers = lookupServers("_radiospi._tcp." + cname);
        if (response.servers.isEmpty())
        {
            response.protocol = DiscoveryResponse::Protocol::RadioEPG;
            response.servers = lookupServers("_radioepg._tcp." + cname);
        }
        if (response.servers.isEmpty())
        {
            qCInfo(radioDNS) << "No SPI server for" << cname;
            continue;
        }

        qCInfo(radioDNS) << bearer.toUri() << "->" << cname << response.servers.size() << "servers";
        responses.append(response);
    }
    return responses;
}

bool RadioDNSResolver::lookup(QDnsLookup::Type type, const QString &name, QDnsLookup &dnsLookup)
{
    dnsLookup.setType(type);
    dnsLookup.setName(name);

    QEventLoop loop;
    connect(&dnsLookup, &QDnsLookup::finished, &loop, &QEventLoop::quit);
    dnsLookup.lookup();
    loop.exec();

    // Check the lookup succeeded.
    if (dnsLookup.error() != QDnsLookup::NoError)
    {
        qCDebug(radioDNS) << "DNS lookup failed:" << name << dnsLookup.errorString();
        return false;
    }
    return true;
}

QString RadioDNSResolver::lookupCName(const QString &fqdn)
{
    QDnsLookup dnsLookup;
    if (!lookup(QDnsLookup::CNAME, fqdn, dnsLookup) || dnsLookup.canonicalNameRecords().isEmpty())
    {
        return QString();
    }

    QDnsDomainNameRecord record = dnsLookup.canonicalNameRecords().at(0);
    qCDebug(radioDNS) << "canonicalNameRecord:" << record.name() << record.value();
    return stripDot(record.value());
}

QList<DiscoveryServer> RadioDNSResolver::lookupServers(const QString &name)
{
    QList<DiscoveryServer> servers;
    QDnsLookup dnsLookup;
    if (!lookup(QDnsLookup::SRV, name, dnsLookup))
    {
        return servers;
    }

    for (const auto & record : dnsLookup.serviceRecords())
    {
        qCDebug(radioDNS) << "serviceRecord:" << record.name() << record.target() << record.port();
        DiscoveryServer server;
        server.priority = record.priority();
        server.weight = record.weight();
        server.target = stripDot(record.target());
        server.port = record.port();
        servers.append(server);
    }
    return servers;
}
