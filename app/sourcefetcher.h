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

#ifndef SOURCEFETCHER_H
#define SOURCEFETCHER_H

#include <QDate>
#include <QList>
#include <QUrl>

#include "accesscredentials.h"
#include "discovery.h"
#include "networktransport.h"
#include "spidocument.h"

enum class FetchStatus
{
    Found,
    NotFound,
    AuthorizationFailure,
    TransportFailure,
    MalformedDocument,
};

QString fetchStatusToString(FetchStatus status);

class SourceFetcher
{
public:
    SourceFetcher(NetworkTransport * transport, const AccessCredentials & credentials);

    FetchStatus fetch(const QUrl & url, QByteArray & data) const;

    // services not carried on any of bearers are dropped
    FetchStatus fetchServiceInformation(const QUrl & url, const QList<DabBearer> & bearers, QList<SPIService> & services) const;
    FetchStatus fetchProgrammeInformation(const QUrl & url, SPIProgrammeInformation & pi) const;

    // priority ascending, weight descending
    static QList<DiscoveryServer> orderedServers(const QList<DiscoveryServer> & servers);

    static QUrl serviceInformationUrl(const DiscoveryResponse & response, const DiscoveryServer & server);
    static QUrl programmeInformationUrl(const DiscoveryResponse & response, const DiscoveryServer & server,
                                        const DabBearer & bearer, const QDate & date);

private:
    NetworkTransport * m_transport;
    const AccessCredentials & m_credentials;
};

#endif // SOURCEFETCHER_H
