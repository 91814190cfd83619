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

#include <QLoggingCategory>
#include <algorithm>

#include "sourcefetcher.h"

Q_LOGGING_CATEGORY(sourceFetcher, "SourceFetcher", QtInfoMsg)

QString fetchStatusToString(FetchStatus status)
{
    switch (status)
    {
    case FetchStatus::Found:
        return QString("found");
    case FetchStatus::NotFound:
        return QString("not found");
    case FetchStatus::AuthorizationFailure:
        return QString("authorization failure");
    case FetchStatus::TransportFailure:
        return QString("transport failure");
    case FetchStatus::MalformedDocument:
        return QString("malformed document");
    }
    return QString();
}

SourceFetcher::SourceFetcher(NetworkTransport *transport, const AccessCredentials &credentials)
    : m_transport(transport)
    , m_credentials(credentials)
{}

FetchStatus SourceFetcher::fetch(const QUrl &url, QByteArray &data) const
{
    QByteArray authorization = m_credentials.credentialFor(url);
    if (!authorization.isEmpty())
    {
        qCDebug(sourceFetcher) << "Using credential for" << url.host();
    }

    NetworkReply reply = m_transport->get(url, authorization);
    switch (reply.error)
    {
    case NetworkReply::Error::NoError:
        data = reply.data;
        return FetchStatus::Found;
    case NetworkReply::Error::HttpError:
        if (404 == reply.httpStatus)
        {
            return FetchStatus::NotFound;
        }
        if ((401 == reply.httpStatus) || (403 == reply.httpStatus) || (500 == reply.httpStatus))
        {
            qCWarning(sourceFetcher) << "Authorization failure" << reply.httpStatus << url.toString();
            return FetchStatus::AuthorizationFailure;
        }
        qCWarning(sourceFetcher) << "HTTP error" << reply.httpStatus << url.toString() << reply.errorString;
        return FetchStatus::TransportFailure;
    case NetworkReply::Error::TransportError:
        qCWarning(sourceFetcher) << "Transport error" << url.toString() << reply.errorString;
        return FetchStatus::TransportFailure;
    }
    return FetchStatus::TransportFailure;
}

FetchStatus SourceFetcher::fetchServiceInformation(const QUrl &url, const QList<DabBearer> &bearers, QList<SPIService> &services) const
{
    services.clear();

    QByteArray data;
    FetchStatus status = fetch(url, data);
    if (FetchStatus::NotFound == status)
    {
        qCInfo(sourceFetcher) << "SI not found:" << url.toString();
        return status;
    }
    if (FetchStatus::Found != status)
    {
        return status;
    }

    SPIServiceInformation si;
    if (!SPIDocument::parseServiceInformation(data, si))
    {
        qCWarning(sourceFetcher) << "Malformed SI document:" << url.toString();
        return FetchStatus::MalformedDocument;
    }

    for (const SPIService & service : si.services)
    {
        if (service.hasBearerIn(bearers))
        {
            services.append(service);
        }
    }
    qCInfo(sourceFetcher) << "SI" << url.toString() << ":" << services.size() << "of" << si.services.size() << "services match";

    return FetchStatus::Found;
}

FetchStatus SourceFetcher::fetchProgrammeInformation(const QUrl &url, SPIProgrammeInformation &pi) const
{
    QByteArray data;
    FetchStatus status = fetch(url, data);
    if (FetchStatus::NotFound == status)
    {   // schedules are not published for every day
        qCDebug(sourceFetcher) << "PI not found:" << url.toString();
        return status;
    }
    if (FetchStatus::Found != status)
    {
        return status;
    }

    if (!SPIDocument::parseProgrammeInformation(data, pi))
    {
        qCWarning(sourceFetcher) << "Malformed PI document:" << url.toString();
        return FetchStatus::MalformedDocument;
    }
    return FetchStatus::Found;
}

QList<DiscoveryServer> SourceFetcher::orderedServers(const QList<DiscoveryServer> &servers)
{
    QList<DiscoveryServer> ordered = servers;
    std::stable_sort(ordered.begin(), ordered.end(), [](const DiscoveryServer & a, const DiscoveryServer & b) {
        if (a.priority != b.priority)
        {
            return a.priority < b.priority;
        }
        return a.weight > b.weight;
    });
    return ordered;
}

QUrl SourceFetcher::serviceInformationUrl(const DiscoveryResponse &response, const DiscoveryServer &server)
{
    QUrl url = response.baseUrl(server);
    url.setPath("/radiodns/spi/3.1/SI.xml");
    return url;
}

QUrl SourceFetcher::programmeInformationUrl(const DiscoveryResponse &response, const DiscoveryServer &server,
                                            const DabBearer &bearer, const QDate &date)
{   // ETSI TS 102 818 V3.4.1 [5.3] /radiodns/spi/3.1/id/<serviceIdentifier>/<date>_PI.xml
    QUrl url = response.baseUrl(server);
    url.setPath(QString("/radiodns/spi/3.1/%1/%2_PI.xml").arg(bearer.pathSegment(), date.toString("yyyyMMdd")));
    return url;
}
