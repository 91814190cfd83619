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

#include "serviceaggregator.h"
#include "scopecalculator.h"
#include "spiencoder.h"

Q_LOGGING_CATEGORY(serviceAggregator, "ServiceAggregator", QtInfoMsg)

ServiceAggregator::ServiceAggregator(const CarouselContext &context, const SourceFetcher &fetcher)
    : m_context(context)
    , m_fetcher(fetcher)
    , m_imageNormalizer(fetcher, context.logoSizeThreshold)
{}

void ServiceAggregator::process(const DiscoveryResponse &response)
{
    qCInfo(serviceAggregator) << "Processing" << response.fqdn << "with" << response.bearers.size() << "bearers and"
                              << response.servers.size() << "servers";

    for (const DiscoveryServer & server : SourceFetcher::orderedServers(response.servers))
    {
        QUrl url = SourceFetcher::serviceInformationUrl(response, server);

        QList<SPIService> services;
        FetchStatus status = m_fetcher.fetchServiceInformation(url, response.bearers, services);
        if (FetchStatus::Found != status)
        {
            qCDebug(serviceAggregator) << "Server" << server.target << "failed:" << fetchStatusToString(status);
            continue;
        }
        if (services.isEmpty())
        {
            qCInfo(serviceAggregator) << "Server" << server.target << "has no service for requested bearers";
            continue;
        }

        for (const SPIService & service : services)
        {
            processService(response, server, service);
        }

        if (SourcePolicy::FirstSuccess == m_context.sourcePolicy)
        {
            break;
        }
    }
}

void ServiceAggregator::processService(const DiscoveryResponse &response, const DiscoveryServer &server, const SPIService &service)
{
    SPIService normalized = restrictToMultiplex(service, m_context.ensemble.ecc, m_context.ensemble.eid);
    if (normalized.bearers.isEmpty())
    {
        qCDebug(serviceAggregator) << "Service" << normalized.displayShortName() << "is not carried in this multiplex";
        return;
    }
    normalized = dropEmptyGenres(normalized);
    normalized = m_imageNormalizer.normalize(normalized, m_objects);

    for (const DabBearer & bearer : normalized.bearers)
    {
        for (int day = 0; day < m_context.days; ++day)
        {
            processProgrammeInformation(response, server, bearer, m_context.today.addDays(day));
        }
    }

    qCInfo(serviceAggregator) << "Service" << normalized.displayShortName() << "added," << normalized.mediaItems.size() << "logos";
    m_services.append(normalized);
}

void ServiceAggregator::processProgrammeInformation(const DiscoveryResponse &response, const DiscoveryServer &server,
                                                    const DabBearer &bearer, const QDate &date)
{
    QUrl url = SourceFetcher::programmeInformationUrl(response, server, bearer, date);

    SPIProgrammeInformation pi;
    FetchStatus status = m_fetcher.fetchProgrammeInformation(url, pi);
    if (FetchStatus::Found != status)
    {
        return;
    }

    ScheduleScope scope = ScopeCalculator::documentScope(pi);
    if (!scope.isValid())
    {
        qCWarning(serviceAggregator) << "PI" << url.toString() << "has no resolvable scope, skipped";
        return;
    }

    pi = ScopeCalculator::applyScope(pi, scope, bearer);
    pi = ScopeCalculator::backfillShortDescriptions(pi, m_context.shortDescriptionLimit);

    AssembledObject object;
    object.name = programmeInformationName(bearer, date);
    object.data = SPIEncoder::encodeProgrammeInformation(pi);
    object.contentType = int(DabMotContentType::SPI);
    object.contentSubType = int(DabMotContentSubType::SPIProgrammeInformation);
    object.addParameter(DabSPIParameter::ScopeStart, DabTables::utcToDabTime(scope.start, false));
    object.addParameter(DabSPIParameter::ScopeEnd, DabTables::utcToDabTime(scope.end, false));
    object.addParameter(DabSPIParameter::ScopeID, bearer.scopeId());
    m_objects.append(object);

    qCInfo(serviceAggregator) << "PI" << object.name << object.data.size() << "bytes, scope"
                              << scope.start.toString(Qt::ISODate) << "-" << scope.end.toString(Qt::ISODate);
}

QString ServiceAggregator::programmeInformationName(const DabBearer &bearer, const QDate &date)
{
    return QString("%1_%2_PI.bin").arg(date.toString("yyyyMMdd"), bearer.objectIdentifier());
}

SPIService ServiceAggregator::dropEmptyGenres(const SPIService &service)
{
    SPIService result = service;
    result.genres.clear();
    for (const SPIGenre & genre : service.genres)
    {
        if (!genre.href.isEmpty())
        {
            result.genres.append(genre);
        }
    }
    return result;
}

SPIService ServiceAggregator::restrictToMultiplex(const SPIService &service, uint8_t ecc, uint16_t eid)
{
    SPIService result = service;
    result.bearers.clear();
    for (const DabBearer & bearer : service.bearers)
    {
        if (bearer.isSameMultiplex(ecc, eid))
        {
            result.bearers.append(bearer);
        }
    }
    return result;
}
