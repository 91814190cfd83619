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

#ifndef SERVICEAGGREGATOR_H
#define SERVICEAGGREGATOR_H

#include <QList>

#include "assembledobject.h"
#include "carouselcontext.h"
#include "discovery.h"
#include "imagenormalizer.h"
#include "sourcefetcher.h"

class ServiceAggregator
{
public:
    ServiceAggregator(const CarouselContext & context, const SourceFetcher & fetcher);

    void process(const DiscoveryResponse & response);

    // logo and PI objects in discovery order
    const QList<AssembledObject> & objects() const { return m_objects; }
    // services with bearers limited to current multiplex
    const QList<SPIService> & services() const { return m_services; }

    static QString programmeInformationName(const DabBearer & bearer, const QDate & date);
    static SPIService dropEmptyGenres(const SPIService & service);
    static SPIService restrictToMultiplex(const SPIService & service, uint8_t ecc, uint16_t eid);

private:
    const CarouselContext & m_context;
    const SourceFetcher & m_fetcher;
    ImageNormalizer m_imageNormalizer;
    QList<AssembledObject> m_objects;
    QList<SPIService> m_services;

    void processService(const DiscoveryResponse & response, const DiscoveryServer & server, const SPIService & service);
    void processProgrammeInformation(const DiscoveryResponse & response, const DiscoveryServer & server,
                                     const DabBearer & bearer, const QDate & date);
};

#endif // SERVICEAGGREGATOR_H
