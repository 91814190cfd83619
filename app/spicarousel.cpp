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
#include <QSaveFile>

#include "spicarousel.h"
#include "directoryassembler.h"
#include "serviceaggregator.h"
#include "sourcefetcher.h"
#include "data/motencoder.h"
#include "data/packetencoder.h"

Q_LOGGING_CATEGORY(spiCarousel, "SPICarousel", QtInfoMsg)

SPICarousel::SPICarousel(const CarouselContext &context, NetworkTransport *transport)
    : m_context(context)
    , m_transport(transport)
{}

bool SPICarousel::assemble(const QList<DiscoveryResponse> &responses, QList<AssembledObject> &objects) const
{
    SourceFetcher fetcher(m_transport, m_context.credentials);
    ServiceAggregator aggregator(m_context, fetcher);
    for (const DiscoveryResponse & response : responses)
    {
        aggregator.process(response);
    }

    return DirectoryAssembler::assemble(aggregator.objects(), aggregator.services(), m_context.ensemble, objects);
}

QList<QByteArray> SPICarousel::encode(const QList<AssembledObject> &objects, const CarouselOutput &output)
{
    MOTEncoder motEncoder;
    QList<QByteArray> dataGroups = motEncoder.encodeDirectory(objects, QList<AssembledParameter>());
    if (output.directoryOnly)
    {
        return dataGroups;
    }

    PacketEncoder packetEncoder;
    return packetEncoder.encodeTransportPackets(dataGroups, output.address, output.packetSize, output.padding);
}

bool SPICarousel::write(const QString &fileName, const QList<QByteArray> &chunks)
{
    QSaveFile file(fileName);
    if (!file.open(QIODevice::WriteOnly))
    {
        qCCritical(spiCarousel) << "Unable to open" << fileName << ":" << file.errorString();
        return false;
    }

    qint64 size = 0;
    for (const QByteArray & chunk : chunks)
    {
        if (file.write(chunk) != chunk.size())
        {
            qCCritical(spiCarousel) << "Write to" << fileName << "failed:" << file.errorString();
            file.cancelWriting();
            return false;
        }
        size += chunk.size();
    }

    if (!file.commit())
    {
        qCCritical(spiCarousel) << "Unable to save" << fileName << ":" << file.errorString();
        return false;
    }

    qCInfo(spiCarousel) << "Written" << size << "bytes to" << fileName;
    return true;
}

SPICarousel::ExitCode SPICarousel::run(const QList<DiscoveryResponse> &responses, const CarouselOutput &output) const
{
    QList<AssembledObject> objects;
    if (!assemble(responses, objects))
    {   // nothing is written
        return EXIT_NO_SERVICES;
    }

    QList<QByteArray> chunks = encode(objects, output);
    if (!write(output.fileName, chunks))
    {
        return EXIT_WRITE_FAILED;
    }
    return EXIT_OK;
}
