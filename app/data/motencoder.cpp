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

#include "motencoder.h"
#include "mscdatagroup.h"
#include "dabtables.h"

Q_LOGGING_CATEGORY(motEncoder, "MOTEncoder", QtInfoMsg)

MOTHeader::MOTHeader(uint32_t bodySize, int contentType, int contentSubType)
    : m_data(7, char(0x00))
    , m_headerSize(0)
{
    // body size, 28 bits
    m_data[0] = char((bodySize >> 20) & 0xFF);
    m_data[1] = char((bodySize >> 12) & 0xFF);
    m_data[2] = char((bodySize >>  4) & 0xFF);
    m_data[3] = char((bodySize <<  4) & 0xF0);

    // header size, 13 bits
    incrementHeaderSize(m_data.size());

    // content type, 6 bits
    m_data[5] = char(m_data[5] | ((contentType << 1) & 0x7E));

    // content subtype, 9 bits
    m_data[5] = char(m_data[5] | ((contentSubType >> 8) & 0x01));
    m_data[6] = char(contentSubType & 0xFF);
}

void MOTHeader::incrementHeaderSize(int size)
{
    m_headerSize += size;

    m_data[3] = char((m_data[3] & 0xF0) | ((m_headerSize >> 9) & 0x0F));
    m_data[4] = char((m_headerSize >> 1) & 0xFF);
    m_data[5] = char((m_data[5] & 0x7F) | ((m_headerSize << 7) & 0x80));
}

void MOTHeader::addParameter(int paramId, const QByteArray &dataField)
{
    QByteArray param = encodeParameter(paramId, dataField);
    m_data.append(param);
    incrementHeaderSize(param.size());
}

void MOTHeader::addContentName(const QString &name)
{   // ETSI EN 301 234 V2.1.1 [6.2.2.1.1] character set indicator in upper nibble
    QByteArray field;
    field.append(char(int(DabCharset::UTF8) << 4));
    field.append(name.toUtf8());
    addParameter(int(DabMotExtParameter::ContentName), field);
}

QByteArray MOTHeader::encodeParameter(int paramId, const QByteArray &dataField)
{
    QByteArray param;
    switch (dataField.size())
    {
    case 0:
        param.append(char((0b00 << 6) | (paramId & 0x3F)));
        break;
    case 1:
        param.append(char((0b01 << 6) | (paramId & 0x3F)));
        param.append(dataField);
        break;
    case 4:
        param.append(char((0b10 << 6) | (paramId & 0x3F)));
        param.append(dataField);
        break;
    default:
        param.append(char((0b11 << 6) | (paramId & 0x3F)));
        if (dataField.size() > 127)
        {
            param.append(char(0x80 | ((dataField.size() >> 8) & 0x7F)));
            param.append(char(dataField.size() & 0xFF));
        }
        else
        {
            param.append(char(dataField.size() & 0x7F));
        }
        param.append(dataField);
        break;
    }
    return param;
}

MOTEncoder::MOTEncoder(int segmentSize, uint16_t firstTransportId, uint32_t dataCarouselPeriod)
    : m_segmentSize(qBound(1, segmentSize, 0x1FFF))
    , m_nextTransportId(firstTransportId)
    , m_dataCarouselPeriod(dataCarouselPeriod & 0xFFFFFF)
{
    for (int n = 0; n < 16; ++n)
    {
        m_continuityIdx[n] = 0;
    }
}

QList<QByteArray> MOTEncoder::encodeDirectory(const QList<AssembledObject> &objects, const QList<AssembledParameter> &headerParameters)
{
    uint16_t directoryTransportId = m_nextTransportId++;
    QList<uint16_t> transportIds;
    for (int n = 0; n < objects.size(); ++n)
    {
        transportIds.append(m_nextTransportId++);
    }

    QList<QByteArray> dataGroups;
    QByteArray dir = directory(objects, transportIds, headerParameters);
    appendSegmented(dataGroups, uint8_t(DabMscDataGroupType::MOTDirectory), directoryTransportId, dir);
    qCDebug(motEncoder) << "Directory TID" << directoryTransportId << dir.size() << "bytes," << objects.size() << "objects";

    for (int n = 0; n < objects.size(); ++n)
    {
        appendSegmented(dataGroups, uint8_t(DabMscDataGroupType::MOTBody), transportIds.at(n), objects.at(n).data);
        qCDebug(motEncoder) << "Object" << objects.at(n).name << "TID" << transportIds.at(n) << objects.at(n).data.size() << "bytes";
    }

    qCInfo(motEncoder) << "Encoded" << objects.size() << "objects into" << dataGroups.size() << "data groups";
    return dataGroups;
}

QByteArray MOTEncoder::directory(const QList<AssembledObject> &objects, const QList<uint16_t> &transportIds,
                                 const QList<AssembledParameter> &headerParameters) const
{
    QByteArray extension;
    for (const AssembledParameter & param : headerParameters)
    {
        extension.append(MOTHeader::encodeParameter(param.id, param.data));
    }

    QByteArray entries;
    for (int n = 0; n < objects.size(); ++n)
    {
        entries.append(char(transportIds.at(n) >> 8));
        entries.append(char(transportIds.at(n) & 0xFF));
        entries.append(objectHeader(objects.at(n)).data());
    }

    // ETSI EN 301 234 V2.1.1 [7.2.3] directory header is 13 bytes
    uint32_t directorySize = 13 + extension.size() + entries.size();
    QByteArray dir;
    dir.append(char((directorySize >> 24) & 0x3F));   // 2 bits RFU
    dir.append(char((directorySize >> 16) & 0xFF));
    dir.append(char((directorySize >> 8) & 0xFF));
    dir.append(char(directorySize & 0xFF));
    dir.append(char(objects.size() >> 8));
    dir.append(char(objects.size() & 0xFF));
    dir.append(char((m_dataCarouselPeriod >> 16) & 0xFF));
    dir.append(char((m_dataCarouselPeriod >> 8) & 0xFF));
    dir.append(char(m_dataCarouselPeriod & 0xFF));
    dir.append(char((m_segmentSize >> 8) & 0x1F));    // 3 bits RFU
    dir.append(char(m_segmentSize & 0xFF));
    dir.append(char(extension.size() >> 8));
    dir.append(char(extension.size() & 0xFF));
    dir.append(extension);
    dir.append(entries);

    return dir;
}

MOTHeader MOTEncoder::objectHeader(const AssembledObject &object)
{
    MOTHeader header(object.data.size(), object.contentType, object.contentSubType);
    header.addContentName(object.name);
    for (const AssembledParameter & param : object.params)
    {
        header.addParameter(param.id, param.data);
    }
    return header;
}

void MOTEncoder::appendSegmented(QList<QByteArray> &dataGroups, uint8_t type, uint16_t transportId, const QByteArray &data)
{
    int numSegments = qMax(1, int((data.size() + m_segmentSize - 1) / m_segmentSize));
    for (int segNum = 0; segNum < numSegments; ++segNum)
    {
        QByteArray segmentData = data.mid(segNum * m_segmentSize, m_segmentSize);

        // ETSI EN 301 234 V2.1.1 [5.1.1] segmentation header: repetition count (3 bits) + segment size (13 bits)
        QByteArray segment;
        segment.append(char((segmentData.size() >> 8) & 0x1F));
        segment.append(char(segmentData.size() & 0xFF));
        segment.append(segmentData);

        bool last = (segNum == numSegments - 1);
        dataGroups.append(MSCDataGroup::encode(type, m_continuityIdx[type], 0, segNum, last, transportId, segment));

        m_continuityIdx[type] = (m_continuityIdx[type] + 1) % 16;   // increment continuity index
    }
}
