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

#ifndef MOTENCODER_H
#define MOTENCODER_H

#include <QByteArray>
#include <QList>
#include <QString>

#include "assembledobject.h"

// ETSI EN 301 234 V2.1.1 [6.1] MOT header: header core followed by header extension
class MOTHeader
{
public:
    MOTHeader(uint32_t bodySize, int contentType, int contentSubType);

    // PLI selected from data field length
    void addParameter(int paramId, const QByteArray & dataField);
    void addContentName(const QString & name);

    const QByteArray & data() const { return m_data; }
    uint16_t headerSize() const { return m_headerSize; }

    static QByteArray encodeParameter(int paramId, const QByteArray & dataField);

private:
    QByteArray m_data;
    uint16_t m_headerSize;

    void incrementHeaderSize(int size);
};

// MOT directory mode, ETSI EN 301 234 V2.1.1 [7.2.3]
class MOTEncoder
{
public:
    explicit MOTEncoder(int segmentSize = 1024, uint16_t firstTransportId = 1, uint32_t dataCarouselPeriod = 0);

    // directory data groups (type 6) followed by body data groups (type 4) in object order
    QList<QByteArray> encodeDirectory(const QList<AssembledObject> & objects, const QList<AssembledParameter> & headerParameters);

    QByteArray directory(const QList<AssembledObject> & objects, const QList<uint16_t> & transportIds,
                         const QList<AssembledParameter> & headerParameters) const;
    static MOTHeader objectHeader(const AssembledObject & object);

private:
    int m_segmentSize;
    uint16_t m_nextTransportId;
    uint32_t m_dataCarouselPeriod;
    uint8_t m_continuityIdx[16];

    void appendSegmented(QList<QByteArray> & dataGroups, uint8_t type, uint16_t transportId, const QByteArray & data);
};

#endif // MOTENCODER_H
