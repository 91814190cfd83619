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

#ifndef SPIENCODER_H
#define SPIENCODER_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include "spidocument.h"

// ETSI TS 102 371 V3.2.1 (2016-05) [4 Binary encoding]
namespace SPIElement
{
    enum class Tag
    {
        CDATA = 0x01,
        epg = 0x02,
        serviceInformation = 0x03,
        shortName = 0x10,
        mediumName= 0x11,
        longName = 0x12,
        mediaDescription = 0x13,
        genre = 0x14,
        keywords= 0x16,
        link = 0x18,
        location = 0x19,
        shortDescription = 0x1A,
        longDescription = 0x1B,
        programme = 0x1C,
        schedule = 0x21,
        scope = 0x24,
        serviceScope = 0x25,
        ensemble = 0x26,
        service = 0x28,
        multimedia = 0x2B,
        time = 0x2C,
        bearer = 0x2D,
        radiodns = 0x31,
    };

    namespace serviceInformation
    {
        enum class attribute
        {
            version = 0x80,
            creationTime = 0x81,
            originator = 0x82,
            serviceProvider = 0x83
        };
    }
    namespace ensemble
    {
        enum class attribute
        {
            id = 0x80,
        };
    }
    namespace service
    {
        enum class attribute
        {
            version = 0x80,
        };
    }
    namespace multimedia
    {
        enum class attribute
        {
            mimeValue = 0x80,
            xml_lang = 0x81,
            url = 0x82,
            type = 0x83,
            width = 0x84,
            height = 0x85
        };
    }
    // shortName, mediumName, longName, shortDescription, longDescription and keywords
    namespace text
    {
        enum class attribute
        {
            xml_lang = 0x80,
        };
    }
    namespace genre
    {
        enum class attribute
        {
            href = 0x80,
            type = 0x81,
        };
    }
    namespace link
    {
        enum class attribute
        {
            uri = 0x80,
            mimeValue = 0x81,
            xml_lang = 0x82,
            description = 0x83,
        };
    }
    namespace programme
    {
        enum class attribute
        {
            id = 0x80,
            shortId = 0x81,
            version = 0x82,
            recommendation = 0x83,
            broadcast = 0x84,
            xml_lang = 0x86,
        };
    }
    namespace schedule
    {
        enum class attribute
        {
            version = 0x80,
            creationTime = 0x81,
            originator = 0x82,
        };
    }
    namespace scope
    {
        enum class attribute
        {
            startTime = 0x80,
            stopTime = 0x81,
        };
    }
    namespace serviceScope
    {
        enum class attribute
        {
            id = 0x80,
        };
    }
    namespace bearer
    {
        enum class attribute
        {
            id = 0x80,
        };
    }
    namespace time
    {
        enum class attribute
        {
            time = 0x80,
            duration = 0x81,
            actualTime = 0x82,
            actualDuration = 0x83,
        };
    }
    namespace radiodns
    {
        enum class attribute
        {
            fqdn = 0x80,
            serviceIdentifier = 0x81,
        };
    }
}

// Binary side of SPI documents
class SPIEncoder
{
public:
    static QByteArray encodeServiceInformation(const SPIServiceInformation & si, const SPIEnsembleContext & ensemble);
    static QByteArray encodeProgrammeInformation(const SPIProgrammeInformation & pi);

    // tag + length (1, 3 or 4 bytes) + value
    static QByteArray element(uint8_t tag, const QByteArray & value);
    static QByteArray genreHref(const QString & href);

private:
    static QByteArray encodeService(const SPIService & service);
    static QByteArray encodeSchedule(const SPISchedule & schedule);
    static QByteArray encodeProgramme(const SPIProgramme & programme);
    static QByteArray encodeLocation(const SPILocation & location);
    static QByteArray encodeText(SPIElement::Tag tag, const SPIText & text);
    static QByteArray encodeMediaDescription(const SPIMediaDescription & mediaDescription);
    static QByteArray encodeMultimedia(const SPIMultimedia & multimedia);
    static QByteArray encodeGenre(const SPIGenre & genre);
    static QByteArray encodeLink(const SPILink & link);
    static QByteArray encodeBearer(SPIElement::Tag tag, const DabBearer & bearer);

    static QByteArray attribute_string(uint8_t tag, const QString & value);
    static QByteArray attribute_uint8(uint8_t tag, uint8_t value);
    static QByteArray attribute_uint16(uint8_t tag, uint16_t value);
    static QByteArray attribute_uint24(uint8_t tag, uint32_t value);
    static QByteArray attribute_timePoint(uint8_t tag, const QDateTime & time);
};

#endif // SPIENCODER_H
