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

#include <catch2/catch.hpp>

#include "motencoder.h"
#include "mscdatagroup.h"

namespace
{
AssembledObject object(const QString & name, int size, DabMotContentType type, int subType)
{
    AssembledObject o;
    o.name = name;
    for (int n = 0; n < size; ++n)
    {
        o.data.append(char(n & 0xFF));
    }
    o.contentType = int(type);
    o.contentSubType = subType;
    return o;
}

// segmentation header stripped
QByteArray segmentData(const MSCDataGroup & dataGroup)
{
    const QByteArray & field = dataGroup.getDataField();
    int size = ((uint8_t(field.at(0)) & 0x1F) << 8) | uint8_t(field.at(1));
    REQUIRE(field.size() == size + 2);
    return field.mid(2);
}
}

TEST_CASE("MOT header core", "[mot]")
{
    SECTION("body size, header size and content type")
    {
        MOTHeader header(2500, int(DabMotContentType::Image), int(DabMotContentSubType::ImagePNG));
        header.addContentName("a.png");

        const QByteArray & data = header.data();
        REQUIRE(header.headerSize() == 15);
        REQUIRE(data.size() == 15);
        REQUIRE(uint8_t(data.at(0)) == 0x00);
        REQUIRE(uint8_t(data.at(1)) == 0x00);
        REQUIRE(uint8_t(data.at(2)) == 0x9C);
        REQUIRE(uint8_t(data.at(3)) == 0x40);
        REQUIRE(uint8_t(data.at(4)) == 0x07);
        REQUIRE(uint8_t(data.at(5)) == 0x84);
        REQUIRE(uint8_t(data.at(6)) == 0x03);

        // content name: PLI 3, length 6, UTF-8 charset, name
        REQUIRE(uint8_t(data.at(7)) == 0xCC);
        REQUIRE(uint8_t(data.at(8)) == 0x06);
        REQUIRE(uint8_t(data.at(9)) == 0xF0);
        REQUIRE(data.mid(10) == QByteArray("a.png"));
    }
    SECTION("SPI content type")
    {
        MOTHeader header(0, int(DabMotContentType::SPI), int(DabMotContentSubType::SPIProgrammeInformation));
        REQUIRE(header.headerSize() == 7);
        REQUIRE(uint8_t(header.data().at(4)) == 0x03);
        REQUIRE(uint8_t(header.data().at(5)) == 0x8E);
        REQUIRE(uint8_t(header.data().at(6)) == 0x01);
    }
}

TEST_CASE("MOT parameter length indicator", "[mot]")
{
    REQUIRE(MOTHeader::encodeParameter(0x05, QByteArray()) == QByteArray("\x05", 1));
    REQUIRE(MOTHeader::encodeParameter(0x0A, QByteArray(1, char(0x07))) == QByteArray("\x4A\x07", 2));

    QByteArray time("\xC7\x40\x01\x80", 4);
    REQUIRE(MOTHeader::encodeParameter(int(DabSPIParameter::ScopeStart), time) == QByteArray("\xA5", 1) + time);

    QByteArray scopeId("\xE1\x12\x34", 3);
    REQUIRE(MOTHeader::encodeParameter(int(DabSPIParameter::ScopeID), scopeId) == QByteArray("\xE7\x03", 2) + scopeId);

    QByteArray longField(200, char(0x55));
    QByteArray param = MOTHeader::encodeParameter(0x0C, longField);
    REQUIRE(param.size() == 203);
    REQUIRE(uint8_t(param.at(0)) == 0xCC);
    REQUIRE(uint8_t(param.at(1)) == 0x80);
    REQUIRE(uint8_t(param.at(2)) == 200);
}

TEST_CASE("MOT directory carousel", "[mot]")
{
    AssembledObject logo = object("a.png", 2500, DabMotContentType::Image, int(DabMotContentSubType::ImagePNG));
    AssembledObject pi = object("b.bin", 10, DabMotContentType::SPI, int(DabMotContentSubType::SPIProgrammeInformation));
    pi.addParameter(DabSPIParameter::ScopeStart, QByteArray("\xC7\x40\x01\x80", 4));
    pi.addParameter(DabSPIParameter::ScopeID, QByteArray("\xE1\x12\x34", 3));

    MOTEncoder encoder;
    QList<QByteArray> dataGroups = encoder.encodeDirectory({ logo, pi }, QList<AssembledParameter>());

    // directory, 3 logo segments, 1 PI segment
    REQUIRE(dataGroups.size() == 5);

    QList<MSCDataGroup> parsed;
    for (const QByteArray & dataGroup : dataGroups)
    {
        MSCDataGroup dg(dataGroup);
        REQUIRE(dg.isValid());
        REQUIRE(dg.hasCrc());
        REQUIRE(dg.getRepetitionIdx() == 0);
        parsed.append(dg);
    }

    SECTION("directory comes first")
    {
        const MSCDataGroup & dir = parsed.at(0);
        REQUIRE(dir.getType() == uint8_t(DabMscDataGroupType::MOTDirectory));
        REQUIRE(dir.getTransportId() == 1);
        REQUIRE(dir.getSegmentNum() == 0);
        REQUIRE(dir.getLastFlag());
        REQUIRE(dir.getContinuityIdx() == 0);

        QByteArray directory = segmentData(dir);
        // 13 byte header, TID + 15 byte header, TID + 25 byte header
        REQUIRE(directory.size() == 57);
        REQUIRE(directory.left(4) == QByteArray("\x00\x00\x00\x39", 4));
        REQUIRE(directory.mid(4, 2) == QByteArray("\x00\x02", 2));
        REQUIRE(directory.mid(6, 3) == QByteArray(3, char(0x00)));
        REQUIRE(directory.mid(9, 2) == QByteArray("\x04\x00", 2));
        REQUIRE(directory.mid(11, 2) == QByteArray(2, char(0x00)));

        REQUIRE(directory.mid(13, 2) == QByteArray("\x00\x02", 2));
        REQUIRE(directory.mid(15, 15) == MOTEncoder::objectHeader(logo).data());
        REQUIRE(directory.mid(30, 2) == QByteArray("\x00\x03", 2));
        REQUIRE(directory.mid(32) == MOTEncoder::objectHeader(pi).data());
        REQUIRE(MOTEncoder::objectHeader(pi).headerSize() == 25);
    }

    SECTION("bodies are segmented in object order")
    {
        QByteArray body;
        for (int n = 1; n <= 3; ++n)
        {
            const MSCDataGroup & dg = parsed.at(n);
            REQUIRE(dg.getType() == uint8_t(DabMscDataGroupType::MOTBody));
            REQUIRE(dg.getTransportId() == 2);
            REQUIRE(dg.getSegmentNum() == n - 1);
            REQUIRE(dg.getLastFlag() == (3 == n));
            REQUIRE(dg.getContinuityIdx() == n - 1);
            body.append(segmentData(dg));
        }
        REQUIRE(segmentData(parsed.at(1)).size() == 1024);
        REQUIRE(segmentData(parsed.at(3)).size() == 452);
        REQUIRE(body == logo.data);

        const MSCDataGroup & last = parsed.at(4);
        REQUIRE(last.getTransportId() == 3);
        REQUIRE(last.getSegmentNum() == 0);
        REQUIRE(last.getLastFlag());
        REQUIRE(last.getContinuityIdx() == 3);
        REQUIRE(segmentData(last) == pi.data);
    }
}

TEST_CASE("Directory header extension", "[mot]")
{
    MOTEncoder encoder(512, 100, 30);
    // SortedHeaderInformation, no data field
    QList<AssembledParameter> headerParameters = { { 0x00, QByteArray() } };
    QList<QByteArray> dataGroups = encoder.encodeDirectory({ object("x", 1, DabMotContentType::SPI, 0) }, headerParameters);
    REQUIRE(dataGroups.size() == 2);

    MSCDataGroup dir(dataGroups.at(0));
    REQUIRE(dir.isValid());
    REQUIRE(dir.getTransportId() == 100);
    QByteArray directory = segmentData(dir);
    REQUIRE(directory.mid(6, 3) == QByteArray("\x00\x00\x1E", 3));
    REQUIRE(directory.mid(9, 2) == QByteArray("\x02\x00", 2));
    REQUIRE(directory.mid(11, 2) == QByteArray("\x00\x01", 2));
    REQUIRE(uint8_t(directory.at(13)) == 0x00);

    REQUIRE(MSCDataGroup(dataGroups.at(1)).getTransportId() == 101);
}

TEST_CASE("Corrupted data group is rejected", "[mot]")
{
    QByteArray dataGroup = MSCDataGroup::encode(4, 0, 0, 0, true, 7, QByteArray("payload"));
    REQUIRE(MSCDataGroup(dataGroup).isValid());

    dataGroup[8] = char(dataGroup.at(8) ^ 0x01);
    REQUIRE_FALSE(MSCDataGroup(dataGroup).isValid());
}
