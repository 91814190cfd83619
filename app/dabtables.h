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

#ifndef DABTABLES_H
#define DABTABLES_H

#include <QByteArray>
#include <QDateTime>

enum class DabCharset
{
    UTF8 = 0xF,      // [ETSI TS 101 756 V2.4.1 Table 1 & 19]
};

// ETSI EN 301 234 V2.1.1 [6.2] MOT parameters
enum class DabMotExtParameter
{
    ContentName = 0x0C,
};

// ETSI TS 102 371 V3.2.1 (2016-05) [6.4 MOT parameters]
enum class DabSPIParameter
{
    ScopeStart = 0x25,
    ScopeEnd = 0x26,
    ScopeID = 0x27,
};

// ETSI EN 300 401 V2.1.1 [5.3.3.1] data group types used by MOT
enum class DabMscDataGroupType
{
    MOTBody = 4,
    MOTDirectory = 6,
};

// ETSI TS 101 756 V2.4.1 table 17 and ETSI TS 102 371 [6.1]
enum class DabMotContentType
{
    Image = 2,
    SPI = 7,
};

enum class DabMotContentSubType
{
    ImagePNG = 3,
    SPIServiceInformation = 0,
    SPIProgrammeInformation = 1,
};

class DabTables
{
public:
    // ETSI EN 300 401 [5.3.3.4] CRC, returned already complemented as transmitted
    static uint16_t crc16(const char *data, int size);
    static uint16_t crc16(const QByteArray &data) { return crc16(data.constData(), data.size()); }

    // ETSI TS 102 371 V3.2.1 [4.7.4] timePoint, UTC, no LTO
    static QByteArray utcToDabTime(const QDateTime &time, bool longForm);
};

#endif  // DABTABLES_H
