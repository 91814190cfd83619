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

#include "dabtables.h"

uint16_t DabTables::crc16(const char *data, int size)
{
    uint16_t crc = 0xFFFF;
    uint16_t mask = 0x1020;

    for (int n = 0; n < size; ++n)
    {
        for (int bit = 7; bit >= 0; --bit)
        {
            uint16_t in = (data[n] >> bit) & 0x1;
            uint16_t tmp = in ^ ((crc>>15) & 0x1);
            crc <<= 1;

            crc ^= (tmp * mask);
            crc += tmp;
        }
    }

    return uint16_t(~crc);
}

QByteArray DabTables::utcToDabTime(const QDateTime &time, bool longForm)
{
    QDateTime utc = time.toUTC();

    // MJD 0 is 17.11.1858
    uint32_t mjd = uint32_t(utc.date().toJulianDay() - 2400001);

    uint32_t dateHoursMinutes = (mjd & 0x1FFFF) << 14;
    if (longForm)
    {   // UTC flag
        dateHoursMinutes |= (1 << 11);
    }
    else { /* short form */ }
    dateHoursMinutes |= (utc.time().hour() & 0x1F) << 6;
    dateHoursMinutes |= (utc.time().minute() & 0x3F);

    QByteArray data;
    data.append(char((dateHoursMinutes >> 24) & 0xFF));
    data.append(char((dateHoursMinutes >> 16) & 0xFF));
    data.append(char((dateHoursMinutes >> 8) & 0xFF));
    data.append(char(dateHoursMinutes & 0xFF));

    if (longForm)
    {
        uint16_t secMsec = ((utc.time().second() & 0x3F) << 10) | (utc.time().msec() & 0x3FF);
        data.append(char((secMsec >> 8) & 0xFF));
        data.append(char(secMsec & 0xFF));
    }
    else { /* short form */ }

    return data;
}
