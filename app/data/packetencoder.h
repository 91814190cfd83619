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

#ifndef PACKETENCODER_H
#define PACKETENCODER_H

#include <QByteArray>
#include <QList>

// ETSI EN 300 401 V2.1.1 [5.3.2] packet mode
class PacketEncoder
{
public:
    PacketEncoder();

    static bool isValidPacketSize(int packetSize);

    // Each data group starts a new packet sequence (first flag set).
    // With padding every packet has packetSize bytes, otherwise last packet
    // of a data group uses the smallest size the remaining data fits in.
    QList<QByteArray> encodeTransportPackets(const QList<QByteArray> & dataGroups, uint16_t address, int packetSize, bool padding);

    static QByteArray packet(const QByteArray & usefulData, int packetSize, uint8_t continuityIdx,
                             bool first, bool last, uint16_t address);

private:
    uint8_t m_continuityIdx;
};

#endif // PACKETENCODER_H
