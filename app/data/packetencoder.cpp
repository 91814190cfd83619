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

#include "packetencoder.h"
#include "dabtables.h"

Q_LOGGING_CATEGORY(packetEncoder, "PacketEncoder", QtInfoMsg)

namespace
{
// packet header (3 bytes) + CRC (2 bytes)
const int packetOverhead = 5;
const int packetSizes[] = { 24, 48, 72, 96 };
}

PacketEncoder::PacketEncoder()
    : m_continuityIdx(0)
{}

bool PacketEncoder::isValidPacketSize(int packetSize)
{
    for (int size : packetSizes)
    {
        if (size == packetSize)
        {
            return true;
        }
    }
    return false;
}

QList<QByteArray> PacketEncoder::encodeTransportPackets(const QList<QByteArray> &dataGroups, uint16_t address, int packetSize, bool padding)
{
    QList<QByteArray> packets;
    if (!isValidPacketSize(packetSize))
    {
        qCWarning(packetEncoder) << "Invalid packet size" << packetSize;
        return packets;
    }

    for (const QByteArray & dataGroup : dataGroups)
    {
        int pos = 0;
        while (pos < dataGroup.size())
        {
            int remaining = dataGroup.size() - pos;
            int size = packetSize;
            if (!padding && (remaining <= packetSize - packetOverhead))
            {   // smallest packet the rest fits in
                for (int candidate : packetSizes)
                {
                    if (remaining <= candidate - packetOverhead)
                    {
                        size = candidate;
                        break;
                    }
                }
            }

            QByteArray usefulData = dataGroup.mid(pos, size - packetOverhead);
            bool first = (0 == pos);
            pos += usefulData.size();
            bool last = (pos >= dataGroup.size());

            packets.append(packet(usefulData, size, m_continuityIdx, first, last, address));
            m_continuityIdx = (m_continuityIdx + 1) % 4;
        }
    }

    qCInfo(packetEncoder) << "Encoded" << dataGroups.size() << "data groups into" << packets.size() << "packets, address" << address;
    return packets;
}

QByteArray PacketEncoder::packet(const QByteArray &usefulData, int packetSize, uint8_t continuityIdx,
                                 bool first, bool last, uint16_t address)
{
    uint8_t lengthCode = 0;
    switch (packetSize)
    {
    case 24: lengthCode = 0; break;
    case 48: lengthCode = 1; break;
    case 72: lengthCode = 2; break;
    default: lengthCode = 3; break;
    }

    QByteArray packet;
    packet.reserve(packetSize);

    // Packet length (2) | Continuity index (2) | First/Last (2) | Address (10) | Command (1) | Useful data length (7)
    packet.append(char((lengthCode << 6) | ((continuityIdx & 0x03) << 4) | (first ? 0x08 : 0x00) | (last ? 0x04 : 0x00)
                       | ((address >> 8) & 0x03)));
    packet.append(char(address & 0xFF));
    packet.append(char(usefulData.size() & 0x7F));
    packet.append(usefulData);

    // padding
    packet.append(QByteArray(packetSize - packetOverhead - usefulData.size(), char(0x00)));

    uint16_t crc = DabTables::crc16(packet);
    packet.append(char(crc >> 8));
    packet.append(char(crc & 0xFF));

    return packet;
}
