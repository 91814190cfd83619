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

#include "mscdatagroup.h"
#include "dabtables.h"

Q_LOGGING_CATEGORY(mscDataGroup, "MSCDataGroup", QtInfoMsg)

MSCDataGroup::MSCDataGroup(const QByteArray &dataGroup)
{
    m_isValid = false;
    if (dataGroup.size() < 2)
    {  // no data
        return;
    }
    else
    { /* data available */ }

    // some data available => first check header
    const uint8_t * inputDataPtr = (const uint8_t *) dataGroup.constBegin();
    const uint8_t * endPtr = inputDataPtr + dataGroup.size();
    m_crcFlag = (*inputDataPtr & 0x40) != 0;
    if (m_crcFlag)  // bit 6
    {   // if CRC present, do check CRC16 according to [ETSI EN 300 401, 5.3.3.4]
        if (dataGroup.size() < 4)
        {
            return;
        }
        uint16_t txCRC = (uint16_t(uint8_t(dataGroup.at(dataGroup.size()-2))) << 8) | uint8_t(dataGroup.at(dataGroup.size()-1));
        if (DabTables::crc16(dataGroup.constData(), dataGroup.size()-2) != txCRC)
        {
            qCDebug(mscDataGroup) << "CRC failed";
            return;
        }
        else
        { /* CRC OK */ }
        endPtr -= 2;
    }
    else
    { /* no CRC */ }

    // Data group header [ETSI EN 300 401, 5.3.3.1]
    m_extensionFlag = (*inputDataPtr & 0x80) != 0;    // byte 0, bit 7
    m_segmentFlag = (*inputDataPtr & 0x20) != 0;      // byte 0, bit 5
    m_userAccessFlag = (*inputDataPtr & 0x10) != 0;   // byte 0, bit 4
    m_type = (*inputDataPtr++ & 0x0F);    // byte 0, bits 3-0

    // inputDataPtr->byte 1
    m_continuityIdx = (*inputDataPtr >> 4) & 0x0F; // byte 1, bits 7-4
    m_repetitionIdx = (*inputDataPtr++ & 0x0F);    // byte 1, bits 3-0

    int headerSize = 2 + (m_extensionFlag ? 2 : 0) + (m_segmentFlag ? 2 : 0) + (m_userAccessFlag ? 1 : 0);
    if (endPtr - (const uint8_t *) dataGroup.constBegin() < headerSize)
    {
        return;
    }

    // inputDataPtr->byte 2 (extension field)
    if (m_extensionFlag)
    {   // extension field is present
        m_extensionField = (*inputDataPtr << 8) | *(inputDataPtr+1);
        inputDataPtr += 2;
    }
    else
    { /* extension field is not present */ }

    // Session header [ETSI EN 300 401, 5.3.3.2]
    // inputDataPtr->segment field
    m_lastFlag = false;
    m_segmentNum = 0;
    if (m_segmentFlag)
    {   // segment field is present
        m_lastFlag = (*inputDataPtr & 0x80) != 0;
        m_segmentNum = (*inputDataPtr++ << 8) & 0x7FFF;
        m_segmentNum += *inputDataPtr++;
    }
    else
    { /* no segment field */ }

    m_transportIdFlag = false;
    m_lengthIndicator = 0;
    m_transportId = 0;
    if (m_userAccessFlag)
    {
        m_transportIdFlag = (*inputDataPtr & 0x10) != 0;
        m_lengthIndicator = (*inputDataPtr++ & 0x0F);
        if (endPtr - inputDataPtr < m_lengthIndicator)
        {
            return;
        }
        if (m_transportIdFlag)
        {
            m_transportId = (*inputDataPtr << 8) | *(inputDataPtr+1);
            inputDataPtr += 2;
        }
        else
        { /* transport ID is not present */ }

        if (m_lengthIndicator - m_transportIdFlag * 2 > 0)
        {   // end user address field is present
            m_endUserAddrField = QByteArray((const char *) inputDataPtr, (m_lengthIndicator - m_transportIdFlag * 2));
            inputDataPtr += m_lengthIndicator - m_transportIdFlag * 2;
        }
        else
        {  /* no end user address field */ }
    }
    else
    {  /* no user access field */ }

    // inputDataPtr -> beginning of MSC data group data field
    m_dataField = QByteArray((const char *) inputDataPtr, endPtr - inputDataPtr);

    m_isValid = true;
}

QByteArray MSCDataGroup::encode(uint8_t type, uint8_t continuityIdx, uint8_t repetitionIdx,
                                uint16_t segmentNum, bool lastFlag, uint16_t transportId,
                                const QByteArray &dataField)
{
    QByteArray dataGroup;
    dataGroup.reserve(7 + dataField.size() + 2);

    // Data group header [ETSI EN 300 401, 5.3.3.1]
    // extension flag 0, CRC flag 1, segment flag 1, user access flag 1
    dataGroup.append(char((1 << 6) | (1 << 5) | (1 << 4) | (type & 0x0F)));
    dataGroup.append(char(((continuityIdx & 0x0F) << 4) | (repetitionIdx & 0x0F)));

    // Session header [ETSI EN 300 401, 5.3.3.2]
    dataGroup.append(char((lastFlag ? 0x80 : 0x00) | ((segmentNum >> 8) & 0x7F)));
    dataGroup.append(char(segmentNum & 0xFF));

    // user access: transport ID flag 1, length indicator 2
    dataGroup.append(char((1 << 4) | 2));
    dataGroup.append(char(transportId >> 8));
    dataGroup.append(char(transportId & 0xFF));

    dataGroup.append(dataField);

    uint16_t crc = DabTables::crc16(dataGroup);
    dataGroup.append(char(crc >> 8));
    dataGroup.append(char(crc & 0xFF));

    return dataGroup;
}

const QByteArray &MSCDataGroup::getDataField() const
{
    return m_dataField;
}

uint8_t MSCDataGroup::getType() const
{
    return m_type;
}

uint8_t MSCDataGroup::getContinuityIdx() const
{
    return m_continuityIdx;
}

uint8_t MSCDataGroup::getRepetitionIdx() const
{
    return m_repetitionIdx;
}

uint16_t MSCDataGroup::getSegmentNum() const
{
    return m_segmentNum;
}

uint16_t MSCDataGroup::getTransportId() const
{
    return m_transportId;
}

bool MSCDataGroup::getLastFlag() const
{
    return m_lastFlag;
}

bool MSCDataGroup::hasCrc() const
{
    return m_crcFlag;
}

bool MSCDataGroup::isValid() const
{
    return m_isValid;
}
