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

#ifndef MSCDATAGROUP_H
#define MSCDATAGROUP_H

#include <QByteArray>

// ETSI EN 300 401 [5.3.3] MSC data group
class MSCDataGroup
{
public:
    explicit MSCDataGroup(const QByteArray &dataGroup);

    // data group with CRC, segment field and user access field carrying transport ID
    static QByteArray encode(uint8_t type, uint8_t continuityIdx, uint8_t repetitionIdx,
                             uint16_t segmentNum, bool lastFlag, uint16_t transportId,
                             const QByteArray & dataField);

    const QByteArray & getDataField() const;
    uint8_t getType() const;
    uint8_t getContinuityIdx() const;
    uint8_t getRepetitionIdx() const;
    uint16_t getSegmentNum() const;
    uint16_t getTransportId() const;
    bool getLastFlag() const;
    bool hasCrc() const;
    bool isValid() const;

private:
    bool m_isValid = false;
    bool m_extensionFlag = false;
    bool m_crcFlag = false;
    bool m_segmentFlag = false;
    bool m_userAccessFlag = false;
    uint8_t m_type = 0;
    uint8_t m_continuityIdx = 0;
    uint8_t m_repetitionIdx = 0;
    uint16_t m_extensionField = 0;
    bool m_lastFlag = false;
    uint16_t m_segmentNum = 0;
    bool m_transportIdFlag = false;
    uint8_t m_lengthIndicator = 0;
    uint16_t m_transportId = 0;
    QByteArray m_endUserAddrField;
    QByteArray m_dataField;
};

#endif  // MSCDATAGROUP_H
