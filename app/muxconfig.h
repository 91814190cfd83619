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

#ifndef MUXCONFIG_H
#define MUXCONFIG_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <iosfwd>

#include "dabbearer.h"
#include "spidocument.h"

// Ensemble and service list of ODR-DabMux configuration (INFO format)
class MuxConfig
{
public:
    bool load(const QString & fileName);
    bool loadFromData(const QByteArray & info);

    uint8_t ecc() const { return m_ecc; }
    uint16_t eid() const { return m_eid; }
    const QString & label() const { return m_label; }
    const QString & shortLabel() const { return m_shortLabel; }
    const QList<DabBearer> & bearers() const { return m_bearers; }

    SPIEnsembleContext ensembleContext() const;

private:
    uint8_t m_ecc = 0;
    uint16_t m_eid = 0;
    QString m_label;
    QString m_shortLabel;
    QList<DabBearer> m_bearers;

    bool parse(std::istream & stream, const QString & source);
};

#endif // MUXCONFIG_H
