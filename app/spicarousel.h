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

#ifndef SPICAROUSEL_H
#define SPICAROUSEL_H

#include <QByteArray>
#include <QList>
#include <QString>

#include "assembledobject.h"
#include "carouselcontext.h"
#include "discovery.h"
#include "networktransport.h"

struct CarouselOutput
{
    QString fileName = "output.dat";
    bool directoryOnly = false;     // MSC data groups instead of packets
    int packetSize = 96;
    uint16_t address = 1;
    bool padding = true;
};

// One run: discovery responses in, carousel bitstream out
class SPICarousel
{
public:
    enum ExitCode
    {
        EXIT_OK = 0,
        EXIT_INVALID_INPUT = 1,
        EXIT_NO_SERVICES = 2,
        EXIT_WRITE_FAILED = 3,
    };

    SPICarousel(const CarouselContext & context, NetworkTransport * transport);

    // false when no service was found
    bool assemble(const QList<DiscoveryResponse> & responses, QList<AssembledObject> & objects) const;
    static QList<QByteArray> encode(const QList<AssembledObject> & objects, const CarouselOutput & output);
    static bool write(const QString & fileName, const QList<QByteArray> & chunks);

    ExitCode run(const QList<DiscoveryResponse> & responses, const CarouselOutput & output) const;

private:
    const CarouselContext & m_context;
    NetworkTransport * m_transport;
};

#endif // SPICAROUSEL_H
