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

#ifndef IMAGENORMALIZER_H
#define IMAGENORMALIZER_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSize>

#include "assembledobject.h"
#include "sourcefetcher.h"
#include "spidocument.h"

class QImage;

class ImageNormalizer
{
public:
    ImageNormalizer(const SourceFetcher & fetcher, int sizeThreshold);

    // Returns copy of service with media list replaced by the packaged logos,
    // one object per logo is appended to objects.
    // Logo names are unique per service for the lifetime of the normalizer.
    SPIService normalize(const SPIService & service, QList<AssembledObject> & objects);

    static bool isAccepted(const SPIMultimedia & multimedia);
    static QSize canonicalSize(const SPIMultimedia & multimedia);
    static SPIMultimedia::Type classify(const QSize & size);
    // withServiceId adds SId to the name stem
    static QString logoName(const SPIService & service, int counter, const QSize & size, bool withServiceId = false);

    // PNG of requested size, recompressed if larger than sizeThreshold
    static bool normalizeImage(const QByteArray & data, const QSize & size, int sizeThreshold, QByteArray & png);
    static QByteArray recompress(const QImage & image);

private:
    const SourceFetcher & m_fetcher;
    int m_sizeThreshold;
    QHash<QString, QString> m_nameOwner;   // logo name -> service key

    static QString serviceKey(const SPIService & service);
};

#endif // IMAGENORMALIZER_H
