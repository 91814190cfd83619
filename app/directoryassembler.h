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

#ifndef DIRECTORYASSEMBLER_H
#define DIRECTORYASSEMBLER_H

#include <QList>

#include "assembledobject.h"
#include "spidocument.h"

class DirectoryAssembler
{
public:
    // Object order: logos and PI as given, SI last.
    // Returns false and leaves result empty when there is no service.
    static bool assemble(const QList<AssembledObject> & objects, const QList<SPIService> & services,
                         const SPIEnsembleContext & ensemble, QList<AssembledObject> & result);

    static AssembledObject serviceInformationObject(const QList<SPIService> & services, const SPIEnsembleContext & ensemble);
};

#endif // DIRECTORYASSEMBLER_H
