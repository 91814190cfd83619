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
#include <QSet>

#include "directoryassembler.h"
#include "spiencoder.h"

Q_LOGGING_CATEGORY(directoryAssembler, "DirectoryAssembler", QtInfoMsg)

bool DirectoryAssembler::assemble(const QList<AssembledObject> &objects, const QList<SPIService> &services,
                                  const SPIEnsembleContext &ensemble, QList<AssembledObject> &result)
{
    result.clear();
    if (services.isEmpty())
    {
        qCCritical(directoryAssembler) << "No services found";
        return false;
    }

    QSet<QString> names;
    for (const AssembledObject & object : objects)
    {
        if (names.contains(object.name))
        {
            qCInfo(directoryAssembler) << "Duplicate object" << object.name << "dropped";
            continue;
        }
        names.insert(object.name);
        result.append(object);
    }

    AssembledObject si = serviceInformationObject(services, ensemble);
    if (names.contains(si.name))
    {   // SI name is reserved
        for (int n = 0; n < result.size(); ++n)
        {
            if (si.name == result.at(n).name)
            {
                qCWarning(directoryAssembler) << "Object" << si.name << "replaced by SI";
                result.removeAt(n);
                break;
            }
        }
    }
    result.append(si);

    qCInfo(directoryAssembler) << "Directory:" << result.size() << "objects," << services.size() << "services";
    return true;
}

AssembledObject DirectoryAssembler::serviceInformationObject(const QList<SPIService> &services, const SPIEnsembleContext &ensemble)
{
    SPIServiceInformation si;
    si.services = services;

    AssembledObject object;
    object.name = "SI.bin";
    object.data = SPIEncoder::encodeServiceInformation(si, ensemble);
    object.contentType = int(DabMotContentType::SPI);
    object.contentSubType = int(DabMotContentSubType::SPIServiceInformation);
    object.addParameter(DabSPIParameter::ScopeID, DabBearer::ensembleScopeId(ensemble.ecc, ensemble.eid));
    return object;
}
