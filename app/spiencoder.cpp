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
#include <QStringList>

#include "spiencoder.h"
#include "dabtables.h"

Q_LOGGING_CATEGORY(spiEncoder, "SPIEncoder", QtInfoMsg)

QByteArray SPIEncoder::encodeServiceInformation(const SPIServiceInformation &si, const SPIEnsembleContext &ensemble)
{
    QByteArray value;
    if (si.version >= 0)
    {
        value.append(attribute_uint16(uint8_t(SPIElement::serviceInformation::attribute::version), si.version));
    }
    if (si.creationTime.isValid())
    {
        value.append(attribute_timePoint(uint8_t(SPIElement::serviceInformation::attribute::creationTime), si.creationTime));
    }
    if (!si.originator.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::serviceInformation::attribute::originator), si.originator));
    }
    if (!si.serviceProvider.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::serviceInformation::attribute::serviceProvider), si.serviceProvider));
    }

    // ETSI TS 102 371 V3.2.1 [4.7.2] ensemble id: ECC (8 bits) + EId (16 bits)
    QByteArray ensembleValue;
    QByteArray id;
    id.append(char(ensemble.ecc));
    id.append(char(ensemble.eid >> 8));
    id.append(char(ensemble.eid & 0xFF));
    ensembleValue.append(element(uint8_t(SPIElement::ensemble::attribute::id), id));
    if (!ensemble.shortName.isEmpty())
    {
        ensembleValue.append(encodeText(SPIElement::Tag::shortName, SPIText{ensemble.shortName, QString()}));
    }
    if (!ensemble.longName.isEmpty())
    {
        ensembleValue.append(encodeText(SPIElement::Tag::longName, SPIText{ensemble.longName, QString()}));
    }
    for (const SPIService & service : si.services)
    {
        ensembleValue.append(encodeService(service));
    }
    value.append(element(uint8_t(SPIElement::Tag::ensemble), ensembleValue));

    qCDebug(spiEncoder) << "SI encoded:" << si.services.size() << "services";

    return element(uint8_t(SPIElement::Tag::serviceInformation), value);
}

QByteArray SPIEncoder::encodeProgrammeInformation(const SPIProgrammeInformation &pi)
{
    QByteArray value;
    for (const SPISchedule & schedule : pi.schedules)
    {
        value.append(encodeSchedule(schedule));
    }
    return element(uint8_t(SPIElement::Tag::epg), value);
}

QByteArray SPIEncoder::element(uint8_t tag, const QByteArray &value)
{
    QByteArray out;
    out.append(char(tag));

    int len = value.size();
    if (len < 0xFE)
    {
        out.append(char(len));
    }
    else if (len <= 0xFFFF)
    {   // ETSI TS 102 371 V3.2.1 [4.4] extended length 16 bits
        out.append(char(0xFE));
        out.append(char((len >> 8) & 0xFF));
        out.append(char(len & 0xFF));
    }
    else
    {   // extended length 24 bits
        out.append(char(0xFF));
        out.append(char((len >> 16) & 0xFF));
        out.append(char((len >> 8) & 0xFF));
        out.append(char(len & 0xFF));
    }
    out.append(value);
    return out;
}

QByteArray SPIEncoder::genreHref(const QString &href)
{   // example: <genre href="urn:tva:metadata:ContentCS:2010:3.6.9">
    // ETSI TS 102 371 V3.2.1 [4.7.8] CS (4 bits) followed by up to 3 levels
    QString term = href.section(':', -1);
    QStringList levels = term.split('.', Qt::SkipEmptyParts);
    if (levels.isEmpty())
    {
        return QByteArray();
    }

    bool ok = false;
    int cs = levels.at(0).toInt(&ok);
    if (!ok || (cs < 1) || (cs > 8))
    {
        return QByteArray();
    }

    QByteArray out;
    out.append(char(cs & 0x0F));
    for (int n = 1; (n < levels.size()) && (n < 4); ++n)
    {
        int level = levels.at(n).toInt(&ok);
        if (!ok || (level < 0) || (level > 255))
        {
            return QByteArray();
        }
        out.append(char(level));
    }
    return out;
}

QByteArray SPIEncoder::encodeService(const SPIService &service)
{
    QByteArray value;
    if (service.version >= 0)
    {
        value.append(attribute_uint16(uint8_t(SPIElement::service::attribute::version), service.version));
    }
    for (const SPIText & name : service.shortNames)
    {
        value.append(encodeText(SPIElement::Tag::shortName, name));
    }
    for (const SPIText & name : service.mediumNames)
    {
        value.append(encodeText(SPIElement::Tag::mediumName, name));
    }
    for (const SPIText & name : service.longNames)
    {
        value.append(encodeText(SPIElement::Tag::longName, name));
    }

    SPIMediaDescription mediaDescription;
    mediaDescription.shortDescriptions = service.shortDescriptions;
    mediaDescription.longDescriptions = service.longDescriptions;
    mediaDescription.multimedia = service.mediaItems;
    value.append(encodeMediaDescription(mediaDescription));

    for (const SPIGenre & genre : service.genres)
    {
        value.append(encodeGenre(genre));
    }
    for (const SPIText & keywords : service.keywords)
    {
        value.append(encodeText(SPIElement::Tag::keywords, keywords));
    }
    for (const SPILink & link : service.links)
    {
        value.append(encodeLink(link));
    }
    for (const DabBearer & bearer : service.bearers)
    {
        value.append(encodeBearer(SPIElement::Tag::bearer, bearer));
    }
    if (!service.radiodnsFqdn.isEmpty())
    {
        QByteArray radiodns;
        radiodns.append(attribute_string(uint8_t(SPIElement::radiodns::attribute::fqdn), service.radiodnsFqdn));
        radiodns.append(attribute_string(uint8_t(SPIElement::radiodns::attribute::serviceIdentifier), service.radiodnsServiceIdentifier));
        value.append(element(uint8_t(SPIElement::Tag::radiodns), radiodns));
    }

    return element(uint8_t(SPIElement::Tag::service), value);
}

QByteArray SPIEncoder::encodeSchedule(const SPISchedule &schedule)
{
    QByteArray value;
    if (schedule.version >= 0)
    {
        value.append(attribute_uint16(uint8_t(SPIElement::schedule::attribute::version), schedule.version));
    }
    if (schedule.creationTime.isValid())
    {
        value.append(attribute_timePoint(uint8_t(SPIElement::schedule::attribute::creationTime), schedule.creationTime));
    }
    if (!schedule.originator.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::schedule::attribute::originator), schedule.originator));
    }

    if (schedule.scope.start.isValid() || schedule.scope.stop.isValid() || !schedule.scope.serviceScopes.isEmpty())
    {
        QByteArray scope;
        if (schedule.scope.start.isValid())
        {
            scope.append(attribute_timePoint(uint8_t(SPIElement::scope::attribute::startTime), schedule.scope.start));
        }
        if (schedule.scope.stop.isValid())
        {
            scope.append(attribute_timePoint(uint8_t(SPIElement::scope::attribute::stopTime), schedule.scope.stop));
        }
        for (const DabBearer & bearer : schedule.scope.serviceScopes)
        {
            scope.append(encodeBearer(SPIElement::Tag::serviceScope, bearer));
        }
        value.append(element(uint8_t(SPIElement::Tag::scope), scope));
    }

    for (const SPIProgramme & programme : schedule.programmes)
    {
        value.append(encodeProgramme(programme));
    }

    return element(uint8_t(SPIElement::Tag::schedule), value);
}

QByteArray SPIEncoder::encodeProgramme(const SPIProgramme &programme)
{
    QByteArray value;
    if (!programme.id.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::programme::attribute::id), programme.id));
    }
    value.append(attribute_uint24(uint8_t(SPIElement::programme::attribute::shortId), programme.shortId));
    if (programme.version >= 0)
    {
        value.append(attribute_uint16(uint8_t(SPIElement::programme::attribute::version), programme.version));
    }
    if ("no" == programme.recommendation)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::programme::attribute::recommendation), 0x01));
    }
    else if ("yes" == programme.recommendation)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::programme::attribute::recommendation), 0x02));
    }
    else { /* default */ }
    if ("on-air" == programme.broadcast)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::programme::attribute::broadcast), 0x01));
    }
    else if ("off-air" == programme.broadcast)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::programme::attribute::broadcast), 0x02));
    }
    else { /* default */ }
    if (!programme.lang.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::programme::attribute::xml_lang), programme.lang));
    }

    for (const SPIText & name : programme.shortNames)
    {
        value.append(encodeText(SPIElement::Tag::shortName, name));
    }
    for (const SPIText & name : programme.mediumNames)
    {
        value.append(encodeText(SPIElement::Tag::mediumName, name));
    }
    for (const SPIText & name : programme.longNames)
    {
        value.append(encodeText(SPIElement::Tag::longName, name));
    }
    for (const SPILocation & location : programme.locations)
    {
        value.append(encodeLocation(location));
    }
    value.append(encodeMediaDescription(programme.mediaDescription));
    for (const SPIGenre & genre : programme.genres)
    {
        value.append(encodeGenre(genre));
    }
    for (const SPIText & keywords : programme.keywords)
    {
        value.append(encodeText(SPIElement::Tag::keywords, keywords));
    }
    for (const SPILink & link : programme.links)
    {
        value.append(encodeLink(link));
    }

    return element(uint8_t(SPIElement::Tag::programme), value);
}

QByteArray SPIEncoder::encodeLocation(const SPILocation &location)
{
    QByteArray value;
    for (const SPITime & time : location.times)
    {
        QByteArray timeValue;
        if (time.time.isValid())
        {
            timeValue.append(attribute_timePoint(uint8_t(SPIElement::time::attribute::time), time.time));
        }
        if (time.durationSec >= 0)
        {
            timeValue.append(attribute_uint16(uint8_t(SPIElement::time::attribute::duration), qMin(time.durationSec, 0xFFFF)));
        }
        if (time.actualTime.isValid())
        {
            timeValue.append(attribute_timePoint(uint8_t(SPIElement::time::attribute::actualTime), time.actualTime));
        }
        if (time.actualDurationSec >= 0)
        {
            timeValue.append(attribute_uint16(uint8_t(SPIElement::time::attribute::actualDuration), qMin(time.actualDurationSec, 0xFFFF)));
        }
        value.append(element(uint8_t(SPIElement::Tag::time), timeValue));
    }
    for (const DabBearer & bearer : location.bearers)
    {
        value.append(encodeBearer(SPIElement::Tag::bearer, bearer));
    }
    return element(uint8_t(SPIElement::Tag::location), value);
}

QByteArray SPIEncoder::encodeText(SPIElement::Tag tag, const SPIText &text)
{
    QByteArray value;
    if (!text.lang.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::text::attribute::xml_lang), text.lang));
    }
    value.append(element(uint8_t(SPIElement::Tag::CDATA), text.text.toUtf8()));
    return element(uint8_t(tag), value);
}

QByteArray SPIEncoder::encodeMediaDescription(const SPIMediaDescription &mediaDescription)
{   // ETSI TS 102 371 V3.2.1 [4.6.6] each mediaDescription carries exactly one child
    QByteArray out;
    for (const SPIText & description : mediaDescription.shortDescriptions)
    {
        out.append(element(uint8_t(SPIElement::Tag::mediaDescription), encodeText(SPIElement::Tag::shortDescription, description)));
    }
    for (const SPIText & description : mediaDescription.longDescriptions)
    {
        out.append(element(uint8_t(SPIElement::Tag::mediaDescription), encodeText(SPIElement::Tag::longDescription, description)));
    }
    for (const SPIMultimedia & multimedia : mediaDescription.multimedia)
    {
        out.append(element(uint8_t(SPIElement::Tag::mediaDescription), encodeMultimedia(multimedia)));
    }
    return out;
}

QByteArray SPIEncoder::encodeMultimedia(const SPIMultimedia &multimedia)
{
    QByteArray value;
    if (!multimedia.mimeValue.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::multimedia::attribute::mimeValue), multimedia.mimeValue));
    }
    if (!multimedia.lang.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::multimedia::attribute::xml_lang), multimedia.lang));
    }
    value.append(attribute_string(uint8_t(SPIElement::multimedia::attribute::url), multimedia.url));
    switch (multimedia.type)
    {
    case SPIMultimedia::Type::Unrestricted:
        value.append(attribute_uint8(uint8_t(SPIElement::multimedia::attribute::type), 0x02));
        break;
    case SPIMultimedia::Type::SquareLogo:
        value.append(attribute_uint8(uint8_t(SPIElement::multimedia::attribute::type), 0x04));
        break;
    case SPIMultimedia::Type::RectangleLogo:
        value.append(attribute_uint8(uint8_t(SPIElement::multimedia::attribute::type), 0x06));
        break;
    case SPIMultimedia::Type::Unknown:
        break;
    }
    if (SPIMultimedia::Type::Unrestricted == multimedia.type)
    {   // width and height are implicit for square and rectangle logos
        value.append(attribute_uint16(uint8_t(SPIElement::multimedia::attribute::width), multimedia.width));
        value.append(attribute_uint16(uint8_t(SPIElement::multimedia::attribute::height), multimedia.height));
    }
    return element(uint8_t(SPIElement::Tag::multimedia), value);
}

QByteArray SPIEncoder::encodeGenre(const SPIGenre &genre)
{
    QByteArray value;
    QByteArray href = genreHref(genre.href);
    if (href.isEmpty())
    {
        qCDebug(spiEncoder) << "Genre not encoded:" << genre.href;
        return QByteArray();
    }
    value.append(element(uint8_t(SPIElement::genre::attribute::href), href));
    if ("main" == genre.type)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::genre::attribute::type), 0x01));
    }
    else if ("secondary" == genre.type)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::genre::attribute::type), 0x02));
    }
    else if ("other" == genre.type)
    {
        value.append(attribute_uint8(uint8_t(SPIElement::genre::attribute::type), 0x03));
    }
    else { /* main is default */ }
    if (!genre.name.isEmpty())
    {
        value.append(element(uint8_t(SPIElement::Tag::CDATA), genre.name.toUtf8()));
    }
    return element(uint8_t(SPIElement::Tag::genre), value);
}

QByteArray SPIEncoder::encodeLink(const SPILink &link)
{
    QByteArray value;
    value.append(attribute_string(uint8_t(SPIElement::link::attribute::uri), link.uri));
    if (!link.mimeValue.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::link::attribute::mimeValue), link.mimeValue));
    }
    if (!link.lang.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::link::attribute::xml_lang), link.lang));
    }
    if (!link.description.isEmpty())
    {
        value.append(attribute_string(uint8_t(SPIElement::link::attribute::description), link.description));
    }
    return element(uint8_t(SPIElement::Tag::link), value);
}

QByteArray SPIEncoder::encodeBearer(SPIElement::Tag tag, const DabBearer &bearer)
{   // bearer and serviceScope both carry the id as attribute 0x80
    return element(uint8_t(tag), element(uint8_t(SPIElement::bearer::attribute::id), bearer.toBinary()));
}

QByteArray SPIEncoder::attribute_string(uint8_t tag, const QString &value)
{
    return element(tag, value.toUtf8());
}

QByteArray SPIEncoder::attribute_uint8(uint8_t tag, uint8_t value)
{
    return element(tag, QByteArray(1, char(value)));
}

QByteArray SPIEncoder::attribute_uint16(uint8_t tag, uint16_t value)
{
    QByteArray data;
    data.append(char(value >> 8));
    data.append(char(value & 0xFF));
    return element(tag, data);
}

QByteArray SPIEncoder::attribute_uint24(uint8_t tag, uint32_t value)
{
    QByteArray data;
    data.append(char((value >> 16) & 0xFF));
    data.append(char((value >> 8) & 0xFF));
    data.append(char(value & 0xFF));
    return element(tag, data);
}

QByteArray SPIEncoder::attribute_timePoint(uint8_t tag, const QDateTime &time)
{
    QDateTime utc = time.toUTC();
    bool longForm = (0 != utc.time().second()) || (0 != utc.time().msec());
    return element(tag, DabTables::utcToDabTime(utc, longForm));
}
