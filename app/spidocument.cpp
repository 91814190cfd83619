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

#include <QDomDocument>
#include <QLoggingCategory>
#include <QRegularExpression>

#include "spidocument.h"

Q_LOGGING_CATEGORY(spiDocument, "SPIDocument", QtInfoMsg)

SPIMultimedia::Type SPIMultimedia::typeFromString(const QString &type)
{
    if ("logo_colour_square" == type)
    {
        return Type::SquareLogo;
    }
    if ("logo_colour_rectangle" == type)
    {
        return Type::RectangleLogo;
    }
    if ("logo_unrestricted" == type)
    {
        return Type::Unrestricted;
    }
    return Type::Unknown;
}

QString SPIService::displayShortName() const
{
    for (const auto & nameList : {shortNames, mediumNames, longNames})
    {
        for (const SPIText & name : nameList)
        {
            if (!name.text.trimmed().isEmpty())
            {
                return name.text.trimmed();
            }
        }
    }
    for (const DabBearer & bearer : bearers)
    {
        if (bearer.isValid())
        {
            return QString("%1").arg(bearer.sid(), 4, 16, QChar('0'));
        }
    }
    return QString("service");
}

bool SPIService::hasBearerIn(const QList<DabBearer> &bearerList) const
{
    for (const DabBearer & bearer : bearers)
    {
        if (bearerList.contains(bearer))
        {
            return true;
        }
    }
    return false;
}

bool SPIDocument::parseServiceInformation(const QByteArray &xml, SPIServiceInformation &si)
{
    QDomDocument xmldocument;
    if (!xmldocument.setContent(xml))
    {
        qCWarning(spiDocument) << "Failed to parse SI document";
        return false;
    }

    QDomElement docElem = xmldocument.documentElement();
    if ("serviceInformation" != docElem.tagName())
    {
        qCWarning(spiDocument) << "Unexpected SI root element:" << docElem.tagName();
        return false;
    }

    si = SPIServiceInformation();
    if (docElem.hasAttribute("version"))
    {
        si.version = docElem.attribute("version").toInt();
    }
    si.creationTime = parseTime(docElem.attribute("creationTime"));
    si.originator = docElem.attribute("originator");
    si.serviceProvider = docElem.attribute("serviceProvider");

    QDomElement element = docElem.firstChildElement();
    while (!element.isNull())
    {   // ETSI TS 102 818 V3.4.1 [6.2]
        // serviceInformation: can contain zero or one of each of the following elements in this order:
        //      services
        //      serviceGroups
        if (("services" == element.tagName()) || ("ensemble" == element.tagName()))
        {
            QDomElement serviceElement = element.firstChildElement("service");
            while (!serviceElement.isNull())
            {
                SPIService service;
                parseService(serviceElement, service);
                si.services.append(service);
                serviceElement = serviceElement.nextSiblingElement("service");
            }
        }
        else
        {
            qCDebug(spiDocument) << "Skipping element" << element.tagName();
        }
        element = element.nextSiblingElement();
    }

    return true;
}

void SPIDocument::parseService(const QDomElement &element, SPIService &service)
{
    if (element.hasAttribute("version"))
    {
        service.version = element.attribute("version").toInt();
    }

    QDomElement child = element.firstChildElement();
    while (!child.isNull())
    {   // ETSI TS 102 818 V3.4.1 [6.5]
        const QString tagName = child.tagName();
        if ("shortName" == tagName)
        {
            service.shortNames.append(parseText(child));
        }
        else if ("mediumName" == tagName)
        {
            service.mediumNames.append(parseText(child));
        }
        else if ("longName" == tagName)
        {
            service.longNames.append(parseText(child));
        }
        else if ("mediaDescription" == tagName)
        {
            SPIMediaDescription mediaDescription;
            parseMediaDescription(child, mediaDescription);
            service.shortDescriptions.append(mediaDescription.shortDescriptions);
            service.longDescriptions.append(mediaDescription.longDescriptions);
            service.mediaItems.append(mediaDescription.multimedia);
        }
        else if ("genre" == tagName)
        {
            service.genres.append(parseGenre(child));
        }
        else if ("keywords" == tagName)
        {
            service.keywords.append(parseText(child));
        }
        else if ("link" == tagName)
        {
            service.links.append(parseLink(child));
        }
        else if ("bearer" == tagName)
        {
            DabBearer bearer = DabBearer::fromUri(child.attribute("id"));
            if (bearer.isValid())
            {
                service.bearers.append(bearer);
            }
            else
            {   // only DAB bearers can be carried
                qCDebug(spiDocument) << "Ignoring bearer" << child.attribute("id");
            }
        }
        else if ("radiodns" == tagName)
        {
            service.radiodnsFqdn = child.attribute("fqdn");
            service.radiodnsServiceIdentifier = child.attribute("serviceIdentifier");
        }
        else
        { /* not carried */ }

        child = child.nextSiblingElement();
    }
}

bool SPIDocument::parseProgrammeInformation(const QByteArray &xml, SPIProgrammeInformation &pi)
{
    QDomDocument xmldocument;
    if (!xmldocument.setContent(xml))
    {
        qCWarning(spiDocument) << "Failed to parse PI document";
        return false;
    }

    QDomElement docElem = xmldocument.documentElement();
    if ("epg" != docElem.tagName())
    {
        qCWarning(spiDocument) << "Unexpected PI root element:" << docElem.tagName();
        return false;
    }

    pi = SPIProgrammeInformation();

    // schedule is either child of epg or of the older programmeSchedule container
    QList<QDomElement> scheduleParents = {docElem};
    QDomElement container = docElem.firstChildElement("programmeSchedule");
    while (!container.isNull())
    {
        scheduleParents.append(container);
        container = container.nextSiblingElement("programmeSchedule");
    }

    bool foundSchedule = false;
    for (const QDomElement & parent : scheduleParents)
    {
        QDomElement scheduleElement = parent.firstChildElement("schedule");
        while (!scheduleElement.isNull())
        {
            foundSchedule = true;
            SPISchedule schedule;
            parseSchedule(scheduleElement, schedule);
            pi.schedules.append(schedule);
            scheduleElement = scheduleElement.nextSiblingElement("schedule");
        }
    }

    if (!foundSchedule)
    {
        qCWarning(spiDocument) << "PI document without schedule";
        return false;
    }

    return true;
}

void SPIDocument::parseSchedule(const QDomElement &element, SPISchedule &schedule)
{
    if (element.hasAttribute("version"))
    {
        schedule.version = element.attribute("version").toInt();
    }
    schedule.creationTime = parseTime(element.attribute("creationTime"));
    schedule.originator = element.attribute("originator");

    QDomElement scope = element.firstChildElement("scope");
    if (!scope.isNull())
    {
        schedule.scope.start = parseTime(scope.attribute("startTime"));
        schedule.scope.stop = parseTime(scope.attribute("stopTime"));
        QDomElement serviceScope = scope.firstChildElement("serviceScope");
        while (!serviceScope.isNull())
        {
            DabBearer bearer = DabBearer::fromUri(serviceScope.attribute("id"));
            if (bearer.isValid())
            {
                schedule.scope.serviceScopes.append(bearer);
            }
            serviceScope = serviceScope.nextSiblingElement("serviceScope");
        }
    }

    QDomElement programmeElement = element.firstChildElement("programme");
    while (!programmeElement.isNull())
    {
        SPIProgramme programme;
        parseProgramme(programmeElement, programme);
        schedule.programmes.append(programme);
        programmeElement = programmeElement.nextSiblingElement("programme");
    }
}

void SPIDocument::parseProgramme(const QDomElement &element, SPIProgramme &programme)
{
    programme.id = element.attribute("id");
    programme.shortId = element.attribute("shortId").toUInt();
    if (element.hasAttribute("version"))
    {
        programme.version = element.attribute("version").toInt();
    }
    programme.recommendation = element.attribute("recommendation");
    programme.broadcast = element.attribute("broadcast");
    programme.lang = element.attribute("xml:lang");

    QDomElement child = element.firstChildElement();
    while (!child.isNull())
    {
        const QString tagName = child.tagName();
        if ("shortName" == tagName)
        {
            programme.shortNames.append(parseText(child));
        }
        else if ("mediumName" == tagName)
        {
            programme.mediumNames.append(parseText(child));
        }
        else if ("longName" == tagName)
        {
            programme.longNames.append(parseText(child));
        }
        else if ("location" == tagName)
        {   // ETSI TS 102 818 V3.3.1 (2020-08) [7.8]
            // The location element may appear zero or more times within a programme or programmeEvent element.
            SPILocation location;
            parseLocation(child, location);
            programme.locations.append(location);
        }
        else if ("mediaDescription" == tagName)
        {
            parseMediaDescription(child, programme.mediaDescription);
        }
        else if ("genre" == tagName)
        {
            programme.genres.append(parseGenre(child));
        }
        else if ("keywords" == tagName)
        {
            programme.keywords.append(parseText(child));
        }
        else if ("link" == tagName)
        {
            programme.links.append(parseLink(child));
        }
        else
        { /* not carried */ }

        child = child.nextSiblingElement();
    }
}

void SPIDocument::parseLocation(const QDomElement &element, SPILocation &location)
{
    QDomElement child = element.firstChildElement();
    while (!child.isNull())
    {
        if ("time" == child.tagName())
        {
            SPITime time;
            time.time = parseTime(child.attribute("time"));
            time.durationSec = parseDuration(child.attribute("duration"));
            time.actualTime = parseTime(child.attribute("actualTime"));
            time.actualDurationSec = parseDuration(child.attribute("actualDuration"));
            location.times.append(time);
        }
        else if ("bearer" == child.tagName())
        {
            DabBearer bearer = DabBearer::fromUri(child.attribute("id"));
            if (bearer.isValid())
            {
                location.bearers.append(bearer);
            }
        }
        child = child.nextSiblingElement();
    }
}

void SPIDocument::parseMediaDescription(const QDomElement &element, SPIMediaDescription &mediaDescription)
{
    QDomElement child = element.firstChildElement();
    while (!child.isNull())
    {
        if ("shortDescription" == child.tagName())
        {
            mediaDescription.shortDescriptions.append(parseText(child));
        }
        else if ("longDescription" == child.tagName())
        {
            mediaDescription.longDescriptions.append(parseText(child));
        }
        else if ("multimedia" == child.tagName())
        {
            mediaDescription.multimedia.append(parseMultimedia(child));
        }
        child = child.nextSiblingElement();
    }
}

SPIText SPIDocument::parseText(const QDomElement &element)
{
    SPIText text;
    text.text = element.text();
    text.lang = element.attribute("xml:lang");
    return text;
}

SPIMultimedia SPIDocument::parseMultimedia(const QDomElement &element)
{
    SPIMultimedia multimedia;
    multimedia.type = SPIMultimedia::typeFromString(element.attribute("type"));
    multimedia.mimeValue = element.attribute("mimeValue");
    multimedia.lang = element.attribute("xml:lang");
    multimedia.url = element.attribute("url");
    multimedia.width = element.attribute("width").toInt();
    multimedia.height = element.attribute("height").toInt();
    return multimedia;
}

SPIGenre SPIDocument::parseGenre(const QDomElement &element)
{
    SPIGenre genre;
    genre.href = element.attribute("href").trimmed();
    genre.type = element.attribute("type");
    genre.name = element.text().trimmed();
    return genre;
}

SPILink SPIDocument::parseLink(const QDomElement &element)
{
    SPILink link;
    link.uri = element.attribute("uri");
    link.mimeValue = element.attribute("mimeValue");
    link.lang = element.attribute("xml:lang");
    link.description = element.attribute("description");
    return link;
}

QDateTime SPIDocument::parseTime(const QString &time)
{
    if (time.isEmpty())
    {
        return QDateTime();
    }

    QDateTime dateTime = QDateTime::fromString(time, Qt::ISODateWithMs);
    if (!dateTime.isValid())
    {
        qCDebug(spiDocument) << "Invalid time" << time;
        return QDateTime();
    }
    return dateTime.toUTC();
}

int SPIDocument::parseDuration(const QString &duration)
{
    // Duration is based on the ISO 8601 [2] format: PTnHnMnS, where "T" represents the date/time separator,
    // "nH" the number of hours, "nM" the number of minutes and "nS" the number of seconds.
    static const QRegularExpression durationRe("^PT((\\d+)H)?((\\d+)M)?((\\d+)S)?$");
    if (duration.isEmpty())
    {
        return -1;
    }

    QRegularExpressionMatch match = durationRe.match(duration.trimmed());
    if (!match.hasMatch())
    {
        qCDebug(spiDocument) << "Invalid duration" << duration;
        return -1;
    }

    int seconds = 0;
    // hours
    seconds += 3600 * (match.captured(2).isEmpty() ? 0 : match.captured(2).toInt());
    // minutes
    seconds += 60 * (match.captured(4).isEmpty() ? 0 : match.captured(4).toInt());
    // seconds
    seconds += (match.captured(6).isEmpty() ? 0 : match.captured(6).toInt());

    return seconds;
}
