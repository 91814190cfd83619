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

#ifndef SPIDOCUMENT_H
#define SPIDOCUMENT_H

#include <QByteArray>
#include <QDateTime>
#include <QDomElement>
#include <QList>
#include <QString>

#include "dabbearer.h"

struct SPIText
{
    QString text;
    QString lang;
};

struct SPIGenre
{
    QString href;
    QString type;
    QString name;
};

struct SPILink
{
    QString uri;
    QString mimeValue;
    QString lang;
    QString description;
};

struct SPIMultimedia
{
    enum class Type
    {
        Unrestricted,
        SquareLogo,
        RectangleLogo,
        Unknown,
    };

    Type type = Type::Unknown;
    QString mimeValue;
    QString lang;
    QString url;
    int width = 0;
    int height = 0;

    static Type typeFromString(const QString & type);
};

// ETSI TS 102 818 V3.4.1 [7.6] mediaDescription content
struct SPIMediaDescription
{
    QList<SPIText> shortDescriptions;
    QList<SPIText> longDescriptions;
    QList<SPIMultimedia> multimedia;
};

struct SPIService
{
    int version = -1;
    QList<SPIText> shortNames;
    QList<SPIText> mediumNames;
    QList<SPIText> longNames;
    QList<SPIText> shortDescriptions;
    QList<SPIText> longDescriptions;
    QList<SPIMultimedia> mediaItems;
    QList<SPIGenre> genres;
    QList<SPIText> keywords;
    QList<SPILink> links;
    QList<DabBearer> bearers;
    QString radiodnsFqdn;
    QString radiodnsServiceIdentifier;

    QString displayShortName() const;
    bool hasBearerIn(const QList<DabBearer> & bearers) const;
};

struct SPIServiceInformation
{
    int version = -1;
    QDateTime creationTime;
    QString originator;
    QString serviceProvider;
    QList<SPIService> services;
};

// context the SI binary encoding is built in
struct SPIEnsembleContext
{
    uint8_t ecc = 0;
    uint16_t eid = 0;
    QString longName;
    QString shortName;
};

struct SPITime
{
    QDateTime time;
    int durationSec = -1;
    QDateTime actualTime;
    int actualDurationSec = -1;

    QDateTime effectiveTime() const { return actualTime.isValid() ? actualTime : time; }
    int effectiveDurationSec() const { return (actualDurationSec >= 0) ? actualDurationSec : durationSec; }
};

struct SPILocation
{
    QList<SPITime> times;
    QList<DabBearer> bearers;
};

struct SPIProgramme
{
    QString id;
    uint32_t shortId = 0;
    int version = -1;
    QString recommendation;
    QString broadcast;
    QString lang;
    QList<SPIText> shortNames;
    QList<SPIText> mediumNames;
    QList<SPIText> longNames;
    QList<SPILocation> locations;
    SPIMediaDescription mediaDescription;
    QList<SPIGenre> genres;
    QList<SPIText> keywords;
    QList<SPILink> links;
};

struct SPIScope
{
    QDateTime start;
    QDateTime stop;
    QList<DabBearer> serviceScopes;
};

struct SPISchedule
{
    int version = -1;
    QDateTime creationTime;
    QString originator;
    SPIScope scope;
    QList<SPIProgramme> programmes;
};

struct SPIProgrammeInformation
{
    QList<SPISchedule> schedules;
};

// XML side of SPI documents, ETSI TS 102 818
class SPIDocument
{
public:
    static bool parseServiceInformation(const QByteArray & xml, SPIServiceInformation & si);
    static bool parseProgrammeInformation(const QByteArray & xml, SPIProgrammeInformation & pi);

    // ETSI TS 102 818 V3.3.1 (2020-08) [5.2.5 duration type]
    static int parseDuration(const QString & duration);

private:
    static void parseService(const QDomElement & element, SPIService & service);
    static void parseSchedule(const QDomElement & element, SPISchedule & schedule);
    static void parseProgramme(const QDomElement & element, SPIProgramme & programme);
    static void parseLocation(const QDomElement & element, SPILocation & location);
    static void parseMediaDescription(const QDomElement & element, SPIMediaDescription & mediaDescription);
    static SPIText parseText(const QDomElement & element);
    static SPIMultimedia parseMultimedia(const QDomElement & element);
    static SPIGenre parseGenre(const QDomElement & element);
    static SPILink parseLink(const QDomElement & element);
    static QDateTime parseTime(const QString & time);
};

#endif // SPIDOCUMENT_H
