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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <iostream>

#include "config.h"
#include "carousellog.h"
#include "carouselcontext.h"
#include "httptransport.h"
#include "radiodnsresolver.h"
#include "spicarousel.h"
#include "data/packetencoder.h"

Q_LOGGING_CATEGORY(spiMain, "Main", QtInfoMsg)

int main(int argc, char *argv[])
{
    QCoreApplication::setApplicationName("spicarousel");
    QCoreApplication::setApplicationVersion(PROJECT_VER);

    QCoreApplication a(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Assembles DAB SPI (EPG) carousel from RadioDNS sources"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("config", QObject::tr("ODR-DabMux multiplex configuration file."));

    QCommandLineOption outputOption(QStringList() << "o", QObject::tr("Output file (default output.dat)."), "output", "output.dat");
    parser.addOption(outputOption);
    QCommandLineOption verboseOption(QStringList() << "X", QObject::tr("Verbose logging."));
    parser.addOption(verboseOption);
    QCommandLineOption daysOption(QStringList() << "d", QObject::tr("Number of days of PI to fetch (default 2)."), "days", "2");
    parser.addOption(daysOption);
    QCommandLineOption packetSizeOption(QStringList() << "p", QObject::tr("Packet size in bytes: 24, 48, 72 or 96 (default 96)."), "size", "96");
    parser.addOption(packetSizeOption);
    QCommandLineOption addressOption(QStringList() << "a", QObject::tr("Packet address 1-1023 (default 1)."), "address", "1");
    parser.addOption(addressOption);
    QCommandLineOption directoryOption(QStringList() << "D", QObject::tr("Output MOT directory data groups instead of packets."));
    parser.addOption(directoryOption);
    QCommandLineOption credentialsOption(QStringList() << "c", QObject::tr("CSV file with fqdn,credential pairs."), "csv");
    parser.addOption(credentialsOption);

    // Process the actual command line arguments given by the user
    parser.process(a);

    setupLogging(parser.isSet(verboseOption));

    const QStringList args = parser.positionalArguments();
    if (1 != args.size())
    {
        std::cerr << qPrintable(parser.helpText()) << std::endl;
        return SPICarousel::EXIT_INVALID_INPUT;
    }

    bool ok = false;
    CarouselContext context;
    context.days = parser.value(daysOption).toInt(&ok);
    if (!ok || (context.days < 1))
    {
        qCCritical(spiMain) << "Invalid number of days:" << parser.value(daysOption);
        return SPICarousel::EXIT_INVALID_INPUT;
    }

    CarouselOutput output;
    output.fileName = parser.value(outputOption);
    output.directoryOnly = parser.isSet(directoryOption);
    output.packetSize = parser.value(packetSizeOption).toInt(&ok);
    if (!ok || !PacketEncoder::isValidPacketSize(output.packetSize))
    {
        qCCritical(spiMain) << "Invalid packet size:" << parser.value(packetSizeOption);
        return SPICarousel::EXIT_INVALID_INPUT;
    }
    int address = parser.value(addressOption).toInt(&ok);
    if (!ok || (address < 1) || (address > 1023))
    {
        qCCritical(spiMain) << "Invalid packet address:" << parser.value(addressOption);
        return SPICarousel::EXIT_INVALID_INPUT;
    }
    output.address = address;

    if (parser.isSet(credentialsOption) && !context.credentials.loadFromFile(parser.value(credentialsOption)))
    {
        return SPICarousel::EXIT_INVALID_INPUT;
    }

    if (!RadioDNSResolver::parseEnsembleIdentity(args.at(0), context.ensemble))
    {
        return SPICarousel::EXIT_INVALID_INPUT;
    }

    RadioDNSResolver resolver;
    QList<DiscoveryResponse> responses;
    if (!resolver.resolve(args.at(0), responses))
    {
        return SPICarousel::EXIT_INVALID_INPUT;
    }

    HttpTransport transport(context.transferTimeoutMs);
    SPICarousel carousel(context, &transport);
    return carousel.run(responses, output);
}
