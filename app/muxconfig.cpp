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

#include <QFile>
#include <QHash>
#include <QLoggingCategory>
#include <QSet>
#include <boost/property_tree/info_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>

#include "muxconfig.h"

Q_LOGGING_CATEGORY(muxConfig, "MuxConfig", QtInfoMsg)

namespace
{
// decimal or 0x prefixed hex
uint32_t parseNumber(const std::string & value, const std::string & key)
{
    bool ok = false;
    uint32_t num = QString::fromStdString(value).trimmed().toUInt(&ok, 0);
    if (!ok)
    {
        throw boost::property_tree::ptree_bad_data("Invalid number for " + key + ": " + value, value);
    }
    return num;
}
}

bool MuxConfig::load(const QString &fileName)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly))
    {
        qCCritical(muxConfig) << "Unable to open" << fileName << ":" << file.errorString();
        return false;
    }
    std::istringstream stream(file.readAll().toStdString());
    return parse(stream, fileName);
}

bool MuxConfig::loadFromData(const QByteArray &info)
{
    std::istringstream stream(info.toStdString());
    return parse(stream, QString("<data>"));
}

bool MuxConfig::parse(std::istream &stream, const QString &source)
{
    using boost::property_tree::ptree;

    m_bearers.clear();
    try
    {
        ptree pt;
        boost::property_tree::read_info(stream, pt);

        const ptree & ensemble = pt.get_child("ensemble");
        m_ecc = parseNumber(ensemble.get<std::string>("ecc"), "ensemble.ecc") & 0xFF;
        m_eid = parseNumber(ensemble.get<std::string>("id"), "ensemble.id") & 0xFFFF;
        m_label = QString::fromStdString(ensemble.get<std::string>("label", "")).trimmed();
        m_shortLabel = QString::fromStdString(ensemble.get<std::string>("shortlabel", "")).trimmed();

        // service name -> (ECC, SId)
        QHash<QString, QPair<uint8_t, uint32_t>> services;
        QList<QString> serviceOrder;
        for (const auto & service : pt.get_child("services", ptree()))
        {
            QString name = QString::fromStdString(service.first);
            uint32_t sid = parseNumber(service.second.get<std::string>("id"), "services." + service.first + ".id");
            uint8_t ecc = m_ecc;
            if (service.second.count("ecc"))
            {
                ecc = parseNumber(service.second.get<std::string>("ecc"), "services." + service.first + ".ecc") & 0xFF;
            }
            services.insert(name, qMakePair(ecc, sid));
            serviceOrder.append(name);
        }

        QSet<QString> servicesWithComponent;
        for (const auto & component : pt.get_child("components", ptree()))
        {
            QString serviceName = QString::fromStdString(component.second.get<std::string>("service"));
            if (!services.contains(serviceName))
            {
                qCWarning(muxConfig) << "Component" << component.first.c_str() << "refers to unknown service" << serviceName;
                continue;
            }
            uint8_t scids = 0;
            if (component.second.count("scids"))
            {
                scids = parseNumber(component.second.get<std::string>("scids"), "components." + component.first + ".scids") & 0x0F;
            }
            const auto & service = services.value(serviceName);
            DabBearer bearer(service.first, m_eid, service.second, scids);
            if (!m_bearers.contains(bearer))
            {
                m_bearers.append(bearer);
            }
            servicesWithComponent.insert(serviceName);
        }

        for (const QString & name : serviceOrder)
        {
            if (!servicesWithComponent.contains(name))
            {   // service without component is primary component
                const auto & service = services.value(name);
                DabBearer bearer(service.first, m_eid, service.second, 0);
                if (!m_bearers.contains(bearer))
                {
                    m_bearers.append(bearer);
                }
            }
        }
    }
    catch (const boost::property_tree::ptree_error & e)
    {
        qCCritical(muxConfig) << "Invalid multiplex configuration" << source << ":" << e.what();
        return false;
    }

    qCInfo(muxConfig) << "Ensemble" << QString("%1%2").arg(m_ecc, 2, 16, QChar('0')).arg(m_eid, 4, 16, QChar('0'))
                      << m_label << "with" << m_bearers.size() << "bearers";
    return true;
}

SPIEnsembleContext MuxConfig::ensembleContext() const
{
    SPIEnsembleContext context;
    context.ecc = m_ecc;
    context.eid = m_eid;
    context.longName = m_label;
    context.shortName = m_shortLabel;
    return context;
}
