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

#include <QEventLoop>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkProxyFactory>
#include <QNetworkReply>
#include <QNetworkRequest>

#include "httptransport.h"

Q_LOGGING_CATEGORY(httpTransport, "HttpTransport", QtInfoMsg)

HttpTransport::HttpTransport(int transferTimeoutMs, QObject *parent)
    : QObject(parent)
    , m_transferTimeoutMs(transferTimeoutMs)
{
    QNetworkProxyFactory::setUseSystemConfiguration(true);
    m_netAccessManager = new QNetworkAccessManager(this);
}

HttpTransport::~HttpTransport()
{
    delete m_netAccessManager;
}

NetworkReply HttpTransport::get(const QUrl &url, const QByteArray &authorization)
{
    qCDebug(httpTransport) << "GET" << url.toString();

    QNetworkRequest request(url);
    request.setTransferTimeout(m_transferTimeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    if (!authorization.isEmpty())
    {
        request.setRawHeader("Authorization", authorization);
    }

    QNetworkReply * reply = m_netAccessManager->get(request);

    // requests are serialized, wait for this one to finish
    QEventLoop loop;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();

    NetworkReply result;
    result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (QNetworkReply::NoError == reply->error())
    {
        result.data = reply->readAll();
    }
    else if (0 != result.httpStatus)
    {
        result.error = NetworkReply::Error::HttpError;
        result.errorString = reply->errorString();
    }
    else
    {
        result.error = NetworkReply::Error::TransportError;
        result.errorString = reply->errorString();
    }

    qCDebug(httpTransport) << "Reply" << result.httpStatus << result.data.size() << "bytes";

    reply->deleteLater();
    return result;
}
