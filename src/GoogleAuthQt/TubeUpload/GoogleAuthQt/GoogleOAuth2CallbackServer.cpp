/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload GoogleAuthQt Library
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

#include "GoogleOAuth2CallbackServer.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QProcess>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QTcpSocket>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>

#include <fmt/format.h>

#include <TubeUpload/Retry/TransferErrors.hpp>

namespace TubeUpload::GoogleAuthQt {

namespace {

void sendResponse(QTcpSocket *socket, bool success)
{
	const QString content = success ? "<h1>Authorization Successful</h1><p>You can close this window now.</p>"
					: "<h1>Authorization Failed</h1><p>Return to the terminal for details.</p>";

	const QString response = QString("HTTP/1.1 200 OK\r\n"
					 "Content-Type: text/html; charset=utf-8\r\n"
					 "Content-Length: %1\r\n"
					 "Connection: close\r\n"
					 "\r\n"
					 "%2")
					 .arg(content.toUtf8().size())
					 .arg(content);

	socket->write(response.toUtf8());
	socket->flush();
}

} // anonymous namespace

GoogleOAuth2CallbackServer::GoogleOAuth2CallbackServer(std::shared_ptr<const Logger::ILogger> logger,
						       GoogleOAuth2CallbackServerOptions options)
	: logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(GoogleOAuth2CallbackServer)")),
	  options_(std::move(options)),
	  server_(std::make_unique<QTcpServer>())
{
}

GoogleOAuth2CallbackServer::~GoogleOAuth2CallbackServer() noexcept
{
	if (server_) {
		server_->close();
	}
}

void GoogleOAuth2CallbackServer::listen()
{
	if (server_->isListening()) {
		return;
	}

	if (!server_->listen(QHostAddress::LocalHost, 0)) {
		throw std::runtime_error(fmt::format("ListenError(GoogleOAuth2CallbackServer):{}",
						     server_->errorString().toStdString()));
	}
	logger_->info("CallbackServerListening", {{"port", std::to_string(server_->serverPort())}});
}

std::string GoogleOAuth2CallbackServer::redirectUri()
{
	listen();

	QUrl url;
	url.setScheme("http");
	url.setHost("localhost");
	url.setPort(static_cast<int>(server_->serverPort()));
	url.setPath("/callback");
	return url.toString().toStdString();
}

std::optional<std::string> GoogleOAuth2CallbackServer::receiveCode(const std::string &authorizationUrl)
{
	if (!QCoreApplication::instance()) {
		throw std::runtime_error("NoApplicationError(GoogleOAuth2CallbackServer)");
	}
	listen();

	const bool started = QProcess::startDetached(QString::fromStdString(options_.browserCommand),
						      QStringList{QString::fromStdString(authorizationUrl)});
	if (!started) {
		throw std::runtime_error("BrowserLaunchError(GoogleOAuth2CallbackServer)");
	}
	logger_->info("BrowserOpened", {{"url", authorizationUrl}});

	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);

	std::optional<GoogleOAuth2CallbackRequest> result;

	QObject::connect(&timer, &QTimer::timeout, &loop, [this, &loop]() {
		logger_->warn("CallbackServerTimedOut");
		loop.quit();
	});

	QObject::connect(server_.get(), &QTcpServer::newConnection, &loop, [this, &loop, &result]() {
		while (QTcpSocket *socket = server_->nextPendingConnection()) {
			auto buffer = std::make_shared<QByteArray>();
			QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
			QObject::connect(socket, &QTcpSocket::readyRead, &loop, [socket, buffer, &loop, &result]() {
				buffer->append(socket->readAll());
				auto request = parseRequest(*buffer);
				if (!request) {
					return;
				}

				const bool success = request->code.has_value();
				sendResponse(socket, success);
				socket->disconnectFromHost();

				if (success || request->error) {
					result = std::move(request);
					loop.quit();
				}
			});
		}
	});

	timer.start(std::chrono::milliseconds(options_.timeout));
	loop.exec();
	server_->close();

	if (!result) {
		return std::nullopt;
	}
	if (result->error) {
		throw Retry::AuthError("AuthorizationDeniedError(GoogleOAuth2CallbackServer):" + *result->error);
	}
	return result->code;
}

std::optional<GoogleOAuth2CallbackRequest> GoogleOAuth2CallbackServer::parseRequest(const QByteArray &data)
{
	if (!data.contains("\r\n")) {
		return std::nullopt;
	}

	static const QRegularExpression re("^GET\\s+(\\S+)\\s+HTTP");
	const QRegularExpressionMatch match = re.match(QString::fromUtf8(data));
	if (!match.hasMatch()) {
		return std::nullopt;
	}

	const QUrl url("http://localhost" + match.captured(1));
	const QUrlQuery query(url);

	GoogleOAuth2CallbackRequest request;
	if (query.hasQueryItem("code")) {
		request.code = query.queryItemValue("code", QUrl::FullyDecoded).toStdString();
	}
	if (query.hasQueryItem("error")) {
		request.error = query.queryItemValue("error", QUrl::FullyDecoded).toStdString();
	}
	return request;
}

} // namespace TubeUpload::GoogleAuthQt
