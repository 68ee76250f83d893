// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include "log.hh"

#include <QtCore>
#include <stdio.h>

namespace kvmrun {

Q_LOGGING_CATEGORY(lcHypervisor, "kvmrun.hypervisor")
Q_LOGGING_CATEGORY(lcVm, "kvmrun.vm")
Q_LOGGING_CATEGORY(lcVcpu, "kvmrun.vcpu")
Q_LOGGING_CATEGORY(lcMemory, "kvmrun.memory")
Q_LOGGING_CATEGORY(lcKvm, "kvmrun.kvm")

namespace {

QMutex sinkLock;
QFile *sinkFile = 0;
int threshold = 1;

int rank(QtMsgType type)
{
	switch (type) {
		case QtDebugMsg:
			return 0;
		case QtInfoMsg:
			return 1;
		case QtWarningMsg:
			return 2;
		case QtCriticalMsg:
		case QtFatalMsg:
			return 3;
	}
	return 3;
}

int rank(LogLevel level)
{
	switch (level) {
		case LogLevel::Debug:
			return 0;
		case LogLevel::Info:
			return 1;
		case LogLevel::Warn:
			return 2;
		case LogLevel::Error:
			return 3;
	}
	return 1;
}

const char *label(QtMsgType type)
{
	switch (type) {
		case QtDebugMsg:
			return "DEBUG";
		case QtInfoMsg:
			return "INFO";
		case QtWarningMsg:
			return "WARN";
		case QtCriticalMsg:
			return "ERROR";
		case QtFatalMsg:
			return "FATAL";
	}
	return "?";
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
	QMutexLocker locker(&sinkLock);
	if (type != QtFatalMsg && rank(type) < threshold)
		return;

	QByteArray line = QString("%1 %2 %3: %4\n")
		.arg(QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz"))
		.arg(label(type))
		.arg(context.category ? context.category : "default")
		.arg(msg)
		.toLocal8Bit();

	if (sinkFile) {
		sinkFile->write(line);
		sinkFile->flush();
	} else {
		fputs(line.constData(), stderr);
		fflush(stderr);
	}
	if (type == QtFatalMsg)
		abort();
}

} // namespace

bool installLogger(const LogConfig *config, Error *error)
{
	QFile *file = 0;
	if (config && !config->path.isEmpty()) {
		file = new QFile(config->path);
		if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
			setError(error, Error::io(QString("%1: %2").arg(config->path, file->errorString())));
			delete file;
			return false;
		}
	}

	{
		QMutexLocker locker(&sinkLock);
		delete sinkFile;
		sinkFile = file;
		threshold = config ? rank(config->level) : rank(LogLevel::Info);
	}

	// Let debug messages reach the handler; it does the filtering.
	QLoggingCategory::setFilterRules("kvmrun.*.debug=true");
	qInstallMessageHandler(messageHandler);
	return true;
}

void uninstallLogger()
{
	qInstallMessageHandler(0);
	QLoggingCategory::setFilterRules(QString());

	QMutexLocker locker(&sinkLock);
	delete sinkFile;
	sinkFile = 0;
	threshold = 1;
}

} // namespace kvmrun
