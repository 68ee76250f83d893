// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <gtest/gtest.h>
#include <QFile>
#include <QTemporaryDir>

#include "log.hh"

using namespace kvmrun;

namespace {

QByteArray readAll(const QString &path)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly))
		return QByteArray();
	return file.readAll();
}

} // namespace

TEST(LogTest, DropsMessagesBelowThreshold)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	LogConfig config;
	config.level = LogLevel::Info;
	config.path = dir.filePath("kvmrun.log");

	ASSERT_TRUE(installLogger(&config, 0));
	qCDebug(lcVm) << "hidden message";
	qCInfo(lcVm) << "shown message";
	qCWarning(lcVcpu) << "warned message";
	uninstallLogger();

	QByteArray log = readAll(config.path);
	EXPECT_FALSE(log.contains("hidden message"));
	EXPECT_TRUE(log.contains("INFO kvmrun.vm: shown message"));
	EXPECT_TRUE(log.contains("WARN kvmrun.vcpu: warned message"));
	EXPECT_EQ(2, log.count('\n'));
}

TEST(LogTest, DebugLevelKeepsEverything)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	LogConfig config;
	config.level = LogLevel::Debug;
	config.path = dir.filePath("kvmrun.log");

	ASSERT_TRUE(installLogger(&config, 0));
	qCDebug(lcMemory) << "debug message";
	uninstallLogger();

	EXPECT_TRUE(readAll(config.path).contains("DEBUG kvmrun.memory: debug message"));
}

TEST(LogTest, AppendsToExistingFile)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	LogConfig config;
	config.level = LogLevel::Error;
	config.path = dir.filePath("kvmrun.log");

	for (int i = 0; i < 2; i++) {
		ASSERT_TRUE(installLogger(&config, 0));
		qCCritical(lcHypervisor) << "run" << i;
		uninstallLogger();
	}

	QByteArray log = readAll(config.path);
	EXPECT_EQ(2, log.count('\n'));
}

TEST(LogTest, ReportsUnwritablePath)
{
	LogConfig config;
	config.level = LogLevel::Info;
	config.path = "/nonexistent/dir/kvmrun.log";

	Error error;
	EXPECT_FALSE(installLogger(&config, &error));
	EXPECT_EQ(Error::IOError, error.kind());
}
