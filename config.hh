// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_CONFIG_HH
#define KVMRUN_CONFIG_HH

#include <QByteArray>
#include <QString>
#include <QVector>

#include "error.hh"

namespace kvmrun {

const unsigned MAX_VCPU = 512;

struct CpuConfig {
	unsigned count;
};

struct MemoryConfig {
	// Total guest RAM in MiB.
	unsigned sizeMib;
};

// Optional strings below are null QStrings when absent.
struct DeviceConfig {
	QString driver;
	QString source;
};

struct OsConfig {
	QString kernel;
	QString initrd;
	QString rootfs;
	QString cmdline;
};

enum class LogLevel {
	Debug,
	Info,
	Warn,
	Error
};

struct LogConfig {
	LogLevel level;
	QString path;
};

struct VmmConfig {
	bool hasLog;
	LogConfig log;
};

struct VmConfig {
	CpuConfig cpu;
	MemoryConfig memory;
	QVector<DeviceConfig> devices;
	OsConfig os;
	bool hasVmm;
	VmmConfig vmm;
};

/*
 * Builds a validated VmConfig from a JSON document:
 *
 * {
 *   "cpu": { "count": 2 },
 *   "memory": { "size_mib": 128 },
 *   "device": [ { "driver": "virtio-blk", "source": "disk.img" } ],
 *   "os": { "kernel": "bzImage", "cmdline": "console=ttyS0" },
 *   "vmm": { "log": { "level": "Debug", "path": "kvmrun.log" } }
 * }
 *
 * On failure *error receives MissingConfig, IllegalConfig, ParsingError or
 * IOError and *config is left untouched.
 */
class ConfigLoader {
public:
	static bool fromFile(const QString &path, VmConfig *config, Error *error);
	static bool fromJson(const QByteArray &json, VmConfig *config, Error *error);
};

QString logLevelName(LogLevel level);

} // namespace kvmrun

#endif
