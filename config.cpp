// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include "config.hh"

#include <QtCore>
#include <cmath>

namespace kvmrun {

namespace {

bool requireObject(const QJsonObject &parent, const QString &key, const QString &path,
		QJsonObject *out, Error *error)
{
	QJsonValue value = parent.value(key);
	if (value.isUndefined() || value.isNull()) {
		setError(error, Error::missingConfig(path));
		return false;
	}
	if (!value.isObject()) {
		setError(error, Error::illegalConfig(path));
		return false;
	}
	*out = value.toObject();
	return true;
}

bool requireUnsigned(const QJsonObject &parent, const QString &key, const QString &path,
		unsigned *out, Error *error)
{
	QJsonValue value = parent.value(key);
	if (value.isUndefined() || value.isNull()) {
		setError(error, Error::missingConfig(path));
		return false;
	}
	double d = value.toDouble(-1);
	if (!value.isDouble() || d < 0 || d > 4294967295.0 || std::floor(d) != d) {
		setError(error, Error::illegalConfig(path));
		return false;
	}
	*out = static_cast<unsigned>(d);
	return true;
}

bool requireString(const QJsonObject &parent, const QString &key, const QString &path,
		QString *out, Error *error)
{
	QJsonValue value = parent.value(key);
	if (value.isUndefined() || value.isNull()) {
		setError(error, Error::missingConfig(path));
		return false;
	}
	if (!value.isString()) {
		setError(error, Error::illegalConfig(path));
		return false;
	}
	*out = value.toString();
	return true;
}

// Absent keys leave *out as a null QString.
bool optionalString(const QJsonObject &parent, const QString &key, const QString &path,
		QString *out, Error *error)
{
	QJsonValue value = parent.value(key);
	if (value.isUndefined() || value.isNull())
		return true;
	return requireString(parent, key, path, out, error);
}

bool parseCpu(const QJsonObject &json, CpuConfig *cpu, Error *error)
{
	if (!requireUnsigned(json, "count", "cpu->count", &cpu->count, error))
		return false;
	if (cpu->count == 0 || cpu->count > MAX_VCPU) {
		setError(error, Error::illegalConfig("cpu->count"));
		return false;
	}
	return true;
}

bool parseMemory(const QJsonObject &json, MemoryConfig *memory, Error *error)
{
	if (!requireUnsigned(json, "size_mib", "memory->size_mib", &memory->sizeMib, error))
		return false;
	if (memory->sizeMib == 0) {
		setError(error, Error::illegalConfig("memory->size_mib"));
		return false;
	}
	return true;
}

bool parseDevices(const QJsonObject &root, QVector<DeviceConfig> *devices, Error *error)
{
	QJsonValue value = root.value("device");
	if (value.isUndefined() || value.isNull()) {
		setError(error, Error::missingConfig("device"));
		return false;
	}
	if (!value.isArray()) {
		setError(error, Error::illegalConfig("device"));
		return false;
	}
	foreach (const QJsonValue &entry, value.toArray()) {
		if (!entry.isObject()) {
			setError(error, Error::illegalConfig("device"));
			return false;
		}
		QJsonObject json = entry.toObject();
		DeviceConfig device;
		if (!requireString(json, "driver", "device->driver", &device.driver, error))
			return false;
		if (!optionalString(json, "source", "device->source", &device.source, error))
			return false;
		devices->append(device);
	}
	return true;
}

bool parseOs(const QJsonObject &json, OsConfig *os, Error *error)
{
	return optionalString(json, "kernel", "os->kernel", &os->kernel, error)
		&& optionalString(json, "initrd", "os->initrd", &os->initrd, error)
		&& optionalString(json, "rootfs", "os->rootfs", &os->rootfs, error)
		&& optionalString(json, "cmdline", "os->cmdline", &os->cmdline, error);
}

bool parseLogLevel(const QString &name, LogLevel *level)
{
	static const LogLevel levels[] = { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error };
	for (LogLevel l : levels) {
		if (logLevelName(l) == name) {
			*level = l;
			return true;
		}
	}
	return false;
}

bool parseVmm(const QJsonObject &root, VmmConfig *vmm, bool *present, Error *error)
{
	*present = false;
	vmm->hasLog = false;
	vmm->log.level = LogLevel::Info;
	if (!root.contains("vmm") || root.value("vmm").isNull())
		return true;

	QJsonObject json;
	if (!requireObject(root, "vmm", "vmm", &json, error))
		return false;
	*present = true;
	if (!json.contains("log") || json.value("log").isNull())
		return true;

	QJsonObject log;
	if (!requireObject(json, "log", "vmm->log", &log, error))
		return false;
	QString name;
	if (!requireString(log, "level", "vmm->log->level", &name, error))
		return false;
	if (!parseLogLevel(name, &vmm->log.level)) {
		setError(error, Error::illegalConfig("vmm->log->level"));
		return false;
	}
	if (!optionalString(log, "path", "vmm->log->path", &vmm->log.path, error))
		return false;
	vmm->hasLog = true;
	return true;
}

} // namespace

QString logLevelName(LogLevel level)
{
	switch (level) {
		case LogLevel::Debug:
			return "Debug";
		case LogLevel::Info:
			return "Info";
		case LogLevel::Warn:
			return "Warn";
		case LogLevel::Error:
			return "Error";
	}
	return QString();
}

bool ConfigLoader::fromFile(const QString &path, VmConfig *config, Error *error)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly)) {
		setError(error, Error::io(QString("%1: %2").arg(path, file.errorString())));
		return false;
	}
	QByteArray json = file.readAll();
	if (file.error() != QFileDevice::NoError) {
		setError(error, Error::io(QString("%1: %2").arg(path, file.errorString())));
		return false;
	}
	return fromJson(json, config, error);
}

bool ConfigLoader::fromJson(const QByteArray &json, VmConfig *config, Error *error)
{
	QJsonParseError parseError;
	QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
	if (parseError.error != QJsonParseError::NoError) {
		setError(error, Error::parsing(QString("Invalid JSON at offset %1: %2")
			.arg(parseError.offset).arg(parseError.errorString())));
		return false;
	}
	if (!doc.isObject()) {
		setError(error, Error::parsing("The configuration must be a JSON object"));
		return false;
	}

	QJsonObject root = doc.object();
	QJsonObject section;
	VmConfig result;

	if (!requireObject(root, "cpu", "cpu", &section, error) || !parseCpu(section, &result.cpu, error))
		return false;
	if (!requireObject(root, "memory", "memory", &section, error)
			|| !parseMemory(section, &result.memory, error))
		return false;
	if (!parseDevices(root, &result.devices, error))
		return false;
	if (!requireObject(root, "os", "os", &section, error) || !parseOs(section, &result.os, error))
		return false;
	if (!parseVmm(root, &result.vmm, &result.hasVmm, error))
		return false;

	*config = result;
	return true;
}

} // namespace kvmrun
