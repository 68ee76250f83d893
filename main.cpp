// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>
#include <cstdio>

#include "config.hh"
#include "hypervisor.hh"
#include "log.hh"

using namespace kvmrun;

enum ExitCode {
	EXIT_OK = 0,
	EXIT_GENERAL_ERROR = 1
};

static void usage()
{
	printf("kvmrun v%s\n", KVMRUN_VERSION);
	printf("Usage:\n");
	printf("./kvmrun <config>     Start a vm with the given config file.\n");
}

static void report(const Error &error)
{
	fprintf(stderr, "kvmrun: %s\n", qPrintable(error.toString()));
}

static int vmmMain(const QString &path)
{
	VmConfig config;
	Error error;
	if (!ConfigLoader::fromFile(path, &config, &error)) {
		report(error);
		return EXIT_GENERAL_ERROR;
	}

	const LogConfig *log = (config.hasVmm && config.vmm.hasLog) ? &config.vmm.log : 0;
	if (!installLogger(log, &error)) {
		report(error);
		return EXIT_GENERAL_ERROR;
	}

	std::unique_ptr<Hypervisor> hv = Hypervisor::create(config, &error);
	if (!hv) {
		report(error);
		return EXIT_GENERAL_ERROR;
	}

	int code = EXIT_OK;
	QVector<VcpuResult> results = hv->vm().broadcast(VcpuMsg::run());
	for (int i = 0; i < results.size(); i++) {
		if (results[i].isOk()) {
			qCInfo(lcHypervisor, "vcpu %d: %s", i, qPrintable(vcpuStatusName(results[i].status())));
		} else {
			report(results[i].error());
			code = EXIT_GENERAL_ERROR;
		}
	}

	foreach (const Error &e, hv->vm().shutdown()) {
		if (!e.isNull()) {
			report(e);
			code = EXIT_GENERAL_ERROR;
		}
	}
	return code;
}

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("kvmrun");
	QCoreApplication::setApplicationVersion(KVMRUN_VERSION);

	QStringList args = app.arguments();
	if (args.size() != 2) {
		usage();
		return EXIT_GENERAL_ERROR;
	}

	int code = vmmMain(args.at(1));
	uninstallLogger();
	return code;
}
