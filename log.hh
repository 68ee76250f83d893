// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_LOG_HH
#define KVMRUN_LOG_HH

#include <QLoggingCategory>

#include "config.hh"

namespace kvmrun {

Q_DECLARE_LOGGING_CATEGORY(lcHypervisor)
Q_DECLARE_LOGGING_CATEGORY(lcVm)
Q_DECLARE_LOGGING_CATEGORY(lcVcpu)
Q_DECLARE_LOGGING_CATEGORY(lcMemory)
Q_DECLARE_LOGGING_CATEGORY(lcKvm)

/*
 * Routes all Qt logging through kvmrun's sink. A null config means
 * Info and above to stderr. Returns false with *error set when the log
 * file can't be opened; the previous sink stays in place then.
 */
bool installLogger(const LogConfig *config, Error *error);

// Restores Qt's default handler and closes the log file.
void uninstallLogger();

} // namespace kvmrun

#endif
