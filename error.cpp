// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include "error.hh"

#include <QtCore>

namespace kvmrun {

Error Error::missingConfig(const QString &path)
{
	return Error(MissingConfig, 0, path);
}

Error Error::illegalConfig(const QString &path)
{
	return Error(IllegalConfig, 0, path);
}

Error Error::parsing(const QString &message)
{
	return Error(ParsingError, 0, message);
}

Error Error::io(const QString &message)
{
	return Error(IOError, 0, message);
}

// The message carries the failing call and strerror() of err.
Error Error::ioctl(int err, const QString &call)
{
	return Error(IoctlError, err, QString("%1: %2").arg(call, qt_error_string(err)));
}

Error Error::memory(const QString &message)
{
	return Error(MemoryError, 0, message);
}

Error Error::channel(unsigned vcpu)
{
	return Error(ChannelError, 0, QString("vcpu %1").arg(vcpu));
}

Error Error::join(unsigned vcpu, const QString &reason)
{
	return Error(JoinError, 0, QString("vcpu %1: %2").arg(vcpu).arg(reason));
}

Error Error::protocol(unsigned vcpu, const QString &reason)
{
	return Error(ProtocolError, 0, QString("vcpu %1: %2").arg(vcpu).arg(reason));
}

QString Error::toString() const
{
	switch (m_kind) {
		case None:
			return QString("No error");
		case MissingConfig:
			return QString("The required configuration for %1 is missing.").arg(m_message);
		case IllegalConfig:
			return QString("The given configuration for %1 is illegal.").arg(m_message);
		case ParsingError:
			return m_message;
		case IOError:
			return QString("I/O error, error=%1").arg(m_message);
		case IoctlError:
			return QString("Failed kvm ioctl, error=(%1, %2)").arg(m_errno).arg(m_message);
		case MemoryError:
			return QString("Failed to allocate guest memory, error=%1").arg(m_message);
		case ChannelError:
			return QString("Channel to %1 is disconnected").arg(m_message);
		case JoinError:
			return QString("Thread of %1 terminated abnormally").arg(m_message);
		case ProtocolError:
			return QString("Control protocol violated for %1").arg(m_message);
	}
	return QString();
}

bool Error::operator==(const Error &other) const
{
	return m_kind == other.m_kind && m_errno == other.m_errno && m_message == other.m_message;
}

} // namespace kvmrun
