// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_ERROR_HH
#define KVMRUN_ERROR_HH

#include <QString>

namespace kvmrun {

class Error {
public:
	enum Kind {
		None,
		MissingConfig,
		IllegalConfig,
		ParsingError,
		IOError,
		IoctlError,
		MemoryError,
		ChannelError,
		JoinError,
		ProtocolError
	};

	Error() : m_kind(None), m_errno(0) {}

	static Error missingConfig(const QString &path);
	static Error illegalConfig(const QString &path);
	static Error parsing(const QString &message);
	static Error io(const QString &message);
	static Error ioctl(int err, const QString &call);
	static Error memory(const QString &message);
	static Error channel(unsigned vcpu);
	static Error join(unsigned vcpu, const QString &reason);
	static Error protocol(unsigned vcpu, const QString &reason);

	Kind kind() const { return m_kind; }
	int errorNumber() const { return m_errno; }
	QString message() const { return m_message; }
	bool isNull() const { return m_kind == None; }

	QString toString() const;

	bool operator==(const Error &other) const;
	bool operator!=(const Error &other) const { return !(*this == other); }

private:
	Error(Kind kind, int err, const QString &message)
		: m_kind(kind), m_errno(err), m_message(message) {}

	Kind m_kind;
	int m_errno;
	QString m_message;
};

// Stores e into *out when the caller asked for it.
inline void setError(Error *out, const Error &e)
{
	if (out)
		*out = e;
}

} // namespace kvmrun

#endif
