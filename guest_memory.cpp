// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>
#include <errno.h>
#include <limits>
#include <string.h>
#include <sys/mman.h>

#include "guest_memory.hh"
#include "log.hh"

namespace kvmrun {

const quint64 GuestMemory::MIB;
const quint64 GuestMemory::MMIO_GAP_START;
const quint64 GuestMemory::MMIO_GAP_END;

QVector<GuestRegion> GuestMemory::layout(quint64 sizeBytes)
{
	QVector<GuestRegion> regions;
#if defined(__x86_64__) || defined(__i386__)
	if (sizeBytes > MMIO_GAP_START) {
		GuestRegion low = { 0, MMIO_GAP_START, 0 };
		GuestRegion high = { MMIO_GAP_END, sizeBytes - MMIO_GAP_START, 0 };
		regions << low << high;
		return regions;
	}
#endif
	GuestRegion all = { 0, sizeBytes, 0 };
	regions << all;
	return regions;
}

std::unique_ptr<GuestMemory> GuestMemory::create(unsigned sizeMib, Error *error)
{
	quint64 total = quint64(sizeMib) * MIB;
	if (total == 0) {
		setError(error, Error::memory("zero sized guest memory"));
		return std::unique_ptr<GuestMemory>();
	}

	if (total > std::numeric_limits<size_t>::max()) {
		qCCritical(lcMemory, "%u MiB of guest memory exceed the host address space", sizeMib);
		setError(error, Error::memory(QString("%1 MiB exceed the host address space").arg(sizeMib)));
		return std::unique_ptr<GuestMemory>();
	}

	void *map = mmap(NULL, size_t(total), PROT_READ | PROT_WRITE,
			MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
	if (map == MAP_FAILED) {
		int err = errno;
		qCCritical(lcMemory, "mmap %u MiB of guest memory: %s", sizeMib, strerror(err));
		setError(error, Error::memory(QString("mmap %1 MiB: %2").arg(sizeMib).arg(qt_error_string(err))));
		return std::unique_ptr<GuestMemory>();
	}

	char *base = static_cast<char *>(map);
	QVector<GuestRegion> regions = layout(total);
	quint64 offset = 0;
	for (int i = 0; i < regions.size(); i++) {
		regions[i].host = base + offset;
		offset += regions[i].size;
	}

	qCDebug(lcMemory, "mapped %u MiB of guest memory in %d region(s)", sizeMib, regions.size());
	return std::unique_ptr<GuestMemory>(new GuestMemory(base, total, regions));
}

GuestMemory::GuestMemory(char *base, quint64 total, const QVector<GuestRegion> &ranges)
	: base(base), total(total), ranges(ranges)
{
}

GuestMemory::~GuestMemory()
{
	munmap(this->base, size_t(this->total));
}

char *GuestMemory::translate(quint64 guestPhys, quint64 len) const
{
	foreach (const GuestRegion &region, this->ranges) {
		if (guestPhys < region.guestPhys)
			continue;
		quint64 offset = guestPhys - region.guestPhys;
		if (offset < region.size && len <= region.size - offset)
			return region.host + offset;
	}
	return 0;
}

bool GuestMemory::write(quint64 guestPhys, const void *data, quint64 len)
{
	char *host = translate(guestPhys, len);
	if (!host)
		return false;
	memcpy(host, data, len);
	return true;
}

bool GuestMemory::read(quint64 guestPhys, void *data, quint64 len) const
{
	const char *host = translate(guestPhys, len);
	if (!host)
		return false;
	memcpy(data, host, len);
	return true;
}

} // namespace kvmrun
