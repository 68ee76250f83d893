// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_GUEST_MEMORY_HH
#define KVMRUN_GUEST_MEMORY_HH

#include <QVector>
#include <memory>

#include "error.hh"

namespace kvmrun {

struct GuestRegion {
	quint64 guestPhys;
	quint64 size;
	char *host;
};

/*
 * Guest physical RAM, backed by one anonymous host mapping. The mapping
 * is split into regions that leave the 32-bit MMIO window unbacked on x86,
 * so RAM beyond 3 GiB continues at 4 GiB. All vCPU threads access it
 * without locking.
 */
class GuestMemory {
public:
	static const quint64 MIB = 1ULL << 20;
	static const quint64 MMIO_GAP_START = 3ULL << 30;
	static const quint64 MMIO_GAP_END = 4ULL << 30;

	static std::unique_ptr<GuestMemory> create(unsigned sizeMib, Error *error);

	// Guest-physical placement of sizeBytes of RAM; host pointers are null.
	static QVector<GuestRegion> layout(quint64 sizeBytes);

	~GuestMemory();

	quint64 size() const { return this->total; }
	const QVector<GuestRegion> &regions() const { return this->ranges; }

	// Both fail if [guestPhys, guestPhys + len) isn't inside a single region.
	bool write(quint64 guestPhys, const void *data, quint64 len);
	bool read(quint64 guestPhys, void *data, quint64 len) const;

private:
	GuestMemory(char *base, quint64 total, const QVector<GuestRegion> &ranges);
	GuestMemory(const GuestMemory &);
	GuestMemory &operator=(const GuestMemory &);

	char *translate(quint64 guestPhys, quint64 len) const;

	char *base;
	quint64 total;
	QVector<GuestRegion> ranges;
};

} // namespace kvmrun

#endif
