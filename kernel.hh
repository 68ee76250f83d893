// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_KERNEL_HH
#define KVMRUN_KERNEL_HH

#include <QtGlobal>
#include <memory>

#include "error.hh"

namespace kvmrun {

// One vCPU context. Released when the object is destroyed.
class KernelVcpu {
public:
	virtual ~KernelVcpu() {}
	virtual unsigned index() const = 0;
};

// One VM. Every KernelVcpu it creates must be destroyed before it.
class KernelVm {
public:
	virtual ~KernelVm() {}
	virtual std::unique_ptr<KernelVcpu> createVcpu(unsigned index, Error *error) = 0;
	virtual bool setUserMemoryRegion(quint32 slot, quint64 guestPhys, quint64 size,
			void *hostAddr, Error *error) = 0;
};

// The system-level handle, a factory for VMs.
class KernelSystem {
public:
	virtual ~KernelSystem() {}
	virtual std::unique_ptr<KernelVm> createVm(Error *error) = 0;
};

} // namespace kvmrun

#endif
