// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_KVM_HH
#define KVMRUN_KVM_HH

#include "kernel.hh"

struct kvm_run;

namespace kvmrun {

class KvmVcpu : public KernelVcpu {
public:
	KvmVcpu(unsigned index, int fd, struct kvm_run *run, long mmapSize);
	~KvmVcpu();

	unsigned index() const { return this->vcpuIndex; }
	int fd() const { return this->vcpuFd; }
	struct kvm_run *runData() const { return this->run; }

private:
	KvmVcpu(const KvmVcpu &);
	KvmVcpu &operator=(const KvmVcpu &);

	unsigned vcpuIndex;
	int vcpuFd;
	struct kvm_run *run;
	long mmapSize;
};

class KvmVm : public KernelVm {
public:
	KvmVm(int fd, long vcpuMmapSize);
	~KvmVm();

	std::unique_ptr<KernelVcpu> createVcpu(unsigned index, Error *error);
	bool setUserMemoryRegion(quint32 slot, quint64 guestPhys, quint64 size,
			void *hostAddr, Error *error);

private:
	KvmVm(const KvmVm &);
	KvmVm &operator=(const KvmVm &);

	int vmFd;
	long vcpuMmapSize;
};

// Owns the /dev/kvm file descriptor.
class KvmSystem : public KernelSystem {
public:
	static std::unique_ptr<KvmSystem> open(Error *error);
	~KvmSystem();

	std::unique_ptr<KernelVm> createVm(Error *error);

private:
	KvmSystem(int fd, long vcpuMmapSize);
	KvmSystem(const KvmSystem &);
	KvmSystem &operator=(const KvmSystem &);

	int fd;
	long vcpuMmapSize;
};

} // namespace kvmrun

#endif
