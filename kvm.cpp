// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <linux/kvm.h>

#include "kvm.hh"
#include "log.hh"

namespace kvmrun {

// Intel needs three pages for its TSS, this address is unused by the guest.
static const unsigned long TSS_ADDR = 0xfffbd000;

KvmVcpu::KvmVcpu(unsigned index, int fd, struct kvm_run *run, long mmapSize)
	: vcpuIndex(index), vcpuFd(fd), run(run), mmapSize(mmapSize)
{
}

KvmVcpu::~KvmVcpu()
{
	if (this->run)
		munmap(this->run, this->mmapSize);
	close(this->vcpuFd);
	qCDebug(lcKvm) << "released vcpu" << this->vcpuIndex;
}

KvmVm::KvmVm(int fd, long vcpuMmapSize)
	: vmFd(fd), vcpuMmapSize(vcpuMmapSize)
{
}

KvmVm::~KvmVm()
{
	close(this->vmFd);
}

std::unique_ptr<KernelVcpu> KvmVm::createVcpu(unsigned index, Error *error)
{
	int fd = ioctl(this->vmFd, KVM_CREATE_VCPU, (unsigned long) index);
	if (fd == -1) {
		int err = errno;
		qCWarning(lcKvm, "kvm_create_vcpu %u: %s", index, strerror(err));
		setError(error, Error::ioctl(err, "KVM_CREATE_VCPU"));
		return std::unique_ptr<KernelVcpu>();
	}

	void *map = mmap(NULL, this->vcpuMmapSize, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
	if (map == MAP_FAILED) {
		int err = errno;
		qCWarning(lcKvm, "mmap vcpu area: %s", strerror(err));
		close(fd);
		setError(error, Error::ioctl(err, "mmap kvm_run"));
		return std::unique_ptr<KernelVcpu>();
	}

	return std::unique_ptr<KernelVcpu>(
		new KvmVcpu(index, fd, (struct kvm_run *) map, this->vcpuMmapSize));
}

bool KvmVm::setUserMemoryRegion(quint32 slot, quint64 guestPhys, quint64 size,
		void *hostAddr, Error *error)
{
	struct kvm_userspace_memory_region region;
	region.slot = slot;
	region.flags = 0;
	region.guest_phys_addr = guestPhys;
	region.memory_size = size;
	region.userspace_addr = (unsigned long) hostAddr;

	if (ioctl(this->vmFd, KVM_SET_USER_MEMORY_REGION, &region) == -1) {
		int err = errno;
		qCWarning(lcKvm, "create_userspace_phys_mem slot %u: %s", slot, strerror(err));
		setError(error, Error::ioctl(err, "KVM_SET_USER_MEMORY_REGION"));
		return false;
	}
	return true;
}

KvmSystem::KvmSystem(int fd, long vcpuMmapSize)
	: fd(fd), vcpuMmapSize(vcpuMmapSize)
{
}

KvmSystem::~KvmSystem()
{
	close(this->fd);
}

std::unique_ptr<KvmSystem> KvmSystem::open(Error *error)
{
	int fd = ::open("/dev/kvm", O_RDWR | O_CLOEXEC);
	if (fd == -1) {
		int err = errno;
		qCCritical(lcKvm, "open /dev/kvm: %s", strerror(err));
		setError(error, Error::ioctl(err, "open /dev/kvm"));
		return std::unique_ptr<KvmSystem>();
	}

	int version = ioctl(fd, KVM_GET_API_VERSION, 0);
	if (version != KVM_API_VERSION) {
		int err = version == -1 ? errno : EINVAL;
		qCCritical(lcKvm, "unsupported KVM API version %d", version);
		close(fd);
		setError(error, Error::ioctl(err, "KVM_GET_API_VERSION"));
		return std::unique_ptr<KvmSystem>();
	}

	long mmapSize = ioctl(fd, KVM_GET_VCPU_MMAP_SIZE, 0);
	if (mmapSize == -1) {
		int err = errno;
		qCCritical(lcKvm, "get vcpu mmap size: %s", strerror(err));
		close(fd);
		setError(error, Error::ioctl(err, "KVM_GET_VCPU_MMAP_SIZE"));
		return std::unique_ptr<KvmSystem>();
	}

	return std::unique_ptr<KvmSystem>(new KvmSystem(fd, mmapSize));
}

std::unique_ptr<KernelVm> KvmSystem::createVm(Error *error)
{
	int fd = ioctl(this->fd, KVM_CREATE_VM, 0);
	if (fd == -1) {
		int err = errno;
		qCCritical(lcKvm, "kvm_create_vm: %s", strerror(err));
		setError(error, Error::ioctl(err, "KVM_CREATE_VM"));
		return std::unique_ptr<KernelVm>();
	}

	std::unique_ptr<KernelVm> vm(new KvmVm(fd, this->vcpuMmapSize));

#if defined(__x86_64__) || defined(__i386__)
	if (ioctl(fd, KVM_SET_TSS_ADDR, TSS_ADDR) == -1) {
		int err = errno;
		qCCritical(lcKvm, "Error assigning TSS space: %s", strerror(err));
		setError(error, Error::ioctl(err, "KVM_SET_TSS_ADDR"));
		return std::unique_ptr<KernelVm>();
	}
#endif
	return vm;
}

} // namespace kvmrun
