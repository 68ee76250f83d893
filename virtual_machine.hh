// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_VIRTUAL_MACHINE_HH
#define KVMRUN_VIRTUAL_MACHINE_HH

#include <memory>

#include "config.hh"
#include "guest_memory.hh"
#include "kernel.hh"
#include "vcpu_manager.hh"

namespace kvmrun {

// Lifecycle of a VM: Epoch -> Paused <-> Running, then Exited.
enum class VmStatus {
	Epoch,
	Paused,
	Running,
	Exited
};

QString vmStatusName(VmStatus status);

class VirtualMachine {
public:
	/*
	 * Maps guest memory, registers it with the VM and starts one thread per
	 * vcpu. Returns a Paused VM, or null with *error set and everything
	 * created so far released.
	 */
	static std::unique_ptr<VirtualMachine> create(std::unique_ptr<KernelVm> kernel,
			const VmConfig &config, std::shared_ptr<VcpuLoop> loop, Error *error);

	~VirtualMachine();

	VmStatus status() const { return this->state; }
	const VmConfig &config() const { return this->cfg; }
	GuestMemory &memory() { return *this->mem; }
	const VcpuManager &vcpus() const { return *this->manager; }

	/*
	 * Forwards msg to all vcpus. The VM status follows the vcpus only when
	 * every one of them has reported the same status. A broadcast Exit
	 * joins the threads like shutdown(), a JoinError then replaces the
	 * result of the crashed vcpu.
	 */
	QVector<VcpuResult> broadcast(const VcpuMsg &msg);

	// Single vcpu halves of broadcast(), with the same status bookkeeping.
	bool post(unsigned index, const VcpuMsg &msg, Error *error = 0);
	VcpuResult reply(unsigned index);

	// Joins all vcpu threads, the VM is Exited afterwards.
	QVector<Error> shutdown();

private:
	void updateStatus();

	VirtualMachine(const VmConfig &config);
	VirtualMachine(const VirtualMachine &);
	VirtualMachine &operator=(const VirtualMachine &);

	// Destroyed bottom up: vcpus, then the VM handle, then the memory.
	std::unique_ptr<GuestMemory> mem;
	std::unique_ptr<KernelVm> kernel;
	std::unique_ptr<VcpuManager> manager;
	VmConfig cfg;
	VmStatus state;
};

} // namespace kvmrun

#endif
