// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_HYPERVISOR_HH
#define KVMRUN_HYPERVISOR_HH

#include <memory>

#include "virtual_machine.hh"

namespace kvmrun {

/*
 * Top of the ownership tree: the system handle and the single VM made
 * from it. One Hypervisor runs one VM.
 */
class Hypervisor {
public:
	// Opens /dev/kvm, guest execution is the idle loop.
	static std::unique_ptr<Hypervisor> create(const VmConfig &config, Error *error);

	static std::unique_ptr<Hypervisor> create(std::unique_ptr<KernelSystem> system,
			const VmConfig &config, std::shared_ptr<VcpuLoop> loop, Error *error);

	bool hasVmmConfig() const { return this->hasVmm; }
	const VmmConfig &vmmConfig() const { return this->vmm; }
	VirtualMachine &vm() { return *this->machine; }

private:
	Hypervisor(const VmConfig &config, std::unique_ptr<KernelSystem> system);
	Hypervisor(const Hypervisor &);
	Hypervisor &operator=(const Hypervisor &);

	bool hasVmm;
	VmmConfig vmm;
	std::unique_ptr<KernelSystem> system;
	std::unique_ptr<VirtualMachine> machine;
};

} // namespace kvmrun

#endif
