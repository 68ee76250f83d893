// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>

#include "hypervisor.hh"
#include "kvm.hh"
#include "log.hh"

namespace kvmrun {

Hypervisor::Hypervisor(const VmConfig &config, std::unique_ptr<KernelSystem> system)
	: hasVmm(config.hasVmm), vmm(config.vmm), system(std::move(system))
{
}

std::unique_ptr<Hypervisor> Hypervisor::create(const VmConfig &config, Error *error)
{
	std::unique_ptr<KvmSystem> kvm = KvmSystem::open(error);
	if (!kvm)
		return std::unique_ptr<Hypervisor>();
	return create(std::move(kvm), config, std::make_shared<IdleLoop>(), error);
}

std::unique_ptr<Hypervisor> Hypervisor::create(std::unique_ptr<KernelSystem> system,
		const VmConfig &config, std::shared_ptr<VcpuLoop> loop, Error *error)
{
	std::unique_ptr<Hypervisor> hv(new Hypervisor(config, std::move(system)));

	std::unique_ptr<KernelVm> kernel = hv->system->createVm(error);
	if (!kernel)
		return std::unique_ptr<Hypervisor>();

	// The hypervisor keeps the vmm section, the VM gets the rest.
	VmConfig vmConfig = config;
	vmConfig.hasVmm = false;

	hv->machine = VirtualMachine::create(std::move(kernel), vmConfig, loop, error);
	if (!hv->machine)
		return std::unique_ptr<Hypervisor>();

	qCInfo(lcHypervisor, "hypervisor ready");
	return hv;
}

} // namespace kvmrun
