// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>

#include "virtual_machine.hh"
#include "log.hh"

namespace kvmrun {

QString vmStatusName(VmStatus status)
{
	switch (status) {
		case VmStatus::Epoch:
			return "Epoch";
		case VmStatus::Paused:
			return "Paused";
		case VmStatus::Running:
			return "Running";
		case VmStatus::Exited:
			return "Exited";
	}
	return QString();
}

VirtualMachine::VirtualMachine(const VmConfig &config)
	: cfg(config), state(VmStatus::Epoch)
{
}

VirtualMachine::~VirtualMachine()
{
	if (this->manager && this->state != VmStatus::Exited)
		shutdown();
}

std::unique_ptr<VirtualMachine> VirtualMachine::create(std::unique_ptr<KernelVm> kernel,
		const VmConfig &config, std::shared_ptr<VcpuLoop> loop, Error *error)
{
	std::unique_ptr<VirtualMachine> vm(new VirtualMachine(config));

	vm->mem = GuestMemory::create(config.memory.sizeMib, error);
	if (!vm->mem)
		return std::unique_ptr<VirtualMachine>();
	vm->kernel = std::move(kernel);

	const QVector<GuestRegion> &regions = vm->mem->regions();
	for (int slot = 0; slot < regions.size(); slot++) {
		const GuestRegion &region = regions[slot];
		if (!vm->kernel->setUserMemoryRegion(slot, region.guestPhys, region.size, region.host, error))
			return std::unique_ptr<VirtualMachine>();
		qCDebug(lcVm, "slot %d: guest 0x%llx size 0x%llx", slot,
				(unsigned long long) region.guestPhys, (unsigned long long) region.size);
	}

	vm->manager = VcpuManager::create(*vm->kernel, config.cpu, loop, error);
	if (!vm->manager)
		return std::unique_ptr<VirtualMachine>();

	vm->state = VmStatus::Paused;
	qCInfo(lcVm, "vm created: %u vcpu(s), %u MiB", config.cpu.count, config.memory.sizeMib);
	return vm;
}

QVector<VcpuResult> VirtualMachine::broadcast(const VcpuMsg &msg)
{
	QVector<VcpuResult> results = this->manager->broadcast(msg);

	if (msg.type == VcpuMsg::Exit && this->state != VmStatus::Exited) {
		QVector<Error> errors = shutdown();
		for (int i = 0; i < errors.size(); i++) {
			if (!errors[i].isNull())
				results[i] = VcpuResult::failed(errors[i]);
		}
		return results;
	}

	updateStatus();
	return results;
}

bool VirtualMachine::post(unsigned index, const VcpuMsg &msg, Error *error)
{
	return this->manager->post(index, msg, error);
}

VcpuResult VirtualMachine::reply(unsigned index)
{
	VcpuResult result = this->manager->reply(index);
	if (result.isOk())
		updateStatus();
	return result;
}

QVector<Error> VirtualMachine::shutdown()
{
	QVector<Error> errors = this->manager->shutdown();
	this->state = VmStatus::Exited;
	qCInfo(lcVm, "vm exited");
	return errors;
}

// Quorum: every vcpu has last reported the same Paused or Running status.
void VirtualMachine::updateStatus()
{
	if (this->state == VmStatus::Exited || this->manager->count() == 0)
		return;

	VcpuStatus agreed = this->manager->status(0);
	for (unsigned i = 1; i < this->manager->count(); i++) {
		if (this->manager->status(i) != agreed) {
			qCDebug(lcVm) << "no quorum, vm stays" << vmStatusName(this->state);
			return;
		}
	}

	switch (agreed) {
		case VcpuStatus::Paused:
			this->state = VmStatus::Paused;
			break;
		case VcpuStatus::Running:
			this->state = VmStatus::Running;
			break;
		case VcpuStatus::Epoch:
		case VcpuStatus::Exited:
			// Exited is only reached once shutdown() has joined the threads.
			break;
	}
	qCDebug(lcVm) << "vm" << vmStatusName(this->state);
}

} // namespace kvmrun
