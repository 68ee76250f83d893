// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <gtest/gtest.h>

#include "fake_kernel.hh"
#include "virtual_machine.hh"

using namespace kvmrun;
using namespace kvmrun::test;

namespace {

VmConfig makeConfig(unsigned cpus, unsigned sizeMib)
{
	VmConfig config;
	config.cpu.count = cpus;
	config.memory.sizeMib = sizeMib;
	config.os.cmdline = "console=ttyS0";
	config.hasVmm = false;
	config.vmm.hasLog = false;
	return config;
}

} // namespace

TEST(VirtualMachineTest, CreatedPausedWithMemoryRegistered)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	Error error;
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(2, 128),
		std::make_shared<IdleLoop>(), &error);
	ASSERT_TRUE(vm != nullptr) << qPrintable(error.toString());

	EXPECT_EQ(VmStatus::Paused, vm->status());
	EXPECT_EQ(2u, vm->vcpus().count());
	EXPECT_EQ(128 * GuestMemory::MIB, vm->memory().size());
	EXPECT_EQ(QString("console=ttyS0"), vm->config().os.cmdline);

	ASSERT_EQ(1, state->slots.size());
	EXPECT_EQ(0u, state->slots[0]);
	EXPECT_EQ(128 * GuestMemory::MIB, state->regionSizes[0]);
}

TEST(VirtualMachineTest, RunThenShutdown)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(1, 128),
		std::make_shared<IdleLoop>(), 0);
	ASSERT_TRUE(vm != nullptr);

	QVector<VcpuResult> results = vm->broadcast(VcpuMsg::run());
	ASSERT_EQ(1, results.size());
	ASSERT_TRUE(results[0].isOk());
	EXPECT_EQ(VcpuStatus::Paused, results[0].status());
	EXPECT_EQ(VmStatus::Paused, vm->status());

	foreach (const Error &e, vm->shutdown())
		EXPECT_TRUE(e.isNull());
	EXPECT_EQ(VmStatus::Exited, vm->status());
	EXPECT_EQ(0u, vm->vcpus().liveThreads());

	results = vm->broadcast(VcpuMsg::run());
	EXPECT_EQ(Error::ChannelError, results[0].error().kind());
	EXPECT_EQ(VmStatus::Exited, vm->status());
}

TEST(VirtualMachineTest, StatusFollowsRunningQuorum)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	std::shared_ptr<GatedLoop> loop = std::make_shared<GatedLoop>();
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(2, 16), loop, 0);
	ASSERT_TRUE(vm != nullptr);

	ASSERT_TRUE(vm->post(0, VcpuMsg::run()));
	ASSERT_TRUE(vm->post(1, VcpuMsg::run()));
	loop->started.acquire(2);

	// Both vcpus are inside the loop, a second Run is answered with Running.
	QVector<VcpuResult> results = vm->broadcast(VcpuMsg::run());
	ASSERT_EQ(2, results.size());
	EXPECT_EQ(VcpuStatus::Running, results[0].status());
	EXPECT_EQ(VcpuStatus::Running, results[1].status());
	EXPECT_EQ(VmStatus::Running, vm->status());

	loop->gate.release(2);
	EXPECT_EQ(VcpuStatus::Paused, vm->reply(0).status());
	EXPECT_EQ(VmStatus::Running, vm->status());
	EXPECT_EQ(VcpuStatus::Paused, vm->reply(1).status());
	EXPECT_EQ(VmStatus::Paused, vm->status());

	vm->shutdown();
	EXPECT_EQ(VmStatus::Exited, vm->status());
}

TEST(VirtualMachineTest, BroadcastExitJoinsThreads)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(3, 16),
		std::make_shared<IdleLoop>(), 0);
	ASSERT_TRUE(vm != nullptr);

	vm->broadcast(VcpuMsg::run());
	QVector<VcpuResult> results = vm->broadcast(VcpuMsg::exit());
	ASSERT_EQ(3, results.size());
	foreach (const VcpuResult &result, results) {
		ASSERT_TRUE(result.isOk());
		EXPECT_EQ(VcpuStatus::Exited, result.status());
	}
	EXPECT_EQ(VmStatus::Exited, vm->status());
	EXPECT_EQ(0u, vm->vcpus().liveThreads());
	EXPECT_EQ(0, state->liveVcpus.load());
}

TEST(VirtualMachineTest, BroadcastReplyLeavesVmUntouched)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(2, 16),
		std::make_shared<IdleLoop>(), 0);
	ASSERT_TRUE(vm != nullptr);

	QVector<VcpuResult> results = vm->broadcast(VcpuMsg::runReply(VcpuStatus::Running));
	ASSERT_EQ(2, results.size());
	EXPECT_EQ(Error::ProtocolError, results[0].error().kind());
	EXPECT_EQ(Error::ProtocolError, results[1].error().kind());
	EXPECT_EQ(VmStatus::Paused, vm->status());
	EXPECT_EQ(2u, vm->vcpus().liveThreads());
}

TEST(VirtualMachineTest, NoQuorumKeepsStatus)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(2, 16),
		std::make_shared<FaultingLoop>(0), 0);
	ASSERT_TRUE(vm != nullptr);

	QVector<VcpuResult> results = vm->broadcast(VcpuMsg::run());
	EXPECT_FALSE(results[0].isOk());
	EXPECT_TRUE(results[1].isOk());
	EXPECT_EQ(VmStatus::Paused, vm->status());

	QVector<Error> errors = vm->shutdown();
	EXPECT_EQ(Error::JoinError, errors[0].kind());
	EXPECT_EQ(VmStatus::Exited, vm->status());
}

TEST(VirtualMachineTest, VcpuFailurePropagatesUnchanged)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	state->failVcpuAt = 1;

	Error error;
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(3, 16),
		std::make_shared<IdleLoop>(), &error);
	EXPECT_TRUE(vm == nullptr);
	EXPECT_EQ(Error::ioctl(EMFILE, "KVM_CREATE_VCPU"), error);
	EXPECT_EQ(0, state->liveVcpus.load());
	EXPECT_EQ(0, state->liveVms.load());
	EXPECT_FALSE(state->vcpusOutlivedVm.load());
}

TEST(VirtualMachineTest, MemoryRegistrationFailureReleasesVm)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	state->failRegion = true;

	Error error;
	std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
		std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(1, 16),
		std::make_shared<IdleLoop>(), &error);
	EXPECT_TRUE(vm == nullptr);
	EXPECT_EQ(Error::IoctlError, error.kind());
	EXPECT_TRUE(state->createdVcpus.isEmpty());
	EXPECT_EQ(0, state->liveVms.load());
}

TEST(VirtualMachineTest, VcpusReleasedBeforeVmHandle)
{
	std::shared_ptr<FakeKernelState> state = std::make_shared<FakeKernelState>();
	{
		std::unique_ptr<VirtualMachine> vm = VirtualMachine::create(
			std::unique_ptr<KernelVm>(new FakeVm(state)), makeConfig(4, 16),
			std::make_shared<IdleLoop>(), 0);
		ASSERT_TRUE(vm != nullptr);
		vm->broadcast(VcpuMsg::run());
	}
	EXPECT_EQ(0, state->liveVms.load());
	EXPECT_EQ(0, state->liveVcpus.load());
	EXPECT_FALSE(state->vcpusOutlivedVm.load());
}
