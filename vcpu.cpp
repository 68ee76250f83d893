// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>
#include <exception>

#include "vcpu.hh"
#include "log.hh"

namespace kvmrun {

QString vcpuStatusName(VcpuStatus status)
{
	switch (status) {
		case VcpuStatus::Epoch:
			return "Epoch";
		case VcpuStatus::Paused:
			return "Paused";
		case VcpuStatus::Running:
			return "Running";
		case VcpuStatus::Exited:
			return "Exited";
	}
	return QString();
}

Vcpu::Vcpu(unsigned id, std::unique_ptr<KernelVcpu> kernel,
		Receiver<VcpuMsg> controlRx, Sender<VcpuMsg> replyTx)
	: vcpuId(id), state(VcpuStatus::Epoch), exitPending(false),
	  handle(std::move(kernel)), controlRx(std::move(controlRx)), replyTx(std::move(replyTx))
{
}

void Vcpu::init()
{
	this->state = VcpuStatus::Paused;
	qCDebug(lcVcpu, "vcpu %u initialised", this->vcpuId);
}

void Vcpu::run(VcpuLoop &loop)
{
	VcpuMsg msg;
	while (this->state != VcpuStatus::Exited) {
		if (!this->controlRx.receive(&msg)) {
			qCWarning(lcVcpu, "vcpu %u: control channel closed", this->vcpuId);
			exit();
			return;
		}

		switch (msg.type) {
			case VcpuMsg::Run:
				// Only reached while Epoch or Paused, Running is served by pollControl().
				execute(loop);
				break;
			case VcpuMsg::Exit:
				exit();
				break;
			case VcpuMsg::RunReply:
				qCWarning(lcVcpu, "vcpu %u: ignoring reply on control channel", this->vcpuId);
				break;
		}
	}
}

bool Vcpu::pollControl()
{
	VcpuMsg msg;
	while (!this->exitPending && this->controlRx.tryReceive(&msg)) {
		switch (msg.type) {
			case VcpuMsg::Run:
				reply(this->state);
				break;
			case VcpuMsg::Exit:
				qCDebug(lcVcpu, "vcpu %u: exit requested while running", this->vcpuId);
				this->exitPending = true;
				break;
			case VcpuMsg::RunReply:
				qCWarning(lcVcpu, "vcpu %u: ignoring reply on control channel", this->vcpuId);
				break;
		}
	}
	return this->exitPending;
}

void Vcpu::execute(VcpuLoop &loop)
{
	this->state = VcpuStatus::Running;
	qCDebug(lcVcpu, "vcpu %u running", this->vcpuId);

	loop.run(*this);

	this->state = VcpuStatus::Paused;
	qCDebug(lcVcpu, "vcpu %u paused", this->vcpuId);
	reply(VcpuStatus::Paused);

	if (this->exitPending)
		exit();
}

void Vcpu::exit()
{
	this->handle.reset();
	this->state = VcpuStatus::Exited;
	qCDebug(lcVcpu, "vcpu %u exited", this->vcpuId);
}

void Vcpu::reply(VcpuStatus status)
{
	if (!this->replyTx.send(VcpuMsg::runReply(status)))
		qCWarning(lcVcpu, "vcpu %u: reply channel closed", this->vcpuId);
}

VcpuWorker::VcpuWorker(std::unique_ptr<Vcpu> vcpu, std::shared_ptr<VcpuLoop> loop)
	: vcpuId(vcpu->id()), vcpu(std::move(vcpu)), loop(loop), crashFlag(false)
{
	setObjectName(QString("vcpu%1").arg(this->vcpuId));
}

void VcpuWorker::init()
{
	this->vcpu->init();
	emit initialised(this->vcpuId, this->vcpu->status());
}

void VcpuWorker::run()
{
	std::unique_ptr<Vcpu> vcpu(std::move(this->vcpu));

	try {
		vcpu->run(*this->loop);
	} catch (const std::exception &e) {
		this->crashFlag = true;
		this->reason = QString::fromLocal8Bit(e.what());
		qCCritical(lcVcpu, "vcpu %u crashed: %s", this->vcpuId, e.what());
		emit failure(this->vcpuId, this->reason);
	}

	// Channels and kernel handle go away here, on the vcpu thread.
	vcpu.reset();
	emit finished();
}

} // namespace kvmrun
