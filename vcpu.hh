// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_VCPU_HH
#define KVMRUN_VCPU_HH

#include <QString>
#include <QObject>
#include <memory>

#include "channel.hh"
#include "kernel.hh"

namespace kvmrun {

// Lifecycle of a vcpu: Epoch -> Paused <-> Running, then Exited.
enum class VcpuStatus {
	Epoch,
	Paused,
	Running,
	Exited
};

QString vcpuStatusName(VcpuStatus status);

/*
 * Control and reply messages exchanged with a vcpu thread.
 *
 * Run: start executing if Epoch or Paused. Answered with RunReply once the
 *      execution loop yields, or at once with the current status if the
 *      vcpu is already Running.
 * Exit: release the vcpu and end its thread. Never answered.
 */
struct VcpuMsg {
	enum Type {
		Run,
		RunReply,
		Exit
	};

	VcpuMsg() : type(Run), status(VcpuStatus::Epoch) {}

	static VcpuMsg run() { return VcpuMsg(Run, VcpuStatus::Epoch); }
	static VcpuMsg runReply(VcpuStatus status) { return VcpuMsg(RunReply, status); }
	static VcpuMsg exit() { return VcpuMsg(Exit, VcpuStatus::Epoch); }

	// Run and Exit travel to a vcpu, RunReply only comes back.
	bool isControl() const { return this->type != RunReply; }

	Type type;
	VcpuStatus status;

private:
	VcpuMsg(Type type, VcpuStatus status) : type(type), status(status) {}
};

class Vcpu;

/*
 * Guest execution for one vcpu, supplied by the emulation layer and shared
 * by all vcpu threads. run() returns when the vcpu should pause. There is
 * no preemption: a long running loop has to call Vcpu::pollControl() and
 * return once it reports a pending Exit.
 */
class VcpuLoop {
public:
	virtual ~VcpuLoop() {}
	virtual void run(Vcpu &vcpu) = 0;
};

// Returns immediately.
class IdleLoop : public VcpuLoop {
public:
	void run(Vcpu &) {}
};

/*
 * One virtual cpu. Lives on its own thread for its whole life and is the
 * only owner of its kernel handle and of both channel ends.
 */
class Vcpu {
public:
	Vcpu(unsigned id, std::unique_ptr<KernelVcpu> kernel,
			Receiver<VcpuMsg> controlRx, Sender<VcpuMsg> replyTx);

	unsigned id() const { return this->vcpuId; }
	VcpuStatus status() const { return this->state; }
	KernelVcpu *kernel() const { return this->handle.get(); }

	// Epoch -> Paused.
	void init();

	// Serves control messages until Exit arrives or the manager disappears.
	void run(VcpuLoop &loop);

	/*
	 * Handles control messages queued while Running. A Run is answered
	 * with RunReply(Running), an Exit is remembered. Returns true if the
	 * execution loop should return.
	 */
	bool pollControl();

private:
	void execute(VcpuLoop &loop);
	void exit();
	void reply(VcpuStatus status);

	unsigned vcpuId;
	VcpuStatus state;
	bool exitPending;
	std::unique_ptr<KernelVcpu> handle;
	Receiver<VcpuMsg> controlRx;
	Sender<VcpuMsg> replyTx;
};

/*
 * Drives one Vcpu on the thread it has been moved to. The Vcpu is handed
 * over in the constructor and destroyed on that thread before finished()
 * is emitted.
 */
class VcpuWorker : public QObject {
	Q_OBJECT

public:
	VcpuWorker(std::unique_ptr<Vcpu> vcpu, std::shared_ptr<VcpuLoop> loop);

	unsigned id() const { return this->vcpuId; }

	// Only meaningful once the owning thread has been joined.
	bool crashed() const { return this->crashFlag; }
	QString crashReason() const { return this->reason; }

public slots:
	void init();
	void run();

signals:
	void initialised(unsigned id, kvmrun::VcpuStatus status);
	void failure(unsigned id, const QString &reason);
	void finished();

private:
	unsigned vcpuId;
	std::unique_ptr<Vcpu> vcpu;
	std::shared_ptr<VcpuLoop> loop;
	bool crashFlag;
	QString reason;
};

} // namespace kvmrun

Q_DECLARE_METATYPE(kvmrun::VcpuStatus)

#endif
