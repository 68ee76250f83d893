// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_VCPU_MANAGER_HH
#define KVMRUN_VCPU_MANAGER_HH

#include <QSemaphore>
#include <QThread>
#include <QVector>
#include <memory>
#include <vector>

#include "config.hh"
#include "vcpu.hh"

namespace kvmrun {

// What one vcpu answered, or why it could not answer.
class VcpuResult {
public:
	VcpuResult() : state(VcpuStatus::Epoch) {}

	static VcpuResult ok(VcpuStatus status) { return VcpuResult(status, Error()); }
	static VcpuResult failed(const Error &error) { return VcpuResult(VcpuStatus::Epoch, error); }

	bool isOk() const { return this->err.isNull(); }
	VcpuStatus status() const { return this->state; }
	Error error() const { return this->err; }

private:
	VcpuResult(VcpuStatus status, const Error &error) : state(status), err(error) {}

	VcpuStatus state;
	Error err;
};

/*
 * Owns every vcpu thread of a VM together with the sending end of each
 * control channel and the receiving end of each reply channel. Index i
 * refers to the same vcpu everywhere. Must be used from one control
 * thread only.
 */
class VcpuManager {
public:
	/*
	 * Creates config.count vcpus with indices 0..count-1 and returns once
	 * every one of them has reported Paused. On the first kernel failure
	 * *error is set, the threads spawned so far are shut down and null is
	 * returned.
	 */
	static std::unique_ptr<VcpuManager> create(KernelVm &vm, const CpuConfig &config,
			std::shared_ptr<VcpuLoop> loop, Error *error);

	// Shuts down if that hasn't happened yet.
	~VcpuManager();

	unsigned count() const { return this->threads.size(); }

	// Number of vcpu threads that have not finished.
	unsigned liveThreads() const;

	// Last status vcpu index reported: at start up, in a reply, or on exit.
	VcpuStatus status(unsigned index) const;

	/*
	 * Sends a control message (Run or Exit) to one vcpu. RunReply is
	 * refused with a ProtocolError, a vcpu that is gone gives ChannelError.
	 */
	bool post(unsigned index, const VcpuMsg &msg, Error *error = 0);

	/*
	 * Waits for the answer to a Run posted earlier. Fails at once with a
	 * ProtocolError if no Run is outstanding for this vcpu.
	 */
	VcpuResult reply(unsigned index);

	/*
	 * Sends msg to every vcpu in index order, then collects one result per
	 * vcpu in the same order. A vcpu that can't be reached yields a
	 * ChannelError without affecting the others. After Exit the result is
	 * Exited once the vcpu has dropped its channels. RunReply is not sent
	 * at all and yields a ProtocolError for every vcpu.
	 */
	QVector<VcpuResult> broadcast(const VcpuMsg &msg);

	/*
	 * Sends Exit to every vcpu and joins every thread. The entry of a thread
	 * that died with an exception is a JoinError, the others are null.
	 * Calling it again reports ChannelError for every vcpu.
	 */
	QVector<Error> shutdown();

private:
	VcpuManager();
	VcpuManager(const VcpuManager &);
	VcpuManager &operator=(const VcpuManager &);

	VcpuResult awaitExit(unsigned index);

	std::vector<std::unique_ptr<QThread> > threads;
	std::vector<std::unique_ptr<VcpuWorker> > workers;
	std::vector<Sender<VcpuMsg> > controlTx;
	std::vector<Receiver<VcpuMsg> > replyRx;
	std::vector<VcpuStatus> statuses;
	std::vector<unsigned> pendingRuns;
	QSemaphore ready;
	bool joined;
};

} // namespace kvmrun

#endif
