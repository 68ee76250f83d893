// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#include <QtCore>

#include "vcpu_manager.hh"
#include "log.hh"

namespace kvmrun {

VcpuManager::VcpuManager()
	: joined(false)
{
}

std::unique_ptr<VcpuManager> VcpuManager::create(KernelVm &vm, const CpuConfig &config,
		std::shared_ptr<VcpuLoop> loop, Error *error)
{
	std::unique_ptr<VcpuManager> manager(new VcpuManager());
	QSemaphore *ready = &manager->ready;

	// Sized up front: vcpu threads write their start up status in place.
	manager->statuses.assign(config.count, VcpuStatus::Epoch);
	VcpuStatus *statuses = manager->statuses.data();

	for (unsigned i = 0; i < config.count; i++) {
		std::unique_ptr<KernelVcpu> kernel = vm.createVcpu(i, error);
		if (!kernel) {
			qCCritical(lcVcpu, "failed to create vcpu %u of %u", i, config.count);
			// The destructor stops the vcpus created so far.
			return std::unique_ptr<VcpuManager>();
		}

		std::pair<Sender<VcpuMsg>, Receiver<VcpuMsg> > control = Channel<VcpuMsg>::create();
		std::pair<Sender<VcpuMsg>, Receiver<VcpuMsg> > replies = Channel<VcpuMsg>::create();

		std::unique_ptr<Vcpu> vcpu(new Vcpu(i, std::move(kernel),
				std::move(control.second), std::move(replies.first)));
		std::unique_ptr<VcpuWorker> worker(new VcpuWorker(std::move(vcpu), loop));
		std::unique_ptr<QThread> thread(new QThread());
		thread->setObjectName(worker->objectName());
		worker->moveToThread(thread.get());

		// Queued, so both slots run in order from the thread's event loop.
		QObject::connect(thread.get(), &QThread::started, worker.get(), &VcpuWorker::init,
				Qt::QueuedConnection);
		QObject::connect(thread.get(), &QThread::started, worker.get(), &VcpuWorker::run,
				Qt::QueuedConnection);
		QObject::connect(worker.get(), &VcpuWorker::finished, thread.get(), &QThread::quit,
				Qt::DirectConnection);

		QObject::connect(worker.get(), &VcpuWorker::initialised,
				[ready, statuses](unsigned id, VcpuStatus status) {
			statuses[id] = status;
			ready->release();
		});
		QObject::connect(worker.get(), &VcpuWorker::failure, [ready](unsigned, const QString &) {
			ready->release();
		});

		thread->start();
		manager->threads.push_back(std::move(thread));
		manager->workers.push_back(std::move(worker));
		manager->controlTx.push_back(std::move(control.first));
		manager->replyRx.push_back(std::move(replies.second));
		manager->pendingRuns.push_back(0);
	}

	manager->ready.acquire(config.count);
	qCInfo(lcVcpu, "%u vcpu(s) ready", config.count);
	return manager;
}

VcpuManager::~VcpuManager()
{
	if (!this->joined)
		shutdown();
}

unsigned VcpuManager::liveThreads() const
{
	unsigned live = 0;
	for (size_t i = 0; i < this->threads.size(); i++) {
		if (!this->threads[i]->isFinished())
			live++;
	}
	return live;
}

VcpuStatus VcpuManager::status(unsigned index) const
{
	if (index >= count())
		return VcpuStatus::Exited;
	return this->statuses[index];
}

bool VcpuManager::post(unsigned index, const VcpuMsg &msg, Error *error)
{
	if (!msg.isControl()) {
		setError(error, Error::protocol(index, "a reply can't be sent to a vcpu"));
		return false;
	}
	if (index >= count()) {
		setError(error, Error::channel(index));
		return false;
	}
	if (!this->controlTx[index].send(msg)) {
		this->statuses[index] = VcpuStatus::Exited;
		setError(error, Error::channel(index));
		return false;
	}
	if (msg.type == VcpuMsg::Run)
		this->pendingRuns[index]++;
	return true;
}

VcpuResult VcpuManager::reply(unsigned index)
{
	if (index >= count())
		return VcpuResult::failed(Error::channel(index));
	if (this->pendingRuns[index] == 0)
		return VcpuResult::failed(Error::protocol(index, "no reply outstanding"));

	VcpuMsg msg;
	this->pendingRuns[index]--;
	if (!this->replyRx[index].receive(&msg)) {
		this->statuses[index] = VcpuStatus::Exited;
		return VcpuResult::failed(Error::channel(index));
	}
	this->statuses[index] = msg.status;
	return VcpuResult::ok(msg.status);
}

// The vcpu closes its reply channel as its thread ends.
VcpuResult VcpuManager::awaitExit(unsigned index)
{
	VcpuMsg msg;
	while (this->replyRx[index].receive(&msg))
		qCDebug(lcVcpu, "vcpu %u: dropping reply sent before exit", index);
	this->pendingRuns[index] = 0;
	this->statuses[index] = VcpuStatus::Exited;
	return VcpuResult::ok(VcpuStatus::Exited);
}

QVector<VcpuResult> VcpuManager::broadcast(const VcpuMsg &msg)
{
	QVector<VcpuResult> results(count());
	QVector<Error> errors(count());
	QVector<bool> delivered(count());

	for (unsigned i = 0; i < count(); i++)
		delivered[i] = post(i, msg, &errors[i]);

	for (unsigned i = 0; i < count(); i++) {
		if (!delivered[i]) {
			qCWarning(lcVcpu) << errors[i].toString();
			results[i] = VcpuResult::failed(errors[i]);
		} else if (msg.type == VcpuMsg::Exit) {
			results[i] = awaitExit(i);
		} else {
			results[i] = reply(i);
		}
	}
	return results;
}

QVector<Error> VcpuManager::shutdown()
{
	QVector<Error> errors(count());

	if (this->joined) {
		for (unsigned i = 0; i < count(); i++)
			errors[i] = Error::channel(i);
		return errors;
	}

	// A closed control channel means the vcpu is already gone, join tells how.
	for (unsigned i = 0; i < count(); i++) {
		if (!post(i, VcpuMsg::exit()))
			qCDebug(lcVcpu, "vcpu %u already exited", i);
	}

	for (unsigned i = 0; i < count(); i++) {
		this->threads[i]->wait();
		this->statuses[i] = VcpuStatus::Exited;
		this->pendingRuns[i] = 0;
		if (this->workers[i]->crashed()) {
			errors[i] = Error::join(i, this->workers[i]->crashReason());
			qCCritical(lcVcpu) << errors[i].toString();
		}
	}

	this->joined = true;
	qCInfo(lcVcpu, "%u vcpu thread(s) joined", count());
	return errors;
}

} // namespace kvmrun
