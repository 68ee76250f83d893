// Copyright (c) 2011 Scott Mansell <phiren@gmail.com>
// Licensed under the MIT license
// Refer to the included LICENCE file.

#ifndef KVMRUN_CHANNEL_HH
#define KVMRUN_CHANNEL_HH

#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QSharedPointer>
#include <QWaitCondition>

#include <utility>

namespace kvmrun {

template <typename T>
class Sender;

template <typename T>
class Receiver;

// State shared by the two ends of one channel.
template <typename T>
struct ChannelState {
	ChannelState() : senderAlive(true), receiverAlive(true) {}

	QMutex lock;
	QWaitCondition ready;
	QQueue<T> queue;
	bool senderAlive;
	bool receiverAlive;
};

/*
 * A single-producer/single-consumer FIFO between two threads. Each end
 * notices when its peer has been destroyed: send() fails once the
 * receiver is gone, receive() fails once the queue is drained and the
 * sender is gone.
 */
template <typename T>
class Channel {
public:
	static std::pair<Sender<T>, Receiver<T> > create()
	{
		QSharedPointer<ChannelState<T> > state(new ChannelState<T>);
		return std::make_pair(Sender<T>(state), Receiver<T>(state));
	}
};

template <typename T>
class Sender {
public:
	Sender() {}
	explicit Sender(const QSharedPointer<ChannelState<T> > &state) : state(state) {}
	Sender(Sender &&other) : state(other.state) { other.state.reset(); }
	~Sender() { close(); }

	Sender &operator=(Sender &&other)
	{
		if (this != &other) {
			close();
			state = other.state;
			other.state.reset();
		}
		return *this;
	}

	bool send(const T &msg)
	{
		if (!state)
			return false;
		QMutexLocker locker(&state->lock);
		if (!state->receiverAlive)
			return false;
		state->queue.enqueue(msg);
		state->ready.wakeOne();
		return true;
	}

	bool isValid() const { return !state.isNull(); }

	void close()
	{
		if (!state)
			return;
		{
			QMutexLocker locker(&state->lock);
			state->senderAlive = false;
			state->ready.wakeAll();
		}
		state.reset();
	}

private:
	QSharedPointer<ChannelState<T> > state;
};

template <typename T>
class Receiver {
public:
	Receiver() {}
	explicit Receiver(const QSharedPointer<ChannelState<T> > &state) : state(state) {}
	Receiver(Receiver &&other) : state(other.state) { other.state.reset(); }
	~Receiver() { close(); }

	Receiver &operator=(Receiver &&other)
	{
		if (this != &other) {
			close();
			state = other.state;
			other.state.reset();
		}
		return *this;
	}

	// Blocks until a message arrives or the sender goes away.
	bool receive(T *msg)
	{
		if (!state)
			return false;
		QMutexLocker locker(&state->lock);
		while (state->queue.isEmpty() && state->senderAlive)
			state->ready.wait(&state->lock);
		if (state->queue.isEmpty())
			return false;
		*msg = state->queue.dequeue();
		return true;
	}

	bool tryReceive(T *msg)
	{
		if (!state)
			return false;
		QMutexLocker locker(&state->lock);
		if (state->queue.isEmpty())
			return false;
		*msg = state->queue.dequeue();
		return true;
	}

	bool isValid() const { return !state.isNull(); }

	void close()
	{
		if (!state)
			return;
		{
			QMutexLocker locker(&state->lock);
			state->receiverAlive = false;
			state->queue.clear();
		}
		state.reset();
	}

private:
	QSharedPointer<ChannelState<T> > state;
};

} // namespace kvmrun

#endif
