#include "core/rawdump-writer.hpp"
#include "core/messages.hpp"
#include "library/directory.hpp"
#include "library/rawdump.hpp"
#include "library/string.hpp"
#include <chrono>

namespace rawdump
{
namespace
{
	const uint32_t WORKFLAG_QUEUED = 1;
}

const size_t writer::default_max_queued = 256;

writer::writer(const std::string& _path, size_t _max_queued)
	: name(_path), path(_path)
{
	owned_sink.reset(new byte_sink_file(path));
	sink = owned_sink.get();
	max_queued = _max_queued;
	start();
}

writer::writer(byte_sink& _sink, size_t _max_queued)
	: name("<stream>")
{
	sink = &_sink;
	max_queued = _max_queued;
	start();
}

void writer::start()
{
	if(!max_queued)
		max_queued = 1;
	in_flight = 0;
	accepting = true;
	closed = false;
	failed = false;
	bytes = 0;
	records = 0;
	messages << "Raw dump " << name << ": opened" << std::endl;
	fire();
}

writer::~writer() throw()
{
	try {
		close();
	} catch(std::exception& e) {
		messages << "Raw dump " << name << ": error closing: " << e.what() << std::endl;
	}
	request_quit();
}

uint64_t writer::now()
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

threads::future<void> writer::enqueue(const uint8_t* data, size_t len, uint64_t timestamp)
{
	if(!data || !len || len > max_payload) {
		std::string err = (stringfmt() << "Rejected packet of " << len << " bytes (must be 1-" << max_payload
			<< ")").str();
		messages << "Raw dump " << name << ": " << err << std::endl;
		return threads::failed_future<void>(err);
	}
	std::unique_ptr<pending_record> r(new pending_record);
	r->buffer = encode_record(data, len, timestamp);
	threads::future<void> f = r->done.get_future();
	{
		threads::alock h(qlock);
		while(accepting && !failed && queue.size() >= max_queued)
			qcond.wait(h);
		if(failed)
			return threads::failed_future<void>("Raw dump writer failed earlier: " + error);
		if(!accepting)
			return threads::failed_future<void>("Raw dump writer is closed");
		queue.push_back(std::move(r));
	}
	set_workflag(WORKFLAG_QUEUED);
	return f;
}

threads::future<void> writer::enqueue(const std::vector<uint8_t>& data, uint64_t timestamp)
{
	return enqueue(data.empty() ? NULL : &data[0], data.size(), timestamp);
}

threads::future<void> writer::enqueue(const std::vector<uint8_t>& data)
{
	return enqueue(data, now());
}

void writer::entry()
{
	while(true) {
		wait_workflag();
		uint32_t work = clear_workflag(~workthread::quit_request);
		drain_queue();
		if(work & workthread::quit_request) {
			drain_queue();
			return;
		}
	}
}

void writer::drain_queue()
{
	while(true) {
		std::unique_ptr<pending_record> r;
		{
			threads::alock h(qlock);
			if(queue.empty() || failed)
				return;
			r = std::move(queue.front());
			queue.pop_front();
			in_flight++;
			qcond.notify_all();
		}
		try {
			sink->write(reinterpret_cast<const char*>(&r->buffer[0]), r->buffer.size());
			sink->flush();
		} catch(std::exception& e) {
			std::string err = e.what();
			messages << "Raw dump " << name << ": write failed: " << err << std::endl;
			threads::fail_promise(r->done, err);
			fail_all(err);
			return;
		}
		{
			threads::alock h(qlock);
			bytes += r->buffer.size();
			records++;
		}
		r->done.set_value();
		{
			threads::alock h(qlock);
			in_flight--;
			qcond.notify_all();
		}
	}
}

void writer::fail_all(const std::string& err)
{
	std::deque<std::unique_ptr<pending_record>> rest;
	{
		threads::alock h(qlock);
		failed = true;
		error = err;
		rest.swap(queue);
	}
	for(auto& i : rest)
		threads::fail_promise(i->done, "Earlier write failed: " + err);
	if(!rest.empty())
		messages << "Raw dump " << name << ": dropped " << rest.size() << " queued records" << std::endl;
	threads::alock h(qlock);
	in_flight--;
	qcond.notify_all();
}

void writer::wait_drain()
{
	threads::alock h(qlock);
	while(!queue.empty() || in_flight)
		qcond.wait(h);
}

void writer::close()
{
	{
		threads::alock h(qlock);
		if(closed)
			return;
		closed = true;
		accepting = false;
		qcond.notify_all();
	}
	wait_drain();
	request_quit();
	std::string close_error;
	try {
		sink->close();
	} catch(std::exception& e) {
		close_error = e.what();
		messages << "Raw dump " << name << ": " << close_error << std::endl;
	}
	uint64_t _bytes = get_bytes_written();
	uint64_t _records = get_records_written();
	messages << "Raw dump " << name << ": closed, " << _records << " records, " << _bytes << " bytes"
		<< std::endl;
	if(path != "") {
		uintmax_t ondisk = directory::size(path);
		if(ondisk != _bytes)
			messages << "Raw dump " << name << ": size on disk (" << static_cast<intmax_t>(ondisk)
				<< ") does not match bytes written (" << _bytes << ")" << std::endl;
	}
	rethrow();
	if(close_error != "")
		throw std::runtime_error(close_error);
}

bool writer::is_failed()
{
	threads::alock h(qlock);
	return failed;
}

std::string writer::get_error()
{
	threads::alock h(qlock);
	return error;
}

uint64_t writer::get_bytes_written()
{
	threads::alock h(qlock);
	return bytes;
}

uint64_t writer::get_records_written()
{
	threads::alock h(qlock);
	return records;
}

size_t writer::get_pending()
{
	threads::alock h(qlock);
	return queue.size() + in_flight;
}
}
