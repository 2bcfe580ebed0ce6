#ifndef _rawdump_writer__hpp__included__
#define _rawdump_writer__hpp__included__

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "library/bytesink.hpp"
#include "library/threads.hpp"
#include "library/workthread.hpp"

namespace rawdump
{
/**
 * Serialized writer of raw dump records.
 *
 * Records are encoded on enqueue and written by a worker thread strictly in enqueue order, each as one
 * write. The queue is bounded: enqueue blocks the producer while it is full.
 *
 * A failed write fails that record, fails every record queued behind it and puts the writer into failed
 * state, where further enqueues fail immediately.
 *
 * Note: All public methods are thread-safe.
 */
class writer : public workthread
{
public:
/**
 * Default maximum number of queued records.
 */
	static const size_t default_max_queued;
/**
 * Create writer writing to a file (created or truncated now).
 *
 * Parameter path: The dump file.
 * Parameter max_queued: Maximum number of queued records before enqueue blocks.
 * Throws std::runtime_error: Can't open the file.
 */
	writer(const std::string& path, size_t max_queued = default_max_queued);
/**
 * Create writer writing to a sink.
 *
 * Parameter sink: The sink. Must outlive the writer. Closed by close().
 * Parameter max_queued: Maximum number of queued records before enqueue blocks.
 */
	writer(byte_sink& sink, size_t max_queued = default_max_queued);
/**
 * Destructor. Closes the writer if not already closed.
 */
	~writer() throw();
/**
 * Queue a record.
 *
 * Parameter data: The payload.
 * Parameter len: The payload length (1-65535).
 * Parameter timestamp: The timestamp in milliseconds.
 * Returns: Future that becomes ready when the record has been written, or fails with
 *	std::runtime_error if it can't be (bad size, closed or failed writer, write error).
 */
	threads::future<void> enqueue(const uint8_t* data, size_t len, uint64_t timestamp);
	threads::future<void> enqueue(const std::vector<uint8_t>& data, uint64_t timestamp);
/**
 * Queue a record stamped with current wall-clock time.
 */
	threads::future<void> enqueue(const std::vector<uint8_t>& data);
/**
 * Wait until every queued record has been written (or failed).
 */
	void wait_drain();
/**
 * Stop accepting records, write out the queue and close the sink. Idempotent.
 *
 * Throws std::runtime_error: Closing the sink failed.
 */
	void close();
/**
 * Has a write failed?
 */
	bool is_failed();
/**
 * Get the error message of the failed write.
 */
	std::string get_error();
/**
 * Get number of bytes successfully written.
 */
	uint64_t get_bytes_written();
/**
 * Get number of records successfully written.
 */
	uint64_t get_records_written();
/**
 * Get number of records waiting or being written.
 */
	size_t get_pending();
/**
 * Get the current wall-clock time in milliseconds since epoch.
 */
	static uint64_t now();
protected:
	void entry();
private:
	struct pending_record
	{
		std::vector<uint8_t> buffer;
		threads::promise<void> done;
	};
	void start();
	void drain_queue();
	void fail_all(const std::string& err);
	std::string name;
	std::string path;
	std::unique_ptr<byte_sink> owned_sink;
	byte_sink* sink;
	size_t max_queued;
	threads::lock qlock;
	threads::cv qcond;
	std::deque<std::unique_ptr<pending_record>> queue;
	size_t in_flight;
	bool accepting;
	bool closed;
	bool failed;
	std::string error;
	uint64_t bytes;
	uint64_t records;
};
}

#endif
