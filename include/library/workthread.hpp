#ifndef _library_workthread__hpp__included__
#define _library_workthread__hpp__included__

#include <cstdint>
#include <string>
#include "threads.hpp"

/**
 * A worker thread driven by work flags.
 *
 * The derived class implements entry(), which typically loops on wait_workflag() until it sees
 * quit_request. Derived destructors must call request_quit() before their own members go away.
 *
 * Note: All methods (except entry) are thread-safe.
 */
class workthread
{
public:
/**
 * Standard quit request.
 */
	static const uint32_t quit_request;
/**
 * Constructor.
 */
	workthread();
/**
 * Destructor. Joins the thread if it is still running.
 */
	virtual ~workthread();
/**
 * Request quit and wait for the thread to exit. Idempotent.
 */
	void request_quit();
/**
 * Rethrow exception escaped from entry(), if any.
 *
 * Throws std::bad_alloc: entry() ran out of memory.
 * Throws std::runtime_error: entry() threw something else.
 */
	void rethrow();
/**
 * Set work flag.
 *
 * Parameter flag: The flags to set.
 */
	void set_workflag(uint32_t flag);
/**
 * Clear work flag.
 *
 * Parameter flag: Work flags to clear.
 * Returns: The workflags before clearing.
 */
	uint32_t clear_workflag(uint32_t flag);
/**
 * Wait until work flags nonzero.
 *
 * Returns: Current work flags.
 */
	uint32_t wait_workflag();
protected:
/**
 * Thread entrypoint.
 *
 * Notes: Exceptions thrown are caught and can be picked up with rethrow().
 */
	virtual void entry() = 0;
/**
 * Start actually running the thread.
 */
	void fire();
private:
	workthread(const workthread&);
	workthread& operator=(const workthread&);
	void run() throw();
	threads::thread* thread;
	threads::cv condition;
	threads::lock mlock;
	bool joined;
	uint32_t workflag;
	bool exception_caught;
	bool exception_oom;
	std::string exception_text;
};

#endif
