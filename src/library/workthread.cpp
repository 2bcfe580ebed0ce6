#include "workthread.hpp"
#include <stdexcept>

const uint32_t workthread::quit_request = 0x80000000U;

workthread::workthread()
{
	thread = NULL;
	workflag = 0;
	exception_caught = false;
	exception_oom = false;
	joined = false;
}

workthread::~workthread()
{
	request_quit();
	delete thread;
}

void workthread::request_quit()
{
	set_workflag(quit_request);
	threads::thread* t;
	{
		threads::alock h(mlock);
		if(!thread || joined)
			return;
		joined = true;
		t = thread;
	}
	t->join();
}

void workthread::rethrow()
{
	threads::alock h(mlock);
	if(exception_caught) {
		if(exception_oom)
			throw std::bad_alloc();
		else
			throw std::runtime_error(exception_text);
	}
}

void workthread::set_workflag(uint32_t flag)
{
	threads::alock h(mlock);
	workflag |= flag;
	condition.notify_all();
}

uint32_t workthread::clear_workflag(uint32_t flag)
{
	threads::alock h(mlock);
	uint32_t tmp = workflag;
	workflag &= ~flag;
	return tmp;
}

uint32_t workthread::wait_workflag()
{
	threads::alock h(mlock);
	while(!workflag)
		condition.wait(h);
	return workflag;
}

void workthread::run() throw()
{
	try {
		entry();
	} catch(std::bad_alloc& e) {
		threads::alock h(mlock);
		exception_oom = true;
		exception_caught = true;
	} catch(std::exception& e) {
		threads::alock h(mlock);
		exception_text = e.what();
		exception_caught = true;
	}
}

void workthread::fire()
{
	threads::alock h(mlock);
	if(thread)
		throw std::logic_error("Worker thread already started");
	thread = new threads::thread([this]() { this->run(); });
}
