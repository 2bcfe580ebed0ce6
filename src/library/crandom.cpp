#include "crandom.hpp"
#include "threads.hpp"
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>

namespace
{
	int fd = -1;
	threads::lock fd_lock;

	void try_file(const char* name)
	{
		int err = 0;
		while(fd < 0 && err != ENOENT && err != ENXIO && err != EACCES) {
			fd = open(name, O_RDONLY);
			if(fd < 0) err = errno;
		}
	}

	void init_locked()
	{
		if(fd < 0) try_file("/dev/urandom");
		if(fd < 0) try_file("/dev/random");
		if(fd < 0) throw std::runtime_error("Can't open /dev/urandom");
	}
}

namespace crandom
{
void init()
{
	threads::alock h(fd_lock);
	init_locked();
}

void generate(void* buffer, size_t buffersize)
{
	threads::alock h(fd_lock);
	init_locked();
	size_t out = 0;
	while(out < buffersize) {
		ssize_t r = read(fd, (char*)buffer + out, buffersize - out);
		if(r > 0)
			out += r;
		else if(r == 0 || errno != EINTR)
			throw std::runtime_error("Can't read random bits");
	}
}

uint32_t generate_u32()
{
	uint32_t x;
	generate(&x, sizeof(x));
	return x;
}
}
