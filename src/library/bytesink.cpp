#include "bytesink.hpp"
#include "string.hpp"
#include <stdexcept>

byte_sink::byte_sink() throw()
{
}

byte_sink::~byte_sink() throw()
{
}

void byte_sink::flush()
{
}

void byte_sink::close()
{
	flush();
}

byte_sink_iostreams::byte_sink_iostreams(std::ostream& stream)
	: os(stream)
{
}

byte_sink_iostreams::~byte_sink_iostreams() throw()
{
}

void byte_sink_iostreams::write(const char* buffer, size_t size)
{
	if(!os)
		throw std::runtime_error("Error writing data");
	os.write(buffer, size);
	if(!os)
		throw std::runtime_error("Error writing data");
}

void byte_sink_iostreams::flush()
{
	os.flush();
	if(!os)
		throw std::runtime_error("Error flushing data");
}

void byte_sink_iostreams::close()
{
	flush();
}

byte_sink_file::byte_sink_file(const std::string& _filename)
	: filename(_filename)
{
	closed = false;
	os.open(filename.c_str(), std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
	if(!os)
		(stringfmt() << "Can't open '" << filename << "' for writing").throwex();
}

byte_sink_file::~byte_sink_file() throw()
{
	if(!closed)
		os.close();
}

void byte_sink_file::write(const char* buffer, size_t size)
{
	if(closed)
		(stringfmt() << "Write to closed file '" << filename << "'").throwex();
	os.write(buffer, size);
	if(!os)
		(stringfmt() << "Error writing to '" << filename << "'").throwex();
}

void byte_sink_file::flush()
{
	if(closed)
		return;
	os.flush();
	if(!os)
		(stringfmt() << "Error flushing '" << filename << "'").throwex();
}

void byte_sink_file::close()
{
	if(closed)
		return;
	closed = true;
	os.flush();
	bool ok = static_cast<bool>(os);
	os.close();
	if(!ok || os.fail())
		(stringfmt() << "Error closing '" << filename << "'").throwex();
}
