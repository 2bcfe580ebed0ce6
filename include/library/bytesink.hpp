#ifndef _library__bytesink__hpp__included__
#define _library__bytesink__hpp__included__

#include <cstdlib>
#include <string>
#include <iostream>
#include <fstream>

/**
 * Destination of a byte stream.
 *
 * Writes are all-or-nothing from the caller's point of view: write() either accepts the whole
 * buffer or throws.
 */
class byte_sink
{
public:
	byte_sink() throw();
	virtual ~byte_sink() throw();
/**
 * Write data.
 *
 * Parameter buffer: The data to write.
 * Parameter size: The size to write.
 * Throws std::runtime_error: Write failed.
 */
	virtual void write(const char* buffer, size_t size) = 0;
/**
 * Push buffered data to the underlying device.
 *
 * Throws std::runtime_error: Flush failed.
 */
	virtual void flush();
/**
 * Flush and release the underlying device. Further writes fail.
 *
 * Throws std::runtime_error: Close failed.
 */
	virtual void close();
private:
	byte_sink(const byte_sink&);
	byte_sink& operator=(const byte_sink&);
};

/**
 * Byte sink writing to std::ostream. Closing only flushes; the stream stays owned by the caller.
 */
class byte_sink_iostreams : public byte_sink
{
public:
	byte_sink_iostreams(std::ostream& stream);
	~byte_sink_iostreams() throw();
	void write(const char* buffer, size_t size);
	void flush();
	void close();
private:
	std::ostream& os;
};

/**
 * Byte sink writing to a file it owns. The file is created or truncated on construction.
 */
class byte_sink_file : public byte_sink
{
public:
/**
 * Constructor.
 *
 * Parameter filename: The file to write.
 * Throws std::runtime_error: Can't open the file.
 */
	byte_sink_file(const std::string& filename);
	~byte_sink_file() throw();
	void write(const char* buffer, size_t size);
	void flush();
	void close();
	const std::string& get_filename() const throw() { return filename; }
private:
	std::ofstream os;
	std::string filename;
	bool closed;
};

#endif
