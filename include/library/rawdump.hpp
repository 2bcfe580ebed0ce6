#ifndef _library__rawdump__hpp__included__
#define _library__rawdump__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>
#include <iostream>

/**
 * Raw packet dump format.
 *
 * A raw dump is a bare sequence of records until EOF, no file header. Each record is:
 *
 * - Payload length, u16 little-endian (1-65535).
 * - Payload.
 * - Timestamp in milliseconds, low 32 bits then high 32 bits, both little-endian.
 */
namespace rawdump
{
/**
 * Largest payload a record can carry.
 */
const size_t max_payload = 65535;
/**
 * Bytes in record besides payload.
 */
const size_t record_overhead = 10;
/**
 * First record lengths above this are suspicious (but valid).
 */
const size_t suspicious_length = 4000;

/**
 * Encode a record.
 *
 * Parameter data: The payload.
 * Parameter len: The payload length.
 * Parameter timestamp: The timestamp (ms).
 * Returns: The record as one contiguous buffer.
 * Throws std::runtime_error: Payload empty or too long.
 */
std::vector<uint8_t> encode_record(const uint8_t* data, size_t len, uint64_t timestamp);

/**
 * A record read back from dump.
 */
struct record
{
	std::vector<uint8_t> payload;
	uint64_t timestamp;
};

/**
 * Sequential reader for raw dumps.
 */
class reader
{
public:
/**
 * Constructor.
 *
 * Parameter stream: The stream to read records from.
 */
	reader(std::istream& stream);
/**
 * Read the next record.
 *
 * Parameter r: The record is assigned here if successful.
 * Returns: True if record was read, false on clean end of dump.
 * Throws std::runtime_error: Record cut short by end of dump, or zero length.
 */
	bool next(record& r);
/**
 * Get offset of the next record.
 */
	uint64_t get_offset() const throw() { return offset; }
/**
 * Get number of records read.
 */
	uint64_t get_count() const throw() { return count; }
private:
	reader(const reader&);
	reader& operator=(const reader&);
	std::istream& is;
	uint64_t offset;
	uint64_t count;
};

/**
 * Result of validating a dump.
 */
struct validation
{
	validation() throw();
	bool valid;
/**
 * File size, (uintmax_t)-1 if the file doesn't exist.
 */
	uintmax_t size;
	uint16_t first_length;
/**
 * The first length is suspiciously large.
 */
	bool suspicious;
/**
 * Number of complete records (validate_all only, 0 otherwise).
 */
	uint64_t records;
	std::string error;
};

/**
 * Check that a dump holds at least one complete record.
 *
 * Parameter path: The dump file.
 * Returns: The result.
 */
validation validate(const std::string& path);
/**
 * Check the whole dump record by record.
 *
 * Parameter path: The dump file.
 * Returns: The result.
 */
validation validate_all(const std::string& path);
}

#endif
