#include "rawdump.hpp"
#include "serialization.hpp"
#include "directory.hpp"
#include "string.hpp"
#include <cstring>
#include <fstream>

namespace rawdump
{
std::vector<uint8_t> encode_record(const uint8_t* data, size_t len, uint64_t timestamp)
{
	if(!len || !data)
		throw std::runtime_error("Empty packet can't be stored");
	if(len > max_payload)
		(stringfmt() << "Packet of " << len << " bytes is too large to store (max " << max_payload
			<< ")").throwex();
	std::vector<uint8_t> buf;
	buf.resize(len + record_overhead);
	serialization::u16l(&buf[0], len);
	memcpy(&buf[2], data, len);
	serialization::u32l(&buf[2 + len], static_cast<uint32_t>(timestamp));
	serialization::u32l(&buf[6 + len], static_cast<uint32_t>(timestamp >> 32));
	return buf;
}

reader::reader(std::istream& stream)
	: is(stream)
{
	offset = 0;
	count = 0;
}

bool reader::next(record& r)
{
	char lbuf[2];
	is.read(lbuf, 2);
	size_t got = is.gcount();
	if(got == 0)
		return false;
	if(got < 2)
		(stringfmt() << "Record at offset " << offset << " truncated in length").throwex();
	uint16_t len = serialization::u16l(lbuf);
	if(!len)
		(stringfmt() << "Record at offset " << offset << " has zero length").throwex();
	std::vector<uint8_t> payload(len);
	is.read(reinterpret_cast<char*>(&payload[0]), len);
	if(static_cast<size_t>(is.gcount()) < len)
		(stringfmt() << "Record at offset " << offset << " truncated in payload").throwex();
	char tbuf[8];
	is.read(tbuf, 8);
	if(is.gcount() < 8)
		(stringfmt() << "Record at offset " << offset << " truncated in timestamp").throwex();
	r.payload.swap(payload);
	r.timestamp = static_cast<uint64_t>(serialization::u32l(tbuf)) |
		(static_cast<uint64_t>(serialization::u32l(tbuf + 4)) << 32);
	offset += 2 + len + 8;
	count++;
	return true;
}

validation::validation() throw()
{
	valid = false;
	size = static_cast<uintmax_t>(-1);
	first_length = 0;
	suspicious = false;
	records = 0;
}

validation validate(const std::string& path)
{
	validation v;
	if(!directory::is_regular(path)) {
		v.error = "File does not exist";
		return v;
	}
	v.size = directory::size(path);
	if(v.size == static_cast<uintmax_t>(-1)) {
		v.error = "Can't get file size";
		return v;
	}
	if(v.size < record_overhead) {
		v.error = (stringfmt() << "File too small (" << v.size << " bytes)").str();
		return v;
	}
	std::ifstream s(path.c_str(), std::ios_base::binary);
	char lbuf[2];
	if(!s || !s.read(lbuf, 2)) {
		v.error = "Can't read first record length";
		return v;
	}
	v.first_length = serialization::u16l(lbuf);
	if(!v.first_length) {
		v.error = "First record has zero length";
		return v;
	}
	if(v.size < 2U + v.first_length + 8U) {
		v.error = (stringfmt() << "File too small for first record (" << v.size << " < "
			<< (2U + v.first_length + 8U) << " bytes)").str();
		return v;
	}
	v.suspicious = (v.first_length > suspicious_length);
	v.valid = true;
	return v;
}

validation validate_all(const std::string& path)
{
	validation v = validate(path);
	if(!v.valid)
		return v;
	std::ifstream s(path.c_str(), std::ios_base::binary);
	if(!s) {
		v.valid = false;
		v.error = "Can't open file";
		return v;
	}
	reader r(s);
	record rec;
	try {
		while(r.next(rec));
	} catch(std::exception& e) {
		v.valid = false;
		v.error = e.what();
	}
	v.records = r.get_count();
	return v;
}
}
