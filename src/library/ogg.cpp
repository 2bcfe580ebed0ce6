#include "ogg.hpp"
#include "serialization.hpp"
#include "string.hpp"
#include <cstring>
#include <algorithm>
#include <iomanip>
#include <memory>

namespace ogg
{
namespace
{
	const uint32_t polynomial = 0x04C11DB7;

	struct checksum_tables
	{
		checksum_tables()
		{
			for(unsigned i = 0; i < 256; i++) {
				uint32_t r = i;
				for(unsigned j = 0; j < 8; j++)
					r = (r & 1) ? ((r >> 1) ^ polynomial) : (r >> 1);
				reflected[i] = r;
				uint32_t m = static_cast<uint32_t>(i) << 24;
				for(unsigned j = 0; j < 8; j++)
					m = (m & 0x80000000U) ? ((m << 1) ^ polynomial) : (m << 1);
				rfc3533[i] = m;
			}
		}
		uint32_t reflected[256];
		uint32_t rfc3533[256];
	};

	const checksum_tables& get_tables()
	{
		static const checksum_tables tables;
		return tables;
	}

	//Checksum of complete page of b bytes, with the checksum field taken as zero.
	uint32_t page_checksum(const char* buffer, size_t b, checksum_variant variant)
	{
		uint8_t zero[4] = {0, 0, 0, 0};
		uint32_t actual = checksum(0, reinterpret_cast<const uint8_t*>(buffer), 22, variant);
		actual = checksum(actual, zero, 4, variant);
		actual = checksum(actual, reinterpret_cast<const uint8_t*>(buffer + 26), b - 26, variant);
		return actual;
	}

	bool page_checksum_ok(const char* buffer, size_t b, checksum_variant& matched)
	{
		uint32_t claimed = serialization::u32l(buffer + 22);
		if(claimed == page_checksum(buffer, b, CRC_REFLECTED)) {
			matched = CRC_REFLECTED;
			return true;
		}
		if(claimed == page_checksum(buffer, b, CRC_RFC3533)) {
			matched = CRC_RFC3533;
			return true;
		}
		return false;
	}
}

uint32_t checksum(uint32_t chain, const uint8_t* data, size_t size, checksum_variant variant) throw()
{
	if(!data)
		return chain;
	const checksum_tables& t = get_tables();
	if(variant == CRC_RFC3533)
		for(size_t i = 0; i < size; i++)
			chain = (chain << 8) ^ t.rfc3533[(chain >> 24) ^ data[i]];
	else
		for(size_t i = 0; i < size; i++)
			chain = (chain >> 8) ^ t.reflected[(chain ^ data[i]) & 0xFF];
	return chain;
}

uint32_t checksum(const std::vector<std::pair<const uint8_t*, size_t>>& parts, checksum_variant variant) throw()
{
	uint32_t chain = 0;
	for(auto i : parts)
		chain = checksum(chain, i.first, i.second, variant);
	return chain;
}

std::vector<uint8_t> lacing_values(size_t size)
{
	std::vector<uint8_t> ret;
	ret.reserve(size / 255 + 1);
	while(size >= 255) {
		ret.push_back(255);
		size -= 255;
	}
	//Always terminate: this is 0 if the size was divisible by 255.
	ret.push_back(size);
	return ret;
}

stream_state::stream_state() throw()
{
	serial = 0;
	sequence = 0;
	granulepos = 0;
	channels = 2;
	rate = 48000;
	preskip = 0;
}

page::page() throw()
{
	version = 0;
	flag_continue = false;
	flag_bos = false;
	flag_eos = false;
	last_incomplete = false;
	variant = CRC_REFLECTED;
	granulepos = granulepos_none;
	stream = 0;
	sequence = 0;
	segment_count = 0;
	packet_count = 0;
	data_count = 0;
	memset(data, 0, sizeof(data));
	memset(segments, 0, sizeof(segments));
	memset(packets, 0, sizeof(packets));
}

page::page(const char* buffer, size_t& advance)
{
	//Check validity of page header.
	if(buffer[0] != 'O' || buffer[1] != 'g' || buffer[2] != 'g' || buffer[3] != 'S')
		throw std::runtime_error("Bad Ogg page header");
	if(buffer[4] != 0)
		throw std::runtime_error("Bad Ogg page version");
	if(buffer[5] & 0xF8)
		throw std::runtime_error("Bad Ogg page flags");
	//Compute length.
	size_t b = 27 + (unsigned char)buffer[26];
	data_count = 0;
	for(unsigned i = 0; i < (unsigned char)buffer[26]; i++) {
		b += (unsigned char)buffer[27 + i];
		data_count += (unsigned char)buffer[27 + i];
	}
	if(!page_checksum_ok(buffer, b, variant))
		throw std::runtime_error("Bad Ogg page checksum");
	//This page is valid.
	version = buffer[4];
	set_header_type(buffer[5]);
	granulepos = serialization::u64l(buffer + 6);
	stream = serialization::u32l(buffer + 14);
	sequence = serialization::u32l(buffer + 18);
	segment_count = buffer[26];
	memset(segments, 0, sizeof(segments));
	if(segment_count)
		memcpy(segments, buffer + 27, segment_count);
	memset(data, 0, sizeof(data));
	if(b > 27U + segment_count)
		memcpy(data, buffer + 27 + segment_count, b - 27 - segment_count);
	packet_count = 0;
	memset(packets, 0, sizeof(packets));
	if(segment_count > 0)
		packets[packet_count++] = 0;
	uint16_t dptr = 0;
	for(unsigned i = 0; i < segment_count; i++) {
		dptr += segments[i];
		if(segment_count > i + 1 && segments[i] < 255)
			packets[packet_count++] = dptr;
	}
	packets[packet_count] = dptr;
	last_incomplete = (segment_count > 0 && segments[segment_count - 1] == 255);
	advance = b;
}

bool page::scan(const char* buffer, size_t bufferlen, bool eof, size_t& advance) throw()
{
	const char* _buffer = buffer;
	size_t buffer_left = bufferlen;
	advance = 0;
	while(buffer_left >= 27) {
		//Check capture pattern, version and flags.
		if(_buffer[0] != 'O' || _buffer[1] != 'g' || _buffer[2] != 'g' || _buffer[3] != 'S' ||
			_buffer[4] != 0 || (_buffer[5] & 0xF8)) {
			advance++;
			_buffer++;
			buffer_left--;
			continue;
		}
		//Check that segment table is present. If not, more data can uncover a page here.
		if(27U + (unsigned char)_buffer[26] > buffer_left) {
			if(!eof)
				return false;
			advance++;
			_buffer++;
			buffer_left--;
			continue;
		}
		//Check that all data is there. If not, more data can uncover a page here.
		size_t b = 27 + (unsigned char)_buffer[26];
		for(unsigned i = 0; i < (unsigned char)_buffer[26]; i++)
			b += (unsigned char)_buffer[27 + i];
		if(b > buffer_left) {
			if(!eof)
				return false;
			advance++;
			_buffer++;
			buffer_left--;
			continue;
		}
		checksum_variant matched;
		if(!page_checksum_ok(_buffer, b, matched)) {
			advance++;
			_buffer++;
			buffer_left--;
			continue;
		}
		return true;	//Here is a page.
	}
	if(eof && buffer_left < 27) {
		//Advance to the end.
		advance += buffer_left;
	}
	return false;
}

uint8_t page::get_header_type() const throw()
{
	return (flag_continue ? PAGE_CONTINUED : 0) | (flag_bos ? PAGE_BOS : 0) | (flag_eos ? PAGE_EOS : 0);
}

void page::set_header_type(uint8_t type) throw()
{
	flag_continue = (type & PAGE_CONTINUED);
	flag_bos = (type & PAGE_BOS);
	flag_eos = (type & PAGE_EOS);
}

std::string page::stream_debug_id() const
{
	return (stringfmt() << "Stream " << std::hex << std::setw(8) << std::setfill('0') << stream).str();
}

std::string page::page_debug_id() const
{
	return (stringfmt() << stream_debug_id() << " page " << sequence).str();
}

bool page::append_segments(const uint8_t* _data, const uint8_t* lacing, size_t count) throw()
{
	if(count > 255U - segment_count)
		return false;
	size_t total = 0;
	for(size_t i = 0; i < count; i++)
		total += lacing[i];
	//A page continuing an incomplete packet starts no new one.
	bool extends = (segment_count > 0 && last_incomplete);
	if(!extends && count > 0)
		packets[packet_count++] = data_count;
	if(total)
		memcpy(data + data_count, _data, total);
	memcpy(segments + segment_count, lacing, count);
	size_t off = data_count;
	for(size_t i = 0; i < count; i++) {
		off += lacing[i];
		if(i + 1 < count && lacing[i] < 255)
			packets[packet_count++] = off;
	}
	segment_count += count;
	data_count += total;
	packets[packet_count] = data_count;
	last_incomplete = (segment_count > 0 && segments[segment_count - 1] == 255);
	return true;
}

void page::serialize(char* buffer, checksum_variant _variant) const throw()
{
	memcpy(buffer, "OggS", 4);
	buffer[4] = version;
	buffer[5] = get_header_type();
	serialization::u64l(buffer + 6, granulepos);
	serialization::u32l(buffer + 14, stream);
	serialization::u32l(buffer + 18, sequence);
	serialization::u32l(buffer + 22, 0);	//CRC will be fixed later.
	buffer[26] = segment_count;
	memcpy(buffer + 27, segments, segment_count);
	memcpy(buffer + 27 + segment_count, data, data_count);
	size_t plen = 27 + segment_count + data_count;
	//Fix the CRC.
	serialization::u32l(buffer + 22, checksum(0, reinterpret_cast<uint8_t*>(buffer), plen, _variant));
}

const uint64_t page::granulepos_none = 0xFFFFFFFFFFFFFFFFULL;

size_t put_page(byte_sink& sink, const page& p, checksum_variant variant)
{
	char buffer[65536];
	size_t s = p.serialize_size();
	p.serialize(buffer, variant);
	sink.write(buffer, s);
	return s;
}

size_t write_page(byte_sink& sink, const uint8_t* packet, size_t len, uint8_t header_type, uint64_t granule,
	stream_state& state, checksum_variant variant)
{
	std::vector<uint8_t> lacing = lacing_values(len);
	size_t written = 0;
	size_t lptr = 0;
	size_t dptr = 0;
	bool first = true;
	while(first || lptr < lacing.size()) {
		size_t count = std::min(lacing.size() - lptr, static_cast<size_t>(255));
		bool last = (lptr + count == lacing.size());
		uint8_t flags = header_type;
		if(!first)
			flags = (flags & ~PAGE_BOS) | PAGE_CONTINUED;
		if(!last)
			flags &= ~PAGE_EOS;
		size_t bytes = 0;
		for(size_t i = 0; i < count; i++)
			bytes += lacing[lptr + i];
		//Page is too big for the stack.
		std::unique_ptr<page> p(new page());
		p->set_header_type(flags);
		p->set_granulepos(last ? granule : page::granulepos_none);
		p->set_stream(state.serial);
		p->set_sequence(state.sequence);
		p->append_segments(packet + dptr, &lacing[lptr], count);
		written += put_page(sink, *p, variant);
		state.sequence++;
		lptr += count;
		dptr += bytes;
		first = false;
	}
	return written;
}

stream_reader::stream_reader() throw()
{
	eof = false;
	left = 0;
	errors_to = &std::cerr;
	last_offset = 0;
	start_offset = 0;
	skipped = 0;
}

stream_reader::~stream_reader() throw()
{
}

void stream_reader::set_errors_to(std::ostream& os)
{
	errors_to = &os;
}

bool stream_reader::get_page(page& spage)
{
	size_t advance;
	while(true) {
		fill_buffer();
		if(eof && !left)
			return false;
		bool f = page::scan(buffer, left, eof, advance);
		if(advance) {
			//The ogg stream resyncs.
			(*errors_to) << "Warning: Ogg stream: Recapture after " << advance << " bytes." << std::endl;
			skipped += advance;
			discard_buffer(advance);
			continue;
		}
		if(!f)
			continue;
		spage = page(buffer, advance);
		last_offset = start_offset;
		discard_buffer(advance);
		return true;
	}
}

void stream_reader::fill_buffer()
{
	size_t r;
	if(!eof && left < sizeof(buffer)) {
		left += (r = read(buffer + left, sizeof(buffer) - left));
		if(!r)
			eof = true;
	}
}

void stream_reader::discard_buffer(size_t amount)
{
	if(amount < left)
		memmove(buffer, buffer + amount, left - amount);
	left -= amount;
	start_offset += amount;
}

stream_reader_iostreams::stream_reader_iostreams(std::istream& stream)
	: is(stream)
{
}

stream_reader_iostreams::~stream_reader_iostreams() throw()
{
}

size_t stream_reader_iostreams::read(char* buffer, size_t size)
{
	if(!is)
		return 0;
	is.read(buffer, size);
	return is.gcount();
}
}
