#include "opus-ogg.hpp"
#include <cstring>
#include <algorithm>
#include "serialization.hpp"

namespace opus
{
namespace
{
	std::vector<uint8_t> single_packet(const ogg::page& page, const char* what)
	{
		if(page.get_packet_count() != 1 || page.get_last_packet_incomplete() || page.get_continue())
			throw std::runtime_error(std::string(what) + " page must have one complete packet");
		if(page.get_granulepos() != 0)
			throw std::runtime_error(std::string(what) + " page must have granulepos 0");
		auto p = page.get_packet(0);
		return std::vector<uint8_t>(p.first, p.first + p.second);
	}
}

ogg_header::ogg_header() throw()
{
	version = 1;
	channels = 2;
	preskip = 0;
	rate = 48000;
	gain = 0;
	map_family = 0;
	streams = 1;
	coupled = 1;
	memset(chanmap, 255, sizeof(chanmap));
	chanmap[0] = 0;
	chanmap[1] = 1;
}

void ogg_header::parse(const std::vector<uint8_t>& p)
{
	struct ogg_header h;
	if(p.size() < 9 || memcmp(&p[0], "OpusHead", 8))
		throw std::runtime_error("Bad OggOpus header magic");
	if(p[8] & 0xF0)
		throw std::runtime_error("Unsupported OggOpus version");
	if(p.size() < 19 || (p[18] && p.size() < 21U + p[9]))
		throw std::runtime_error("OggOpus header packet truncated");
	if(!p[9])
		throw std::runtime_error("Zero channels not allowed");
	h.version = p[8];
	h.channels = p[9];
	h.preskip = serialization::u16l(&p[10]);
	h.rate = serialization::u32l(&p[12]);
	h.gain = serialization::s16l(&p[16]);
	h.map_family = p[18];
	memset(h.chanmap, 255, sizeof(h.chanmap));
	if(h.map_family) {
		h.streams = p[19];
		h.coupled = p[20];
		if(h.coupled > h.streams)
			throw std::runtime_error("More coupled streams than total streams.");
		if(static_cast<int>(h.streams) > 255 - h.coupled)
			throw std::runtime_error("Maximum of 255 physical channels exceeded");
		memcpy(h.chanmap, &p[21], h.channels);
		for(unsigned i = 0; i < h.channels; i++)
			if(h.chanmap[i] != 255 && h.chanmap[i] > h.streams + h.coupled)
				throw std::runtime_error("Logical channel mapped to invalid physical channel");
	} else {
		h.streams = 1;
		if(h.channels > 2)
			throw std::runtime_error("Only 1 or 2 channels allowed with mapping family 0");
		h.coupled = (h.channels == 2) ? 1 : 0;
		h.chanmap[0] = 0;
		if(h.channels == 2) h.chanmap[1] = 1;
	}
	*this = h;
}

void ogg_header::parse(const ogg::page& page)
{
	if(!page.get_bos() || page.get_eos())
		throw std::runtime_error("OggOpus header page must be first but not last page");
	parse(single_packet(page, "OggOpus header"));
}

std::vector<uint8_t> ogg_header::serialize() const
{
	std::vector<uint8_t> buffer;
	if(version != 1)
		throw std::runtime_error("Don't how to serialize this oggopus version");
	if(!channels || (channels > 2 && !map_family))
		throw std::runtime_error("Illegal channel count");
	if(map_family && static_cast<int>(streams) > 255 - coupled)
		throw std::runtime_error("Maximum of 255 physical channels exceeded");
	if(map_family)
		for(unsigned i = 0; i < channels; i++)
			if(chanmap[i] != 255 && chanmap[i] > streams + coupled)
				throw std::runtime_error("Logical channel mapped to invalid physical channel");
	buffer.resize(map_family ? 21 + channels : 19);
	serialization::u64b(&buffer[0], 0x4F70757348656164ULL);
	buffer[8] = version;
	buffer[9] = channels;
	serialization::u16l(&buffer[10], preskip);
	serialization::u32l(&buffer[12], rate);
	serialization::s16l(&buffer[16], gain);
	buffer[18] = map_family;
	if(map_family) {
		buffer[19] = streams;
		buffer[20] = coupled;
		memcpy(&buffer[21], chanmap, channels);
	}
	return buffer;
}

void ogg_tags::parse(const std::vector<uint8_t>& p)
{
	struct ogg_tags h;
	if(p.size() < 8 || memcmp(&p[0], "OpusTags", 8))
		throw std::runtime_error("Bad OggOpus tags magic");
	if(p.size() < 12)
		throw std::runtime_error("OggOpus tags packet truncated");
	//Scan the thing.
	size_t itr = 8;
	uint32_t vlen = serialization::u32l(&p[itr]);
	if(vlen > p.size() - itr - 4 || p.size() - itr - 4 - vlen < 4)
		throw std::runtime_error("OggOpus tags packet truncated");
	h.vendor = std::string(reinterpret_cast<const char*>(&p[itr + 4]), vlen);
	itr += 4 + vlen;
	uint32_t headers = serialization::u32l(&p[itr]);
	itr += 4;
	for(uint32_t i = 0; i < headers; i++) {
		if(p.size() - itr < 4)
			throw std::runtime_error("OggOpus tags packet truncated");
		uint32_t clen = serialization::u32l(&p[itr]);
		if(clen > p.size() - itr - 4)
			throw std::runtime_error("OggOpus tags packet truncated");
		h.comments.push_back(std::string(reinterpret_cast<const char*>(&p[itr]) + 4, clen));
		itr += 4 + clen;
	}
	*this = h;
}

void ogg_tags::parse(const ogg::page& page)
{
	if(page.get_bos())
		throw std::runtime_error("OggOpus tags page must not be first page");
	parse(single_packet(page, "OggOpus tags"));
}

std::vector<uint8_t> ogg_tags::serialize() const
{
	size_t needed = 8;
	needed += vendor.length();
	needed += 4;
	for(auto& i : comments)
		needed += (i.length() + 4);
	needed += 4;
	if(vendor.length() > 0xFFFFFFFFULL || comments.size() > 0xFFFFFFFFULL)
		throw std::runtime_error("OggOpus tags too large");

	std::vector<uint8_t> contents;
	contents.resize(needed);
	size_t itr = 0;
	serialization::u64b(&contents[0], 0x4F70757354616773ULL);
	serialization::u32l(&contents[8], vendor.length());
	std::copy(vendor.begin(), vendor.end(), reinterpret_cast<char*>(contents.data()) + 12);
	itr = 12 + vendor.length();
	serialization::u32l(&contents[itr], comments.size());
	itr += 4;
	for(auto& i : comments) {
		serialization::u32l(&contents[itr], i.length());
		std::copy(i.begin(), i.end(), reinterpret_cast<char*>(contents.data()) + itr + 4);
		itr += (i.length() + 4);
	}
	return contents;
}
}
