#include "opus-toc.hpp"

namespace opus
{
namespace
{
	const uint32_t durations[4] = {10, 20, 40, 60};
}

toc_info parse_toc(uint8_t toc, uint32_t rate) throw()
{
	toc_info t;
	t.config = toc & 0x03;
	t.stereo = (toc & 0x04) != 0;
	t.frame_count_code = (toc >> 4) & 0x0F;
	if(t.frame_count_code == 0 || t.frame_count_code == 3)
		t.frames = 1;
	else if(t.frame_count_code < 3)
		t.frames = 2;
	else
		t.frames = t.frame_count_code - 3;
	t.duration_ms = durations[t.config % 4];
	t.samples_per_frame = static_cast<uint32_t>(static_cast<uint64_t>(t.duration_ms) * rate / 1000);
	t.samples_per_packet = t.samples_per_frame * t.frames;
	return t;
}
}
