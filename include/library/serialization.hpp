#ifndef _library__serialization__hpp__included__
#define _library__serialization__hpp__included__

#include <cstdint>
#include <cstdlib>

/**
 * Fixed-width integer encoding into byte buffers.
 *
 * The names follow the pattern <s|u><bits><l|b>: signedness, width and byte order. The writing
 * overloads take the target pointer and the value, the reading overloads only the source pointer.
 */
namespace serialization
{
template<size_t n> struct unsigned_of {};
template<> struct unsigned_of<1> { typedef uint8_t t; };
template<> struct unsigned_of<2> { typedef uint16_t t; };
template<> struct unsigned_of<4> { typedef uint32_t t; };
template<> struct unsigned_of<8> { typedef uint64_t t; };

template<typename T1, bool be>
void write_common(uint8_t* target, T1 value)
{
	typedef typename unsigned_of<sizeof(T1)>::t U;
	U v = static_cast<U>(value);
	for(size_t i = 0; i < sizeof(T1); i++) {
		size_t shift = be ? 8 * (sizeof(T1) - i - 1) : 8 * i;
		target[i] = static_cast<uint8_t>(v >> shift);
	}
}

template<typename T1, bool be>
T1 read_common(const uint8_t* source)
{
	typedef typename unsigned_of<sizeof(T1)>::t U;
	U value = 0;
	for(size_t i = 0; i < sizeof(T1); i++) {
		size_t shift = be ? 8 * (sizeof(T1) - i - 1) : 8 * i;
		value |= static_cast<U>(static_cast<U>(source[i]) << shift);
	}
	return static_cast<T1>(value);
}

inline void u8l(void* t, uint8_t v) { write_common<uint8_t, false>(reinterpret_cast<uint8_t*>(t), v); }
inline void u16l(void* t, uint16_t v) { write_common<uint16_t, false>(reinterpret_cast<uint8_t*>(t), v); }
inline void s16l(void* t, int16_t v) { write_common<int16_t, false>(reinterpret_cast<uint8_t*>(t), v); }
inline void u32l(void* t, uint32_t v) { write_common<uint32_t, false>(reinterpret_cast<uint8_t*>(t), v); }
inline void u64l(void* t, uint64_t v) { write_common<uint64_t, false>(reinterpret_cast<uint8_t*>(t), v); }
inline void u64b(void* t, uint64_t v) { write_common<uint64_t, true>(reinterpret_cast<uint8_t*>(t), v); }

inline uint8_t u8l(const void* t) { return read_common<uint8_t, false>(reinterpret_cast<const uint8_t*>(t)); }
inline uint16_t u16l(const void* t) { return read_common<uint16_t, false>(reinterpret_cast<const uint8_t*>(t)); }
inline int16_t s16l(const void* t) { return read_common<int16_t, false>(reinterpret_cast<const uint8_t*>(t)); }
inline uint32_t u32l(const void* t) { return read_common<uint32_t, false>(reinterpret_cast<const uint8_t*>(t)); }
inline uint64_t u64l(const void* t) { return read_common<uint64_t, false>(reinterpret_cast<const uint8_t*>(t)); }
inline uint64_t u64b(const void* t) { return read_common<uint64_t, true>(reinterpret_cast<const uint8_t*>(t)); }
}

#endif
