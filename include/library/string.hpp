#ifndef _library__string__hpp__included__
#define _library__string__hpp__included__

#include <string>
#include <sstream>
#include <stdexcept>
#include <limits>
#include <boost/lexical_cast.hpp>

/**
 * String formatter
 */
class stringfmt
{
public:
	stringfmt() {}
	std::string str() { return x.str(); }
	template<typename T> stringfmt& operator<<(const T& y) { x << y; return *this; }
	void throwex() { throw std::runtime_error(x.str()); }
private:
	std::ostringstream x;
};

/**
 * Parse a string into a value.
 *
 * Integers are range-checked against T, so "300" doesn't parse as uint8_t.
 *
 * Parameter value: The string to parse.
 * Returns: The parsed value.
 * Throws std::runtime_error: The value can't be parsed or is out of range.
 */
template<typename T> inline T parse_value(const std::string& value)
{
	try {
		if(std::numeric_limits<T>::is_integer) {
			if(value.empty())
				throw std::runtime_error("Empty number");
			if(!std::numeric_limits<T>::is_signed) {
				if(value[0] == '-')
					throw std::runtime_error("Unsigned values can't be negative");
				unsigned long long v = boost::lexical_cast<unsigned long long>(value);
				if(v > static_cast<unsigned long long>(std::numeric_limits<T>::max()))
					throw std::runtime_error("Value exceeds range");
				return static_cast<T>(v);
			}
			long long v = boost::lexical_cast<long long>(value);
			if(v < static_cast<long long>(std::numeric_limits<T>::min()) ||
				v > static_cast<long long>(std::numeric_limits<T>::max()))
				throw std::runtime_error("Value exceeds range");
			return static_cast<T>(v);
		}
		return boost::lexical_cast<T>(value);
	} catch(std::exception& e) {
		throw std::runtime_error("Can't parse value '" + value + "': " + e.what());
	}
}

template<> inline std::string parse_value(const std::string& value)
{
	return value;
}

#endif
