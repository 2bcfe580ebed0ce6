#ifndef _messages__hpp__included__
#define _messages__hpp__included__

#include <iostream>

/**
 * messages -> log stream (std::cerr unless redirected).
 *
 * Output is collected per thread and handed to the log stream one complete line at a time, so
 * lines from concurrently running tracks don't interleave.
 */
class messages_relay_class
{
public:
	operator std::ostream&() { return getstream(); }
	static std::ostream& getstream();
/**
 * Redirect the log output.
 *
 * Parameter os: The new log stream. Must stay valid until redirected again.
 */
	static void set_stream(std::ostream& os);
};
template<typename T> inline std::ostream& operator<<(messages_relay_class& x, T value)
{
	return messages_relay_class::getstream() << value;
};
inline std::ostream& operator<<(messages_relay_class& x, std::ostream& (*fn)(std::ostream& o))
{
	return fn(messages_relay_class::getstream());
};
extern messages_relay_class messages;

#endif
