#include "core/messages.hpp"
#include "library/threads.hpp"
#include <string>
#include <streambuf>

namespace
{
	threads::lock target_lock;
	std::ostream* target = &std::cerr;

	class line_relay : public std::streambuf
	{
	protected:
		int overflow(int ch)
		{
			if(ch == traits_type::eof())
				return traits_type::not_eof(ch);
			pending() += static_cast<char>(ch);
			if(ch == '\n')
				emit();
			return ch;
		}
		int sync()
		{
			emit();
			return 0;
		}
	private:
		static std::string& pending()
		{
			static thread_local std::string line;
			return line;
		}
		void emit()
		{
			std::string& line = pending();
			if(line.empty())
				return;
			threads::alock h(target_lock);
			target->write(line.data(), line.size());
			target->flush();
			line.clear();
		}
	};

	line_relay relay;
}

std::ostream& messages_relay_class::getstream()
{
	static thread_local std::ostream stream(&relay);
	return stream;
}

void messages_relay_class::set_stream(std::ostream& os)
{
	threads::alock h(target_lock);
	target = &os;
}

messages_relay_class messages;
