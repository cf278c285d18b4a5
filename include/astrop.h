/*
 * astrop.h
 *
 * String slicing helpers for header lines, config lines and URLs.
 */

#ifndef INCLUDE_ASTROP_H_
#define INCLUDE_ASTROP_H_

#include <string>
#include <strings.h>
#include <nonstd/string_view.hpp>

#define SPACECHARS " \f\n\r\t\v"

namespace rtv
{

using string_view = nonstd::string_view;

inline void trimFront(std::string &s, const char* junk=SPACECHARS)
{
	auto pos = s.find_first_not_of(junk);
	if(pos == std::string::npos)
		s.clear();
	else if(pos>0)
		s.erase(0, pos);
}

inline void trimFront(string_view& s, const char* junk=SPACECHARS)
{
	auto pos = s.find_first_not_of(junk);
	s.remove_prefix(pos == std::string::npos ? s.length() : pos);
}

inline void trimBack(std::string &s, const char* junk=SPACECHARS)
{
	auto pos = s.find_last_not_of(junk);
	if(pos == std::string::npos)
		s.clear();
	else
		s.erase(pos+1);
}

inline void trimBack(string_view& s, const char* junk=SPACECHARS)
{
	auto pos = s.find_last_not_of(junk);
	s.remove_suffix(pos != std::string::npos ? s.size() - pos - 1 : s.length());
}

inline void trimBoth(std::string &s, const char* junk=SPACECHARS)
{
	trimBack(s, junk);
	trimFront(s, junk);
}

inline void trimBoth(string_view &s, const char* junk=SPACECHARS)
{
	trimBack(s, junk);
	trimFront(s, junk);
}

//! iterator-like helper for string splitting, works exactly once
class tSplitWalk
{
	string_view m_input;
	std::string::size_type m_sliece_len;
	const char* m_seps;

public:
	/**
	 * @param line The input
	 * @param separators Characters which are considered delimiters (any char in that string),
	 * a sequence of them is considered as one delimiter
	 */
	inline tSplitWalk(string_view line, const char* separators = SPACECHARS)
	: m_input(line), m_sliece_len(0), m_seps(separators)
	{}
	inline bool Next()
	{
		if (m_input.length() == m_sliece_len)
			return false;
		m_input.remove_prefix(m_sliece_len);
		trimFront(m_input, m_seps);
		if(m_input.empty())
			return false;
		m_sliece_len = m_input.find_first_of(m_seps);
		if (m_sliece_len == std::string::npos)
			m_sliece_len = m_input.length();
		return true;
	}
	inline std::string str() const { return std::string(m_input.data(), m_sliece_len); }
	inline string_view view() const { return string_view(m_input.data(), m_sliece_len); }
};

inline bool scaseequals(string_view a, string_view b)
{
	return a.length() == b.length() && 0 == strncasecmp(a.data(), b.data(), a.length());
}

#define startsWithSz(where, what) (0==(where).compare(0, sizeof((what))-1, (what)))
#define endsWithSzAr(where, what) ((where).size()>=(sizeof((what))-1) && \
		0==(where).compare((where).size()-(sizeof((what))-1), (sizeof((what))-1), (what)))

inline std::string to_string(string_view s) {return std::string(s.data(), s.length());}

}

#endif /* INCLUDE_ASTROP_H_ */
