#pragma once

#include <cstdio>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/regex.hpp>

namespace agroprecios
{

typedef boost::gregorian::date date;

inline date today()
{
	return boost::gregorian::day_clock::local_day();
}

inline boost::optional<date> make_date(std::string const& day, std::string const& month, std::string const& year)
{
	try
	{
		return date(
			boost::lexical_cast<unsigned short>(year),
			boost::lexical_cast<unsigned short>(month),
			boost::lexical_cast<unsigned short>(day)
		);
	} catch(std::out_of_range const&) // bad_day_of_month, bad_month, bad_year
	{
		return boost::none;
	} catch(boost::bad_lexical_cast const&)
	{
		return boost::none;
	}
}

/* Parses dd/mm/yyyy, as taken on the command line and sent to the server */
inline date parse_input_date(std::string const& str)
{
	static const boost::regex match_date("([0-9]{2})/([0-9]{2})/([0-9]{4})");

	boost::smatch what;
	if(!boost::regex_match(str, what, match_date))
		throw std::invalid_argument("Invalid date '" + str + "', expected dd/mm/yyyy");

	boost::optional<date> d(make_date(what[1], what[2], what[3]));
	if(!d)
		throw std::invalid_argument("Invalid date '" + str + "', no such day");

	return *d;
}

inline std::string to_query_date(date const& d)
{
	char buf[11];
	std::snprintf(buf, sizeof(buf), "%02u/%02u/%04u",
		static_cast<unsigned int>(d.day()),
		static_cast<unsigned int>(d.month()),
		static_cast<unsigned int>(d.year())
	);

	return std::string(buf);
}

inline std::string to_iso_date(date const& d)
{
	return boost::gregorian::to_iso_extended_string(d);
}

}
