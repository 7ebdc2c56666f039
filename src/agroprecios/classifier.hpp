#pragma once

#include <string>
#include <boost/algorithm/string.hpp>

namespace agroprecios
{

/*
 * The server answers unknown auctions or dates with a page mentioning an
 * error instead of the products table. A page that still carries the table
 * is valid, whatever else it says.
 */
inline bool is_error_response(std::string const& html)
{
	return boost::algorithm::icontains(html, "ERROR") && !boost::algorithm::contains(html, "tab_pre_pro");
}

}
