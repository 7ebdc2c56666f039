#pragma once

#include <cstdint>
#include <string>
#include <boost/optional.hpp>

namespace agroprecios
{

typedef uint64_t id_t;

struct auction
{
	id_t id; // Auction number as used by the site, not generated
	std::string name;
};

struct family
{
	id_t id;
	std::string name;
};

struct product
{
	id_t id;
	id_t family_id;
	std::string name;
	boost::optional<std::string> url;
};

struct price
{
	id_t auction_id;
	std::string date; // yyyy-mm-dd
	id_t product_id;
	unsigned int cut; // 1-based column in the products table
	int64_t value;
};

}
