#pragma once

#include <istream>
#include <stdexcept>
#include <string>
#include <SAX/helpers/DefaultHandler.hpp>

namespace agroprecios
{
	/* Runs a SAX handler over tag soup; pages are rarely well-formed */
	class html_parser
	{
	public:
		typedef Arabica::SAX::DefaultHandler<std::string> default_handler;

		class error : public std::runtime_error
		{
		public:
			error(std::string const& what)
			: std::runtime_error(what)
			{}
		};

		html_parser() = delete;

		static void parse(const std::string& src, default_handler& p);
		static void parse(std::istream& is, default_handler& p);
	};
}
