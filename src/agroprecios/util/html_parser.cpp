#include <agroprecios/util/html_parser.hpp>

#include <sstream>
#include <SAX/SAXException.hpp>
#include <Taggle/Taggle.hpp>

namespace agroprecios
{
	void html_parser::parse(const std::string& src, html_parser::default_handler& p)
	{
		std::istringstream ss(src);
		parse(ss, p);
	}

	void html_parser::parse(std::istream& is, html_parser::default_handler& p)
	{
		Arabica::SAX::Taggle<std::string> parser;

		parser.setContentHandler(p);
		parser.setErrorHandler(p);

		Arabica::SAX::InputSource<std::string> i(is);

		try
		{
			parser.parse(i);
		} catch(Arabica::SAX::SAXException const& e)
		{
			throw error(std::string("Could not parse html: ") + e.what());
		}
	}
}
