#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <boost/optional.hpp>

#include <agroprecios/util/html_parser.hpp>
#include <agroprecios/util/html_scope.hpp>
#include <agroprecios/util/util.hpp>

namespace agroprecios
{
	/*
	 * Reads the products table (table.tab_pre_pro) of an auction page.
	 *
	 * The table interleaves family headers (tr.familias_subasta) with product
	 * rows. Every product row belongs to the last family header seen before it,
	 * rows preceding the first header are dropped. The price columns ("cuts")
	 * of a product row are the td.txt cells, numbered by position starting at 1.
	 */
	class row_parser : public html_parser::default_handler
	{
	public:
		typedef boost::optional<int64_t> cut_t;

		struct row
		{
			std::string family_name;
			std::string product_name;
			boost::optional<std::string> product_url;
			std::vector<cut_t> cuts;
		};

		typedef std::function<void(row)> row_callback_t;

	private:
		enum state_e {
			S_INIT,
			S_TABLE,
			S_FAMILY,
			S_PRODUCT,
			S_DONE
		};

		struct row_proto
		{
			boost::optional<std::string> product_name;
			boost::optional<std::string> product_url;
			std::vector<cut_t> cuts;
		};

		row_callback_t row_callback;

		boost::optional<html_recorder> rec;
		html_watcher_collection wc;

		state_e state;

		std::string current_family;
		bool family_cell_seen;
		row_proto current_r;

	public:
		static boost::optional<std::string> parse_product_url(std::string const& onclick)
		{
			static const boost::regex match_location("window\\.location\\s*=\\s*'([^']+)'");

			boost::smatch what;
			if(!boost::regex_search(onclick, what, match_location))
				return boost::none;

			return std::string(what[1]);
		}

		static cut_t parse_cut(std::string const& text)
		{
			std::string str = util::sanitize(text);
			if(str.empty() || str == "-")
				return boost::none;

			std::string cleaned = util::digits_only(str);
			if(cleaned.empty())
				return boost::none;

			try
			{
				return boost::lexical_cast<int64_t>(cleaned);
			} catch(boost::bad_lexical_cast const&)
			{
				return boost::none; // Too many digits to be a price
			}
		}

		row_parser(row_callback_t row_callback_)
		: row_callback(row_callback_)
		, rec()
		, wc()
		, state(S_INIT)
		, current_family()
		, family_cell_seen(false)
		, current_r()
		{}

		template<typename T>
		void parse(T source)
		{
			html_parser::parse(source, *this);
		}

		static std::vector<row> parse_rows(std::string const& html)
		{
			std::vector<row> rows;

			row_parser p([&](row r) {
				rows.emplace_back(std::move(r));
			});
			p.parse(html);

			return rows;
		}

		virtual void startElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName, const AttributesT& atts)
		{
			if(rec)
				rec.get().startElement();

			wc.startElement();

			const std::string att_class = atts.getValue("class");

			switch(state)
			{
			case S_INIT:
				if(boost::iequals(qName, "table") && util::contains_attr("tab_pre_pro", att_class))
				{
					state = S_TABLE;
					wc.add([&]() {
						state = S_DONE;
					});
				}
			break;
			case S_TABLE:
				if(!boost::iequals(qName, "tr"))
					break;

				if(util::contains_attr("familias_subasta", att_class))
				{
					family_cell_seen = false;

					state = S_FAMILY;
					wc.add([&]() { state = S_TABLE; });
				}
				else
				{
					current_r = row_proto();
					current_r.product_url = parse_product_url(atts.getValue("onclick"));

					state = S_PRODUCT;
					wc.add([&]() {
						state = S_TABLE;

						if(!current_r.product_name || current_family.empty())
							return;

						row_callback(row{
							current_family,
							*current_r.product_name,
							current_r.product_url,
							current_r.cuts
						});
					});
				}
			break;
			case S_FAMILY:
				if(boost::iequals(qName, "td") && !family_cell_seen && boost::starts_with(att_class, "fam"))
				{
					family_cell_seen = true;
					rec = html_recorder([&](std::string ch) { current_family = util::sanitize(ch); });
				}
			break;
			case S_PRODUCT:
				if(!boost::iequals(qName, "td"))
					break;

				if(!current_r.product_name && util::contains_attr("pro", att_class))
				{
					current_r.product_name = std::string();
					rec = html_recorder([&](std::string ch) { current_r.product_name = util::sanitize(ch); });
				}
				else if(util::contains_attr("txt", att_class))
					rec = html_recorder([&](std::string ch) { current_r.cuts.emplace_back(parse_cut(ch)); });
			break;
			case S_DONE:
			break;
			}
		}

		virtual void characters(const std::string& ch)
		{
			if(rec)
				rec.get().characters(ch);
		}

		virtual void endElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& /* qName */)
		{
			if(rec && rec.get().endElement())
				rec = boost::none;

			wc.endElement();
		}
	};
}
