#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <boost/optional.hpp>

#include <agroprecios/util/date.hpp>
#include <agroprecios/util/html_parser.hpp>
#include <agroprecios/util/html_scope.hpp>
#include <agroprecios/util/util.hpp>

namespace agroprecios
{
	/*
	 * Reads the header table (table.tab_pre_sub) of an auction page, which holds
	 * the auction name on the left (td.titNombreizq) and the date the prices
	 * belong to on the right (td.titNombreder).
	 */
	class title_parser : public html_parser::default_handler
	{
	public:
		struct title_info
		{
			boost::optional<std::string> name;
			boost::optional<std::string> date_text;

			std::string auction_name(uint64_t fallback_id) const
			{
				if(!name || name->empty())
					return "Subasta " + std::to_string(fallback_id);

				return *name;
			}

			date table_date(date const& fallback) const
			{
				static const boost::regex match_date("([0-9]{2})-([0-9]{2})-([0-9]{4})");

				if(!date_text)
					return fallback;

				boost::smatch what;
				if(!boost::regex_search(*date_text, what, match_date))
					return fallback;

				boost::optional<date> d(make_date(what[1], what[2], what[3]));
				if(!d)
					return fallback;

				return *d;
			}
		};

	private:
		enum state_e {
			S_INIT,
			S_TITLE
		};

		boost::optional<html_recorder> rec;
		html_watcher_collection wc;

		state_e state;
		title_info current_t;

	public:
		title_parser()
		: rec()
		, wc()
		, state(S_INIT)
		, current_t()
		{}

		template<typename T>
		title_info parse(T source)
		{
			html_parser::parse(source, *this);
			return current_t;
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
				if(boost::iequals(qName, "table") && util::contains_attr("tab_pre_sub", att_class))
				{
					state = S_TITLE;
					wc.add([&]() { state = S_INIT; });
				}
			break;
			case S_TITLE:
				if(!boost::iequals(qName, "td"))
					break;

				if(!current_t.name && util::contains_attr("titNombreizq", att_class))
				{
					current_t.name = std::string();
					rec = html_recorder([&](std::string ch) { current_t.name = util::sanitize(ch); });
				}
				else if(!current_t.date_text && util::contains_attr("titNombreder", att_class))
				{
					current_t.date_text = std::string();
					rec = html_recorder([&](std::string ch) { current_t.date_text = util::sanitize(ch); });
				}
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
