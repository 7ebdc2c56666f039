#include <agroprecios/scraper.hpp>

#include <iostream>
#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>
#include <boost/regex.hpp>

#include <agroprecios/classifier.hpp>
#include <agroprecios/parsers/row_parser.hpp>
#include <agroprecios/parsers/title_parser.hpp>

namespace agroprecios
{
	static const std::string domain_uri = "https://www.agroprecios.com";
	static const std::string table_uri = domain_uri + "/precios-subasta-tabla.php";

	static const std::string user_agent =
		"Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) "
		"AppleWebKit/537.36 (KHTML, like Gecko) "
		"Chrome/123.0.0.0 Safari/537.36";

	scraper::scraper(fetch_callback_t _fetch, store& _s, bool _dry_run, bool _silent)
	: fetch(_fetch)
	, s(_s)
	, dry_run(_dry_run)
	, silent(_silent)
	, query_count(0)
	, price_count(0)
	, error_count(0)
	{}

	std::string scraper::auction_uri(id_t auction_id, date const& day)
	{
		return table_uri
			+ "?sub=" + std::to_string(auction_id)
			+ "&fec=" + boost::algorithm::replace_all_copy(to_query_date(day), "/", "%2F")
			+ "&op=1";
	}

	std::unique_ptr<downloader> scraper::create_downloader(unsigned int ratelimit, long timeout)
	{
		std::unique_ptr<downloader> dl(std::make_unique<downloader>(user_agent, ratelimit, timeout));

		dl->set_referer(domain_uri + "/");
		dl->add_header("Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8");
		dl->add_header("Accept-Language: es-ES,es;q=0.9,en;q=0.8");

		return dl;
	}

	std::string scraper::decode(downloader::response const& response) const
	{
		static const boost::regex match_charset("charset\\s*=\\s*[\"']?([A-Za-z0-9_.:-]+)", boost::regex::icase);
		static const boost::regex match_meta_charset("<meta[^>]*charset\\s*=\\s*[\"']?([A-Za-z0-9_.:-]+)", boost::regex::icase);

		// The header wins, a <meta> declaration in the page is the fallback
		boost::smatch what;
		if(
			!boost::regex_search(response.content_type, what, match_charset) &&
			!boost::regex_search(response.body, what, match_meta_charset)
		)
			return response.body;

		std::string charset(what[1]);
		if(boost::iequals(charset, "utf-8") || boost::iequals(charset, "utf8"))
			return response.body;

		try
		{
			return boost::locale::conv::to_utf<char>(response.body, charset);
		} catch(boost::locale::conv::invalid_charset_error const&)
		{
			std::cerr << "[WARN] Unknown charset '" << charset << "', reading page as UTF-8" << std::endl;
			return response.body;
		}
	}

	void scraper::process(id_t auction_id, date const& day, std::string const& body)
	{
		title_parser::title_info title(title_parser().parse(body));
		std::vector<row_parser::row> rows(row_parser::parse_rows(body));

		std::string const auction_name = title.auction_name(auction_id);
		std::string const date_iso = to_iso_date(title.table_date(day));

		if(rows.empty())
		{
			if(!silent)
				std::cerr << "[INFO] No product rows for auction " << auction_id << " on " << date_iso << std::endl;

			return;
		}

		s.upsert_auction(auction_id, auction_name);

		size_t inserted = 0;
		for(auto const& r : rows)
		{
			id_t family_id = s.get_or_create_family(r.family_name);
			id_t product_id = s.get_or_create_product(family_id, r.product_name, r.product_url);

			for(size_t i = 0; i < r.cuts.size(); ++i)
			{
				if(!r.cuts[i])
					continue;

				if(s.insert_price(auction_id, date_iso, product_id, static_cast<unsigned int>(i + 1), *r.cuts[i]))
					++inserted;
			}
		}

		price_count += inserted;

		if(!silent)
			std::cerr << "[INFO] Auction " << auction_id << " '" << auction_name << "' on " << date_iso << ": " << rows.size() << " rows, " << inserted << " new prices" << std::endl;
	}

	scraper::stats scraper::scrape(date const& lastdate, unsigned int maxdays, unsigned int maxauctions)
	{
		query_count = 0;
		price_count = 0;
		error_count = 0;

		for(unsigned int day_offset = 0; day_offset < maxdays; ++day_offset)
		{
			date const current_day = lastdate - boost::gregorian::days(day_offset);

			for(id_t auction_id = 1; auction_id <= maxauctions; ++auction_id)
			{
				++query_count;

				std::string body;
				try
				{
					body = decode(fetch(auction_uri(auction_id, current_day)));
				} catch(std::runtime_error const& e)
				{
					++error_count;
					std::cerr << "[WARN] Request failed for auction " << auction_id << " on " << to_query_date(current_day) << ": " << e.what() << std::endl;
					continue;
				}

				if(is_error_response(body))
				{
					if(!silent)
						std::cerr << "[INFO] No valid auction " << auction_id << " on " << to_query_date(current_day) << std::endl;

					continue;
				}

				try
				{
					process(auction_id, current_day, body);
				} catch(std::runtime_error const& e)
				{
					++error_count;
					std::cerr << "[WARN] Could not parse auction " << auction_id << " on " << to_query_date(current_day) << ": " << e.what() << std::endl;
				}
			}
		}

		if(!dry_run)
			s.save();

		return stats{query_count, price_count, error_count};
	}
}
