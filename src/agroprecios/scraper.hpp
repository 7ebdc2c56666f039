#pragma once

#include <functional>
#include <memory>
#include <string>

#include <agroprecios/records.hpp>
#include <agroprecios/store.hpp>
#include <agroprecios/util/date.hpp>
#include <agroprecios/util/downloader.hpp>

namespace agroprecios
{
	class scraper
	{
	public:
		typedef std::function<downloader::response(std::string const& uri)> fetch_callback_t;

		struct stats
		{
			size_t query_count, price_count, error_count;
		};

	private:
		fetch_callback_t fetch;
		store& s;

		bool dry_run;
		bool silent;

		size_t query_count, price_count, error_count;

		std::string decode(downloader::response const& response) const;
		void process(id_t auction_id, date const& day, std::string const& body);

	public:
		static std::string auction_uri(id_t auction_id, date const& day);
		static std::unique_ptr<downloader> create_downloader(unsigned int ratelimit, long timeout);

		scraper(fetch_callback_t _fetch, store& _s, bool dry_run = false, bool silent = false);
		scraper(scraper&) = delete;
		void operator=(scraper&) = delete;

		/* Visits every auction 1..maxauctions for lastdate and the maxdays-1 days before it */
		stats scrape(date const& lastdate, unsigned int maxdays, unsigned int maxauctions);
	};
}
