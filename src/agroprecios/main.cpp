#include <agroprecios/scraper.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <agroprecios/cli.hpp>
#include <agroprecios/store.hpp>
#include <agroprecios/util/date.hpp>

int main(int argc, char** argv)
{
	agroprecios::cli_options opt;

	int result = agroprecios::read_options(opt, argc, argv);
	if(result != EXIT_SUCCESS)
		return result;

	try
	{
		agroprecios::store st(opt.data_dir);

		std::unique_ptr<agroprecios::downloader> dl(agroprecios::scraper::create_downloader(opt.ratelimit, opt.timeout));
		agroprecios::scraper s([&](std::string const& uri) {
			return dl->fetch(uri);
		}, st, opt.dry_run, opt.silent);

		agroprecios::scraper::stats stats(s.scrape(
			opt.lastdate,
			static_cast<unsigned int>(opt.maxdays),
			static_cast<unsigned int>(opt.maxauctions)
		));

		std::cerr
				<< "[OK] Queries: " << stats.query_count
				<< ", new prices: " << stats.price_count
				<< ", failed: " << stats.error_count
				<< ". Data in " << st.directory().string()
				<< (opt.dry_run ? " (dry run, not saved)" : "")
				<< std::endl;
	} catch(agroprecios::store::error const& e)
	{
		std::cerr << "[ERROR] " << e.what() << std::endl;
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
