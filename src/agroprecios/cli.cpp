#include <agroprecios/cli.hpp>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace agroprecios
{
	int read_options(cli_options& opt, int argc, char const* const* argv)
	{
		std::string lastdate_str;
		int maxsubastas = 0;

		boost::program_options::options_description o_general("General options");
		o_general.add_options()
				("help,h", "display this message")
				("lastdate", boost::program_options::value(&lastdate_str), "most recent date to scrape, dd/mm/yyyy (default: today)")
				("maxdays", boost::program_options::value(&opt.maxdays), "amount of days to scrape, going back from lastdate (default: 1)")
				("maxauctions", boost::program_options::value(&opt.maxauctions), "scrape auctions 1 up to and including this id (default: 10)")
				("maxsubastas", boost::program_options::value(&maxsubastas), "same as --maxauctions")
				("data-dir,o", boost::program_options::value(&opt.data_dir), "directory holding the json collections (default: ./data)")
				("ratelimit,r", boost::program_options::value(&opt.ratelimit), "minimal time between each request in milliseconds (default: 1000)")
				("timeout,t", boost::program_options::value(&opt.timeout), "timeout of a single request in seconds (default: 20)")
				("dry-run,d", "does not save the collections when set")
				("silent,s", "only report failures and the final summary");

		boost::program_options::variables_map vm;
		boost::program_options::positional_options_description pos;

		boost::program_options::options_description options("Allowed options");
		options.add(o_general);

		try
		{
			boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(options).positional(pos).run(), vm);
		} catch(boost::program_options::unknown_option &e)
		{
			std::cerr << "Unknown option --" << e.get_option_name() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		} catch(boost::program_options::error &e)
		{
			std::cerr << e.what() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		}

		try
		{
			boost::program_options::notify(vm);
		} catch(boost::program_options::error &e)
		{
			std::cerr << e.what() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		}

		if(vm.count("help"))
		{
			std::cout
					<< "Incremental scraper for the auction price tables of agroprecios.com" << std::endl
					<< "Usage: ./agroprecios [options]" << std::endl
					<< std::endl
					<< o_general;

			return EXIT_FAILURE;
		}

		try
		{
			opt.lastdate = vm.count("lastdate") ? parse_input_date(lastdate_str) : today();
		} catch(std::invalid_argument const& e)
		{
			std::cerr << "Invalid --lastdate, use dd/mm/yyyy: " << e.what() << std::endl;
			return EXIT_FAILURE;
		}

		if(!vm.count("maxdays"))
			opt.maxdays = 1;

		if(!vm.count("maxauctions"))
			opt.maxauctions = vm.count("maxsubastas") ? maxsubastas : 10;

		if(opt.maxdays < 1)
		{
			std::cerr << "--maxdays should be at least 1" << std::endl;
			return EXIT_FAILURE;
		}

		if(opt.maxauctions < 1)
		{
			std::cerr << "--maxauctions should be at least 1" << std::endl;
			return EXIT_FAILURE;
		}

		if(!vm.count("data-dir"))
			opt.data_dir = "./data";

		if(!vm.count("ratelimit"))
			opt.ratelimit = 1000;

		if(!vm.count("timeout"))
			opt.timeout = 20;

		opt.dry_run = vm.count("dry-run");
		opt.silent = vm.count("silent");

		return EXIT_SUCCESS;
	}
}
