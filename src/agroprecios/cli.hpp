#pragma once

#include <string>

#include <agroprecios/util/date.hpp>

namespace agroprecios
{
	struct cli_options
	{
		date lastdate;
		int maxdays;
		int maxauctions;
		std::string data_dir;
		unsigned int ratelimit;
		long timeout;
		bool dry_run;
		bool silent;
	};

	/* Fills opt from the command line, returns EXIT_SUCCESS or the exit code main should return */
	int read_options(cli_options& opt, int argc, char const* const* argv);
}
