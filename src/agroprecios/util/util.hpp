#pragma once

#include <algorithm>
#include <iterator>
#include <locale>
#include <sstream>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>
#include <boost/regex.hpp>

namespace agroprecios
{
	class util
	{
		util() = delete;
		util(util&) = delete;
		void operator=(util&) = delete;

	public:
		/* Non-breaking spaces (&nbsp; decoded to UTF-8) become plain spaces */
		static inline std::string unify_spaces(const std::string& str)
		{
			return boost::algorithm::replace_all_copy(str, "\xC2\xA0", " ");
		}

		static inline std::string trim(const std::string& str)
		{
			return boost::algorithm::trim_copy(unify_spaces(str));
		}

		static inline std::string sanitize(const std::string& str)
		{
			std::stringstream is(unify_spaces(str));
			std::string result;

			while(is.peek() != std::char_traits<char>::eof())
			{
				std::string tmp;
				is >> tmp;

				if(!result.empty() && !tmp.empty())
					result.append(" ");

				result.append(tmp);
			}

			boost::trim(result);
			return result;
		}

		static inline bool contains_attr(const std::string& needle, const std::string& haystack)
		{
			static const boost::regex regex_classes(" ");

			boost::sregex_token_iterator it(haystack.begin(), haystack.end(), regex_classes, -1);
			boost::sregex_token_iterator end;

			while(it != end)
			{
				auto m = *it++;
				if(m.matched && m.compare(needle) == 0)
					return true;
			}

			return false;
		}

		static inline std::string digits_only(const std::string& str)
		{
			std::string result;
			std::copy_if(str.begin(), str.end(), std::back_inserter(result), [](char c) {
				return c >= '0' && c <= '9';
			});

			return result;
		}

		/* Lookup key for names: trimmed and case folded, "Vacuno" == " vacuno " */
		static inline std::string normalize_key(const std::string& name)
		{
			static const std::locale loc = boost::locale::generator()("en_US.UTF-8");

			std::string trimmed = trim(name);
			try
			{
				return boost::locale::to_lower(trimmed, loc);
			} catch(boost::locale::conv::conversion_error const&)
			{
				return boost::algorithm::to_lower_copy(trimmed); // Not UTF-8, fold ASCII only
			}
		}
	};
}
