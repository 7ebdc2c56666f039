#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

typedef void CURL;

namespace agroprecios
{
	class downloader
	{
	public:
		typedef std::unique_ptr<CURL, std::function<void(CURL*)>> curl_ptr;

		struct response
		{
			long code;
			std::string content_type;
			std::string body;
		};

		class error : public std::runtime_error
		{
		public:
			error(std::string const& what)
			: std::runtime_error(what)
			{}
		};

	private:
		std::string agent, referer;
		std::vector<std::string> headers;

		unsigned int ratelimit; // Milliseconds between the end of a request and the start of the next
		long timeout; // Seconds

		bool has_requested;
		std::chrono::steady_clock::time_point last_request;

		curl_ptr create_handle() const;
		void await_ratelimit();

	public:
		downloader(const std::string& agent, unsigned int ratelimit = 0, long timeout = 20);

		response fetch(const std::string& url);

		void set_referer(const std::string& referer);
		void add_header(const std::string& header);

		downloader(downloader&) = delete;
		void operator=(downloader&) = delete;
	};
}
