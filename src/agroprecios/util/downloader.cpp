#include <agroprecios/util/downloader.hpp>

#include <thread>
#include <curl/curl.h>

namespace agroprecios
{
	static size_t downloader_write_callback(void *contents, size_t size, size_t nmemb, void *userp)
	{
		size_t realsize = size * nmemb;

		std::string *mem = (std::string *)userp;
		mem->append((char *)contents, realsize);

		return realsize;
	}

	downloader::curl_ptr downloader::create_handle() const
	{
		static bool initialized = false;

		if(!initialized)
		{
			curl_global_init(CURL_GLOBAL_ALL);
			initialized = true;
		}

		CURL* handle = curl_easy_init();
		if(handle == nullptr)
			throw error("Could not create curl handle");

		curl_easy_setopt(handle, CURLOPT_REFERER, referer.c_str());
		curl_easy_setopt(handle, CURLOPT_USERAGENT, agent.c_str());
		curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, ""); // Whatever curl can decompress
		curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout);
		curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, downloader_write_callback);

		return curl_ptr(handle, &curl_easy_cleanup);
	}

	void downloader::await_ratelimit()
	{
		if(!has_requested)
			return;

		auto next_request = last_request + std::chrono::milliseconds(ratelimit);
		auto now = std::chrono::steady_clock::now();

		if(now < next_request)
			std::this_thread::sleep_for(next_request - now);
	}

	downloader::downloader(const std::string& agent, unsigned int ratelimit, long timeout)
	: agent(agent)
	, referer()
	, headers()
	, ratelimit(ratelimit)
	, timeout(timeout)
	, has_requested(false)
	, last_request()
	{}

	downloader::response downloader::fetch(const std::string& url)
	{
		await_ratelimit();

		response result{0, "", ""};
		curl_ptr handle(create_handle());

		std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerlist(nullptr, &curl_slist_free_all);
		for(auto const& h : headers)
		{
			curl_slist* appended = curl_slist_append(headerlist.get(), h.c_str());
			if(appended == nullptr)
				throw error("Could not build header list");

			headerlist.release();
			headerlist.reset(appended);
		}

		char errbuf[CURL_ERROR_SIZE];
		errbuf[0] = '\0';

		curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headerlist.get());
		curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errbuf);
		curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
		curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, (void *)&result.body);

		CURLcode code = curl_easy_perform(handle.get());

		has_requested = true;
		last_request = std::chrono::steady_clock::now();

		if(code != CURLE_OK)
			throw error(url + ": " + (errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(code))));

		curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &result.code);

		char* content_type = nullptr;
		if(curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type != nullptr)
			result.content_type = content_type;

		if(result.code >= 400)
			throw error(url + ": HTTP status " + std::to_string(result.code));

		return result;
	}

	void downloader::set_referer(const std::string& r)
	{
		referer = r;
	}

	void downloader::add_header(const std::string& h)
	{
		headers.emplace_back(h);
	}
}
