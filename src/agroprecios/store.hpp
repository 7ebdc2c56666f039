#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include <jsoncpp/json/json.h>

#include <agroprecios/records.hpp>

namespace agroprecios
{
	/*
	 * Keeps auctions, families, products and prices keyed by their natural keys.
	 *
	 * Every collection lives in its own JSON file within the data directory. All
	 * four are read on construction and written back as a whole by save(). A
	 * collection that cannot be read starts out empty.
	 */
	class store
	{
	public:
		class error : public std::runtime_error
		{
		public:
			error(std::string const& what)
			: std::runtime_error(what)
			{}
		};

		typedef std::pair<id_t, std::string> product_key_t;
		typedef std::tuple<id_t, std::string, id_t, unsigned int> price_key_t;

	private:
		boost::filesystem::path data_dir;

		std::vector<auction> auction_list;
		std::vector<family> family_list;
		std::vector<product> product_list;
		std::vector<price> price_list;

		std::map<id_t, size_t> auctions_by_id;
		std::map<id_t, size_t> families_by_id;
		std::map<std::string, size_t> families_by_name;
		std::map<id_t, size_t> products_by_id;
		std::map<product_key_t, size_t> products_by_key;
		std::set<price_key_t> price_keys;

		id_t max_family_id, max_product_id;

		boost::filesystem::path path_of(std::string const& filename) const;

		void load();
		void load_auctions(Json::Value const& root);
		void load_families(Json::Value const& root);
		void load_products(Json::Value const& root);
		void load_prices(Json::Value const& root);

		void rename_auction(auction& a, std::string const& name);
		void set_product_url(product& p, std::string const& url);

		static Json::Value read_collection(boost::filesystem::path const& path);
		static void write_collection(boost::filesystem::path const& path, Json::Value const& root);

	public:
		store(std::string const& data_dir);
		store(store&) = delete;
		void operator=(store&) = delete;

		void upsert_auction(id_t id, std::string const& name);
		id_t get_or_create_family(std::string const& name);
		id_t get_or_create_product(id_t family_id, std::string const& name, boost::optional<std::string> const& url);
		bool insert_price(id_t auction_id, std::string const& date_iso, id_t product_id, unsigned int cut, int64_t value);

		void save() const;

		boost::optional<auction> find_auction(id_t id) const;
		boost::optional<family> find_family(id_t id) const;
		boost::optional<product> find_product(id_t id) const;

		std::vector<auction> const& auctions() const { return auction_list; }
		std::vector<family> const& families() const { return family_list; }
		std::vector<product> const& products() const { return product_list; }
		std::vector<price> const& prices() const { return price_list; }

		boost::filesystem::path const& directory() const { return data_dir; }
	};
}
