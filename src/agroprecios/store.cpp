#include <agroprecios/store.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>

#include <agroprecios/util/util.hpp>

namespace agroprecios
{
	// File and field names match the data directories of earlier versions of the tool
	static const std::string auctions_file = "subastas.json";
	static const std::string families_file = "familias.json";
	static const std::string products_file = "productos.json";
	static const std::string prices_file = "preciosubasta.json";

	static bool has_id(Json::Value const& v, char const* field)
	{
		return v.isMember(field) && v[field].isUInt64();
	}

	static bool has_string(Json::Value const& v, char const* field)
	{
		return v.isMember(field) && v[field].isString();
	}

	static void report_skipped(std::string const& file, Json::ArrayIndex i, std::string const& reason)
	{
		std::cerr << "[WARN] Skipping record " << i << " of " << file << ": " << reason << std::endl;
	}

	store::store(std::string const& _data_dir)
	: data_dir(_data_dir)
	, auction_list()
	, family_list()
	, product_list()
	, price_list()
	, auctions_by_id()
	, families_by_id()
	, families_by_name()
	, products_by_id()
	, products_by_key()
	, price_keys()
	, max_family_id(0)
	, max_product_id(0)
	{
		try
		{
			boost::filesystem::create_directories(data_dir);
		} catch(boost::filesystem::filesystem_error const& e)
		{
			throw error("Could not create data directory " + data_dir.string() + ": " + e.what());
		}

		load();
	}

	boost::filesystem::path store::path_of(std::string const& filename) const
	{
		return data_dir / filename;
	}

	Json::Value store::read_collection(boost::filesystem::path const& path)
	{
		if(!boost::filesystem::exists(path))
			return Json::Value(Json::arrayValue);

		std::ifstream is(path.string(), std::ios::binary);
		if(!is)
		{
			std::cerr << "[WARN] Could not open " << path.string() << ", starting with an empty collection" << std::endl;
			return Json::Value(Json::arrayValue);
		}

		Json::CharReaderBuilder builder;
		Json::Value root;
		std::string errs;

		if(!Json::parseFromStream(builder, is, &root, &errs))
		{
			std::cerr << "[WARN] Could not parse " << path.string() << ", starting with an empty collection: " << errs << std::endl;
			return Json::Value(Json::arrayValue);
		}

		if(!root.isArray())
		{
			std::cerr << "[WARN] " << path.string() << " does not hold a list, starting with an empty collection" << std::endl;
			return Json::Value(Json::arrayValue);
		}

		return root;
	}

	void store::write_collection(boost::filesystem::path const& path, Json::Value const& root)
	{
		boost::filesystem::path tmp_path(path);
		tmp_path += ".tmp";

		{
			std::ofstream os(tmp_path.string(), std::ios::binary | std::ios::trunc);
			if(!os)
				throw error("Could not open " + tmp_path.string() + " for writing");

			Json::StreamWriterBuilder builder;
			builder["indentation"] = "  ";
			builder["emitUTF8"] = true;

			std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
			writer->write(root, &os);
			os << std::endl;

			os.close();
			if(!os)
				throw error("Could not write " + tmp_path.string());
		}

		// Replaces the previous snapshot in one step, a crash leaves either the old or the new file
		boost::system::error_code ec;
		boost::filesystem::rename(tmp_path, path, ec);
		if(ec)
			throw error("Could not replace " + path.string() + ": " + ec.message());
	}

	void store::load()
	{
		load_auctions(read_collection(path_of(auctions_file)));
		load_families(read_collection(path_of(families_file)));
		load_products(read_collection(path_of(products_file)));
		load_prices(read_collection(path_of(prices_file)));
	}

	void store::load_auctions(Json::Value const& root)
	{
		for(Json::ArrayIndex i = 0; i < root.size(); ++i)
		{
			Json::Value const& v = root[i];
			if(!v.isObject() || !has_id(v, "id") || !has_string(v, "nombre"))
			{
				report_skipped(auctions_file, i, "malformed");
				continue;
			}

			auction a{v["id"].asUInt64(), v["nombre"].asString()};
			if(!auctions_by_id.emplace(a.id, auction_list.size()).second)
			{
				report_skipped(auctions_file, i, "duplicate id");
				continue;
			}

			auction_list.emplace_back(std::move(a));
		}
	}

	void store::load_families(Json::Value const& root)
	{
		for(Json::ArrayIndex i = 0; i < root.size(); ++i)
		{
			Json::Value const& v = root[i];
			if(!v.isObject() || !has_id(v, "id") || !has_string(v, "nombre"))
			{
				report_skipped(families_file, i, "malformed");
				continue;
			}

			family f{v["id"].asUInt64(), v["nombre"].asString()};
			if(!families_by_id.emplace(f.id, family_list.size()).second)
			{
				report_skipped(families_file, i, "duplicate id");
				continue;
			}

			families_by_name.emplace(util::normalize_key(f.name), family_list.size());
			max_family_id = std::max(max_family_id, f.id);
			family_list.emplace_back(std::move(f));
		}
	}

	void store::load_products(Json::Value const& root)
	{
		for(Json::ArrayIndex i = 0; i < root.size(); ++i)
		{
			Json::Value const& v = root[i];
			if(!v.isObject() || !has_id(v, "id") || !has_id(v, "familia_id") || !has_string(v, "nombre"))
			{
				report_skipped(products_file, i, "malformed");
				continue;
			}

			product p{v["id"].asUInt64(), v["familia_id"].asUInt64(), v["nombre"].asString(), boost::none};
			if(has_string(v, "url") && !v["url"].asString().empty())
				p.url = v["url"].asString();

			if(!products_by_id.emplace(p.id, product_list.size()).second)
			{
				report_skipped(products_file, i, "duplicate id");
				continue;
			}

			products_by_key.emplace(product_key_t(p.family_id, util::normalize_key(p.name)), product_list.size());
			max_product_id = std::max(max_product_id, p.id);
			product_list.emplace_back(std::move(p));
		}
	}

	void store::load_prices(Json::Value const& root)
	{
		for(Json::ArrayIndex i = 0; i < root.size(); ++i)
		{
			Json::Value const& v = root[i];
			if(
				!v.isObject() ||
				!has_id(v, "subasta_id") ||
				!has_string(v, "fecha") ||
				!has_id(v, "producto_id") ||
				!v.isMember("corte") || !v["corte"].isUInt() ||
				!v.isMember("precio") || !v["precio"].isInt64()
			)
			{
				report_skipped(prices_file, i, "malformed");
				continue;
			}

			price p{
				v["subasta_id"].asUInt64(),
				v["fecha"].asString(),
				v["producto_id"].asUInt64(),
				v["corte"].asUInt(),
				v["precio"].asInt64()
			};

			if(!price_keys.emplace(p.auction_id, p.date, p.product_id, p.cut).second)
			{
				report_skipped(prices_file, i, "duplicate key");
				continue;
			}

			price_list.emplace_back(std::move(p));
		}
	}

	void store::rename_auction(auction& a, std::string const& name)
	{
		a.name = name;
	}

	void store::set_product_url(product& p, std::string const& url)
	{
		p.url = url;
	}

	void store::upsert_auction(id_t id, std::string const& _name)
	{
		std::string name(util::trim(_name));

		auto it = auctions_by_id.find(id);
		if(it == auctions_by_id.end())
		{
			auctions_by_id.emplace(id, auction_list.size());
			auction_list.emplace_back(auction{id, name});
			return;
		}

		auction& stored = auction_list[it->second];
		if(!name.empty() && stored.name != name)
			rename_auction(stored, name);
	}

	id_t store::get_or_create_family(std::string const& name)
	{
		std::string key(util::normalize_key(name));

		auto it = families_by_name.find(key);
		if(it != families_by_name.end())
			return family_list[it->second].id;

		id_t id = ++max_family_id;
		families_by_id.emplace(id, family_list.size());
		families_by_name.emplace(key, family_list.size());
		family_list.emplace_back(family{id, util::trim(name)});

		return id;
	}

	id_t store::get_or_create_product(id_t family_id, std::string const& name, boost::optional<std::string> const& url)
	{
		product_key_t key(family_id, util::normalize_key(name));

		auto it = products_by_key.find(key);
		if(it != products_by_key.end())
		{
			product& stored = product_list[it->second];
			if(url && !url->empty() && (!stored.url || stored.url->empty()))
				set_product_url(stored, *url);

			return stored.id;
		}

		boost::optional<std::string> stored_url;
		if(url && !url->empty())
			stored_url = *url;

		id_t id = ++max_product_id;
		products_by_id.emplace(id, product_list.size());
		products_by_key.emplace(key, product_list.size());
		product_list.emplace_back(product{id, family_id, util::trim(name), stored_url});

		return id;
	}

	bool store::insert_price(id_t auction_id, std::string const& date_iso, id_t product_id, unsigned int cut, int64_t value)
	{
		if(!price_keys.emplace(auction_id, date_iso, product_id, cut).second)
			return false;

		price_list.emplace_back(price{auction_id, date_iso, product_id, cut, value});
		return true;
	}

	void store::save() const
	{
		Json::Value auctions_root(Json::arrayValue);
		for(auto const& a : auction_list)
		{
			Json::Value v(Json::objectValue);
			v["id"] = Json::UInt64(a.id);
			v["nombre"] = a.name;
			auctions_root.append(v);
		}

		Json::Value families_root(Json::arrayValue);
		for(auto const& f : family_list)
		{
			Json::Value v(Json::objectValue);
			v["id"] = Json::UInt64(f.id);
			v["nombre"] = f.name;
			families_root.append(v);
		}

		Json::Value products_root(Json::arrayValue);
		for(auto const& p : product_list)
		{
			Json::Value v(Json::objectValue);
			v["id"] = Json::UInt64(p.id);
			v["familia_id"] = Json::UInt64(p.family_id);
			v["nombre"] = p.name;
			v["url"] = p.url ? Json::Value(*p.url) : Json::Value(Json::nullValue);
			products_root.append(v);
		}

		Json::Value prices_root(Json::arrayValue);
		for(auto const& p : price_list)
		{
			Json::Value v(Json::objectValue);
			v["subasta_id"] = Json::UInt64(p.auction_id);
			v["fecha"] = p.date;
			v["producto_id"] = Json::UInt64(p.product_id);
			v["corte"] = p.cut;
			v["precio"] = Json::Int64(p.value);
			prices_root.append(v);
		}

		write_collection(path_of(auctions_file), auctions_root);
		write_collection(path_of(families_file), families_root);
		write_collection(path_of(products_file), products_root);
		write_collection(path_of(prices_file), prices_root);
	}

	boost::optional<auction> store::find_auction(id_t id) const
	{
		auto it = auctions_by_id.find(id);
		if(it == auctions_by_id.end())
			return boost::none;

		return auction_list[it->second];
	}

	boost::optional<family> store::find_family(id_t id) const
	{
		auto it = families_by_id.find(id);
		if(it == families_by_id.end())
			return boost::none;

		return family_list[it->second];
	}

	boost::optional<product> store::find_product(id_t id) const
	{
		auto it = products_by_id.find(id);
		if(it == products_by_id.end())
			return boost::none;

		return product_list[it->second];
	}
}
