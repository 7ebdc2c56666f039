#pragma once

#include <string>

namespace agroprecios
{
namespace test
{

inline std::string title_table(std::string const& name, std::string const& date_text)
{
	return
		"<table class=\"tab_pre_sub\"><tr>"
		"<td class=\"titNombreizq\">" + name + "</td>"
		"<td class=\"titNombreder\">" + date_text + "</td>"
		"</tr></table>";
}

inline std::string family_row(std::string const& name)
{
	return "<tr class=\"familias_subasta\"><td class=\"fam1\" colspan=\"5\">" + name + "</td></tr>";
}

inline std::string product_row(std::string const& name, std::string const& cells, std::string const& onclick = "")
{
	std::string tr = onclick.empty() ? "<tr>" : "<tr onclick=\"" + onclick + "\">";
	return tr + "<td class=\"pro\">" + name + "</td>" + cells + "</tr>";
}

inline std::string cut(std::string const& text)
{
	return "<td class=\"txt\">" + text + "</td>";
}

inline std::string products_table(std::string const& rows)
{
	return "<table class=\"tab_pre_pro\">" + rows + "</table>";
}

inline std::string page(std::string const& content)
{
	return "<html><head><title>Precios subasta</title></head><body>" + content + "</body></html>";
}

inline std::string error_page()
{
	return page("<p>ERROR: no existen datos para la subasta solicitada</p>");
}

}
}
