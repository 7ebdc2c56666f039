#include <gtest/gtest.h>

#include <agroprecios/parsers/title_parser.hpp>

#include "pages.hpp"

using namespace agroprecios;

TEST(TitleParserTest, ReadsNameAndDate)
{
	std::string html = test::page(test::title_table(" Subasta  La Union ", "Precios del 05-03-2024"));

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.auction_name(3), "Subasta La Union");
	EXPECT_EQ(t.table_date(date(2099, 1, 1)), date(2024, 3, 5));
}

TEST(TitleParserTest, MissingTitleFallsBack)
{
	std::string html = test::page("<p>Sin cabecera</p>");

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.auction_name(7), "Subasta 7");
	EXPECT_EQ(t.table_date(date(2024, 1, 2)), date(2024, 1, 2));
}

TEST(TitleParserTest, EmptyNameFallsBack)
{
	std::string html = test::page(test::title_table("  ", "05-03-2024"));

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.auction_name(12), "Subasta 12");
}

TEST(TitleParserTest, DateWithoutPatternFallsBack)
{
	std::string html = test::page(test::title_table("Mercado", "5 de marzo de 2024"));

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.table_date(date(2024, 3, 1)), date(2024, 3, 1));
}

TEST(TitleParserTest, ImpossibleDateFallsBack)
{
	std::string html = test::page(test::title_table("Mercado", "31-02-2024"));

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.table_date(date(2024, 3, 1)), date(2024, 3, 1));
}

TEST(TitleParserTest, CellsOutsideHeaderTableAreIgnored)
{
	std::string html = test::page(
		"<table class=\"otra\"><tr><td class=\"titNombreizq\">Falsa</td><td class=\"titNombreder\">01-01-2000</td></tr></table>" +
		test::title_table("Buena", "02-02-2020")
	);

	title_parser::title_info t(title_parser().parse(html));

	EXPECT_EQ(t.auction_name(1), "Buena");
	EXPECT_EQ(t.table_date(date(2024, 3, 1)), date(2020, 2, 2));
}
