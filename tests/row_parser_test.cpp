#include <gtest/gtest.h>

#include <vector>
#include <boost/optional/optional_io.hpp>

#include <agroprecios/parsers/row_parser.hpp>

#include "pages.hpp"

using namespace agroprecios;
using cut_t = row_parser::cut_t;

TEST(RowParserTest, CutsKeepTheirPosition)
{
	std::string html = test::page(test::products_table(
		test::family_row("Hortalizas") +
		test::product_row("Tomate", test::cut("1200") + test::cut("-") + test::cut("") + test::cut("980"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);

	std::vector<cut_t> expected{cut_t(1200), boost::none, boost::none, cut_t(980)};
	EXPECT_EQ(rows[0].cuts, expected);
}

TEST(RowParserTest, CutsStripEverythingButDigits)
{
	std::string html = test::page(test::products_table(
		test::family_row("Hortalizas") +
		test::product_row("Pepino", test::cut("1.234 EUR") + test::cut(" 0,85 ") + test::cut("n/d") + test::cut(" - "))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);

	std::vector<cut_t> expected{cut_t(1234), cut_t(85), boost::none, boost::none};
	EXPECT_EQ(rows[0].cuts, expected);
}

TEST(RowParserTest, ProductsBelongToLastFamilyHeader)
{
	std::string html = test::page(test::products_table(
		test::family_row("Vacuno") +
		test::product_row("Novillo", test::cut("1500")) +
		test::product_row("Ternera", test::cut("1700")) +
		test::family_row("Porcino") +
		test::product_row("Cebo", test::cut("900"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 3u);

	EXPECT_EQ(rows[0].family_name, "Vacuno");
	EXPECT_EQ(rows[0].product_name, "Novillo");
	EXPECT_EQ(rows[1].family_name, "Vacuno");
	EXPECT_EQ(rows[1].product_name, "Ternera");
	EXPECT_EQ(rows[2].family_name, "Porcino");
	EXPECT_EQ(rows[2].product_name, "Cebo");
}

TEST(RowParserTest, RowsBeforeFirstFamilyAreSkipped)
{
	std::string html = test::page(test::products_table(
		"<tr><td class=\"cab\">Producto</td><td class=\"cab\">Corte 1</td></tr>" +
		test::product_row("Huerfano", test::cut("100")) +
		test::family_row("Ovino") +
		test::product_row("Cordero", test::cut("650"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].family_name, "Ovino");
	EXPECT_EQ(rows[0].product_name, "Cordero");
}

TEST(RowParserTest, NamesAreTrimmedAndCollapsed)
{
	std::string html = test::page(test::products_table(
		test::family_row("\n   Frutas   ") +
		test::product_row("  Uva <b>blanca</b>\n  sin semilla ", test::cut("300"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].family_name, "Frutas");
	EXPECT_EQ(rows[0].product_name, "Uva blanca sin semilla");
}

TEST(RowParserTest, NonBreakingSpacePaddingIsTrimmed)
{
	std::string html = test::page(test::products_table(
		test::family_row("Vacuno\xC2\xA0") +
		test::product_row("\xC2\xA0Novillo\xC2\xA0\xC2\xA0" "extra", test::cut("1500"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].family_name, "Vacuno");
	EXPECT_EQ(rows[0].product_name, "Novillo extra");
}

TEST(RowParserTest, ProductUrlFromRowNavigation)
{
	std::string html = test::page(test::products_table(
		test::family_row("Vacuno") +
		test::product_row("Novillo", test::cut("1500"), "window.location = '/precios-producto.php?pro=12'") +
		test::product_row("Ternera", test::cut("1700"))
	));

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 2u);

	ASSERT_TRUE(rows[0].product_url);
	EXPECT_EQ(*rows[0].product_url, "/precios-producto.php?pro=12");
	EXPECT_FALSE(rows[1].product_url);
}

TEST(RowParserTest, ParseProductUrl)
{
	EXPECT_EQ(row_parser::parse_product_url("window.location='a.php?x=1'").value_or(""), "a.php?x=1");
	EXPECT_EQ(row_parser::parse_product_url("return false; window.location  =  'b.php'").value_or(""), "b.php");
	EXPECT_FALSE(row_parser::parse_product_url(""));
	EXPECT_FALSE(row_parser::parse_product_url("window.open('c.php')"));
}

TEST(RowParserTest, ParseCut)
{
	EXPECT_EQ(row_parser::parse_cut("1200"), cut_t(1200));
	EXPECT_EQ(row_parser::parse_cut("-"), cut_t());
	EXPECT_EQ(row_parser::parse_cut("   "), cut_t());
	EXPECT_EQ(row_parser::parse_cut("99999999999999999999999"), cut_t());
}

TEST(RowParserTest, WithoutProductsTableThereAreNoRows)
{
	std::string html = test::page(
		"<table class=\"otra\">" +
		test::family_row("Vacuno") +
		test::product_row("Novillo", test::cut("1500")) +
		"</table>"
	);

	EXPECT_TRUE(row_parser::parse_rows(html).empty());
}

TEST(RowParserTest, OnlyFirstProductsTableIsRead)
{
	std::string html = test::page(
		test::products_table(test::family_row("Vacuno") + test::product_row("Novillo", test::cut("1500"))) +
		test::products_table(test::family_row("Porcino") + test::product_row("Cebo", test::cut("900")))
	);

	auto rows = row_parser::parse_rows(html);
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].product_name, "Novillo");
}

TEST(RowParserTest, CallbackReceivesRowsInDocumentOrder)
{
	std::string html = test::page(test::products_table(
		test::family_row("Vacuno") +
		test::product_row("Novillo", test::cut("1500")) +
		test::product_row("Ternera", test::cut("1700"))
	));

	std::vector<std::string> names;
	row_parser p([&](row_parser::row r) {
		names.push_back(r.product_name);
	});
	p.parse(html);

	EXPECT_EQ(names, (std::vector<std::string>{"Novillo", "Ternera"}));
}
