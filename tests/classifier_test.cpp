#include <gtest/gtest.h>

#include <agroprecios/classifier.hpp>

#include "pages.hpp"

using namespace agroprecios;

TEST(ClassifierTest, ErrorWithoutProductsTable)
{
	EXPECT_TRUE(is_error_response(test::error_page()));
}

TEST(ClassifierTest, ErrorIsMatchedCaseInsensitively)
{
	EXPECT_TRUE(is_error_response("<html><body>Se ha producido un Error</body></html>"));
}

TEST(ClassifierTest, ProductsTableWinsOverErrorText)
{
	std::string html = test::page(
		"<p>ERROR en la cotizacion anterior</p>" +
		test::products_table(test::family_row("Vacuno"))
	);

	EXPECT_FALSE(is_error_response(html));
}

TEST(ClassifierTest, PageWithoutErrorText)
{
	EXPECT_FALSE(is_error_response(test::page("<p>Sin datos</p>")));
	EXPECT_FALSE(is_error_response(""));
}
