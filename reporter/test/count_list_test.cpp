#include <catch2/catch.hpp>

#include "count_list.h"

TEST_CASE("count list: repeats expand to one count per node", "[count_list]")
{
  REQUIRE(count_list_decode("1(x2),2(x3)")
          == expanded_counts_t{1, 1, 2, 2, 2});
  CHECK(count_list_decode("36") == expanded_counts_t{36});
  CHECK(count_list_decode("0") == expanded_counts_t{0});
  CHECK(count_list_decode("").empty());
}

TEST_CASE("count list: sum covers every position", "[count_list]")
{
  const auto counts = count_list_decode("1(x2),2(x3)");
  CHECK(counts.size() == 5);
  CHECK(count_list_sum("1(x2),2(x3)") == 8);
  CHECK(count_list_sum("36,24(x2)") == 84);
  CHECK(count_list_sum("4") == 4);
}

TEST_CASE("count list: empty or unusable lists sum to one", "[count_list]")
{
  CHECK(count_list_sum("") == COUNT_LIST_EMPTY_SUM);
  CHECK(count_list_sum("garbage") == 1);
  CHECK(count_list_sum("2,x") == 1);
  CHECK(count_list_sum("0") == 1);
}

TEST_CASE("count list: grammar violations", "[count_list]")
{
  CHECK_THROWS_AS(count_list_decode(",1"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1,"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1,,2"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1(x0)"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("0(x2)"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1(x2"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1(2)"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1 ,2"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("-1"), malformed_expression_error);
  CHECK_THROWS_AS(count_list_decode("1(x2000000)"),
                  malformed_expression_error);
}
