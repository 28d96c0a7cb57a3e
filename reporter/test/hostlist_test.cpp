#include <catch2/catch.hpp>

#include "hostlist.h"

TEST_CASE("hostlist: ranges keep first-seen order", "[hostlist]")
{
  REQUIRE(hostlist_decode("n[9-11],d[01-02]")
          == host_set_t{"n9", "n10", "n11", "d01", "d02"});
}

TEST_CASE("hostlist: numeric sort orders digit runs by value", "[hostlist]")
{
  REQUIRE(hostlist_decode("n[9-11],d[01-02]", HOSTLIST_NUMERIC_SORT)
          == host_set_t{"d01", "d02", "n9", "n10", "n11"});
  CHECK(hostname_numeric_less("n2", "n10"));
  CHECK_FALSE(hostname_numeric_less("n10", "n2"));
  CHECK(hostname_numeric_less("n1", "n01"));
  CHECK(hostname_numeric_less("r1n9", "r1n10"));
  CHECK(hostname_numeric_less("r1n10", "r2n1"));
  CHECK_FALSE(hostname_numeric_less("n5", "n5"));
  CHECK(hostname_numeric_less("n", "n1"));
}

TEST_CASE("hostlist: compound names expand as a cross product", "[hostlist]")
{
  REQUIRE(hostlist_decode("a[1-3]b[1-2]")
          == host_set_t{"a1b1", "a1b2", "a2b1", "a2b2", "a3b1", "a3b2"});
  REQUIRE(hostlist_decode("x[1-2]y[1-3]z").size() == 6);
  REQUIRE(hostlist_decode("x[1-2]y[1-3]z").back() == "x2y3z");
}

TEST_CASE("hostlist: literals, lists and padding", "[hostlist]")
{
  CHECK(hostlist_decode("").empty());
  CHECK(hostlist_decode("node1") == host_set_t{"node1"});
  CHECK(hostlist_decode("n[1,3-4]") == host_set_t{"n1", "n3", "n4"});
  CHECK(hostlist_decode("n[098-101]")
        == host_set_t{"n098", "n099", "n100", "n101"});
  CHECK(hostlist_decode("compute-0-[29-30],compute-2-04")
        == host_set_t{"compute-0-29", "compute-0-30", "compute-2-04"});
  CHECK(hostlist_decode("a,,b") == host_set_t{"a", "b"});
}

TEST_CASE("hostlist: duplicates are dropped unless kept", "[hostlist]")
{
  CHECK(hostlist_decode("a,b,a") == host_set_t{"a", "b"});
  CHECK(hostlist_decode("n[1-2],n[2-3]") == host_set_t{"n1", "n2", "n3"});
  CHECK(hostlist_decode("a,b,a", HOSTLIST_KEEP_DUPLICATES)
        == host_set_t{"a", "b", "a"});
}

TEST_CASE("hostlist: grammar violations are malformed expressions",
          "[hostlist]")
{
  CHECK_THROWS_AS(hostlist_decode("n[1-2"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[1[2-3]]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[5-2]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n1-2]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[1,,2]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[a-b]"), malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[1-2-3]"), malformed_expression_error);
}

TEST_CASE("hostlist: oversized expansions are rejected", "[hostlist]")
{
  CHECK_THROWS_AS(hostlist_decode("n[1-999999999]"),
                  malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("a[1-1025]b[1-1024]"),
                  malformed_expression_error);
  CHECK_THROWS_AS(hostlist_decode("n[1-99999999999999999999]"),
                  malformed_expression_error);
}

TEST_CASE("hostlist: the error names the offending expression", "[hostlist]")
{
  try {
    hostlist_decode("x,n[5-2]");
    FAIL("expected malformed_expression_error");
  } catch (malformed_expression_error &e) {
    CHECK(e.input() == "x,n[5-2]");
  }
}

TEST_CASE("rangelist: flat ranges without prefix", "[hostlist]")
{
  CHECK(rangelist_decode("0-3,8") == std::vector<node_val_t>{0, 1, 2, 3, 8});
  CHECK(rangelist_decode("").empty());
  CHECK_THROWS_AS(rangelist_decode("3-1"), malformed_expression_error);
  CHECK_THROWS_AS(rangelist_decode("0-3,"), malformed_expression_error);
}
