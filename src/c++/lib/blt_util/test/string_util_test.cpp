//
// AsmReport - Assembly Report Filter
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "boost/test/unit_test.hpp"

#include "blt_util/string_util.hpp"

BOOST_AUTO_TEST_SUITE(test_string_util)

BOOST_AUTO_TEST_CASE(test_split_string)
{
  std::vector<std::string> words;
  split_string("a\tbb\t\tc", '\t', words);
  BOOST_REQUIRE_EQUAL(words.size(), 4u);
  BOOST_REQUIRE_EQUAL(words[1], "bb");
  BOOST_REQUIRE_EQUAL(words[2], "");
  BOOST_REQUIRE_EQUAL(words[3], "c");

  // a trailing delimiter produces a trailing empty word:
  split_string("a\t", '\t', words);
  BOOST_REQUIRE_EQUAL(words.size(), 2u);
  BOOST_REQUIRE_EQUAL(words[1], "");

  split_string("a\tbb\t\tc\t", '\t', words, true);
  BOOST_REQUIRE_EQUAL(words.size(), 3u);
  BOOST_REQUIRE_EQUAL(words[2], "c");
}

BOOST_AUTO_TEST_CASE(test_join_string)
{
  const std::vector<std::string> words = {"a", "", "c"};
  BOOST_REQUIRE_EQUAL(join_string(words, '\t'), "a\t\tc");
  BOOST_REQUIRE_EQUAL(join_string(std::vector<std::string>(), '\t'), "");

  std::vector<std::string> words2;
  split_string(join_string(words, '\t'), '\t', words2);
  BOOST_REQUIRE(words == words2);
}

BOOST_AUTO_TEST_CASE(test_chomp_cr)
{
  std::string line("a\tb\r");
  chomp_cr(line);
  BOOST_REQUIRE_EQUAL(line, "a\tb");
  chomp_cr(line);
  BOOST_REQUIRE_EQUAL(line, "a\tb");

  std::string empty;
  chomp_cr(empty);
  BOOST_REQUIRE(empty.empty());
}

BOOST_AUTO_TEST_SUITE_END()
