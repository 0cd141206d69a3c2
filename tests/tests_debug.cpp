// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief Environment option conversion tests.
 */

#include "util/u_debug.h"

#include <catch2/catch.hpp>

#include <stdlib.h>


TEST_CASE("debug_string_to_bool")
{
	CHECK(debug_string_to_bool("true"));
	CHECK(debug_string_to_bool("ON"));
	CHECK(debug_string_to_bool("1"));
	CHECK(debug_string_to_bool("y"));
	CHECK_FALSE(debug_string_to_bool("false"));
	CHECK_FALSE(debug_string_to_bool("0"));
	CHECK_FALSE(debug_string_to_bool("banana"));
	CHECK_FALSE(debug_string_to_bool(nullptr));
}

TEST_CASE("debug_string_to_num")
{
	CHECK(debug_string_to_num("600", 1) == 600);
	CHECK(debug_string_to_num("0x10", 1) == 16);
	CHECK(debug_string_to_num("-3", 1) == -3);
	CHECK(debug_string_to_num("12px", 7) == 7);
	CHECK(debug_string_to_num("", 7) == 7);
	CHECK(debug_string_to_num(nullptr, 7) == 7);
}

TEST_CASE("debug_string_to_float")
{
	CHECK(debug_string_to_float("1.5", 0.f) == Approx(1.5f));
	CHECK(debug_string_to_float("-0.25", 0.f) == Approx(-0.25f));
	CHECK(debug_string_to_float("abc", 0.09f) == Approx(0.09f));
	CHECK(debug_string_to_float(nullptr, 0.4f) == Approx(0.4f));
}

TEST_CASE("debug_string_to_log_level")
{
	CHECK(debug_string_to_log_level("trace", U_LOGGING_WARN) == U_LOGGING_TRACE);
	CHECK(debug_string_to_log_level("D", U_LOGGING_WARN) == U_LOGGING_DEBUG);
	CHECK(debug_string_to_log_level("Info", U_LOGGING_WARN) == U_LOGGING_INFO);
	CHECK(debug_string_to_log_level("e", U_LOGGING_WARN) == U_LOGGING_ERROR);
	CHECK(debug_string_to_log_level("loud", U_LOGGING_INFO) == U_LOGGING_INFO);
	CHECK(debug_string_to_log_level(nullptr, U_LOGGING_WARN) == U_LOGGING_WARN);
}

TEST_CASE("debug_get_float_option")
{
	setenv("LP_TEST_FLOAT_OPTION", "2.25", 1);
	CHECK(debug_get_float_option("LP_TEST_FLOAT_OPTION", 1.f) == Approx(2.25f));

	unsetenv("LP_TEST_FLOAT_OPTION");
	CHECK(debug_get_float_option("LP_TEST_FLOAT_OPTION", 1.f) == Approx(1.f));
}
